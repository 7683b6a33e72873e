// File: src/clustering/cluster_model.hpp
#pragma once

#include "clustering/cluster_snapshot.hpp"
#include <cstdint>
#include <string>

namespace medeq {

/// Parameters of one clustering fit
struct FitParameters {
    /// Number of clusters (must be positive)
    size_t k{8};
    /// Base seed; restart r uses seed + r
    uint64_t seed{42};
    /// Cap on centroid updates per restart
    size_t max_iterations{300};
    /// Stop when no centroid moves farther than this
    double tolerance{1e-4};
    /// Independent restarts; the lowest inertia wins
    size_t n_restarts{10};
    /// Empty-cluster reseeds allowed per restart before it is marked failed
    size_t max_reseed_attempts{3};

    /// @throws ConfigurationError for k == 0, n_restarts == 0 or tolerance < 0
    void Validate() const;
};

/// ClusterModel: Partitioning capability behind which the committed
/// algorithm (k-means) lives. Alternative algorithms are further
/// implementations of this interface, not runtime options.
///
/// Fit() must be serialized per model instance; the returned snapshot is
/// immutable and serves Predict() concurrently.
class ClusterModel {
public:
    virtual ~ClusterModel() = default;

    /// Fit a partition over the vectors
    /// @throws InsufficientData if vectors.size() < params.k
    /// When no restart fills every cluster the best failed restart is
    /// returned and the snapshot reports IsDegraded()
    /// @throws ConfigurationError for invalid parameters
    virtual ClusterModelSnapshot Fit(const VectorTable& vectors,
                                     const FitParameters& params) const = 0;

    /// Cluster label of a vector under a snapshot
    size_t Predict(const ClusterModelSnapshot& snapshot, const FeatureVector& vector) const {
        return snapshot.Predict(vector);
    }

    /// Cluster count for a batch when none is configured.
    /// Defaults to params.k.
    virtual size_t SuggestClusterCount(const VectorTable& vectors,
                                       const FitParameters& params) const {
        (void)vectors;
        return params.k;
    }

    /// Algorithm name (for reports)
    virtual std::string Name() const = 0;
};

} // namespace medeq

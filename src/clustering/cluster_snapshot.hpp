// File: src/clustering/cluster_snapshot.hpp
#pragma once

#include "core/feature_vector.hpp"
#include "core/types.hpp"
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace medeq {

/// Feature vectors keyed by record id; ordered so fits are reproducible
using VectorTable = std::map<RecordID, FeatureVector>;

/// Cluster membership of one training vector
struct ClusterAssignment {
    RecordID record_id;
    size_t cluster_label{0};
    FeatureVector vector;
};

/// Outcome of one k-means restart
struct RestartResult {
    size_t restart{0};
    double inertia{0.0};          // Within-cluster sum of squared distances
    size_t iterations{0};         // Centroid updates performed
    size_t reseeds{0};            // Empty clusters reseeded
    bool converged{false};        // Movement fell below tolerance
    bool failed{false};           // Ran out of reseed attempts
    size_t empty_clusters{0};     // Clusters still empty when the restart ended
};

/// Index of the nearest centroid; ties go to the lowest label
/// @throws std::invalid_argument if centroids is empty
size_t NearestCentroid(const std::vector<FeatureVector>& centroids,
                       const FeatureVector& vector);

/// ClusterModelSnapshot: Immutable result of one clustering fit.
///
/// Holds the centroids, the assignment of every training vector and a
/// per-cluster member index. Retraining produces a new snapshot with a new
/// SnapshotID; a snapshot is never mutated after construction, so Predict()
/// and the lookups are safe to call concurrently without locking.
class ClusterModelSnapshot {
public:
    /// @param assignments Training assignments; labels must be < centroids.size()
    /// @throws std::invalid_argument on an out-of-range label or duplicate id
    ClusterModelSnapshot(SnapshotID id,
                         std::vector<FeatureVector> centroids,
                         std::vector<ClusterAssignment> assignments,
                         std::vector<RestartResult> restarts = {},
                         size_t best_restart = 0);

    SnapshotID GetID() const { return id_; }

    size_t GetClusterCount() const { return centroids_.size(); }
    size_t GetDimension() const;

    const std::vector<FeatureVector>& GetCentroids() const { return centroids_; }
    const std::vector<ClusterAssignment>& GetAssignments() const { return assignments_; }

    /// Assignment of a training record, nullptr if the record was not trained
    const ClusterAssignment* FindAssignment(const RecordID& record_id) const;

    /// Cluster label of a training record
    std::optional<size_t> GetLabel(const RecordID& record_id) const;

    /// Indices into GetAssignments() of the members of a cluster
    /// @throws std::out_of_range for an unknown label
    const std::vector<size_t>& GetMemberIndices(size_t label) const;

    /// Record ids of the members of a cluster
    std::vector<RecordID> GetMembers(size_t label) const;

    /// Number of members per cluster
    std::vector<size_t> GetClusterSizes() const;

    /// Nearest cluster of an arbitrary vector
    /// @throws std::invalid_argument on a dimension mismatch
    size_t Predict(const FeatureVector& vector) const;

    /// Within-cluster sum of squared distances of the training vectors
    double GetInertia() const { return inertia_; }

    const std::vector<RestartResult>& GetRestarts() const { return restarts_; }
    size_t GetBestRestart() const { return best_restart_; }

    /// True when the kept restart is a failed one: no restart filled every
    /// cluster, so some labels have no members
    bool IsDegraded() const;

private:
    SnapshotID id_;
    std::vector<FeatureVector> centroids_;
    std::vector<ClusterAssignment> assignments_;
    std::unordered_map<RecordID, size_t> assignment_index_;
    std::vector<std::vector<size_t>> members_;
    std::vector<RestartResult> restarts_;
    size_t best_restart_{0};
    double inertia_{0.0};
};

} // namespace medeq

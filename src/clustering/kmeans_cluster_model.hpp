// File: src/clustering/kmeans_cluster_model.hpp
#pragma once

#include "clustering/cluster_model.hpp"
#include <random>
#include <vector>

namespace medeq {

/// KMeansClusterModel: Lloyd's k-means with k-means++ seeding and restarts.
///
/// Each restart seeds with k-means++ (first centroid uniform, the next ones
/// drawn with probability proportional to the squared distance to the
/// nearest chosen centroid), then alternates nearest-centroid assignment and
/// mean updates until no centroid moves more than the tolerance or the
/// iteration cap is hit. A cluster left empty is reseeded at the point
/// farthest from its nearest surviving centroid; a restart that exhausts its
/// reseed budget is marked failed. The successful restart with the lowest
/// inertia wins. When every restart failed, the one with the fewest empty
/// clusters (then the lowest inertia) is kept and the snapshot is degraded.
///
/// Final labels are always the nearest-centroid labels of the final
/// centroids, so Predict() on a training vector returns its recorded label.
/// Identical inputs and parameters give identical snapshots.
///
/// Thread-safety: Fit() is const but must be serialized per instance when
/// debug logging is shared; snapshots are immutable.
class KMeansClusterModel : public ClusterModel {
public:
    struct Config {
        Config() = default;
        /// Log restart outcomes
        bool debug_logging{false};
    };

    KMeansClusterModel();
    explicit KMeansClusterModel(const Config& config);
    ~KMeansClusterModel() override = default;

    ClusterModelSnapshot Fit(const VectorTable& vectors,
                             const FitParameters& params) const override;

    std::string Name() const override { return "kmeans"; }

    /// Elbow heuristic over k in [2, min(20, n / 10)]: the k at the largest
    /// second difference of the inertia curve. Degraded fits are skipped.
    /// Returns 1 when the batch is too small to try two clusters.
    size_t SuggestClusterCount(const VectorTable& vectors,
                               const FitParameters& params) const override;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    /// One restart over the flattened points
    struct RunState {
        std::vector<FeatureVector> centroids;
        std::vector<size_t> labels;
        RestartResult result;
    };

    RunState RunRestart(const std::vector<const FeatureVector*>& points,
                        const FitParameters& params,
                        size_t restart) const;

    /// Initialize centroids using k-means++
    std::vector<FeatureVector> InitializeCentroids(
        const std::vector<const FeatureVector*>& points,
        size_t k,
        std::mt19937_64& gen) const;

    /// Assign points to nearest centroids
    /// @return Number of points per cluster
    std::vector<size_t> AssignPoints(const std::vector<const FeatureVector*>& points,
                                     const std::vector<FeatureVector>& centroids,
                                     std::vector<size_t>& labels) const;

    /// Reseed empty clusters until none remain or the budget runs out
    /// @return false if the budget ran out with an empty cluster left
    bool RepairEmptyClusters(const std::vector<const FeatureVector*>& points,
                             std::vector<FeatureVector>& centroids,
                             std::vector<size_t>& labels,
                             std::vector<size_t>& counts,
                             RestartResult& result,
                             size_t max_reseeds) const;

    /// Recompute centroids as member means
    /// @return Largest centroid movement
    double UpdateCentroids(const std::vector<const FeatureVector*>& points,
                           const std::vector<size_t>& labels,
                           const std::vector<size_t>& counts,
                           std::vector<FeatureVector>& centroids) const;

    /// Successful before failed, then fewer empty clusters, then lower inertia
    static bool IsBetterRestart(const RestartResult& candidate,
                                const RestartResult& incumbent);

    void LogDebug(const std::string& message) const;
};

} // namespace medeq

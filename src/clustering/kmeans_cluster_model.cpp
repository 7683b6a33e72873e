// File: src/clustering/kmeans_cluster_model.cpp
#include "clustering/kmeans_cluster_model.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace medeq {

// ============================================================================
// Construction
// ============================================================================

KMeansClusterModel::KMeansClusterModel()
    : config_()
{
}

KMeansClusterModel::KMeansClusterModel(const Config& config)
    : config_(config)
{
}

// ============================================================================
// Fitting
// ============================================================================

ClusterModelSnapshot KMeansClusterModel::Fit(
    const VectorTable& vectors,
    const FitParameters& params
) const {
    params.Validate();

    if (vectors.size() < params.k) {
        throw InsufficientData(vectors.size(), params.k);
    }

    // Flatten in record-id order
    std::vector<const RecordID*> ids;
    std::vector<const FeatureVector*> points;
    ids.reserve(vectors.size());
    points.reserve(vectors.size());

    const size_t dim = vectors.begin()->second.Dimension();
    for (const auto& [id, vector] : vectors) {
        if (vector.Dimension() != dim) {
            throw std::invalid_argument("Vector of " + id + " has dimension " +
                                        std::to_string(vector.Dimension()) +
                                        ", expected " + std::to_string(dim));
        }
        ids.push_back(&id);
        points.push_back(&vector);
    }

    std::vector<RestartResult> restarts;
    restarts.reserve(params.n_restarts);

    bool have_best = false;
    RunState best;

    for (size_t r = 0; r < params.n_restarts; ++r) {
        RunState run = RunRestart(points, params, r);
        restarts.push_back(run.result);

        std::ostringstream oss;
        oss << "Restart " << r << ": inertia=" << run.result.inertia
            << " iterations=" << run.result.iterations
            << " reseeds=" << run.result.reseeds
            << (run.result.converged ? " converged" : "")
            << (run.result.failed ? " FAILED" : "");
        if (run.result.failed) {
            oss << " empty=" << run.result.empty_clusters;
        }
        LogDebug(oss.str());

        // Strict comparisons keep the earliest restart on ties
        if (!have_best || IsBetterRestart(run.result, best.result)) {
            best = std::move(run);
            have_best = true;
        }
    }

    if (!have_best) {
        throw DegenerateCluster("No restart produced a partition");
    }
    if (best.result.failed) {
        LogDebug("Every restart left an empty cluster after " +
                 std::to_string(params.max_reseed_attempts) +
                 " reseed attempts; keeping degraded restart " +
                 std::to_string(best.result.restart) + " with " +
                 std::to_string(best.result.empty_clusters) + " empty cluster(s)");
    }

    std::vector<ClusterAssignment> assignments;
    assignments.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        assignments.push_back(ClusterAssignment{*ids[i], best.labels[i], *points[i]});
    }

    return ClusterModelSnapshot(SnapshotID::Generate(),
                                std::move(best.centroids),
                                std::move(assignments),
                                std::move(restarts),
                                best.result.restart);
}

size_t KMeansClusterModel::SuggestClusterCount(
    const VectorTable& vectors,
    const FitParameters& params
) const {
    const size_t max_k = std::min<size_t>(20, vectors.size() / 10);
    if (max_k < 2) {
        return 1;
    }

    std::vector<size_t> candidates;
    std::vector<double> inertias;
    for (size_t k = 2; k <= max_k; ++k) {
        FitParameters trial = params;
        trial.k = k;
        ClusterModelSnapshot snapshot = Fit(vectors, trial);
        if (snapshot.IsDegraded()) {
            LogDebug("Skipping k=" + std::to_string(k) + ": no restart filled every cluster");
            continue;
        }
        inertias.push_back(snapshot.GetInertia());
        candidates.push_back(k);
    }

    if (candidates.empty()) {
        return 1;
    }
    if (inertias.size() <= 2) {
        return candidates.front();
    }

    // Elbow: largest second difference (sharpest bend) of the inertia curve
    size_t best_index = 0;
    double best_second = std::numeric_limits<double>::lowest();
    for (size_t i = 0; i + 2 < inertias.size(); ++i) {
        double second = (inertias[i + 2] - inertias[i + 1]) - (inertias[i + 1] - inertias[i]);
        if (second > best_second) {
            best_second = second;
            best_index = i;
        }
    }
    return candidates[best_index + 1];
}

// ============================================================================
// Private Helper Methods
// ============================================================================

bool KMeansClusterModel::IsBetterRestart(const RestartResult& candidate,
                                         const RestartResult& incumbent) {
    if (candidate.failed != incumbent.failed) {
        return !candidate.failed;
    }
    if (candidate.empty_clusters != incumbent.empty_clusters) {
        return candidate.empty_clusters < incumbent.empty_clusters;
    }
    return candidate.inertia < incumbent.inertia;
}

KMeansClusterModel::RunState KMeansClusterModel::RunRestart(
    const std::vector<const FeatureVector*>& points,
    const FitParameters& params,
    size_t restart
) const {
    std::mt19937_64 gen(params.seed + restart);

    RunState state;
    state.result.restart = restart;
    state.centroids = InitializeCentroids(points, params.k, gen);
    state.labels.assign(points.size(), 0);

    for (size_t iter = 0; ; ++iter) {
        auto counts = AssignPoints(points, state.centroids, state.labels);

        if (!RepairEmptyClusters(points, state.centroids, state.labels, counts,
                                 state.result, params.max_reseed_attempts)) {
            state.result.failed = true;
            break;
        }

        // Labels are consistent with the centroids at this point
        if (state.result.converged || iter >= params.max_iterations) {
            break;
        }

        double movement = UpdateCentroids(points, state.labels, counts, state.centroids);
        state.result.iterations++;
        state.result.converged = movement < params.tolerance;
    }

    // A failed restart keeps its partition as a fallback candidate
    double inertia = 0.0;
    std::vector<bool> occupied(state.centroids.size(), false);
    for (size_t i = 0; i < points.size(); ++i) {
        inertia += points[i]->SquaredDistance(state.centroids[state.labels[i]]);
        occupied[state.labels[i]] = true;
    }
    state.result.inertia = inertia;
    state.result.empty_clusters =
        static_cast<size_t>(std::count(occupied.begin(), occupied.end(), false));

    return state;
}

std::vector<FeatureVector> KMeansClusterModel::InitializeCentroids(
    const std::vector<const FeatureVector*>& points,
    size_t k,
    std::mt19937_64& gen
) const {
    std::vector<FeatureVector> centroids;
    centroids.reserve(k);

    // Choose first centroid uniformly
    std::uniform_int_distribution<size_t> uniform(0, points.size() - 1);
    centroids.push_back(*points[uniform(gen)]);

    // Squared distance of each point to its nearest chosen centroid
    std::vector<double> distances(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        distances[i] = points[i]->SquaredDistance(centroids.front());
    }

    while (centroids.size() < k) {
        double total = 0.0;
        for (double d : distances) {
            total += d;
        }

        size_t next_idx;
        if (total > 0.0) {
            std::discrete_distribution<size_t> weighted(distances.begin(), distances.end());
            next_idx = weighted(gen);
        } else {
            // Every point coincides with a chosen centroid
            next_idx = uniform(gen);
        }

        centroids.push_back(*points[next_idx]);
        for (size_t i = 0; i < points.size(); ++i) {
            distances[i] = std::min(distances[i], points[i]->SquaredDistance(centroids.back()));
        }
    }

    return centroids;
}

std::vector<size_t> KMeansClusterModel::AssignPoints(
    const std::vector<const FeatureVector*>& points,
    const std::vector<FeatureVector>& centroids,
    std::vector<size_t>& labels
) const {
    std::vector<size_t> counts(centroids.size(), 0);
    for (size_t i = 0; i < points.size(); ++i) {
        labels[i] = NearestCentroid(centroids, *points[i]);
        counts[labels[i]]++;
    }
    return counts;
}

bool KMeansClusterModel::RepairEmptyClusters(
    const std::vector<const FeatureVector*>& points,
    std::vector<FeatureVector>& centroids,
    std::vector<size_t>& labels,
    std::vector<size_t>& counts,
    RestartResult& result,
    size_t max_reseeds
) const {
    for (;;) {
        auto empty = std::find(counts.begin(), counts.end(), 0u);
        if (empty == counts.end()) {
            return true;
        }
        if (result.reseeds >= max_reseeds) {
            return false;
        }

        const size_t empty_label = static_cast<size_t>(empty - counts.begin());

        // Farthest point from its nearest surviving centroid
        size_t farthest = 0;
        double farthest_distance = -1.0;
        for (size_t i = 0; i < points.size(); ++i) {
            double nearest = std::numeric_limits<double>::max();
            for (size_t c = 0; c < centroids.size(); ++c) {
                if (counts[c] == 0) {
                    continue;
                }
                nearest = std::min(nearest, points[i]->SquaredDistance(centroids[c]));
            }
            if (nearest > farthest_distance) {
                farthest_distance = nearest;
                farthest = i;
            }
        }

        centroids[empty_label] = *points[farthest];
        result.reseeds++;
        result.converged = false;
        counts = AssignPoints(points, centroids, labels);
    }
}

double KMeansClusterModel::UpdateCentroids(
    const std::vector<const FeatureVector*>& points,
    const std::vector<size_t>& labels,
    const std::vector<size_t>& counts,
    std::vector<FeatureVector>& centroids
) const {
    const size_t dim = centroids.front().Dimension();
    std::vector<FeatureVector> sums(centroids.size(), FeatureVector(dim));

    for (size_t i = 0; i < points.size(); ++i) {
        sums[labels[i]] += *points[i];
    }

    double max_movement = 0.0;
    for (size_t c = 0; c < centroids.size(); ++c) {
        if (counts[c] == 0) {
            continue;
        }
        FeatureVector mean = std::move(sums[c]);
        mean *= 1.0 / static_cast<double>(counts[c]);
        max_movement = std::max(max_movement, mean.EuclideanDistance(centroids[c]));
        centroids[c] = std::move(mean);
    }

    return max_movement;
}

void KMeansClusterModel::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[KMeansClusterModel] " << message << std::endl;
    }
}

} // namespace medeq

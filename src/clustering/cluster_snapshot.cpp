// File: src/clustering/cluster_snapshot.cpp
#include "clustering/cluster_snapshot.hpp"
#include <stdexcept>

namespace medeq {

size_t NearestCentroid(const std::vector<FeatureVector>& centroids,
                       const FeatureVector& vector) {
    if (centroids.empty()) {
        throw std::invalid_argument("No centroids to compare against");
    }

    size_t nearest = 0;
    double min_distance = vector.SquaredDistance(centroids[0]);

    for (size_t i = 1; i < centroids.size(); ++i) {
        double distance = vector.SquaredDistance(centroids[i]);
        // Strict comparison keeps the lowest label on ties
        if (distance < min_distance) {
            min_distance = distance;
            nearest = i;
        }
    }

    return nearest;
}

ClusterModelSnapshot::ClusterModelSnapshot(
    SnapshotID id,
    std::vector<FeatureVector> centroids,
    std::vector<ClusterAssignment> assignments,
    std::vector<RestartResult> restarts,
    size_t best_restart
)
    : id_(id),
      centroids_(std::move(centroids)),
      assignments_(std::move(assignments)),
      restarts_(std::move(restarts)),
      best_restart_(best_restart)
{
    members_.resize(centroids_.size());

    for (size_t i = 0; i < assignments_.size(); ++i) {
        const auto& assignment = assignments_[i];
        if (assignment.cluster_label >= centroids_.size()) {
            throw std::invalid_argument("Assignment of " + assignment.record_id +
                                        " has an out-of-range cluster label");
        }
        if (!assignment_index_.emplace(assignment.record_id, i).second) {
            throw std::invalid_argument("Duplicate assignment for " + assignment.record_id);
        }
        members_[assignment.cluster_label].push_back(i);
        inertia_ += assignment.vector.SquaredDistance(centroids_[assignment.cluster_label]);
    }
}

bool ClusterModelSnapshot::IsDegraded() const {
    for (const auto& restart : restarts_) {
        if (restart.restart == best_restart_) {
            return restart.failed;
        }
    }
    return false;
}

size_t ClusterModelSnapshot::GetDimension() const {
    return centroids_.empty() ? 0 : centroids_.front().Dimension();
}

const ClusterAssignment* ClusterModelSnapshot::FindAssignment(const RecordID& record_id) const {
    auto it = assignment_index_.find(record_id);
    if (it == assignment_index_.end()) {
        return nullptr;
    }
    return &assignments_[it->second];
}

std::optional<size_t> ClusterModelSnapshot::GetLabel(const RecordID& record_id) const {
    const auto* assignment = FindAssignment(record_id);
    if (!assignment) {
        return std::nullopt;
    }
    return assignment->cluster_label;
}

const std::vector<size_t>& ClusterModelSnapshot::GetMemberIndices(size_t label) const {
    if (label >= members_.size()) {
        throw std::out_of_range("Unknown cluster label " + std::to_string(label));
    }
    return members_[label];
}

std::vector<RecordID> ClusterModelSnapshot::GetMembers(size_t label) const {
    std::vector<RecordID> ids;
    for (size_t index : GetMemberIndices(label)) {
        ids.push_back(assignments_[index].record_id);
    }
    return ids;
}

std::vector<size_t> ClusterModelSnapshot::GetClusterSizes() const {
    std::vector<size_t> sizes;
    sizes.reserve(members_.size());
    for (const auto& members : members_) {
        sizes.push_back(members.size());
    }
    return sizes;
}

size_t ClusterModelSnapshot::Predict(const FeatureVector& vector) const {
    if (vector.Dimension() != GetDimension()) {
        throw std::invalid_argument("Vector dimension does not match the snapshot");
    }
    return NearestCentroid(centroids_, vector);
}

} // namespace medeq

// File: src/equivalence/equivalence_resolver.hpp
#pragma once

#include "core/trained_model.hpp"
#include "core/types.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace medeq {

/// Substitute candidate with its distance to the query
struct Candidate {
    RecordID cum;
    double distance;
    double similarity;   // 1 / (1 + distance)

    Candidate(RecordID id, double dist)
        : cum(std::move(id)), distance(dist), similarity(1.0 / (1.0 + dist)) {}

    /// Ascending distance, ties by CUM
    bool operator<(const Candidate& other) const {
        if (distance != other.distance) {
            return distance < other.distance;
        }
        return cum < other.cum;
    }
};

/// Query configuration
struct QueryOptions {
    /// Maximum number of candidates; unset uses the resolver default
    std::optional<size_t> top_k;

    /// Hard filters every candidate must pass; unset uses the resolver
    /// defaults, an empty set applies none
    std::optional<std::set<CandidateFilter>> filters;

    /// Candidates farther than this are dropped
    std::optional<double> max_distance;

    static QueryOptions Default() {
        return QueryOptions{};
    }

    static QueryOptions TopK(size_t k) {
        QueryOptions options;
        options.top_k = k;
        return options;
    }
};

/// Whether a candidate record passes one filter
/// @param query_atc ATC code of the query, required by ATC_EXACT_MATCH
/// @throws std::invalid_argument for ATC_EXACT_MATCH without a query ATC
bool PassesFilter(CandidateFilter filter,
                  const MedicationRecord& candidate,
                  const std::optional<std::string>& query_atc);

/// CandidateSequence: Ranked substitutes of one query.
///
/// The ranking is computed on first access and cached; Take() can be
/// called repeatedly with any length and always starts from the closest
/// candidate. The sequence keeps its model alive, so it stays valid after
/// a newer model is published.
///
/// Thread-safety: not safe for concurrent use; give each thread its own.
class CandidateSequence {
public:
    CandidateSequence(std::shared_ptr<const TrainedModel> model,
                      FeatureVector query_vector,
                      size_t cluster_label,
                      std::optional<RecordID> query_id,
                      std::optional<std::string> query_atc,
                      std::set<CandidateFilter> filters,
                      std::optional<double> max_distance,
                      size_t top_k);

    /// First n candidates of the full ranking
    std::vector<Candidate> Take(size_t n) const;

    /// First top_k candidates
    std::vector<Candidate> Results() const { return Take(top_k_); }

    /// Number of candidates passing every filter, ignoring top_k
    size_t Available() const;

    size_t GetClusterLabel() const { return cluster_label_; }
    size_t GetTopK() const { return top_k_; }
    const std::optional<RecordID>& GetQueryID() const { return query_id_; }
    SnapshotID GetSnapshotID() const { return model_->GetID(); }

    /// Model the sequence was resolved against
    const TrainedModel& GetModel() const { return *model_; }

private:
    std::shared_ptr<const TrainedModel> model_;
    FeatureVector query_vector_;
    size_t cluster_label_;
    std::optional<RecordID> query_id_;
    std::optional<std::string> query_atc_;
    std::set<CandidateFilter> filters_;
    std::optional<double> max_distance_;
    size_t top_k_;

    mutable std::optional<std::vector<Candidate>> ranked_;

    const std::vector<Candidate>& Ranked() const;
};

/// EquivalenceResolver: Finds substitutes of a medication within its cluster.
///
/// Candidates are the cluster co-members of the query, minus the query
/// itself, passing every requested filter, ordered by ascending Euclidean
/// distance in the weighted feature space.
///
/// Records that were trained resolve to their recorded cluster. Records
/// that have a vector but were not trained (ineligible ones) and ad-hoc
/// vectors resolve to the nearest centroid.
///
/// Thread-safety: const methods are safe for concurrent use.
class EquivalenceResolver {
public:
    struct Config {
        Config() = default;
        /// top_k when a query leaves it unset
        size_t default_top_k{10};
        /// Filters applied when a query names none
        std::set<CandidateFilter> default_filters;
        bool debug_logging{false};
    };

    /// @throws std::invalid_argument if model is null
    explicit EquivalenceResolver(std::shared_ptr<const TrainedModel> model);
    EquivalenceResolver(std::shared_ptr<const TrainedModel> model, const Config& config);

    /// Substitutes of a known record
    /// @throws UnresolvableQuery if the record is unknown or has no vector
    CandidateSequence Query(const RecordID& cum,
                            const QueryOptions& options = QueryOptions::Default()) const;

    /// Substitutes of an ad-hoc weighted vector
    /// @param query_atc ATC code for the atc_exact_match filter
    /// @throws std::invalid_argument on a dimension mismatch
    CandidateSequence QueryVector(const FeatureVector& vector,
                                  const QueryOptions& options = QueryOptions::Default(),
                                  const std::optional<std::string>& query_atc = std::nullopt) const;

    /// Substitutes of a record outside the training batch
    /// @throws UnresolvableQuery if the record cannot be vectorized
    CandidateSequence QueryRecord(const MedicationRecord& record,
                                  const QueryOptions& options = QueryOptions::Default()) const;

    const TrainedModel& GetModel() const { return *model_; }
    std::shared_ptr<const TrainedModel> GetModelPtr() const { return model_; }
    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<const TrainedModel> model_;
    Config config_;

    CandidateSequence MakeSequence(const FeatureVector& vector,
                                   size_t label,
                                   std::optional<RecordID> query_id,
                                   std::optional<std::string> query_atc,
                                   const QueryOptions& options) const;

    void LogDebug(const std::string& message) const;
};

} // namespace medeq

// File: src/equivalence/equivalence_resolver.cpp
#include "equivalence/equivalence_resolver.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace medeq {

bool PassesFilter(CandidateFilter filter,
                  const MedicationRecord& candidate,
                  const std::optional<std::string>& query_atc) {
    switch (filter) {
        case CandidateFilter::REGISTRATION_ACTIVE:
            return candidate.registration_status == RegistrationStatus::ACTIVE;
        case CandidateFilter::NOT_MEDICAL_SAMPLE:
            return !candidate.medical_sample;
        case CandidateFilter::ATC_EXACT_MATCH:
            if (!query_atc) {
                throw std::invalid_argument("atc_exact_match requires a query ATC code");
            }
            return candidate.atc_code == *query_atc;
        case CandidateFilter::COVERAGE_IN_PBS:
            return candidate.covered_by_benefit_plan;
    }
    return false;
}

// ============================================================================
// CandidateSequence
// ============================================================================

CandidateSequence::CandidateSequence(
    std::shared_ptr<const TrainedModel> model,
    FeatureVector query_vector,
    size_t cluster_label,
    std::optional<RecordID> query_id,
    std::optional<std::string> query_atc,
    std::set<CandidateFilter> filters,
    std::optional<double> max_distance,
    size_t top_k
)
    : model_(std::move(model)),
      query_vector_(std::move(query_vector)),
      cluster_label_(cluster_label),
      query_id_(std::move(query_id)),
      query_atc_(std::move(query_atc)),
      filters_(std::move(filters)),
      max_distance_(max_distance),
      top_k_(top_k)
{
    if (!model_) {
        throw std::invalid_argument("CandidateSequence requires a model");
    }
    if (filters_.count(CandidateFilter::ATC_EXACT_MATCH) > 0 && !query_atc_) {
        throw std::invalid_argument("atc_exact_match requires a query ATC code");
    }
}

std::vector<Candidate> CandidateSequence::Take(size_t n) const {
    const auto& ranked = Ranked();
    const size_t count = std::min(n, ranked.size());
    return std::vector<Candidate>(ranked.begin(), ranked.begin() + count);
}

size_t CandidateSequence::Available() const {
    return Ranked().size();
}

const std::vector<Candidate>& CandidateSequence::Ranked() const {
    if (ranked_) {
        return *ranked_;
    }

    const auto& snapshot = model_->GetSnapshot();
    const auto& assignments = snapshot.GetAssignments();

    std::vector<Candidate> ranked;
    for (size_t index : snapshot.GetMemberIndices(cluster_label_)) {
        const auto& member = assignments[index];
        if (query_id_ && member.record_id == *query_id_) {
            continue;
        }

        const MedicationRecord* record = model_->FindRecord(member.record_id);
        if (record == nullptr) {
            continue;
        }

        bool passes = true;
        for (CandidateFilter filter : filters_) {
            if (!PassesFilter(filter, *record, query_atc_)) {
                passes = false;
                break;
            }
        }
        if (!passes) {
            continue;
        }

        double distance = member.vector.EuclideanDistance(query_vector_);
        if (max_distance_ && distance > *max_distance_) {
            continue;
        }
        ranked.emplace_back(member.record_id, distance);
    }

    std::sort(ranked.begin(), ranked.end());
    ranked_ = std::move(ranked);
    return *ranked_;
}

// ============================================================================
// EquivalenceResolver
// ============================================================================

EquivalenceResolver::EquivalenceResolver(std::shared_ptr<const TrainedModel> model)
    : EquivalenceResolver(std::move(model), Config())
{
}

EquivalenceResolver::EquivalenceResolver(
    std::shared_ptr<const TrainedModel> model,
    const Config& config
)
    : model_(std::move(model)),
      config_(config)
{
    if (!model_) {
        throw std::invalid_argument("EquivalenceResolver requires a model");
    }
}

CandidateSequence EquivalenceResolver::Query(
    const RecordID& cum,
    const QueryOptions& options
) const {
    const MedicationRecord* record = model_->FindRecord(cum);
    if (record == nullptr) {
        throw UnresolvableQuery("Unknown CUM: " + cum);
    }

    const FeatureVector* vector = model_->FindVector(cum);
    if (vector == nullptr) {
        throw UnresolvableQuery("CUM " + cum + " was excluded from vectorization");
    }

    const auto& snapshot = model_->GetSnapshot();
    size_t label;
    if (auto trained = snapshot.GetLabel(cum)) {
        label = *trained;
    } else {
        label = snapshot.Predict(*vector);
        LogDebug("CUM " + cum + " was not trained, placed in cluster " + std::to_string(label));
    }

    return MakeSequence(*vector, label, cum, record->atc_code, options);
}

CandidateSequence EquivalenceResolver::QueryVector(
    const FeatureVector& vector,
    const QueryOptions& options,
    const std::optional<std::string>& query_atc
) const {
    size_t label = model_->GetSnapshot().Predict(vector);
    return MakeSequence(vector, label, std::nullopt, query_atc, options);
}

CandidateSequence EquivalenceResolver::QueryRecord(
    const MedicationRecord& record,
    const QueryOptions& options
) const {
    FeatureVector vector;
    try {
        vector = model_->Vectorize(record);
    } catch (const InvalidQuantity& e) {
        throw UnresolvableQuery("Record " + record.cum + " cannot be vectorized: " + e.what());
    }

    size_t label = model_->GetSnapshot().Predict(vector);
    std::optional<RecordID> query_id;
    if (!record.cum.empty()) {
        query_id = record.cum;
    }
    return MakeSequence(vector, label, query_id, record.atc_code, options);
}

// ============================================================================
// Private Helper Methods
// ============================================================================

CandidateSequence EquivalenceResolver::MakeSequence(
    const FeatureVector& vector,
    size_t label,
    std::optional<RecordID> query_id,
    std::optional<std::string> query_atc,
    const QueryOptions& options
) const {
    const size_t top_k = options.top_k.value_or(config_.default_top_k);
    const auto& filters = options.filters ? *options.filters : config_.default_filters;

    LogDebug("Query " + query_id.value_or("<vector>") + " -> cluster " +
             std::to_string(label) + ", top_k=" + std::to_string(top_k) +
             ", filters=" + std::to_string(filters.size()));

    return CandidateSequence(model_, vector, label, std::move(query_id),
                             std::move(query_atc), filters,
                             options.max_distance, top_k);
}

void EquivalenceResolver::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[EquivalenceResolver] " << message << std::endl;
    }
}

} // namespace medeq

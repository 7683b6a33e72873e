// File: src/core/equivalence_engine.cpp
#include "core/equivalence_engine.hpp"
#include "core/errors.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace medeq {

// ============================================================================
// Construction
// ============================================================================

EquivalenceEngine::EquivalenceEngine()
    : EquivalenceEngine(Config())
{
}

EquivalenceEngine::EquivalenceEngine(const Config& config, std::unique_ptr<ClusterModel> model)
    : config_(config),
      classifier_(config.eligibility),
      encoder_(config.encoder),
      assembler_(config.assembler),
      model_(std::move(model))
{
    if (!model_) {
        KMeansClusterModel::Config kmeans_config;
        kmeans_config.debug_logging = config_.debug_logging;
        model_ = std::make_unique<KMeansClusterModel>(kmeans_config);
    }
    if (!config_.auto_select_k) {
        config_.clustering.Validate();
    }
}

// ============================================================================
// Training
// ============================================================================

std::shared_ptr<const TrainedModel> EquivalenceEngine::Train(
    const std::vector<MedicationRecord>& records
) const {
    std::lock_guard<std::mutex> lock(train_mutex_);
    auto start = std::chrono::steady_clock::now();

    std::unordered_set<RecordID> seen;
    for (const auto& record : records) {
        if (record.cum.empty()) {
            throw std::invalid_argument("Record with an empty CUM in training batch");
        }
        if (!seen.insert(record.cum).second) {
            throw std::invalid_argument("Duplicate CUM in training batch: " + record.cum);
        }
    }

    TrainingReport report;
    report.total_records = records.size();
    report.algorithm = model_->Name();

    // 1. Eligibility
    std::vector<bool> eligible = classifier_.ClassifyAll(records);
    for (bool flag : eligible) {
        if (flag) {
            report.eligible_records++;
        }
    }

    // 2. Frequency tables over the whole batch
    EncoderTables tables = EncoderTables::Fit(encoder_, records, eligible);

    // 3. Raw vectors; numeric failures are excluded, not fatal
    VectorTable raw_vectors;
    std::vector<FeatureVector> member_raws;
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        try {
            FeatureVector raw = assembler_.AssembleRaw(record, tables, &report.unknown_categories);
            if (eligible[i]) {
                member_raws.push_back(raw);
            }
            raw_vectors.emplace(record.cum, std::move(raw));
        } catch (const InvalidQuantity& e) {
            report.excluded.push_back(ExcludedRecord{record.cum, e.what()});
            LogDebug("Excluded " + record.cum + ": " + e.what());
        }
    }
    report.vectorized_records = raw_vectors.size();
    report.training_members = member_raws.size();

    // 4. Scaling fitted on training members only
    FeatureScaler scaler = FeatureScaler::Fit(member_raws,
                                              VectorAssembler::LayoutTiers(),
                                              config_.assembler.weights);

    VectorTable vectors;
    VectorTable members;
    for (size_t i = 0; i < records.size(); ++i) {
        auto it = raw_vectors.find(records[i].cum);
        if (it == raw_vectors.end()) {
            continue;
        }
        FeatureVector weighted = scaler.Transform(it->second);
        if (eligible[i]) {
            members.emplace(records[i].cum, weighted);
        }
        vectors.emplace(records[i].cum, std::move(weighted));
    }

    // 5. Clustering
    FitParameters params = config_.clustering;
    if (config_.auto_select_k) {
        if (members.empty()) {
            throw InsufficientData(0, 1);
        }
        params.k = model_->SuggestClusterCount(members, params);
        LogDebug("Suggested k=" + std::to_string(params.k));
    }

    ClusterModelSnapshot snapshot = model_->Fit(members, params);
    report.cluster_count = snapshot.GetClusterCount();
    report.degraded = snapshot.IsDegraded();
    if (report.degraded) {
        LogDebug("Snapshot " + snapshot.GetID().ToString() +
                 " is degraded: no restart filled all " + std::to_string(params.k) + " clusters");
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    LogDebug("Trained snapshot " + snapshot.GetID().ToString() + " over " +
             std::to_string(report.training_members) + " members in " +
             std::to_string(elapsed.count()) + " ms");

    return std::make_shared<TrainedModel>(std::move(tables),
                                          std::move(scaler),
                                          config_.assembler,
                                          std::move(snapshot),
                                          records,
                                          std::move(eligible),
                                          std::move(vectors),
                                          std::move(report));
}

void EquivalenceEngine::Publish(std::shared_ptr<const TrainedModel> model) {
    if (!model) {
        throw std::invalid_argument("Cannot publish a null model");
    }
    LogDebug("Publishing snapshot " + model->GetID().ToString());
    std::atomic_store(&current_, std::move(model));
}

std::shared_ptr<const TrainedModel> EquivalenceEngine::TrainAndPublish(
    const std::vector<MedicationRecord>& records
) {
    auto model = Train(records);
    Publish(model);
    return model;
}

// ============================================================================
// Queries
// ============================================================================

std::shared_ptr<const TrainedModel> EquivalenceEngine::GetModel() const {
    return std::atomic_load(&current_);
}

EquivalenceResolver EquivalenceEngine::GetResolver() const {
    return EquivalenceResolver(RequireModel(), config_.resolver);
}

CandidateSequence EquivalenceEngine::Query(
    const RecordID& cum,
    const QueryOptions& options
) const {
    return GetResolver().Query(cum, options);
}

CandidateSequence EquivalenceEngine::QueryVector(
    const FeatureVector& vector,
    const QueryOptions& options,
    const std::optional<std::string>& query_atc
) const {
    return GetResolver().QueryVector(vector, options, query_atc);
}

CandidateSequence EquivalenceEngine::QueryRecord(
    const MedicationRecord& record,
    const QueryOptions& options
) const {
    return GetResolver().QueryRecord(record, options);
}

HomologationSummary EquivalenceEngine::Homologate(
    const std::vector<std::string>& cums,
    const QueryOptions& options
) const {
    EquivalenceResolver resolver = GetResolver();
    return BatchHomologation(resolver).Run(cums, options);
}

std::optional<MedicationRecord> EquivalenceEngine::GetRecord(const RecordID& cum) const {
    auto model = GetModel();
    if (!model) {
        return std::nullopt;
    }
    const MedicationRecord* record = model->FindRecord(cum);
    if (record == nullptr) {
        return std::nullopt;
    }
    return *record;
}

// ============================================================================
// Statistics & Information
// ============================================================================

EquivalenceEngine::Statistics EquivalenceEngine::GetStatistics() const {
    Statistics stats;
    auto model = GetModel();
    if (!model) {
        return stats;
    }

    const auto& report = model->GetReport();
    const auto& snapshot = model->GetSnapshot();
    stats.has_model = true;
    stats.snapshot_id = model->GetID();
    stats.records = report.total_records;
    stats.eligible = report.eligible_records;
    stats.training_members = report.training_members;
    stats.excluded = report.excluded.size();
    stats.cluster_count = snapshot.GetClusterCount();
    stats.inertia = snapshot.GetInertia();
    stats.cluster_sizes = snapshot.GetClusterSizes();
    return stats;
}

// ============================================================================
// Private Helper Methods
// ============================================================================

std::shared_ptr<const TrainedModel> EquivalenceEngine::RequireModel() const {
    auto model = GetModel();
    if (!model) {
        throw UnresolvableQuery("No model has been published");
    }
    return model;
}

void EquivalenceEngine::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[EquivalenceEngine] " << message << std::endl;
    }
}

} // namespace medeq

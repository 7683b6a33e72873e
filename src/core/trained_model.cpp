// File: src/core/trained_model.cpp
#include "core/trained_model.hpp"
#include <sstream>
#include <stdexcept>

namespace medeq {

std::string TrainingReport::ToString() const {
    std::ostringstream oss;
    oss << "Training report (" << algorithm << ")\n"
        << "  Records:            " << total_records << "\n"
        << "  Eligible:           " << eligible_records << "\n"
        << "  Vectorized:         " << vectorized_records << "\n"
        << "  Training members:   " << training_members << "\n"
        << "  Clusters:           " << cluster_count
        << (degraded ? " (degraded: some clusters are empty)" : "") << "\n"
        << "  Unknown categories: " << unknown_categories << "\n"
        << "  Excluded:           " << excluded.size() << "\n";
    for (const auto& entry : excluded) {
        oss << "    " << entry.cum << ": " << entry.reason << "\n";
    }
    return oss.str();
}

TrainedModel::TrainedModel(
    EncoderTables tables,
    FeatureScaler scaler,
    VectorAssembler::Config assembler_config,
    ClusterModelSnapshot snapshot,
    std::vector<MedicationRecord> records,
    std::vector<bool> eligible,
    VectorTable vectors,
    TrainingReport report
)
    : tables_(std::move(tables)),
      scaler_(std::move(scaler)),
      assembler_config_(std::move(assembler_config)),
      assembler_(assembler_config_),
      snapshot_(std::move(snapshot)),
      records_(std::move(records)),
      eligible_(std::move(eligible)),
      vectors_(std::move(vectors)),
      report_(std::move(report))
{
    if (records_.size() != eligible_.size()) {
        throw std::invalid_argument("records and eligibility flags must have the same length");
    }

    for (size_t i = 0; i < records_.size(); ++i) {
        if (!record_index_.emplace(records_[i].cum, i).second) {
            throw std::invalid_argument("Duplicate CUM in training batch: " + records_[i].cum);
        }
    }
}

const MedicationRecord* TrainedModel::FindRecord(const RecordID& cum) const {
    auto it = record_index_.find(cum);
    if (it == record_index_.end()) {
        return nullptr;
    }
    return &records_[it->second];
}

const FeatureVector* TrainedModel::FindVector(const RecordID& cum) const {
    auto it = vectors_.find(cum);
    if (it == vectors_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool TrainedModel::IsEligible(const RecordID& cum) const {
    auto it = record_index_.find(cum);
    if (it == record_index_.end()) {
        throw std::out_of_range("Unknown record: " + cum);
    }
    return eligible_[it->second];
}

std::map<std::string, std::string> TrainedModel::GetMetadata(const RecordID& cum) const {
    auto it = record_index_.find(cum);
    if (it == record_index_.end()) {
        throw std::out_of_range("Unknown record: " + cum);
    }
    return VectorAssembler::InformativeMetadata(records_[it->second], eligible_[it->second]);
}

FeatureVector TrainedModel::Vectorize(const MedicationRecord& record) const {
    return assembler_.Assemble(record, tables_, scaler_);
}

} // namespace medeq

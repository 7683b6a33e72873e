// File: src/core/trained_model.hpp
#pragma once

#include "clustering/cluster_snapshot.hpp"
#include "core/feature_vector.hpp"
#include "core/medication_record.hpp"
#include "encoding/vector_assembler.hpp"
#include "encoding/validity_classifier.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace medeq {

/// A record left out of training, flagged for manual review
struct ExcludedRecord {
    RecordID cum;
    std::string reason;
};

/// Batch-level report of one training run
struct TrainingReport {
    size_t total_records{0};        // Records in the batch
    size_t eligible_records{0};     // Records passing the eligibility rules
    size_t vectorized_records{0};   // Records whose numeric transforms succeeded
    size_t training_members{0};     // Eligible and vectorized
    size_t unknown_categories{0};   // Sentinel encodings during assembly
    size_t cluster_count{0};
    bool degraded{false};           // No restart filled every cluster
    std::string algorithm;
    std::vector<ExcludedRecord> excluded;

    /// Multi-line human-readable summary
    std::string ToString() const;
};

/// TrainedModel: Everything one training run produced.
///
/// Bundles the frequency tables, scaler, cluster snapshot, record table,
/// feature vector table and report. Immutable once built; the engine
/// publishes it as a whole so readers never see a mix of two runs.
class TrainedModel {
public:
    /// @param records Training batch, in any order
    /// @param eligible One flag per record
    /// @param vectors Weighted vectors of every vectorized record
    /// @throws std::invalid_argument on mismatched sizes or duplicate CUMs
    TrainedModel(EncoderTables tables,
                 FeatureScaler scaler,
                 VectorAssembler::Config assembler_config,
                 ClusterModelSnapshot snapshot,
                 std::vector<MedicationRecord> records,
                 std::vector<bool> eligible,
                 VectorTable vectors,
                 TrainingReport report);

    SnapshotID GetID() const { return snapshot_.GetID(); }

    const ClusterModelSnapshot& GetSnapshot() const { return snapshot_; }
    const EncoderTables& GetTables() const { return tables_; }
    const FeatureScaler& GetScaler() const { return scaler_; }
    const VectorAssembler::Config& GetAssemblerConfig() const { return assembler_config_; }
    const TrainingReport& GetReport() const { return report_; }

    const std::vector<MedicationRecord>& GetRecords() const { return records_; }

    /// Feature vector table keyed by record id (vectorized records only)
    const VectorTable& GetVectors() const { return vectors_; }

    /// Record lookup, nullptr if unknown
    const MedicationRecord* FindRecord(const RecordID& cum) const;

    /// Weighted vector lookup, nullptr if the record failed vectorization
    const FeatureVector* FindVector(const RecordID& cum) const;

    /// Eligibility flag of a known record
    /// @throws std::out_of_range for an unknown record
    bool IsEligible(const RecordID& cum) const;

    /// Informative metadata of a known record
    /// @throws std::out_of_range for an unknown record
    std::map<std::string, std::string> GetMetadata(const RecordID& cum) const;

    /// Weighted vector of a record outside the batch, using this run's
    /// tables and scaler; unseen categories get sentinel scores
    /// @throws InvalidQuantity if a numeric transform fails
    FeatureVector Vectorize(const MedicationRecord& record) const;

private:
    EncoderTables tables_;
    FeatureScaler scaler_;
    VectorAssembler::Config assembler_config_;
    VectorAssembler assembler_;
    ClusterModelSnapshot snapshot_;
    std::vector<MedicationRecord> records_;
    std::vector<bool> eligible_;
    std::unordered_map<RecordID, size_t> record_index_;
    VectorTable vectors_;
    TrainingReport report_;
};

} // namespace medeq

// File: src/storage/registry_store.hpp
#pragma once

#include "core/medication_record.hpp"
#include "core/trained_model.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace medeq {

/// Summary row of a stored model
struct StoredModelInfo {
    SnapshotID snapshot_id;
    int64_t created_at{0};        // Unix seconds
    std::string algorithm;
    size_t cluster_count{0};
    size_t training_members{0};
    double inertia{0.0};
};

/// Registry and model storage backed by SQLite
///
/// Holds two things:
/// - the cleaned medication table handed over by ingestion (`medications`)
/// - every saved TrainedModel, normalized into tables for audit and reload:
///   frequency tables, scaler parameters, centroids, restarts, the model's
///   record batch, feature vectors, assignments and exclusions
///
/// A loaded model is equivalent to the saved one: same snapshot id, same
/// encodings, same vectors and the same query results.
///
/// Thread-safety: all methods lock an internal mutex.
class RegistryStore {
public:
    /// Configuration for RegistryStore
    struct Config {
        /// Database file; created on first open
        std::string db_path;

        /// journal_mode=WAL so readers never block a store
        bool enable_wal{true};

        /// PRAGMA cache_size, in KiB
        size_t cache_size_kb{10240};

        /// PRAGMA synchronous value
        std::string synchronous{"NORMAL"};
    };

    /// @throws std::runtime_error if the database cannot be opened or
    ///         the schema cannot be created
    explicit RegistryStore(const Config& config);

    ~RegistryStore();

    RegistryStore(const RegistryStore&) = delete;
    RegistryStore& operator=(const RegistryStore&) = delete;

    // ========================================================================
    // Medication Registry
    // ========================================================================

    /// Insert or replace records, in one transaction
    /// @return Number of records written (0 on failure)
    size_t StoreRecords(const std::vector<MedicationRecord>& records);

    /// All records, ordered by CUM
    std::vector<MedicationRecord> LoadRecords() const;

    std::optional<MedicationRecord> GetRecord(const RecordID& cum) const;

    bool DeleteRecord(const RecordID& cum);

    size_t CountRecords() const;

    void ClearRecords();

    // ========================================================================
    // Trained Models
    // ========================================================================

    /// Persist a model and everything it needs to be reloaded
    /// @return false if the snapshot already exists or a write failed
    bool SaveModel(const TrainedModel& model);

    /// @throws std::runtime_error if the stored rows are inconsistent
    std::optional<TrainedModel> LoadModel(SnapshotID id) const;

    /// Model with the highest snapshot id
    std::optional<TrainedModel> LoadLatestModel() const;

    /// Stored models, newest first
    std::vector<StoredModelInfo> ListModels() const;

    bool DeleteModel(SnapshotID id);

    // ========================================================================
    // Maintenance
    // ========================================================================

    /// Checkpoint the WAL
    void Flush();

    /// VACUUM the database
    void Compact();

    /// Copy the whole database to another file
    bool CreateBackup(const std::string& path);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    void InitializeDatabase();
    void CreateTables();
    void CreateIndices();

    /// Runs statements that return no rows; false if SQLite rejects them
    bool ExecuteSQL(const std::string& sql) const;

    /// Largest stored snapshot id, 0 when none
    SnapshotID::ValueType MaxSnapshotID() const;

    bool SaveModelUnlocked(const TrainedModel& model);
    std::optional<TrainedModel> LoadModelUnlocked(SnapshotID id) const;

    void BeginTransaction();
    void CommitTransaction();
    void RollbackTransaction();
};

} // namespace medeq

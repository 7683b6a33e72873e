// File: src/storage/registry_store.cpp
#include "storage/registry_store.hpp"
#include <cstring>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace medeq {

namespace {

// Finalizes a prepared statement on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_{nullptr};
};

const char* kRecordColumns =
    "cum, product_name, active_ingredient, atc_code, atc_description, "
    "pharmaceutical_form, route, measurement_unit, quantity, reference_quantity, "
    "registration_status, cum_status, medical_sample, expiration_date, "
    "file_number, covered_by_benefit_plan";

const char* kRecordColumnDefinitions = R"(
            product_name TEXT NOT NULL,
            active_ingredient TEXT NOT NULL,
            atc_code TEXT NOT NULL,
            atc_description TEXT NOT NULL,
            pharmaceutical_form TEXT NOT NULL,
            route TEXT NOT NULL,
            measurement_unit TEXT NOT NULL,
            quantity REAL NOT NULL,
            reference_quantity REAL NOT NULL,
            registration_status TEXT NOT NULL,
            cum_status TEXT NOT NULL,
            medical_sample INTEGER NOT NULL,
            expiration_date TEXT NOT NULL,
            file_number TEXT NOT NULL,
            covered_by_benefit_plan INTEGER NOT NULL
)";

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* stmt, int index, const std::string& blob) {
    sqlite3_bind_blob(stmt, index, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
}

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (text == nullptr) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
}

std::string ColumnBlob(sqlite3_stmt* stmt, int column) {
    const void* data = sqlite3_column_blob(stmt, column);
    int size = sqlite3_column_bytes(stmt, column);
    if (data == nullptr || size <= 0) {
        return "";
    }
    return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
}

// Binds the record columns starting at parameter `first`
void BindRecord(sqlite3_stmt* stmt, int first, const MedicationRecord& record) {
    BindText(stmt, first, record.cum);
    BindText(stmt, first + 1, record.product_name);
    BindText(stmt, first + 2, record.active_ingredient);
    BindText(stmt, first + 3, record.atc_code);
    BindText(stmt, first + 4, record.atc_description);
    BindText(stmt, first + 5, record.pharmaceutical_form);
    BindText(stmt, first + 6, record.route);
    BindText(stmt, first + 7, record.measurement_unit);
    sqlite3_bind_double(stmt, first + 8, record.quantity);
    sqlite3_bind_double(stmt, first + 9, record.reference_quantity);
    BindText(stmt, first + 10, ToString(record.registration_status));
    BindText(stmt, first + 11, ToString(record.cum_status));
    sqlite3_bind_int(stmt, first + 12, record.medical_sample ? 1 : 0);
    BindText(stmt, first + 13, record.expiration_date);
    BindText(stmt, first + 14, record.file_number);
    sqlite3_bind_int(stmt, first + 15, record.covered_by_benefit_plan ? 1 : 0);
}

// Reads the record columns starting at column `first`
MedicationRecord ReadRecord(sqlite3_stmt* stmt, int first) {
    MedicationRecord record;
    record.cum = ColumnText(stmt, first);
    record.product_name = ColumnText(stmt, first + 1);
    record.active_ingredient = ColumnText(stmt, first + 2);
    record.atc_code = ColumnText(stmt, first + 3);
    record.atc_description = ColumnText(stmt, first + 4);
    record.pharmaceutical_form = ColumnText(stmt, first + 5);
    record.route = ColumnText(stmt, first + 6);
    record.measurement_unit = ColumnText(stmt, first + 7);
    record.quantity = sqlite3_column_double(stmt, first + 8);
    record.reference_quantity = sqlite3_column_double(stmt, first + 9);
    record.registration_status = ParseRegistrationStatus(ColumnText(stmt, first + 10));
    record.cum_status = ParseCumStatus(ColumnText(stmt, first + 11));
    record.medical_sample = sqlite3_column_int(stmt, first + 12) != 0;
    record.expiration_date = ColumnText(stmt, first + 13);
    record.file_number = ColumnText(stmt, first + 14);
    record.covered_by_benefit_plan = sqlite3_column_int(stmt, first + 15) != 0;
    return record;
}

std::string VectorToBlob(const FeatureVector& vector) {
    std::ostringstream oss(std::ios::binary);
    vector.Serialize(oss);
    return oss.str();
}

FeatureVector VectorFromBlob(const std::string& blob) {
    std::istringstream iss(blob, std::ios::binary);
    return FeatureVector::Deserialize(iss);
}

std::string DoublesToBlob(const std::vector<double>& values) {
    std::string blob(values.size() * sizeof(double), '\0');
    if (!values.empty()) {
        std::memcpy(&blob[0], values.data(), blob.size());
    }
    return blob;
}

std::vector<double> DoublesFromBlob(const std::string& blob) {
    if (blob.size() % sizeof(double) != 0) {
        throw std::runtime_error("Corrupt double array blob");
    }
    std::vector<double> values(blob.size() / sizeof(double));
    if (!values.empty()) {
        std::memcpy(values.data(), blob.data(), blob.size());
    }
    return values;
}

FeatureTier TierFromInt(int value) {
    switch (value) {
        case 0: return FeatureTier::CRITICAL;
        case 1: return FeatureTier::IMPORTANT;
        case 2: return FeatureTier::INFORMATIVE;
        default:
            throw std::runtime_error("Invalid feature tier in store: " + std::to_string(value));
    }
}

// Step a write statement and reset it for the next row
bool StepAndReset(sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

} // anonymous namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

RegistryStore::RegistryStore(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    try {
        InitializeDatabase();
    } catch (...) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }
}

RegistryStore::~RegistryStore() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void RegistryStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, 5000);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
    ExecuteSQL("PRAGMA cache_size=-" + std::to_string(config_.cache_size_kb) + ";");

    CreateTables();
    CreateIndices();

    // Snapshot ids restored from disk must not be handed out again
    SnapshotID::ReserveAtLeast(MaxSnapshotID());
}

void RegistryStore::CreateTables() {
    std::vector<std::string> statements = {
        std::string("CREATE TABLE IF NOT EXISTS medications (\n"
                    "    cum TEXT PRIMARY KEY,") + kRecordColumnDefinitions + ");",

        R"(CREATE TABLE IF NOT EXISTS models (
            snapshot_id INTEGER PRIMARY KEY,
            created_at INTEGER NOT NULL,
            algorithm TEXT NOT NULL,
            cluster_count INTEGER NOT NULL,
            inertia REAL NOT NULL,
            best_restart INTEGER NOT NULL,
            total_records INTEGER NOT NULL,
            eligible_records INTEGER NOT NULL,
            vectorized_records INTEGER NOT NULL,
            training_members INTEGER NOT NULL,
            unknown_categories INTEGER NOT NULL,
            critical_weight REAL NOT NULL,
            important_weight REAL NOT NULL,
            bin_breakpoints BLOB
        );)",

        R"(CREATE TABLE IF NOT EXISTS encoder_tables (
            snapshot_id INTEGER NOT NULL,
            attribute TEXT NOT NULL,
            total_eligible INTEGER NOT NULL,
            count_divisor REAL NOT NULL,
            PRIMARY KEY (snapshot_id, attribute)
        );)",

        R"(CREATE TABLE IF NOT EXISTS frequency_entries (
            snapshot_id INTEGER NOT NULL,
            attribute TEXT NOT NULL,
            value TEXT NOT NULL,
            rank INTEGER NOT NULL,
            count INTEGER NOT NULL,
            eligible_count INTEGER NOT NULL,
            PRIMARY KEY (snapshot_id, attribute, value)
        );)",

        R"(CREATE TABLE IF NOT EXISTS scaler (
            snapshot_id INTEGER NOT NULL,
            component INTEGER NOT NULL,
            name TEXT NOT NULL,
            tier INTEGER NOT NULL,
            mean REAL NOT NULL,
            deviation REAL NOT NULL,
            PRIMARY KEY (snapshot_id, component)
        );)",

        R"(CREATE TABLE IF NOT EXISTS centroids (
            snapshot_id INTEGER NOT NULL,
            label INTEGER NOT NULL,
            vector BLOB NOT NULL,
            PRIMARY KEY (snapshot_id, label)
        );)",

        R"(CREATE TABLE IF NOT EXISTS restarts (
            snapshot_id INTEGER NOT NULL,
            restart INTEGER NOT NULL,
            inertia REAL NOT NULL,
            iterations INTEGER NOT NULL,
            reseeds INTEGER NOT NULL,
            converged INTEGER NOT NULL,
            failed INTEGER NOT NULL,
            empty_clusters INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (snapshot_id, restart)
        );)",

        std::string("CREATE TABLE IF NOT EXISTS model_records (\n"
                    "    snapshot_id INTEGER NOT NULL,\n"
                    "    position INTEGER NOT NULL,\n"
                    "    eligible INTEGER NOT NULL,\n"
                    "    cum TEXT NOT NULL,") + kRecordColumnDefinitions +
            ",    PRIMARY KEY (snapshot_id, cum));",

        R"(CREATE TABLE IF NOT EXISTS feature_vectors (
            snapshot_id INTEGER NOT NULL,
            cum TEXT NOT NULL,
            vector BLOB NOT NULL,
            PRIMARY KEY (snapshot_id, cum)
        );)",

        R"(CREATE TABLE IF NOT EXISTS assignments (
            snapshot_id INTEGER NOT NULL,
            cum TEXT NOT NULL,
            label INTEGER NOT NULL,
            PRIMARY KEY (snapshot_id, cum)
        );)",

        R"(CREATE TABLE IF NOT EXISTS exclusions (
            snapshot_id INTEGER NOT NULL,
            cum TEXT NOT NULL,
            reason TEXT NOT NULL
        );)",
    };

    for (const auto& sql : statements) {
        if (!ExecuteSQL(sql)) {
            throw std::runtime_error("Failed to create schema: " + std::string(sqlite3_errmsg(db_)));
        }
    }
}

void RegistryStore::CreateIndices() {
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_medications_atc ON medications(atc_code);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_assignments_label ON assignments(snapshot_id, label);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_exclusions_snapshot ON exclusions(snapshot_id);");
}

bool RegistryStore::ExecuteSQL(const std::string& sql) const {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

SnapshotID::ValueType RegistryStore::MaxSnapshotID() const {
    Statement stmt(db_, "SELECT MAX(snapshot_id) FROM models;");
    if (!stmt.ok()) {
        return 0;
    }
    if (sqlite3_step(stmt.get()) == SQLITE_ROW &&
        sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL) {
        return static_cast<SnapshotID::ValueType>(sqlite3_column_int64(stmt.get(), 0));
    }
    return 0;
}

// ============================================================================
// Medication Registry
// ============================================================================

size_t RegistryStore::StoreRecords(const std::vector<MedicationRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (records.empty()) {
        return 0;
    }

    std::string sql = std::string("INSERT OR REPLACE INTO medications (") + kRecordColumns +
                      ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";

    BeginTransaction();

    Statement stmt(db_, sql.c_str());
    if (!stmt.ok()) {
        RollbackTransaction();
        return 0;
    }

    size_t stored_count = 0;
    for (const auto& record : records) {
        BindRecord(stmt.get(), 1, record);
        if (!StepAndReset(stmt.get())) {
            RollbackTransaction();
            return 0;
        }
        ++stored_count;
    }

    CommitTransaction();
    return stored_count;
}

std::vector<MedicationRecord> RegistryStore::LoadRecords() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<MedicationRecord> records;
    std::string sql = std::string("SELECT ") + kRecordColumns + " FROM medications ORDER BY cum;";
    Statement stmt(db_, sql.c_str());
    if (!stmt.ok()) {
        return records;
    }

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        records.push_back(ReadRecord(stmt.get(), 0));
    }
    return records;
}

std::optional<MedicationRecord> RegistryStore::GetRecord(const RecordID& cum) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kRecordColumns + " FROM medications WHERE cum = ?;";
    Statement stmt(db_, sql.c_str());
    if (!stmt.ok()) {
        return std::nullopt;
    }

    BindText(stmt.get(), 1, cum);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return ReadRecord(stmt.get(), 0);
    }
    return std::nullopt;
}

bool RegistryStore::DeleteRecord(const RecordID& cum) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "DELETE FROM medications WHERE cum = ?;");
    if (!stmt.ok()) {
        return false;
    }

    BindText(stmt.get(), 1, cum);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

size_t RegistryStore::CountRecords() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT COUNT(*) FROM medications;");
    if (!stmt.ok()) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }
    return count;
}

void RegistryStore::ClearRecords() {
    std::lock_guard<std::mutex> lock(mutex_);
    ExecuteSQL("DELETE FROM medications;");
}

// ============================================================================
// Trained Models
// ============================================================================

bool RegistryStore::SaveModel(const TrainedModel& model) {
    std::lock_guard<std::mutex> lock(mutex_);

    BeginTransaction();
    bool saved = false;
    try {
        saved = SaveModelUnlocked(model);
    } catch (...) {
        RollbackTransaction();
        throw;
    }

    if (saved) {
        CommitTransaction();
    } else {
        RollbackTransaction();
    }
    return saved;
}

bool RegistryStore::SaveModelUnlocked(const TrainedModel& model) {
    const auto id = static_cast<sqlite3_int64>(model.GetID().value());
    const auto& snapshot = model.GetSnapshot();
    const auto& report = model.GetReport();
    const auto& assembler_config = model.GetAssemblerConfig();

    // Header row; fails on an existing snapshot id
    {
        Statement stmt(db_, R"(INSERT INTO models (snapshot_id, created_at, algorithm,
            cluster_count, inertia, best_restart, total_records, eligible_records,
            vectorized_records, training_members, unknown_categories,
            critical_weight, important_weight, bin_breakpoints)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);)");
        if (!stmt.ok()) {
            return false;
        }
        sqlite3_bind_int64(stmt.get(), 1, id);
        sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(std::time(nullptr)));
        BindText(stmt.get(), 3, report.algorithm);
        sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(snapshot.GetClusterCount()));
        sqlite3_bind_double(stmt.get(), 5, snapshot.GetInertia());
        sqlite3_bind_int64(stmt.get(), 6, static_cast<sqlite3_int64>(snapshot.GetBestRestart()));
        sqlite3_bind_int64(stmt.get(), 7, static_cast<sqlite3_int64>(report.total_records));
        sqlite3_bind_int64(stmt.get(), 8, static_cast<sqlite3_int64>(report.eligible_records));
        sqlite3_bind_int64(stmt.get(), 9, static_cast<sqlite3_int64>(report.vectorized_records));
        sqlite3_bind_int64(stmt.get(), 10, static_cast<sqlite3_int64>(report.training_members));
        sqlite3_bind_int64(stmt.get(), 11, static_cast<sqlite3_int64>(report.unknown_categories));
        sqlite3_bind_double(stmt.get(), 12, assembler_config.weights.critical_weight);
        sqlite3_bind_double(stmt.get(), 13, assembler_config.weights.important_weight);
        BindBlob(stmt.get(), 14, DoublesToBlob(assembler_config.bin_breakpoints));
        if (!StepAndReset(stmt.get())) {
            return false;
        }
    }

    // Frequency tables
    {
        Statement table_stmt(db_, "INSERT INTO encoder_tables (snapshot_id, attribute, "
                                  "total_eligible, count_divisor) VALUES (?, ?, ?, ?);");
        Statement entry_stmt(db_, "INSERT INTO frequency_entries (snapshot_id, attribute, "
                                  "value, rank, count, eligible_count) VALUES (?, ?, ?, ?, ?, ?);");
        if (!table_stmt.ok() || !entry_stmt.ok()) {
            return false;
        }

        for (const auto& attribute : EncoderTables::AttributeNames()) {
            const auto& table = model.GetTables().Get(attribute);
            sqlite3_bind_int64(table_stmt.get(), 1, id);
            BindText(table_stmt.get(), 2, attribute);
            sqlite3_bind_int64(table_stmt.get(), 3, static_cast<sqlite3_int64>(table.GetTotalEligible()));
            sqlite3_bind_double(table_stmt.get(), 4, table.GetCountDivisor());
            if (!StepAndReset(table_stmt.get())) {
                return false;
            }

            for (const auto& entry : table.GetEntries()) {
                sqlite3_bind_int64(entry_stmt.get(), 1, id);
                BindText(entry_stmt.get(), 2, attribute);
                BindText(entry_stmt.get(), 3, entry.value);
                sqlite3_bind_int64(entry_stmt.get(), 4, static_cast<sqlite3_int64>(entry.rank));
                sqlite3_bind_int64(entry_stmt.get(), 5, static_cast<sqlite3_int64>(entry.count));
                sqlite3_bind_int64(entry_stmt.get(), 6, static_cast<sqlite3_int64>(entry.eligible_count));
                if (!StepAndReset(entry_stmt.get())) {
                    return false;
                }
            }
        }
    }

    // Scaler parameters, one row per component
    {
        Statement stmt(db_, "INSERT INTO scaler (snapshot_id, component, name, tier, mean, "
                            "deviation) VALUES (?, ?, ?, ?, ?, ?);");
        if (!stmt.ok()) {
            return false;
        }

        const auto& scaler = model.GetScaler();
        const auto& layout = VectorAssembler::Layout();
        for (size_t i = 0; i < scaler.Dimension(); ++i) {
            sqlite3_bind_int64(stmt.get(), 1, id);
            sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(i));
            BindText(stmt.get(), 3, i < layout.size() ? layout[i].name : std::string());
            sqlite3_bind_int(stmt.get(), 4, static_cast<int>(scaler.GetTiers()[i]));
            sqlite3_bind_double(stmt.get(), 5, scaler.GetMeans()[i]);
            sqlite3_bind_double(stmt.get(), 6, scaler.GetDeviations()[i]);
            if (!StepAndReset(stmt.get())) {
                return false;
            }
        }
    }

    // Centroids
    {
        Statement stmt(db_, "INSERT INTO centroids (snapshot_id, label, vector) VALUES (?, ?, ?);");
        if (!stmt.ok()) {
            return false;
        }

        const auto& centroids = snapshot.GetCentroids();
        for (size_t label = 0; label < centroids.size(); ++label) {
            sqlite3_bind_int64(stmt.get(), 1, id);
            sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(label));
            BindBlob(stmt.get(), 3, VectorToBlob(centroids[label]));
            if (!StepAndReset(stmt.get())) {
                return false;
            }
        }
    }

    // Restart outcomes
    {
        Statement stmt(db_, "INSERT INTO restarts (snapshot_id, restart, inertia, iterations, "
                            "reseeds, converged, failed, empty_clusters) "
                            "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        if (!stmt.ok()) {
            return false;
        }

        for (const auto& restart : snapshot.GetRestarts()) {
            sqlite3_bind_int64(stmt.get(), 1, id);
            sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(restart.restart));
            sqlite3_bind_double(stmt.get(), 3, restart.inertia);
            sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(restart.iterations));
            sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(restart.reseeds));
            sqlite3_bind_int(stmt.get(), 6, restart.converged ? 1 : 0);
            sqlite3_bind_int(stmt.get(), 7, restart.failed ? 1 : 0);
            sqlite3_bind_int64(stmt.get(), 8, static_cast<sqlite3_int64>(restart.empty_clusters));
            if (!StepAndReset(stmt.get())) {
                return false;
            }
        }
    }

    // Training batch
    {
        std::string sql = std::string("INSERT INTO model_records (snapshot_id, position, eligible, ") +
                          kRecordColumns +
                          ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
        Statement stmt(db_, sql.c_str());
        if (!stmt.ok()) {
            return false;
        }

        const auto& records = model.GetRecords();
        for (size_t i = 0; i < records.size(); ++i) {
            sqlite3_bind_int64(stmt.get(), 1, id);
            sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(i));
            sqlite3_bind_int(stmt.get(), 3, model.IsEligible(records[i].cum) ? 1 : 0);
            BindRecord(stmt.get(), 4, records[i]);
            if (!StepAndReset(stmt.get())) {
                return false;
            }
        }
    }

    // Feature vectors of every vectorized record
    {
        Statement stmt(db_, "INSERT INTO feature_vectors (snapshot_id, cum, vector) VALUES (?, ?, ?);");
        if (!stmt.ok()) {
            return false;
        }

        for (const auto& [cum, vector] : model.GetVectors()) {
            sqlite3_bind_int64(stmt.get(), 1, id);
            BindText(stmt.get(), 2, cum);
            BindBlob(stmt.get(), 3, VectorToBlob(vector));
            if (!StepAndReset(stmt.get())) {
                return false;
            }
        }
    }

    // Cluster assignments of the training members
    {
        Statement stmt(db_, "INSERT INTO assignments (snapshot_id, cum, label) VALUES (?, ?, ?);");
        if (!stmt.ok()) {
            return false;
        }

        for (const auto& assignment : snapshot.GetAssignments()) {
            sqlite3_bind_int64(stmt.get(), 1, id);
            BindText(stmt.get(), 2, assignment.record_id);
            sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(assignment.cluster_label));
            if (!StepAndReset(stmt.get())) {
                return false;
            }
        }
    }

    // Records excluded during vectorization
    {
        Statement stmt(db_, "INSERT INTO exclusions (snapshot_id, cum, reason) VALUES (?, ?, ?);");
        if (!stmt.ok()) {
            return false;
        }

        for (const auto& excluded : report.excluded) {
            sqlite3_bind_int64(stmt.get(), 1, id);
            BindText(stmt.get(), 2, excluded.cum);
            BindText(stmt.get(), 3, excluded.reason);
            if (!StepAndReset(stmt.get())) {
                return false;
            }
        }
    }

    return true;
}

std::optional<TrainedModel> RegistryStore::LoadModel(SnapshotID id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadModelUnlocked(id);
}

std::optional<TrainedModel> RegistryStore::LoadLatestModel() const {
    std::lock_guard<std::mutex> lock(mutex_);

    SnapshotID::ValueType latest = MaxSnapshotID();
    if (latest == 0) {
        return std::nullopt;
    }
    return LoadModelUnlocked(SnapshotID(latest));
}

std::optional<TrainedModel> RegistryStore::LoadModelUnlocked(SnapshotID id) const {
    const auto key = static_cast<sqlite3_int64>(id.value());

    TrainingReport report;
    VectorAssembler::Config assembler_config;
    size_t best_restart = 0;

    // Header
    {
        Statement stmt(db_, R"(SELECT algorithm, cluster_count, best_restart, total_records,
            eligible_records, vectorized_records, training_members, unknown_categories,
            critical_weight, important_weight, bin_breakpoints
            FROM models WHERE snapshot_id = ?;)");
        if (!stmt.ok()) {
            return std::nullopt;
        }
        sqlite3_bind_int64(stmt.get(), 1, key);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            return std::nullopt;
        }

        report.algorithm = ColumnText(stmt.get(), 0);
        report.cluster_count = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 1));
        best_restart = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 2));
        report.total_records = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 3));
        report.eligible_records = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 4));
        report.vectorized_records = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 5));
        report.training_members = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 6));
        report.unknown_categories = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 7));
        assembler_config.weights.critical_weight = sqlite3_column_double(stmt.get(), 8);
        assembler_config.weights.important_weight = sqlite3_column_double(stmt.get(), 9);
        assembler_config.bin_breakpoints = DoublesFromBlob(ColumnBlob(stmt.get(), 10));
    }

    // Frequency tables
    EncoderTables tables;
    {
        Statement table_stmt(db_, "SELECT attribute, total_eligible, count_divisor "
                                  "FROM encoder_tables WHERE snapshot_id = ?;");
        Statement entry_stmt(db_, "SELECT value, count, eligible_count FROM frequency_entries "
                                  "WHERE snapshot_id = ? AND attribute = ?;");
        if (!table_stmt.ok() || !entry_stmt.ok()) {
            throw std::runtime_error("Failed to read frequency tables: " + std::string(sqlite3_errmsg(db_)));
        }

        sqlite3_bind_int64(table_stmt.get(), 1, key);
        while (sqlite3_step(table_stmt.get()) == SQLITE_ROW) {
            std::string attribute = ColumnText(table_stmt.get(), 0);
            size_t total_eligible = static_cast<size_t>(sqlite3_column_int64(table_stmt.get(), 1));
            double divisor = sqlite3_column_double(table_stmt.get(), 2);

            std::unordered_map<std::string, CategoricalFrequencyTable::Counts> counts;
            sqlite3_bind_int64(entry_stmt.get(), 1, key);
            BindText(entry_stmt.get(), 2, attribute);
            while (sqlite3_step(entry_stmt.get()) == SQLITE_ROW) {
                CategoricalFrequencyTable::Counts value_counts;
                value_counts.count = static_cast<size_t>(sqlite3_column_int64(entry_stmt.get(), 1));
                value_counts.eligible_count = static_cast<size_t>(sqlite3_column_int64(entry_stmt.get(), 2));
                counts.emplace(ColumnText(entry_stmt.get(), 0), value_counts);
            }
            sqlite3_reset(entry_stmt.get());

            tables.Get(attribute) = CategoricalFrequencyTable::FromCounts(
                attribute, counts, total_eligible, divisor);
        }
    }

    // Scaler
    FeatureScaler scaler;
    {
        Statement stmt(db_, "SELECT tier, mean, deviation FROM scaler "
                            "WHERE snapshot_id = ? ORDER BY component;");
        if (!stmt.ok()) {
            throw std::runtime_error("Failed to read scaler: " + std::string(sqlite3_errmsg(db_)));
        }

        std::vector<double> means;
        std::vector<double> deviations;
        std::vector<FeatureTier> tiers;
        sqlite3_bind_int64(stmt.get(), 1, key);
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            tiers.push_back(TierFromInt(sqlite3_column_int(stmt.get(), 0)));
            means.push_back(sqlite3_column_double(stmt.get(), 1));
            deviations.push_back(sqlite3_column_double(stmt.get(), 2));
        }
        scaler = FeatureScaler::FromParameters(std::move(means), std::move(deviations),
                                               std::move(tiers), assembler_config.weights);
    }

    // Centroids
    std::vector<FeatureVector> centroids;
    {
        Statement stmt(db_, "SELECT vector FROM centroids WHERE snapshot_id = ? ORDER BY label;");
        if (!stmt.ok()) {
            throw std::runtime_error("Failed to read centroids: " + std::string(sqlite3_errmsg(db_)));
        }
        sqlite3_bind_int64(stmt.get(), 1, key);
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            centroids.push_back(VectorFromBlob(ColumnBlob(stmt.get(), 0)));
        }
    }

    // Restarts
    std::vector<RestartResult> restarts;
    {
        Statement stmt(db_, "SELECT restart, inertia, iterations, reseeds, converged, failed, "
                            "empty_clusters FROM restarts WHERE snapshot_id = ? ORDER BY restart;");
        if (!stmt.ok()) {
            throw std::runtime_error("Failed to read restarts: " + std::string(sqlite3_errmsg(db_)));
        }
        sqlite3_bind_int64(stmt.get(), 1, key);
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            RestartResult restart;
            restart.restart = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
            restart.inertia = sqlite3_column_double(stmt.get(), 1);
            restart.iterations = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 2));
            restart.reseeds = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 3));
            restart.converged = sqlite3_column_int(stmt.get(), 4) != 0;
            restart.failed = sqlite3_column_int(stmt.get(), 5) != 0;
            restart.empty_clusters = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 6));
            restarts.push_back(restart);
        }
    }

    // Training batch, in its original order
    std::vector<MedicationRecord> records;
    std::vector<bool> eligible;
    {
        std::string sql = std::string("SELECT eligible, ") + kRecordColumns +
                          " FROM model_records WHERE snapshot_id = ? ORDER BY position;";
        Statement stmt(db_, sql.c_str());
        if (!stmt.ok()) {
            throw std::runtime_error("Failed to read model records: " + std::string(sqlite3_errmsg(db_)));
        }
        sqlite3_bind_int64(stmt.get(), 1, key);
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            eligible.push_back(sqlite3_column_int(stmt.get(), 0) != 0);
            records.push_back(ReadRecord(stmt.get(), 1));
        }
    }

    // Feature vectors
    VectorTable vectors;
    {
        Statement stmt(db_, "SELECT cum, vector FROM feature_vectors WHERE snapshot_id = ?;");
        if (!stmt.ok()) {
            throw std::runtime_error("Failed to read feature vectors: " + std::string(sqlite3_errmsg(db_)));
        }
        sqlite3_bind_int64(stmt.get(), 1, key);
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            vectors.emplace(ColumnText(stmt.get(), 0), VectorFromBlob(ColumnBlob(stmt.get(), 1)));
        }
    }

    // Assignments, in record-id order like a fresh fit
    std::vector<ClusterAssignment> assignments;
    {
        Statement stmt(db_, "SELECT cum, label FROM assignments WHERE snapshot_id = ? ORDER BY cum;");
        if (!stmt.ok()) {
            throw std::runtime_error("Failed to read assignments: " + std::string(sqlite3_errmsg(db_)));
        }
        sqlite3_bind_int64(stmt.get(), 1, key);
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            std::string cum = ColumnText(stmt.get(), 0);
            auto it = vectors.find(cum);
            if (it == vectors.end()) {
                throw std::runtime_error("Assignment without a feature vector: " + cum);
            }
            size_t label = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 1));
            assignments.push_back(ClusterAssignment{cum, label, it->second});
        }
    }

    // Exclusions
    {
        Statement stmt(db_, "SELECT cum, reason FROM exclusions WHERE snapshot_id = ? ORDER BY rowid;");
        if (!stmt.ok()) {
            throw std::runtime_error("Failed to read exclusions: " + std::string(sqlite3_errmsg(db_)));
        }
        sqlite3_bind_int64(stmt.get(), 1, key);
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            report.excluded.push_back(ExcludedRecord{ColumnText(stmt.get(), 0),
                                                     ColumnText(stmt.get(), 1)});
        }
    }

    ClusterModelSnapshot snapshot(id, std::move(centroids), std::move(assignments),
                                  std::move(restarts), best_restart);
    report.degraded = snapshot.IsDegraded();

    return TrainedModel(std::move(tables), std::move(scaler), std::move(assembler_config),
                        std::move(snapshot), std::move(records), std::move(eligible),
                        std::move(vectors), std::move(report));
}

std::vector<StoredModelInfo> RegistryStore::ListModels() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<StoredModelInfo> models;
    Statement stmt(db_, "SELECT snapshot_id, created_at, algorithm, cluster_count, "
                        "training_members, inertia FROM models ORDER BY snapshot_id DESC;");
    if (!stmt.ok()) {
        return models;
    }

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        StoredModelInfo info;
        info.snapshot_id = SnapshotID(static_cast<SnapshotID::ValueType>(sqlite3_column_int64(stmt.get(), 0)));
        info.created_at = sqlite3_column_int64(stmt.get(), 1);
        info.algorithm = ColumnText(stmt.get(), 2);
        info.cluster_count = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 3));
        info.training_members = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 4));
        info.inertia = sqlite3_column_double(stmt.get(), 5);
        models.push_back(std::move(info));
    }
    return models;
}

bool RegistryStore::DeleteModel(SnapshotID id) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto key = static_cast<sqlite3_int64>(id.value());
    const char* tables[] = {
        "encoder_tables", "frequency_entries", "scaler", "centroids", "restarts",
        "model_records", "feature_vectors", "assignments", "exclusions",
    };

    BeginTransaction();
    for (const char* table : tables) {
        std::string sql = std::string("DELETE FROM ") + table + " WHERE snapshot_id = ?;";
        Statement stmt(db_, sql.c_str());
        if (!stmt.ok()) {
            RollbackTransaction();
            return false;
        }
        sqlite3_bind_int64(stmt.get(), 1, key);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            RollbackTransaction();
            return false;
        }
    }

    Statement stmt(db_, "DELETE FROM models WHERE snapshot_id = ?;");
    if (!stmt.ok()) {
        RollbackTransaction();
        return false;
    }
    sqlite3_bind_int64(stmt.get(), 1, key);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        RollbackTransaction();
        return false;
    }
    bool deleted = sqlite3_changes(db_) > 0;

    CommitTransaction();
    return deleted;
}

// ============================================================================
// Maintenance Operations
// ============================================================================

void RegistryStore::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA wal_checkpoint(FULL);");
    }
}

void RegistryStore::Compact() {
    std::lock_guard<std::mutex> lock(mutex_);
    ExecuteSQL("VACUUM;");
}

bool RegistryStore::CreateBackup(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA wal_checkpoint(FULL);");
    }

    sqlite3* backup_db = nullptr;
    int rc = sqlite3_open(path.c_str(), &backup_db);
    if (rc != SQLITE_OK) {
        sqlite3_close(backup_db);
        return false;
    }

    sqlite3_backup* backup = sqlite3_backup_init(backup_db, "main", db_, "main");
    if (!backup) {
        sqlite3_close(backup_db);
        return false;
    }

    sqlite3_backup_step(backup, -1);
    sqlite3_backup_finish(backup);

    rc = sqlite3_errcode(backup_db);
    sqlite3_close(backup_db);

    return rc == SQLITE_OK;
}

// ============================================================================
// Helper Methods
// ============================================================================

void RegistryStore::BeginTransaction() {
    ExecuteSQL("BEGIN TRANSACTION;");
}

void RegistryStore::CommitTransaction() {
    ExecuteSQL("COMMIT;");
}

void RegistryStore::RollbackTransaction() {
    ExecuteSQL("ROLLBACK;");
}

} // namespace medeq

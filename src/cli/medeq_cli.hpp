// File: src/cli/medeq_cli.hpp
//
// MedEq CLI class definition
// Extracted for testability

#ifndef MEDEQ_CLI_HPP
#define MEDEQ_CLI_HPP

#include "cli/medeq_config.hpp"
#include "core/equivalence_engine.hpp"
#include "storage/registry_store.hpp"
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace medeq {

/// ANSI color codes for terminal output
namespace Color {
    inline const char* RESET = "\033[0m";

    inline const char* RED = "\033[31m";
    inline const char* GREEN = "\033[32m";
    inline const char* YELLOW = "\033[33m";
    inline const char* CYAN = "\033[36m";

    inline const char* BOLD_GREEN = "\033[1;32m";
    inline const char* BOLD_CYAN = "\033[1;36m";

    inline const char* BOLD = "\033[1m";
    inline const char* DIM = "\033[2m";
}

/// Engine configuration described by a CLI configuration
/// @param verbose Switches component debug logging on
/// @throws std::invalid_argument for unknown status or filter names
EquivalenceEngine::Config ToEngineConfig(const MedEqConfig& config, bool verbose);

/// Command-line front end of the equivalence engine
///
/// Works on one registry database: trains from its `medications` table,
/// stores every trained model there and reloads the latest one on start.
class MedEqCli {
public:
    MedEqCli();
    explicit MedEqCli(const MedEqConfig& config);
    ~MedEqCli();

    MedEqCli(const MedEqCli&) = delete;
    MedEqCli& operator=(const MedEqCli&) = delete;

    /// Main run loop - interactive mode
    void Run();

    /// Process a single command
    /// @return false if the command failed or was unknown
    bool ProcessCommand(const std::string& input);

    /// Set database path (for testing with temp files)
    void SetDatabasePath(const std::string& path) { db_path_ = path; }

    /// Open the database without loading a stored model (for testing)
    void InitializeClean();

    /// Open the database and publish its latest stored model, if any
    void Initialize();

    // Accessors for verification
    bool HasModel() const { return engine_ && engine_->HasModel(); }
    bool IsVerboseEnabled() const { return verbose_; }
    bool IsRunning() const { return running_; }
    size_t GetCommandsProcessed() const { return commands_processed_; }
    const QueryOptions& GetQueryOptions() const { return query_options_; }
    const std::vector<Candidate>& GetLastResults() const { return last_results_; }
    const std::optional<HomologationSummary>& GetLastBatch() const { return last_batch_; }
    const std::string& GetDatabasePath() const { return db_path_; }

    EquivalenceEngine& GetEngine() { return *engine_; }
    RegistryStore& GetStore() { return *store_; }

private:
    MedEqConfig config_;
    std::unique_ptr<RegistryStore> store_;
    std::unique_ptr<EquivalenceEngine> engine_;

    bool running_ = true;
    bool verbose_ = false;
    bool colors_enabled_ = true;
    std::string prompt_ = "medeq> ";
    std::string db_path_ = "medeq_registry.db";

    size_t commands_processed_ = 0;
    QueryOptions query_options_;
    std::vector<Candidate> last_results_;
    std::optional<HomologationSummary> last_batch_;

    // Initialization
    void OpenStore();
    void InitializeEngine();
    void PrintWelcome();

    // Command handling
    bool HandleCommand(const std::string& command, std::istringstream& args);

    // Commands
    void ShowHelp();
    bool ShowStatistics();
    bool Train();
    bool LoadModel(const std::string& snapshot);
    bool ListModels();
    bool Query(const std::string& cum, const std::string& top_k);
    bool ShowRecord(const std::string& cum);
    bool ShowCluster(const std::string& label);
    bool ShowTable(const std::string& attribute);
    bool Batch(const std::string& input_path, const std::string& output_path);
    bool Export(const std::string& path);
    bool SetFilters(const std::string& names);
    std::string DescribeFilters() const;
    bool SetTopK(const std::string& value);
    void ToggleVerbose();
    void Shutdown();

    void PrintError(const std::string& message) const;

    // Color helpers
    const char* C(const char* color) const { return colors_enabled_ ? color : ""; }
};

} // namespace medeq

#endif // MEDEQ_CLI_HPP

// File: src/cli/medeq_cli.cpp
//
// Command-line front end for the medication equivalence engine
//
// Features:
// - Training from the registry database
// - Substitute queries with filters
// - Batch homologation of CUM lists
// - Model persistence, reload and CSV export

#include "cli/medeq_cli.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>

namespace medeq {

namespace {

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

} // anonymous namespace

EquivalenceEngine::Config ToEngineConfig(const MedEqConfig& config, bool verbose) {
    EquivalenceEngine::Config engine_config;

    engine_config.clustering.k = config.clustering.k;
    engine_config.clustering.seed = config.clustering.seed;
    engine_config.clustering.max_iterations = config.clustering.max_iterations;
    engine_config.clustering.tolerance = config.clustering.tolerance;
    engine_config.clustering.n_restarts = config.clustering.n_restarts;
    engine_config.clustering.max_reseed_attempts = config.clustering.max_reseed_attempts;
    engine_config.auto_select_k = config.clustering.auto_k;

    engine_config.assembler.weights.critical_weight = config.weights.critical_weight;
    engine_config.assembler.weights.important_weight = config.weights.important_weight;
    engine_config.assembler.bin_breakpoints = config.binning.quantity_breakpoints;
    engine_config.assembler.debug_logging = verbose;

    engine_config.eligibility.accepted_registration_statuses.clear();
    for (const auto& status : config.eligibility.registration_statuses) {
        engine_config.eligibility.accepted_registration_statuses.insert(
            ParseRegistrationStatus(status));
    }
    engine_config.eligibility.require_active_cum = config.eligibility.require_active_cum;
    engine_config.eligibility.exclude_medical_samples = config.eligibility.exclude_medical_samples;

    engine_config.encoder.debug_logging = verbose;

    engine_config.resolver.default_top_k = config.query.top_k;
    for (const auto& filter : config.query.filters) {
        engine_config.resolver.default_filters.insert(ParseCandidateFilter(filter));
    }
    engine_config.resolver.debug_logging = verbose;

    engine_config.debug_logging = verbose;
    return engine_config;
}

// ============================================================================
// Construction
// ============================================================================

MedEqCli::MedEqCli()
    : MedEqCli(MedEqConfig::Default())
{
}

MedEqCli::MedEqCli(const MedEqConfig& config)
    : config_(config),
      verbose_(config.interface.verbose),
      colors_enabled_(config.interface.colors_enabled),
      prompt_(config.interface.prompt),
      db_path_(config.interface.db_path)
{
    if (config_.query.max_distance > 0.0) {
        query_options_.max_distance = config_.query.max_distance;
    }
}

MedEqCli::~MedEqCli() = default;

void MedEqCli::Run() {
    Initialize();
    PrintWelcome();

    std::string line;
    while (running_) {
        std::cout << C(Color::BOLD_CYAN) << prompt_ << C(Color::RESET);
        std::getline(std::cin, line);

        if (std::cin.eof() || line == "exit" || line == "quit") {
            break;
        }

        ProcessCommand(line);
    }

    Shutdown();
}

void MedEqCli::Initialize() {
    InitializeClean();

    auto stored = store_->LoadLatestModel();
    if (stored) {
        engine_->Publish(std::make_shared<TrainedModel>(std::move(*stored)));
        std::cout << "Loaded model " << engine_->GetModel()->GetID().ToString()
                  << " from " << db_path_ << "\n";
    }
}

void MedEqCli::InitializeClean() {
    OpenStore();
    InitializeEngine();
    last_results_.clear();
    last_batch_.reset();
}

void MedEqCli::OpenStore() {
    store_.reset();

    RegistryStore::Config store_config;
    store_config.db_path = db_path_;
    store_ = std::make_unique<RegistryStore>(store_config);
}

void MedEqCli::InitializeEngine() {
    auto current = engine_ ? engine_->GetModel() : nullptr;

    engine_ = std::make_unique<EquivalenceEngine>(ToEngineConfig(config_, verbose_));
    if (current) {
        engine_->Publish(current);
    }
}

void MedEqCli::PrintWelcome() {
    std::cout << R"(
╔══════════════════════════════════════════════════════════════╗
║                                                              ║
║   MedEq - Medication Equivalence Engine                      ║
║                                                              ║
║   Finds therapeutic substitutes within medication clusters   ║
║                                                              ║
╚══════════════════════════════════════════════════════════════╝

Type 'help' for available commands.

)";
    std::cout << "Registry: " << db_path_ << " (" << store_->CountRecords() << " records)\n";
    if (!HasModel()) {
        std::cout << "No trained model yet. Run 'train' to build one.\n";
    }
    std::cout << "\n";
}

// ============================================================================
// Command Handling
// ============================================================================

bool MedEqCli::ProcessCommand(const std::string& input) {
    std::string line = Trim(input);
    if (line.empty()) {
        return true;
    }
    if (line[0] == '/') {
        line = line.substr(1);
    }

    std::istringstream iss(line);
    std::string command;
    iss >> command;
    commands_processed_++;

    try {
        if (!engine_) {
            InitializeClean();
        }
        return HandleCommand(command, iss);
    } catch (const UnresolvableQuery& e) {
        PrintError(std::string("Cannot resolve query: ") + e.what());
    } catch (const InsufficientData& e) {
        PrintError(std::string("Not enough data: ") + e.what());
    } catch (const MedEqError& e) {
        PrintError(e.what());
    } catch (const std::exception& e) {
        PrintError(std::string("Command failed: ") + e.what());
    }
    return false;
}

bool MedEqCli::HandleCommand(const std::string& command, std::istringstream& args) {
    std::string first;
    std::string second;

    if (command == "help") {
        ShowHelp();
        return true;
    } else if (command == "stats") {
        return ShowStatistics();
    } else if (command == "train") {
        return Train();
    } else if (command == "load") {
        args >> first;
        return LoadModel(first);
    } else if (command == "models") {
        return ListModels();
    } else if (command == "query") {
        args >> first >> second;
        return Query(first, second);
    } else if (command == "record") {
        args >> first;
        return ShowRecord(first);
    } else if (command == "cluster") {
        args >> first;
        return ShowCluster(first);
    } else if (command == "table") {
        args >> first;
        return ShowTable(first);
    } else if (command == "batch") {
        args >> first >> second;
        return Batch(first, second);
    } else if (command == "export") {
        args >> first;
        return Export(first);
    } else if (command == "filters") {
        std::getline(args, first);
        return SetFilters(Trim(first));
    } else if (command == "topk") {
        args >> first;
        return SetTopK(first);
    } else if (command == "verbose") {
        ToggleVerbose();
        return true;
    } else if (command == "config") {
        args >> first;
        if (first.empty()) {
            std::cout << config_.ToYamlString();
            return true;
        }
        if (!config_.SaveToFile(first)) {
            return false;
        }
        std::cout << "Configuration written to " << first << "\n";
        return true;
    } else if (command == "clear") {
        std::cout << "\033[2J\033[1;1H";
        return true;
    } else if (command == "exit" || command == "quit") {
        running_ = false;
        return true;
    }

    std::cout << "Unknown command: " << command << "\n";
    std::cout << "Type 'help' for available commands.\n";
    return false;
}

// ============================================================================
// Commands
// ============================================================================

void MedEqCli::ShowHelp() {
    std::cout << R"(
Available Commands:
===================

Model:
  train                   Train a model on the registry and store it
  load [snapshot]         Load a stored model (latest when omitted)
  models                  List stored models

Queries:
  query <CUM> [top_k]     Substitutes of a registered medication
  batch <file> [out.csv]  Homologate a list of CUMs (one per line)
  record <CUM>            Show a record and its metadata
  cluster <label>         List the members of a cluster
  table <attribute>       Show a frequency table (atc, route, ...)

Settings:
  filters <f1,f2,...>     Set query filters (registration_active,
                          not_medical_sample, atc_exact_match,
                          coverage_in_pbs); 'filters default' resets,
                          'filters none' disables them
  topk <n>                Set the number of substitutes per query
  verbose                 Toggle component debug logging
  config [file]           Print or save the configuration

Information:
  stats                   Show model and registry statistics
  export <file.csv>       Write cluster assignments with metadata

Utility:
  clear                   Clear screen
  help                    Show this help
  exit, quit              Exit the program

Examples:
  train
  query 19943544-1 5
  filters atc_exact_match,registration_active
  batch cums.txt results.csv

)";
}

bool MedEqCli::ShowStatistics() {
    auto stats = engine_->GetStatistics();

    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════╗\n";
    std::cout << "║           MedEq Model Statistics         ║\n";
    std::cout << "╚══════════════════════════════════════════╝\n\n";

    std::cout << "Registry:\n";
    std::cout << "  Database: " << db_path_ << "\n";
    std::cout << "  Records: " << store_->CountRecords() << "\n";
    std::cout << "  Stored models: " << store_->ListModels().size() << "\n\n";

    if (!stats.has_model) {
        std::cout << "No model published. Run 'train' or 'load'.\n\n";
        return true;
    }

    std::cout << "Model " << stats.snapshot_id.ToString() << ":\n";
    std::cout << "  Records: " << stats.records << "\n";
    std::cout << "  Eligible: " << stats.eligible << "\n";
    std::cout << "  Training members: " << stats.training_members << "\n";
    std::cout << "  Excluded: " << stats.excluded << "\n";
    std::cout << "  Clusters: " << stats.cluster_count << "\n";
    std::cout << "  Inertia: " << std::fixed << std::setprecision(4) << stats.inertia << "\n";
    std::cout << "  Cluster sizes:";
    for (size_t size : stats.cluster_sizes) {
        std::cout << " " << size;
    }
    std::cout << "\n\n";

    std::cout << "Query settings:\n";
    std::cout << "  top_k: " << query_options_.top_k.value_or(config_.query.top_k) << "\n";
    std::cout << "  filters: " << DescribeFilters() << "\n\n";
    return true;
}

bool MedEqCli::Train() {
    auto records = store_->LoadRecords();
    if (records.empty()) {
        PrintError("No records in " + db_path_);
        return false;
    }

    std::cout << "Training on " << records.size() << " records...\n";
    auto model = engine_->TrainAndPublish(records);

    std::cout << C(Color::GREEN) << "✓ " << C(Color::RESET)
              << "Published " << model->GetID().ToString() << "\n";
    std::cout << model->GetReport().ToString();

    if (!store_->SaveModel(*model)) {
        PrintError("Model trained but could not be stored in " + db_path_);
        return false;
    }
    return true;
}

bool MedEqCli::LoadModel(const std::string& snapshot) {
    std::optional<TrainedModel> stored;
    if (snapshot.empty()) {
        stored = store_->LoadLatestModel();
    } else {
        stored = store_->LoadModel(SnapshotID(ParseUnsigned(snapshot)));
    }

    if (!stored) {
        PrintError("No stored model" + (snapshot.empty() ? std::string() : " " + snapshot));
        return false;
    }

    engine_->Publish(std::make_shared<TrainedModel>(std::move(*stored)));
    std::cout << "Loaded " << engine_->GetModel()->GetID().ToString() << "\n";
    return true;
}

bool MedEqCli::ListModels() {
    auto models = store_->ListModels();
    if (models.empty()) {
        std::cout << "No stored models.\n";
        return true;
    }

    std::cout << std::left << std::setw(12) << "Snapshot" << std::setw(10) << "Clusters"
              << std::setw(10) << "Members" << std::setw(14) << "Inertia" << "Algorithm\n";
    for (const auto& info : models) {
        std::cout << std::left << std::setw(12) << info.snapshot_id.value()
                  << std::setw(10) << info.cluster_count
                  << std::setw(10) << info.training_members
                  << std::setw(14) << std::fixed << std::setprecision(4) << info.inertia
                  << info.algorithm << "\n";
    }
    return true;
}

bool MedEqCli::Query(const std::string& cum, const std::string& top_k) {
    if (cum.empty()) {
        PrintError("Usage: query <CUM> [top_k]");
        return false;
    }

    QueryOptions options = query_options_;
    if (!top_k.empty()) {
        options.top_k = static_cast<size_t>(ParseUnsigned(top_k));
    }

    CandidateSequence sequence = engine_->Query(cum, options);
    last_results_ = sequence.Results();

    const auto& model = sequence.GetModel();
    const MedicationRecord* query = model.FindRecord(cum);

    std::cout << "\n" << C(Color::BOLD) << cum << C(Color::RESET);
    if (query != nullptr) {
        std::cout << "  " << query->product_name << " [" << query->atc_code << ", "
                  << query->route << "]";
    }
    std::cout << "\nCluster " << sequence.GetClusterLabel() << ", "
              << sequence.Available() << " candidate(s)\n\n";

    if (last_results_.empty()) {
        std::cout << C(Color::YELLOW) << "No substitutes found." << C(Color::RESET) << "\n\n";
        return true;
    }

    for (size_t i = 0; i < last_results_.size(); ++i) {
        const auto& candidate = last_results_[i];
        const MedicationRecord* record = model.FindRecord(candidate.cum);
        std::cout << "  " << std::setw(3) << (i + 1) << ". " << std::left << std::setw(14)
                  << candidate.cum << std::right
                  << " d=" << std::fixed << std::setprecision(4) << candidate.distance
                  << " sim=" << std::setprecision(3) << candidate.similarity;
        if (record != nullptr) {
            std::cout << "  " << record->product_name;
        }
        std::cout << "\n";
    }
    std::cout << "\n";
    return true;
}

bool MedEqCli::ShowRecord(const std::string& cum) {
    if (cum.empty()) {
        PrintError("Usage: record <CUM>");
        return false;
    }

    auto model = engine_->GetModel();
    if (model && model->FindRecord(cum) != nullptr) {
        std::cout << model->FindRecord(cum)->ToString() << "\n";
        for (const auto& [key, value] : model->GetMetadata(cum)) {
            std::cout << "  " << std::left << std::setw(20) << key << value << "\n";
        }
        auto label = model->GetSnapshot().GetLabel(cum);
        std::cout << "  " << std::left << std::setw(20) << "cluster"
                  << (label ? std::to_string(*label) : std::string("-")) << "\n";
        return true;
    }

    auto record = store_->GetRecord(cum);
    if (!record) {
        PrintError("Unknown CUM: " + cum);
        return false;
    }
    std::cout << record->ToString() << "\n(not part of the published model)\n";
    return true;
}

bool MedEqCli::ShowCluster(const std::string& label) {
    if (label.empty()) {
        PrintError("Usage: cluster <label>");
        return false;
    }

    auto model = engine_->GetModel();
    if (!model) {
        PrintError("No model published");
        return false;
    }

    size_t index = static_cast<size_t>(ParseUnsigned(label));
    const auto& snapshot = model->GetSnapshot();
    if (index >= snapshot.GetClusterCount()) {
        PrintError("Cluster " + label + " does not exist (" +
                   std::to_string(snapshot.GetClusterCount()) + " clusters)");
        return false;
    }

    auto members = snapshot.GetMembers(index);
    std::cout << "Cluster " << index << ": " << members.size() << " member(s)\n";
    for (const auto& cum : members) {
        const MedicationRecord* record = model->FindRecord(cum);
        std::cout << "  " << std::left << std::setw(14) << cum;
        if (record != nullptr) {
            std::cout << record->product_name << " [" << record->atc_code << "]";
        }
        std::cout << "\n";
    }
    return true;
}

bool MedEqCli::ShowTable(const std::string& attribute) {
    auto model = engine_->GetModel();
    if (!model) {
        PrintError("No model published");
        return false;
    }

    if (attribute.empty()) {
        std::cout << "Attributes:";
        for (const auto& name : EncoderTables::AttributeNames()) {
            std::cout << " " << name;
        }
        std::cout << "\n";
        return true;
    }

    const auto& table = model->GetTables().Get(attribute);
    std::cout << attribute << ": " << table.GetDistinctCount() << " value(s), "
              << table.GetTotalEligible() << " eligible record(s)\n";
    std::cout << std::left << std::setw(6) << "Rank" << std::setw(8) << "Count"
              << std::setw(10) << "Eligible" << std::setw(12) << "Score" << "Value\n";
    for (const auto& entry : table.GetEntries()) {
        std::cout << std::left << std::setw(6) << entry.rank
                  << std::setw(8) << entry.count
                  << std::setw(10) << entry.eligible_count
                  << std::setw(12) << std::fixed << std::setprecision(4) << table.Score(entry)
                  << entry.value << "\n";
    }
    return true;
}

bool MedEqCli::Batch(const std::string& input_path, const std::string& output_path) {
    if (input_path.empty()) {
        PrintError("Usage: batch <file> [out.csv]");
        return false;
    }

    std::ifstream input(input_path);
    if (!input.is_open()) {
        PrintError("Failed to open " + input_path);
        return false;
    }

    // One CUM per line; the first comma-separated field is used
    std::vector<std::string> cums;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line[0] == '#') {
            continue;
        }
        cums.push_back(line.substr(0, line.find(',')));
    }

    last_batch_ = engine_->Homologate(cums, query_options_);
    const auto& summary = *last_batch_;

    for (const auto& row : summary.rows) {
        std::cout << "  " << std::left << std::setw(14) << row.query;
        switch (row.status) {
            case HomologationStatus::FOUND:
                std::cout << C(Color::GREEN) << "-> " << row.substitutes.front().cum
                          << C(Color::RESET) << " (d=" << std::fixed << std::setprecision(4)
                          << row.substitutes.front().distance << ")";
                break;
            case HomologationStatus::NO_SUBSTITUTE:
                std::cout << C(Color::YELLOW) << "no substitute" << C(Color::RESET);
                break;
            case HomologationStatus::UNRESOLVABLE:
                std::cout << C(Color::RED) << "unresolvable" << C(Color::RESET)
                          << " (" << row.message << ")";
                break;
        }
        std::cout << "\n";
    }

    std::cout << "\nFound: " << summary.found
              << "  No substitute: " << summary.no_substitute
              << "  Unresolvable: " << summary.unresolvable
              << "  Skipped: " << summary.skipped << "\n";

    if (!output_path.empty()) {
        std::ofstream output(output_path);
        if (!output.is_open()) {
            PrintError("Failed to open file for writing: " + output_path);
            return false;
        }
        output << summary.ToCsv();
        std::cout << "Results written to " << output_path << "\n";
    }
    return true;
}

bool MedEqCli::Export(const std::string& path) {
    if (path.empty()) {
        PrintError("Usage: export <file.csv>");
        return false;
    }

    auto model = engine_->GetModel();
    if (!model) {
        PrintError("No model published");
        return false;
    }

    std::ofstream output(path);
    if (!output.is_open()) {
        PrintError("Failed to open file for writing: " + path);
        return false;
    }

    const auto& snapshot = model->GetSnapshot();
    const auto& records = model->GetRecords();

    // Metadata columns, in the fixed key order of the metadata map
    std::vector<std::string> columns;
    if (!records.empty()) {
        for (const auto& [key, value] : model->GetMetadata(records.front().cum)) {
            if (key != "cum") {
                columns.push_back(key);
            }
        }
    }

    output << "cum,cluster,placement";
    for (const auto& column : columns) {
        output << "," << column;
    }
    output << "\n";

    for (const auto& record : records) {
        std::string cluster;
        std::string placement;
        if (auto label = snapshot.GetLabel(record.cum)) {
            cluster = std::to_string(*label);
            placement = "trained";
        } else if (const FeatureVector* vector = model->FindVector(record.cum)) {
            cluster = std::to_string(snapshot.Predict(*vector));
            placement = "predicted";
        } else {
            placement = "excluded";
        }

        auto metadata = model->GetMetadata(record.cum);
        output << EscapeCsvField(record.cum) << "," << cluster << "," << placement;
        for (const auto& column : columns) {
            output << "," << EscapeCsvField(metadata[column]);
        }
        output << "\n";
    }

    std::cout << "Exported " << records.size() << " record(s) to " << path << "\n";
    return true;
}

bool MedEqCli::SetFilters(const std::string& names) {
    if (names.empty()) {
        std::cout << "Filters: " << DescribeFilters() << "\n";
        return true;
    }

    if (names == "default") {
        query_options_.filters.reset();
        std::cout << "Filters reset to configuration defaults\n";
        return true;
    }
    if (names == "none") {
        query_options_.filters.emplace();
        std::cout << "Filters disabled\n";
        return true;
    }

    std::set<CandidateFilter> filters;
    std::string normalized = names;
    for (char& c : normalized) {
        if (c == ',') {
            c = ' ';
        }
    }
    std::istringstream iss(normalized);
    std::string name;
    while (iss >> name) {
        filters.insert(ParseCandidateFilter(name));
    }

    query_options_.filters = std::move(filters);
    std::cout << "Filters set (" << query_options_.filters->size() << ")\n";
    return true;
}

std::string MedEqCli::DescribeFilters() const {
    if (!query_options_.filters) {
        std::string text = "(default)";
        for (const auto& name : config_.query.filters) {
            text += " " + name;
        }
        return text;
    }
    if (query_options_.filters->empty()) {
        return "(none)";
    }
    std::string text;
    for (CandidateFilter filter : *query_options_.filters) {
        text += (text.empty() ? "" : " ") + std::string(ToString(filter));
    }
    return text;
}

bool MedEqCli::SetTopK(const std::string& value) {
    if (value.empty()) {
        PrintError("Usage: topk <n>");
        return false;
    }

    size_t top_k = static_cast<size_t>(ParseUnsigned(value));
    if (top_k == 0) {
        PrintError("top_k must be greater than 0");
        return false;
    }
    query_options_.top_k = top_k;
    std::cout << "top_k: " << top_k << "\n";
    return true;
}

void MedEqCli::ToggleVerbose() {
    verbose_ = !verbose_;
    InitializeEngine();
    std::cout << "Verbose mode: " << (verbose_ ? "ON" : "OFF") << "\n";
}

void MedEqCli::Shutdown() {
    std::cout << "\nShutting down...\n";
    if (store_) {
        store_->Flush();
    }
    std::cout << "Commands processed: " << commands_processed_ << "\n";
}

void MedEqCli::PrintError(const std::string& message) const {
    std::cerr << C(Color::RED) << "Error: " << C(Color::RESET) << message << "\n";
}

} // namespace medeq

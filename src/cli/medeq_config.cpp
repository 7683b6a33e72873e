// File: src/cli/medeq_config.cpp
//
// YAML Configuration Implementation for the MedEq CLI

#include "cli/medeq_config.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "encoding/numeric_transforms.hpp"
#include <yaml.h>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace medeq {

namespace {

/// Truthy spellings accepted for boolean settings
bool ParseBool(const std::string& value) {
    static const char* const kTrue[] = {"true", "True", "TRUE", "yes", "Yes", "YES",
                                        "on", "On", "ON", "1"};
    for (const char* candidate : kTrue) {
        if (value == candidate) {
            return true;
        }
    }
    return false;
}

/// Owns a libyaml parser reading from an in-memory document
class YamlEventSource {
public:
    explicit YamlEventSource(const std::string& document) : document_(document) {
        ready_ = yaml_parser_initialize(&parser_) != 0;
        if (ready_) {
            yaml_parser_set_input_string(
                &parser_, reinterpret_cast<const unsigned char*>(document_.data()),
                document_.size());
        }
    }

    ~YamlEventSource() {
        if (ready_) {
            yaml_parser_delete(&parser_);
        }
    }

    YamlEventSource(const YamlEventSource&) = delete;
    YamlEventSource& operator=(const YamlEventSource&) = delete;

    bool Ready() const { return ready_; }

    /// Parses the next event into `event`; false on a syntax error
    bool Next(yaml_event_t& event) {
        return yaml_parser_parse(&parser_, &event) != 0;
    }

    std::string Problem() const {
        std::ostringstream msg;
        msg << (parser_.problem ? parser_.problem : "unknown error")
            << " at line " << parser_.problem_mark.line + 1;
        return msg.str();
    }

private:
    const std::string& document_;
    yaml_parser_t parser_;
    bool ready_ = false;
};

/// Releases an event when it goes out of scope
struct EventGuard {
    yaml_event_t& event;
    ~EventGuard() { yaml_event_delete(&event); }
};

} // namespace

unsigned long long ParseUnsigned(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    size_t end = text.find_last_not_of(" \t");
    if (begin == std::string::npos) {
        throw std::invalid_argument("expected a non-negative integer, got an empty value");
    }
    std::string digits = text.substr(begin, end - begin + 1);
    if (digits.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("expected a non-negative integer, got '" + digits + "'");
    }
    return std::stoull(digits);
}

// Apply one scalar setting
static void ApplyScalar(MedEqConfig& config,
                        const std::string& section,
                        const std::string& key,
                        const std::string& value) {
    if (section == "interface") {
        if (key == "prompt") config.interface.prompt = value;
        else if (key == "colors_enabled") config.interface.colors_enabled = ParseBool(value);
        else if (key == "verbose") config.interface.verbose = ParseBool(value);
        else if (key == "db_path") config.interface.db_path = value;
    }
    else if (section == "clustering") {
        if (key == "k") config.clustering.k = static_cast<size_t>(ParseUnsigned(value));
        else if (key == "auto_k") config.clustering.auto_k = ParseBool(value);
        else if (key == "seed") config.clustering.seed = ParseUnsigned(value);
        else if (key == "max_iterations") config.clustering.max_iterations = static_cast<size_t>(ParseUnsigned(value));
        else if (key == "tolerance") config.clustering.tolerance = std::stod(value);
        else if (key == "n_restarts") config.clustering.n_restarts = static_cast<size_t>(ParseUnsigned(value));
        else if (key == "max_reseed_attempts") config.clustering.max_reseed_attempts = static_cast<size_t>(ParseUnsigned(value));
    }
    else if (section == "weights") {
        if (key == "critical_weight") config.weights.critical_weight = std::stod(value);
        else if (key == "important_weight") config.weights.important_weight = std::stod(value);
    }
    else if (section == "eligibility") {
        if (key == "require_active_cum") config.eligibility.require_active_cum = ParseBool(value);
        else if (key == "exclude_medical_samples") config.eligibility.exclude_medical_samples = ParseBool(value);
    }
    else if (section == "query") {
        if (key == "top_k") config.query.top_k = static_cast<size_t>(ParseUnsigned(value));
        else if (key == "max_distance") config.query.max_distance = std::stod(value);
    }
}

// Apply one sequence setting
static void ApplySequence(MedEqConfig& config,
                          const std::string& section,
                          const std::string& key,
                          const std::vector<std::string>& values) {
    if (section == "binning" && key == "quantity_breakpoints") {
        config.binning.quantity_breakpoints.clear();
        for (const auto& value : values) {
            config.binning.quantity_breakpoints.push_back(std::stod(value));
        }
    }
    else if (section == "eligibility" && key == "registration_statuses") {
        config.eligibility.registration_statuses = values;
    }
    else if (section == "query" && key == "filters") {
        config.query.filters = values;
    }
}

std::optional<MedEqConfig> MedEqConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream in(filepath);
    if (!in) {
        std::cerr << "[MedEqConfig] Cannot read " << filepath << std::endl;
        return std::nullopt;
    }
    std::string document((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return LoadFromString(document);
}

std::optional<MedEqConfig> MedEqConfig::LoadFromString(const std::string& yaml_content) {
    YamlEventSource source(yaml_content);
    if (!source.Ready()) {
        std::cerr << "[MedEqConfig] Could not create YAML parser" << std::endl;
        return std::nullopt;
    }

    // Documents are two levels deep: section -> key -> scalar or flow list
    MedEqConfig config = Default();
    std::string section;
    std::string key;
    std::vector<std::string> list;
    bool collecting_list = false;
    int mapping_level = 0;

    for (bool finished = false; !finished;) {
        yaml_event_t event;
        if (!source.Next(event)) {
            std::cerr << "[MedEqConfig] YAML parse error: " << source.Problem() << std::endl;
            return std::nullopt;
        }
        EventGuard guard{event};

        try {
            if (event.type == YAML_MAPPING_START_EVENT) {
                ++mapping_level;
            } else if (event.type == YAML_MAPPING_END_EVENT) {
                if (--mapping_level == 1) {
                    section.clear();
                }
            } else if (event.type == YAML_SEQUENCE_START_EVENT) {
                collecting_list = mapping_level == 2 && !key.empty();
                list.clear();
            } else if (event.type == YAML_SEQUENCE_END_EVENT) {
                if (collecting_list) {
                    ApplySequence(config, section, key, list);
                    collecting_list = false;
                    key.clear();
                }
            } else if (event.type == YAML_SCALAR_EVENT) {
                std::string text(reinterpret_cast<const char*>(event.data.scalar.value),
                                 event.data.scalar.length);
                if (collecting_list) {
                    list.push_back(std::move(text));
                } else if (mapping_level == 1) {
                    section = std::move(text);
                } else if (mapping_level == 2 && key.empty()) {
                    key = std::move(text);
                } else if (mapping_level == 2) {
                    ApplyScalar(config, section, key, text);
                    key.clear();
                }
            } else if (event.type == YAML_DOCUMENT_END_EVENT ||
                       event.type == YAML_STREAM_END_EVENT) {
                finished = true;
            }
        } catch (const std::exception& e) {
            std::cerr << "[MedEqConfig] Bad value for " << section << "." << key
                      << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    auto problems = config.GetValidationErrors();
    if (!problems.empty()) {
        std::cerr << "[MedEqConfig] Rejected configuration:" << std::endl;
        for (const auto& problem : problems) {
            std::cerr << "  - " << problem << std::endl;
        }
        return std::nullopt;
    }
    return config;
}

bool MedEqConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream out(filepath);
    if (!out) {
        std::cerr << "[MedEqConfig] Cannot write " << filepath << std::endl;
        return false;
    }
    out << ToYamlString();
    return static_cast<bool>(out);
}

namespace {

const char* YesNo(bool flag) {
    return flag ? "true" : "false";
}

template <typename T>
std::string FlowList(const std::vector<T>& items) {
    std::ostringstream out;
    out << std::setprecision(15) << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        out << (i == 0 ? "" : ", ") << items[i];
    }
    out << "]";
    return out.str();
}

} // namespace

std::string MedEqConfig::ToYamlString() const {
    std::ostringstream ss;
    ss << std::setprecision(15)
       << "# MedEq engine and shell settings\n\n"
       << "interface:\n"
       << "  prompt: \"" << interface.prompt << "\"\n"
       << "  colors_enabled: " << YesNo(interface.colors_enabled) << "\n"
       << "  verbose: " << YesNo(interface.verbose) << "\n"
       << "  db_path: \"" << interface.db_path << "\"\n\n"
       << "clustering:\n"
       << "  k: " << clustering.k << "\n"
       << "  auto_k: " << YesNo(clustering.auto_k) << "\n"
       << "  seed: " << clustering.seed << "\n"
       << "  max_iterations: " << clustering.max_iterations << "\n"
       << "  tolerance: " << clustering.tolerance << "\n"
       << "  n_restarts: " << clustering.n_restarts << "\n"
       << "  max_reseed_attempts: " << clustering.max_reseed_attempts << "\n\n"
       << "weights:\n"
       << "  critical_weight: " << weights.critical_weight << "\n"
       << "  important_weight: " << weights.important_weight << "\n\n"
       << "binning:\n"
       << "  quantity_breakpoints: " << FlowList(binning.quantity_breakpoints) << "\n\n"
       << "eligibility:\n"
       << "  registration_statuses: " << FlowList(eligibility.registration_statuses) << "\n"
       << "  require_active_cum: " << YesNo(eligibility.require_active_cum) << "\n"
       << "  exclude_medical_samples: " << YesNo(eligibility.exclude_medical_samples) << "\n\n"
       << "query:\n"
       << "  top_k: " << query.top_k << "\n"
       << "  filters: " << FlowList(query.filters) << "\n"
       << "  max_distance: " << query.max_distance << "\n";
    return ss.str();
}

bool MedEqConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> MedEqConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Validate clustering
    if (clustering.k == 0 && !clustering.auto_k) {
        errors.push_back("k must be greater than 0 unless auto_k is enabled");
    }
    if (clustering.n_restarts == 0) {
        errors.push_back("n_restarts must be greater than 0");
    }
    if (!(clustering.tolerance >= 0.0)) {
        errors.push_back("tolerance must be non-negative");
    }

    // Validate weights
    if (weights.critical_weight < 0.0 || weights.critical_weight > 1.0 ||
        weights.important_weight < 0.0 || weights.important_weight > 1.0) {
        errors.push_back("weights must be between 0.0 and 1.0");
    }
    if (std::fabs(weights.critical_weight + weights.important_weight - 1.0) > 1e-6) {
        errors.push_back("critical_weight + important_weight must equal 1.0");
    }

    // Validate binning
    try {
        ValidateBreakpoints(binning.quantity_breakpoints);
    } catch (const ConfigurationError& e) {
        errors.push_back(e.what());
    }

    // Validate eligibility
    if (eligibility.registration_statuses.empty()) {
        errors.push_back("registration_statuses must name at least one status");
    }
    for (const auto& status : eligibility.registration_statuses) {
        try {
            ParseRegistrationStatus(status);
        } catch (const std::invalid_argument&) {
            errors.push_back("unknown registration status: " + status);
        }
    }

    // Validate query defaults
    if (query.top_k == 0) {
        errors.push_back("top_k must be greater than 0");
    }
    if (!(query.max_distance >= 0.0)) {
        errors.push_back("max_distance must be non-negative");
    }
    for (const auto& filter : query.filters) {
        try {
            ParseCandidateFilter(filter);
        } catch (const std::invalid_argument&) {
            errors.push_back("unknown filter: " + filter);
        }
    }

    return errors;
}

MedEqConfig MedEqConfig::Default() {
    return MedEqConfig{};  // Uses default member initializers
}

} // namespace medeq

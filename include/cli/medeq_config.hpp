// File: include/cli/medeq_config.hpp
//
// Shell and engine settings for the MedEq CLI, stored as YAML

#ifndef MEDEQ_CLI_CONFIG_HPP
#define MEDEQ_CLI_CONFIG_HPP

#include <cstddef>
#include <string>
#include <optional>
#include <vector>

namespace medeq {

/// Settings the MedEq shell reads at startup
struct MedEqConfig {
    // === Interface Settings ===
    struct Interface {
        std::string prompt = "medeq> ";
        bool colors_enabled = true;
        bool verbose = false;
        std::string db_path = "medeq_registry.db";
    } interface;

    // === Clustering Settings ===
    struct Clustering {
        size_t k = 8;
        bool auto_k = false;             // Elbow heuristic instead of k
        unsigned long long seed = 42;
        size_t max_iterations = 300;
        double tolerance = 1e-4;
        size_t n_restarts = 10;
        size_t max_reseed_attempts = 3;
    } clustering;

    // === Block Weights ===
    struct Weights {
        double critical_weight = 0.85;
        double important_weight = 0.15;
    } weights;

    // === Quantity Binning ===
    struct Binning {
        std::vector<double> quantity_breakpoints = {10.0, 100.0, 500.0};
    } binning;

    // === Eligibility Rules ===
    struct Eligibility {
        std::vector<std::string> registration_statuses = {"ACTIVE", "IN_RENEWAL"};
        bool require_active_cum = true;
        bool exclude_medical_samples = true;
    } eligibility;

    // === Query Defaults ===
    struct Query {
        size_t top_k = 10;
        std::vector<std::string> filters;
        double max_distance = 0.0;       // 0 disables the cut-off
    } query;

    /// Reads a YAML document from disk. Missing sections keep their
    /// defaults; unreadable files, syntax errors, malformed values and
    /// failed validation are reported on stderr and yield std::nullopt.
    static std::optional<MedEqConfig> LoadFromFile(const std::string& filepath);
    static std::optional<MedEqConfig> LoadFromString(const std::string& yaml_content);

    /// Writes ToYamlString() to `filepath`
    bool SaveToFile(const std::string& filepath) const;

    /// Every setting, in a form LoadFromString accepts back
    std::string ToYamlString() const;

    bool Validate() const;

    /// One message per rejected setting; empty when the configuration is usable
    std::vector<std::string> GetValidationErrors() const;

    static MedEqConfig Default();
};

/// Whole-string unsigned decimal, as used for counts and ids in YAML and
/// shell arguments. Unlike std::stoull, a sign or trailing text is rejected.
/// @throws std::invalid_argument on malformed text
/// @throws std::out_of_range if the value does not fit
unsigned long long ParseUnsigned(const std::string& text);

} // namespace medeq

#endif // MEDEQ_CLI_CONFIG_HPP

// File: src/encoding/vector_assembler.hpp
#pragma once

#include "core/feature_vector.hpp"
#include "core/medication_record.hpp"
#include "core/types.hpp"
#include "encoding/categorical_encoder.hpp"
#include <map>
#include <string>
#include <vector>

namespace medeq {

// Attribute names used for the frequency tables
namespace attributes {
    inline const char* ATC = "atc";
    inline const char* ROUTE = "route";
    inline const char* ACTIVE_INGREDIENT = "active_ingredient";
    inline const char* PHARMACEUTICAL_FORM = "pharmaceutical_form";
    inline const char* MEASUREMENT_UNIT = "measurement_unit";
}

/// Relative influence of the critical and important blocks
struct WeightConfig {
    double critical_weight{0.85};
    double important_weight{0.15};

    /// @throws ConfigurationError unless both lie in [0,1] and sum to 1
    void Validate() const;
};

/// One component of the assembled vector
struct FeatureComponent {
    std::string name;
    FeatureTier tier;
};

/// Frequency tables of every encoded attribute, fitted on one batch
struct EncoderTables {
    CategoricalFrequencyTable atc;
    CategoricalFrequencyTable route;
    CategoricalFrequencyTable active_ingredient;
    CategoricalFrequencyTable pharmaceutical_form;
    CategoricalFrequencyTable measurement_unit;

    /// Fit all tables over a batch
    /// @param eligible One eligibility flag per record
    static EncoderTables Fit(const CategoricalEncoder& encoder,
                             const std::vector<MedicationRecord>& records,
                             const std::vector<bool>& eligible);

    /// Table by attribute name
    /// @throws std::invalid_argument for an unknown attribute
    const CategoricalFrequencyTable& Get(const std::string& attribute) const;
    CategoricalFrequencyTable& Get(const std::string& attribute);

    /// Attribute names in a fixed order
    static const std::vector<std::string>& AttributeNames();

private:
    static CategoricalFrequencyTable EncoderTables::* Member(const std::string& attribute);
};

/// FeatureScaler: Standardizes raw components and applies block weights.
///
/// Each component is z-scored with statistics of the training members and
/// multiplied by sqrt(block_weight / block_size). The squared scale factors
/// of a block sum to its weight, so blocks contribute to squared distance in
/// proportion to the configured weights.
class FeatureScaler {
public:
    FeatureScaler() = default;

    /// Fit means and deviations over raw vectors
    /// @throws std::invalid_argument if tiers is empty, contains
    ///         INFORMATIVE, or a vector has the wrong dimension
    static FeatureScaler Fit(const std::vector<FeatureVector>& raw_vectors,
                             const std::vector<FeatureTier>& tiers,
                             const WeightConfig& weights);

    /// Restore a fitted scaler
    static FeatureScaler FromParameters(std::vector<double> means,
                                        std::vector<double> deviations,
                                        std::vector<FeatureTier> tiers,
                                        const WeightConfig& weights);

    /// Weighted vector of a raw vector
    FeatureVector Transform(const FeatureVector& raw) const;

    /// Sum of squared weight factors (before standardization) over a block
    double BlockWeight(FeatureTier tier) const;

    size_t Dimension() const { return means_.size(); }
    const std::vector<double>& GetMeans() const { return means_; }
    const std::vector<double>& GetDeviations() const { return deviations_; }
    const std::vector<FeatureTier>& GetTiers() const { return tiers_; }
    const WeightConfig& GetWeights() const { return weights_; }

private:
    std::vector<double> means_;
    std::vector<double> deviations_;
    std::vector<double> block_factors_;  // sqrt(weight / block size)
    std::vector<FeatureTier> tiers_;
    WeightConfig weights_;

    void ComputeBlockFactors();
};

/// VectorAssembler: Builds one feature vector per medication record.
///
/// Critical block, per attribute (ATC, route, active ingredient): score,
/// validity indicator, probability among valid records.
/// Important block: form and unit score + probability among valid records,
/// log quantity, log reference quantity, quantity ratio, quantity bin.
/// Informative fields never enter the vector; they travel as metadata.
///
/// Thread-safety: const methods are safe for concurrent use.
class VectorAssembler {
public:
    struct Config {
        Config();
        WeightConfig weights;
        /// Quantity bin breakpoints, strictly increasing
        std::vector<double> bin_breakpoints;
        bool debug_logging{false};
    };

    VectorAssembler();

    /// @throws ConfigurationError for invalid weights or breakpoints
    explicit VectorAssembler(const Config& config);

    /// Unweighted critical + important components of a record
    /// @param unknown_categories Incremented once per unknown category
    /// @throws InvalidQuantity if a numeric transform fails
    FeatureVector AssembleRaw(const MedicationRecord& record,
                              const EncoderTables& tables,
                              size_t* unknown_categories = nullptr) const;

    /// Weighted vector of a record
    /// @throws InvalidQuantity if a numeric transform fails
    FeatureVector Assemble(const MedicationRecord& record,
                           const EncoderTables& tables,
                           const FeatureScaler& scaler) const;

    /// Informative block of a record
    static std::map<std::string, std::string> InformativeMetadata(
        const MedicationRecord& record, bool eligible);

    /// Component layout of the assembled vector
    static const std::vector<FeatureComponent>& Layout();

    /// Tiers of the layout, in order
    static std::vector<FeatureTier> LayoutTiers();

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    CategoricalEncoder encoder_;

    void LogDebug(const std::string& message) const;
};

} // namespace medeq

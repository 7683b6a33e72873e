// File: src/encoding/vector_assembler.cpp
#include "encoding/vector_assembler.hpp"
#include "encoding/numeric_transforms.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace medeq {

namespace {

CategoricalEncoder::Config EncoderConfigFor(bool debug_logging) {
    CategoricalEncoder::Config config;
    config.debug_logging = debug_logging;
    return config;
}

std::string FormatNumber(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace

// ============================================================================
// WeightConfig
// ============================================================================

void WeightConfig::Validate() const {
    if (critical_weight < 0.0 || critical_weight > 1.0) {
        throw ConfigurationError("critical_weight must be between 0.0 and 1.0");
    }
    if (important_weight < 0.0 || important_weight > 1.0) {
        throw ConfigurationError("important_weight must be between 0.0 and 1.0");
    }
    if (std::abs(critical_weight + important_weight - 1.0) > 1e-6) {
        throw ConfigurationError("critical_weight + important_weight must equal 1.0");
    }
}

// ============================================================================
// EncoderTables
// ============================================================================

EncoderTables EncoderTables::Fit(
    const CategoricalEncoder& encoder,
    const std::vector<MedicationRecord>& records,
    const std::vector<bool>& eligible
) {
    if (records.size() != eligible.size()) {
        throw std::invalid_argument("records and eligibility flags must have the same length");
    }

    std::vector<std::string> atc, route, ingredient, form, unit;
    atc.reserve(records.size());
    route.reserve(records.size());
    ingredient.reserve(records.size());
    form.reserve(records.size());
    unit.reserve(records.size());

    for (const auto& record : records) {
        atc.push_back(record.atc_code);
        route.push_back(record.route);
        ingredient.push_back(record.active_ingredient);
        form.push_back(record.pharmaceutical_form);
        unit.push_back(record.measurement_unit);
    }

    EncoderTables tables;
    tables.atc = encoder.Fit(attributes::ATC, atc, eligible);
    tables.route = encoder.Fit(attributes::ROUTE, route, eligible);
    tables.active_ingredient = encoder.Fit(attributes::ACTIVE_INGREDIENT, ingredient, eligible);
    tables.pharmaceutical_form = encoder.Fit(attributes::PHARMACEUTICAL_FORM, form, eligible);
    tables.measurement_unit = encoder.Fit(attributes::MEASUREMENT_UNIT, unit, eligible);
    return tables;
}

CategoricalFrequencyTable EncoderTables::* EncoderTables::Member(const std::string& attribute) {
    if (attribute == attributes::ATC) return &EncoderTables::atc;
    if (attribute == attributes::ROUTE) return &EncoderTables::route;
    if (attribute == attributes::ACTIVE_INGREDIENT) return &EncoderTables::active_ingredient;
    if (attribute == attributes::PHARMACEUTICAL_FORM) return &EncoderTables::pharmaceutical_form;
    if (attribute == attributes::MEASUREMENT_UNIT) return &EncoderTables::measurement_unit;
    throw std::invalid_argument("Unknown attribute: " + attribute);
}

const CategoricalFrequencyTable& EncoderTables::Get(const std::string& attribute) const {
    return this->*Member(attribute);
}

CategoricalFrequencyTable& EncoderTables::Get(const std::string& attribute) {
    return this->*Member(attribute);
}

const std::vector<std::string>& EncoderTables::AttributeNames() {
    static const std::vector<std::string> names = {
        attributes::ATC,
        attributes::ROUTE,
        attributes::ACTIVE_INGREDIENT,
        attributes::PHARMACEUTICAL_FORM,
        attributes::MEASUREMENT_UNIT,
    };
    return names;
}

// ============================================================================
// FeatureScaler
// ============================================================================

FeatureScaler FeatureScaler::Fit(
    const std::vector<FeatureVector>& raw_vectors,
    const std::vector<FeatureTier>& tiers,
    const WeightConfig& weights
) {
    if (tiers.empty()) {
        throw std::invalid_argument("FeatureScaler needs at least one component");
    }
    for (FeatureTier tier : tiers) {
        if (tier == FeatureTier::INFORMATIVE) {
            throw std::invalid_argument("Informative components cannot be scaled into the vector");
        }
    }
    weights.Validate();

    const size_t dim = tiers.size();
    std::vector<double> means(dim, 0.0);
    std::vector<double> deviations(dim, 1.0);

    if (!raw_vectors.empty()) {
        for (const auto& v : raw_vectors) {
            if (v.Dimension() != dim) {
                throw std::invalid_argument("Raw vector dimension does not match the layout");
            }
            for (size_t j = 0; j < dim; ++j) {
                means[j] += v[j];
            }
        }
        for (size_t j = 0; j < dim; ++j) {
            means[j] /= static_cast<double>(raw_vectors.size());
        }

        std::vector<double> sum_sq(dim, 0.0);
        for (const auto& v : raw_vectors) {
            for (size_t j = 0; j < dim; ++j) {
                double diff = v[j] - means[j];
                sum_sq[j] += diff * diff;
            }
        }
        for (size_t j = 0; j < dim; ++j) {
            double stddev = std::sqrt(sum_sq[j] / static_cast<double>(raw_vectors.size()));
            // Constant components stay centred but unscaled
            deviations[j] = stddev > 1e-12 ? stddev : 1.0;
        }
    }

    return FromParameters(std::move(means), std::move(deviations),
                          std::vector<FeatureTier>(tiers), weights);
}

FeatureScaler FeatureScaler::FromParameters(
    std::vector<double> means,
    std::vector<double> deviations,
    std::vector<FeatureTier> tiers,
    const WeightConfig& weights
) {
    if (means.size() != tiers.size() || deviations.size() != tiers.size()) {
        throw std::invalid_argument("Scaler parameters must match the number of components");
    }
    for (double d : deviations) {
        if (!(d > 0.0)) {
            throw std::invalid_argument("Scaler deviations must be positive");
        }
    }
    weights.Validate();

    FeatureScaler scaler;
    scaler.means_ = std::move(means);
    scaler.deviations_ = std::move(deviations);
    scaler.tiers_ = std::move(tiers);
    scaler.weights_ = weights;
    scaler.ComputeBlockFactors();
    return scaler;
}

void FeatureScaler::ComputeBlockFactors() {
    size_t critical_count = 0;
    size_t important_count = 0;
    for (FeatureTier tier : tiers_) {
        if (tier == FeatureTier::CRITICAL) critical_count++;
        else if (tier == FeatureTier::IMPORTANT) important_count++;
    }

    block_factors_.assign(tiers_.size(), 0.0);
    for (size_t j = 0; j < tiers_.size(); ++j) {
        if (tiers_[j] == FeatureTier::CRITICAL && critical_count > 0) {
            block_factors_[j] = std::sqrt(weights_.critical_weight / critical_count);
        } else if (tiers_[j] == FeatureTier::IMPORTANT && important_count > 0) {
            block_factors_[j] = std::sqrt(weights_.important_weight / important_count);
        }
    }
}

FeatureVector FeatureScaler::Transform(const FeatureVector& raw) const {
    if (raw.Dimension() != means_.size()) {
        throw std::invalid_argument("Raw vector dimension does not match the scaler");
    }

    FeatureVector result(raw.Dimension());
    for (size_t j = 0; j < raw.Dimension(); ++j) {
        result[j] = (raw[j] - means_[j]) / deviations_[j] * block_factors_[j];
    }
    return result;
}

double FeatureScaler::BlockWeight(FeatureTier tier) const {
    double total = 0.0;
    for (size_t j = 0; j < tiers_.size(); ++j) {
        if (tiers_[j] == tier) {
            total += block_factors_[j] * block_factors_[j];
        }
    }
    return total;
}

// ============================================================================
// VectorAssembler
// ============================================================================

VectorAssembler::Config::Config()
    : bin_breakpoints(DefaultQuantityBreakpoints())
{
}

VectorAssembler::VectorAssembler()
    : VectorAssembler(Config())
{
}

VectorAssembler::VectorAssembler(const Config& config)
    : config_(config),
      encoder_(EncoderConfigFor(config.debug_logging))
{
    config_.weights.Validate();
    ValidateBreakpoints(config_.bin_breakpoints);
}

FeatureVector VectorAssembler::AssembleRaw(
    const MedicationRecord& record,
    const EncoderTables& tables,
    size_t* unknown_categories
) const {
    // Numeric transforms first: a failure excludes the whole record
    double log_quantity = LogFeature(record.quantity);
    double log_reference = LogFeature(record.reference_quantity);
    double ratio = RatioFeature(record.quantity, record.reference_quantity);
    double bin = static_cast<double>(BinFeature(record.quantity, config_.bin_breakpoints));

    FeatureVector::Components values;
    values.reserve(Layout().size());

    auto add_encoded = [&](const std::string& value,
                           const CategoricalFrequencyTable& table,
                           bool with_validity) {
        EncodedFeature feature = encoder_.Encode(value, table);
        if (!feature.is_known_category && unknown_categories) {
            (*unknown_categories)++;
        }
        values.push_back(feature.score);
        if (with_validity) {
            values.push_back(feature.seen_among_valid ? 1.0 : 0.0);
        }
        values.push_back(feature.prob_among_valid);
    };

    // Critical block
    add_encoded(record.atc_code, tables.atc, true);
    add_encoded(record.route, tables.route, true);
    add_encoded(record.active_ingredient, tables.active_ingredient, true);

    // Important block
    add_encoded(record.pharmaceutical_form, tables.pharmaceutical_form, false);
    add_encoded(record.measurement_unit, tables.measurement_unit, false);
    values.push_back(log_quantity);
    values.push_back(log_reference);
    values.push_back(ratio);
    values.push_back(bin);

    return FeatureVector(std::move(values));
}

FeatureVector VectorAssembler::Assemble(
    const MedicationRecord& record,
    const EncoderTables& tables,
    const FeatureScaler& scaler
) const {
    FeatureVector weighted = scaler.Transform(AssembleRaw(record, tables));
    LogDebug("Assembled " + record.cum + ": " + weighted.ToString());
    return weighted;
}

std::map<std::string, std::string> VectorAssembler::InformativeMetadata(
    const MedicationRecord& record, bool eligible
) {
    return {
        {"cum", record.cum},
        {"product_name", record.product_name},
        {"atc_code", record.atc_code},
        {"atc_description", record.atc_description},
        {"route", record.route},
        {"active_ingredient", record.active_ingredient},
        {"pharmaceutical_form", record.pharmaceutical_form},
        {"measurement_unit", record.measurement_unit},
        {"quantity", FormatNumber(record.quantity)},
        {"reference_quantity", FormatNumber(record.reference_quantity)},
        {"expiration_date", record.expiration_date},
        {"file_number", record.file_number},
        {"eligible", eligible ? "1" : "0"},
    };
}

const std::vector<FeatureComponent>& VectorAssembler::Layout() {
    static const std::vector<FeatureComponent> layout = {
        {"atc.score", FeatureTier::CRITICAL},
        {"atc.valid", FeatureTier::CRITICAL},
        {"atc.prob_valid", FeatureTier::CRITICAL},
        {"route.score", FeatureTier::CRITICAL},
        {"route.valid", FeatureTier::CRITICAL},
        {"route.prob_valid", FeatureTier::CRITICAL},
        {"active_ingredient.score", FeatureTier::CRITICAL},
        {"active_ingredient.valid", FeatureTier::CRITICAL},
        {"active_ingredient.prob_valid", FeatureTier::CRITICAL},
        {"pharmaceutical_form.score", FeatureTier::IMPORTANT},
        {"pharmaceutical_form.prob_valid", FeatureTier::IMPORTANT},
        {"measurement_unit.score", FeatureTier::IMPORTANT},
        {"measurement_unit.prob_valid", FeatureTier::IMPORTANT},
        {"quantity.log", FeatureTier::IMPORTANT},
        {"reference_quantity.log", FeatureTier::IMPORTANT},
        {"quantity.ratio", FeatureTier::IMPORTANT},
        {"quantity.bin", FeatureTier::IMPORTANT},
    };
    return layout;
}

std::vector<FeatureTier> VectorAssembler::LayoutTiers() {
    std::vector<FeatureTier> tiers;
    tiers.reserve(Layout().size());
    for (const auto& component : Layout()) {
        tiers.push_back(component.tier);
    }
    return tiers;
}

void VectorAssembler::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[VectorAssembler] " << message << std::endl;
    }
}

} // namespace medeq

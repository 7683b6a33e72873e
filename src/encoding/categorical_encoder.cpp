// File: src/encoding/categorical_encoder.cpp
#include "encoding/categorical_encoder.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace medeq {

// ============================================================================
// CategoricalFrequencyTable
// ============================================================================

CategoricalFrequencyTable CategoricalFrequencyTable::FromCounts(
    const std::string& attribute,
    const std::unordered_map<std::string, Counts>& counts,
    size_t total_eligible,
    double count_divisor
) {
    if (count_divisor <= 0.0) {
        throw std::invalid_argument("count_divisor must be positive");
    }

    CategoricalFrequencyTable table;
    table.attribute_ = attribute;
    table.total_eligible_ = total_eligible;
    table.count_divisor_ = count_divisor;

    table.entries_.reserve(counts.size());
    for (const auto& [value, c] : counts) {
        if (c.count == 0) {
            throw std::invalid_argument("Value '" + value + "' has a zero count");
        }
        if (c.eligible_count > c.count) {
            throw std::invalid_argument("Value '" + value + "' has more eligible than total occurrences");
        }
        Entry entry;
        entry.value = value;
        entry.count = c.count;
        entry.eligible_count = c.eligible_count;
        table.entries_.push_back(std::move(entry));
        table.total_count_ += c.count;
    }

    // Descending count, ties ordered lexicographically
    std::sort(table.entries_.begin(), table.entries_.end(),
              [](const Entry& a, const Entry& b) {
                  if (a.count != b.count) {
                      return a.count > b.count;
                  }
                  return a.value < b.value;
              });

    // Competition ranking: a value's rank counts the strictly more frequent values
    for (size_t i = 0; i < table.entries_.size(); ++i) {
        if (i > 0 && table.entries_[i].count == table.entries_[i - 1].count) {
            table.entries_[i].rank = table.entries_[i - 1].rank;
        } else {
            table.entries_[i].rank = i + 1;
        }
        table.max_rank_ = std::max(table.max_rank_, table.entries_[i].rank);
        table.index_[table.entries_[i].value] = i;
    }

    return table;
}

const CategoricalFrequencyTable::Entry* CategoricalFrequencyTable::Find(
    const std::string& value
) const {
    auto it = index_.find(value);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

// ============================================================================
// CategoricalEncoder
// ============================================================================

CategoricalEncoder::CategoricalEncoder()
    : config_()
{
}

CategoricalEncoder::CategoricalEncoder(const Config& config)
    : config_(config)
{
    if (config_.count_divisor <= 0.0) {
        throw std::invalid_argument("count_divisor must be positive");
    }
}

CategoricalFrequencyTable CategoricalEncoder::Fit(
    const std::string& attribute,
    const std::vector<std::string>& values
) const {
    return Fit(attribute, values, std::vector<bool>(values.size(), true));
}

CategoricalFrequencyTable CategoricalEncoder::Fit(
    const std::string& attribute,
    const std::vector<std::string>& values,
    const std::vector<bool>& eligible
) const {
    if (values.size() != eligible.size()) {
        throw std::invalid_argument("values and eligibility flags must have the same length");
    }

    std::unordered_map<std::string, CategoricalFrequencyTable::Counts> counts;
    size_t total_eligible = 0;
    size_t max_count = 0;

    for (size_t i = 0; i < values.size(); ++i) {
        auto& c = counts[values[i]];
        c.count++;
        if (eligible[i]) {
            c.eligible_count++;
            total_eligible++;
        }
        max_count = std::max(max_count, c.count);
    }

    double divisor = config_.count_divisor;
    if (static_cast<double>(max_count) >= divisor) {
        if (!config_.auto_rescale) {
            throw std::invalid_argument(
                "Attribute '" + attribute + "' has a value occurring " +
                std::to_string(max_count) + " times; rescale count_divisor");
        }
        while (static_cast<double>(max_count) >= divisor) {
            divisor *= 10.0;
        }
        LogDebug("Attribute '" + attribute + "' rescaled count divisor to " +
                 std::to_string(static_cast<long long>(divisor)));
    }

    auto table = CategoricalFrequencyTable::FromCounts(attribute, counts, total_eligible, divisor);
    LogDebug("Fitted '" + attribute + "': " + std::to_string(table.GetDistinctCount()) +
             " distinct values, max rank " + std::to_string(table.GetMaxRank()));
    return table;
}

EncodedFeature CategoricalEncoder::Encode(
    const std::string& value,
    const CategoricalFrequencyTable& table
) const {
    EncodedFeature feature;

    const auto* entry = table.Find(value);
    if (!entry) {
        LogDebug("Unknown category '" + value + "' for attribute '" +
                 table.GetAttribute() + "', using sentinel score");
        feature.score = table.SentinelScore();
        feature.is_known_category = false;
        feature.prob_among_valid = 0.0;
        feature.seen_among_valid = false;
        return feature;
    }

    feature.score = table.Score(*entry);
    feature.is_known_category = true;
    feature.seen_among_valid = entry->eligible_count > 0;
    if (table.GetTotalEligible() > 0) {
        feature.prob_among_valid = static_cast<double>(entry->eligible_count) /
                                   static_cast<double>(table.GetTotalEligible());
    }
    return feature;
}

void CategoricalEncoder::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[CategoricalEncoder] " << message << std::endl;
    }
}

} // namespace medeq

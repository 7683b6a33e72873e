// File: src/encoding/categorical_encoder.hpp
#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace medeq {

/// Encoding of one categorical value against a frequency table
struct EncodedFeature {
    double score{0.0};              // rank + count / divisor, or sentinel
    bool is_known_category{false};  // value present in the table
    double prob_among_valid{0.0};   // eligible share of the value
    bool seen_among_valid{false};   // at least one eligible record had it
};

/// CategoricalFrequencyTable: Frequency ranking of one attribute's values
/// observed in a training batch.
///
/// rank(x) = 1 + number of distinct values with a strictly greater count,
/// so equally frequent values share a rank. Entries are ordered by rank and
/// then lexicographically by value, which fixes the order of ties for
/// exports and persistence.
///
/// Immutable once built; scores are only comparable within the batch that
/// produced the table.
class CategoricalFrequencyTable {
public:
    struct Entry {
        std::string value;
        size_t rank{0};
        size_t count{0};
        size_t eligible_count{0};
    };

    /// Occurrences of one value in the batch
    struct Counts {
        size_t count{0};
        size_t eligible_count{0};
    };

    CategoricalFrequencyTable() = default;

    /// Build a table from per-value counts, computing ranks
    /// @param attribute Attribute (column) name
    /// @param counts Per-value total and eligible occurrence counts
    /// @param total_eligible Number of eligible records in the batch
    /// @param count_divisor Divisor of the fractional tie-break term
    /// @throws std::invalid_argument if count_divisor <= 0 or a count is 0
    static CategoricalFrequencyTable FromCounts(
        const std::string& attribute,
        const std::unordered_map<std::string, Counts>& counts,
        size_t total_eligible,
        double count_divisor);

    /// Look up a value
    /// @return Entry pointer, nullptr if the value was not observed
    const Entry* Find(const std::string& value) const;

    /// Score of an observed entry: rank + count / divisor
    double Score(const Entry& entry) const {
        return static_cast<double>(entry.rank) +
               static_cast<double>(entry.count) / count_divisor_;
    }

    /// Score reserved for values absent from the table
    double SentinelScore() const { return static_cast<double>(max_rank_ + 1); }

    const std::string& GetAttribute() const { return attribute_; }
    const std::vector<Entry>& GetEntries() const { return entries_; }
    size_t GetDistinctCount() const { return entries_.size(); }
    size_t GetMaxRank() const { return max_rank_; }
    size_t GetTotalCount() const { return total_count_; }
    size_t GetTotalEligible() const { return total_eligible_; }
    double GetCountDivisor() const { return count_divisor_; }
    bool IsEmpty() const { return entries_.empty(); }

private:
    std::string attribute_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
    size_t max_rank_{0};
    size_t total_count_{0};
    size_t total_eligible_{0};
    double count_divisor_{10000.0};
};

/// CategoricalEncoder: Adjusted frequency ranking of categorical attributes.
///
/// Fit() counts the values of one attribute over a training batch and
/// returns a new table; Encode() maps a value to its score through a table
/// passed in explicitly. The encoder itself holds configuration only.
///
/// Precondition of the scoring rule: no value occurs count_divisor times or
/// more, otherwise the fractional term would spill into the next rank. With
/// auto_rescale the divisor is raised to the next power of ten instead.
///
/// Thread-safety: const methods are safe for concurrent use.
class CategoricalEncoder {
public:
    struct Config {
        Config() = default;
        /// Divisor of the fractional count term
        double count_divisor{10000.0};
        /// Grow the divisor by powers of ten when a count reaches it
        bool auto_rescale{true};
        /// Log unknown categories and rescaling
        bool debug_logging{false};
    };

    CategoricalEncoder();
    explicit CategoricalEncoder(const Config& config);

    /// Fit a table treating every record as eligible
    CategoricalFrequencyTable Fit(const std::string& attribute,
                                  const std::vector<std::string>& values) const;

    /// Fit a table from one attribute column and the eligibility flags
    /// @param attribute Attribute name stored in the table
    /// @param values One value per record
    /// @param eligible One flag per record (same length as values)
    /// @throws std::invalid_argument on length mismatch, or when a count
    ///         reaches the divisor and auto_rescale is off
    CategoricalFrequencyTable Fit(const std::string& attribute,
                                  const std::vector<std::string>& values,
                                  const std::vector<bool>& eligible) const;

    /// Encode a value; unknown values get the sentinel score, never an error
    EncodedFeature Encode(const std::string& value,
                          const CategoricalFrequencyTable& table) const;

    /// Score only
    double EncodeScore(const std::string& value,
                       const CategoricalFrequencyTable& table) const {
        return Encode(value, table).score;
    }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    void LogDebug(const std::string& message) const;
};

} // namespace medeq

// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <atomic>
#include <iosfwd>

namespace medeq {

// RecordID: regulatory CUM code identifying one approved drug product
using RecordID = std::string;

// SnapshotID: Identifies one training run's model snapshot
// Numbered independently per run; 0 is reserved for "no snapshot"
class SnapshotID {
public:
    using ValueType = uint64_t;

    SnapshotID() : value_(kInvalidID) {}

    explicit SnapshotID(ValueType value) : value_(value) {}

    // Next process-wide number; safe to call from any thread
    static SnapshotID Generate();

    // Make sure later Generate() calls never reuse a restored ID
    static void ReserveAtLeast(ValueType value);

    bool IsValid() const { return value_ != kInvalidID; }

    ValueType value() const { return value_; }

    bool operator==(const SnapshotID& other) const { return value_ == other.value_; }
    bool operator!=(const SnapshotID& other) const { return value_ != other.value_; }
    bool operator<(const SnapshotID& other) const { return value_ < other.value_; }
    bool operator>(const SnapshotID& other) const { return value_ > other.value_; }

    // "SnapshotID(<n>)", or "SnapshotID(INVALID)" for the reserved 0
    std::string ToString() const;

    // Fixed 8-byte host-order encoding
    void Serialize(std::ostream& out) const;
    static SnapshotID Deserialize(std::istream& in);

private:
    static constexpr ValueType kInvalidID = 0;
    static std::atomic<ValueType> next_id_;

    ValueType value_;
};

// RegistrationStatus: Sanitary registration state of a product
enum class RegistrationStatus : uint8_t {
    ACTIVE = 0,       // Registration in force
    EXPIRED = 1,      // Registration lapsed
    IN_RENEWAL = 2,   // Renewal filed, still marketable
    OTHER = 3,        // Any other administrative state
};

const char* ToString(RegistrationStatus status);

// Accepts the canonical upper-case names and their lower-case forms
RegistrationStatus ParseRegistrationStatus(const std::string& str);

// CumStatus: State of the CUM code itself
enum class CumStatus : uint8_t {
    ACTIVE = 0,
    INACTIVE = 1,
};

const char* ToString(CumStatus status);
CumStatus ParseCumStatus(const std::string& str);

// FeatureTier: Weighting tier controlling a feature's influence on distance
enum class FeatureTier : uint8_t {
    CRITICAL = 0,     // Dominant share of the distance
    IMPORTANT = 1,    // Minor share of the distance
    INFORMATIVE = 2,  // Metadata only, never part of the vector
};

const char* ToString(FeatureTier tier);

// CandidateFilter: Hard post-hoc filters applied to substitute candidates
enum class CandidateFilter : uint8_t {
    REGISTRATION_ACTIVE = 0,  // Candidate registration is ACTIVE
    NOT_MEDICAL_SAMPLE = 1,   // Candidate is not a medical sample
    ATC_EXACT_MATCH = 2,      // Candidate ATC equals the query ATC
    COVERAGE_IN_PBS = 3,      // Candidate is covered by the benefit plan
};

// Lower-case snake names, e.g. "atc_exact_match"
const char* ToString(CandidateFilter filter);
CandidateFilter ParseCandidateFilter(const std::string& str);

} // namespace medeq

// Hash specialization for std::unordered_map
namespace std {
    template<>
    struct hash<medeq::SnapshotID> {
        size_t operator()(const medeq::SnapshotID& id) const {
            return std::hash<medeq::SnapshotID::ValueType>()(id.value());
        }
    };
}

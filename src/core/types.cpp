// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <stdexcept>

namespace medeq {

// Static member initialization
std::atomic<SnapshotID::ValueType> SnapshotID::next_id_{1};

SnapshotID SnapshotID::Generate() {
    ValueType new_id = next_id_.fetch_add(1, std::memory_order_relaxed);
    return SnapshotID(new_id);
}

void SnapshotID::ReserveAtLeast(ValueType value) {
    ValueType current = next_id_.load(std::memory_order_relaxed);
    while (current <= value &&
           !next_id_.compare_exchange_weak(current, value + 1, std::memory_order_relaxed)) {
    }
}

std::string SnapshotID::ToString() const {
    if (!IsValid()) {
        return "SnapshotID(INVALID)";
    }
    std::ostringstream oss;
    oss << "SnapshotID(" << value_ << ")";
    return oss.str();
}

void SnapshotID::Serialize(std::ostream& out) const {
    out.write(reinterpret_cast<const char*>(&value_), sizeof(value_));
}

SnapshotID SnapshotID::Deserialize(std::istream& in) {
    ValueType value = kInvalidID;
    if (!in.read(reinterpret_cast<char*>(&value), sizeof(value))) {
        throw std::runtime_error("Truncated snapshot id");
    }
    return SnapshotID(value);
}

// Enum implementations

const char* ToString(RegistrationStatus status) {
    switch (status) {
        case RegistrationStatus::ACTIVE: return "ACTIVE";
        case RegistrationStatus::EXPIRED: return "EXPIRED";
        case RegistrationStatus::IN_RENEWAL: return "IN_RENEWAL";
        case RegistrationStatus::OTHER: return "OTHER";
        default: return "UNKNOWN";
    }
}

RegistrationStatus ParseRegistrationStatus(const std::string& str) {
    if (str == "ACTIVE" || str == "active") return RegistrationStatus::ACTIVE;
    if (str == "EXPIRED" || str == "expired") return RegistrationStatus::EXPIRED;
    if (str == "IN_RENEWAL" || str == "in_renewal") return RegistrationStatus::IN_RENEWAL;
    if (str == "OTHER" || str == "other") return RegistrationStatus::OTHER;
    throw std::invalid_argument("Unknown RegistrationStatus: " + str);
}

const char* ToString(CumStatus status) {
    switch (status) {
        case CumStatus::ACTIVE: return "ACTIVE";
        case CumStatus::INACTIVE: return "INACTIVE";
        default: return "UNKNOWN";
    }
}

CumStatus ParseCumStatus(const std::string& str) {
    if (str == "ACTIVE" || str == "active") return CumStatus::ACTIVE;
    if (str == "INACTIVE" || str == "inactive") return CumStatus::INACTIVE;
    throw std::invalid_argument("Unknown CumStatus: " + str);
}

const char* ToString(FeatureTier tier) {
    switch (tier) {
        case FeatureTier::CRITICAL: return "CRITICAL";
        case FeatureTier::IMPORTANT: return "IMPORTANT";
        case FeatureTier::INFORMATIVE: return "INFORMATIVE";
        default: return "UNKNOWN";
    }
}

const char* ToString(CandidateFilter filter) {
    switch (filter) {
        case CandidateFilter::REGISTRATION_ACTIVE: return "registration_active";
        case CandidateFilter::NOT_MEDICAL_SAMPLE: return "not_medical_sample";
        case CandidateFilter::ATC_EXACT_MATCH: return "atc_exact_match";
        case CandidateFilter::COVERAGE_IN_PBS: return "coverage_in_pbs";
        default: return "unknown";
    }
}

CandidateFilter ParseCandidateFilter(const std::string& str) {
    if (str == "registration_active") return CandidateFilter::REGISTRATION_ACTIVE;
    if (str == "not_medical_sample") return CandidateFilter::NOT_MEDICAL_SAMPLE;
    if (str == "atc_exact_match") return CandidateFilter::ATC_EXACT_MATCH;
    if (str == "coverage_in_pbs") return CandidateFilter::COVERAGE_IN_PBS;
    throw std::invalid_argument("Unknown CandidateFilter: " + str);
}

} // namespace medeq

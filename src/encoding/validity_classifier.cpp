// File: src/encoding/validity_classifier.cpp
#include "encoding/validity_classifier.hpp"
#include <algorithm>

namespace medeq {

ValidityClassifier::ValidityClassifier(const EligibilityRules& rules)
    : rules_(rules)
{
}

bool ValidityClassifier::Classify(const MedicationRecord& record) const {
    if (rules_.accepted_registration_statuses.count(record.registration_status) == 0) {
        return false;
    }
    if (rules_.require_active_cum && record.cum_status != CumStatus::ACTIVE) {
        return false;
    }
    if (rules_.exclude_medical_samples && record.medical_sample) {
        return false;
    }
    return true;
}

std::vector<bool> ValidityClassifier::ClassifyAll(
    const std::vector<MedicationRecord>& records
) const {
    std::vector<bool> flags;
    flags.reserve(records.size());
    for (const auto& record : records) {
        flags.push_back(Classify(record));
    }
    return flags;
}

size_t ValidityClassifier::CountEligible(const std::vector<MedicationRecord>& records) const {
    return static_cast<size_t>(std::count_if(records.begin(), records.end(),
        [this](const MedicationRecord& record) { return Classify(record); }));
}

std::vector<std::string> ValidityClassifier::ExplainIneligibility(
    const MedicationRecord& record
) const {
    std::vector<std::string> reasons;

    if (rules_.accepted_registration_statuses.count(record.registration_status) == 0) {
        reasons.push_back(std::string("registration status ") +
                          ToString(record.registration_status) + " not accepted");
    }
    if (rules_.require_active_cum && record.cum_status != CumStatus::ACTIVE) {
        reasons.push_back("CUM status is not ACTIVE");
    }
    if (rules_.exclude_medical_samples && record.medical_sample) {
        reasons.push_back("medical sample");
    }

    return reasons;
}

} // namespace medeq

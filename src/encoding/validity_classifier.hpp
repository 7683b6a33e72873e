// File: src/encoding/validity_classifier.hpp
#pragma once

#include "core/medication_record.hpp"
#include <set>
#include <string>
#include <vector>

namespace medeq {

/// Rules deciding whether a record may be offered as a substitute
struct EligibilityRules {
    /// Registration states considered marketable
    std::set<RegistrationStatus> accepted_registration_statuses{
        RegistrationStatus::ACTIVE, RegistrationStatus::IN_RENEWAL};
    /// CUM code itself must be ACTIVE
    bool require_active_cum{true};
    /// Medical samples are never eligible
    bool exclude_medical_samples{true};

    static EligibilityRules Default() { return EligibilityRules{}; }
};

/// ValidityClassifier: Labels records eligible or ineligible for homologation.
///
/// Pure function of the record fields and the configured rules. The same
/// flags gate the "valid" denominator of the encoder's prob_among_valid and
/// the candidate set served by the resolver.
///
/// Thread-safety: Immutable after construction, safe for concurrent use.
class ValidityClassifier {
public:
    ValidityClassifier() = default;
    explicit ValidityClassifier(const EligibilityRules& rules);

    /// @return true if the record is eligible under the configured rules
    bool Classify(const MedicationRecord& record) const;

    /// Classify every record of a batch, in order
    std::vector<bool> ClassifyAll(const std::vector<MedicationRecord>& records) const;

    /// Number of eligible records in a batch
    size_t CountEligible(const std::vector<MedicationRecord>& records) const;

    /// Human-readable reasons a record is ineligible (empty when eligible)
    std::vector<std::string> ExplainIneligibility(const MedicationRecord& record) const;

    const EligibilityRules& GetRules() const { return rules_; }

private:
    EligibilityRules rules_;
};

} // namespace medeq

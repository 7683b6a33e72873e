// File: src/core/medication_record.hpp
#pragma once

#include "core/types.hpp"
#include <string>

namespace medeq {

/// MedicationRecord: One cleaned regulatory entry of the drug registry.
///
/// Produced by the external ingestion stage and read-only to the engine.
/// Identity is the CUM code.
struct MedicationRecord {
    RecordID cum;                       // Unique regulatory code
    std::string product_name;           // Commercial name
    std::string active_ingredient;      // Raw active-ingredient string
    std::string atc_code;               // ATC therapeutic code
    std::string atc_description;        // Human-readable ATC label
    std::string pharmaceutical_form;
    std::string route;                  // Route of administration
    std::string measurement_unit;
    double quantity{0.0};
    double reference_quantity{0.0};     // Quantity declared on the CUM
    RegistrationStatus registration_status{RegistrationStatus::OTHER};
    CumStatus cum_status{CumStatus::INACTIVE};
    bool medical_sample{false};
    std::string expiration_date;        // ISO-8601 date, may be empty
    std::string file_number;            // Regulatory file ("expediente")
    bool covered_by_benefit_plan{false};

    /// String representation (for debugging and CLI output)
    std::string ToString() const;

    bool operator==(const MedicationRecord& other) const;
    bool operator!=(const MedicationRecord& other) const { return !(*this == other); }
};

} // namespace medeq

// File: src/core/medication_record.cpp
#include "core/medication_record.hpp"
#include <sstream>

namespace medeq {

std::string MedicationRecord::ToString() const {
    std::ostringstream oss;
    oss << "MedicationRecord(" << cum << ", \"" << product_name << "\""
        << ", atc=" << atc_code
        << ", route=" << route
        << ", form=" << pharmaceutical_form
        << ", qty=" << quantity << " " << measurement_unit
        << ", registration=" << medeq::ToString(registration_status)
        << ", cum_status=" << medeq::ToString(cum_status)
        << (medical_sample ? ", sample" : "")
        << ")";
    return oss.str();
}

bool MedicationRecord::operator==(const MedicationRecord& other) const {
    return cum == other.cum &&
           product_name == other.product_name &&
           active_ingredient == other.active_ingredient &&
           atc_code == other.atc_code &&
           atc_description == other.atc_description &&
           pharmaceutical_form == other.pharmaceutical_form &&
           route == other.route &&
           measurement_unit == other.measurement_unit &&
           quantity == other.quantity &&
           reference_quantity == other.reference_quantity &&
           registration_status == other.registration_status &&
           cum_status == other.cum_status &&
           medical_sample == other.medical_sample &&
           expiration_date == other.expiration_date &&
           file_number == other.file_number &&
           covered_by_benefit_plan == other.covered_by_benefit_plan;
}

} // namespace medeq

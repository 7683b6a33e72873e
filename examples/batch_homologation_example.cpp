// File: examples/batch_homologation_example.cpp
//
// Batch homologation example.
// Demonstrates:
// - Training with automatic cluster count selection
// - Homologating a hospital formulary against the registry
// - Reading the summary and CSV output
// - Republishing after the registry changes

#include "core/equivalence_engine.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace medeq;

/// Registry of `groups` therapeutic classes with `per_group` products each
std::vector<MedicationRecord> BuildRegistry(size_t groups, size_t per_group) {
    static const char* kIngredients[] = {"ACETAMINOFEN", "IBUPROFENO", "LOSARTAN",
                                         "METFORMINA", "OMEPRAZOL", "SALBUTAMOL"};
    static const char* kAtc[] = {"N02BE01", "M01AE01", "C09CA01",
                                 "A10BA02", "A02BC01", "R03AC02"};
    static const char* kForms[] = {"TABLETA", "TABLETA", "TABLETA",
                                   "TABLETA", "CAPSULA", "AEROSOL"};
    static const char* kRoutes[] = {"ORAL", "ORAL", "ORAL", "ORAL", "ORAL", "INHALADA"};
    static const double kStrength[] = {500.0, 400.0, 50.0, 850.0, 20.0, 100.0};

    std::vector<MedicationRecord> records;
    for (size_t g = 0; g < groups && g < 6; ++g) {
        for (size_t i = 0; i < per_group + g; ++i) {
            MedicationRecord record;
            record.cum = std::to_string(10000 * (g + 1) + i) + "-1";
            record.active_ingredient = kIngredients[g];
            record.product_name = std::string(kIngredients[g]) + " LAB " + std::to_string(i);
            record.atc_code = kAtc[g];
            record.atc_description = kIngredients[g];
            record.pharmaceutical_form = kForms[g];
            record.route = kRoutes[g];
            record.measurement_unit = g == 5 ? "MCG" : "MG";
            record.reference_quantity = kStrength[g];
            record.quantity = kStrength[g] * (i % 2 == 0 ? 1.0 : 2.0);
            record.registration_status = i % 7 == 6 ? RegistrationStatus::IN_RENEWAL
                                                    : RegistrationStatus::ACTIVE;
            record.cum_status = CumStatus::ACTIVE;
            record.medical_sample = false;
            record.covered_by_benefit_plan = i % 5 != 4;
            records.push_back(record);
        }
    }
    return records;
}

int main() {
    std::cout << "=== MedEq Batch Homologation Example ===\n\n";

    auto registry = BuildRegistry(6, 10);
    std::cout << "Registry: " << registry.size() << " records\n\n";

    EquivalenceEngine::Config config;
    config.auto_select_k = true;
    config.resolver.default_top_k = 2;
    config.resolver.default_filters = {CandidateFilter::REGISTRATION_ACTIVE};
    EquivalenceEngine engine(config);

    try {
        auto model = engine.TrainAndPublish(registry);
        std::cout << "Published " << model->GetID().ToString() << " with "
                  << model->GetSnapshot().GetClusterCount() << " clusters\n\n";
    } catch (const MedEqError& e) {
        std::cerr << "Training failed: " << e.what() << "\n";
        return 1;
    }

    // Formulary with a blank line, a duplicate and an unknown code
    std::vector<std::string> formulary = {
        registry[0].cum, registry[12].cum, "", registry[30].cum,
        "99999-9", registry[0].cum, registry.back().cum,
    };

    auto summary = engine.Homologate(formulary);
    std::cout << "Found: " << summary.found
              << "  No substitute: " << summary.no_substitute
              << "  Unresolvable: " << summary.unresolvable
              << "  Skipped: " << summary.skipped << "\n\n";
    std::cout << summary.ToCsv() << "\n";

    // The registry changes: a new product enters the first class
    auto updated = registry;
    MedicationRecord newcomer = registry[0];
    newcomer.cum = "77777-1";
    newcomer.product_name = "ACETAMINOFEN NUEVO";
    updated.push_back(newcomer);

    engine.TrainAndPublish(updated);
    auto rerun = engine.Homologate({registry[0].cum}, QueryOptions::TopK(1));
    if (!rerun.rows.empty() && rerun.rows[0].status == HomologationStatus::FOUND) {
        std::cout << "After update, " << registry[0].cum << " -> "
                  << rerun.rows[0].substitutes.front().cum << "\n\n";
    }

    std::cout << "=== Example completed successfully ===\n";
    return 0;
}

// File: examples/basic_example.cpp
//
// Basic equivalence example using the MedEq engine.
// Demonstrates:
// - Building a small medication registry
// - Training and publishing a model
// - Querying substitutes with and without filters
// - Placing a record that was never part of training
// - Viewing statistics

#include "core/equivalence_engine.hpp"
#include "core/errors.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

using namespace medeq;

/// Eligible record with the given attributes
MedicationRecord MakeMedication(const std::string& cum,
                                const std::string& name,
                                const std::string& ingredient,
                                const std::string& atc,
                                const std::string& form,
                                const std::string& route,
                                const std::string& unit,
                                double quantity,
                                double reference_quantity) {
    MedicationRecord record;
    record.cum = cum;
    record.product_name = name;
    record.active_ingredient = ingredient;
    record.atc_code = atc;
    record.atc_description = ingredient;
    record.pharmaceutical_form = form;
    record.route = route;
    record.measurement_unit = unit;
    record.quantity = quantity;
    record.reference_quantity = reference_quantity;
    record.registration_status = RegistrationStatus::ACTIVE;
    record.cum_status = CumStatus::ACTIVE;
    record.medical_sample = false;
    record.covered_by_benefit_plan = true;
    return record;
}

void PrintResults(const CandidateSequence& sequence) {
    const auto& model = sequence.GetModel();
    std::cout << "  Cluster " << sequence.GetClusterLabel() << ", "
              << sequence.Available() << " candidate(s)\n";
    for (const auto& candidate : sequence.Results()) {
        const MedicationRecord* record = model.FindRecord(candidate.cum);
        std::cout << "    " << std::left << std::setw(10) << candidate.cum << std::right
                  << " d=" << std::fixed << std::setprecision(4) << candidate.distance
                  << " sim=" << std::setprecision(3) << candidate.similarity;
        if (record != nullptr) {
            std::cout << "  " << record->product_name;
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

int main() {
    std::cout << "=== MedEq Basic Equivalence Example ===\n\n";

    // Step 1: Build a registry
    std::cout << "Step 1: Building registry...\n";

    std::vector<MedicationRecord> registry;
    for (int i = 0; i < 8; ++i) {
        registry.push_back(MakeMedication("1000" + std::to_string(i) + "-1",
                                          "ACETAMINOFEN " + std::to_string(500 + 50 * (i % 3)) + " MG",
                                          "ACETAMINOFEN", "N02BE01", "TABLETA", "ORAL", "MG",
                                          500.0 + 50.0 * (i % 3), 500.0));
    }
    for (int i = 0; i < 6; ++i) {
        registry.push_back(MakeMedication("2000" + std::to_string(i) + "-1",
                                          "SALBUTAMOL INHALADOR " + std::to_string(i + 1),
                                          "SALBUTAMOL", "R03AC02", "AEROSOL", "INHALADA", "MCG",
                                          100.0, 100.0));
    }
    for (int i = 0; i < 5; ++i) {
        registry.push_back(MakeMedication("3000" + std::to_string(i) + "-1",
                                          "BETAMETASONA CREMA " + std::to_string(i + 1),
                                          "BETAMETASONA", "D07AC01", "CREMA", "TOPICA", "G",
                                          15.0 + 15.0 * (i % 2), 15.0));
    }

    // One expired registration and one without benefit plan coverage
    registry[3].registration_status = RegistrationStatus::EXPIRED;
    registry[5].covered_by_benefit_plan = false;
    std::cout << "  " << registry.size() << " records\n\n";

    // Step 2: Train and publish
    std::cout << "Step 2: Training model...\n";

    EquivalenceEngine::Config config;
    config.clustering.k = 3;
    config.clustering.seed = 42;
    EquivalenceEngine engine(config);

    std::shared_ptr<const TrainedModel> model;
    try {
        model = engine.TrainAndPublish(registry);
    } catch (const MedEqError& e) {
        std::cerr << "Training failed: " << e.what() << "\n";
        return 1;
    }
    std::cout << "  ✓ Published " << model->GetID().ToString() << "\n";
    std::cout << model->GetReport().ToString() << "\n";

    // Step 3: Query substitutes
    std::cout << "Step 3: Substitutes of " << registry[0].cum << "...\n";
    PrintResults(engine.Query(registry[0].cum, QueryOptions::TopK(5)));

    // Step 4: Same query restricted to covered, active registrations
    std::cout << "Step 4: Filtered substitutes...\n";
    QueryOptions options;
    options.top_k = 5;
    options.filters = {CandidateFilter::REGISTRATION_ACTIVE, CandidateFilter::COVERAGE_IN_PBS};
    PrintResults(engine.Query(registry[0].cum, options));

    // Step 5: Expired records are placed in a cluster but never offered
    std::cout << "Step 5: Substitutes of expired " << registry[3].cum << "...\n";
    PrintResults(engine.Query(registry[3].cum, QueryOptions::TopK(3)));

    // Step 6: A record the model has never seen
    std::cout << "Step 6: Ad-hoc record...\n";
    MedicationRecord incoming = MakeMedication("90000-1", "NEW SALBUTAMOL", "SALBUTAMOL",
                                               "R03AC02", "AEROSOL", "INHALADA", "MCG",
                                               100.0, 100.0);
    PrintResults(engine.QueryRecord(incoming, QueryOptions::TopK(3)));

    try {
        engine.Query("00000-0");
    } catch (const UnresolvableQuery& e) {
        std::cout << "  Unknown CUM: " << e.what() << "\n\n";
    }

    // Step 7: Statistics
    std::cout << "Step 7: Engine statistics:\n";
    auto stats = engine.GetStatistics();
    std::cout << "  Records: " << stats.records << "\n";
    std::cout << "  Eligible: " << stats.eligible << "\n";
    std::cout << "  Training members: " << stats.training_members << "\n";
    std::cout << "  Clusters: " << stats.cluster_count << "\n";
    std::cout << "  Inertia: " << std::fixed << std::setprecision(4) << stats.inertia << "\n\n";

    std::cout << "=== Example completed successfully ===\n";

    return 0;
}

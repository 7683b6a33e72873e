// File: tests/edge_case_tests.cpp
//
// Edge Case and Boundary Condition Tests
//
// This test suite focuses on:
// - Empty and fully ineligible registries
// - Boundary cluster counts
// - Malformed numeric attributes
// - Unseen and empty categorical values

#include "core/equivalence_engine.hpp"
#include "core/errors.hpp"
#include "medication_test_fixtures.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace medeq {
namespace {

using namespace fixtures;

// ============================================================================
// Training Input Edge Cases
// ============================================================================

TEST(EdgeCaseTest, EmptyRegistryIsInsufficient) {
    EquivalenceEngine engine(SmallEngineConfig());
    try {
        engine.Train({});
        FAIL() << "Expected InsufficientData";
    } catch (const InsufficientData& e) {
        EXPECT_EQ(0u, e.available());
        EXPECT_EQ(3u, e.requested());
    }
}

TEST(EdgeCaseTest, FullyIneligibleRegistryIsInsufficient) {
    EquivalenceEngine engine(SmallEngineConfig());
    auto records = MakeRegistry();
    for (auto& record : records) {
        record.cum_status = CumStatus::INACTIVE;
    }
    EXPECT_THROW(engine.Train(records), InsufficientData);
}

TEST(EdgeCaseTest, AllQuantitiesInvalidIsInsufficient) {
    EquivalenceEngine engine(SmallEngineConfig());
    auto records = MakeRegistry();
    for (auto& record : records) {
        record.quantity = 0.0;
    }
    EXPECT_THROW(engine.Train(records), InsufficientData);
}

TEST(EdgeCaseTest, ExactlyKMembersGivesSingletonClusters) {
    EquivalenceEngine engine(SmallEngineConfig());
    auto model = engine.Train({Analgesic(1), Inhaler(1), Topical(1)});

    EXPECT_EQ((std::vector<size_t>{1, 1, 1}), model->GetSnapshot().GetClusterSizes());
    EXPECT_NEAR(0.0, model->GetSnapshot().GetInertia(), 1e-12);

    EquivalenceResolver resolver(model);
    EXPECT_TRUE(resolver.Query("B-01").Results().empty());
}

TEST(EdgeCaseTest, IdenticalRecordsStillTrain) {
    auto config = SmallEngineConfig();
    config.clustering.max_reseed_attempts = 2;
    EquivalenceEngine engine(config);

    std::vector<MedicationRecord> records;
    for (size_t i = 1; i <= 5; ++i) {
        auto record = Analgesic(1);
        record.cum = "SAME-" + std::to_string(i);
        records.push_back(record);
    }

    auto model = engine.TrainAndPublish(records);
    EXPECT_TRUE(model->GetReport().degraded);
    EXPECT_TRUE(model->GetSnapshot().IsDegraded());
    for (const auto& record : records) {
        EXPECT_TRUE(model->GetSnapshot().GetLabel(record.cum).has_value()) << record.cum;
    }
    EXPECT_EQ(4u, engine.Query("SAME-1", QueryOptions::TopK(10)).Results().size());
}

TEST(EdgeCaseTest, TwoGroupsOfIdenticalGenericsWithThreeClusters) {
    EquivalenceEngine engine(SmallEngineConfig());

    std::vector<MedicationRecord> records;
    for (size_t i = 1; i <= 6; ++i) {
        auto analgesic = Analgesic(1);
        analgesic.cum = "GEN-A" + std::to_string(i);
        records.push_back(analgesic);

        auto inhaler = Inhaler(1);
        inhaler.cum = "GEN-B" + std::to_string(i);
        records.push_back(inhaler);
    }

    auto model = engine.TrainAndPublish(records);
    const auto& snapshot = model->GetSnapshot();
    EXPECT_TRUE(model->GetReport().degraded);
    EXPECT_EQ(12u, snapshot.GetAssignments().size());
    EXPECT_NE(snapshot.GetLabel("GEN-A1"), snapshot.GetLabel("GEN-B1"));

    auto results = engine.Query("GEN-A1", QueryOptions::TopK(10)).Results();
    ASSERT_EQ(5u, results.size());
    for (const auto& candidate : results) {
        EXPECT_EQ(0, candidate.cum.compare(0, 5, "GEN-A")) << candidate.cum;
        EXPECT_DOUBLE_EQ(0.0, candidate.distance);
    }
}

TEST(EdgeCaseTest, SeparableRegistryIsNotDegraded) {
    EquivalenceEngine engine(SmallEngineConfig());
    auto model = engine.Train(MakeRegistry());
    EXPECT_FALSE(model->GetReport().degraded);
    EXPECT_EQ(std::string::npos, model->GetReport().ToString().find("degraded"));
}

TEST(EdgeCaseTest, AutoSelectOnSmallRegistryUsesOneCluster) {
    auto config = SmallEngineConfig();
    config.auto_select_k = true;
    EquivalenceEngine engine(config);

    // Fewer than 20 members leaves no room for k >= 2
    std::vector<MedicationRecord> records;
    for (size_t i = 1; i <= 6; ++i) records.push_back(Analgesic(i));
    for (size_t i = 1; i <= 6; ++i) records.push_back(Inhaler(i));

    auto model = engine.Train(records);
    EXPECT_EQ(1u, model->GetSnapshot().GetClusterCount());
    EXPECT_EQ(11u, EquivalenceResolver(model).Query("A-01", QueryOptions::TopK(50)).Available());
}

// ============================================================================
// Numeric Attribute Edge Cases
// ============================================================================

TEST(EdgeCaseTest, NonFiniteQuantitiesAreExcluded) {
    EquivalenceEngine engine(SmallEngineConfig());
    auto records = MakeRegistry();
    records[0].quantity = std::numeric_limits<double>::infinity();     // A-01
    records[1].quantity = std::numeric_limits<double>::quiet_NaN();    // A-02
    records[2].reference_quantity = 0.0;                               // A-03
    records[3].reference_quantity = -std::numeric_limits<double>::infinity();  // A-04

    auto model = engine.Train(records);
    const auto& report = model->GetReport();
    ASSERT_EQ(4u, report.excluded.size());
    EXPECT_EQ(18u, report.training_members);
    for (const auto& excluded : report.excluded) {
        EXPECT_FALSE(excluded.reason.empty()) << excluded.cum;
        EXPECT_EQ(nullptr, model->FindVector(excluded.cum));
    }
}

TEST(EdgeCaseTest, OverflowingRatioIsExcluded) {
    EquivalenceEngine engine(SmallEngineConfig());
    auto records = MakeRegistry();
    records[0].quantity = 1e300;
    records[0].reference_quantity = 1e-300;

    auto model = engine.Train(records);
    ASSERT_EQ(1u, model->GetReport().excluded.size());
    EXPECT_EQ("A-01", model->GetReport().excluded[0].cum);
}

TEST(EdgeCaseTest, TinyAndHugeQuantitiesStayFinite) {
    EquivalenceEngine engine(SmallEngineConfig());
    auto records = MakeRegistry();
    records[0].quantity = 1e-9;
    records[1].quantity = 1e9;
    records[1].reference_quantity = 1e-3;

    auto model = engine.Train(records);
    EXPECT_TRUE(model->GetReport().excluded.empty());
    for (const auto& [cum, vector] : model->GetVectors()) {
        for (size_t i = 0; i < vector.Dimension(); ++i) {
            EXPECT_TRUE(std::isfinite(vector[i])) << cum << " component " << i;
        }
    }
}

// ============================================================================
// Categorical Attribute Edge Cases
// ============================================================================

TEST(EdgeCaseTest, EmptyCategoryIsOrdinaryValue) {
    EquivalenceEngine engine(SmallEngineConfig());
    auto records = MakeRegistry();
    records[0].route.clear();
    records[0].measurement_unit.clear();

    auto model = engine.Train(records);
    EXPECT_NE(nullptr, model->GetTables().route.Find(""));
    EXPECT_NE(nullptr, model->FindVector("A-01"));
    EXPECT_EQ(0u, model->GetReport().unknown_categories);
}

TEST(EdgeCaseTest, CategoryOnlySeenInIneligibleRecords) {
    EquivalenceEngine engine(SmallEngineConfig());
    auto records = MakeRegistry();
    records[0].route = "RECTAL";
    records[0].medical_sample = true;

    auto model = engine.Train(records);
    const auto* entry = model->GetTables().route.Find("RECTAL");
    ASSERT_NE(nullptr, entry);
    EXPECT_EQ(1u, entry->count);
    EXPECT_EQ(0u, entry->eligible_count);
}

TEST(EdgeCaseTest, QueryRecordWithAllCategoriesUnseen) {
    EquivalenceEngine engine(SmallEngineConfig());
    engine.TrainAndPublish(MakeRegistry());

    MedicationRecord record = MakeRecord("NOVEL", "V99ZZ99", "INTRAOCULAR", "NOVELINA",
                                         "IMPLANTE", "UI", 3.0, 3.0);
    auto sequence = engine.QueryRecord(record, QueryOptions::TopK(2));
    EXPECT_LT(sequence.GetClusterLabel(), 3u);
    EXPECT_LE(sequence.Results().size(), 2u);
}

// ============================================================================
// Query Edge Cases
// ============================================================================

TEST(EdgeCaseTest, TopKLargerThanClusterReturnsAllMates) {
    EquivalenceEngine engine(SmallEngineConfig());
    engine.TrainAndPublish(MakeRegistry());
    EXPECT_EQ(4u, engine.Query("C-01", QueryOptions::TopK(1000)).Results().size());
}

TEST(EdgeCaseTest, NegativeMaxDistanceKeepsNothing) {
    EquivalenceEngine engine(SmallEngineConfig());
    engine.TrainAndPublish(MakeRegistry());

    QueryOptions options;
    options.max_distance = -1.0;
    EXPECT_TRUE(engine.Query("A-01", options).Results().empty());
}

TEST(EdgeCaseTest, HomologateEmptyAndBlankInput) {
    EquivalenceEngine engine(SmallEngineConfig());
    engine.TrainAndPublish(MakeRegistry());

    auto empty = engine.Homologate({});
    EXPECT_TRUE(empty.rows.empty());

    auto blank = engine.Homologate({"", "  ", "\t"});
    EXPECT_TRUE(blank.rows.empty());
    EXPECT_EQ(3u, blank.skipped);
}

TEST(EdgeCaseTest, HomologateWithoutModelIsUnresolvable) {
    EquivalenceEngine engine(SmallEngineConfig());
    EXPECT_THROW(engine.Homologate({"A-01"}), UnresolvableQuery);
}

} // namespace
} // namespace medeq

// File: tests/core/trained_model_test.cpp
#include "core/trained_model.hpp"
#include "core/errors.hpp"
#include "medication_test_fixtures.hpp"
#include <gtest/gtest.h>

namespace medeq {
namespace {

using namespace fixtures;

class TrainedModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        EquivalenceEngine engine(SmallEngineConfig());
        auto records = MakeRegistry();
        records[0].registration_status = RegistrationStatus::EXPIRED;  // A-01
        records[1].quantity = -5.0;                                    // A-02
        model_ = engine.Train(records);
    }

    std::shared_ptr<const TrainedModel> model_;
};

TEST_F(TrainedModelTest, RecordLookups) {
    ASSERT_NE(nullptr, model_->FindRecord("B-03"));
    EXPECT_EQ("SALBUTAMOL", model_->FindRecord("B-03")->active_ingredient);
    EXPECT_EQ(nullptr, model_->FindRecord("Z-99"));
    EXPECT_EQ(22u, model_->GetRecords().size());
}

TEST_F(TrainedModelTest, IneligibleRecordKeepsItsVector) {
    EXPECT_FALSE(model_->IsEligible("A-01"));
    EXPECT_NE(nullptr, model_->FindVector("A-01"));
    EXPECT_FALSE(model_->GetSnapshot().GetLabel("A-01").has_value());
}

TEST_F(TrainedModelTest, ExcludedRecordHasNoVector) {
    EXPECT_TRUE(model_->IsEligible("A-02"));
    EXPECT_EQ(nullptr, model_->FindVector("A-02"));
    EXPECT_EQ(21u, model_->GetVectors().size());

    const auto& excluded = model_->GetReport().excluded;
    ASSERT_EQ(1u, excluded.size());
    EXPECT_EQ("A-02", excluded[0].cum);
}

TEST_F(TrainedModelTest, UnknownRecordThrowsOutOfRange) {
    EXPECT_THROW(model_->IsEligible("Z-99"), std::out_of_range);
    EXPECT_THROW(model_->GetMetadata("Z-99"), std::out_of_range);
}

TEST_F(TrainedModelTest, MetadataReportsEligibility) {
    EXPECT_EQ("0", model_->GetMetadata("A-01").at("eligible"));
    EXPECT_EQ("1", model_->GetMetadata("A-03").at("eligible"));
}

TEST_F(TrainedModelTest, VectorizeReproducesStoredVector) {
    const MedicationRecord* record = model_->FindRecord("C-02");
    ASSERT_NE(nullptr, record);
    EXPECT_EQ(*model_->FindVector("C-02"), model_->Vectorize(*record));
}

TEST_F(TrainedModelTest, VectorizeRejectsInvalidQuantity) {
    auto record = Topical(9);
    record.reference_quantity = 0.0;
    EXPECT_THROW(model_->Vectorize(record), InvalidQuantity);
}

TEST_F(TrainedModelTest, ReportSummarizesRun) {
    const auto& report = model_->GetReport();
    EXPECT_EQ(22u, report.total_records);
    EXPECT_EQ(21u, report.eligible_records);
    EXPECT_EQ(21u, report.vectorized_records);
    EXPECT_EQ(20u, report.training_members);
    EXPECT_EQ(3u, report.cluster_count);
    EXPECT_EQ("kmeans", report.algorithm);

    std::string text = report.ToString();
    EXPECT_NE(std::string::npos, text.find("A-02"));
}

TEST(TrainedModelConstructionTest, RejectsDuplicateRecords) {
    auto snapshot = ClusterModelSnapshot(SnapshotID(1), {FeatureVector(1)}, {});
    std::vector<MedicationRecord> records = {Analgesic(1), Analgesic(1)};

    EXPECT_THROW(TrainedModel(EncoderTables{}, FeatureScaler{}, VectorAssembler::Config{},
                              snapshot, records, {true, true}, VectorTable{}, TrainingReport{}),
                 std::invalid_argument);
}

TEST(TrainedModelConstructionTest, RejectsFlagCountMismatch) {
    auto snapshot = ClusterModelSnapshot(SnapshotID(1), {FeatureVector(1)}, {});
    std::vector<MedicationRecord> records = {Analgesic(1)};

    EXPECT_THROW(TrainedModel(EncoderTables{}, FeatureScaler{}, VectorAssembler::Config{},
                              snapshot, records, {true, false}, VectorTable{}, TrainingReport{}),
                 std::invalid_argument);
}

} // namespace
} // namespace medeq

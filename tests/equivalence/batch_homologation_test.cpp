// File: tests/equivalence/batch_homologation_test.cpp
#include "equivalence/batch_homologation.hpp"
#include "medication_test_fixtures.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace medeq {
namespace {

using namespace fixtures;

class BatchHomologationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto records = MakeRegistry();
        records[9].quantity = -5.0;  // A-10, excluded

        EquivalenceEngine engine(SmallEngineConfig());
        resolver_ = std::make_unique<EquivalenceResolver>(engine.Train(records));
    }

    std::unique_ptr<EquivalenceResolver> resolver_;
};

TEST(BatchHomologationInputTest, NormalizeTrimsAndDeduplicates) {
    size_t skipped = 0;
    auto normalized = BatchHomologation::NormalizeInput(
        {" A-01 ", "", "B-02", "A-01", "\t", "C-03\r"}, &skipped);

    ASSERT_EQ(3u, normalized.size());
    EXPECT_EQ("A-01", normalized[0]);
    EXPECT_EQ("B-02", normalized[1]);
    EXPECT_EQ("C-03", normalized[2]);
    EXPECT_EQ(3u, skipped);
}

TEST(BatchHomologationInputTest, EscapeCsvField) {
    EXPECT_EQ("plain", EscapeCsvField("plain"));
    EXPECT_EQ("\"a,b\"", EscapeCsvField("a,b"));
    EXPECT_EQ("\"say \"\"hi\"\"\"", EscapeCsvField("say \"hi\""));
}

TEST_F(BatchHomologationTest, RowsFollowInputOrder) {
    BatchHomologation batch(*resolver_);
    auto summary = batch.Run({"C-02", "Z-00", "A-01", "A-10", "B-05"}, QueryOptions::TopK(3));

    ASSERT_EQ(5u, summary.rows.size());
    EXPECT_EQ("C-02", summary.rows[0].query);
    EXPECT_EQ("Z-00", summary.rows[1].query);
    EXPECT_EQ("A-01", summary.rows[2].query);
    EXPECT_EQ("A-10", summary.rows[3].query);
    EXPECT_EQ("B-05", summary.rows[4].query);

    EXPECT_EQ(HomologationStatus::FOUND, summary.rows[0].status);
    EXPECT_EQ(HomologationStatus::UNRESOLVABLE, summary.rows[1].status);
    EXPECT_FALSE(summary.rows[1].message.empty());
    EXPECT_FALSE(summary.rows[1].cluster_label.has_value());
    EXPECT_EQ(HomologationStatus::UNRESOLVABLE, summary.rows[3].status);

    EXPECT_EQ(3u, summary.found);
    EXPECT_EQ(2u, summary.unresolvable);
    EXPECT_EQ(0u, summary.no_substitute);
    EXPECT_EQ(0u, summary.skipped);

    for (const auto& row : summary.rows) {
        EXPECT_LE(row.substitutes.size(), 3u);
    }
}

TEST_F(BatchHomologationTest, FilteredOutRowHasNoSubstitute) {
    QueryOptions options;
    options.max_distance = 0.0;
    BatchHomologation batch(*resolver_);

    auto summary = batch.Run({"B-01"}, options);
    ASSERT_EQ(1u, summary.rows.size());
    EXPECT_EQ(HomologationStatus::NO_SUBSTITUTE, summary.rows[0].status);
    EXPECT_TRUE(summary.rows[0].cluster_label.has_value());
    EXPECT_EQ(1u, summary.no_substitute);
}

TEST_F(BatchHomologationTest, CsvHasOneLinePerSubstitute) {
    BatchHomologation batch(*resolver_);
    auto summary = batch.Run({"B-01", "Z-00"}, QueryOptions::TopK(2));
    std::string csv = summary.ToCsv();

    std::istringstream lines(csv);
    std::string line;
    std::vector<std::string> rows;
    while (std::getline(lines, line)) {
        rows.push_back(line);
    }

    ASSERT_EQ(4u, rows.size());
    EXPECT_EQ("query,status,cluster,substitute,distance,similarity", rows[0]);
    EXPECT_EQ(0u, rows[1].find("B-01,FOUND,"));
    EXPECT_EQ(0u, rows[2].find("B-01,FOUND,"));
    EXPECT_EQ("Z-00,UNRESOLVABLE,,,,", rows[3]);
}

TEST_F(BatchHomologationTest, EmptyInputGivesEmptySummary) {
    BatchHomologation batch(*resolver_);
    auto summary = batch.Run({});
    EXPECT_TRUE(summary.rows.empty());
    EXPECT_EQ(0u, summary.found + summary.no_substitute + summary.unresolvable);
}

TEST(HomologationStatusTest, Names) {
    EXPECT_STREQ("FOUND", ToString(HomologationStatus::FOUND));
    EXPECT_STREQ("NO_SUBSTITUTE", ToString(HomologationStatus::NO_SUBSTITUTE));
    EXPECT_STREQ("UNRESOLVABLE", ToString(HomologationStatus::UNRESOLVABLE));
}

} // namespace
} // namespace medeq

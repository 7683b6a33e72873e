// File: tests/cli/medeq_cli_test.cpp
//
// Test suite for the MedEq command-line front end

#include "cli/medeq_cli.hpp"
#include "medication_test_fixtures.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace medeq {
namespace {

using namespace fixtures;

class MedEqCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string stamp = std::to_string(
            std::chrono::system_clock::now().time_since_epoch().count());
        test_db_ = "/tmp/test_medeq_cli_" + stamp + ".db";
        test_input_ = "/tmp/test_medeq_cli_" + stamp + ".txt";
        test_output_ = "/tmp/test_medeq_cli_" + stamp + ".csv";

        cli_ = MakeCli();
        cli_->InitializeClean();
        cli_->GetStore().StoreRecords(MakeRegistry());
    }

    void TearDown() override {
        cli_.reset();
        std::filesystem::remove(test_db_);
        std::filesystem::remove(test_db_ + "-wal");
        std::filesystem::remove(test_db_ + "-shm");
        std::filesystem::remove(test_input_);
        std::filesystem::remove(test_output_);
    }

    std::unique_ptr<MedEqCli> MakeCli() const {
        auto config = MedEqConfig::Default();
        config.interface.colors_enabled = false;
        config.clustering.k = 3;
        config.clustering.seed = 7;
        config.clustering.n_restarts = 5;
        config.query.top_k = 4;

        auto cli = std::make_unique<MedEqCli>(config);
        cli->SetDatabasePath(test_db_);
        return cli;
    }

    static std::vector<std::string> ReadLines(const std::string& path) {
        std::ifstream file(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::unique_ptr<MedEqCli> cli_;
    std::string test_db_;
    std::string test_input_;
    std::string test_output_;
};

// ============================================================================
// Command Parsing Tests
// ============================================================================

TEST_F(MedEqCliTest, StartsWithoutModel) {
    EXPECT_FALSE(cli_->HasModel());
    EXPECT_FALSE(cli_->IsVerboseEnabled());
    EXPECT_EQ(0u, cli_->GetCommandsProcessed());
    EXPECT_EQ(test_db_, cli_->GetDatabasePath());
}

TEST_F(MedEqCliTest, EmptyCommandDoesNothing) {
    EXPECT_TRUE(cli_->ProcessCommand("   "));
    EXPECT_EQ(0u, cli_->GetCommandsProcessed());
}

TEST_F(MedEqCliTest, HelpAndStatsSucceedWithoutModel) {
    EXPECT_TRUE(cli_->ProcessCommand("help"));
    EXPECT_TRUE(cli_->ProcessCommand("stats"));
    EXPECT_EQ(2u, cli_->GetCommandsProcessed());
}

TEST_F(MedEqCliTest, LeadingSlashIsAccepted) {
    EXPECT_TRUE(cli_->ProcessCommand("/help"));
}

TEST_F(MedEqCliTest, UnknownCommandFails) {
    EXPECT_FALSE(cli_->ProcessCommand("prescribe A-01"));
    EXPECT_EQ(1u, cli_->GetCommandsProcessed());
}

TEST_F(MedEqCliTest, VerboseTogglesAndKeepsModel) {
    ASSERT_TRUE(cli_->ProcessCommand("train"));
    auto model = cli_->GetEngine().GetModel();

    cli_->ProcessCommand("verbose");
    EXPECT_TRUE(cli_->IsVerboseEnabled());
    EXPECT_EQ(model, cli_->GetEngine().GetModel());

    cli_->ProcessCommand("verbose");
    EXPECT_FALSE(cli_->IsVerboseEnabled());
}

TEST_F(MedEqCliTest, ExitStopsRunning) {
    EXPECT_TRUE(cli_->IsRunning());
    cli_->ProcessCommand("quit");
    EXPECT_FALSE(cli_->IsRunning());
}

TEST_F(MedEqCliTest, CommandBeforeInitializeOpensDatabase) {
    auto fresh = MakeCli();
    EXPECT_TRUE(fresh->ProcessCommand("models"));
}

// ============================================================================
// Training and Model Tests
// ============================================================================

TEST_F(MedEqCliTest, TrainPublishesAndStoresModel) {
    ASSERT_TRUE(cli_->ProcessCommand("train"));
    EXPECT_TRUE(cli_->HasModel());

    auto models = cli_->GetStore().ListModels();
    ASSERT_EQ(1u, models.size());
    EXPECT_EQ(cli_->GetEngine().GetModel()->GetID(), models[0].snapshot_id);
    EXPECT_EQ(3u, models[0].cluster_count);

    EXPECT_TRUE(cli_->ProcessCommand("models"));
    EXPECT_TRUE(cli_->ProcessCommand("stats"));
}

TEST_F(MedEqCliTest, TrainWithEmptyRegistryFails) {
    cli_->GetStore().ClearRecords();
    EXPECT_FALSE(cli_->ProcessCommand("train"));
    EXPECT_FALSE(cli_->HasModel());
}

TEST_F(MedEqCliTest, TrainWithTooFewRecordsFails) {
    cli_->GetStore().ClearRecords();
    cli_->GetStore().StoreRecords({Analgesic(1), Inhaler(1)});
    EXPECT_FALSE(cli_->ProcessCommand("train"));
    EXPECT_FALSE(cli_->HasModel());
}

TEST_F(MedEqCliTest, InitializeLoadsLatestStoredModel) {
    ASSERT_TRUE(cli_->ProcessCommand("train"));
    SnapshotID trained = cli_->GetEngine().GetModel()->GetID();
    cli_.reset();

    cli_ = MakeCli();
    cli_->Initialize();
    ASSERT_TRUE(cli_->HasModel());
    EXPECT_EQ(trained, cli_->GetEngine().GetModel()->GetID());
}

TEST_F(MedEqCliTest, LoadSelectsStoredSnapshot) {
    ASSERT_TRUE(cli_->ProcessCommand("train"));
    SnapshotID first = cli_->GetEngine().GetModel()->GetID();
    ASSERT_TRUE(cli_->ProcessCommand("train"));
    EXPECT_NE(first, cli_->GetEngine().GetModel()->GetID());

    EXPECT_TRUE(cli_->ProcessCommand("load " + std::to_string(first.value())));
    EXPECT_EQ(first, cli_->GetEngine().GetModel()->GetID());

    EXPECT_FALSE(cli_->ProcessCommand("load 999999999"));
    EXPECT_EQ(first, cli_->GetEngine().GetModel()->GetID());
}

TEST_F(MedEqCliTest, LoadWithoutStoredModelFails) {
    EXPECT_FALSE(cli_->ProcessCommand("load"));
}

// ============================================================================
// Query Tests
// ============================================================================

TEST_F(MedEqCliTest, QueryBeforeTrainingFails) {
    EXPECT_FALSE(cli_->ProcessCommand("query A-01"));
}

TEST_F(MedEqCliTest, QueryUsesConfiguredTopK) {
    ASSERT_TRUE(cli_->ProcessCommand("train"));
    ASSERT_TRUE(cli_->ProcessCommand("query B-03"));

    const auto& results = cli_->GetLastResults();
    ASSERT_EQ(4u, results.size());
    for (const auto& candidate : results) {
        EXPECT_EQ('B', GroupOf(candidate.cum));
    }
}

TEST_F(MedEqCliTest, QueryTopKArgumentOverrides) {
    ASSERT_TRUE(cli_->ProcessCommand("train"));
    ASSERT_TRUE(cli_->ProcessCommand("query A-05 2"));
    EXPECT_EQ(2u, cli_->GetLastResults().size());
}

TEST_F(MedEqCliTest, QueryUnknownCumFails) {
    ASSERT_TRUE(cli_->ProcessCommand("train"));
    EXPECT_FALSE(cli_->ProcessCommand("query Z-99"));
    EXPECT_FALSE(cli_->ProcessCommand("query"));
}

TEST_F(MedEqCliTest, NegativeNumericArgumentsFail) {
    ASSERT_TRUE(cli_->ProcessCommand("train"));
    EXPECT_FALSE(cli_->ProcessCommand("query A-01 -2"));
    EXPECT_FALSE(cli_->ProcessCommand("cluster -1"));
    EXPECT_FALSE(cli_->ProcessCommand("load -5"));
}

TEST_F(MedEqCliTest, TopKCommand) {
    EXPECT_TRUE(cli_->ProcessCommand("topk 6"));
    ASSERT_TRUE(cli_->GetQueryOptions().top_k.has_value());
    EXPECT_EQ(6u, *cli_->GetQueryOptions().top_k);

    EXPECT_FALSE(cli_->ProcessCommand("topk 0"));
    EXPECT_FALSE(cli_->ProcessCommand("topk"));
    EXPECT_FALSE(cli_->ProcessCommand("topk lots"));
    EXPECT_FALSE(cli_->ProcessCommand("topk -1"));
    EXPECT_FALSE(cli_->ProcessCommand("topk 3rd"));
    EXPECT_EQ(6u, *cli_->GetQueryOptions().top_k);

    ASSERT_TRUE(cli_->ProcessCommand("train"));
    ASSERT_TRUE(cli_->ProcessCommand("query A-01"));
    EXPECT_EQ(6u, cli_->GetLastResults().size());
}

TEST_F(MedEqCliTest, FiltersCommand) {
    EXPECT_TRUE(cli_->ProcessCommand("filters atc_exact_match, registration_active"));
    const auto& filters = cli_->GetQueryOptions().filters;
    ASSERT_TRUE(filters.has_value());
    EXPECT_EQ(2u, filters->size());
    EXPECT_EQ(1u, filters->count(CandidateFilter::ATC_EXACT_MATCH));
    EXPECT_EQ(1u, filters->count(CandidateFilter::REGISTRATION_ACTIVE));

    EXPECT_TRUE(cli_->ProcessCommand("filters"));

    EXPECT_FALSE(cli_->ProcessCommand("filters cheapest"));
    EXPECT_EQ(2u, cli_->GetQueryOptions().filters->size());

    EXPECT_TRUE(cli_->ProcessCommand("filters none"));
    ASSERT_TRUE(cli_->GetQueryOptions().filters.has_value());
    EXPECT_TRUE(cli_->GetQueryOptions().filters->empty());

    EXPECT_TRUE(cli_->ProcessCommand("filters default"));
    EXPECT_FALSE(cli_->GetQueryOptions().filters.has_value());
}

TEST_F(MedEqCliTest, CoverageFilterAppliesToQueries) {
    auto records = MakeRegistry();
    records[1].covered_by_benefit_plan = false;  // A-02
    cli_->GetStore().StoreRecords(records);

    ASSERT_TRUE(cli_->ProcessCommand("train"));
    ASSERT_TRUE(cli_->ProcessCommand("filters coverage_in_pbs"));
    ASSERT_TRUE(cli_->ProcessCommand("query A-01 20"));

    for (const auto& candidate : cli_->GetLastResults()) {
        EXPECT_NE("A-02", candidate.cum);
    }
    EXPECT_EQ(8u, cli_->GetLastResults().size());
}

// ============================================================================
// Inspection Tests
// ============================================================================

TEST_F(MedEqCliTest, RecordCommand) {
    EXPECT_TRUE(cli_->ProcessCommand("record C-02"));   // registry only
    EXPECT_FALSE(cli_->ProcessCommand("record Z-99"));

    ASSERT_TRUE(cli_->ProcessCommand("train"));
    EXPECT_TRUE(cli_->ProcessCommand("record C-02"));
    EXPECT_FALSE(cli_->ProcessCommand("record"));
}

TEST_F(MedEqCliTest, ClusterCommand) {
    EXPECT_FALSE(cli_->ProcessCommand("cluster 0"));

    ASSERT_TRUE(cli_->ProcessCommand("train"));
    EXPECT_TRUE(cli_->ProcessCommand("cluster 0"));
    EXPECT_TRUE(cli_->ProcessCommand("cluster 2"));
    EXPECT_FALSE(cli_->ProcessCommand("cluster 3"));
    EXPECT_FALSE(cli_->ProcessCommand("cluster"));
}

TEST_F(MedEqCliTest, TableCommand) {
    ASSERT_TRUE(cli_->ProcessCommand("train"));
    EXPECT_TRUE(cli_->ProcessCommand("table"));
    EXPECT_TRUE(cli_->ProcessCommand("table atc"));
    EXPECT_TRUE(cli_->ProcessCommand("table route"));
    EXPECT_FALSE(cli_->ProcessCommand("table colour"));
}

TEST_F(MedEqCliTest, ConfigCommandWritesFile) {
    EXPECT_TRUE(cli_->ProcessCommand("config"));
    ASSERT_TRUE(cli_->ProcessCommand("config " + test_output_));

    auto loaded = MedEqConfig::LoadFromFile(test_output_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(3u, loaded->clustering.k);
    EXPECT_EQ(4u, loaded->query.top_k);
}

// ============================================================================
// Batch and Export Tests
// ============================================================================

TEST_F(MedEqCliTest, BatchFromFile) {
    {
        std::ofstream input(test_input_);
        input << "# requested CUMs\n";
        input << "A-01\n";
        input << "B-02,extra column\n";
        input << "\n";
        input << "Z-99\n";
        input << "A-01\n";
    }

    ASSERT_TRUE(cli_->ProcessCommand("train"));
    ASSERT_TRUE(cli_->ProcessCommand("batch " + test_input_ + " " + test_output_));

    const auto& batch = cli_->GetLastBatch();
    ASSERT_TRUE(batch.has_value());
    ASSERT_EQ(3u, batch->rows.size());
    EXPECT_EQ("A-01", batch->rows[0].query);
    EXPECT_EQ("B-02", batch->rows[1].query);
    EXPECT_EQ("Z-99", batch->rows[2].query);
    EXPECT_EQ(2u, batch->found);
    EXPECT_EQ(1u, batch->unresolvable);
    EXPECT_EQ(2u, batch->skipped);

    auto lines = ReadLines(test_output_);
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ("query,status,cluster,substitute,distance,similarity", lines[0]);
    // Four substitutes for each found query plus one unresolvable row
    EXPECT_EQ(1u + 4u + 4u + 1u, lines.size());
}

TEST_F(MedEqCliTest, BatchWithMissingFileFails) {
    ASSERT_TRUE(cli_->ProcessCommand("train"));
    EXPECT_FALSE(cli_->ProcessCommand("batch /tmp/no_such_medeq_batch.txt"));
    EXPECT_FALSE(cli_->ProcessCommand("batch"));
}

TEST_F(MedEqCliTest, ExportWritesOneLinePerRecord) {
    auto records = MakeRegistry();
    records[0].medical_sample = true;  // A-01, placed by prediction
    records[1].quantity = 0.0;         // A-02, excluded
    cli_->GetStore().StoreRecords(records);

    EXPECT_FALSE(cli_->ProcessCommand("export " + test_output_));

    ASSERT_TRUE(cli_->ProcessCommand("train"));
    ASSERT_TRUE(cli_->ProcessCommand("export " + test_output_));

    auto lines = ReadLines(test_output_);
    ASSERT_EQ(23u, lines.size());
    EXPECT_EQ(0u, lines[0].find("cum,cluster,placement"));

    size_t trained = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.find("A-01,") == 0) {
            EXPECT_NE(std::string::npos, line.find(",predicted"));
        } else if (line.find("A-02,") == 0) {
            EXPECT_EQ(0u, line.find("A-02,,excluded"));
        } else if (line.find(",trained") != std::string::npos) {
            ++trained;
        }
    }
    EXPECT_EQ(20u, trained);
}

} // namespace
} // namespace medeq

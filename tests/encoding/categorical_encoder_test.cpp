// File: tests/encoding/categorical_encoder_test.cpp
#include "encoding/categorical_encoder.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace medeq {
namespace {

std::vector<std::string> RouteColumn() {
    std::vector<std::string> values;
    for (int i = 0; i < 7; ++i) values.push_back("ORAL");
    for (int i = 0; i < 3; ++i) values.push_back("TOPICA");
    for (int i = 0; i < 3; ++i) values.push_back("INHALADA");
    return values;
}

CategoricalEncoder EncoderWithDivisor(double divisor) {
    CategoricalEncoder::Config config;
    config.count_divisor = divisor;
    return CategoricalEncoder(config);
}

// ============================================================================
// Frequency Table Tests
// ============================================================================

TEST(CategoricalFrequencyTableTest, RanksFollowDescendingCount) {
    CategoricalEncoder encoder;
    auto table = encoder.Fit("route", RouteColumn());

    ASSERT_EQ(3u, table.GetDistinctCount());
    EXPECT_EQ(1u, table.Find("ORAL")->rank);
    EXPECT_EQ(2u, table.Find("TOPICA")->rank);
    EXPECT_EQ(2u, table.Find("INHALADA")->rank);
    EXPECT_EQ(2u, table.GetMaxRank());
    EXPECT_EQ(13u, table.GetTotalCount());
}

TEST(CategoricalFrequencyTableTest, TiesAreOrderedLexicographically) {
    CategoricalEncoder encoder;
    auto table = encoder.Fit("route", RouteColumn());

    const auto& entries = table.GetEntries();
    ASSERT_EQ(3u, entries.size());
    EXPECT_EQ("ORAL", entries[0].value);
    EXPECT_EQ("INHALADA", entries[1].value);
    EXPECT_EQ("TOPICA", entries[2].value);
}

TEST(CategoricalFrequencyTableTest, RankSkipsAfterTie) {
    CategoricalEncoder encoder;
    auto table = encoder.Fit("form", {"A", "A", "B", "C", "D", "D", "D"});

    EXPECT_EQ(1u, table.Find("D")->rank);
    EXPECT_EQ(2u, table.Find("A")->rank);
    EXPECT_EQ(3u, table.Find("B")->rank);
    EXPECT_EQ(3u, table.Find("C")->rank);
}

TEST(CategoricalFrequencyTableTest, FromCountsRejectsBadInput) {
    std::unordered_map<std::string, CategoricalFrequencyTable::Counts> counts;
    counts["X"] = {2, 1};

    EXPECT_THROW(CategoricalFrequencyTable::FromCounts("a", counts, 1, 0.0),
                 std::invalid_argument);

    counts["Y"] = {0, 0};
    EXPECT_THROW(CategoricalFrequencyTable::FromCounts("a", counts, 1, 100.0),
                 std::invalid_argument);
}

TEST(CategoricalFrequencyTableTest, EmptyColumnGivesEmptyTable) {
    CategoricalEncoder encoder;
    auto table = encoder.Fit("atc", std::vector<std::string>{});

    EXPECT_TRUE(table.IsEmpty());
    EXPECT_EQ(0u, table.GetMaxRank());
    EXPECT_DOUBLE_EQ(1.0, table.SentinelScore());
}

// ============================================================================
// Encoding Tests
// ============================================================================

TEST(CategoricalEncoderTest, ScoreIsRankPlusScaledCount) {
    auto encoder = EncoderWithDivisor(100.0);
    auto table = encoder.Fit("route", RouteColumn());

    EXPECT_NEAR(1.07, encoder.EncodeScore("ORAL", table), 1e-12);
    EXPECT_NEAR(2.03, encoder.EncodeScore("TOPICA", table), 1e-12);
    EXPECT_NEAR(2.03, encoder.EncodeScore("INHALADA", table), 1e-12);
}

TEST(CategoricalEncoderTest, DefaultDivisorKeepsRanksApart) {
    CategoricalEncoder encoder;
    auto table = encoder.Fit("route", RouteColumn());

    EXPECT_NEAR(1.0007, encoder.EncodeScore("ORAL", table), 1e-12);
    EXPECT_NEAR(2.0003, encoder.EncodeScore("TOPICA", table), 1e-12);
}

TEST(CategoricalEncoderTest, UnknownValueGetsSentinel) {
    CategoricalEncoder encoder;
    auto table = encoder.Fit("route", RouteColumn());

    EncodedFeature feature;
    EXPECT_NO_THROW(feature = encoder.Encode("NASAL", table));
    EXPECT_FALSE(feature.is_known_category);
    EXPECT_DOUBLE_EQ(3.0, feature.score);
    EXPECT_DOUBLE_EQ(0.0, feature.prob_among_valid);
    EXPECT_FALSE(feature.seen_among_valid);
}

TEST(CategoricalEncoderTest, ProbabilityAmongValidUsesEligibleRecordsOnly) {
    CategoricalEncoder encoder;
    std::vector<std::string> values = {"ORAL", "ORAL", "ORAL", "TOPICA", "TOPICA"};
    std::vector<bool> eligible = {true, true, false, false, false};

    auto table = encoder.Fit("route", values, eligible);
    EXPECT_EQ(2u, table.GetTotalEligible());

    auto oral = encoder.Encode("ORAL", table);
    EXPECT_TRUE(oral.is_known_category);
    EXPECT_TRUE(oral.seen_among_valid);
    EXPECT_DOUBLE_EQ(1.0, oral.prob_among_valid);

    auto topical = encoder.Encode("TOPICA", table);
    EXPECT_TRUE(topical.is_known_category);
    EXPECT_FALSE(topical.seen_among_valid);
    EXPECT_DOUBLE_EQ(0.0, topical.prob_among_valid);
}

TEST(CategoricalEncoderTest, NoEligibleRecordsGivesZeroProbability) {
    CategoricalEncoder encoder;
    auto table = encoder.Fit("route", {"ORAL", "ORAL"}, {false, false});

    auto feature = encoder.Encode("ORAL", table);
    EXPECT_TRUE(feature.is_known_category);
    EXPECT_DOUBLE_EQ(0.0, feature.prob_among_valid);
}

TEST(CategoricalEncoderTest, FitRejectsLengthMismatch) {
    CategoricalEncoder encoder;
    EXPECT_THROW(encoder.Fit("route", {"ORAL", "ORAL"}, {true}), std::invalid_argument);
}

TEST(CategoricalEncoderTest, RescalesDivisorWhenCountReachesIt) {
    auto encoder = EncoderWithDivisor(10.0);
    std::vector<std::string> values(25, "ORAL");
    values.push_back("TOPICA");

    auto table = encoder.Fit("route", values);
    EXPECT_DOUBLE_EQ(100.0, table.GetCountDivisor());
    EXPECT_NEAR(1.25, encoder.EncodeScore("ORAL", table), 1e-12);
    EXPECT_LT(encoder.EncodeScore("ORAL", table), encoder.EncodeScore("TOPICA", table));
}

TEST(CategoricalEncoderTest, RejectsOverflowWithoutRescale) {
    CategoricalEncoder::Config config;
    config.count_divisor = 10.0;
    config.auto_rescale = false;
    CategoricalEncoder encoder(config);

    std::vector<std::string> values(10, "ORAL");
    EXPECT_THROW(encoder.Fit("route", values), std::invalid_argument);
}

TEST(CategoricalEncoderTest, RejectsNonPositiveDivisor) {
    CategoricalEncoder::Config config;
    config.count_divisor = 0.0;
    EXPECT_THROW(CategoricalEncoder{config}, std::invalid_argument);
}

TEST(CategoricalEncoderTest, ScoresNeverReorderAcrossRanks) {
    CategoricalEncoder encoder;
    std::vector<std::string> values;
    for (int v = 0; v < 6; ++v) {
        for (int i = 0; i <= v * 3; ++i) {
            values.push_back("V" + std::to_string(v));
        }
    }
    auto table = encoder.Fit("atc", values);

    const auto& entries = table.GetEntries();
    for (size_t i = 1; i < entries.size(); ++i) {
        EXPECT_LE(entries[i - 1].rank, entries[i].rank);
        EXPECT_LT(table.Score(entries[i - 1]) - entries[i - 1].rank, 1.0);
        if (entries[i - 1].rank < entries[i].rank) {
            EXPECT_LT(table.Score(entries[i - 1]), table.Score(entries[i]));
        }
    }
}

} // namespace
} // namespace medeq

/**
 * @file test_scores.cpp
 * @brief Composite trust score
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <scoring/polyp_scores.hpp>
#include <cmath>

using namespace Reef;

TEST(ScoresTest, DefaultWeights) {
    ScoreWeights w;
    EXPECT_DOUBLE_EQ(w.zk_validity, 0.30);
    EXPECT_DOUBLE_EQ(w.semantic_quality, 0.25);
    EXPECT_DOUBLE_EQ(w.novelty, 0.15);
    EXPECT_DOUBLE_EQ(w.source_credibility, 0.15);
    EXPECT_DOUBLE_EQ(w.embedding_quality, 0.15);
    EXPECT_NEAR(w.sum(), 1.0, 1e-12);
    EXPECT_NO_THROW(w.validate());
}

TEST(ScoresTest, WeightedScoreIsFixedDotProduct) {
    const double samples[][5] = {
        {1.0, 1.0, 1.0, 1.0, 1.0},
        {0.0, 0.0, 0.0, 0.0, 0.0},
        {1.0, 0.8, 0.2, 0.5, 0.9},
        {0.0, 0.33, 0.66, 0.99, 0.01},
        {0.5, 0.5, 0.5, 0.5, 0.5},
    };
    for (const auto& s : samples) {
        PolypScores scores = PolypScores::make(s[0], s[1], s[2], s[3], s[4]);
        double expected = 0.30 * s[0] + 0.25 * s[1] + 0.15 * s[2] + 0.15 * s[3] + 0.15 * s[4];
        EXPECT_NEAR(scores.weighted_score(), expected, 1e-12);
        // Pure: same input, same output
        EXPECT_EQ(scores.weighted_score(), scores.weighted_score());
    }
}

TEST(ScoresTest, EachDimensionClampedIndependently) {
    PolypScores s = PolypScores::make(1.5, -0.2, 0.4, 7.0, -1.0);
    EXPECT_DOUBLE_EQ(s.zk_validity, 1.0);
    EXPECT_DOUBLE_EQ(s.semantic_quality, 0.0);
    EXPECT_DOUBLE_EQ(s.novelty, 0.4);
    EXPECT_DOUBLE_EQ(s.source_credibility, 1.0);
    EXPECT_DOUBLE_EQ(s.embedding_quality, 0.0);
}

TEST(ScoresTest, MissingDimensionIsPolicyError) {
    PolypScores s = PolypScores::make(1.0, 1.0, 1.0, 1.0, 1.0);
    s.novelty = PolypScores::kUnset;

    EXPECT_FALSE(s.complete());
    EXPECT_THROW(s.weighted_score(), PolicyError);
    EXPECT_THROW(PolypScores{}.weighted_score(), PolicyError);
}

TEST(ScoresTest, CustomWeightsAreNotRenormalized) {
    ScoreWeights w;
    w.zk_validity = 0.5;
    w.semantic_quality = 0.5;
    w.novelty = 0.0;
    w.source_credibility = 0.0;
    w.embedding_quality = 0.0;
    ASSERT_NO_THROW(w.validate());

    PolypScores s = PolypScores::make(1.0, 0.0, 1.0, 1.0, 1.0);
    EXPECT_DOUBLE_EQ(s.weighted_score(w), 0.5);
}

TEST(ScoresTest, WeightsMustSumToOne) {
    ScoreWeights w;
    w.zk_validity = 0.31;
    EXPECT_THROW(w.validate(), ConfigError);

    ScoreWeights negative;
    negative.zk_validity = -0.1;
    negative.semantic_quality = 0.65;
    EXPECT_THROW(negative.validate(), ConfigError);
}

TEST(ScoresTest, ParseWeights) {
    ScoreWeights w = ScoreWeights::parse("0.2,0.2,0.2,0.2,0.2");
    EXPECT_DOUBLE_EQ(w.novelty, 0.2);

    EXPECT_THROW(ScoreWeights::parse("0.2,0.2,0.2,0.2"), ConfigError);
    EXPECT_THROW(ScoreWeights::parse("0.2,0.2,abc,0.2,0.2"), ConfigError);
    EXPECT_THROW(ScoreWeights::parse("0.5,0.5,0.5,0.5,0.5"), ConfigError);
}

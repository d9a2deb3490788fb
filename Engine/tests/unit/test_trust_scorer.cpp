/**
 * @file test_trust_scorer.cpp
 * @brief Score dimensions and their heuristics
 */

#include <gtest/gtest.h>
#include <scoring/trust_scorer.hpp>
#include "test_support.hpp"

using namespace Reef;
using namespace ReefTest;

class TrustScorerTest : public ::testing::Test {
protected:
    TestNode node;
    ReefConfig config;
    VectorIndex index;
    ReputationRegistry reputation;
    TrustScorer scorer{index, node.verifier, reputation, config};

    Polyp polyp(const std::string& text) {
        auto [subject, proof] = node.make(text);
        Polyp p;
        p.id = PolypId::generate();
        p.subject = std::move(subject);
        p.proof = std::move(proof);
        return p;
    }
};

TEST_F(TrustScorerTest, ValidProofScoresOne) {
    EXPECT_DOUBLE_EQ(scorer.zk_validity(polyp("A verified statement about reefs")), 1.0);
}

TEST_F(TrustScorerTest, ProofForOtherContentScoresZero) {
    Polyp p = polyp("first");
    p.proof = node.make("second").second;
    EXPECT_DOUBLE_EQ(scorer.zk_validity(p), 0.0);
}

TEST_F(TrustScorerTest, ForgedProofScoresZero) {
    Polyp p = polyp("forged");
    p.proof.proof_bytes.assign(32, 0);
    EXPECT_DOUBLE_EQ(scorer.zk_validity(p), 0.0);
}

TEST_F(TrustScorerTest, VerifierOutagePropagates) {
    FlakyVerifier flaky(node.verifier);
    flaky.set_available(false);
    TrustScorer offline(index, flaky, reputation, config);
    EXPECT_THROW(offline.zk_validity(polyp("offline")), VerifierUnavailableError);
    EXPECT_THROW(offline.score(polyp("offline"), 0), VerifierUnavailableError);
}

TEST_F(TrustScorerTest, NoveltyAgainstHardenedOnly) {
    Polyp p = polyp("Sea turtles navigate using the magnetic field");
    EXPECT_DOUBLE_EQ(scorer.novelty(p.id, p.subject.vector), 1.0);

    // An Approved duplicate does not count against novelty
    PolypId approved = PolypId::generate();
    index.upsert(approved, p.subject.vector, IndexTier::Approved);
    EXPECT_DOUBLE_EQ(scorer.novelty(p.id, p.subject.vector), 1.0);

    PolypId hardened = PolypId::generate();
    index.upsert(hardened, p.subject.vector, IndexTier::Hardened);
    EXPECT_NEAR(scorer.novelty(p.id, p.subject.vector), 0.0, 1e-5);
}

TEST_F(TrustScorerTest, NoveltyIgnoresSelf) {
    Polyp p = polyp("self similarity");
    index.upsert(p.id, p.subject.vector, IndexTier::Hardened);
    EXPECT_DOUBLE_EQ(scorer.novelty(p.id, p.subject.vector), 1.0);
}

TEST_F(TrustScorerTest, NoveltyIsPerModelSpace) {
    EmbeddingModelId m = test_model("m", 8);
    index.upsert(PolypId::generate(), axis_vector(m, 0), IndexTier::Hardened);

    EXPECT_NEAR(scorer.novelty(PolypId::generate(), axis_vector(m, 0)), 0.0, 1e-5);
    EXPECT_NEAR(scorer.novelty(PolypId::generate(), axis_vector(m, 1)), 1.0, 1e-5);
    EXPECT_DOUBLE_EQ(scorer.novelty(PolypId::generate(), axis_vector(test_model("n", 8), 0)), 1.0);
}

TEST_F(TrustScorerTest, SourceCredibilityDefaultsAndDecays) {
    EXPECT_DOUBLE_EQ(scorer.source_credibility("did:reef:unknown", 0), 0.5);

    reputation.record("did:reef:known", 0.9, 1);
    EXPECT_DOUBLE_EQ(scorer.source_credibility("did:reef:known", 5), 0.9);

    ReputationRegistry decaying(DecayPolicy::exponential(2.0));
    decaying.record("did:reef:known", 0.8, 0);
    TrustScorer faded(index, node.verifier, decaying, config);
    EXPECT_NEAR(faded.source_credibility("did:reef:known", 4), 0.2, 1e-12);
}

TEST_F(TrustScorerTest, FullScoreAndComposite) {
    reputation.record("did:reef:test", 1.0, 0);
    Polyp p = polyp("Light travels through vacuum at a constant speed for every observer");

    PolypScores s = scorer.score(p, 0);
    ASSERT_TRUE(s.complete());
    EXPECT_DOUBLE_EQ(s.zk_validity, 1.0);
    EXPECT_GT(s.semantic_quality, 0.9);
    EXPECT_DOUBLE_EQ(s.novelty, 1.0);
    EXPECT_DOUBLE_EQ(s.source_credibility, 1.0);
    EXPECT_DOUBLE_EQ(s.embedding_quality, 1.0);
    EXPECT_NEAR(scorer.composite(s), s.weighted_score(), 1e-12);
}

TEST_F(TrustScorerTest, InvalidWeightsRejected) {
    ReefConfig bad;
    bad.weights.zk_validity = 0.9;
    EXPECT_THROW(TrustScorer(index, node.verifier, reputation, bad), ConfigError);
}

// =============================================================================
//  Heuristics
// =============================================================================

TEST(LexicalQualityTest, LengthAndDiversity) {
    LexicalQualityHeuristic h(8);
    Payload p;

    p.content = "";
    EXPECT_DOUBLE_EQ(h.evaluate(p), 0.0);

    p.content = "one two three four five six seven eight";
    EXPECT_DOUBLE_EQ(h.evaluate(p), 1.0);

    p.content = "reef reef reef reef";
    // length 0.5, diversity 0.25
    EXPECT_DOUBLE_EQ(h.evaluate(p), 0.5 * (0.5 + 0.5 * 0.25));
}

TEST(CentroidQualityTest, ReferenceCosine) {
    EmbeddingModelId m = test_model("centroid", 4);
    CentroidQualityHeuristic h;

    EXPECT_DOUBLE_EQ(h.evaluate(axis_vector(m, 0)), 1.0);

    h.set_reference(m, {2.0f, 0.0f, 0.0f, 0.0f});
    EXPECT_NEAR(h.evaluate(axis_vector(m, 0)), 1.0, 1e-6);
    EXPECT_NEAR(h.evaluate(axis_vector(m, 1)), 0.0, 1e-6);
    EXPECT_NEAR(h.evaluate(axis_vector(m, 0, 1.0f)), 1.0 / std::sqrt(2.0), 1e-6);

    VectorEmbedding opposite = axis_vector(m, 0);
    opposite.values[0] = -1.0f;
    EXPECT_DOUBLE_EQ(h.evaluate(opposite), 0.0);

    EXPECT_THROW(h.set_reference(m, {1.0f, 0.0f}), ValidationError);
}

TEST(CentroidQualityTest, MalformedVectorScoresZero) {
    EmbeddingModelId m = test_model("malformed", 4);
    CentroidQualityHeuristic h;
    VectorEmbedding v = axis_vector(m, 0);
    v.values[0] = 3.0f;
    EXPECT_DOUBLE_EQ(h.evaluate(v), 0.0);
}

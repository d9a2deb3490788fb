/**
 * @file test_consensus_primitives.cpp
 * @brief Epochs, vote aggregation, Merkle batches and reputation decay
 */

#include <gtest/gtest.h>
#include <consensus/epoch.hpp>
#include <consensus/merkle_tree.hpp>
#include <consensus/vote_aggregation.hpp>
#include <core/errors.hpp>
#include <reputation/reputation_registry.hpp>

using namespace Reef;

// =============================================================================
//  EpochClock
// =============================================================================

TEST(EpochClockTest, NumberingAndPhases) {
    EpochClock clock(360);
    EXPECT_EQ(clock.epoch_of(0), 0u);
    EXPECT_EQ(clock.epoch_of(359), 0u);
    EXPECT_EQ(clock.epoch_of(360), 1u);
    EXPECT_EQ(clock.epoch_start(2), 720u);
    EXPECT_TRUE(clock.is_boundary(720));
    EXPECT_FALSE(clock.is_boundary(721));

    EXPECT_EQ(clock.phase_of(0), EpochPhase::Open);
    EXPECT_EQ(clock.phase_of(179), EpochPhase::Open);
    EXPECT_EQ(clock.phase_of(180), EpochPhase::Scoring);
    EXPECT_EQ(clock.phase_of(269), EpochPhase::Scoring);
    EXPECT_EQ(clock.phase_of(270), EpochPhase::Committing);
    EXPECT_EQ(clock.phase_of(360 + 10), EpochPhase::Open);
}

TEST(EpochClockTest, ContextCarriesLedger) {
    EpochClock clock(10);
    VoteLedger ledger;
    EpochContext ctx = clock.at_block(28, &ledger);
    EXPECT_EQ(ctx.epoch, 2u);
    EXPECT_EQ(ctx.block, 28u);
    EXPECT_EQ(ctx.phase, EpochPhase::Committing);
    EXPECT_EQ(ctx.votes, &ledger);
    EXPECT_EQ(clock.at_block(27).votes, nullptr);
    EXPECT_STREQ(phase_name(ctx.phase), "committing");
}

TEST(EpochClockTest, ZeroLengthRejected) {
    EXPECT_THROW(EpochClock(0), ConfigError);
}

// =============================================================================
//  Stake-weighted median
// =============================================================================

TEST(VoteAggregationTest, StakeDominates) {
    std::vector<ValidatorScore> votes = {
        {"did:v:a", 0.9, 10},
        {"did:v:b", 0.2, 80},
        {"did:v:c", 0.7, 10},
    };
    EXPECT_DOUBLE_EQ(stake_weighted_median(votes), 0.2);
}

TEST(VoteAggregationTest, UpperMedianOnEvenSplit) {
    std::vector<ValidatorScore> votes = {
        {"did:v:a", 0.8, 50},
        {"did:v:b", 0.4, 50},
    };
    EXPECT_DOUBLE_EQ(stake_weighted_median(votes), 0.8);
    EXPECT_DOUBLE_EQ(stake_weighted_median(votes, 1.0), 0.4);
}

TEST(VoteAggregationTest, ZeroStakeCountsEqually) {
    std::vector<ValidatorScore> votes = {
        {"did:v:a", 0.1, 0},
        {"did:v:b", 0.6, 0},
        {"did:v:c", 0.9, 0},
    };
    EXPECT_DOUBLE_EQ(stake_weighted_median(votes), 0.6);
}

TEST(VoteAggregationTest, ScoresClamped) {
    std::vector<ValidatorScore> votes = {{"did:v:a", 1.7, 1}};
    EXPECT_DOUBLE_EQ(stake_weighted_median(votes), 1.0);
}

TEST(VoteAggregationTest, InvalidInputs) {
    EXPECT_THROW(stake_weighted_median({}), PolicyError);
    std::vector<ValidatorScore> votes = {{"did:v:a", 0.5, 1}};
    EXPECT_THROW(stake_weighted_median(votes, 0.0), PolicyError);
    EXPECT_THROW(stake_weighted_median(votes, 1.5), PolicyError);
}

TEST(VoteLedgerTest, LaterVoteReplacesEarlier) {
    VoteLedger ledger;
    PolypId id = PolypId::generate();
    EXPECT_TRUE(ledger.votes(id).empty());

    ledger.cast(id, {"did:v:a", 0.3, 5});
    ledger.cast(id, {"did:v:b", 0.6, 5});
    ledger.cast(id, {"did:v:a", 0.9, 5});

    auto votes = ledger.votes(id);
    ASSERT_EQ(votes.size(), 2u);
    EXPECT_EQ(votes[0].validator_did, "did:v:a");
    EXPECT_DOUBLE_EQ(votes[0].score, 0.9);

    ledger.clear();
    EXPECT_TRUE(ledger.votes(id).empty());
}

// =============================================================================
//  MerkleTree
// =============================================================================

namespace {

std::vector<Hash256> make_leaves(size_t n) {
    std::vector<Hash256> leaves;
    for (size_t i = 0; i < n; ++i) leaves.push_back(BLAKE3Pipeline::hash("leaf " + std::to_string(i)));
    return leaves;
}

} // namespace

TEST(MerkleTreeTest, SingleLeafIsRoot) {
    auto leaves = make_leaves(1);
    MerkleTree tree(leaves);
    EXPECT_EQ(tree.root(), leaves[0]);
    EXPECT_TRUE(tree.proof(0).empty());
    EXPECT_TRUE(MerkleTree::verify(leaves[0], 0, {}, tree.root()));
}

TEST(MerkleTreeTest, TwoLeaves) {
    auto leaves = make_leaves(2);
    MerkleTree tree(leaves);
    EXPECT_EQ(tree.root(), BLAKE3Pipeline::hash_pair(leaves[0], leaves[1]));
}

TEST(MerkleTreeTest, EveryLeafVerifiesForOddAndEvenSizes) {
    for (size_t n : {2u, 3u, 5u, 8u, 13u}) {
        auto leaves = make_leaves(n);
        MerkleTree tree(leaves);
        EXPECT_EQ(tree.size(), n);
        for (size_t i = 0; i < n; ++i) {
            auto proof = tree.proof(i);
            EXPECT_TRUE(MerkleTree::verify(leaves[i], i, proof, tree.root())) << "n=" << n << " i=" << i;
        }
    }
}

TEST(MerkleTreeTest, WrongLeafOrIndexFails) {
    auto leaves = make_leaves(5);
    MerkleTree tree(leaves);
    auto proof = tree.proof(2);
    EXPECT_FALSE(MerkleTree::verify(leaves[3], 2, proof, tree.root()));
    EXPECT_FALSE(MerkleTree::verify(leaves[2], 3, proof, tree.root()));
}

TEST(MerkleTreeTest, InvalidConstruction) {
    EXPECT_THROW(MerkleTree(std::vector<Hash256>{}), ValidationError);
    MerkleTree tree(make_leaves(3));
    EXPECT_THROW(tree.proof(3), ValidationError);
}

TEST(MerkleTreeTest, LeafBindsIdAndCid) {
    PolypId a = PolypId::generate();
    PolypId b = PolypId::generate();
    Hash256 la = MerkleTree::leaf(a.bytes().data(), a.bytes().size(), "b3:00");
    EXPECT_NE(la, MerkleTree::leaf(b.bytes().data(), b.bytes().size(), "b3:00"));
    EXPECT_NE(la, MerkleTree::leaf(a.bytes().data(), a.bytes().size(), "b3:01"));
}

// =============================================================================
//  Reputation
// =============================================================================

TEST(DecayPolicyTest, Kinds) {
    EXPECT_DOUBLE_EQ(DecayPolicy{}.apply(0.8, 100), 0.8);
    EXPECT_DOUBLE_EQ(DecayPolicy::exponential(10).apply(0.8, 10), 0.4);
    EXPECT_DOUBLE_EQ(DecayPolicy::exponential(0).apply(0.8, 1), 0.0);
    EXPECT_NEAR(DecayPolicy::linear(0.1).apply(0.8, 3), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(DecayPolicy::linear(0.1).apply(0.8, 20), 0.0);
}

TEST(ReputationRegistryTest, RecordLookupForget) {
    ReputationRegistry registry(DecayPolicy::linear(0.1));
    EXPECT_FALSE(registry.reputation("did:reef:x", 0).has_value());

    registry.record("did:reef:x", 1.4, 2);
    EXPECT_DOUBLE_EQ(*registry.reputation("did:reef:x", 2), 1.0);
    EXPECT_NEAR(*registry.reputation("did:reef:x", 5), 0.7, 1e-12);
    // Lookups before the recording epoch do not decay
    EXPECT_DOUBLE_EQ(*registry.reputation("did:reef:x", 0), 1.0);
    EXPECT_EQ(registry.size(), 1u);

    registry.forget("did:reef:x");
    EXPECT_EQ(registry.size(), 0u);
}

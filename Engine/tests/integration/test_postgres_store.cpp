/**
 * @file test_postgres_store.cpp
 * @brief Polyp store contract against a live PostgreSQL database
 *
 * Connects with the PG* environment variables. Tests are skipped when no
 * server is reachable. Records are never deleted; every test works on Polyps
 * it created itself.
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <database/connection_pool.hpp>
#include <index/vector_index.hpp>
#include <storage/postgres_polyp_store.hpp>
#include "test_support.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace Reef;
using namespace ReefTest;

class PostgresStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        try {
            pool = std::make_unique<PostgresConnectionPool>(4);
        } catch (const StorageError& e) {
            GTEST_SKIP() << "Database not available - skipping integration test: " << e.what();
        }
        store = std::make_unique<PostgresPolypStore>(*pool);
    }

    PolypId create(const std::string& text) {
        auto [subject, proof] = node.make(text + " " + PolypId::generate().to_string());
        subject.provenance.source.source_url = "https://example.org/reef";
        subject.provenance.pipeline.steps.back().params["dimensions"] = "64";
        return store->create(subject, proof);
    }

    TestNode node;
    std::unique_ptr<PostgresConnectionPool> pool;
    std::unique_ptr<PostgresPolypStore> store;
};

TEST_F(PostgresStoreTest, CreateAndReadBack) {
    PolypId id = create("Kelp forests grow up to half a metre per day");
    Polyp p = store->get(id);

    EXPECT_EQ(p.id, id);
    EXPECT_EQ(p.state, PolypState::Draft);
    EXPECT_EQ(p.version, 1u);
    EXPECT_EQ(p.subject.vector.model_id, node.model());
    EXPECT_EQ(p.subject.provenance.creator.did, "did:reef:test");
    EXPECT_EQ(p.subject.provenance.source.source_url, std::optional<std::string>("https://example.org/reef"));
    ASSERT_EQ(p.subject.provenance.pipeline.steps.size(), 1u);
    EXPECT_EQ(p.subject.provenance.pipeline.steps[0].params.at("dimensions"), "64");
    // Float vectors survive the text encoding bit for bit
    EXPECT_TRUE(proof_matches_subject(p.subject, p.proof));
    EXPECT_EQ(p.proof.proof_bytes, node.prover.prove(p.subject.payload.content, p.subject.vector).proof_bytes);

    EXPECT_FALSE(store->find(PolypId::generate()).has_value());
    EXPECT_THROW(store->get(PolypId::generate()), NotFoundError);
}

TEST_F(PostgresStoreTest, CreateRejectsUnboundProof) {
    auto [subject, proof] = node.make("bound text");
    subject.payload.content = "other text";
    EXPECT_THROW(store->create(subject, proof), ValidationError);
}

TEST_F(PostgresStoreTest, TransitionPersistsConsensusAndHardening) {
    PolypId id = create("Mangroves store carbon in waterlogged soils");

    TransitionUpdate soft;
    soft.consensus = ConsensusMetadata{};
    soft.consensus->epoch = 2;
    soft.consensus->scores = PolypScores::make(1.0, 0.9, 0.8, 0.5, 1.0);
    soft.consensus->composite = soft.consensus->scores.weighted_score();
    soft.consensus->final_score = 0.75;
    soft.consensus->validator_scores = {{"did:reef:v1", 0.75, 40}, {"did:reef:v2", 0.6, 10}};
    soft.reason = "proof verified";
    store->transition(id, PolypState::Draft, PolypState::Soft, soft);
    store->transition(id, PolypState::Soft, PolypState::UnderReview, TransitionUpdate{});
    store->transition(id, PolypState::UnderReview, PolypState::Approved, TransitionUpdate{});

    TransitionUpdate hard;
    hard.hardening = HardeningLineage{};
    hard.hardening->cid = "b3:feed";
    hard.hardening->merkle_root = BLAKE3Pipeline::hash("root");
    hard.hardening->merkle_proof = {BLAKE3Pipeline::hash("a"), BLAKE3Pipeline::hash("b")};
    hard.hardening->attestations = {Attestation{"did:reef:v1", 1000}};
    hard.hardening->anchor_tx = "0x01";
    hard.hardening->epoch = 3;
    hard.hardening->hardened_at = 2000;
    Polyp h = store->transition(id, PolypState::Approved, PolypState::Hardened, hard);
    EXPECT_EQ(h.version, 5u);

    Polyp p = store->get(id);
    EXPECT_EQ(p.state, PolypState::Hardened);
    ASSERT_TRUE(p.consensus.has_value());
    EXPECT_EQ(p.consensus->epoch, 2u);
    EXPECT_DOUBLE_EQ(p.consensus->scores.novelty, 0.8);
    EXPECT_DOUBLE_EQ(p.consensus->final_score, 0.75);
    ASSERT_EQ(p.consensus->validator_scores.size(), 2u);
    EXPECT_EQ(p.consensus->validator_scores[0].stake, 40u);

    ASSERT_TRUE(p.hardening.has_value());
    EXPECT_EQ(p.hardening->cid, "b3:feed");
    EXPECT_EQ(p.hardening->merkle_root, BLAKE3Pipeline::hash("root"));
    EXPECT_EQ(p.hardening->merkle_proof.size(), 2u);
    ASSERT_EQ(p.hardening->attestations.size(), 1u);
    EXPECT_EQ(p.hardening->attestations[0].node_did, "did:reef:v1");
    EXPECT_EQ(p.hardening->anchor_tx, std::optional<std::string>("0x01"));
    EXPECT_EQ(p.hardening->epoch, 3u);

    auto audit = store->audit_log(id);
    ASSERT_EQ(audit.size(), 5u);
    EXPECT_EQ(audit[1].reason, "proof verified");
    EXPECT_EQ(audit[4].to_state, PolypState::Hardened);
}

TEST_F(PostgresStoreTest, StaleExpectationIsConflict) {
    PolypId id = create("Stale expectations lose");
    store->transition(id, PolypState::Draft, PolypState::Soft, TransitionUpdate{});
    EXPECT_THROW(store->transition(id, PolypState::Draft, PolypState::Rejected, TransitionUpdate{}),
                 ConflictError);
    EXPECT_THROW(store->transition(id, PolypState::Soft, PolypState::Hardened, TransitionUpdate{}),
                 InvalidTransitionError);
    EXPECT_EQ(store->get(id).version, 2u);
}

TEST_F(PostgresStoreTest, ConcurrentConnectionsHaveOneWinner) {
    PolypId id = create("Race across connections");

    std::atomic<int> wins{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            try {
                store->transition(id, PolypState::Draft, PolypState::Soft, TransitionUpdate{});
                wins++;
            } catch (const ConflictError&) {
                conflicts++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(conflicts.load(), 3);
    EXPECT_EQ(store->audit_log(id).size(), 2u);
}

TEST_F(PostgresStoreTest, SeparateStoresShareOneWinner) {
    PolypId id = create("Race across stores");

    std::atomic<int> wins{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 3; ++t) {
        threads.emplace_back([&] {
            PostgresConnectionPool own(1);
            PostgresPolypStore other(own, false);
            try {
                other.transition(id, PolypState::Draft, PolypState::Rejected, TransitionUpdate{});
                wins++;
            } catch (const ConflictError&) {
                conflicts++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(conflicts.load(), 2);
    EXPECT_EQ(store->get(id).state, PolypState::Rejected);
}

TEST_F(PostgresStoreTest, IndependentPolypsUpdateInParallel) {
    std::vector<PolypId> ids;
    for (int i = 0; i < 8; ++i) ids.push_back(create("Parallel " + std::to_string(i)));

    std::vector<std::thread> threads;
    for (const auto& id : ids) {
        threads.emplace_back([&, id] {
            store->transition(id, PolypState::Draft, PolypState::Soft, TransitionUpdate{});
            store->transition(id, PolypState::Soft, PolypState::UnderReview, TransitionUpdate{});
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& id : ids) EXPECT_EQ(store->get(id).state, PolypState::UnderReview);
    EXPECT_LE(pool->open_connections(), pool->max_connections());
    EXPECT_EQ(pool->idle_connections(), pool->open_connections());
}

TEST_F(PostgresStoreTest, PoolWaitsForReturnedConnection) {
    PostgresConnectionPool small(2);
    auto a = std::make_unique<PostgresConnectionPool::Lease>(small.acquire());
    auto b = small.acquire();
    EXPECT_NE(&**a, &*b);
    EXPECT_EQ(small.open_connections(), 2u);
    EXPECT_EQ(small.idle_connections(), 0u);

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto c = small.acquire();
        acquired = true;
        EXPECT_TRUE(c->is_connected());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired.load());

    a.reset();
    waiter.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(small.open_connections(), 2u);
}

TEST_F(PostgresStoreTest, CursorAndIndexRebuild) {
    std::vector<PolypId> ids;
    for (int i = 0; i < 3; ++i) {
        PolypId id = create("Rebuild source " + std::to_string(i));
        store->transition(id, PolypState::Draft, PolypState::Soft, TransitionUpdate{});
        store->transition(id, PolypState::Soft, PolypState::UnderReview, TransitionUpdate{});
        store->transition(id, PolypState::UnderReview, PolypState::Approved, TransitionUpdate{});
        ids.push_back(id);
    }

    size_t seen = 0;
    auto cursor = store->list_by_state(PolypState::Approved, 2);
    while (auto p = cursor.next()) {
        EXPECT_EQ(p->state, PolypState::Approved);
        if (std::find(ids.begin(), ids.end(), p->id) != ids.end()) ++seen;
    }
    EXPECT_EQ(seen, ids.size());
    EXPECT_GE(store->count(PolypState::Approved), ids.size());

    VectorIndex index;
    EXPECT_GE(index.rebuild(*store), ids.size());
    for (const auto& id : ids) EXPECT_TRUE(index.contains(id));
}

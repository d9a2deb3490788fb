/**
 * @file test_adapters.cpp
 * @brief Local embedding model and attestation proofs
 */

#include <gtest/gtest.h>
#include <ml/vector_math.hpp>
#include "test_support.hpp"

using namespace Reef;
using namespace ReefTest;

// =============================================================================
//  FeatureHashEmbedder
// =============================================================================

TEST(FeatureHashEmbedderTest, Tokenize) {
    auto tokens = FeatureHashEmbedder::tokenize("The speed of light, in VACUUM!");
    std::vector<std::string> expected = {"the", "speed", "of", "light", "in", "vacuum"};
    EXPECT_EQ(tokens, expected);
    EXPECT_TRUE(FeatureHashEmbedder::tokenize("  ... ").empty());
}

TEST(FeatureHashEmbedderTest, DeterministicAndNormalized) {
    FeatureHashEmbedder embedder(128);
    auto a = embedder.embed("Light travels at 299792458 metres per second", embedder.model_id());
    auto b = embedder.embed("Light travels at 299792458 metres per second", embedder.model_id());

    EXPECT_EQ(a.values, b.values);
    EXPECT_EQ(a.values.size(), 128u);
    EXPECT_EQ(a.model_id, embedder.model_id());
    EXPECT_NEAR(VectorMath::norm(a.values), 1.0, 1e-5);
    EXPECT_NO_THROW(a.validate());
}

TEST(FeatureHashEmbedderTest, SharedWordsAreCloserThanUnrelatedText) {
    FeatureHashEmbedder embedder;
    const auto& m = embedder.model_id();
    auto fact = embedder.embed("The speed of light in vacuum is 299792458 m/s", m);
    auto query = embedder.embed("how fast is light", m);
    auto unrelated = embedder.embed("Coral polyps secrete calcium carbonate skeletons", m);

    double related = VectorMath::cosine(fact.values, query.values);
    double far = VectorMath::cosine(fact.values, unrelated.values);
    EXPECT_GT(related, 0.0);
    EXPECT_GT(related, far);
}

TEST(FeatureHashEmbedderTest, ModelsDifferByDimensionsAndName) {
    FeatureHashEmbedder a(64);
    FeatureHashEmbedder b(128);
    FeatureHashEmbedder c(64, "feature-hash-v2");
    EXPECT_NE(a.model_id(), b.model_id());
    EXPECT_NE(a.model_id(), c.model_id());
    EXPECT_NE(a.model_id().weights_hash, c.model_id().weights_hash);
    ASSERT_EQ(a.models().size(), 1u);
    EXPECT_EQ(a.models()[0], a.model_id());
}

TEST(FeatureHashEmbedderTest, UnknownModelIsUnavailable) {
    FeatureHashEmbedder embedder(64);
    EXPECT_THROW(embedder.embed("text", test_model("elsewhere", 64)), ModelUnavailableError);
    EXPECT_THROW(embedder.embed_batch({"text"}, test_model("elsewhere", 64)), ModelUnavailableError);
}

TEST(FeatureHashEmbedderTest, NoTokensIsEmbeddingFailure) {
    FeatureHashEmbedder embedder(64);
    EXPECT_THROW(embedder.embed("", embedder.model_id()), EmbeddingFailedError);
    EXPECT_THROW(embedder.embed("?!", embedder.model_id()), EmbeddingFailedError);
}

TEST(FeatureHashEmbedderTest, BatchMatchesSingle) {
    FeatureHashEmbedder embedder(64);
    std::vector<std::string> texts;
    for (int i = 0; i < 300; ++i) texts.push_back("document number " + std::to_string(i));

    auto batch = embedder.embed_batch(texts, embedder.model_id());
    ASSERT_EQ(batch.size(), texts.size());
    for (size_t i = 0; i < texts.size(); i += 37) {
        EXPECT_EQ(batch[i].values, embedder.embed(texts[i], embedder.model_id()).values);
    }

    texts[150] = "";
    EXPECT_THROW(embedder.embed_batch(texts, embedder.model_id()), EmbeddingFailedError);
}

TEST(FeatureHashEmbedderTest, ZeroDimensionsRejected) {
    EXPECT_THROW(FeatureHashEmbedder(0), ConfigError);
}

// =============================================================================
//  Attestation proofs
// =============================================================================

class AttestationTest : public ::testing::Test {
protected:
    TestNode node;

    bool verify(const PolypSubject& s, const ZkProof& p) {
        return node.verifier.verify(p, BLAKE3Pipeline::hash(s.payload.content),
                                    BLAKE3Pipeline::hash_vector(s.vector.values));
    }
};

TEST_F(AttestationTest, ProofBindsTextVectorAndModel) {
    auto [subject, proof] = node.make("Water boils at 100 degrees Celsius at sea level");
    EXPECT_EQ(proof.proof_type, AttestationProver::kProofType);
    EXPECT_EQ(proof.text_hash, BLAKE3Pipeline::hash(subject.payload.content));
    EXPECT_EQ(proof.vector_hash, BLAKE3Pipeline::hash_vector(subject.vector.values));
    EXPECT_EQ(proof.model_id, node.model());
    EXPECT_EQ(proof.vk_hash, node.prover.vk_hash());
    EXPECT_TRUE(proof_matches_subject(subject, proof));
    EXPECT_TRUE(verify(subject, proof));
}

TEST_F(AttestationTest, TamperedMacRejected) {
    auto [subject, proof] = node.make("tamper with me");
    proof.proof_bytes[0] ^= 0x01;
    EXPECT_FALSE(verify(subject, proof));
}

TEST_F(AttestationTest, TamperedModelRejected) {
    auto [subject, proof] = node.make("model swap");
    proof.model_id.name = "other";
    EXPECT_FALSE(verify(subject, proof));
}

TEST_F(AttestationTest, MismatchedHashesRejected) {
    auto [subject, proof] = node.make("first text");
    EXPECT_FALSE(node.verifier.verify(proof, BLAKE3Pipeline::hash("second text"), proof.vector_hash));
}

TEST_F(AttestationTest, UnsupportedProofTypeRejected) {
    auto [subject, proof] = node.make("wrong type");
    proof.proof_type = "groth16";
    EXPECT_FALSE(verify(subject, proof));
}

TEST_F(AttestationTest, UntrustedAndRevokedKeys) {
    AttestationProver stranger(BLAKE3Pipeline::hash("someone else"));
    PolypSubject subject = node.subject("unknown signer");
    ZkProof proof = stranger.prove(subject.payload.content, subject.vector);
    EXPECT_FALSE(verify(subject, proof));

    auto [own_subject, own_proof] = node.make("revocation");
    EXPECT_TRUE(verify(own_subject, own_proof));
    node.verifier.revoke(node.prover.vk_hash());
    EXPECT_FALSE(verify(own_subject, own_proof));
}

TEST_F(AttestationTest, FlakyVerifierReportsUnavailability) {
    FlakyVerifier flaky(node.verifier);
    auto [subject, proof] = node.make("flaky");
    Hash256 th = BLAKE3Pipeline::hash(subject.payload.content);
    Hash256 vh = BLAKE3Pipeline::hash_vector(subject.vector.values);

    flaky.set_available(false);
    EXPECT_THROW(flaky.verify(proof, th, vh), VerifierUnavailableError);
    flaky.set_available(true);
    EXPECT_TRUE(flaky.verify(proof, th, vh));
    EXPECT_EQ(flaky.calls(), 2);
}

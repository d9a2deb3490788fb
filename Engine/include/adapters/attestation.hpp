/**
 * @file attestation.hpp
 * @brief Keyed-BLAKE3 attestation proofs
 *
 * A node holding an attestation key binds (text_hash, vector_hash, model,
 * created_at) with BLAKE3 keyed mode. The verification key hash is
 * BLAKE3(key); verifiers hold the keys of the nodes they trust.
 */

#pragma once

#include <adapters/proof_verifier.hpp>
#include <mutex>
#include <unordered_map>

namespace Reef {

class REEF_API AttestationProver : public ProofProver {
public:
    static constexpr const char* kProofType = "blake3-keyed-attestation";

    explicit AttestationProver(const Hash256& key);

    ZkProof prove(const std::string& text, const VectorEmbedding& embedding) override;

    /**
     * @brief Attest to explicit hashes (callers that hash content themselves)
     */
    ZkProof attest(const Hash256& text_hash, const Hash256& vector_hash, const EmbeddingModelId& model) const;

    const Hash256& vk_hash() const { return vk_hash_; }

    /**
     * @brief Bytes covered by the attestation MAC
     */
    static std::vector<uint8_t> message(const Hash256& text_hash, const Hash256& vector_hash,
                                        const EmbeddingModelId& model, Timestamp created_at);

private:
    Hash256 key_;
    Hash256 vk_hash_;
};

class REEF_API AttestationVerifier : public ProofVerifier {
public:
    AttestationVerifier() = default;

    /**
     * @brief Accept proofs made with this key
     */
    void trust(const Hash256& key);

    void revoke(const Hash256& vk_hash);

    bool verify(const ZkProof& proof, const Hash256& text_hash, const Hash256& vector_hash) override;

private:
    struct HashKey {
        size_t operator()(const Hash256& h) const noexcept {
            size_t v = 0;
            for (size_t i = 0; i < sizeof(size_t); ++i) v = (v << 8) | h[i];
            return v;
        }
    };

    std::mutex mutex_;
    std::unordered_map<Hash256, Hash256, HashKey> keys_; // vk_hash -> key
};

} // namespace Reef

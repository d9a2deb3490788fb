/**
 * @file attestation.cpp
 * @brief Keyed-BLAKE3 attestation prover and verifier
 */

#include <adapters/attestation.hpp>
#include <utils/logger.hpp>
#include <algorithm>

namespace Reef {

AttestationProver::AttestationProver(const Hash256& key)
    : key_(key), vk_hash_(BLAKE3Pipeline::hash(key.data(), key.size())) {}

std::vector<uint8_t> AttestationProver::message(const Hash256& text_hash, const Hash256& vector_hash,
                                                const EmbeddingModelId& model, Timestamp created_at) {
    const std::string model_key = model.key();
    std::vector<uint8_t> msg;
    msg.reserve(text_hash.size() + vector_hash.size() + model_key.size() + 8);
    msg.insert(msg.end(), text_hash.begin(), text_hash.end());
    msg.insert(msg.end(), vector_hash.begin(), vector_hash.end());
    msg.insert(msg.end(), model_key.begin(), model_key.end());
    for (int i = 0; i < 8; ++i) {
        msg.push_back(static_cast<uint8_t>((static_cast<uint64_t>(created_at) >> (8 * i)) & 0xFF));
    }
    return msg;
}

ZkProof AttestationProver::attest(const Hash256& text_hash, const Hash256& vector_hash,
                                  const EmbeddingModelId& model) const {
    ZkProof proof;
    proof.proof_type = kProofType;
    proof.vk_hash = vk_hash_;
    proof.text_hash = text_hash;
    proof.vector_hash = vector_hash;
    proof.model_id = model;
    proof.created_at = now_ms();

    auto msg = message(text_hash, vector_hash, model, proof.created_at);
    auto mac = BLAKE3Pipeline::keyed_hash(key_, msg.data(), msg.size());
    proof.proof_bytes.assign(mac.begin(), mac.end());
    return proof;
}

ZkProof AttestationProver::prove(const std::string& text, const VectorEmbedding& embedding) {
    return attest(BLAKE3Pipeline::hash(text), BLAKE3Pipeline::hash_vector(embedding.values), embedding.model_id);
}

void AttestationVerifier::trust(const Hash256& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    keys_[BLAKE3Pipeline::hash(key.data(), key.size())] = key;
}

void AttestationVerifier::revoke(const Hash256& vk_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    keys_.erase(vk_hash);
}

bool AttestationVerifier::verify(const ZkProof& proof, const Hash256& text_hash, const Hash256& vector_hash) {
    if (proof.proof_type != AttestationProver::kProofType) {
        Logger::warn("Unsupported proof type: " + proof.proof_type);
        return false;
    }
    if (proof.text_hash != text_hash || proof.vector_hash != vector_hash) {
        return false;
    }

    Hash256 key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = keys_.find(proof.vk_hash);
        if (it == keys_.end()) {
            Logger::warn("Proof signed by untrusted key " + BLAKE3Pipeline::to_hex(proof.vk_hash).substr(0, 16));
            return false;
        }
        key = it->second;
    }

    auto msg = AttestationProver::message(text_hash, vector_hash, proof.model_id, proof.created_at);
    auto expected = BLAKE3Pipeline::keyed_hash(key, msg.data(), msg.size());
    return proof.proof_bytes.size() == expected.size() &&
           std::equal(expected.begin(), expected.end(), proof.proof_bytes.begin());
}

} // namespace Reef

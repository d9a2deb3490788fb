/**
 * @file proof_verifier.hpp
 * @brief Boundary to proof generation and verification
 */

#pragma once

#include <export.hpp>
#include <core/polyp.hpp>
#include <string>

namespace Reef {

/**
 * @brief Checks that a proof attests to the given text and vector hashes
 */
class REEF_API ProofVerifier {
public:
    virtual ~ProofVerifier() = default;

    /**
     * @return true if valid, false if invalid (a final outcome)
     * @throws VerifierUnavailableError if the verifier cannot answer right now
     */
    virtual bool verify(const ZkProof& proof, const Hash256& text_hash, const Hash256& vector_hash) = 0;
};

/**
 * @brief Producer-side counterpart: creates a proof for a text and its embedding
 */
class REEF_API ProofProver {
public:
    virtual ~ProofProver() = default;

    virtual ZkProof prove(const std::string& text, const VectorEmbedding& embedding) = 0;
};

} // namespace Reef

/**
 * @file polyp.hpp
 * @brief Polyp record and the value types it is built from
 */

#pragma once

#include <export.hpp>
#include <core/polyp_id.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <scoring/polyp_scores.hpp>
#include <utils/time.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Reef {

enum class PolypState : uint8_t {
    Draft,
    Soft,
    UnderReview,
    Approved,
    Hardened,
    Rejected,
    Molted
};

REEF_API const char* state_name(PolypState state);

/**
 * @throws ValidationError for unknown names
 */
REEF_API PolypState parse_state(const std::string& name);

/**
 * @brief Identity of the model that produced an embedding
 *
 * Vectors are comparable only when every field matches.
 */
struct REEF_API EmbeddingModelId {
    std::string provider;
    std::string name;
    Hash256 weights_hash{};
    uint32_t dimensions = 0;

    /// provider/name/<hex weights>/<dimensions>
    std::string key() const;

    bool operator==(const EmbeddingModelId& other) const {
        return provider == other.provider && name == other.name &&
               weights_hash == other.weights_hash && dimensions == other.dimensions;
    }
    bool operator!=(const EmbeddingModelId& other) const { return !(*this == other); }
};

struct REEF_API VectorEmbedding {
    std::vector<float> values;
    EmbeddingModelId model_id;
    std::string quantization = "float32";
    std::string normalization = "l2";

    /**
     * @brief Enforce dimensions, finiteness and (for "l2") unit norm within 1e-3
     * @throws ValidationError
     */
    void validate() const;
};

struct Payload {
    std::string content;
    std::string content_type = "text/plain";
    std::optional<std::string> language;
};

struct NodeIdentity {
    Hash256 hotkey{};
    std::string did;
};

struct SourceAttribution {
    std::optional<std::string> source_cid;
    std::optional<std::string> source_url;
    std::optional<std::string> title;
    std::optional<std::string> license;
    Timestamp accessed_at = 0;
};

struct PipelineStep {
    std::string name;
    std::string version;
    std::map<std::string, std::string> params;
};

struct ProcessingPipeline {
    std::vector<PipelineStep> steps;
    uint64_t duration_ms = 0;
};

struct Provenance {
    NodeIdentity creator;
    SourceAttribution source;
    ProcessingPipeline pipeline;
};

/// Content of a Polyp: what was said, where it sits in embedding space, and who said it.
struct PolypSubject {
    Payload payload;
    VectorEmbedding vector;
    Provenance provenance;
};

/**
 * @brief Proof binding a text and its embedding to a model
 *
 * text_hash = BLAKE3(utf8 content), vector_hash = BLAKE3(float32 LE bytes).
 */
struct ZkProof {
    std::string proof_type;
    std::vector<uint8_t> proof_bytes;
    Hash256 vk_hash{};
    Hash256 text_hash{};
    Hash256 vector_hash{};
    EmbeddingModelId model_id;
    Timestamp created_at = 0;
};

struct ValidatorScore {
    std::string validator_did;
    double score = 0.0;
    uint64_t stake = 0;
};

struct ConsensusMetadata {
    uint64_t epoch = 0;
    PolypScores scores;
    double composite = 0.0;
    double final_score = 0.0;
    std::vector<ValidatorScore> validator_scores;
    uint32_t review_cycles = 0;
    bool hardened = false;
    Timestamp finalized_at = 0;
};

struct Attestation {
    std::string node_did;
    Timestamp attested_at = 0;
};

struct HardeningLineage {
    std::string cid;
    Hash256 merkle_root{};
    std::vector<Hash256> merkle_proof;
    std::vector<Attestation> attestations;
    std::optional<std::string> anchor_tx;
    uint64_t epoch = 0;
    Timestamp hardened_at = 0;
};

/**
 * @brief A unit of knowledge tracked through the hardening lifecycle
 *
 * The state tag drives which optional sections are populated: consensus from
 * Soft onward, hardening once Hardened, successor_id only when Molted.
 */
struct REEF_API Polyp {
    PolypId id;
    PolypState state = PolypState::Draft;
    uint64_t version = 0;
    PolypSubject subject;
    ZkProof proof;
    std::optional<ConsensusMetadata> consensus;
    std::optional<HardeningLineage> hardening;
    std::optional<PolypId> successor_id;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;

    /// Trust score shown to searchers (consensus composite, 0 before scoring)
    double trust_score() const {
        return consensus ? consensus->composite : 0.0;
    }
};

/**
 * @brief Deterministic byte encoding of a Polyp's immutable content
 *
 * Covers id, payload, vector, model, creator and creation time. Used for the
 * content address of hardened Polyps.
 */
REEF_API std::vector<uint8_t> canonical_bytes(const Polyp& polyp);

/**
 * @brief Content address "b3:<hex>" of canonical_bytes
 */
REEF_API std::string content_id(const Polyp& polyp);

/**
 * @brief Check that a proof is bound to exactly this subject
 *
 * Recomputes the text and vector hashes from the subject and compares them
 * and the model id against the proof.
 */
REEF_API bool proof_matches_subject(const PolypSubject& subject, const ZkProof& proof);

} // namespace Reef

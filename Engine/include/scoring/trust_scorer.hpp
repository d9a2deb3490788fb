/**
 * @file trust_scorer.hpp
 * @brief Five-dimensional Polyp scoring
 */

#pragma once

#include <export.hpp>
#include <adapters/proof_verifier.hpp>
#include <core/config.hpp>
#include <core/polyp.hpp>
#include <index/vector_index.hpp>
#include <reputation/reputation_registry.hpp>
#include <scoring/polyp_scores.hpp>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace Reef {

/**
 * @brief Scores the content of a payload in [0,1]
 */
class REEF_API SemanticQualityHeuristic {
public:
    virtual ~SemanticQualityHeuristic() = default;
    virtual double evaluate(const Payload& payload) const = 0;
};

/**
 * @brief Token count saturation times lexical diversity
 *
 * length = min(1, tokens / saturation), diversity = unique / total;
 * score = length * (0.5 + 0.5 * diversity).
 */
class REEF_API LexicalQualityHeuristic : public SemanticQualityHeuristic {
public:
    explicit LexicalQualityHeuristic(size_t saturation_tokens = 8) : saturation_(saturation_tokens) {}
    double evaluate(const Payload& payload) const override;

private:
    size_t saturation_;
};

/**
 * @brief Scores an embedding in [0,1]
 */
class REEF_API EmbeddingQualityHeuristic {
public:
    virtual ~EmbeddingQualityHeuristic() = default;
    virtual double evaluate(const VectorEmbedding& embedding) const = 0;
};

/**
 * @brief Cosine against a reference centroid registered per model space
 *
 * Malformed vectors score 0. Without a reference for the model, a
 * well-formed vector scores 1.
 */
class REEF_API CentroidQualityHeuristic : public EmbeddingQualityHeuristic {
public:
    void set_reference(const EmbeddingModelId& model, std::vector<float> centroid);
    double evaluate(const VectorEmbedding& embedding) const override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::vector<float>> references_;
};

/**
 * @brief Computes PolypScores
 *
 * zk_validity       1 iff the proof is bound to the subject and verifies
 * semantic_quality  pluggable heuristic (lexical by default)
 * novelty           1 - max cosine to Hardened Polyps in the same model space
 * source_credibility creator reputation, default when unknown
 * embedding_quality pluggable heuristic (reference centroid by default)
 */
class REEF_API TrustScorer {
public:
    TrustScorer(const VectorIndex& index, ProofVerifier& verifier, const ReputationRegistry& reputation,
                const ReefConfig& config,
                std::shared_ptr<SemanticQualityHeuristic> semantic = nullptr,
                std::shared_ptr<EmbeddingQualityHeuristic> embedding = nullptr);

    /**
     * @throws VerifierUnavailableError from the verifier
     */
    PolypScores score(const Polyp& polyp, uint64_t epoch) const;

    /**
     * @throws VerifierUnavailableError from the verifier
     */
    double zk_validity(const Polyp& polyp) const;

    double novelty(const PolypId& self, const VectorEmbedding& embedding) const;

    double source_credibility(const std::string& did, uint64_t epoch) const;

    double composite(const PolypScores& scores) const { return scores.weighted_score(weights_); }

    const ScoreWeights& weights() const { return weights_; }

private:
    const VectorIndex& index_;
    ProofVerifier& verifier_;
    const ReputationRegistry& reputation_;
    ScoreWeights weights_;
    double default_reputation_;
    std::shared_ptr<SemanticQualityHeuristic> semantic_;
    std::shared_ptr<EmbeddingQualityHeuristic> embedding_;
};

} // namespace Reef

/**
 * @file trust_scorer.cpp
 * @brief Trust scoring implementation
 */

#include <scoring/trust_scorer.hpp>
#include <adapters/feature_hash_embedder.hpp>
#include <core/errors.hpp>
#include <ml/vector_math.hpp>
#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace Reef {

double LexicalQualityHeuristic::evaluate(const Payload& payload) const {
    auto tokens = FeatureHashEmbedder::tokenize(payload.content);
    if (tokens.empty()) return 0.0;

    std::unordered_set<std::string> unique(tokens.begin(), tokens.end());
    double length = std::min(1.0, static_cast<double>(tokens.size()) / std::max<size_t>(saturation_, 1));
    double diversity = static_cast<double>(unique.size()) / tokens.size();
    return length * (0.5 + 0.5 * diversity);
}

void CentroidQualityHeuristic::set_reference(const EmbeddingModelId& model, std::vector<float> centroid) {
    if (centroid.size() != model.dimensions) {
        throw ValidationError("Reference centroid length does not match model dimensions", model.key());
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    references_[model.key()] = VectorMath::normalized(centroid);
}

double CentroidQualityHeuristic::evaluate(const VectorEmbedding& embedding) const {
    try {
        embedding.validate();
    } catch (const ValidationError&) {
        return 0.0;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = references_.find(embedding.model_id.key());
    if (it == references_.end()) return 1.0;
    return PolypScores::clamp_unit(VectorMath::cosine(embedding.values, it->second));
}

TrustScorer::TrustScorer(const VectorIndex& index, ProofVerifier& verifier, const ReputationRegistry& reputation,
                         const ReefConfig& config,
                         std::shared_ptr<SemanticQualityHeuristic> semantic,
                         std::shared_ptr<EmbeddingQualityHeuristic> embedding)
    : index_(index)
    , verifier_(verifier)
    , reputation_(reputation)
    , weights_(config.weights)
    , default_reputation_(config.default_reputation)
    , semantic_(semantic ? std::move(semantic) : std::make_shared<LexicalQualityHeuristic>())
    , embedding_(embedding ? std::move(embedding) : std::make_shared<CentroidQualityHeuristic>()) {
    weights_.validate();
}

double TrustScorer::zk_validity(const Polyp& polyp) const {
    if (!proof_matches_subject(polyp.subject, polyp.proof)) return 0.0;

    const Hash256 text_hash = BLAKE3Pipeline::hash(polyp.subject.payload.content);
    const Hash256 vector_hash = BLAKE3Pipeline::hash_vector(polyp.subject.vector.values);
    return verifier_.verify(polyp.proof, text_hash, vector_hash) ? 1.0 : 0.0;
}

double TrustScorer::novelty(const PolypId& self, const VectorEmbedding& embedding) const {
    auto hits = index_.query(embedding.values, embedding.model_id, 2, true);
    for (const auto& hit : hits) {
        if (hit.id == self) continue;
        return PolypScores::clamp_unit(1.0 - hit.similarity);
    }
    return 1.0;
}

double TrustScorer::source_credibility(const std::string& did, uint64_t epoch) const {
    return reputation_.reputation(did, epoch).value_or(default_reputation_);
}

PolypScores TrustScorer::score(const Polyp& polyp, uint64_t epoch) const {
    const auto& subject = polyp.subject;
    return PolypScores::make(
        zk_validity(polyp),
        semantic_->evaluate(subject.payload),
        novelty(polyp.id, subject.vector),
        source_credibility(subject.provenance.creator.did, epoch),
        embedding_->evaluate(subject.vector));
}

} // namespace Reef

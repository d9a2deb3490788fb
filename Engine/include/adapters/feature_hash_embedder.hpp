/**
 * @file feature_hash_embedder.hpp
 * @brief Deterministic local embedding model based on hashed lexical features
 */

#pragma once

#include <adapters/embedding_provider.hpp>

namespace Reef {

/**
 * @brief Signed feature hashing of word unigrams and character trigrams
 *
 * Each lower-cased word contributes weight 1.0 and each trigram of the
 * boundary-padded word 0.5. Features are hashed with BLAKE3 into
 * `dimensions` buckets (the fifth digest byte picks the sign), then the
 * vector is L2-normalized. Texts that share words or word fragments get a
 * positive cosine similarity; byte-identical texts get identical vectors.
 */
class REEF_API FeatureHashEmbedder : public EmbeddingProvider {
public:
    explicit FeatureHashEmbedder(uint32_t dimensions = 256, std::string name = "feature-hash-v1");

    const EmbeddingModelId& model_id() const { return model_; }

    VectorEmbedding embed(const std::string& text, const EmbeddingModelId& model) override;
    std::vector<EmbeddingModelId> models() const override { return {model_}; }

    /**
     * @brief Parallel batch embedding (OpenMP)
     */
    std::vector<VectorEmbedding> embed_batch(const std::vector<std::string>& texts,
                                             const EmbeddingModelId& model) override;

    /// Lower-cased word tokens; bytes >= 0x80 count as word characters
    static std::vector<std::string> tokenize(const std::string& text);

private:
    VectorEmbedding compute(const std::string& text) const;

    EmbeddingModelId model_;
};

} // namespace Reef

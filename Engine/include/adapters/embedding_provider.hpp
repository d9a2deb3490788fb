/**
 * @file embedding_provider.hpp
 * @brief Boundary to embedding models
 */

#pragma once

#include <export.hpp>
#include <core/polyp.hpp>
#include <string>
#include <vector>

namespace Reef {

/**
 * @brief Turns text into a vector under a named model
 *
 * Implementations must be safe to call from several threads.
 */
class REEF_API EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Embed text with the given model
     * @throws ModelUnavailableError if the model is not served (transient)
     * @throws EmbeddingFailedError if the text cannot be embedded
     */
    virtual VectorEmbedding embed(const std::string& text, const EmbeddingModelId& model) = 0;

    /// Models this provider can serve
    virtual std::vector<EmbeddingModelId> models() const = 0;

    virtual std::vector<VectorEmbedding> embed_batch(const std::vector<std::string>& texts,
                                                     const EmbeddingModelId& model) {
        std::vector<VectorEmbedding> out;
        out.reserve(texts.size());
        for (const auto& t : texts) out.push_back(embed(t, model));
        return out;
    }
};

} // namespace Reef

/**
 * @file feature_hash_embedder.cpp
 * @brief Hashed lexical feature embeddings
 */

#include <adapters/feature_hash_embedder.hpp>
#include <core/errors.hpp>
#include <ml/vector_math.hpp>
#include <cctype>
#include <exception>

namespace Reef {

namespace {

void add_feature(std::vector<float>& acc, const std::string& feature, float weight) {
    auto h = BLAKE3Pipeline::hash(feature);
    uint32_t bucket = static_cast<uint32_t>(h[0]) | (static_cast<uint32_t>(h[1]) << 8) |
                      (static_cast<uint32_t>(h[2]) << 16) | (static_cast<uint32_t>(h[3]) << 24);
    float sign = (h[4] & 1) ? -1.0f : 1.0f;
    acc[bucket % acc.size()] += sign * weight;
}

} // namespace

FeatureHashEmbedder::FeatureHashEmbedder(uint32_t dimensions, std::string name) {
    if (dimensions == 0) {
        throw ConfigError("Embedding dimensions must be positive");
    }
    model_.provider = "reef";
    model_.name = std::move(name);
    model_.weights_hash = BLAKE3Pipeline::hash(model_.provider + "/" + model_.name + "/" +
                                               std::to_string(dimensions));
    model_.dimensions = dimensions;
}

std::vector<std::string> FeatureHashEmbedder::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c >= 0x80) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

VectorEmbedding FeatureHashEmbedder::compute(const std::string& text) const {
    auto tokens = tokenize(text);
    if (tokens.empty()) {
        throw EmbeddingFailedError("Text has no embeddable tokens");
    }

    std::vector<float> acc(model_.dimensions, 0.0f);
    for (const auto& token : tokens) {
        add_feature(acc, "w:" + token, 1.0f);

        const std::string padded = "^" + token + "$";
        for (size_t i = 0; i + 3 <= padded.size(); ++i) {
            add_feature(acc, "t:" + padded.substr(i, 3), 0.5f);
        }
    }

    VectorEmbedding out;
    out.model_id = model_;
    try {
        out.values = VectorMath::normalized(acc);
    } catch (const ValidationError&) {
        // Every feature cancelled out
        throw EmbeddingFailedError("Embedding collapsed to a zero vector");
    }
    return out;
}

VectorEmbedding FeatureHashEmbedder::embed(const std::string& text, const EmbeddingModelId& model) {
    if (model != model_) {
        throw ModelUnavailableError("Model not served by this provider", model.key());
    }
    return compute(text);
}

std::vector<VectorEmbedding> FeatureHashEmbedder::embed_batch(const std::vector<std::string>& texts,
                                                              const EmbeddingModelId& model) {
    if (model != model_) {
        throw ModelUnavailableError("Model not served by this provider", model.key());
    }

    std::vector<VectorEmbedding> out(texts.size());
    std::exception_ptr failure;
    const long long n = static_cast<long long>(texts.size());

    #pragma omp parallel for schedule(dynamic, 16)
    for (long long i = 0; i < n; ++i) {
        try {
            out[i] = compute(texts[i]);
        } catch (...) {
            #pragma omp critical
            {
                if (!failure) failure = std::current_exception();
            }
        }
    }

    if (failure) std::rethrow_exception(failure);
    return out;
}

} // namespace Reef

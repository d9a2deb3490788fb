/**
 * @file search_engine.hpp
 * @brief Trust-aware semantic search over Approved and Hardened Polyps
 */

#pragma once

#include <export.hpp>
#include <adapters/embedding_provider.hpp>
#include <core/config.hpp>
#include <core/polyp.hpp>
#include <index/vector_index.hpp>
#include <storage/polyp_store.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Reef {

struct SearchOptions {
    size_t top_k = 10;
    RankMode rank_mode = RankMode::Similarity;
    double min_trust = 0.0;     // drop results whose trust score is below this
    bool hardened_only = false;
};

/**
 * @brief One hit joined to its Polyp; built per query, never stored
 */
struct SearchResult {
    PolypId polyp_id;
    std::optional<std::string> cid;
    Payload payload;
    double similarity = 0.0;
    double trust_score = 0.0;
    std::string creator_did;
    PolypState state = PolypState::Approved;
    std::optional<uint64_t> hardened_epoch;
};

struct SearchResponse {
    std::vector<SearchResult> results;
    bool empty_index = false; // the model space holds no entries yet
    double search_time_ms = 0.0;
};

/**
 * @brief Search engine
 *
 * Algorithm:
 * 1. Embed the query in the requested model space
 * 2. Over-fetch top_k * overfetch_factor neighbours from the index
 * 3. Re-read each candidate; drop anything no longer Approved/Hardened or
 *    embedded under another model
 * 4. Rank by similarity (default) or similarity * trust, ties by id
 * 5. Truncate to top_k
 */
class REEF_API SearchEngine {
public:
    SearchEngine(const PolypStore& store, const VectorIndex& index, EmbeddingProvider& embedder,
                 const SearchConfig& config = SearchConfig{});

    /**
     * @throws ModelUnavailableError, EmbeddingFailedError from the embedder
     */
    SearchResponse search(const std::string& query_text, const EmbeddingModelId& model,
                          const SearchOptions& options) const;

    SearchResponse search(const std::string& query_text, const EmbeddingModelId& model, size_t top_k) const;

    /**
     * @brief Search with an already embedded query
     * @throws ValidationError for a malformed embedding
     */
    SearchResponse search_vector(const VectorEmbedding& query, const SearchOptions& options) const;

    const SearchConfig& config() const { return config_; }

private:
    SearchResult to_result(const Polyp& polyp, double similarity) const;

    const PolypStore& store_;
    const VectorIndex& index_;
    EmbeddingProvider& embedder_;
    SearchConfig config_;
};

} // namespace Reef

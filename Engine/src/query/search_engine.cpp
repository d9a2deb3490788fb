/**
 * @file search_engine.cpp
 * @brief Search engine implementation
 */

#include <query/search_engine.hpp>
#include <core/lifecycle.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>

namespace Reef {

SearchEngine::SearchEngine(const PolypStore& store, const VectorIndex& index, EmbeddingProvider& embedder,
                           const SearchConfig& config)
    : store_(store), index_(index), embedder_(embedder), config_(config) {
    if (config_.overfetch_factor == 0) config_.overfetch_factor = 1;
}

SearchResponse SearchEngine::search(const std::string& query_text, const EmbeddingModelId& model,
                                    const SearchOptions& options) const {
    Timer timer;
    VectorEmbedding query = embedder_.embed(query_text, model);
    SearchResponse response = search_vector(query, options);
    response.search_time_ms = timer.elapsed_ms();
    return response;
}

SearchResponse SearchEngine::search(const std::string& query_text, const EmbeddingModelId& model,
                                    size_t top_k) const {
    SearchOptions options;
    options.top_k = top_k;
    options.rank_mode = config_.rank_mode;
    return search(query_text, model, options);
}

SearchResult SearchEngine::to_result(const Polyp& polyp, double similarity) const {
    SearchResult r;
    r.polyp_id = polyp.id;
    r.payload = polyp.subject.payload;
    r.similarity = similarity;
    r.trust_score = polyp.trust_score();
    r.creator_did = polyp.subject.provenance.creator.did;
    r.state = polyp.state;
    if (polyp.hardening) {
        r.cid = polyp.hardening->cid;
        r.hardened_epoch = polyp.hardening->epoch;
    }
    return r;
}

SearchResponse SearchEngine::search_vector(const VectorEmbedding& query, const SearchOptions& options) const {
    Timer timer;
    query.validate();

    SearchResponse response;
    if (options.top_k == 0) return response;

    if (index_.size(query.model_id) == 0) {
        Logger::warn("Search against empty model space " + query.model_id.key());
        response.empty_index = true;
        response.search_time_ms = timer.elapsed_ms();
        return response;
    }

    size_t candidate_k = options.top_k * config_.overfetch_factor;
    auto hits = index_.query(query.values, query.model_id, candidate_k, options.hardened_only);

    struct Ranked {
        SearchResult result;
        double key;
    };
    std::vector<Ranked> ranked;
    ranked.reserve(hits.size());

    for (const auto& hit : hits) {
        // The index may lag the store; the store decides what is live
        auto polyp = store_.find(hit.id);
        if (!polyp) continue;
        if (!is_searchable(polyp->state)) continue;
        if (polyp->subject.vector.model_id != query.model_id) continue;
        if (options.hardened_only && polyp->state != PolypState::Hardened) continue;
        if (polyp->trust_score() < options.min_trust) continue;

        Ranked r{to_result(*polyp, hit.similarity), hit.similarity};
        if (options.rank_mode == RankMode::TrustWeighted) {
            r.key = hit.similarity * r.result.trust_score;
        }
        ranked.push_back(std::move(r));
    }

    std::sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        if (a.key != b.key) return a.key > b.key;
        return a.result.polyp_id < b.result.polyp_id;
    });

    if (ranked.size() > options.top_k) ranked.resize(options.top_k);

    response.results.reserve(ranked.size());
    for (auto& r : ranked) response.results.push_back(std::move(r.result));
    response.search_time_ms = timer.elapsed_ms();

    Logger::debug("Search " + query.model_id.key() + ": " + std::to_string(hits.size()) + " candidates, " +
                  std::to_string(response.results.size()) + " results");
    return response;
}

} // namespace Reef

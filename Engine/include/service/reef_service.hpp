/**
 * @file reef_service.hpp
 * @brief Engine facade: ingestion, search, sweeps and finality
 */

#pragma once

#include <export.hpp>
#include <adapters/embedding_provider.hpp>
#include <adapters/proof_verifier.hpp>
#include <consensus/consensus_engine.hpp>
#include <consensus/epoch.hpp>
#include <consensus/vote_aggregation.hpp>
#include <core/config.hpp>
#include <index/vector_index.hpp>
#include <query/search_engine.hpp>
#include <reputation/reputation_registry.hpp>
#include <scoring/trust_scorer.hpp>
#include <storage/polyp_store.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Reef {

struct SubmitRequest {
    std::string text;
    std::string content_type = "text/plain";
    std::optional<std::string> language;
    std::optional<EmbeddingModelId> model_id; // first model of the embedder if unset
    SourceAttribution source;
};

/**
 * @brief What a client talks to
 *
 * Owns the derived state (index, scorer, engine, votes, reputation) and
 * shares the store and adapters with the caller. The ingestion pipeline is
 * sequential: embed, prove, create, evaluate.
 *
 * Example:
 * @code
 *   ReefService reef(config, store, embedder, verifier, prover, node);
 *   PolypId id = reef.submit({"The speed of light is 299792458 m/s"});
 *   reef.run_sweep(reef.context_at(0));
 *   reef.finalize_epoch(reef.context_at(config.blocks_per_epoch));
 *   auto hits = reef.search("how fast is light", 5);
 * @endcode
 */
class REEF_API ReefService {
public:
    ReefService(const ReefConfig& config,
                std::shared_ptr<PolypStore> store,
                std::shared_ptr<EmbeddingProvider> embedder,
                std::shared_ptr<ProofVerifier> verifier,
                std::shared_ptr<ProofProver> prover,
                NodeIdentity node);

    ReefService(const ReefService&) = delete;
    ReefService& operator=(const ReefService&) = delete;

    /**
     * @brief Embed, prove, store and evaluate a text
     *
     * The first failing step's error propagates unchanged. If verification is
     * unavailable the Polyp has already been stored and stays in Draft until
     * a sweep picks it up; the VerifierUnavailableError carries its id as
     * context. Submitting the same text again resumes that Draft instead of
     * storing a second copy.
     * @throws ModelUnavailableError, EmbeddingFailedError, ValidationError,
     *         VerifierUnavailableError
     */
    PolypId submit(const SubmitRequest& request, const EpochContext& ctx = EpochContext{});

    /**
     * @brief Store and evaluate a subject embedded and proven elsewhere
     *
     * A Draft from the same creator with the same text, vector and model is
     * re-evaluated rather than duplicated.
     * @throws ValidationError if the proof is not bound to the subject
     */
    PolypId ingest(const PolypSubject& subject, const ZkProof& proof, const EpochContext& ctx = EpochContext{});

    SearchResponse search(const std::string& query, size_t top_k,
                          const std::optional<EmbeddingModelId>& model = std::nullopt) const;

    SearchResponse search(const std::string& query, const EmbeddingModelId& model,
                          const SearchOptions& options) const;

    /**
     * @throws NotFoundError
     */
    Polyp get(const PolypId& id) const { return store_->get(id); }

    std::vector<AuditEntry> audit_log(const PolypId& id) const { return store_->audit_log(id); }

    SweepReport run_sweep(const EpochContext& ctx) { return engine_.sweep(ctx); }

    std::vector<Polyp> finalize_epoch(const EpochContext& ctx, const std::vector<Attestation>& attestations = {}) {
        return engine_.finalize_epoch(ctx, attestations);
    }

    Polyp confirm_finality(const PolypId& id, const FinalitySignal& signal) {
        return engine_.confirm_finality(id, signal);
    }

    Polyp molt(const PolypId& old_id, const PolypId& successor_id, const std::string& reason = "") {
        return engine_.molt(old_id, successor_id, reason);
    }

    /**
     * @brief Rebuild the index from the store (after a restart)
     */
    size_t rebuild_index() { return index_.rebuild(*store_); }

    /// Context for a block height, carrying this service's vote ledger
    EpochContext context_at(uint64_t block) const { return clock_.at_block(block, &votes_); }

    /// Default model for submissions and searches
    EmbeddingModelId default_model() const;

    const ReefConfig& config() const { return config_; }
    const NodeIdentity& node() const { return node_; }
    const EpochClock& clock() const { return clock_; }
    VectorIndex& index() { return index_; }
    const VectorIndex& index() const { return index_; }
    VoteLedger& votes() { return votes_; }
    ReputationRegistry& reputation() { return reputation_; }
    CentroidQualityHeuristic& centroids() { return *centroids_; }
    ConsensusEngine& engine() { return engine_; }
    PolypStore& store() { return *store_; }

private:
    /// Draft left behind by an earlier attempt at the same ingestion
    std::optional<PolypId> pending_draft(const PolypSubject& subject, const ZkProof& proof) const;

    ReefConfig config_;
    std::shared_ptr<PolypStore> store_;
    std::shared_ptr<EmbeddingProvider> embedder_;
    std::shared_ptr<ProofVerifier> verifier_;
    std::shared_ptr<ProofProver> prover_;
    NodeIdentity node_;

    EpochClock clock_;
    ReputationRegistry reputation_;
    std::shared_ptr<CentroidQualityHeuristic> centroids_;
    VectorIndex index_;
    VoteLedger votes_;
    TrustScorer scorer_;
    ConsensusEngine engine_;
    SearchEngine search_;
    std::mutex ingest_mutex_; // lookup and create of pending Drafts
};

} // namespace Reef

/**
 * @file reef_service.cpp
 * @brief Engine facade implementation
 */

#include <service/reef_service.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace Reef {

namespace {

template <typename T>
std::shared_ptr<T> require(std::shared_ptr<T> ptr, const char* what) {
    if (!ptr) throw ConfigError(std::string("ReefService requires ") + what);
    return ptr;
}

} // namespace

ReefService::ReefService(const ReefConfig& config,
                         std::shared_ptr<PolypStore> store,
                         std::shared_ptr<EmbeddingProvider> embedder,
                         std::shared_ptr<ProofVerifier> verifier,
                         std::shared_ptr<ProofProver> prover,
                         NodeIdentity node)
    : config_(config)
    , store_(require(std::move(store), "a store"))
    , embedder_(require(std::move(embedder), "an embedding provider"))
    , verifier_(require(std::move(verifier), "a proof verifier"))
    , prover_(require(std::move(prover), "a proof prover"))
    , node_(std::move(node))
    , clock_(config.blocks_per_epoch)
    , centroids_(std::make_shared<CentroidQualityHeuristic>())
    , index_(config.index)
    , scorer_(index_, *verifier_, reputation_, config_, nullptr, centroids_)
    , engine_(*store_, index_, scorer_, config_)
    , search_(*store_, index_, *embedder_, config.search) {
    config_.validate();
}

EmbeddingModelId ReefService::default_model() const {
    auto models = embedder_->models();
    if (models.empty()) {
        throw ModelUnavailableError("Embedding provider serves no models");
    }
    return models.front();
}

PolypId ReefService::submit(const SubmitRequest& request, const EpochContext& ctx) {
    Timer timer;
    EmbeddingModelId model = request.model_id ? *request.model_id : default_model();

    PolypSubject subject;
    subject.payload.content = request.text;
    subject.payload.content_type = request.content_type;
    subject.payload.language = request.language;
    subject.provenance.creator = node_;
    subject.provenance.source = request.source;
    if (subject.provenance.source.accessed_at == 0) {
        subject.provenance.source.accessed_at = now_ms();
    }

    // 1. Embed
    subject.vector = embedder_->embed(request.text, model);
    subject.provenance.pipeline.steps.push_back(PipelineStep{
        "embed", model.name,
        {{"provider", model.provider}, {"dimensions", std::to_string(model.dimensions)}}});

    // 2. Prove
    ZkProof proof = prover_->prove(request.text, subject.vector);
    subject.provenance.pipeline.steps.push_back(PipelineStep{"prove", proof.proof_type, {}});
    subject.provenance.pipeline.duration_ms = static_cast<uint64_t>(timer.elapsed_ms());

    // 3. Store and evaluate
    return ingest(subject, proof, ctx);
}

std::optional<PolypId> ReefService::pending_draft(const PolypSubject& subject, const ZkProof& proof) const {
    auto cursor = store_->list_by_state(PolypState::Draft);
    while (auto p = cursor.next()) {
        if (p->proof.text_hash == proof.text_hash &&
            p->proof.vector_hash == proof.vector_hash &&
            p->subject.vector.model_id == subject.vector.model_id &&
            p->subject.provenance.creator.did == subject.provenance.creator.did) {
            return p->id;
        }
    }
    return std::nullopt;
}

PolypId ReefService::ingest(const PolypSubject& subject, const ZkProof& proof, const EpochContext& ctx) {
    PolypId id;
    {
        std::lock_guard<std::mutex> lock(ingest_mutex_);
        if (auto pending = pending_draft(subject, proof)) {
            id = *pending;
            Logger::info("Resuming draft Polyp " + id.to_string());
        } else {
            id = store_->create(subject, proof);
            Logger::debug("Created Polyp " + id.to_string());
        }
    }

    try {
        engine_.evaluate(id, ctx, EvaluationTrigger::Ingestion);
    } catch (const VerifierUnavailableError& e) {
        Logger::warn("Polyp " + id.to_string() + " left in draft: " + e.what());
        throw VerifierUnavailableError("Proof verification deferred, Polyp stored in draft", id.to_string());
    }
    return id;
}

SearchResponse ReefService::search(const std::string& query, size_t top_k,
                                   const std::optional<EmbeddingModelId>& model) const {
    return search_.search(query, model ? *model : default_model(), top_k);
}

SearchResponse ReefService::search(const std::string& query, const EmbeddingModelId& model,
                                   const SearchOptions& options) const {
    return search_.search(query, model, options);
}

} // namespace Reef

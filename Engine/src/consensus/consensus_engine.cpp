/**
 * @file consensus_engine.cpp
 * @brief Lifecycle decisions, finality and sweeps
 */

#include <consensus/consensus_engine.hpp>
#include <consensus/vote_aggregation.hpp>
#include <core/errors.hpp>
#include <core/lifecycle.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <cstdio>

namespace Reef {

namespace {

std::string fmt_score(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}

} // namespace

ConsensusEngine::ConsensusEngine(PolypStore& store, VectorIndex& index, const TrustScorer& scorer,
                                 const ReefConfig& config)
    : store_(store), index_(index), scorer_(scorer), config_(config) {
    config_.validate();
}

// =============================================================================
// Decisions
// =============================================================================

ConsensusMetadata ConsensusEngine::fresh_metadata(const Polyp& polyp, const EpochContext& ctx) const {
    ConsensusMetadata md;
    if (polyp.consensus) {
        md.review_cycles = polyp.consensus->review_cycles;
    }
    md.epoch = ctx.epoch;
    md.scores = scorer_.score(polyp, ctx.epoch);
    md.composite = scorer_.composite(md.scores);
    md.final_score = md.composite;
    return md;
}

ConsensusEngine::Decision ConsensusEngine::decide_draft(const Polyp& polyp, const EpochContext& ctx) const {
    Decision d;
    ConsensusMetadata md = fresh_metadata(polyp, ctx);
    if (md.scores.zk_validity >= 1.0) {
        d.next = PolypState::Soft;
        d.update.reason = "proof verified, composite " + fmt_score(md.composite);
    } else {
        d.next = PolypState::Rejected;
        d.update.reason = "proof rejected";
    }
    d.update.consensus = std::move(md);
    return d;
}

std::optional<ConsensusEngine::Decision> ConsensusEngine::decide_soft(const Polyp& polyp, const EpochContext& ctx,
                                                                      EvaluationTrigger trigger) const {
    double composite = 0.0;
    std::optional<ConsensusMetadata> rescored;
    if (polyp.consensus && polyp.consensus->scores.complete()) {
        composite = polyp.consensus->composite;
    } else {
        rescored = fresh_metadata(polyp, ctx);
        composite = rescored->composite;
    }

    Decision d;
    d.next = PolypState::UnderReview;
    d.update.consensus = std::move(rescored);
    if (composite >= config_.lifecycle.review_threshold) {
        d.update.reason = "composite " + fmt_score(composite) + " reached review threshold";
        return d;
    }
    if (trigger == EvaluationTrigger::Sweep) {
        d.update.reason = "picked up by sweep";
        return d;
    }
    return std::nullopt;
}

ConsensusEngine::Decision ConsensusEngine::decide_review(const Polyp& polyp, const EpochContext& ctx) const {
    ConsensusMetadata md = fresh_metadata(polyp, ctx);

    if (ctx.votes) {
        auto votes = ctx.votes->votes(polyp.id);
        if (!votes.empty()) {
            md.final_score = stake_weighted_median(votes);
            md.validator_scores = std::move(votes);
        }
    }

    const auto& policy = config_.lifecycle;
    Decision d;
    if (md.final_score >= policy.approval_threshold && md.scores.novelty > policy.min_novelty) {
        d.next = PolypState::Approved;
        d.update.reason = "final score " + fmt_score(md.final_score) + ", novelty " + fmt_score(md.scores.novelty);
    } else {
        md.review_cycles++;
        std::string why = md.scores.novelty > policy.min_novelty
            ? "final score " + fmt_score(md.final_score) + " below approval threshold"
            : "duplicate of hardened knowledge";
        if (md.review_cycles >= policy.max_review_cycles) {
            d.next = PolypState::Rejected;
            d.update.reason = why + " after " + std::to_string(md.review_cycles) + " reviews";
        } else {
            d.next = PolypState::UnderReview;
            d.update.reason = why + ", review " + std::to_string(md.review_cycles) + " deferred";
        }
    }
    d.update.consensus = std::move(md);
    return d;
}

std::optional<ConsensusEngine::Decision> ConsensusEngine::decide(const Polyp& polyp, const EpochContext& ctx,
                                                                 EvaluationTrigger trigger) const {
    switch (polyp.state) {
        case PolypState::Draft:
            return decide_draft(polyp, ctx);
        case PolypState::Soft:
            return decide_soft(polyp, ctx, trigger);
        case PolypState::UnderReview:
            if (trigger == EvaluationTrigger::Sweep) return decide_review(polyp, ctx);
            return std::nullopt;
        default:
            // Approved waits for finality; terminal states never move
            return std::nullopt;
    }
}

// =============================================================================
// Evaluation
// =============================================================================

EvaluationOutcome ConsensusEngine::evaluate(const PolypId& id, const EpochContext& ctx, EvaluationTrigger trigger) {
    Polyp current = store_.get(id);

    EvaluationOutcome outcome;
    outcome.id = id;
    outcome.from = current.state;
    outcome.to = current.state;

    uint32_t conflicts = 0;
    bool reviewed = false;

    while (!is_terminal(current.state)) {
        // One review per evaluation, a deferral must wait for the next sweep
        if (reviewed && current.state == PolypState::UnderReview) break;

        auto decision = decide(current, ctx, trigger);
        if (!decision) break;

        PolypState from = current.state;
        try {
            current = store_.transition(id, from, decision->next, decision->update);
        } catch (const ConflictError& e) {
            if (++conflicts > config_.max_conflict_retries) throw;
            Logger::debug("Conflict on " + id.to_string() + ", re-reading: " + e.what());
            current = store_.get(id);
            continue;
        }

        if (from == PolypState::UnderReview) reviewed = true;
        outcome.changed = true;
        outcome.to = current.state;
        outcome.reason = decision->update.reason;

        if (current.state == PolypState::Rejected) {
            Logger::warn("Polyp " + id.to_string() + " rejected: " + outcome.reason);
        } else if (from != current.state) {
            Logger::info("Polyp " + id.to_string() + " " + state_name(from) + " -> " +
                         state_name(current.state) + ": " + outcome.reason);
        }

        if (is_searchable(current.state) || is_searchable(from)) {
            sync_index(current);
        }
    }

    outcome.to = current.state;
    return outcome;
}

void ConsensusEngine::sync_index(const Polyp& polyp) {
    if (!is_searchable(polyp.state)) {
        index_.remove(polyp.id);
        return;
    }
    index_.upsert(polyp.id, polyp.subject.vector,
                  polyp.state == PolypState::Hardened ? IndexTier::Hardened : IndexTier::Approved);

    // The copy may be stale by now: a molt or rejection that committed before
    // the upsert landed must not leave the entry behind
    auto latest = store_.find(polyp.id);
    if (!latest || !is_searchable(latest->state)) {
        index_.remove(polyp.id);
    } else if (latest->state != polyp.state) {
        index_.upsert(polyp.id, latest->subject.vector,
                      latest->state == PolypState::Hardened ? IndexTier::Hardened : IndexTier::Approved);
    }
}

// =============================================================================
// Finality
// =============================================================================

HardeningLineage ConsensusEngine::lineage(const Polyp& polyp, const MerkleTree& batch, size_t index,
                                          uint64_t epoch, const std::vector<Attestation>& attestations,
                                          const std::optional<std::string>& anchor_tx) const {
    HardeningLineage h;
    h.cid = content_id(polyp);
    h.merkle_root = batch.root();
    h.merkle_proof = batch.proof(index);
    h.attestations = attestations;
    h.anchor_tx = anchor_tx;
    h.epoch = epoch;
    h.hardened_at = now_ms();
    return h;
}

Polyp ConsensusEngine::confirm_finality(const PolypId& id, const FinalitySignal& signal) {
    Polyp polyp = store_.get(id);
    if (polyp.state == PolypState::Hardened) return polyp;
    if (polyp.state != PolypState::Approved) {
        throw InvalidTransitionError(std::string("Finality requires an Approved Polyp, found ") +
                                     state_name(polyp.state), id.to_string());
    }
    if (signal.attestations.size() < config_.lifecycle.min_attestations) {
        throw PolicyError("Finality signal has " + std::to_string(signal.attestations.size()) +
                          " attestations, " + std::to_string(config_.lifecycle.min_attestations) + " required",
                          id.to_string());
    }

    MerkleTree batch({MerkleTree::leaf(polyp.id.bytes().data(), polyp.id.bytes().size(), content_id(polyp))});

    TransitionUpdate update;
    update.hardening = lineage(polyp, batch, 0, signal.epoch, signal.attestations, signal.anchor_tx);
    ConsensusMetadata md = polyp.consensus.value_or(ConsensusMetadata{});
    md.hardened = true;
    md.finalized_at = update.hardening->hardened_at;
    update.consensus = std::move(md);
    update.reason = "finality confirmed by " + std::to_string(signal.attestations.size()) + " attestations";

    Polyp hardened;
    try {
        hardened = store_.transition(id, PolypState::Approved, PolypState::Hardened, update);
    } catch (const ConflictError&) {
        Polyp now = store_.get(id);
        if (now.state == PolypState::Hardened) return now;
        throw;
    }

    sync_index(hardened);
    Logger::success("Polyp " + id.to_string() + " hardened in epoch " + std::to_string(signal.epoch));
    return hardened;
}

std::vector<Polyp> ConsensusEngine::finalize_epoch(const EpochContext& ctx,
                                                   const std::vector<Attestation>& attestations) {
    std::vector<Polyp> batch;
    auto cursor = store_.list_by_state(PolypState::Approved);
    while (auto p = cursor.next()) {
        if (p->consensus && p->consensus->epoch < ctx.epoch) {
            batch.push_back(std::move(*p));
        }
    }
    if (batch.empty()) {
        Logger::debug("Epoch " + std::to_string(ctx.epoch) + ": nothing to finalize");
        return {};
    }

    std::vector<Hash256> leaves;
    leaves.reserve(batch.size());
    for (const auto& p : batch) {
        leaves.push_back(MerkleTree::leaf(p.id.bytes().data(), p.id.bytes().size(), content_id(p)));
    }
    MerkleTree tree(std::move(leaves));

    std::vector<Polyp> hardened;
    for (size_t i = 0; i < batch.size(); ++i) {
        const Polyp& p = batch[i];

        TransitionUpdate update;
        update.hardening = lineage(p, tree, i, ctx.epoch, attestations, std::nullopt);
        ConsensusMetadata md = p.consensus.value_or(ConsensusMetadata{});
        md.hardened = true;
        md.finalized_at = update.hardening->hardened_at;
        update.consensus = std::move(md);
        update.reason = "epoch " + std::to_string(ctx.epoch) + " finalization";

        try {
            hardened.push_back(store_.transition(p.id, PolypState::Approved, PolypState::Hardened, update));
        } catch (const ConflictError& e) {
            // Moved by another writer (molted or hardened on its own signal); its leaf stays in the root
            Logger::debug("Skipping " + p.id.to_string() + " in epoch finalization: " + e.what());
            continue;
        }
        sync_index(hardened.back());
    }

    Logger::success("Epoch " + std::to_string(ctx.epoch) + ": hardened " + std::to_string(hardened.size()) +
                    " Polyps, root " + BLAKE3Pipeline::to_hex(tree.root()).substr(0, 16));
    return hardened;
}

// =============================================================================
// Molting
// =============================================================================

Polyp ConsensusEngine::molt(const PolypId& old_id, const PolypId& successor_id, const std::string& reason) {
    if (old_id == successor_id) {
        throw ValidationError("A Polyp cannot supersede itself", old_id.to_string());
    }
    store_.get(successor_id);

    Polyp current = store_.get(old_id);
    uint32_t conflicts = 0;
    while (true) {
        if (is_terminal(current.state)) {
            throw InvalidTransitionError(std::string("Cannot molt a Polyp in state ") + state_name(current.state),
                                         old_id.to_string());
        }

        index_.remove(old_id);

        TransitionUpdate update;
        update.successor_id = successor_id;
        update.reason = reason.empty() ? "superseded by " + successor_id.to_string() : reason;
        try {
            Polyp molted = store_.transition(old_id, current.state, PolypState::Molted, update);
            // A concurrent sync may have re-added the entry between remove and commit
            index_.remove(old_id);
            Logger::info("Polyp " + old_id.to_string() + " molted, successor " + successor_id.to_string());
            return molted;
        } catch (const ConflictError& e) {
            current = store_.get(old_id);
            // Restore the entry if the record is still live and searchable
            if (is_searchable(current.state)) sync_index(current);
            if (++conflicts > config_.max_conflict_retries) throw;
            Logger::debug("Conflict molting " + old_id.to_string() + ", re-reading: " + e.what());
        }
    }
}

// =============================================================================
// Sweeps
// =============================================================================

SweepReport ConsensusEngine::sweep(const EpochContext& ctx) {
    std::vector<PolypId> ids;
    for (PolypState state : {PolypState::Draft, PolypState::Soft, PolypState::UnderReview}) {
        auto cursor = store_.list_by_state(state);
        while (auto p = cursor.next()) ids.push_back(p->id);
    }

    Logger::step("Sweep epoch " + std::to_string(ctx.epoch) + " (" + phase_name(ctx.phase) + "): " +
                 std::to_string(ids.size()) + " Polyps");
    if (ids.empty()) return SweepReport{};

    SweepReport report;
    {
        SweepScheduler scheduler(
            std::max<size_t>(1, std::min(config_.sweep_workers, ids.size())),
            [this, &ctx](const PolypId& id) { return evaluate(id, ctx, EvaluationTrigger::Sweep).changed; },
            config_.max_conflict_retries);
        for (const auto& id : ids) scheduler.enqueue(id);
        scheduler.wait_all();
        report = scheduler.report();
    }

    Logger::info("Sweep epoch " + std::to_string(ctx.epoch) + ": " + std::to_string(report.evaluated) +
                 " evaluated, " + std::to_string(report.changed) + " changed, " +
                 std::to_string(report.deferred) + " deferred, " + std::to_string(report.failed) + " failed");
    return report;
}

} // namespace Reef

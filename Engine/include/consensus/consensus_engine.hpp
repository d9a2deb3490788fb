/**
 * @file consensus_engine.hpp
 * @brief Drives Polyps through the hardening lifecycle
 */

#pragma once

#include <export.hpp>
#include <consensus/epoch.hpp>
#include <consensus/merkle_tree.hpp>
#include <consensus/sweep_scheduler.hpp>
#include <core/config.hpp>
#include <core/polyp.hpp>
#include <index/vector_index.hpp>
#include <scoring/trust_scorer.hpp>
#include <storage/polyp_store.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Reef {

enum class EvaluationTrigger {
    Ingestion, // right after create()
    Sweep      // scheduled re-evaluation
};

struct EvaluationOutcome {
    PolypId id;
    PolypState from = PolypState::Draft;
    PolypState to = PolypState::Draft;
    bool changed = false;
    std::string reason;
};

/**
 * @brief External evidence that an Approved Polyp is final
 */
struct FinalitySignal {
    uint64_t epoch = 0;
    std::vector<Attestation> attestations;
    std::optional<std::string> anchor_tx;
};

/**
 * @brief Lifecycle decisions on top of the store's compare-and-set
 *
 * Every decision re-reads the Polyp, decides from its current state and
 * commits with that state as the expectation. Losing a race means re-reading
 * and deciding again; a Polyp whose state no longer calls for a change is left
 * alone. The index is kept in step: Approved and Hardened Polyps are upserted,
 * anything else is removed.
 */
class REEF_API ConsensusEngine {
public:
    ConsensusEngine(PolypStore& store, VectorIndex& index, const TrustScorer& scorer,
                    const ReefConfig& config);

    /**
     * @brief Advance one Polyp as far as the trigger allows
     *
     * Ingestion walks Draft -> Soft -> UnderReview. A sweep additionally
     * reviews UnderReview Polyps once per call.
     * @throws NotFoundError, VerifierUnavailableError (Polyp stays where it was),
     *         ConflictError after max_conflict_retries lost races
     */
    EvaluationOutcome evaluate(const PolypId& id, const EpochContext& ctx, EvaluationTrigger trigger);

    /**
     * @brief Harden one Approved Polyp on an external finality signal
     *
     * Already Hardened: returned unchanged.
     * @throws PolicyError if the signal carries fewer than min_attestations
     * @throws InvalidTransitionError if the Polyp is not Approved
     */
    Polyp confirm_finality(const PolypId& id, const FinalitySignal& signal);

    /**
     * @brief Harden every Polyp approved before ctx.epoch as one batch
     *
     * One Merkle tree over the batch; each Polyp stores the root and its own
     * inclusion proof.
     * @return Polyps hardened by this call
     */
    std::vector<Polyp> finalize_epoch(const EpochContext& ctx,
                                      const std::vector<Attestation>& attestations = {});

    /**
     * @brief Supersede a non-terminal Polyp with an existing successor
     *
     * The index entry goes first so no search can return the old record as live.
     * @throws NotFoundError if either Polyp is missing
     * @throws InvalidTransitionError if the old Polyp is terminal
     */
    Polyp molt(const PolypId& old_id, const PolypId& successor_id, const std::string& reason);

    /**
     * @brief Evaluate every Draft, Soft and UnderReview Polyp on the worker pool
     *
     * Draft Polyps left behind by an unavailable verifier are retried here.
     */
    SweepReport sweep(const EpochContext& ctx);

    /**
     * @brief Make the index agree with the Polyp's current state
     */
    void sync_index(const Polyp& polyp);

private:
    struct Decision {
        PolypState next;
        TransitionUpdate update;
    };

    std::optional<Decision> decide(const Polyp& polyp, const EpochContext& ctx,
                                   EvaluationTrigger trigger) const;
    Decision decide_draft(const Polyp& polyp, const EpochContext& ctx) const;
    std::optional<Decision> decide_soft(const Polyp& polyp, const EpochContext& ctx,
                                        EvaluationTrigger trigger) const;
    Decision decide_review(const Polyp& polyp, const EpochContext& ctx) const;

    ConsensusMetadata fresh_metadata(const Polyp& polyp, const EpochContext& ctx) const;
    HardeningLineage lineage(const Polyp& polyp, const MerkleTree& batch, size_t index,
                             uint64_t epoch, const std::vector<Attestation>& attestations,
                             const std::optional<std::string>& anchor_tx) const;

    PolypStore& store_;
    VectorIndex& index_;
    const TrustScorer& scorer_;
    ReefConfig config_;
};

} // namespace Reef

/**
 * @file polyp_store.hpp
 * @brief Polyp persistence interface with optimistic state transitions
 */

#pragma once

#include <export.hpp>
#include <core/polyp.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Reef {

/**
 * @brief One recorded lifecycle transition
 */
struct AuditEntry {
    PolypId polyp_id;
    std::optional<PolypState> from_state; // nullopt for creation
    PolypState to_state = PolypState::Draft;
    uint64_t version = 0;
    std::string reason;
    std::string actor;
    Timestamp at = 0;
};

/**
 * @brief Metadata persisted together with a state change
 *
 * Fields left empty keep their stored value.
 */
struct TransitionUpdate {
    std::optional<ConsensusMetadata> consensus;
    std::optional<HardeningLineage> hardening;
    std::optional<PolypId> successor_id;
    std::string reason;
    std::string actor = "reef";
};

class PolypStore;

/**
 * @brief Lazy, restartable iteration over Polyps in one state, ascending id
 *
 * Fetches in batches; a cursor observes transitions that happen while it runs
 * (a Polyp leaving the state before its batch is fetched is skipped).
 */
class REEF_API PolypCursor {
public:
    PolypCursor(const PolypStore& store, PolypState state, size_t batch_size = 256);

    /**
     * @brief Next Polyp, or nullopt once exhausted
     */
    std::optional<Polyp> next();

    /**
     * @brief Restart iteration just after the given id
     */
    void resume_after(const PolypId& id);

    /// Last id handed out, usable to resume a new cursor later
    const std::optional<PolypId>& position() const { return after_; }

private:
    const PolypStore& store_;
    PolypState state_;
    size_t batch_size_;
    std::optional<PolypId> after_;
    std::vector<Polyp> buffer_;
    size_t pos_ = 0;
    bool exhausted_ = false;
};

/**
 * @brief Owner of Polyp records
 *
 * Implementations must be safe for concurrent use. Writes to one Polyp are
 * serialized by the expected-state check in transition(); independent Polyps
 * update in parallel.
 */
class REEF_API PolypStore {
public:
    virtual ~PolypStore() = default;

    /**
     * @brief Persist a new Polyp in Draft
     * @throws ValidationError if the subject is malformed or the proof is not bound to it
     */
    virtual PolypId create(const PolypSubject& subject, const ZkProof& proof) = 0;

    /**
     * @throws NotFoundError
     */
    virtual Polyp get(const PolypId& id) const = 0;

    virtual std::optional<Polyp> find(const PolypId& id) const = 0;

    /**
     * @brief Compare-and-set state change
     *
     * Succeeds only if the current state equals expected. On success the new
     * state and update fields persist atomically with a version bump and one
     * audit entry.
     * @throws NotFoundError, InvalidTransitionError, ConflictError
     */
    virtual Polyp transition(const PolypId& id, PolypState expected, PolypState next,
                             const TransitionUpdate& update) = 0;

    /**
     * @brief Up to limit Polyps in state with id > after, ascending id
     */
    virtual std::vector<Polyp> scan(PolypState state, const std::optional<PolypId>& after,
                                    size_t limit) const = 0;

    virtual size_t count(PolypState state) const = 0;

    virtual std::vector<AuditEntry> audit_log(const PolypId& id) const = 0;

    PolypCursor list_by_state(PolypState state, size_t batch_size = 256) const {
        return PolypCursor(*this, state, batch_size);
    }

protected:
    /**
     * @brief Shared creation checks: subject well-formed, proof bound to it
     * @throws ValidationError
     */
    static void validate_new(const PolypSubject& subject, const ZkProof& proof);

    /**
     * @brief Shared transition legality check
     * @throws InvalidTransitionError
     */
    static void check_transition(const PolypId& id, PolypState from, PolypState next);
};

} // namespace Reef

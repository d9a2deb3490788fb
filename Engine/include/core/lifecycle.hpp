/**
 * @file lifecycle.hpp
 * @brief Polyp lifecycle state machine
 *
 * Pure functions, independent of storage:
 *
 *   Draft --ProofVerified--> Soft --ReviewStarted--> UnderReview
 *   UnderReview --ReviewPassed--> Approved --FinalityConfirmed--> Hardened
 *   UnderReview --ReviewDeferred--> UnderReview
 *   Draft --ProofRejected--> Rejected, UnderReview --ReviewFailed--> Rejected
 *   any non-terminal --Superseded--> Molted
 */

#pragma once

#include <export.hpp>
#include <core/polyp.hpp>
#include <optional>

namespace Reef {

enum class LifecycleEvent : uint8_t {
    ProofVerified,
    ProofRejected,
    ReviewStarted,
    ReviewPassed,
    ReviewDeferred,
    ReviewFailed,
    FinalityConfirmed,
    Superseded
};

REEF_API const char* event_name(LifecycleEvent event);

REEF_API std::optional<PolypState> next_state(PolypState state, LifecycleEvent event) noexcept;

/**
 * @throws InvalidTransitionError if the event does not apply to the state
 */
REEF_API PolypState apply_event(PolypState state, LifecycleEvent event);

/**
 * @brief Whether some event moves `from` to `to`
 */
REEF_API bool transition_allowed(PolypState from, PolypState to) noexcept;

/// Rejected, Hardened and Molted admit no further transitions
REEF_API bool is_terminal(PolypState state) noexcept;

/// Approved and Hardened Polyps are visible to search
REEF_API bool is_searchable(PolypState state) noexcept;

} // namespace Reef

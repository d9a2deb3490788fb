/**
 * @file lifecycle.cpp
 * @brief Lifecycle transition table
 */

#include <core/lifecycle.hpp>
#include <core/errors.hpp>

namespace Reef {

const char* event_name(LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::ProofVerified:     return "proof_verified";
        case LifecycleEvent::ProofRejected:     return "proof_rejected";
        case LifecycleEvent::ReviewStarted:     return "review_started";
        case LifecycleEvent::ReviewPassed:      return "review_passed";
        case LifecycleEvent::ReviewDeferred:    return "review_deferred";
        case LifecycleEvent::ReviewFailed:      return "review_failed";
        case LifecycleEvent::FinalityConfirmed: return "finality_confirmed";
        case LifecycleEvent::Superseded:        return "superseded";
    }
    return "unknown";
}

bool is_terminal(PolypState state) noexcept {
    return state == PolypState::Rejected ||
           state == PolypState::Hardened ||
           state == PolypState::Molted;
}

bool is_searchable(PolypState state) noexcept {
    return state == PolypState::Approved || state == PolypState::Hardened;
}

std::optional<PolypState> next_state(PolypState state, LifecycleEvent event) noexcept {
    if (is_terminal(state)) return std::nullopt;

    if (event == LifecycleEvent::Superseded) return PolypState::Molted;

    switch (state) {
        case PolypState::Draft:
            if (event == LifecycleEvent::ProofVerified) return PolypState::Soft;
            if (event == LifecycleEvent::ProofRejected) return PolypState::Rejected;
            break;
        case PolypState::Soft:
            if (event == LifecycleEvent::ReviewStarted) return PolypState::UnderReview;
            break;
        case PolypState::UnderReview:
            if (event == LifecycleEvent::ReviewPassed) return PolypState::Approved;
            if (event == LifecycleEvent::ReviewDeferred) return PolypState::UnderReview;
            if (event == LifecycleEvent::ReviewFailed) return PolypState::Rejected;
            break;
        case PolypState::Approved:
            if (event == LifecycleEvent::FinalityConfirmed) return PolypState::Hardened;
            break;
        default:
            break;
    }
    return std::nullopt;
}

PolypState apply_event(PolypState state, LifecycleEvent event) {
    auto next = next_state(state, event);
    if (!next) {
        throw InvalidTransitionError(std::string("Event ") + event_name(event) +
                                     " does not apply to state " + state_name(state));
    }
    return *next;
}

bool transition_allowed(PolypState from, PolypState to) noexcept {
    static const LifecycleEvent events[] = {
        LifecycleEvent::ProofVerified, LifecycleEvent::ProofRejected,
        LifecycleEvent::ReviewStarted, LifecycleEvent::ReviewPassed,
        LifecycleEvent::ReviewDeferred, LifecycleEvent::ReviewFailed,
        LifecycleEvent::FinalityConfirmed, LifecycleEvent::Superseded
    };
    for (LifecycleEvent e : events) {
        auto next = next_state(from, e);
        if (next && *next == to) return true;
    }
    return false;
}

} // namespace Reef

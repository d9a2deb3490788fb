#include <consensus/epoch.hpp>
#include <core/errors.hpp>

namespace Reef {

const char* phase_name(EpochPhase phase) {
    switch (phase) {
        case EpochPhase::Open:       return "open";
        case EpochPhase::Scoring:    return "scoring";
        case EpochPhase::Committing: return "committing";
    }
    return "unknown";
}

EpochClock::EpochClock(uint64_t blocks_per_epoch) : blocks_per_epoch_(blocks_per_epoch) {
    if (blocks_per_epoch_ == 0) {
        throw ConfigError("blocks_per_epoch must be at least 1");
    }
}

EpochPhase EpochClock::phase_of(uint64_t block) const {
    const uint64_t offset = block % blocks_per_epoch_;
    // Integer comparisons: offset/len < 1/2 and < 3/4
    if (offset * 2 < blocks_per_epoch_) return EpochPhase::Open;
    if (offset * 4 < blocks_per_epoch_ * 3) return EpochPhase::Scoring;
    return EpochPhase::Committing;
}

EpochContext EpochClock::at_block(uint64_t block, const VoteLedger* votes) const {
    EpochContext ctx;
    ctx.epoch = epoch_of(block);
    ctx.block = block;
    ctx.phase = phase_of(block);
    ctx.votes = votes;
    return ctx;
}

} // namespace Reef

/**
 * @file epoch.hpp
 * @brief Epoch numbering and phases derived from block height
 */

#pragma once

#include <export.hpp>
#include <cstdint>

namespace Reef {

class VoteLedger;

enum class EpochPhase {
    Open,       // first half: submissions
    Scoring,    // up to 75%: validators score
    Committing  // remainder: results committed
};

REEF_API const char* phase_name(EpochPhase phase);

/**
 * @brief Consensus context passed explicitly into every evaluation
 */
struct EpochContext {
    uint64_t epoch = 0;
    uint64_t block = 0;
    EpochPhase phase = EpochPhase::Open;
    const VoteLedger* votes = nullptr; // validator votes for this epoch, optional
};

class REEF_API EpochClock {
public:
    explicit EpochClock(uint64_t blocks_per_epoch = 360);

    uint64_t blocks_per_epoch() const { return blocks_per_epoch_; }

    uint64_t epoch_of(uint64_t block) const { return block / blocks_per_epoch_; }

    uint64_t epoch_start(uint64_t epoch) const { return epoch * blocks_per_epoch_; }

    EpochPhase phase_of(uint64_t block) const;

    /// True for the first block of an epoch
    bool is_boundary(uint64_t block) const { return block % blocks_per_epoch_ == 0; }

    EpochContext at_block(uint64_t block, const VoteLedger* votes = nullptr) const;

private:
    uint64_t blocks_per_epoch_;
};

} // namespace Reef

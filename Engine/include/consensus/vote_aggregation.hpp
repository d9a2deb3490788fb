/**
 * @file vote_aggregation.hpp
 * @brief Validator votes and their stake-weighted aggregation
 */

#pragma once

#include <export.hpp>
#include <core/polyp.hpp>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace Reef {

/**
 * @brief Stake-weighted consensus score
 *
 * The highest score that validators holding at least `kappa` of the total
 * stake scored at or above. kappa = 0.5 gives the stake-weighted (upper)
 * median. If every stake is zero, votes count equally.
 * @throws PolicyError for an empty vote set or kappa outside (0,1]
 */
REEF_API double stake_weighted_median(std::vector<ValidatorScore> votes, double kappa = 0.5);

/**
 * @brief Votes cast in one epoch, keyed by Polyp
 */
class REEF_API VoteLedger {
public:
    /**
     * @brief Record a vote, replacing an earlier vote by the same validator
     */
    void cast(const PolypId& id, const ValidatorScore& vote);

    std::vector<ValidatorScore> votes(const PolypId& id) const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<PolypId, std::vector<ValidatorScore>, PolypIdHash> votes_;
};

} // namespace Reef

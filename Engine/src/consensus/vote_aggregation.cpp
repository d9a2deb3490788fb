#include <consensus/vote_aggregation.hpp>
#include <core/errors.hpp>
#include <algorithm>

namespace Reef {

double stake_weighted_median(std::vector<ValidatorScore> votes, double kappa) {
    if (votes.empty()) {
        throw PolicyError("No validator votes to aggregate");
    }
    if (!(kappa > 0.0 && kappa <= 1.0)) {
        throw PolicyError("kappa must be within (0,1]", std::to_string(kappa));
    }

    long double total = 0;
    for (const auto& v : votes) total += v.stake;
    const bool equal_weight = total == 0;
    if (equal_weight) total = static_cast<long double>(votes.size());

    std::sort(votes.begin(), votes.end(), [](const ValidatorScore& a, const ValidatorScore& b) {
        return a.score > b.score;
    });

    const long double needed = kappa * total;
    long double support = 0;
    for (const auto& v : votes) {
        support += equal_weight ? 1 : v.stake;
        if (support >= needed) return PolypScores::clamp_unit(v.score);
    }
    return PolypScores::clamp_unit(votes.back().score);
}

void VoteLedger::cast(const PolypId& id, const ValidatorScore& vote) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = votes_[id];
    auto it = std::find_if(list.begin(), list.end(), [&](const ValidatorScore& v) {
        return v.validator_did == vote.validator_did;
    });
    if (it != list.end()) {
        *it = vote;
    } else {
        list.push_back(vote);
    }
}

std::vector<ValidatorScore> VoteLedger::votes(const PolypId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = votes_.find(id);
    return it == votes_.end() ? std::vector<ValidatorScore>{} : it->second;
}

void VoteLedger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    votes_.clear();
}

} // namespace Reef

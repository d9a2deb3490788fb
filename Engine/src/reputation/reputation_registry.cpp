/**
 * @file reputation_registry.cpp
 * @brief Reputation decay and lookup
 */

#include <reputation/reputation_registry.hpp>
#include <algorithm>
#include <cmath>
#include <mutex>

namespace Reef {

double DecayPolicy::apply(double value, uint64_t elapsed_epochs) const {
    const double elapsed = static_cast<double>(elapsed_epochs);
    switch (kind) {
        case Kind::None:
            return value;
        case Kind::Exponential:
            if (half_life <= 0.0) return 0.0;
            return value * std::pow(0.5, elapsed / half_life);
        case Kind::Linear:
            return std::max(0.0, value - rate * elapsed);
    }
    return value;
}

ReputationRegistry::ReputationRegistry(DecayPolicy decay) : decay_(decay) {}

void ReputationRegistry::record(const std::string& did, double reputation, uint64_t epoch) {
    double v = std::isfinite(reputation) ? std::clamp(reputation, 0.0, 1.0) : 0.0;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[did] = Entry{v, epoch};
}

std::optional<double> ReputationRegistry::reputation(const std::string& did, uint64_t current_epoch) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(did);
    if (it == entries_.end()) return std::nullopt;

    uint64_t elapsed = current_epoch > it->second.epoch ? current_epoch - it->second.epoch : 0;
    return decay_.apply(it->second.value, elapsed);
}

void ReputationRegistry::forget(const std::string& did) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.erase(did);
}

size_t ReputationRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

} // namespace Reef

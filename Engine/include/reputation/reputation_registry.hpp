/**
 * @file reputation_registry.hpp
 * @brief Creator reputation lookup with epoch-based decay
 */

#pragma once

#include <export.hpp>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace Reef {

/**
 * @brief How a recorded reputation fades with epochs elapsed
 *
 * Exponential: value * 0.5^(elapsed / half_life), 0 when half_life is 0.
 * Linear: max(0, value - rate * elapsed).
 */
struct REEF_API DecayPolicy {
    enum class Kind { None, Exponential, Linear };

    Kind kind = Kind::None;
    double half_life = 0.0;
    double rate = 0.0;

    static DecayPolicy exponential(double half_life_epochs) { return {Kind::Exponential, half_life_epochs, 0.0}; }
    static DecayPolicy linear(double rate_per_epoch) { return {Kind::Linear, 0.0, rate_per_epoch}; }

    double apply(double value, uint64_t elapsed_epochs) const;
};

/**
 * @brief DID -> reputation in [0,1], thread-safe
 */
class REEF_API ReputationRegistry {
public:
    explicit ReputationRegistry(DecayPolicy decay = DecayPolicy{});

    /**
     * @brief Record a reputation observed at an epoch (clamped to [0,1])
     */
    void record(const std::string& did, double reputation, uint64_t epoch);

    /**
     * @brief Decayed reputation as of current_epoch, nullopt for unknown DIDs
     */
    std::optional<double> reputation(const std::string& did, uint64_t current_epoch) const;

    void forget(const std::string& did);

    size_t size() const;

private:
    struct Entry {
        double value;
        uint64_t epoch;
    };

    DecayPolicy decay_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace Reef

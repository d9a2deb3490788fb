/**
 * @file time.hpp
 * @brief Wall-clock timestamps and latency timing
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace Reef {

/// Wall-clock time as Unix milliseconds.
using Timestamp = int64_t;

/**
 * @brief Current wall-clock time in Unix milliseconds.
 */
inline Timestamp now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief High-resolution timer for measuring pipeline and query latency.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    /// Fractional milliseconds since construction
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

private:
    TimePoint start_;
};

} // namespace Reef

#pragma once

#include <core/errors.hpp>
#include <core/polyp_id.hpp>
#include <utils/logger.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace Reef {

struct SweepReport {
    size_t evaluated = 0; // units that ran to completion
    size_t changed = 0;   // of those, units that moved their Polyp
    size_t deferred = 0;  // transient failures (verifier/model unavailable), left for the next sweep
    size_t failed = 0;
};

/**
 * @brief Multi-worker pool draining a queue of Polyp evaluations.
 *
 * Each unit is idempotent. A unit that loses an optimistic-concurrency race
 * (ConflictError) is retried with exponential backoff; transient adapter
 * outages are counted as deferred; anything else is logged and counted as
 * failed.
 */
class SweepScheduler {
public:
    /// Evaluates one Polyp, returns whether its state changed
    using Unit = std::function<bool(const PolypId&)>;

    SweepScheduler(size_t num_workers, Unit unit, uint32_t max_attempts = 4, size_t queue_limit = 1024)
        : unit_(std::move(unit)), max_attempts_(max_attempts == 0 ? 1 : max_attempts), queue_limit_(queue_limit) {
        workers_.reserve(num_workers);
        for (size_t i = 0; i < num_workers; ++i)
            workers_.emplace_back(&SweepScheduler::worker, this);
    }

    ~SweepScheduler() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& t : workers_)
            if (t.joinable()) t.join();
    }

    SweepScheduler(const SweepScheduler&) = delete;
    SweepScheduler& operator=(const SweepScheduler&) = delete;

    /**
     * @brief Enqueue a Polyp for evaluation.
     * Blocks while the queue is full (backpressure).
     */
    void enqueue(const PolypId& id) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return queue_.size() < queue_limit_ || stop_; });
            if (stop_) return;
            queue_.push(id);
        }
        cv_.notify_all();
    }

    /**
     * @brief Block until every enqueued unit has finished.
     */
    void wait_all() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return queue_.empty() && workers_busy_ == 0; });
    }

    SweepReport report() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return report_;
    }

private:
    enum class Result { Unchanged, Changed, Deferred, Failed };

    Result run(const PolypId& id) {
        for (uint32_t attempt = 0; attempt < max_attempts_; ++attempt) {
            try {
                return unit_(id) ? Result::Changed : Result::Unchanged;
            } catch (const ConflictError& e) {
                if (attempt + 1 >= max_attempts_) {
                    Logger::error("Sweep gave up on " + id.to_string() + " after repeated conflicts: " + e.what());
                    return Result::Failed;
                }
                // Backoff: 5-15ms, 10-30ms, 20-60ms
                int base_ms = 5 * (1 << attempt);
                std::this_thread::sleep_for(std::chrono::milliseconds(
                    base_ms + (std::hash<std::thread::id>{}(std::this_thread::get_id()) % (base_ms * 2))));
            } catch (const ReefError& e) {
                if (e.retryable()) {
                    Logger::warn("Sweep deferred " + id.to_string() + ": " + e.what());
                    return Result::Deferred;
                }
                Logger::error("Sweep failed on " + id.to_string() + ": " + e.what());
                return Result::Failed;
            } catch (const std::exception& e) {
                Logger::error("Sweep failed on " + id.to_string() + ": " + e.what());
                return Result::Failed;
            }
        }
        return Result::Failed;
    }

    void worker() {
        while (true) {
            PolypId id;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || stop_; });
                if (stop_ && queue_.empty()) break;
                id = queue_.front();
                queue_.pop();
                workers_busy_++;
            }
            cv_.notify_all();

            Result result = run(id);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                switch (result) {
                    case Result::Changed:   report_.evaluated++; report_.changed++; break;
                    case Result::Unchanged: report_.evaluated++; break;
                    case Result::Deferred:  report_.deferred++; break;
                    case Result::Failed:    report_.failed++; break;
                }
                workers_busy_--;
            }
            cv_.notify_all();
        }
    }

    Unit unit_;
    uint32_t max_attempts_;
    size_t queue_limit_;

    std::queue<PolypId> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> workers_;
    bool stop_ = false;
    int workers_busy_ = 0;
    SweepReport report_;
};

} // namespace Reef

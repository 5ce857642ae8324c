#pragma once

#include "limiter/irate_limit_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ratekeeper {

enum class WaitOutcome {
    ACQUIRED,
    TIMED_OUT,
    CANCELLED,
    QUEUE_FULL
};

inline const char* wait_outcome_to_string(WaitOutcome outcome) {
    switch (outcome) {
        case WaitOutcome::ACQUIRED:   return "acquired";
        case WaitOutcome::TIMED_OUT:  return "timed_out";
        case WaitOutcome::CANCELLED:  return "cancelled";
        case WaitOutcome::QUEUE_FULL: return "queue_full";
        default:                      return "unknown";
    }
}

/**
 * @brief Blocking acquire-with-timeout over a rate limit store
 *
 * When a slot is not available the caller sleeps for
 * min(get_wait_time, poll_interval, time left) and retries acquire(). The
 * store is never mutated by a wait that does not acquire.
 *
 * cancel() wakes every wait in progress; those return CANCELLED. Waits
 * started afterwards are unaffected.
 */
class WaitableRateLimiter {
public:
    struct Config {
        std::chrono::milliseconds poll_interval{250};
        uint32_t max_waiters = 1000;
    };

    struct WaitResult {
        WaitOutcome outcome = WaitOutcome::TIMED_OUT;
        uint32_t attempts = 0;
        std::chrono::milliseconds waited{0};

        [[nodiscard]] bool acquired() const { return outcome == WaitOutcome::ACQUIRED; }
    };

    WaitableRateLimiter(std::shared_ptr<IRateLimitStore> store, const Config& config);
    WaitableRateLimiter(std::shared_ptr<IAdaptiveRateLimitStore> store, const Config& config);
    ~WaitableRateLimiter();

    WaitableRateLimiter(const WaitableRateLimiter&) = delete;
    WaitableRateLimiter& operator=(const WaitableRateLimiter&) = delete;

    /**
     * @param priority Ignored when wrapping a non-adaptive store
     * @throws Whatever the store throws (validation, destroyed, backend)
     */
    [[nodiscard]] WaitResult acquire_or_wait(const std::string& resource,
                                             std::optional<Priority> priority,
                                             std::chrono::milliseconds timeout);

    void cancel();

    [[nodiscard]] uint64_t waited_total() const { return total_waited_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t wait_timeouts() const { return total_timeouts_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t wait_cancellations() const { return total_cancelled_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint32_t current_waiters() const { return current_waiters_.load(std::memory_order_relaxed); }

private:
    /**
     * @brief Count one more waiter unless max_waiters are already waiting
     */
    [[nodiscard]] bool try_reserve_waiter();

    using AcquireFn = std::function<bool(const std::string&, std::optional<Priority>)>;
    using WaitTimeFn = std::function<int64_t(const std::string&, std::optional<Priority>)>;

    WaitResult finish(WaitResult result, std::chrono::steady_clock::time_point started);

    AcquireFn acquire_;
    WaitTimeFn wait_time_;
    Config config_;

    std::atomic<uint32_t> current_waiters_{0};
    std::atomic<uint64_t> total_waited_{0};
    std::atomic<uint64_t> total_timeouts_{0};
    std::atomic<uint64_t> total_cancelled_{0};

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    uint64_t cancel_generation_ = 0;  // Guarded by wait_mutex_
};

} // namespace ratekeeper

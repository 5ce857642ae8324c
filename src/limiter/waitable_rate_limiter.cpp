#include "limiter/waitable_rate_limiter.hpp"

#include <algorithm>

namespace ratekeeper {

namespace {

// Leaves the waiter count on every exit path, store exceptions included
struct WaiterGuard {
    std::atomic<uint32_t>& waiters;
    ~WaiterGuard() { waiters.fetch_sub(1, std::memory_order_relaxed); }
};

} // anonymous namespace

WaitableRateLimiter::WaitableRateLimiter(std::shared_ptr<IRateLimitStore> store,
                                         const Config& config)
    : config_(config) {
    acquire_ = [store](const std::string& resource, std::optional<Priority>) {
        return store->acquire(resource);
    };
    wait_time_ = [store](const std::string& resource, std::optional<Priority>) {
        return store->get_wait_time(resource);
    };
}

WaitableRateLimiter::WaitableRateLimiter(std::shared_ptr<IAdaptiveRateLimitStore> store,
                                         const Config& config)
    : config_(config) {
    acquire_ = [store](const std::string& resource, std::optional<Priority> priority) {
        return store->acquire(resource, priority);
    };
    wait_time_ = [store](const std::string& resource, std::optional<Priority> priority) {
        return store->get_wait_time(resource, priority);
    };
}

WaitableRateLimiter::~WaitableRateLimiter() {
    cancel();
}

WaitableRateLimiter::WaitResult WaitableRateLimiter::acquire_or_wait(
    const std::string& resource,
    std::optional<Priority> priority,
    std::chrono::milliseconds timeout) {

    const auto started = std::chrono::steady_clock::now();
    WaitResult result;

    // Fast path
    ++result.attempts;
    if (acquire_(resource, priority)) {
        result.outcome = WaitOutcome::ACQUIRED;
        return finish(result, started);
    }
    if (timeout <= std::chrono::milliseconds::zero()) {
        result.outcome = WaitOutcome::TIMED_OUT;
        total_timeouts_.fetch_add(1, std::memory_order_relaxed);
        return finish(result, started);
    }

    // The generation is taken before the waiter is visible to cancel()
    std::unique_lock lock(wait_mutex_);
    if (!try_reserve_waiter()) {
        lock.unlock();
        result.outcome = WaitOutcome::QUEUE_FULL;
        return finish(result, started);
    }
    WaiterGuard waiter{current_waiters_};
    const uint64_t generation = cancel_generation_;
    total_waited_.fetch_add(1, std::memory_order_relaxed);

    const auto deadline = started + timeout;

    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left <= std::chrono::milliseconds::zero()) {
            result.outcome = WaitOutcome::TIMED_OUT;
            break;
        }

        // Ask the store while unlocked so cancel() never waits on I/O
        lock.unlock();
        const int64_t hint_ms = wait_time_(resource, priority);
        lock.lock();

        auto pause = std::min({std::chrono::milliseconds(std::max<int64_t>(hint_ms, 1)),
                               config_.poll_interval, left});
        if (wait_cv_.wait_for(lock, pause, [&] { return cancel_generation_ != generation; })) {
            result.outcome = WaitOutcome::CANCELLED;
            break;
        }

        lock.unlock();
        ++result.attempts;
        const bool acquired = acquire_(resource, priority);
        lock.lock();

        if (acquired) {
            result.outcome = WaitOutcome::ACQUIRED;
            break;
        }
    }
    lock.unlock();

    if (result.outcome == WaitOutcome::TIMED_OUT) {
        total_timeouts_.fetch_add(1, std::memory_order_relaxed);
    } else if (result.outcome == WaitOutcome::CANCELLED) {
        total_cancelled_.fetch_add(1, std::memory_order_relaxed);
    }
    return finish(result, started);
}

bool WaitableRateLimiter::try_reserve_waiter() {
    uint32_t current = current_waiters_.load(std::memory_order_relaxed);
    while (current < config_.max_waiters) {
        if (current_waiters_.compare_exchange_weak(current, current + 1,
                                                   std::memory_order_relaxed)) {
            return true;
        }
    }
    return false;
}

void WaitableRateLimiter::cancel() {
    {
        std::lock_guard lock(wait_mutex_);
        ++cancel_generation_;
    }
    wait_cv_.notify_all();
}

WaitableRateLimiter::WaitResult WaitableRateLimiter::finish(
    WaitResult result, std::chrono::steady_clock::time_point started) {
    result.waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

} // namespace ratekeeper

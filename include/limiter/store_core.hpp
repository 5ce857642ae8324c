#pragma once

#include "backend/irate_limit_backend.hpp"
#include "limiter/cooldown_store.hpp"
#include "limiter/resource_config_registry.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ratekeeper {

/**
 * @brief State shared by both store front-ends
 *
 * Owns the backend, the resource config registry, the cooldown store, the
 * destroyed flag and the optional cleanup worker. The worker wakes every
 * cleanup_interval_ms (0 disables it) and is only started for backends
 * without native expiry.
 */
class StoreCore {
public:
    struct Options {
        RateLimitConfig default_config = kDefaultRateLimit;
        std::unordered_map<std::string, RateLimitConfig> resource_configs;
        int64_t cleanup_interval_ms = 60000;
    };

    StoreCore(std::unique_ptr<IRateLimitBackend> backend, Options options);
    ~StoreCore();

    StoreCore(const StoreCore&) = delete;
    StoreCore& operator=(const StoreCore&) = delete;

    /**
     * @throws StoreDestroyedError after close()
     */
    void ensure_open() const;

    [[nodiscard]] bool is_closed() const { return closed_.load(std::memory_order_acquire); }

    [[nodiscard]] IRateLimitBackend& backend() { return *backend_; }
    [[nodiscard]] ResourceConfigRegistry& configs() { return configs_; }
    [[nodiscard]] CooldownStore& cooldowns() { return cooldowns_; }
    [[nodiscard]] const BackendCapabilities& capabilities() const { return capabilities_; }

    /**
     * @throws UnsupportedOperationError when the backend does not list records
     */
    [[nodiscard]] StoreStats get_stats();
    [[nodiscard]] std::vector<ResourceUsage> list_resources();

    /**
     * @brief Purge expired records, slot claims and cooldowns now
     * @return Number of entries removed
     */
    size_t cleanup();

    /**
     * @return false if already closed
     */
    bool close();

private:
    void cleanup_loop();
    void require_listing() const;

    std::unique_ptr<IRateLimitBackend> backend_;
    BackendCapabilities capabilities_;
    ResourceConfigRegistry configs_;
    CooldownStore cooldowns_;
    int64_t cleanup_interval_ms_;

    std::atomic<bool> closed_{false};

    // Cleanup worker
    std::thread cleanup_thread_;
    std::atomic<bool> running_{false};
    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cv_;
};

} // namespace ratekeeper

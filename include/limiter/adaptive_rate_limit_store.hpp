#pragma once

#include "adaptive/activity_metrics.hpp"
#include "adaptive/adaptive_config.hpp"
#include "adaptive/capacity_calculator.hpp"
#include "limiter/irate_limit_store.hpp"
#include "limiter/store_core.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace ratekeeper {

/**
 * @brief Store that splits each resource's limit between user and background traffic
 *
 * The split comes from AdaptiveCapacityCalculator over the store's own
 * ActivityMetricsTracker. A resource's history is hydrated from the backend
 * the first time the store evaluates its capacity, so a restarted process
 * on a persistent backend picks up where the previous one left off.
 */
class AdaptiveRateLimitStore : public IAdaptiveRateLimitStore {
public:
    struct Options {
        RateLimitConfig default_config = kDefaultRateLimit;
        std::unordered_map<std::string, RateLimitConfig> resource_configs;
        int64_t cleanup_interval_ms = 60000;
        AdaptiveConfig adaptive;
    };

    explicit AdaptiveRateLimitStore(std::unique_ptr<IRateLimitBackend> backend,
                                    Options options = {});
    ~AdaptiveRateLimitStore() override = default;

    [[nodiscard]] bool can_proceed(const std::string& resource,
                                   std::optional<Priority> priority = std::nullopt) override;
    [[nodiscard]] bool acquire(const std::string& resource,
                               std::optional<Priority> priority = std::nullopt) override;
    void record(const std::string& resource,
                std::optional<Priority> priority = std::nullopt) override;

    /**
     * @brief Remaining capacity plus the current allocation
     *
     * Without a priority, remaining is limit minus all in-window records.
     * With one, it is that priority's share minus its own records (0 while
     * background is paused).
     */
    [[nodiscard]] RateLimitStatus get_status(const std::string& resource,
                                             std::optional<Priority> priority = std::nullopt) override;

    /**
     * @brief As IRateLimitStore::get_wait_time, against the priority's share
     *
     * A paused background waits recalculation_interval_ms, the earliest the
     * allocation can change.
     */
    [[nodiscard]] int64_t get_wait_time(const std::string& resource,
                                        std::optional<Priority> priority = std::nullopt) override;

    void reset(const std::string& resource) override;
    void clear() override;

    void set_resource_config(const std::string& resource,
                             const RateLimitConfig& config) override;
    [[nodiscard]] RateLimitConfig get_resource_config(const std::string& resource) override;

    void set_cooldown(const std::string& origin, int64_t until_ms) override;
    [[nodiscard]] std::optional<int64_t> get_cooldown(const std::string& origin) override;
    void clear_cooldown(const std::string& origin) override;

    void close() override;

    [[nodiscard]] StoreStats get_stats() { return core_.get_stats(); }
    [[nodiscard]] std::vector<ResourceUsage> list_resources() { return core_.list_resources(); }
    size_t cleanup() { return core_.cleanup(); }

    [[nodiscard]] const BackendCapabilities& capabilities() const { return core_.capabilities(); }
    [[nodiscard]] std::string_view backend_name() { return core_.backend().name(); }
    [[nodiscard]] const AdaptiveConfig& adaptive_config() const { return calculator_.config(); }

private:
    RateLimitConfig prepare(const std::string& resource);

    // Load persisted history for a resource this instance has not seen yet
    void hydrate(const std::string& resource, int64_t now_ms);

    CapacitySnapshot capacity(const std::string& resource,
                              const RateLimitConfig& config,
                              int64_t now_ms);

    static uint32_t share_of(const CapacitySnapshot& snapshot, Priority priority) {
        return priority == Priority::USER ? snapshot.user_reserved : snapshot.background_max;
    }

    StoreCore core_;
    AdaptiveConfig adaptive_;
    ActivityMetricsTracker tracker_;
    AdaptiveCapacityCalculator calculator_;
};

} // namespace ratekeeper

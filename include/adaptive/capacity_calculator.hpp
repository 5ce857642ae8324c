#pragma once

#include "adaptive/activity_metrics.hpp"
#include "adaptive/adaptive_config.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ratekeeper {

/**
 * @brief One allocation decision for a resource
 *
 * user_reserved + background_max == limit in every strategy; the
 * sustained-inactivity strategy gives background the whole limit.
 */
struct CapacitySnapshot {
    uint32_t user_reserved = 0;
    uint32_t background_max = 0;
    bool background_paused = false;
    std::string reason;
    int64_t computed_at_ms = 0;
    uint32_t limit = 0;
};

/**
 * @brief Splits a resource's limit between user and background traffic
 *
 * Strategies, first match wins:
 *   1. Initial state            no history at all: 30% user
 *   2. No user activity yet     background only: min_user_reserved for users
 *   3. Zero user activity       nothing in the monitoring window:
 *                               sustained (>= threshold) -> everything to background,
 *                               otherwise min_user_reserved
 *   4. High user activity       >= high_activity_threshold: users scaled up,
 *                               background paused on an increasing trend
 *   5. Dynamic scaling          40% base scaled by recent user count, capped at 70%
 *
 * current() caches the decision per resource for recalculation_interval_ms.
 * Thread-safe; the cache is owned by one store instance.
 */
class AdaptiveCapacityCalculator {
public:
    static constexpr double kInitialUserShare = 0.3;
    static constexpr double kBaseUserShare = 0.4;
    static constexpr double kMaxDynamicUserShare = 0.7;
    static constexpr double kMaxHighActivityUserShare = 0.9;
    static constexpr double kHighActivityBaseShare = 0.5;
    static constexpr double kUserScalingStep = 5.0;

    explicit AdaptiveCapacityCalculator(const AdaptiveConfig& config);

    /**
     * @brief Evaluate the strategies (no caching)
     */
    [[nodiscard]] CapacitySnapshot calculate(const ActivityMetrics& metrics,
                                             uint32_t limit,
                                             int64_t now_ms) const;

    /**
     * @brief Cached decision, recomputed once recalculation_interval_ms has
     *        elapsed or the limit changed
     */
    [[nodiscard]] CapacitySnapshot current(const std::string& resource,
                                           const ActivityMetrics& metrics,
                                           uint32_t limit,
                                           int64_t now_ms);

    void invalidate(const std::string& resource);
    void clear();

    [[nodiscard]] const AdaptiveConfig& config() const { return config_; }

private:
    [[nodiscard]] CapacitySnapshot split(uint32_t limit, uint32_t user_reserved,
                                         bool paused, std::string reason,
                                         int64_t now_ms) const;

    AdaptiveConfig config_;
    std::unordered_map<std::string, CapacitySnapshot> cache_;
    mutable std::mutex mutex_;
};

} // namespace ratekeeper

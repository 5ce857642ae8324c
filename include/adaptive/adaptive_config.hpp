#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace ratekeeper {

/**
 * @brief Tuning for the user/background capacity split
 */
struct AdaptiveConfig {
    int64_t monitoring_window_ms = 900000;              // 15 min
    uint32_t high_activity_threshold = 10;
    uint32_t moderate_activity_threshold = 3;
    int64_t recalculation_interval_ms = 30000;
    int64_t sustained_inactivity_threshold_ms = 1800000; // 30 min
    bool background_pause_on_increasing_trend = true;
    double max_user_scaling = 2.0;
    uint32_t min_user_reserved = 5;

    /**
     * @brief Per-priority history bound: max(100, high_activity_threshold * 20)
     */
    [[nodiscard]] size_t max_metric_samples() const {
        return std::max<size_t>(100, static_cast<size_t>(high_activity_threshold) * 20);
    }
};

} // namespace ratekeeper

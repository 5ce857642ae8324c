#pragma once

#include "adaptive/adaptive_config.hpp"
#include "core/request_priority.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ratekeeper {

enum class ActivityTrend {
    NONE,
    STABLE,
    INCREASING,
    DECREASING
};

inline const char* activity_trend_to_string(ActivityTrend trend) {
    switch (trend) {
        case ActivityTrend::NONE:       return "none";
        case ActivityTrend::STABLE:     return "stable";
        case ActivityTrend::INCREASING: return "increasing";
        case ActivityTrend::DECREASING: return "decreasing";
        default:                        return "none";
    }
}

/**
 * @brief Recent request timestamps for one resource, oldest first
 */
struct ActivityMetrics {
    std::deque<int64_t> recent_user_requests;
    std::deque<int64_t> recent_background_requests;
    ActivityTrend user_activity_trend = ActivityTrend::NONE;
};

/**
 * @brief Bounded per-resource, per-priority request histories
 *
 * Entries older than the monitoring window are dropped when a new entry is
 * pushed onto the same history and when a history is hydrated; reads do not
 * prune, so the newest timestamp of an idle history stays available for the
 * sustained-inactivity decision. Each history holds at most
 * config.max_metric_samples() entries, oldest trimmed first.
 *
 * Thread-safe. Owned by one store instance.
 */
class ActivityMetricsTracker {
public:
    explicit ActivityMetricsTracker(const AdaptiveConfig& config);

    [[nodiscard]] bool contains(const std::string& resource) const;

    /**
     * @brief Install persisted history for a resource not yet tracked
     * @return false if the resource was already tracked (nothing changes)
     */
    bool hydrate(const std::string& resource,
                 std::vector<int64_t> user_timestamps,
                 std::vector<int64_t> background_timestamps,
                 int64_t now_ms);

    /**
     * @brief Append one request, creating the history on first use
     */
    void record(const std::string& resource, Priority priority, int64_t timestamp_ms);

    /**
     * @brief Copy of the histories with the trend classified at now_ms
     */
    [[nodiscard]] ActivityMetrics snapshot(const std::string& resource, int64_t now_ms) const;

    /**
     * @brief User requests with timestamp in [now - monitoring_window, now]
     */
    [[nodiscard]] uint32_t recent_user_count(const std::string& resource, int64_t now_ms) const;

    void reset(const std::string& resource);
    void clear();

    [[nodiscard]] size_t max_samples() const { return max_samples_; }
    [[nodiscard]] size_t tracked_resources() const;

    /**
     * @brief Compare user request density in the two halves of the window
     *
     * Both halves empty: NONE. Older half empty: INCREASING. Otherwise
     * newer/older > 1.5 is INCREASING, < 0.5 DECREASING, else STABLE.
     */
    [[nodiscard]] static ActivityTrend classify_trend(const std::deque<int64_t>& user_requests,
                                                      int64_t now_ms,
                                                      int64_t monitoring_window_ms);

    /**
     * @brief Entries in [now - window_ms, now]
     */
    [[nodiscard]] static uint32_t count_in_window(const std::deque<int64_t>& history,
                                                  int64_t now_ms,
                                                  int64_t window_ms);

private:
    void push(std::deque<int64_t>& history, int64_t timestamp_ms) const;
    void prune(std::deque<int64_t>& history, int64_t now_ms) const;

    AdaptiveConfig config_;
    size_t max_samples_;
    std::unordered_map<std::string, ActivityMetrics> metrics_;
    mutable std::mutex mutex_;
};

} // namespace ratekeeper

#include "adaptive/activity_metrics.hpp"

#include <algorithm>

namespace ratekeeper {

ActivityMetricsTracker::ActivityMetricsTracker(const AdaptiveConfig& config)
    : config_(config)
    , max_samples_(config.max_metric_samples()) {}

bool ActivityMetricsTracker::contains(const std::string& resource) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_.contains(resource);
}

bool ActivityMetricsTracker::hydrate(const std::string& resource,
                                     std::vector<int64_t> user_timestamps,
                                     std::vector<int64_t> background_timestamps,
                                     int64_t now_ms) {
    std::sort(user_timestamps.begin(), user_timestamps.end());
    std::sort(background_timestamps.begin(), background_timestamps.end());

    ActivityMetrics metrics;
    metrics.recent_user_requests.assign(user_timestamps.begin(), user_timestamps.end());
    metrics.recent_background_requests.assign(background_timestamps.begin(),
                                              background_timestamps.end());
    prune(metrics.recent_user_requests, now_ms);
    prune(metrics.recent_background_requests, now_ms);

    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_.try_emplace(resource, std::move(metrics)).second;
}

void ActivityMetricsTracker::record(const std::string& resource, Priority priority,
                                    int64_t timestamp_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& metrics = metrics_[resource];
    auto& history = (priority == Priority::USER) ? metrics.recent_user_requests
                                                 : metrics.recent_background_requests;
    push(history, timestamp_ms);
}

ActivityMetrics ActivityMetricsTracker::snapshot(const std::string& resource,
                                                 int64_t now_ms) const {
    ActivityMetrics copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = metrics_.find(resource);
        if (it != metrics_.end()) {
            copy = it->second;
        }
    }
    copy.user_activity_trend = classify_trend(copy.recent_user_requests, now_ms,
                                              config_.monitoring_window_ms);
    return copy;
}

uint32_t ActivityMetricsTracker::recent_user_count(const std::string& resource,
                                                   int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = metrics_.find(resource);
    if (it == metrics_.end()) return 0;
    return count_in_window(it->second.recent_user_requests, now_ms,
                           config_.monitoring_window_ms);
}

void ActivityMetricsTracker::reset(const std::string& resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.erase(resource);
}

void ActivityMetricsTracker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.clear();
}

size_t ActivityMetricsTracker::tracked_resources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_.size();
}

ActivityTrend ActivityMetricsTracker::classify_trend(const std::deque<int64_t>& user_requests,
                                                     int64_t now_ms,
                                                     int64_t monitoring_window_ms) {
    const int64_t window_start = now_ms - monitoring_window_ms;
    const int64_t midpoint = now_ms - monitoring_window_ms / 2;

    uint32_t older = 0;
    uint32_t newer = 0;
    for (const int64_t ts : user_requests) {
        if (ts < window_start || ts > now_ms) continue;
        if (ts >= midpoint) {
            ++newer;
        } else {
            ++older;
        }
    }

    if (older == 0 && newer == 0) return ActivityTrend::NONE;
    if (older == 0) return ActivityTrend::INCREASING;

    const double ratio = static_cast<double>(newer) / static_cast<double>(older);
    if (ratio > 1.5) return ActivityTrend::INCREASING;
    if (ratio < 0.5) return ActivityTrend::DECREASING;
    return ActivityTrend::STABLE;
}

uint32_t ActivityMetricsTracker::count_in_window(const std::deque<int64_t>& history,
                                                 int64_t now_ms,
                                                 int64_t window_ms) {
    const int64_t window_start = now_ms - window_ms;
    return static_cast<uint32_t>(std::count_if(history.begin(), history.end(),
        [&](int64_t ts) { return ts >= window_start && ts <= now_ms; }));
}

void ActivityMetricsTracker::push(std::deque<int64_t>& history, int64_t timestamp_ms) const {
    // Callers race on the clock, so keep the history ordered on insert
    history.insert(std::upper_bound(history.begin(), history.end(), timestamp_ms),
                   timestamp_ms);
    prune(history, timestamp_ms);
}

void ActivityMetricsTracker::prune(std::deque<int64_t>& history, int64_t now_ms) const {
    const int64_t cutoff = now_ms - config_.monitoring_window_ms;
    while (!history.empty() && history.front() < cutoff) {
        history.pop_front();
    }
    while (history.size() > max_samples_) {
        history.pop_front();
    }
}

} // namespace ratekeeper

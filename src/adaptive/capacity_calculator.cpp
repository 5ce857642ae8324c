#include "adaptive/capacity_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace ratekeeper {

namespace {

uint32_t floor_share(uint32_t limit, double share) {
    return static_cast<uint32_t>(std::floor(static_cast<double>(limit) * share));
}

} // anonymous namespace

AdaptiveCapacityCalculator::AdaptiveCapacityCalculator(const AdaptiveConfig& config)
    : config_(config) {}

CapacitySnapshot AdaptiveCapacityCalculator::split(uint32_t limit, uint32_t user_reserved,
                                                   bool paused, std::string reason,
                                                   int64_t now_ms) const {
    CapacitySnapshot snapshot;
    snapshot.user_reserved = std::min(user_reserved, limit);
    snapshot.background_max = limit - snapshot.user_reserved;
    snapshot.background_paused = paused;
    snapshot.reason = std::move(reason);
    snapshot.computed_at_ms = now_ms;
    snapshot.limit = limit;
    return snapshot;
}

CapacitySnapshot AdaptiveCapacityCalculator::calculate(const ActivityMetrics& metrics,
                                                       uint32_t limit,
                                                       int64_t now_ms) const {
    const auto& user = metrics.recent_user_requests;
    const auto& background = metrics.recent_background_requests;
    const uint32_t min_reserved = std::min(config_.min_user_reserved, limit);

    // 1. Nothing observed yet
    if (user.empty() && background.empty()) {
        const auto reserved = static_cast<uint32_t>(
            std::lround(static_cast<double>(limit) * kInitialUserShare));
        return split(limit, reserved, false,
                     "Initial state: default 30% user reservation", now_ms);
    }

    // 2. Background traffic only
    if (user.empty()) {
        return split(limit, min_reserved, false,
                     "No user activity yet: minimum user reservation", now_ms);
    }

    const uint32_t recent_user = ActivityMetricsTracker::count_in_window(
        user, now_ms, config_.monitoring_window_ms);

    // 3. Users have gone quiet
    if (recent_user == 0) {
        const int64_t idle_ms = now_ms - user.back();
        if (idle_ms >= config_.sustained_inactivity_threshold_ms) {
            return split(limit, 0, false,
                         std::format("Sustained zero activity for {}ms: full capacity to background",
                                     idle_ms),
                         now_ms);
        }
        return split(limit, min_reserved, false,
                     "Recent zero user activity: minimum user reservation", now_ms);
    }

    // 4. Heavy interactive load
    if (recent_user >= config_.high_activity_threshold) {
        const uint32_t scaled = std::min(
            floor_share(limit, kMaxHighActivityUserShare),
            floor_share(limit, kHighActivityBaseShare * config_.max_user_scaling));
        const uint32_t reserved = std::max(min_reserved, scaled);
        const bool paused = config_.background_pause_on_increasing_trend &&
                            metrics.user_activity_trend == ActivityTrend::INCREASING;
        return split(limit, reserved, paused,
                     std::format("High user activity ({} requests, trend {}): {}",
                                 recent_user,
                                 activity_trend_to_string(metrics.user_activity_trend),
                                 paused ? "background paused" : "background limited"),
                     now_ms);
    }

    // 5. General case
    const uint32_t base = floor_share(limit, kBaseUserShare);
    const double multiplier = std::min(
        config_.max_user_scaling,
        1.0 + static_cast<double>(recent_user) / kUserScalingStep);
    const uint32_t dynamic = std::min(
        floor_share(limit, kMaxDynamicUserShare),
        static_cast<uint32_t>(std::floor(static_cast<double>(base) * multiplier)));
    const uint32_t reserved = std::max(min_reserved, dynamic);

    const char* level = recent_user >= config_.moderate_activity_threshold ? "Moderate" : "Light";
    return split(limit, reserved, false,
                 std::format("{} user activity ({} requests): dynamic scaling x{:.2f}",
                             level, recent_user, multiplier),
                 now_ms);
}

CapacitySnapshot AdaptiveCapacityCalculator::current(const std::string& resource,
                                                     const ActivityMetrics& metrics,
                                                     uint32_t limit,
                                                     int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = cache_.find(resource);
    if (it != cache_.end() &&
        it->second.limit == limit &&
        now_ms - it->second.computed_at_ms < config_.recalculation_interval_ms) {
        return it->second;
    }

    auto snapshot = calculate(metrics, limit, now_ms);
    cache_[resource] = snapshot;
    return snapshot;
}

void AdaptiveCapacityCalculator::invalidate(const std::string& resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(resource);
}

void AdaptiveCapacityCalculator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

} // namespace ratekeeper

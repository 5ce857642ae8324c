#include <catch2/catch_test_macros.hpp>
#include "adaptive/capacity_calculator.hpp"

#include <string>

using namespace ratekeeper;

namespace {

constexpr int64_t kNow = 1700000000000;

AdaptiveConfig test_config() {
    AdaptiveConfig cfg;
    cfg.monitoring_window_ms = 60000;
    cfg.high_activity_threshold = 10;
    cfg.moderate_activity_threshold = 3;
    cfg.recalculation_interval_ms = 1000;
    cfg.sustained_inactivity_threshold_ms = 120000;
    cfg.max_user_scaling = 2.0;
    cfg.min_user_reserved = 5;
    return cfg;
}

// n user requests spread evenly over the last `span_ms`
ActivityMetrics user_activity(int n, int64_t span_ms = 50000) {
    ActivityMetrics metrics;
    for (int i = 0; i < n; ++i) {
        metrics.recent_user_requests.push_back(kNow - span_ms + (span_ms / n) * i);
    }
    metrics.user_activity_trend = ActivityMetricsTracker::classify_trend(
        metrics.recent_user_requests, kNow, 60000);
    return metrics;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("AdaptiveCapacityCalculator: strategies", "[capacity]") {
    AdaptiveCapacityCalculator calc(test_config());

    SECTION("Initial state reserves 30% for users") {
        const auto s = calc.calculate(ActivityMetrics{}, 100, kNow);
        CHECK(s.user_reserved == 30);
        CHECK(s.background_max == 70);
        CHECK_FALSE(s.background_paused);
        CHECK(contains(s.reason, "Initial state"));
        CHECK(s.computed_at_ms == kNow);
        CHECK(s.limit == 100);
    }

    SECTION("Initial share rounds to nearest") {
        CHECK(calc.calculate(ActivityMetrics{}, 5, kNow).user_reserved == 2);   // 1.5
        CHECK(calc.calculate(ActivityMetrics{}, 7, kNow).user_reserved == 2);   // 2.1
        CHECK(calc.calculate(ActivityMetrics{}, 0, kNow).user_reserved == 0);
    }

    SECTION("Background-only history keeps the minimum user reservation") {
        ActivityMetrics metrics;
        metrics.recent_background_requests = {kNow - 1000, kNow - 500};
        const auto s = calc.calculate(metrics, 100, kNow);
        CHECK(s.user_reserved == 5);
        CHECK(s.background_max == 95);
        CHECK(contains(s.reason, "No user activity yet"));

        // Minimum is capped by the limit
        const auto small = calc.calculate(metrics, 3, kNow);
        CHECK(small.user_reserved == 3);
        CHECK(small.background_max == 0);
    }

    SECTION("Recently quiet users keep the minimum reservation") {
        ActivityMetrics metrics;
        metrics.recent_user_requests = {kNow - 90000};
        const auto s = calc.calculate(metrics, 100, kNow);
        CHECK(s.user_reserved == 5);
        CHECK(s.background_max == 95);
        CHECK(contains(s.reason, "Recent zero user activity"));
    }

    SECTION("Sustained inactivity hands everything to background") {
        ActivityMetrics metrics;
        metrics.recent_user_requests = {kNow - 200000, kNow - 130000};
        const auto s = calc.calculate(metrics, 100, kNow);
        CHECK(s.user_reserved == 0);
        CHECK(s.background_max == 100);
        CHECK_FALSE(s.background_paused);
        CHECK(contains(s.reason, "Sustained zero activity for 130000ms"));
    }

    SECTION("Inactivity exactly at the threshold counts as sustained") {
        ActivityMetrics metrics;
        metrics.recent_user_requests = {kNow - 120000};
        CHECK(calc.calculate(metrics, 100, kNow).user_reserved == 0);
    }

    SECTION("Light activity scales from the 40% base") {
        const auto s = calc.calculate(user_activity(1), 100, kNow);
        CHECK(s.user_reserved == 48);   // 40 * 1.2
        CHECK(s.background_max == 52);
        CHECK(contains(s.reason, "Light user activity (1 requests)"));
        CHECK(contains(s.reason, "x1.20"));
    }

    SECTION("Moderate activity is capped at 70%") {
        const auto s = calc.calculate(user_activity(5), 100, kNow);
        CHECK(s.user_reserved == 70);   // min(70, 40 * 2.0)
        CHECK(s.background_max == 30);
        CHECK(contains(s.reason, "Moderate user activity (5 requests)"));
    }

    SECTION("Dynamic reservation never drops below the minimum") {
        const auto s = calc.calculate(user_activity(1), 10, kNow);
        CHECK(s.user_reserved == 5);   // floor(4 * 1.2) = 4 < 5
        CHECK(s.background_max == 5);
    }

    SECTION("High activity with a steady trend limits background") {
        ActivityMetrics metrics;
        // Ten requests spread across both halves of the window
        for (int i = 0; i < 10; ++i) {
            metrics.recent_user_requests.push_back(kNow - 55000 + i * 5500);
        }
        metrics.user_activity_trend = ActivityTrend::STABLE;

        const auto s = calc.calculate(metrics, 100, kNow);
        CHECK(s.user_reserved == 90);   // min(90, 100)
        CHECK(s.background_max == 10);
        CHECK_FALSE(s.background_paused);
        CHECK(contains(s.reason, "High user activity (10 requests, trend stable)"));
    }

    SECTION("High activity with an increasing trend pauses background") {
        ActivityMetrics metrics;
        for (int i = 0; i < 12; ++i) {
            metrics.recent_user_requests.push_back(kNow - 20000 + i * 1000);
        }
        metrics.user_activity_trend = ActivityTrend::INCREASING;

        const auto s = calc.calculate(metrics, 100, kNow);
        CHECK(s.background_paused);
        CHECK(contains(s.reason, "background paused"));
    }

    SECTION("Pause can be disabled") {
        auto cfg = test_config();
        cfg.background_pause_on_increasing_trend = false;
        AdaptiveCapacityCalculator relaxed(cfg);

        ActivityMetrics metrics;
        for (int i = 0; i < 12; ++i) {
            metrics.recent_user_requests.push_back(kNow - 20000 + i * 1000);
        }
        metrics.user_activity_trend = ActivityTrend::INCREASING;
        CHECK_FALSE(relaxed.calculate(metrics, 100, kNow).background_paused);
    }

    SECTION("Max user scaling bounds the high-activity share") {
        auto cfg = test_config();
        cfg.max_user_scaling = 1.2;
        AdaptiveCapacityCalculator capped(cfg);

        const auto s = capped.calculate(user_activity(10), 100, kNow);
        CHECK(s.user_reserved == 60);   // floor(100 * 0.5 * 1.2)
    }

    SECTION("Shares always add up to the limit") {
        for (uint32_t limit : {0u, 1u, 3u, 17u, 100u, 1000u}) {
            for (int n : {0, 1, 3, 9, 10, 40}) {
                const auto metrics = n == 0 ? ActivityMetrics{} : user_activity(n);
                const auto s = calc.calculate(metrics, limit, kNow);
                CAPTURE(limit, n);
                CHECK(s.user_reserved + s.background_max == limit);
            }
        }
    }
}

TEST_CASE("AdaptiveCapacityCalculator: caching", "[capacity]") {
    AdaptiveCapacityCalculator calc(test_config());

    const auto first = calc.current("api", ActivityMetrics{}, 100, kNow);
    REQUIRE(first.user_reserved == 30);

    SECTION("Within the interval the cached decision is returned") {
        const auto again = calc.current("api", user_activity(5), 100, kNow + 999);
        CHECK(again.user_reserved == 30);
        CHECK(again.computed_at_ms == kNow);
    }

    SECTION("After the interval the decision is recomputed") {
        const auto later = calc.current("api", user_activity(5), 100, kNow + 1000);
        CHECK(later.user_reserved == 70);
        CHECK(later.computed_at_ms == kNow + 1000);
    }

    SECTION("A changed limit bypasses the cache") {
        const auto resized = calc.current("api", ActivityMetrics{}, 200, kNow + 10);
        CHECK(resized.user_reserved == 60);
    }

    SECTION("Invalidate and clear drop cached decisions") {
        calc.invalidate("api");
        CHECK(calc.current("api", user_activity(5), 100, kNow + 1).user_reserved == 70);

        calc.current("other", ActivityMetrics{}, 100, kNow);
        calc.clear();
        CHECK(calc.current("other", user_activity(1), 100, kNow + 1).user_reserved == 48);
    }

    SECTION("Resources are cached independently") {
        CHECK(calc.current("other", user_activity(5), 100, kNow).user_reserved == 70);
        CHECK(calc.current("api", user_activity(5), 100, kNow).user_reserved == 30);
    }
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "core/error.hpp"
#include "core/utils.hpp"
#include "limiter/store_factory.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <format>
#include <thread>
#include <vector>

using namespace ratekeeper;

namespace {

AdaptiveConfig fast_adaptive_config() {
    AdaptiveConfig cfg;
    cfg.monitoring_window_ms = 1000;
    cfg.high_activity_threshold = 5;
    cfg.moderate_activity_threshold = 2;
    cfg.recalculation_interval_ms = 100;
    cfg.sustained_inactivity_threshold_ms = 2000;
    cfg.background_pause_on_increasing_trend = true;
    cfg.max_user_scaling = 2.0;
    cfg.min_user_reserved = 10;
    return cfg;
}

StoreConfig make_config(BackendKind backend, RateLimitConfig defaults = {200, 60000},
                        AdaptiveConfig adaptive = fast_adaptive_config()) {
    StoreConfig cfg;
    cfg.backend = backend;
    cfg.adaptive = true;
    cfg.cleanup_interval_ms = 0;
    cfg.default_config = defaults;
    cfg.adaptive_config = adaptive;
    cfg.sqlite.path = ":memory:";
    cfg.kv.ensure_table_exists = true;
    return cfg;
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // anonymous namespace

TEST_CASE("AdaptiveRateLimitStore: allocation follows user activity", "[adaptive_store]") {
    const auto backend = GENERATE(BackendKind::MEMORY, BackendKind::SQLITE, BackendKind::KV);
    CAPTURE(backend_kind_to_string(backend));
    auto store = create_adaptive_rate_limit_store(make_config(backend));

    SECTION("Initial split gives users 30%") {
        const auto status = store->get_status("api", Priority::USER);
        REQUIRE(status.adaptive.has_value());
        CHECK(status.adaptive->user_reserved == 60);
        CHECK(status.adaptive->background_max == 140);
        CHECK_FALSE(status.adaptive->background_paused);
        CHECK(status.adaptive->recent_user_activity == 0);
        CHECK(status.adaptive->reason.find("Initial state") != std::string::npos);
        CHECK(status.remaining == 60);
        CHECK(status.limit == 200);

        store->set_resource_config("small", {50, 60000});
        const auto small = store->get_status("small", Priority::BACKGROUND);
        CHECK(small.adaptive->user_reserved == 15);
        CHECK(small.adaptive->background_max == 35);
        CHECK(small.remaining == 35);
    }

    SECTION("Allocation is cached until the recalculation interval passes") {
        REQUIRE(store->get_status("api", Priority::USER).adaptive->user_reserved == 60);

        for (int i = 0; i < 3; ++i) store->record("api", Priority::USER);
        CHECK(store->get_status("api", Priority::USER).adaptive->user_reserved == 60);

        sleep_ms(150);
        const auto status = store->get_status("api", Priority::USER);
        CHECK(status.adaptive->user_reserved == 128);
        CHECK(status.adaptive->background_max == 72);
        CHECK(status.adaptive->recent_user_activity == 3);
        CHECK(status.adaptive->reason.find("dynamic scaling") != std::string::npos);
        CHECK(status.remaining == 125);
    }

    SECTION("Burst of user traffic pauses background") {
        for (int i = 0; i < 6; ++i) store->record("api", Priority::USER);

        const auto status = store->get_status("api", Priority::BACKGROUND);
        CHECK(status.adaptive->user_reserved == 180);
        CHECK(status.adaptive->background_max == 20);
        CHECK(status.adaptive->background_paused);
        CHECK(status.adaptive->reason.find("High user activity") != std::string::npos);
        CHECK(status.remaining == 0);

        CHECK_FALSE(store->can_proceed("api", Priority::BACKGROUND));
        CHECK_FALSE(store->acquire("api", Priority::BACKGROUND));
        CHECK(store->get_wait_time("api", Priority::BACKGROUND) == 100);

        CHECK(store->can_proceed("api", Priority::USER));
        CHECK(store->get_wait_time("api", Priority::USER) == 0);
    }

    SECTION("User reservation never shrinks while activity grows") {
        uint32_t previous = store->get_status("api", Priority::USER).adaptive->user_reserved;
        for (int round = 0; round < 3; ++round) {
            for (int i = 0; i < 2; ++i) store->record("api", Priority::USER);
            sleep_ms(110);
            const uint32_t reserved =
                store->get_status("api", Priority::USER).adaptive->user_reserved;
            CHECK(reserved >= previous);
            previous = reserved;
        }
    }

    SECTION("Omitted priority is treated as background") {
        store->record("api");
        CHECK(store->get_status("api", Priority::BACKGROUND).remaining ==
              store->get_status("api", Priority::BACKGROUND).adaptive->background_max - 1);
        CHECK(store->get_status("api", Priority::USER).adaptive->recent_user_activity == 0);
    }

    SECTION("Status without a priority reports the whole resource") {
        store->record("api", Priority::USER);
        store->record("api", Priority::BACKGROUND);
        store->record("api", Priority::BACKGROUND);
        CHECK(store->get_status("api").remaining == 197);
    }
}

TEST_CASE("AdaptiveRateLimitStore: sustained inactivity", "[adaptive_store][slow]") {
    const auto backend = GENERATE(BackendKind::MEMORY, BackendKind::SQLITE, BackendKind::KV);
    CAPTURE(backend_kind_to_string(backend));
    auto store = create_adaptive_rate_limit_store(make_config(backend));

    store->record("api", Priority::USER);
    sleep_ms(2100);

    const auto status = store->get_status("api", Priority::BACKGROUND);
    CHECK(status.adaptive->user_reserved == 0);
    CHECK(status.adaptive->background_max == 200);
    CHECK_FALSE(status.adaptive->background_paused);
    CHECK(status.adaptive->recent_user_activity == 0);
    CHECK(status.adaptive->reason.find("Sustained zero activity") != std::string::npos);
}

TEST_CASE("AdaptiveRateLimitStore: priority shares are enforced separately", "[adaptive_store]") {
    const auto backend = GENERATE(BackendKind::MEMORY, BackendKind::SQLITE, BackendKind::KV);
    CAPTURE(backend_kind_to_string(backend));

    // Long recalculation interval keeps the initial 6/14 split for the whole test
    auto adaptive = fast_adaptive_config();
    adaptive.recalculation_interval_ms = 60000;
    auto store = create_adaptive_rate_limit_store(make_config(backend, {20, 60000}, adaptive));

    for (int i = 0; i < 6; ++i) {
        CHECK(store->acquire("api", Priority::USER));
    }
    CHECK_FALSE(store->acquire("api", Priority::USER));
    CHECK_FALSE(store->can_proceed("api", Priority::USER));
    CHECK(store->get_status("api", Priority::USER).remaining == 0);

    const auto wait = store->get_wait_time("api", Priority::USER);
    CHECK(wait > 0);
    CHECK(wait <= 60000);

    // Background share is untouched by user traffic
    for (int i = 0; i < 14; ++i) {
        CHECK(store->acquire("api", Priority::BACKGROUND));
    }
    CHECK_FALSE(store->acquire("api", Priority::BACKGROUND));
    CHECK(store->get_status("api").remaining == 0);
}

TEST_CASE("AdaptiveRateLimitStore: concurrent acquires stay within each share", "[adaptive_store][concurrency]") {
    const auto backend = GENERATE(BackendKind::MEMORY, BackendKind::SQLITE, BackendKind::KV);
    CAPTURE(backend_kind_to_string(backend));

    auto adaptive = fast_adaptive_config();
    adaptive.recalculation_interval_ms = 60000;
    auto store = create_adaptive_rate_limit_store(make_config(backend, {20, 60000}, adaptive));

    // Fix the 6/14 split before the threads start
    const auto initial = store->get_status("contended", Priority::USER);
    REQUIRE(initial.adaptive->user_reserved == 6);
    REQUIRE(initial.adaptive->background_max == 14);

    constexpr int kUserThreads = 12;
    constexpr int kBackgroundThreads = 20;
    std::atomic<int> user_granted{0};
    std::atomic<int> background_granted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kUserThreads + kBackgroundThreads; ++i) {
        const Priority p = (i % 2 == 0 && i / 2 < kUserThreads) ? Priority::USER
                                                                 : Priority::BACKGROUND;
        threads.emplace_back([&, p] {
            if (!store->acquire("contended", p)) return;
            (p == Priority::USER ? user_granted : background_granted).fetch_add(1);
        });
    }
    for (auto& t : threads) t.join();

    CHECK(user_granted.load() == 6);
    CHECK(background_granted.load() == 14);
    CHECK(user_granted.load() + background_granted.load() <= 20);
    CHECK(store->get_status("contended").remaining == 0);
}

TEST_CASE("AdaptiveRateLimitStore: edge cases", "[adaptive_store]") {
    const auto backend = GENERATE(BackendKind::MEMORY, BackendKind::SQLITE, BackendKind::KV);
    CAPTURE(backend_kind_to_string(backend));
    auto store = create_adaptive_rate_limit_store(make_config(backend));

    SECTION("Zero limit refuses both priorities and waits a full window") {
        store->set_resource_config("blocked", {0, 4321});
        CHECK_FALSE(store->can_proceed("blocked", Priority::USER));
        CHECK_FALSE(store->acquire("blocked", Priority::BACKGROUND));
        CHECK(store->get_wait_time("blocked", Priority::USER) == 4321);
        CHECK(store->get_wait_time("blocked") == 4321);

        const auto status = store->get_status("blocked", Priority::USER);
        CHECK(status.remaining == 0);
        CHECK(status.adaptive->user_reserved == 0);
        CHECK(status.adaptive->background_max == 0);
    }

    SECTION("Zero background share waits for its oldest record") {
        store->set_resource_config("tiny", {2, 5000});
        store->record("tiny", Priority::BACKGROUND);

        const auto status = store->get_status("tiny", Priority::BACKGROUND);
        CHECK(status.adaptive->user_reserved == 2);
        CHECK(status.adaptive->background_max == 0);
        CHECK(status.remaining == 0);
        CHECK_FALSE(store->can_proceed("tiny", Priority::BACKGROUND));

        const auto wait = store->get_wait_time("tiny", Priority::BACKGROUND);
        CHECK(wait > 0);
        CHECK(wait <= 5000);
    }

    SECTION("Reset clears one resource's history and allocation") {
        for (int i = 0; i < 6; ++i) store->record("api", Priority::USER);
        REQUIRE(store->get_status("api", Priority::USER).adaptive->background_paused);

        store->reset("api");
        const auto status = store->get_status("api", Priority::USER);
        CHECK(status.remaining == 60);
        CHECK(status.adaptive->recent_user_activity == 0);
        CHECK(status.adaptive->user_reserved == 60);
    }

    SECTION("Clear wipes every resource and the activity history") {
        for (int i = 0; i < 3; ++i) store->record("api", Priority::USER);
        store->record("other", Priority::BACKGROUND);

        store->clear();
        const auto status = store->get_status("api");
        CHECK(status.remaining == 200);
        CHECK(status.adaptive->recent_user_activity == 0);
        CHECK(store->get_status("other").remaining == 200);
    }

    SECTION("Invalid keys and closed stores") {
        CHECK_THROWS_AS(store->record("", Priority::USER), ValidationError);
        CHECK_THROWS_AS(store->get_status(std::string(600, 'k')), ValidationError);

        store->close();
        REQUIRE_NOTHROW(store->close());
        CHECK_THROWS_AS(store->acquire("api", Priority::USER), StoreDestroyedError);
        CHECK_THROWS_AS(store->get_wait_time("api"), StoreDestroyedError);
        CHECK_THROWS_AS(store->set_cooldown("example.com", 0), StoreDestroyedError);
    }
}

TEST_CASE("AdaptiveRateLimitStore: activity survives a restart on SQLite", "[adaptive_store][sqlite]") {
    const auto path = std::filesystem::temp_directory_path() /
                      std::format("ratekeeper-adaptive-{}.db", utils::generate_uuid());
    auto cfg = make_config(BackendKind::SQLITE);
    cfg.sqlite.path = path.string();

    {
        auto first = create_adaptive_rate_limit_store(cfg);
        for (int i = 0; i < 4; ++i) first->record("api", Priority::USER);
        first->record("api", Priority::BACKGROUND);
        first->close();
    }

    {
        auto second = create_adaptive_rate_limit_store(cfg);
        const auto status = second->get_status("api", Priority::USER);
        CHECK(status.adaptive->recent_user_activity == 4);
        CHECK(status.adaptive->reason.find("Moderate user activity") != std::string::npos);
        CHECK(status.adaptive->user_reserved == 144);
        CHECK(status.remaining == 140);
        second->close();
    }

    {
        // First call after the restart records instead of reading
        auto third = create_adaptive_rate_limit_store(cfg);
        third->record("api", Priority::USER);
        const auto status = third->get_status("api", Priority::USER);
        CHECK(status.adaptive->recent_user_activity == 5);
        third->close();
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::filesystem::remove(path.string() + "-wal", ec);
    std::filesystem::remove(path.string() + "-shm", ec);
}

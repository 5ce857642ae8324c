#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "backend/in_memory_kv_client.hpp"
#include "backend/kv_backend.hpp"
#include "backend/memory_backend.hpp"
#include "backend/sqlite_backend.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <memory>
#include <string>

using namespace ratekeeper;

namespace {

std::unique_ptr<IRateLimitBackend> make_backend(const std::string& kind) {
    if (kind == "sqlite") {
        SqliteBackend::Options options;
        options.path = ":memory:";
        return std::make_unique<SqliteBackend>(options);
    }
    if (kind == "kv") {
        KvBackend::Options options;
        options.ensure_table_exists = true;
        options.sleeper = [](std::chrono::milliseconds) {};
        return std::make_unique<KvBackend>(std::make_shared<InMemoryKeyValueClient>(),
                                           std::move(options));
    }
    return std::make_unique<MemoryBackend>();
}

RequestRecord make_record(const std::string& resource, int64_t ts,
                          std::optional<Priority> priority = std::nullopt) {
    return RequestRecord{resource, ts, priority, utils::generate_uuid()};
}

SlotClaim make_claim(const std::string& resource, uint32_t index, int64_t now,
                     int64_t window_ms, std::optional<Priority> priority = std::nullopt) {
    SlotClaim claim;
    claim.resource = resource;
    claim.priority = priority;
    claim.slot_index = index;
    claim.window_ms = window_ms;
    claim.claimed_at_ms = now;
    return claim;
}

} // anonymous namespace

TEST_CASE("Backend contract", "[backend]") {
    const std::string kind = GENERATE(as<std::string>{}, "memory", "sqlite", "kv");
    CAPTURE(kind);
    auto backend = make_backend(kind);
    const int64_t now = utils::now_ms();

    SECTION("Window counts honor the lower bound and priority filter") {
        backend->insert_record(make_record("api", now - 5000), 60000);
        backend->insert_record(make_record("api", now - 1000, Priority::USER), 60000);
        backend->insert_record(make_record("api", now - 500, Priority::BACKGROUND), 60000);
        backend->insert_record(make_record("other", now), 60000);

        CHECK(backend->count_in_window("api", now - 60000, std::nullopt) == 3);
        CHECK(backend->count_in_window("api", now - 2000, std::nullopt) == 2);
        CHECK(backend->count_in_window("api", now - 60000, Priority::USER) == 1);
        CHECK(backend->count_in_window("api", now - 60000, Priority::BACKGROUND) == 1);
        CHECK(backend->count_in_window("missing", now - 60000, std::nullopt) == 0);
    }

    SECTION("Oldest in window") {
        CHECK_FALSE(backend->oldest_in_window("api", now - 60000, std::nullopt).has_value());

        backend->insert_record(make_record("api", now - 30000), 60000);
        backend->insert_record(make_record("api", now - 10000, Priority::USER), 60000);
        backend->insert_record(make_record("api", now - 90000), 60000);

        CHECK(backend->oldest_in_window("api", now - 60000, std::nullopt) == now - 30000);
        CHECK(backend->oldest_in_window("api", now - 60000, Priority::USER) == now - 10000);
    }

    SECTION("Records sharing a timestamp are kept apart") {
        backend->insert_record(make_record("api", now), 60000);
        backend->insert_record(make_record("api", now), 60000);
        CHECK(backend->count_in_window("api", now - 1, std::nullopt) == 2);
    }

    SECTION("Slot claim conflicts until the previous claim expires") {
        const auto first = make_claim("api", 0, now, 1000);
        REQUIRE(backend->try_claim_slot(first, make_record("api", now)) ==
                SlotClaimOutcome::CLAIMED);

        const auto again = make_claim("api", 0, now + 10, 1000);
        CHECK(backend->try_claim_slot(again, make_record("api", now + 10)) ==
              SlotClaimOutcome::CONFLICT);

        // The failed claim wrote nothing
        CHECK(backend->count_in_window("api", now - 1, std::nullopt) == 1);

        const auto other_index = make_claim("api", 1, now + 10, 1000);
        CHECK(backend->try_claim_slot(other_index, make_record("api", now + 10)) ==
              SlotClaimOutcome::CLAIMED);

        const auto later = make_claim("api", 0, now + 1000, 1000);
        CHECK(backend->try_claim_slot(later, make_record("api", now + 1000)) ==
              SlotClaimOutcome::CLAIMED);
        CHECK(backend->count_in_window("api", now - 1, std::nullopt) == 3);
    }

    SECTION("Slot namespaces are separate per priority") {
        const auto user = make_claim("api", 0, now, 1000, Priority::USER);
        const auto background = make_claim("api", 0, now, 1000, Priority::BACKGROUND);
        CHECK(backend->try_claim_slot(user, make_record("api", now, Priority::USER)) ==
              SlotClaimOutcome::CLAIMED);
        CHECK(backend->try_claim_slot(background, make_record("api", now, Priority::BACKGROUND)) ==
              SlotClaimOutcome::CLAIMED);
    }

    SECTION("Recent timestamps come back oldest first and bounded") {
        for (int i = 0; i < 5; ++i) {
            backend->insert_record(make_record("api", now - 5000 + i * 1000, Priority::USER), 60000);
        }
        backend->insert_record(make_record("api", now - 100, Priority::BACKGROUND), 60000);

        const auto newest = backend->load_recent_timestamps("api", Priority::USER, now - 60000, 3);
        REQUIRE(newest.size() == 3);
        CHECK(newest[0] == now - 3000);
        CHECK(newest[1] == now - 2000);
        CHECK(newest[2] == now - 1000);

        const auto background =
            backend->load_recent_timestamps("api", Priority::BACKGROUND, now - 60000, 100);
        REQUIRE(background.size() == 1);
        CHECK(background[0] == now - 100);
    }

    SECTION("delete_resource leaves other resources alone") {
        backend->insert_record(make_record("api", now), 60000);
        backend->insert_record(make_record("api-v2", now), 60000);
        REQUIRE(backend->try_claim_slot(make_claim("api", 0, now, 60000),
                                        make_record("api", now)) == SlotClaimOutcome::CLAIMED);

        backend->delete_resource("api");

        CHECK(backend->count_in_window("api", now - 60000, std::nullopt) == 0);
        CHECK(backend->count_in_window("api-v2", now - 60000, std::nullopt) == 1);

        // Slot 0 is free again after the reset
        CHECK(backend->try_claim_slot(make_claim("api", 0, now, 60000),
                                      make_record("api", now)) == SlotClaimOutcome::CLAIMED);
    }

    SECTION("delete_all removes records, slots and cooldowns") {
        backend->insert_record(make_record("a", now), 60000);
        backend->insert_record(make_record("b", now, Priority::USER), 60000);
        backend->put_cooldown("example.com", now + 60000);

        backend->delete_all();

        CHECK(backend->count_in_window("a", now - 60000, std::nullopt) == 0);
        CHECK(backend->count_in_window("b", now - 60000, Priority::USER) == 0);
        CHECK_FALSE(backend->read_cooldown("example.com").has_value());
    }

    SECTION("Cooldowns upsert and delete") {
        CHECK_FALSE(backend->read_cooldown("example.com").has_value());

        backend->put_cooldown("example.com", now + 1000);
        CHECK(backend->read_cooldown("example.com") == now + 1000);

        backend->put_cooldown("example.com", now + 5000);
        CHECK(backend->read_cooldown("example.com") == now + 5000);

        backend->delete_cooldown("example.com");
        CHECK_FALSE(backend->read_cooldown("example.com").has_value());
    }

    SECTION("Listing matches the declared capability") {
        backend->insert_record(make_record("a", now), 60000);
        backend->insert_record(make_record("a", now), 60000);
        backend->insert_record(make_record("b", now), 60000);

        if (backend->capabilities().supports_listing) {
            const auto counts = backend->record_counts();
            REQUIRE(counts.size() == 2);
            uint64_t total = 0;
            for (const auto& usage : counts) total += usage.request_count;
            CHECK(total == 3);
        } else {
            CHECK_THROWS_AS(backend->record_counts(), UnsupportedOperationError);
        }
    }
}

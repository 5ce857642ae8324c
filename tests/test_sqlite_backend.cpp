#include <catch2/catch_test_macros.hpp>
#include "backend/sqlite_backend.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "limiter/rate_limit_store.hpp"

#include <filesystem>
#include <format>
#include <memory>

using namespace ratekeeper;

namespace {

/**
 * @brief Database file under the temp directory, removed on scope exit
 */
struct TempDatabase {
    std::filesystem::path path = std::filesystem::temp_directory_path() /
                                 std::format("ratekeeper-{}.db", utils::generate_uuid());

    ~TempDatabase() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        std::filesystem::remove(path.string() + "-wal", ec);
        std::filesystem::remove(path.string() + "-shm", ec);
    }
};

std::unique_ptr<RateLimitStore> make_store(std::unique_ptr<IRateLimitBackend> backend,
                                           RateLimitConfig defaults = {3, 60000}) {
    RateLimitStore::Options options;
    options.default_config = defaults;
    options.cleanup_interval_ms = 0;
    return std::make_unique<RateLimitStore>(std::move(backend), options);
}

} // anonymous namespace

TEST_CASE("SqliteBackend: file databases", "[sqlite]") {
    TempDatabase db;
    SqliteBackend::Options options;
    options.path = db.path.string();

    SECTION("Records outlive the store that wrote them") {
        {
            auto store = make_store(std::make_unique<SqliteBackend>(options));
            store->record("api");
            store->record("api");
            store->set_cooldown("example.com", utils::now_ms() + 60000);
            store->close();
        }

        auto reopened = make_store(std::make_unique<SqliteBackend>(options));
        CHECK(reopened->get_status("api").remaining == 1);
        CHECK(reopened->get_cooldown("example.com").has_value());
        CHECK(reopened->capabilities().persistent);
    }

    SECTION("Two stores on one file share their counts") {
        auto first = make_store(std::make_unique<SqliteBackend>(options));
        auto second = make_store(std::make_unique<SqliteBackend>(options));

        CHECK(first->acquire("api"));
        CHECK(second->acquire("api"));
        CHECK(first->acquire("api"));
        CHECK_FALSE(second->acquire("api"));
        CHECK(first->get_status("api").remaining == 0);
    }

    SECTION("Missing tables surface as TableMissingError") {
        options.auto_create_tables = false;
        auto store = make_store(std::make_unique<SqliteBackend>(options));

        try {
            (void)store->can_proceed("api");
            FAIL("expected TableMissingError");
        } catch (const TableMissingError& e) {
            CHECK(e.table_name() == SqliteBackend::kRecordsTable);
            CHECK(e.category() == ErrorCategory::INFRASTRUCTURE_ERROR);
        }
    }
}

TEST_CASE("SqliteBackend: connection ownership", "[sqlite]") {

    SECTION("A private connection is closed with the store") {
        auto backend = std::make_unique<SqliteBackend>(SqliteBackend::Options{});
        auto connection = backend->connection();
        auto store = make_store(std::move(backend));

        store->close();
        CHECK_FALSE(connection->is_open());
    }

    SECTION("A shared connection stays open after the store closes") {
        auto connection = std::make_shared<SqliteConnection>(SqliteConnection::Options{});
        auto first = make_store(std::make_unique<SqliteBackend>(connection, true));
        first->record("api");
        first->close();

        REQUIRE(connection->is_open());
        CHECK(connection->table_exists(SqliteBackend::kRecordsTable));

        auto second = make_store(std::make_unique<SqliteBackend>(connection, false));
        CHECK(second->get_status("api").remaining == 2);
    }

    SECTION("In-memory databases are not persistent") {
        SqliteBackend backend(SqliteBackend::Options{});
        CHECK_FALSE(backend.capabilities().persistent);
        CHECK(backend.capabilities().supports_listing);
        CHECK_FALSE(backend.capabilities().native_expiry);
    }
}

TEST_CASE("SqliteBackend: purge and listing", "[sqlite]") {
    SqliteBackend backend(SqliteBackend::Options{});
    const int64_t now = utils::now_ms();

    auto insert = [&](const std::string& resource, int64_t ts) {
        backend.insert_record(RequestRecord{resource, ts, std::nullopt, utils::generate_uuid()},
                              60000);
    };

    insert("short", now - 5000);
    insert("short", now - 500);
    insert("long", now - 5000);
    backend.put_cooldown("expired.example.com", now - 1);
    backend.put_cooldown("active.example.com", now + 60000);

    const auto window_of = [](const std::string& resource) -> int64_t {
        return resource == "short" ? 1000 : 60000;
    };

    CHECK(backend.purge_expired(now, window_of) == 2);
    CHECK(backend.count_in_window("short", 0, std::nullopt) == 1);
    CHECK(backend.count_in_window("long", 0, std::nullopt) == 1);
    CHECK_FALSE(backend.read_cooldown("expired.example.com").has_value());
    CHECK(backend.read_cooldown("active.example.com").has_value());

    const auto counts = backend.record_counts();
    REQUIRE(counts.size() == 2);
}

TEST_CASE("SqliteConnection: errors", "[sqlite]") {
    SqliteConnection connection(SqliteConnection::Options{});

    SECTION("Malformed SQL is a BackendError") {
        CHECK_THROWS_AS(connection.execute("SELEC nonsense"), BackendError);
    }

    SECTION("Unknown table is a TableMissingError") {
        CHECK_THROWS_AS(connection.prepare("SELECT * FROM nowhere"), TableMissingError);
    }

    SECTION("Transaction rolls back unless committed") {
        connection.execute("CREATE TABLE t (v INTEGER)");
        {
            SqliteTransaction tx(connection);
            connection.execute("INSERT INTO t VALUES (1)");
        }
        {
            SqliteTransaction tx(connection);
            connection.execute("INSERT INTO t VALUES (2)");
            tx.commit();
        }
        auto stmt = connection.prepare("SELECT COUNT(*), SUM(v) FROM t");
        REQUIRE(stmt.step());
        CHECK(stmt.column_int64(0) == 1);
        CHECK(stmt.column_int64(1) == 2);
    }

    SECTION("Closed connection refuses work") {
        connection.close();
        CHECK_FALSE(connection.is_open());
        CHECK_THROWS_AS(connection.execute("SELECT 1"), BackendError);
    }
}

#include "backend/sqlite_backend.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace ratekeeper {

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS rate_limits (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    resource TEXT NOT NULL,
    timestamp INTEGER NOT NULL,
    priority TEXT,
    unique_id TEXT NOT NULL UNIQUE
);
CREATE INDEX IF NOT EXISTS idx_rate_limits_resource_timestamp
    ON rate_limits (resource, timestamp);
CREATE INDEX IF NOT EXISTS idx_rate_limits_resource_priority_timestamp
    ON rate_limits (resource, priority, timestamp);
CREATE TABLE IF NOT EXISTS rate_limit_slots (
    resource TEXT NOT NULL,
    priority TEXT NOT NULL DEFAULT '',
    slot_index INTEGER NOT NULL,
    expires_at INTEGER NOT NULL,
    PRIMARY KEY (resource, priority, slot_index)
);
CREATE TABLE IF NOT EXISTS server_cooldowns (
    origin TEXT PRIMARY KEY,
    cooldown_until INTEGER NOT NULL
);
)SQL";

// Slot rows use '' rather than NULL so the primary key stays unique
std::string_view slot_priority(std::optional<Priority> priority) {
    return priority ? priority_to_string(*priority) : "";
}

} // anonymous namespace

SqliteBackend::SqliteBackend(const Options& options)
    : connection_(std::make_shared<SqliteConnection>(
          SqliteConnection::Options{options.path, options.busy_timeout_ms, true}))
    , owns_connection_(true) {
    if (options.auto_create_tables) {
        create_tables();
    }
}

SqliteBackend::SqliteBackend(std::shared_ptr<SqliteConnection> connection,
                             bool auto_create_tables)
    : connection_(std::move(connection))
    , owns_connection_(false) {
    if (!connection_) {
        throw BackendError("SqliteBackend requires a connection");
    }
    if (auto_create_tables) {
        create_tables();
    }
}

SqliteBackend::~SqliteBackend() {
    close();
}

void SqliteBackend::create_tables() {
    auto lock = connection_->lock();
    connection_->execute(kSchema);
}

uint64_t SqliteBackend::count_in_window(const std::string& resource,
                                        int64_t window_start_ms,
                                        std::optional<Priority> priority) {
    auto lock = connection_->lock();
    if (priority) {
        auto stmt = connection_->prepare(
            "SELECT COUNT(*) FROM rate_limits "
            "WHERE resource = ? AND priority = ? AND timestamp >= ?");
        stmt.bind(1, resource).bind(2, priority_to_string(*priority)).bind(3, window_start_ms);
        return stmt.step() ? static_cast<uint64_t>(stmt.column_int64(0)) : 0;
    }

    auto stmt = connection_->prepare(
        "SELECT COUNT(*) FROM rate_limits WHERE resource = ? AND timestamp >= ?");
    stmt.bind(1, resource).bind(2, window_start_ms);
    return stmt.step() ? static_cast<uint64_t>(stmt.column_int64(0)) : 0;
}

std::optional<int64_t> SqliteBackend::oldest_in_window(const std::string& resource,
                                                       int64_t window_start_ms,
                                                       std::optional<Priority> priority) {
    auto lock = connection_->lock();
    auto stmt = priority
        ? connection_->prepare(
              "SELECT MIN(timestamp) FROM rate_limits "
              "WHERE resource = ? AND priority = ? AND timestamp >= ?")
        : connection_->prepare(
              "SELECT MIN(timestamp) FROM rate_limits "
              "WHERE resource = ? AND timestamp >= ?");

    stmt.bind(1, resource);
    if (priority) {
        stmt.bind(2, priority_to_string(*priority)).bind(3, window_start_ms);
    } else {
        stmt.bind(2, window_start_ms);
    }

    // MIN() over no rows yields one NULL row
    if (!stmt.step() || stmt.column_is_null(0)) return std::nullopt;
    return stmt.column_int64(0);
}

void SqliteBackend::insert_record_locked(const RequestRecord& record) {
    auto stmt = connection_->prepare(
        "INSERT INTO rate_limits (resource, timestamp, priority, unique_id) "
        "VALUES (?, ?, ?, ?)");
    stmt.bind(1, record.resource).bind(2, record.timestamp_ms);
    if (record.priority) {
        stmt.bind(3, priority_to_string(*record.priority));
    } else {
        stmt.bind_null(3);
    }
    stmt.bind(4, record.unique_id);
    stmt.run();
}

void SqliteBackend::insert_record(const RequestRecord& record, int64_t /*window_ms*/) {
    auto lock = connection_->lock();
    insert_record_locked(record);
}

SlotClaimOutcome SqliteBackend::try_claim_slot(const SlotClaim& claim,
                                               const RequestRecord& record) {
    auto lock = connection_->lock();
    SqliteTransaction txn(*connection_);

    auto stmt = connection_->prepare(
        "INSERT INTO rate_limit_slots (resource, priority, slot_index, expires_at) "
        "VALUES (?, ?, ?, ?) "
        "ON CONFLICT (resource, priority, slot_index) "
        "DO UPDATE SET expires_at = excluded.expires_at "
        "WHERE rate_limit_slots.expires_at <= ?");
    stmt.bind(1, claim.resource)
        .bind(2, slot_priority(claim.priority))
        .bind(3, static_cast<int64_t>(claim.slot_index))
        .bind(4, claim.expires_at_ms())
        .bind(5, claim.claimed_at_ms);
    stmt.run();

    if (connection_->changes() != 1) {
        // Live claim on this index; the transaction rolls back on scope exit
        return SlotClaimOutcome::CONFLICT;
    }

    insert_record_locked(record);
    txn.commit();
    return SlotClaimOutcome::CLAIMED;
}

std::vector<int64_t> SqliteBackend::load_recent_timestamps(const std::string& resource,
                                                           Priority priority,
                                                           int64_t since_ms,
                                                           size_t max_count) {
    std::vector<int64_t> result;
    auto lock = connection_->lock();
    auto stmt = connection_->prepare(
        "SELECT timestamp FROM rate_limits "
        "WHERE resource = ? AND priority = ? AND timestamp >= ? "
        "ORDER BY timestamp DESC LIMIT ?");
    stmt.bind(1, resource)
        .bind(2, priority_to_string(priority))
        .bind(3, since_ms)
        .bind(4, static_cast<int64_t>(max_count));

    while (stmt.step()) {
        result.push_back(stmt.column_int64(0));
    }
    std::reverse(result.begin(), result.end());
    return result;
}

void SqliteBackend::delete_resource(const std::string& resource) {
    auto lock = connection_->lock();
    SqliteTransaction txn(*connection_);
    connection_->prepare("DELETE FROM rate_limits WHERE resource = ?").bind(1, resource).run();
    connection_->prepare("DELETE FROM rate_limit_slots WHERE resource = ?").bind(1, resource).run();
    txn.commit();
}

void SqliteBackend::delete_all() {
    auto lock = connection_->lock();
    SqliteTransaction txn(*connection_);
    connection_->execute("DELETE FROM rate_limits");
    connection_->execute("DELETE FROM rate_limit_slots");
    connection_->execute("DELETE FROM server_cooldowns");
    txn.commit();
}

size_t SqliteBackend::purge_expired(int64_t now_ms, const WindowLookup& window_of) {
    size_t removed = 0;
    auto lock = connection_->lock();

    std::vector<std::string> resources;
    {
        auto stmt = connection_->prepare("SELECT DISTINCT resource FROM rate_limits");
        while (stmt.step()) {
            resources.push_back(stmt.column_text(0));
        }
    }

    SqliteTransaction txn(*connection_);
    for (const auto& resource : resources) {
        connection_->prepare("DELETE FROM rate_limits WHERE resource = ? AND timestamp < ?")
            .bind(1, resource)
            .bind(2, now_ms - window_of(resource))
            .run();
        removed += static_cast<size_t>(connection_->changes());
    }

    connection_->prepare("DELETE FROM rate_limit_slots WHERE expires_at <= ?")
        .bind(1, now_ms).run();
    removed += static_cast<size_t>(connection_->changes());

    connection_->prepare("DELETE FROM server_cooldowns WHERE cooldown_until <= ?")
        .bind(1, now_ms).run();
    removed += static_cast<size_t>(connection_->changes());

    txn.commit();
    return removed;
}

std::vector<ResourceUsage> SqliteBackend::record_counts() {
    std::vector<ResourceUsage> result;
    auto lock = connection_->lock();
    auto stmt = connection_->prepare(
        "SELECT resource, COUNT(*) FROM rate_limits GROUP BY resource ORDER BY resource");
    while (stmt.step()) {
        ResourceUsage usage;
        usage.resource = stmt.column_text(0);
        usage.request_count = static_cast<uint64_t>(stmt.column_int64(1));
        result.push_back(std::move(usage));
    }
    return result;
}

void SqliteBackend::put_cooldown(const std::string& origin, int64_t until_ms) {
    auto lock = connection_->lock();
    connection_->prepare(
        "INSERT INTO server_cooldowns (origin, cooldown_until) VALUES (?, ?) "
        "ON CONFLICT (origin) DO UPDATE SET cooldown_until = excluded.cooldown_until")
        .bind(1, origin)
        .bind(2, until_ms)
        .run();
}

std::optional<int64_t> SqliteBackend::read_cooldown(const std::string& origin) {
    auto lock = connection_->lock();
    auto stmt = connection_->prepare(
        "SELECT cooldown_until FROM server_cooldowns WHERE origin = ?");
    stmt.bind(1, origin);
    if (!stmt.step()) return std::nullopt;
    return stmt.column_int64(0);
}

void SqliteBackend::delete_cooldown(const std::string& origin) {
    auto lock = connection_->lock();
    connection_->prepare("DELETE FROM server_cooldowns WHERE origin = ?").bind(1, origin).run();
}

void SqliteBackend::close() {
    if (closed_.exchange(true)) return;
    if (owns_connection_) {
        connection_->close();
    }
}

} // namespace ratekeeper

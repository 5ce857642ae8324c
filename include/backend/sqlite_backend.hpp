#pragma once

#include "backend/irate_limit_backend.hpp"
#include "backend/sqlite_connection.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace ratekeeper {

/**
 * @brief Embedded SQL backend (SQLite)
 *
 * Tables:
 *   rate_limits       (id, resource, timestamp, priority, unique_id UNIQUE)
 *   rate_limit_slots  (resource, priority, slot_index, expires_at), PK on the first three
 *   server_cooldowns  (origin PK, cooldown_until)
 *
 * Slot claims run inside BEGIN IMMEDIATE: an upsert that only overwrites an
 * expired claim, followed by the record insert. Records have no native
 * expiry; purge_expired() reclaims them.
 */
class SqliteBackend : public IRateLimitBackend {
public:
    struct Options {
        std::string path = ":memory:";
        bool auto_create_tables = true;
        int busy_timeout_ms = 5000;
    };

    static constexpr const char* kRecordsTable = "rate_limits";
    static constexpr const char* kSlotsTable = "rate_limit_slots";
    static constexpr const char* kCooldownsTable = "server_cooldowns";

    /**
     * @brief Open a private connection; close() closes it
     */
    explicit SqliteBackend(const Options& options);

    /**
     * @brief Use a caller-owned connection; close() leaves it open
     */
    SqliteBackend(std::shared_ptr<SqliteConnection> connection, bool auto_create_tables);

    ~SqliteBackend() override;

    [[nodiscard]] std::string_view name() const override { return "sqlite"; }

    [[nodiscard]] BackendCapabilities capabilities() const override {
        return {.persistent = !connection_->is_memory(),
                .shared_across_processes = !connection_->is_memory(),
                .supports_listing = true,
                .native_expiry = false};
    }

    [[nodiscard]] uint64_t count_in_window(
        const std::string& resource,
        int64_t window_start_ms,
        std::optional<Priority> priority) override;

    [[nodiscard]] std::optional<int64_t> oldest_in_window(
        const std::string& resource,
        int64_t window_start_ms,
        std::optional<Priority> priority) override;

    void insert_record(const RequestRecord& record, int64_t window_ms) override;

    [[nodiscard]] SlotClaimOutcome try_claim_slot(
        const SlotClaim& claim,
        const RequestRecord& record) override;

    [[nodiscard]] std::vector<int64_t> load_recent_timestamps(
        const std::string& resource,
        Priority priority,
        int64_t since_ms,
        size_t max_count) override;

    void delete_resource(const std::string& resource) override;
    void delete_all() override;
    size_t purge_expired(int64_t now_ms, const WindowLookup& window_of) override;

    [[nodiscard]] std::vector<ResourceUsage> record_counts() override;

    void put_cooldown(const std::string& origin, int64_t until_ms) override;
    [[nodiscard]] std::optional<int64_t> read_cooldown(const std::string& origin) override;
    void delete_cooldown(const std::string& origin) override;

    void close() override;

    /**
     * @brief CREATE TABLE/INDEX IF NOT EXISTS for all three tables
     */
    void create_tables();

    [[nodiscard]] std::shared_ptr<SqliteConnection> connection() const { return connection_; }

private:
    void insert_record_locked(const RequestRecord& record);

    std::shared_ptr<SqliteConnection> connection_;
    bool owns_connection_;
    std::atomic<bool> closed_{false};
};

} // namespace ratekeeper

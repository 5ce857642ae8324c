#pragma once

#include "backend/ikv_client.hpp"
#include "backend/irate_limit_backend.hpp"
#include "backend/kv_utils.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace ratekeeper {

/**
 * @brief Distributed backend over a shared key-value table
 *
 * Several processes may point at the same table; the slot claim is a
 * two-item transaction (slot item conditioned on "absent or expired", plus
 * the request record), so exclusivity holds across the fleet. Items carry a
 * `ttl` attribute (epoch seconds, rounded up) for clients with native
 * expiry; with any other client the store's cleanup worker purges them.
 *
 * Client errors are translated at every call site: a missing table becomes
 * TableMissingError, anything else BackendError.
 */
class KvBackend : public IRateLimitBackend {
public:
    static constexpr const char* kDefaultTableName = "http-client-toolkit";

    struct Options {
        std::string table_name = kDefaultTableName;
        bool ensure_table_exists = false;
        int table_wait_attempts = 30;
        std::chrono::milliseconds table_wait_delay{1000};
        kv::Sleeper sleeper = kv::sleep_for;
    };

    /**
     * @throws TableMissingError / BackendError if table provisioning fails
     */
    KvBackend(std::shared_ptr<IKeyValueClient> client, Options options);

    [[nodiscard]] std::string_view name() const override { return "kv"; }

    [[nodiscard]] BackendCapabilities capabilities() const override {
        return {.persistent = true,
                .shared_across_processes = true,
                .supports_listing = false,
                .native_expiry = client_->supports_native_ttl()};
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

    /**
     * @brief Delete records older than their resource's window, and slots and
     *        cooldowns whose deadline has passed
     *
     * Decided on the millisecond attributes; the rounded ttl is never used.
     */
    size_t purge_expired(int64_t now_ms, const WindowLookup& window_of) override;

    [[nodiscard]] std::vector<ResourceUsage> record_counts() override;

    void put_cooldown(const std::string& origin, int64_t until_ms) override;
    [[nodiscard]] std::optional<int64_t> read_cooldown(const std::string& origin) override;
    void delete_cooldown(const std::string& origin) override;

    void close() override;

    /**
     * @brief Create the table (with gsi1) if the client reports it missing,
     *        then wait for it to become ACTIVE
     */
    void ensure_table();

    [[nodiscard]] const std::string& table_name() const { return options_.table_name; }

private:
    [[nodiscard]] KvItem build_record_item(const RequestRecord& record, int64_t window_ms) const;
    [[nodiscard]] bool is_expired(const KvItem& item, int64_t now_ms,
                                  const WindowLookup& window_of) const;
    [[nodiscard]] KvQuery window_query(const std::string& resource,
                                       int64_t window_start_ms,
                                       std::optional<Priority> priority) const;

    /**
     * @brief Run fn, translating KvError into the store's error vocabulary
     */
    template <typename Fn>
    auto translate(Fn&& fn) -> decltype(fn());

    [[noreturn]] void rethrow(const KvError& error) const;

    std::shared_ptr<IKeyValueClient> client_;
    Options options_;
    std::atomic<bool> closed_{false};
};

} // namespace ratekeeper

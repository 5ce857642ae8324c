#pragma once

#include "backend/irate_limit_backend.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ratekeeper {

/**
 * @brief In-process backend: per-resource record logs behind one lock
 *
 * The slot claim is a check-and-insert under the exclusive lock, which is
 * all the atomicity a single process needs. Nothing survives the process.
 */
class MemoryBackend : public IRateLimitBackend {
public:
    MemoryBackend() = default;

    [[nodiscard]] std::string_view name() const override { return "memory"; }

    [[nodiscard]] BackendCapabilities capabilities() const override {
        return {.persistent = false,
                .shared_across_processes = false,
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

private:
    struct Entry {
        int64_t timestamp_ms;
        std::optional<Priority> priority;
    };

    static bool matches(const Entry& e, int64_t window_start_ms,
                        std::optional<Priority> priority) {
        return e.timestamp_ms >= window_start_ms && (!priority || e.priority == priority);
    }

    std::unordered_map<std::string, std::vector<Entry>> records_;
    // resource -> (slot partition + slot sort key -> expires_at_ms)
    std::unordered_map<std::string, std::unordered_map<std::string, int64_t>> slots_;
    std::unordered_map<std::string, int64_t> cooldowns_;
    mutable std::shared_mutex mutex_;
};

} // namespace ratekeeper

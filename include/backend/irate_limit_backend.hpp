#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ratekeeper {

/**
 * @brief What a storage medium offers beyond the core primitives
 *
 * Read once when a store is constructed; stores never probe a backend's
 * shape per call.
 */
struct BackendCapabilities {
    bool persistent = false;               // Survives process restart
    bool shared_across_processes = false;  // Safe for multi-instance fleets
    bool supports_listing = false;         // record_counts() is implemented
    bool native_expiry = false;            // Items carry a TTL the medium reclaims itself
};

/**
 * @brief Maps a resource to its current window length (used by purge_expired)
 */
using WindowLookup = std::function<int64_t(const std::string& resource)>;

/**
 * @brief Storage primitives shared by every rate limit store
 *
 * Implementations: MemoryBackend (in-process map), SqliteBackend (embedded
 * SQL), KvBackend (distributed key-value table). The admission algorithm
 * lives in the stores; a backend only answers window queries and performs
 * the atomic slot claim with the medium's own consistency primitive.
 *
 * Priority arguments: std::nullopt means "all priorities".
 * Every method may throw TableMissingError or BackendError.
 */
class IRateLimitBackend {
public:
    virtual ~IRateLimitBackend() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    [[nodiscard]] virtual BackendCapabilities capabilities() const = 0;

    /**
     * @brief Count records with timestamp >= window_start_ms
     */
    [[nodiscard]] virtual uint64_t count_in_window(
        const std::string& resource,
        int64_t window_start_ms,
        std::optional<Priority> priority) = 0;

    /**
     * @brief Oldest timestamp >= window_start_ms, std::nullopt if none
     */
    [[nodiscard]] virtual std::optional<int64_t> oldest_in_window(
        const std::string& resource,
        int64_t window_start_ms,
        std::optional<Priority> priority) = 0;

    /**
     * @brief Append one record; window_ms sizes the expiry marker
     */
    virtual void insert_record(const RequestRecord& record, int64_t window_ms) = 0;

    /**
     * @brief Atomically claim a slot and write its record
     *
     * Both writes happen or neither does. Returns CONFLICT when the slot is
     * held by a claim that has not yet expired; any other failure throws.
     */
    [[nodiscard]] virtual SlotClaimOutcome try_claim_slot(
        const SlotClaim& claim,
        const RequestRecord& record) = 0;

    /**
     * @brief Up to max_count newest timestamps >= since_ms, returned oldest-first
     */
    [[nodiscard]] virtual std::vector<int64_t> load_recent_timestamps(
        const std::string& resource,
        Priority priority,
        int64_t since_ms,
        size_t max_count) = 0;

    /**
     * @brief Delete every record and slot claim for one resource
     */
    virtual void delete_resource(const std::string& resource) = 0;

    /**
     * @brief Delete all records, slot claims and cooldowns
     */
    virtual void delete_all() = 0;

    /**
     * @brief Delete records older than their resource's window, plus expired
     *        slot claims and cooldowns
     * @return Number of rows/items removed
     */
    virtual size_t purge_expired(int64_t now_ms, const WindowLookup& window_of) = 0;

    /**
     * @brief Stored record count per resource (expired records included until purged)
     * @throws UnsupportedOperationError when capabilities().supports_listing is false
     */
    [[nodiscard]] virtual std::vector<ResourceUsage> record_counts() = 0;

    // Cooldowns
    virtual void put_cooldown(const std::string& origin, int64_t until_ms) = 0;
    [[nodiscard]] virtual std::optional<int64_t> read_cooldown(const std::string& origin) = 0;
    virtual void delete_cooldown(const std::string& origin) = 0;

    /**
     * @brief Release connections/handles. Idempotent.
     */
    virtual void close() = 0;
};

} // namespace ratekeeper

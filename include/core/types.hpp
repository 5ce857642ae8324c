#pragma once

#include "core/request_priority.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ratekeeper {

// ============================================================================
// Rate Limit Configuration
// ============================================================================

/**
 * @brief Sliding-window limit for one resource
 *
 * limit = 0 means "never proceed", not "unlimited".
 */
struct RateLimitConfig {
    uint32_t limit = 60;
    int64_t window_ms = 60000;

    bool operator==(const RateLimitConfig&) const = default;
};

inline constexpr RateLimitConfig kDefaultRateLimit{60, 60000};

// ============================================================================
// Persisted Entities
// ============================================================================

/**
 * @brief One accepted request. unique_id disambiguates equal timestamps.
 */
struct RequestRecord {
    std::string resource;
    int64_t timestamp_ms = 0;
    std::optional<Priority> priority;
    std::string unique_id;
};

/**
 * @brief Conditional marker making "room for one more" an atomic decision
 *
 * The claim is live until expires_at_ms; a conditional write on the same
 * (resource, priority, slot_index) succeeds only once the previous claim
 * has expired.
 */
struct SlotClaim {
    std::string resource;
    std::optional<Priority> priority;
    uint32_t slot_index = 0;
    int64_t window_ms = 0;
    int64_t claimed_at_ms = 0;

    [[nodiscard]] int64_t expires_at_ms() const { return claimed_at_ms + window_ms; }
};

enum class SlotClaimOutcome {
    CLAIMED,
    CONFLICT
};

// ============================================================================
// Introspection
// ============================================================================

struct AdaptiveStatus {
    uint32_t user_reserved = 0;
    uint32_t background_max = 0;
    bool background_paused = false;
    uint32_t recent_user_activity = 0;
    std::string reason;
};

struct RateLimitStatus {
    uint32_t remaining = 0;
    int64_t reset_time_ms = 0;
    uint32_t limit = 0;
    std::optional<AdaptiveStatus> adaptive;
};

struct ResourceUsage {
    std::string resource;
    uint64_t request_count = 0;
    uint32_t limit = 0;
    int64_t window_ms = 0;
};

struct StoreStats {
    uint64_t total_requests = 0;
    uint64_t unique_resources = 0;
    std::vector<std::string> rate_limited_resources;
};

} // namespace ratekeeper

#pragma once

#include "core/request_priority.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ratekeeper {

/**
 * @brief Validates caller-supplied keys and maps them onto storage keys
 *
 * Key layout (shared with existing key-value deployments):
 *   request record   pk = RATELIMIT#{resource}           sk = TS#{ts}#{uuid}
 *   priority index   gsi1pk = RATELIMIT#{resource}#{p}   gsi1sk = TS#{ts}#{uuid}
 *   slot claim       pk = RATELIMIT_SLOT#{resource}[#{p}] sk = SLOT#{index}
 *   cooldown         pk = sk = COOLDOWN#{origin}
 */
class ResourceKeyCodec {
public:
    static constexpr size_t kMaxKeyBytes = 512;
    static constexpr char kKeySeparator = '#';

    static constexpr std::string_view kRecordPrefix = "RATELIMIT#";
    static constexpr std::string_view kSlotPrefix = "RATELIMIT_SLOT#";
    static constexpr std::string_view kCooldownPrefix = "COOLDOWN#";
    static constexpr std::string_view kTimestampPrefix = "TS#";
    static constexpr std::string_view kSlotSortPrefix = "SLOT#";

    /**
     * @brief Reject empty, oversized (> 512 UTF-8 bytes) or control-character keys
     * @param label Name used in the message ("resource", "origin")
     * @throws ValidationError
     */
    static void validate(std::string_view value, std::string_view label);

    /**
     * @brief validate() plus a ban on '#', the separator in storage keys
     * @throws ValidationError
     */
    static void validate_resource(std::string_view resource);
    static void validate_origin(std::string_view origin) { validate(origin, "origin"); }

    [[nodiscard]] static std::string record_partition(std::string_view resource);
    [[nodiscard]] static std::string record_sort(int64_t timestamp_ms, std::string_view unique_id);

    /**
     * @brief Inclusive lower bound for "sk >= window start" range queries
     */
    [[nodiscard]] static std::string record_sort_lower_bound(int64_t window_start_ms);

    [[nodiscard]] static std::string priority_partition(std::string_view resource, Priority priority);

    [[nodiscard]] static std::string slot_partition(std::string_view resource,
                                                    std::optional<Priority> priority);
    [[nodiscard]] static std::string slot_sort(uint32_t slot_index);

    [[nodiscard]] static std::string cooldown_key(std::string_view origin);

    /**
     * @brief Recover the resource from a RATELIMIT#{resource} partition key
     */
    [[nodiscard]] static std::optional<std::string> resource_from_partition(std::string_view pk);
};

} // namespace ratekeeper

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace ratekeeper {

/**
 * @brief Traffic class for adaptive allocation
 *
 *   USER       = interactive, latency-sensitive
 *   BACKGROUND = deferrable (prefetch, sync jobs)
 */
enum class Priority : uint8_t {
    USER = 0,
    BACKGROUND = 1
};

inline constexpr std::string_view kPriorityUser       = "user";
inline constexpr std::string_view kPriorityBackground = "background";

inline constexpr Priority kAllPriorities[] = {Priority::USER, Priority::BACKGROUND};

/**
 * @brief Parse priority string, std::nullopt if unrecognized
 */
inline std::optional<Priority> parse_priority(std::string_view str) {
    static const std::unordered_map<std::string_view, Priority> kMap = {
        {kPriorityUser,       Priority::USER},
        {kPriorityBackground, Priority::BACKGROUND},
    };
    const auto it = kMap.find(str);
    if (it == kMap.end()) return std::nullopt;
    return it->second;
}

inline const char* priority_to_string(Priority priority) {
    switch (priority) {
        case Priority::USER:       return "user";
        case Priority::BACKGROUND: return "background";
        default:                   return "background";
    }
}

} // namespace ratekeeper

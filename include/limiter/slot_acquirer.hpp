#pragma once

#include "backend/irate_limit_backend.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ratekeeper {

/**
 * @brief Atomic "reserve one of limit slots" over any backend
 *
 * Walks slot indices 0..limit-1 once. A conflict on an index (claim still
 * live) advances to the next index; any other backend error propagates
 * without retry. Returns false when every index is held, which is the
 * normal "capacity exhausted" outcome.
 */
class SlotAcquirer {
public:
    struct Result {
        bool acquired = false;
        uint32_t attempts = 0;
        std::optional<uint32_t> slot_index;
    };

    explicit SlotAcquirer(IRateLimitBackend& backend)
        : backend_(backend) {}

    /**
     * @param effective_limit Number of slots (user_reserved/background_max on the adaptive store)
     * @param current_count   In-window records already counted against that limit
     */
    [[nodiscard]] Result acquire(const std::string& resource,
                                 std::optional<Priority> priority,
                                 uint32_t effective_limit,
                                 uint64_t current_count,
                                 int64_t window_ms,
                                 int64_t now_ms);

private:
    IRateLimitBackend& backend_;
};

} // namespace ratekeeper

#pragma once

#include "backend/irate_limit_backend.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ratekeeper {

/**
 * @brief Per-origin "do not send until" markers with expiry-on-read
 *
 * Independent of the window counters; typically fed from Retry-After.
 */
class CooldownStore {
public:
    explicit CooldownStore(IRateLimitBackend& backend)
        : backend_(backend) {}

    /**
     * @brief Upsert the cooldown for origin
     * @throws ValidationError on an invalid origin key
     */
    void set(const std::string& origin, int64_t until_ms);

    /**
     * @brief The stored timestamp if still in the future
     *
     * An expired entry is deleted and reported as absent.
     */
    [[nodiscard]] std::optional<int64_t> get(const std::string& origin, int64_t now_ms);

    void clear(const std::string& origin);

private:
    IRateLimitBackend& backend_;
};

} // namespace ratekeeper

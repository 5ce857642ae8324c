#pragma once

#include "core/types.hpp"

#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace ratekeeper {

/**
 * @brief Per-resource RateLimitConfig with a store-wide default
 *
 * Entries never expire. Thread-safe.
 */
class ResourceConfigRegistry {
public:
    explicit ResourceConfigRegistry(RateLimitConfig default_config = kDefaultRateLimit,
                                    std::unordered_map<std::string, RateLimitConfig> overrides = {})
        : default_config_(default_config)
        , configs_(std::move(overrides)) {}

    void set(const std::string& resource, const RateLimitConfig& config) {
        std::unique_lock lock(mutex_);
        configs_[resource] = config;
    }

    [[nodiscard]] RateLimitConfig get(const std::string& resource) const {
        std::shared_lock lock(mutex_);
        const auto it = configs_.find(resource);
        return (it != configs_.end()) ? it->second : default_config_;
    }

    [[nodiscard]] const RateLimitConfig& default_config() const { return default_config_; }

    [[nodiscard]] int64_t window_ms(const std::string& resource) const {
        return get(resource).window_ms;
    }

private:
    const RateLimitConfig default_config_;
    std::unordered_map<std::string, RateLimitConfig> configs_;
    mutable std::shared_mutex mutex_;
};

} // namespace ratekeeper

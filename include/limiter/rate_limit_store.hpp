#pragma once

#include "limiter/irate_limit_store.hpp"
#include "limiter/store_core.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace ratekeeper {

/**
 * @brief Sliding-window store with a single limit per resource
 *
 * All traffic for a resource shares its limit regardless of priority.
 */
class RateLimitStore : public IRateLimitStore {
public:
    using Options = StoreCore::Options;

    explicit RateLimitStore(std::unique_ptr<IRateLimitBackend> backend,
                            Options options = {});
    ~RateLimitStore() override = default;

    [[nodiscard]] bool can_proceed(const std::string& resource) override;
    [[nodiscard]] bool acquire(const std::string& resource) override;
    void record(const std::string& resource) override;
    [[nodiscard]] RateLimitStatus get_status(const std::string& resource) override;
    [[nodiscard]] int64_t get_wait_time(const std::string& resource) override;

    void reset(const std::string& resource) override;
    void clear() override;

    void set_resource_config(const std::string& resource,
                             const RateLimitConfig& config) override;
    [[nodiscard]] RateLimitConfig get_resource_config(const std::string& resource) override;

    void set_cooldown(const std::string& origin, int64_t until_ms) override;
    [[nodiscard]] std::optional<int64_t> get_cooldown(const std::string& origin) override;
    void clear_cooldown(const std::string& origin) override;

    void close() override;

    /**
     * @throws UnsupportedOperationError on backends without listing
     */
    [[nodiscard]] StoreStats get_stats() { return core_.get_stats(); }
    [[nodiscard]] std::vector<ResourceUsage> list_resources() { return core_.list_resources(); }
    size_t cleanup() { return core_.cleanup(); }

    [[nodiscard]] const BackendCapabilities& capabilities() const { return core_.capabilities(); }
    [[nodiscard]] std::string_view backend_name() { return core_.backend().name(); }

private:
    // Validated resource + its config; throws on a closed store first
    RateLimitConfig prepare(const std::string& resource);

    StoreCore core_;
};

} // namespace ratekeeper

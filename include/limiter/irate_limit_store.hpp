#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ratekeeper {

/**
 * @brief Sliding-window rate limit store
 *
 * Implemented over every backend (memory, sqlite, kv) with identical
 * admission decisions. can_proceed/acquire return false for "capacity
 * exhausted"; only genuine faults throw (ValidationError,
 * StoreDestroyedError, TableMissingError, BackendError).
 */
class IRateLimitStore {
public:
    virtual ~IRateLimitStore() = default;

    /**
     * @brief true iff the in-window count is below the limit (never for limit 0)
     */
    [[nodiscard]] virtual bool can_proceed(const std::string& resource) = 0;

    /**
     * @brief Atomically reserve capacity and record the request
     *
     * Unlike can_proceed() + record(), concurrent callers can never push
     * the in-window count past the limit.
     */
    [[nodiscard]] virtual bool acquire(const std::string& resource) = 0;

    /**
     * @brief Log a request at now without checking capacity
     */
    virtual void record(const std::string& resource) = 0;

    [[nodiscard]] virtual RateLimitStatus get_status(const std::string& resource) = 0;

    /**
     * @brief Milliseconds until a request may proceed
     *
     * window_ms for limit 0, 0 when under the limit, otherwise the time until
     * the oldest in-window record ages out.
     */
    [[nodiscard]] virtual int64_t get_wait_time(const std::string& resource) = 0;

    virtual void reset(const std::string& resource) = 0;
    virtual void clear() = 0;

    virtual void set_resource_config(const std::string& resource,
                                     const RateLimitConfig& config) = 0;
    [[nodiscard]] virtual RateLimitConfig get_resource_config(const std::string& resource) = 0;

    virtual void set_cooldown(const std::string& origin, int64_t until_ms) = 0;
    [[nodiscard]] virtual std::optional<int64_t> get_cooldown(const std::string& origin) = 0;
    virtual void clear_cooldown(const std::string& origin) = 0;

    /**
     * @brief Release the backend; idempotent. Later calls throw StoreDestroyedError.
     */
    virtual void close() = 0;

    void destroy() { close(); }
};

/**
 * @brief Priority-aware rate limit store
 *
 * Each priority is admitted against its share of the limit
 * (user_reserved / background_max). An omitted priority means background,
 * except for get_status() where it reports whole-resource capacity.
 */
class IAdaptiveRateLimitStore {
public:
    virtual ~IAdaptiveRateLimitStore() = default;

    [[nodiscard]] virtual bool can_proceed(
        const std::string& resource,
        std::optional<Priority> priority = std::nullopt) = 0;

    [[nodiscard]] virtual bool acquire(
        const std::string& resource,
        std::optional<Priority> priority = std::nullopt) = 0;

    virtual void record(
        const std::string& resource,
        std::optional<Priority> priority = std::nullopt) = 0;

    [[nodiscard]] virtual RateLimitStatus get_status(
        const std::string& resource,
        std::optional<Priority> priority = std::nullopt) = 0;

    [[nodiscard]] virtual int64_t get_wait_time(
        const std::string& resource,
        std::optional<Priority> priority = std::nullopt) = 0;

    virtual void reset(const std::string& resource) = 0;
    virtual void clear() = 0;

    virtual void set_resource_config(const std::string& resource,
                                     const RateLimitConfig& config) = 0;
    [[nodiscard]] virtual RateLimitConfig get_resource_config(const std::string& resource) = 0;

    virtual void set_cooldown(const std::string& origin, int64_t until_ms) = 0;
    [[nodiscard]] virtual std::optional<int64_t> get_cooldown(const std::string& origin) = 0;
    virtual void clear_cooldown(const std::string& origin) = 0;

    virtual void close() = 0;

    void destroy() { close(); }
};

} // namespace ratekeeper

#include "limiter/rate_limit_store.hpp"
#include "core/resource_key.hpp"
#include "core/utils.hpp"
#include "limiter/slot_acquirer.hpp"

#include <algorithm>
#include <format>

namespace ratekeeper {

RateLimitStore::RateLimitStore(std::unique_ptr<IRateLimitBackend> backend, Options options)
    : core_(std::move(backend), std::move(options)) {}

RateLimitConfig RateLimitStore::prepare(const std::string& resource) {
    core_.ensure_open();
    ResourceKeyCodec::validate_resource(resource);
    return core_.configs().get(resource);
}

bool RateLimitStore::can_proceed(const std::string& resource) {
    const auto config = prepare(resource);
    if (config.limit == 0) return false;

    const int64_t now = utils::now_ms();
    return core_.backend().count_in_window(resource, now - config.window_ms, std::nullopt)
        < config.limit;
}

bool RateLimitStore::acquire(const std::string& resource) {
    const auto config = prepare(resource);
    if (config.limit == 0) return false;

    const int64_t now = utils::now_ms();
    const uint64_t count = core_.backend().count_in_window(
        resource, now - config.window_ms, std::nullopt);
    if (count >= config.limit) return false;

    SlotAcquirer acquirer(core_.backend());
    const auto result = acquirer.acquire(resource, std::nullopt, config.limit, count,
                                         config.window_ms, now);
    if (!result.acquired) {
        utils::log::debug(std::format("acquire {}: all {} slots held", resource, config.limit));
    }
    return result.acquired;
}

void RateLimitStore::record(const std::string& resource) {
    const auto config = prepare(resource);

    RequestRecord entry;
    entry.resource = resource;
    entry.timestamp_ms = utils::now_ms();
    entry.unique_id = utils::generate_uuid();
    core_.backend().insert_record(entry, config.window_ms);
}

RateLimitStatus RateLimitStore::get_status(const std::string& resource) {
    const auto config = prepare(resource);

    const int64_t now = utils::now_ms();
    const uint64_t count = core_.backend().count_in_window(
        resource, now - config.window_ms, std::nullopt);

    RateLimitStatus status;
    status.limit = config.limit;
    status.remaining = (count >= config.limit)
        ? 0 : static_cast<uint32_t>(config.limit - count);
    status.reset_time_ms = now + config.window_ms;
    return status;
}

int64_t RateLimitStore::get_wait_time(const std::string& resource) {
    const auto config = prepare(resource);
    if (config.limit == 0) return config.window_ms;

    const int64_t now = utils::now_ms();
    const int64_t window_start = now - config.window_ms;
    if (core_.backend().count_in_window(resource, window_start, std::nullopt) < config.limit) {
        return 0;
    }

    const auto oldest = core_.backend().oldest_in_window(resource, window_start, std::nullopt);
    if (!oldest) return 0;
    return std::max<int64_t>(0, *oldest + config.window_ms - now);
}

void RateLimitStore::reset(const std::string& resource) {
    core_.ensure_open();
    ResourceKeyCodec::validate_resource(resource);
    core_.backend().delete_resource(resource);
}

void RateLimitStore::clear() {
    core_.ensure_open();
    core_.backend().delete_all();
}

void RateLimitStore::set_resource_config(const std::string& resource,
                                         const RateLimitConfig& config) {
    core_.ensure_open();
    ResourceKeyCodec::validate_resource(resource);
    core_.configs().set(resource, config);
}

RateLimitConfig RateLimitStore::get_resource_config(const std::string& resource) {
    return prepare(resource);
}

void RateLimitStore::set_cooldown(const std::string& origin, int64_t until_ms) {
    core_.ensure_open();
    core_.cooldowns().set(origin, until_ms);
}

std::optional<int64_t> RateLimitStore::get_cooldown(const std::string& origin) {
    core_.ensure_open();
    return core_.cooldowns().get(origin, utils::now_ms());
}

void RateLimitStore::clear_cooldown(const std::string& origin) {
    core_.ensure_open();
    core_.cooldowns().clear(origin);
}

void RateLimitStore::close() {
    core_.close();
}

} // namespace ratekeeper

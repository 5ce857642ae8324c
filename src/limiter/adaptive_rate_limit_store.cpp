#include "limiter/adaptive_rate_limit_store.hpp"
#include "core/resource_key.hpp"
#include "core/utils.hpp"
#include "limiter/slot_acquirer.hpp"

#include <algorithm>
#include <format>

namespace ratekeeper {

namespace {

StoreCore::Options core_options(AdaptiveRateLimitStore::Options& options) {
    StoreCore::Options core;
    core.default_config = options.default_config;
    core.resource_configs = std::move(options.resource_configs);
    core.cleanup_interval_ms = options.cleanup_interval_ms;
    return core;
}

uint32_t remaining_of(uint32_t capacity, uint64_t used) {
    return (used >= capacity) ? 0 : static_cast<uint32_t>(capacity - used);
}

} // anonymous namespace

AdaptiveRateLimitStore::AdaptiveRateLimitStore(std::unique_ptr<IRateLimitBackend> backend,
                                               Options options)
    : core_(std::move(backend), core_options(options))
    , adaptive_(options.adaptive)
    , tracker_(adaptive_)
    , calculator_(adaptive_) {}

RateLimitConfig AdaptiveRateLimitStore::prepare(const std::string& resource) {
    core_.ensure_open();
    ResourceKeyCodec::validate_resource(resource);
    return core_.configs().get(resource);
}

void AdaptiveRateLimitStore::hydrate(const std::string& resource, int64_t now_ms) {
    if (tracker_.contains(resource)) return;

    const int64_t since = now_ms - adaptive_.monitoring_window_ms;
    const size_t max_samples = tracker_.max_samples();
    auto user = core_.backend().load_recent_timestamps(resource, Priority::USER, since, max_samples);
    auto background = core_.backend().load_recent_timestamps(
        resource, Priority::BACKGROUND, since, max_samples);

    const size_t user_count = user.size();
    const size_t background_count = background.size();
    if (tracker_.hydrate(resource, std::move(user), std::move(background), now_ms) &&
        user_count + background_count > 0) {
        utils::log::debug(std::format("Hydrated activity for {}: {} user, {} background",
            resource, user_count, background_count));
    }
}

CapacitySnapshot AdaptiveRateLimitStore::capacity(const std::string& resource,
                                                  const RateLimitConfig& config,
                                                  int64_t now_ms) {
    hydrate(resource, now_ms);
    return calculator_.current(resource, tracker_.snapshot(resource, now_ms), config.limit, now_ms);
}

bool AdaptiveRateLimitStore::can_proceed(const std::string& resource,
                                         std::optional<Priority> priority) {
    const auto config = prepare(resource);
    if (config.limit == 0) return false;

    const Priority p = priority.value_or(Priority::BACKGROUND);
    const int64_t now = utils::now_ms();
    const auto snapshot = capacity(resource, config, now);
    if (p == Priority::BACKGROUND && snapshot.background_paused) return false;

    const uint32_t share = share_of(snapshot, p);
    if (share == 0) return false;

    return core_.backend().count_in_window(resource, now - config.window_ms, p) < share;
}

bool AdaptiveRateLimitStore::acquire(const std::string& resource,
                                     std::optional<Priority> priority) {
    const auto config = prepare(resource);
    if (config.limit == 0) return false;

    const Priority p = priority.value_or(Priority::BACKGROUND);
    const int64_t now = utils::now_ms();
    const auto snapshot = capacity(resource, config, now);
    if (p == Priority::BACKGROUND && snapshot.background_paused) return false;

    const uint32_t share = share_of(snapshot, p);
    const uint64_t count = core_.backend().count_in_window(resource, now - config.window_ms, p);
    if (count >= share) return false;

    SlotAcquirer acquirer(core_.backend());
    const auto result = acquirer.acquire(resource, p, share, count, config.window_ms, now);
    if (!result.acquired) {
        utils::log::debug(std::format("acquire {} ({}): all {} slots held",
            resource, priority_to_string(p), share));
        return false;
    }

    tracker_.record(resource, p, now);
    return true;
}

void AdaptiveRateLimitStore::record(const std::string& resource,
                                    std::optional<Priority> priority) {
    const auto config = prepare(resource);
    const Priority p = priority.value_or(Priority::BACKGROUND);

    RequestRecord entry;
    entry.resource = resource;
    entry.timestamp_ms = utils::now_ms();
    entry.priority = p;
    entry.unique_id = utils::generate_uuid();

    // Load persisted history before this record joins it
    hydrate(resource, entry.timestamp_ms);
    core_.backend().insert_record(entry, config.window_ms);

    tracker_.record(resource, p, entry.timestamp_ms);
}

RateLimitStatus AdaptiveRateLimitStore::get_status(const std::string& resource,
                                                   std::optional<Priority> priority) {
    const auto config = prepare(resource);

    const int64_t now = utils::now_ms();
    const int64_t window_start = now - config.window_ms;
    const auto snapshot = capacity(resource, config, now);

    RateLimitStatus status;
    status.limit = config.limit;
    status.reset_time_ms = now + config.window_ms;

    if (!priority) {
        status.remaining = remaining_of(
            config.limit, core_.backend().count_in_window(resource, window_start, std::nullopt));
    } else if (*priority == Priority::BACKGROUND && snapshot.background_paused) {
        status.remaining = 0;
    } else {
        status.remaining = remaining_of(
            share_of(snapshot, *priority),
            core_.backend().count_in_window(resource, window_start, *priority));
    }

    AdaptiveStatus adaptive;
    adaptive.user_reserved = snapshot.user_reserved;
    adaptive.background_max = snapshot.background_max;
    adaptive.background_paused = snapshot.background_paused;
    adaptive.recent_user_activity = tracker_.recent_user_count(resource, now);
    adaptive.reason = snapshot.reason;
    status.adaptive = std::move(adaptive);
    return status;
}

int64_t AdaptiveRateLimitStore::get_wait_time(const std::string& resource,
                                              std::optional<Priority> priority) {
    const auto config = prepare(resource);
    if (config.limit == 0) return config.window_ms;

    const Priority p = priority.value_or(Priority::BACKGROUND);
    const int64_t now = utils::now_ms();
    const auto snapshot = capacity(resource, config, now);
    if (p == Priority::BACKGROUND && snapshot.background_paused) {
        return adaptive_.recalculation_interval_ms;
    }

    const int64_t window_start = now - config.window_ms;
    if (core_.backend().count_in_window(resource, window_start, p) < share_of(snapshot, p)) {
        return 0;
    }

    // A zero share waits for this priority's oldest record; with none, 0
    const auto oldest = core_.backend().oldest_in_window(resource, window_start, p);
    if (!oldest) return 0;
    return std::max<int64_t>(0, *oldest + config.window_ms - now);
}

void AdaptiveRateLimitStore::reset(const std::string& resource) {
    core_.ensure_open();
    ResourceKeyCodec::validate_resource(resource);
    core_.backend().delete_resource(resource);
    tracker_.reset(resource);
    calculator_.invalidate(resource);
}

void AdaptiveRateLimitStore::clear() {
    core_.ensure_open();
    core_.backend().delete_all();
    tracker_.clear();
    calculator_.clear();
}

void AdaptiveRateLimitStore::set_resource_config(const std::string& resource,
                                                 const RateLimitConfig& config) {
    core_.ensure_open();
    ResourceKeyCodec::validate_resource(resource);
    core_.configs().set(resource, config);
    calculator_.invalidate(resource);
}

RateLimitConfig AdaptiveRateLimitStore::get_resource_config(const std::string& resource) {
    return prepare(resource);
}

void AdaptiveRateLimitStore::set_cooldown(const std::string& origin, int64_t until_ms) {
    core_.ensure_open();
    core_.cooldowns().set(origin, until_ms);
}

std::optional<int64_t> AdaptiveRateLimitStore::get_cooldown(const std::string& origin) {
    core_.ensure_open();
    return core_.cooldowns().get(origin, utils::now_ms());
}

void AdaptiveRateLimitStore::clear_cooldown(const std::string& origin) {
    core_.ensure_open();
    core_.cooldowns().clear(origin);
}

void AdaptiveRateLimitStore::close() {
    if (core_.close()) {
        tracker_.clear();
        calculator_.clear();
    }
}

} // namespace ratekeeper

#include "limiter/store_core.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <format>

namespace ratekeeper {

StoreCore::StoreCore(std::unique_ptr<IRateLimitBackend> backend, Options options)
    : backend_(std::move(backend))
    , capabilities_(backend_->capabilities())
    , configs_(options.default_config, std::move(options.resource_configs))
    , cooldowns_(*backend_)
    , cleanup_interval_ms_(options.cleanup_interval_ms) {

    if (cleanup_interval_ms_ > 0 && !capabilities_.native_expiry) {
        running_.store(true);
        cleanup_thread_ = std::thread([this] { cleanup_loop(); });
        utils::log::debug(std::format("{} store: cleanup every {}ms",
            backend_->name(), cleanup_interval_ms_));
    }
}

StoreCore::~StoreCore() {
    close();
}

void StoreCore::ensure_open() const {
    if (closed_.load(std::memory_order_acquire)) {
        throw StoreDestroyedError();
    }
}

void StoreCore::require_listing() const {
    if (!capabilities_.supports_listing) {
        throw UnsupportedOperationError(std::format(
            "The {} backend does not support listing stored records", backend_->name()));
    }
}

StoreStats StoreCore::get_stats() {
    ensure_open();
    require_listing();

    const int64_t now = utils::now_ms();
    StoreStats stats;
    for (const auto& usage : backend_->record_counts()) {
        stats.total_requests += usage.request_count;
        ++stats.unique_resources;

        const auto config = configs_.get(usage.resource);
        const uint64_t in_window = backend_->count_in_window(
            usage.resource, now - config.window_ms, std::nullopt);
        if (in_window >= config.limit) {
            stats.rate_limited_resources.push_back(usage.resource);
        }
    }
    return stats;
}

std::vector<ResourceUsage> StoreCore::list_resources() {
    ensure_open();
    require_listing();

    auto usages = backend_->record_counts();
    for (auto& usage : usages) {
        const auto config = configs_.get(usage.resource);
        usage.limit = config.limit;
        usage.window_ms = config.window_ms;
    }
    return usages;
}

size_t StoreCore::cleanup() {
    ensure_open();
    const size_t removed = backend_->purge_expired(
        utils::now_ms(),
        [this](const std::string& resource) { return configs_.window_ms(resource); });
    if (removed > 0) {
        utils::log::debug(std::format("{} store: purged {} expired entries",
            backend_->name(), removed));
    }
    return removed;
}

bool StoreCore::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }

    if (running_.exchange(false)) {
        {
            std::lock_guard lock(cleanup_mutex_);
        }
        cleanup_cv_.notify_all();
        if (cleanup_thread_.joinable()) {
            cleanup_thread_.join();
        }
    }

    backend_->close();
    utils::log::debug(std::format("{} store closed", backend_->name()));
    return true;
}

void StoreCore::cleanup_loop() {
    while (running_.load()) {
        {
            std::unique_lock lock(cleanup_mutex_);
            cleanup_cv_.wait_for(lock, std::chrono::milliseconds(cleanup_interval_ms_),
                [this] { return !running_.load(); });
        }
        if (!running_.load()) break;

        try {
            (void)backend_->purge_expired(
                utils::now_ms(),
                [this](const std::string& resource) { return configs_.window_ms(resource); });
        } catch (const std::exception& e) {
            utils::log::warn(std::format("{} store: periodic cleanup failed: {}",
                backend_->name(), e.what()));
        }
    }
}

} // namespace ratekeeper

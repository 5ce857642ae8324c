#include "limiter/store_factory.hpp"
#include "backend/in_memory_kv_client.hpp"
#include "backend/kv_backend.hpp"
#include "backend/memory_backend.hpp"
#include "backend/sqlite_backend.hpp"
#include "core/utils.hpp"

#include <format>

namespace ratekeeper {

std::unique_ptr<IRateLimitBackend> create_backend(const StoreConfig& config,
                                                  std::shared_ptr<IKeyValueClient> kv_client) {
    switch (config.backend) {
        case BackendKind::SQLITE: {
            SqliteBackend::Options options;
            options.path = config.sqlite.path;
            options.auto_create_tables = config.sqlite.auto_create_tables;
            options.busy_timeout_ms = config.sqlite.busy_timeout_ms;
            return std::make_unique<SqliteBackend>(options);
        }
        case BackendKind::KV: {
            if (!kv_client) {
                kv_client = std::make_shared<InMemoryKeyValueClient>();
            }
            KvBackend::Options options;
            options.table_name = config.kv.table;
            options.ensure_table_exists = config.kv.ensure_table_exists;
            return std::make_unique<KvBackend>(std::move(kv_client), std::move(options));
        }
        case BackendKind::MEMORY:
        default:
            return std::make_unique<MemoryBackend>();
    }
}

std::unique_ptr<RateLimitStore> create_rate_limit_store(const StoreConfig& config,
                                                        std::shared_ptr<IKeyValueClient> kv_client) {
    RateLimitStore::Options options;
    options.default_config = config.default_config;
    options.resource_configs = config.resource_configs;
    options.cleanup_interval_ms = config.cleanup_interval_ms;

    auto store = std::make_unique<RateLimitStore>(
        create_backend(config, std::move(kv_client)), std::move(options));
    utils::log::info(std::format("Rate limit store ready (backend={}, default {}/{}ms, {} overrides)",
        backend_kind_to_string(config.backend), config.default_config.limit,
        config.default_config.window_ms, config.resource_configs.size()));
    return store;
}

std::unique_ptr<AdaptiveRateLimitStore> create_adaptive_rate_limit_store(
    const StoreConfig& config,
    std::shared_ptr<IKeyValueClient> kv_client) {
    AdaptiveRateLimitStore::Options options;
    options.default_config = config.default_config;
    options.resource_configs = config.resource_configs;
    options.cleanup_interval_ms = config.cleanup_interval_ms;
    options.adaptive = config.adaptive_config;

    auto store = std::make_unique<AdaptiveRateLimitStore>(
        create_backend(config, std::move(kv_client)), std::move(options));
    utils::log::info(std::format(
        "Adaptive rate limit store ready (backend={}, default {}/{}ms, monitoring {}ms)",
        backend_kind_to_string(config.backend), config.default_config.limit,
        config.default_config.window_ms, config.adaptive_config.monitoring_window_ms));
    return store;
}

} // namespace ratekeeper

#pragma once

#include "adaptive/adaptive_config.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace ratekeeper {

// ============================================================================
// Configuration Types
// ============================================================================

enum class BackendKind {
    MEMORY,
    SQLITE,
    KV
};

inline const char* backend_kind_to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::MEMORY: return "memory";
        case BackendKind::SQLITE: return "sqlite";
        case BackendKind::KV:     return "kv";
        default:                  return "unknown";
    }
}

struct LoggingConfig {
    std::string level = "info";
};

struct SqliteStoreConfig {
    std::string path = ":memory:";
    bool auto_create_tables = true;
    int busy_timeout_ms = 5000;
};

struct KvStoreConfig {
    std::string table = "http-client-toolkit";
    bool ensure_table_exists = false;
};

/**
 * @brief Everything needed to build a store (see store_factory.hpp)
 */
struct StoreConfig {
    BackendKind backend = BackendKind::MEMORY;
    bool adaptive = false;
    int64_t cleanup_interval_ms = 60000;

    RateLimitConfig default_config = kDefaultRateLimit;
    std::unordered_map<std::string, RateLimitConfig> resource_configs;

    SqliteStoreConfig sqlite;
    KvStoreConfig kv;
    AdaptiveConfig adaptive_config;
};

struct RatekeeperConfig {
    LoggingConfig logging;
    StoreConfig store;
};

} // namespace ratekeeper

#pragma once

#include "backend/ikv_client.hpp"
#include "backend/irate_limit_backend.hpp"
#include "config/config_types.hpp"
#include "limiter/adaptive_rate_limit_store.hpp"
#include "limiter/rate_limit_store.hpp"

#include <memory>

namespace ratekeeper {

/**
 * @brief Build the backend named by config.backend
 *
 * kv_client is used for BackendKind::KV; when null an in-process
 * InMemoryKeyValueClient is created (the table is provisioned only if
 * config.kv.ensure_table_exists is set).
 *
 * @throws TableMissingError / BackendError if the medium cannot be opened
 */
[[nodiscard]] std::unique_ptr<IRateLimitBackend> create_backend(
    const StoreConfig& config,
    std::shared_ptr<IKeyValueClient> kv_client = nullptr);

[[nodiscard]] std::unique_ptr<RateLimitStore> create_rate_limit_store(
    const StoreConfig& config,
    std::shared_ptr<IKeyValueClient> kv_client = nullptr);

[[nodiscard]] std::unique_ptr<AdaptiveRateLimitStore> create_adaptive_rate_limit_store(
    const StoreConfig& config,
    std::shared_ptr<IKeyValueClient> kv_client = nullptr);

} // namespace ratekeeper

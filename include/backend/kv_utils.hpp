#pragma once

#include "backend/ikv_client.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <limits>
#include <set>
#include <string>
#include <vector>

namespace ratekeeper::kv {

inline constexpr size_t kBatchDeleteSize = 25;
inline constexpr int kMaxBatchDeleteRetries = 8;
inline constexpr size_t kMaxPaginationPages = 10000;

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Default Sleeper (std::this_thread::sleep_for)
 */
void sleep_for(std::chrono::milliseconds delay);

/**
 * @brief Backoff before retrying unprocessed batch items
 *
 * min(1000, 50 * 2^attempt) plus 0..24 ms jitter.
 */
[[nodiscard]] std::chrono::milliseconds batch_retry_delay(int attempt);

/**
 * @brief Transaction was cancelled because a condition check failed
 *
 * The only error class acquire() treats as contention. Everything else
 * (throttling, permissions, missing table) is a real failure.
 */
[[nodiscard]] bool is_conditional_conflict(const KvError& error);

[[nodiscard]] bool is_table_missing(const KvError& error);

/**
 * @brief Guards a continuation-token loop against stores that never finish
 *
 * Throws BackendError after kMaxPaginationPages pages or when a
 * continuation key repeats.
 */
class PaginationGuard {
public:
    explicit PaginationGuard(std::string operation, size_t max_pages = kMaxPaginationPages)
        : operation_(std::move(operation)), max_pages_(max_pages) {}

    /**
     * @brief Record one page
     * @return true if another page must be fetched
     */
    bool next(const std::optional<KvItem>& last_evaluated_key);

private:
    std::string operation_;
    size_t max_pages_;
    size_t pages_ = 0;
    std::set<KvItem> seen_keys_;
};

/**
 * @brief Sum of count over every page
 */
[[nodiscard]] uint64_t query_count_all_pages(IKeyValueClient& client,
                                             const std::string& table,
                                             KvQuery query);

/**
 * @brief Items over every page, stopping once max_items are collected
 */
[[nodiscard]] std::vector<KvItem> query_items_all_pages(
    IKeyValueClient& client,
    const std::string& table,
    KvQuery query,
    size_t max_items = std::numeric_limits<size_t>::max());

/**
 * @brief Visit every page of a prefix scan
 */
void scan_all_pages(IKeyValueClient& client,
                    const std::string& table,
                    KvScan scan,
                    const std::function<void(const std::vector<KvItem>&)>& on_page);

/**
 * @brief Delete keys in groups of 25, retrying unprocessed keys with backoff
 *
 * @throws BackendError "Failed to delete all items from table ..." when a
 *         group still has unprocessed keys after kMaxBatchDeleteRetries retries
 */
void batch_delete_with_retries(IKeyValueClient& client,
                               const std::string& table,
                               const std::vector<KvKey>& keys,
                               const Sleeper& sleeper = sleep_for);

} // namespace ratekeeper::kv

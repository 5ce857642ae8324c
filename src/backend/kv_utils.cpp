#include "backend/kv_utils.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <random>
#include <thread>

namespace ratekeeper::kv {

void sleep_for(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

std::chrono::milliseconds batch_retry_delay(int attempt) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> jitter(0, 24);

    const int64_t backoff = std::min<int64_t>(1000, int64_t{50} << std::min(attempt, 20));
    return std::chrono::milliseconds(backoff + jitter(gen));
}

bool is_conditional_conflict(const KvError& error) {
    if (error.code() == KvErrorCode::CONDITIONAL_CHECK_FAILED) {
        return true;
    }
    if (error.code() != KvErrorCode::TRANSACTION_CANCELED) {
        return false;
    }

    const auto& reasons = error.cancellation_reasons();
    if (!reasons.empty()) {
        return std::any_of(reasons.begin(), reasons.end(),
                           [](const std::string& r) { return r == "ConditionalCheckFailed"; });
    }

    // Some clients only carry the reasons in the message text
    return std::string_view(error.what()).find("ConditionalCheckFailed") != std::string_view::npos;
}

bool is_table_missing(const KvError& error) {
    return error.code() == KvErrorCode::RESOURCE_NOT_FOUND;
}

// ============================================================================
// PaginationGuard
// ============================================================================

bool PaginationGuard::next(const std::optional<KvItem>& last_evaluated_key) {
    ++pages_;
    if (!last_evaluated_key) {
        return false;
    }

    if (pages_ >= max_pages_) {
        throw BackendError(std::format(
            "pagination did not terminate: {} exceeded {} pages", operation_, max_pages_));
    }
    if (!seen_keys_.insert(*last_evaluated_key).second) {
        throw BackendError(std::format(
            "pagination did not terminate: {} returned a repeated continuation key",
            operation_));
    }
    return true;
}

// ============================================================================
// Paginated reads
// ============================================================================

uint64_t query_count_all_pages(IKeyValueClient& client, const std::string& table,
                               KvQuery query) {
    query.count_only = true;
    query.exclusive_start_key.reset();

    PaginationGuard guard("query");
    uint64_t total = 0;
    while (true) {
        auto page = client.query(table, query);
        total += page.count;
        if (!guard.next(page.last_evaluated_key)) break;
        query.exclusive_start_key = std::move(page.last_evaluated_key);
    }
    return total;
}

std::vector<KvItem> query_items_all_pages(IKeyValueClient& client, const std::string& table,
                                          KvQuery query, size_t max_items) {
    query.count_only = false;
    query.exclusive_start_key.reset();

    std::vector<KvItem> items;
    if (max_items == 0) return items;

    PaginationGuard guard("query");
    while (true) {
        const size_t remaining = max_items - items.size();
        if (!query.limit || *query.limit > remaining) {
            query.limit = remaining;
        }

        auto page = client.query(table, query);
        for (auto& item : page.items) {
            items.push_back(std::move(item));
        }
        if (items.size() >= max_items) {
            items.resize(max_items);
            break;
        }
        if (!guard.next(page.last_evaluated_key)) break;
        query.exclusive_start_key = std::move(page.last_evaluated_key);
    }
    return items;
}

void scan_all_pages(IKeyValueClient& client, const std::string& table, KvScan scan,
                    const std::function<void(const std::vector<KvItem>&)>& on_page) {
    scan.exclusive_start_key.reset();

    PaginationGuard guard("scan");
    while (true) {
        auto page = client.scan(table, scan);
        if (!page.items.empty()) {
            on_page(page.items);
        }
        if (!guard.next(page.last_evaluated_key)) break;
        scan.exclusive_start_key = std::move(page.last_evaluated_key);
    }
}

// ============================================================================
// Batch delete
// ============================================================================

void batch_delete_with_retries(IKeyValueClient& client, const std::string& table,
                               const std::vector<KvKey>& keys, const Sleeper& sleeper) {
    for (size_t offset = 0; offset < keys.size(); offset += kBatchDeleteSize) {
        const size_t end = std::min(offset + kBatchDeleteSize, keys.size());
        std::vector<KvKey> pending(keys.begin() + static_cast<std::ptrdiff_t>(offset),
                                   keys.begin() + static_cast<std::ptrdiff_t>(end));

        for (int attempt = 0; !pending.empty(); ++attempt) {
            auto unprocessed = client.batch_delete(table, pending);
            if (unprocessed.empty()) {
                break;
            }

            if (attempt >= kMaxBatchDeleteRetries) {
                throw BackendError(std::format(
                    "Failed to delete all items from table \"{}\" after {} attempts",
                    table, kMaxBatchDeleteRetries + 1));
            }

            utils::log::debug(std::format("Retrying {} unprocessed deletes on {} (attempt {})",
                                          unprocessed.size(), table, attempt + 1));
            pending = std::move(unprocessed);
            sleeper(batch_retry_delay(attempt));
        }
    }
}

} // namespace ratekeeper::kv

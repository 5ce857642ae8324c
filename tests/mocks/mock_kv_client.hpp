#pragma once

#include "backend/in_memory_kv_client.hpp"

#include <atomic>
#include <format>
#include <string>
#include <vector>

namespace ratekeeper::testing {

/**
 * @brief Fault-injecting key-value client for backend tests
 *
 * Delegates to an InMemoryKeyValueClient and, when armed, replaces the
 * result of the next calls with conflicts, generic failures, missing-table
 * errors, unprocessed batch keys or pages that never end.
 */
class MockKvClient : public IKeyValueClient {
public:
    explicit MockKvClient(size_t page_size = InMemoryKeyValueClient::kDefaultPageSize)
        : inner_(page_size) {}

    // ---- Fault switches ---------------------------------------------------

    // Next n transact_put calls fail as a conditional conflict
    void fail_next_transactions_with_conflict(int n) { conflicts_left_.store(n); }

    // Next n transact_put calls fail with an unclassified error
    void fail_next_transactions_with_error(int n) { errors_left_.store(n); }

    // Every call reports the table as missing
    void set_table_missing(bool missing) { table_missing_.store(missing); }

    // Next n batch_delete calls process nothing
    void leave_next_batches_unprocessed(int n) { unprocessed_left_.store(n); }

    // query()/scan() return a continuation key on every page
    enum class Pagination { NORMAL, REPEATING_KEY, ENDLESS };
    void set_pagination(Pagination mode) { pagination_.store(mode); }

    // Report the client as one whose store expires items itself
    void set_native_ttl(bool native) { native_ttl_.store(native); }

    // ---- Counters ---------------------------------------------------------

    [[nodiscard]] int transact_calls() const { return transact_calls_.load(); }
    [[nodiscard]] int batch_delete_calls() const { return batch_delete_calls_.load(); }
    [[nodiscard]] int page_calls() const { return page_calls_.load(); }

    [[nodiscard]] InMemoryKeyValueClient& inner() { return inner_; }

    // ---- IKeyValueClient --------------------------------------------------

    void put_item(const std::string& table, const KvPut& put) override {
        check_table();
        inner_.put_item(table, put);
    }

    [[nodiscard]] std::optional<KvItem> get_item(const std::string& table,
                                                 const KvKey& key) override {
        check_table();
        return inner_.get_item(table, key);
    }

    void delete_item(const std::string& table, const KvKey& key) override {
        check_table();
        inner_.delete_item(table, key);
    }

    void transact_put(const std::string& table, const std::vector<KvPut>& puts) override {
        check_table();
        transact_calls_.fetch_add(1);
        if (take(conflicts_left_)) {
            std::vector<std::string> reasons(puts.size(), "None");
            reasons.front() = "ConditionalCheckFailed";
            throw KvError(KvErrorCode::TRANSACTION_CANCELED,
                          "Transaction cancelled [ConditionalCheckFailed, None]",
                          std::move(reasons));
        }
        if (take(errors_left_)) {
            throw KvError(KvErrorCode::THROTTLED, "Rate exceeded for table");
        }
        inner_.transact_put(table, puts);
    }

    [[nodiscard]] std::vector<KvKey> batch_delete(const std::string& table,
                                                  const std::vector<KvKey>& keys) override {
        check_table();
        batch_delete_calls_.fetch_add(1);
        if (take(unprocessed_left_)) {
            return keys;
        }
        return inner_.batch_delete(table, keys);
    }

    [[nodiscard]] KvPage query(const std::string& table, const KvQuery& query) override {
        check_table();
        return paginate(inner_.query(table, query));
    }

    [[nodiscard]] KvPage scan(const std::string& table, const KvScan& scan) override {
        check_table();
        return paginate(inner_.scan(table, scan));
    }

    [[nodiscard]] std::optional<KvTableStatus> describe_table(const std::string& table) override {
        if (table_missing_.load()) return std::nullopt;
        return inner_.describe_table(table);
    }

    void create_table(const std::string& table) override {
        table_missing_.store(false);
        if (!inner_.describe_table(table)) {
            inner_.create_table(table);
        }
    }

    [[nodiscard]] bool supports_native_ttl() const override { return native_ttl_.load(); }

private:
    static bool take(std::atomic<int>& counter) {
        int left = counter.load();
        while (left > 0) {
            if (counter.compare_exchange_weak(left, left - 1)) return true;
        }
        return false;
    }

    void check_table() const {
        if (table_missing_.load()) {
            throw KvError(KvErrorCode::RESOURCE_NOT_FOUND,
                          "Requested resource not found: Table not found");
        }
    }

    KvPage paginate(KvPage page) {
        const int call = page_calls_.fetch_add(1) + 1;
        switch (pagination_.load()) {
            case Pagination::REPEATING_KEY:
                page.last_evaluated_key = KvItem{{kKvPartitionAttr, std::string("stuck")},
                                                 {kKvSortAttr, std::string("stuck")}};
                break;
            case Pagination::ENDLESS:
                page.last_evaluated_key = KvItem{{kKvPartitionAttr, std::string("page")},
                                                 {kKvSortAttr, std::format("{}", call)}};
                break;
            case Pagination::NORMAL:
            default:
                break;
        }
        return page;
    }

    InMemoryKeyValueClient inner_;

    std::atomic<int> conflicts_left_{0};
    std::atomic<int> errors_left_{0};
    std::atomic<int> unprocessed_left_{0};
    std::atomic<bool> table_missing_{false};
    std::atomic<bool> native_ttl_{false};
    std::atomic<Pagination> pagination_{Pagination::NORMAL};

    std::atomic<int> transact_calls_{0};
    std::atomic<int> batch_delete_calls_{0};
    std::atomic<int> page_calls_{0};
};

} // namespace ratekeeper::testing

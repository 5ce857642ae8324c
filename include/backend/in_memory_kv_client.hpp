#pragma once

#include "backend/ikv_client.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ratekeeper {

/**
 * @brief In-process IKeyValueClient for single-node deployments and tests
 *
 * Honors conditions, transactions, index queries and pagination
 * (page_size items evaluated per call) with the same observable behavior as
 * a hosted document store. TTL attributes are stored but never acted upon,
 * so stores over this client purge through their cleanup worker.
 */
class InMemoryKeyValueClient : public IKeyValueClient {
public:
    static constexpr size_t kDefaultPageSize = 100;

    explicit InMemoryKeyValueClient(size_t page_size = kDefaultPageSize);

    void put_item(const std::string& table, const KvPut& put) override;

    [[nodiscard]] std::optional<KvItem> get_item(
        const std::string& table, const KvKey& key) override;

    void delete_item(const std::string& table, const KvKey& key) override;

    void transact_put(const std::string& table, const std::vector<KvPut>& puts) override;

    [[nodiscard]] std::vector<KvKey> batch_delete(
        const std::string& table, const std::vector<KvKey>& keys) override;

    [[nodiscard]] KvPage query(const std::string& table, const KvQuery& query) override;

    [[nodiscard]] KvPage scan(const std::string& table, const KvScan& scan) override;

    [[nodiscard]] std::optional<KvTableStatus> describe_table(const std::string& table) override;

    void create_table(const std::string& table) override;

    [[nodiscard]] bool supports_native_ttl() const override { return false; }

    [[nodiscard]] size_t item_count(const std::string& table);

private:
    using Table = std::map<KvKey, KvItem>;

    Table& table_or_throw(const std::string& table);
    static bool condition_holds(const KvCondition& condition, const KvItem* existing);

    size_t page_size_;
    std::unordered_map<std::string, Table> tables_;
    std::mutex mutex_;
};

} // namespace ratekeeper

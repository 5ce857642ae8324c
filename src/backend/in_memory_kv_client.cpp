#include "backend/in_memory_kv_client.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <tuple>

namespace ratekeeper {

namespace {

// (sort value, pk, sk): total order for query results
using QueryPosition = std::tuple<std::string, std::string, std::string>;

QueryPosition position_of(const KvItem& item, bool use_index) {
    return {kv_get_string(item, use_index ? kKvIndexSortAttr : kKvSortAttr).value_or(""),
            kv_get_string(item, kKvPartitionAttr).value_or(""),
            kv_get_string(item, kKvSortAttr).value_or("")};
}

KvItem continuation_key(const KvItem& item, bool use_index) {
    KvItem key;
    for (const char* attr : {kKvPartitionAttr, kKvSortAttr}) {
        if (auto it = item.find(attr); it != item.end()) key.emplace(attr, it->second);
    }
    if (use_index) {
        for (const char* attr : {kKvIndexPartitionAttr, kKvIndexSortAttr}) {
            if (auto it = item.find(attr); it != item.end()) key.emplace(attr, it->second);
        }
    }
    return key;
}

std::string join_reasons(const std::vector<std::string>& reasons) {
    std::string joined;
    for (size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += reasons[i];
    }
    return joined;
}

} // anonymous namespace

InMemoryKeyValueClient::InMemoryKeyValueClient(size_t page_size)
    : page_size_(page_size == 0 ? kDefaultPageSize : page_size) {}

InMemoryKeyValueClient::Table& InMemoryKeyValueClient::table_or_throw(const std::string& table) {
    const auto it = tables_.find(table);
    if (it == tables_.end()) {
        throw KvError(KvErrorCode::RESOURCE_NOT_FOUND,
                      std::format("Requested resource not found: Table: {} not found", table));
    }
    return it->second;
}

bool InMemoryKeyValueClient::condition_holds(const KvCondition& condition,
                                             const KvItem* existing) {
    switch (condition.kind) {
        case KvCondition::Kind::NONE:
            return true;
        case KvCondition::Kind::NOT_EXISTS:
            return existing == nullptr;
        case KvCondition::Kind::NOT_EXISTS_OR_EXPIRED: {
            if (!existing) return true;
            const auto value = kv_get_number(*existing, condition.attribute);
            return value && *value <= condition.threshold;
        }
    }
    return false;
}

void InMemoryKeyValueClient::put_item(const std::string& table, const KvPut& put) {
    const auto key = kv_key_of(put.item);
    if (!key) {
        throw KvError(KvErrorCode::OTHER, "One or more parameter values were invalid: missing key");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& items = table_or_throw(table);
    const auto it = items.find(*key);
    if (!condition_holds(put.condition, it == items.end() ? nullptr : &it->second)) {
        throw KvError(KvErrorCode::CONDITIONAL_CHECK_FAILED, "The conditional request failed");
    }
    items[*key] = put.item;
}

std::optional<KvItem> InMemoryKeyValueClient::get_item(const std::string& table,
                                                       const KvKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& items = table_or_throw(table);
    const auto it = items.find(key);
    if (it == items.end()) return std::nullopt;
    return it->second;
}

void InMemoryKeyValueClient::delete_item(const std::string& table, const KvKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    table_or_throw(table).erase(key);
}

void InMemoryKeyValueClient::transact_put(const std::string& table,
                                          const std::vector<KvPut>& puts) {
    std::vector<KvKey> keys;
    keys.reserve(puts.size());
    for (const auto& put : puts) {
        auto key = kv_key_of(put.item);
        if (!key) {
            throw KvError(KvErrorCode::OTHER,
                          "One or more parameter values were invalid: missing key");
        }
        keys.push_back(std::move(*key));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& items = table_or_throw(table);

    std::vector<std::string> reasons;
    reasons.reserve(puts.size());
    bool cancelled = false;
    for (size_t i = 0; i < puts.size(); ++i) {
        const auto it = items.find(keys[i]);
        if (condition_holds(puts[i].condition, it == items.end() ? nullptr : &it->second)) {
            reasons.emplace_back("None");
        } else {
            reasons.emplace_back("ConditionalCheckFailed");
            cancelled = true;
        }
    }

    if (cancelled) {
        throw KvError(KvErrorCode::TRANSACTION_CANCELED,
                      std::format("Transaction cancelled, please refer cancellation "
                                  "reasons for specific reasons [{}]", join_reasons(reasons)),
                      std::move(reasons));
    }

    for (size_t i = 0; i < puts.size(); ++i) {
        items[keys[i]] = puts[i].item;
    }
}

std::vector<KvKey> InMemoryKeyValueClient::batch_delete(const std::string& table,
                                                        const std::vector<KvKey>& keys) {
    if (keys.size() > 25) {
        throw KvError(KvErrorCode::OTHER,
                      "Too many items requested for the BatchWriteItem call");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& items = table_or_throw(table);
    for (const auto& key : keys) {
        items.erase(key);
    }
    return {};
}

KvPage InMemoryKeyValueClient::query(const std::string& table, const KvQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& items = table_or_throw(table);

    const char* partition_attr = query.use_index ? kKvIndexPartitionAttr : kKvPartitionAttr;
    const char* sort_attr = query.use_index ? kKvIndexSortAttr : kKvSortAttr;

    std::vector<std::pair<QueryPosition, const KvItem*>> matches;
    for (const auto& [key, item] : items) {
        const auto partition = kv_get_string(item, partition_attr);
        if (!partition || *partition != query.partition_value) continue;

        const auto sort = kv_get_string(item, sort_attr);
        if (!sort) continue;
        if (query.sort_at_least && *sort < *query.sort_at_least) continue;

        matches.emplace_back(position_of(item, query.use_index), &item);
    }

    std::sort(matches.begin(), matches.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    if (!query.scan_forward) {
        std::reverse(matches.begin(), matches.end());
    }

    auto begin = matches.begin();
    if (query.exclusive_start_key) {
        const auto start = position_of(*query.exclusive_start_key, query.use_index);
        begin = std::find_if(matches.begin(), matches.end(), [&](const auto& m) {
            return query.scan_forward ? m.first > start : m.first < start;
        });
    }

    const size_t page_limit = query.limit ? std::min(*query.limit, page_size_) : page_size_;
    const auto available = static_cast<size_t>(std::distance(begin, matches.end()));
    const size_t taken = std::min(page_limit, available);

    KvPage page;
    page.count = taken;
    if (!query.count_only) {
        page.items.reserve(taken);
        for (size_t i = 0; i < taken; ++i) {
            page.items.push_back(*(begin + static_cast<std::ptrdiff_t>(i))->second);
        }
    }
    if (taken < available && taken > 0) {
        const auto& last = *(begin + static_cast<std::ptrdiff_t>(taken - 1))->second;
        page.last_evaluated_key = continuation_key(last, query.use_index);
    }
    return page;
}

KvPage InMemoryKeyValueClient::scan(const std::string& table, const KvScan& scan) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& items = table_or_throw(table);

    auto it = items.begin();
    if (scan.exclusive_start_key) {
        const auto start = kv_key_of(*scan.exclusive_start_key);
        if (start) it = items.upper_bound(*start);
    }

    const size_t page_limit = scan.limit ? std::min(*scan.limit, page_size_) : page_size_;

    KvPage page;
    size_t evaluated = 0;
    for (; it != items.end() && evaluated < page_limit; ++it, ++evaluated) {
        const auto& pk = it->first.pk;
        const bool selected = scan.partition_prefixes.empty() ||
            std::any_of(scan.partition_prefixes.begin(), scan.partition_prefixes.end(),
                        [&](const std::string& prefix) { return pk.starts_with(prefix); });
        if (selected) {
            page.items.push_back(it->second);
        }
    }
    page.count = page.items.size();

    if (it != items.end() && evaluated > 0) {
        const auto& last = std::prev(it)->first;
        page.last_evaluated_key = KvItem{{kKvPartitionAttr, last.pk}, {kKvSortAttr, last.sk}};
    }
    return page;
}

std::optional<KvTableStatus> InMemoryKeyValueClient::describe_table(const std::string& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tables_.contains(table)) return std::nullopt;
    return KvTableStatus::ACTIVE;
}

void InMemoryKeyValueClient::create_table(const std::string& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tables_.contains(table)) {
        throw KvError(KvErrorCode::OTHER, std::format("Table already exists: {}", table));
    }
    tables_.emplace(table, Table{});
}

size_t InMemoryKeyValueClient::item_count(const std::string& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_or_throw(table).size();
}

} // namespace ratekeeper

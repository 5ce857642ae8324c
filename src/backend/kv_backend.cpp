#include "backend/kv_backend.hpp"
#include "core/error.hpp"
#include "core/resource_key.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace ratekeeper {

namespace {

constexpr const char* kTimestampAttr = "timestamp";
constexpr const char* kPriorityAttr = "priority";
constexpr const char* kTtlAttr = "ttl";
constexpr const char* kExpiresAtAttr = "expiresAt";
constexpr const char* kCooldownUntilAttr = "cooldownUntil";

// Rounded up so native expiry never reclaims an item before its deadline
int64_t ttl_seconds(int64_t epoch_ms) {
    return (epoch_ms + 999) / 1000;
}

} // anonymous namespace

KvBackend::KvBackend(std::shared_ptr<IKeyValueClient> client, Options options)
    : client_(std::move(client))
    , options_(std::move(options)) {
    if (!client_) {
        throw BackendError("KvBackend requires a client");
    }
    if (options_.ensure_table_exists) {
        ensure_table();
    }
}

template <typename Fn>
auto KvBackend::translate(Fn&& fn) -> decltype(fn()) {
    if (closed_.load()) {
        throw BackendError("Key-value backend is closed");
    }
    try {
        return fn();
    } catch (const KvError& e) {
        rethrow(e);
    }
}

void KvBackend::rethrow(const KvError& error) const {
    if (kv::is_table_missing(error)) {
        throw TableMissingError(options_.table_name);
    }
    throw BackendError(error.what());
}

void KvBackend::ensure_table() {
    translate([&] {
        auto status = client_->describe_table(options_.table_name);
        if (!status) {
            utils::log::info(std::format("Creating key-value table '{}'", options_.table_name));
            client_->create_table(options_.table_name);
        }

        for (int attempt = 0; attempt < options_.table_wait_attempts; ++attempt) {
            status = client_->describe_table(options_.table_name);
            if (status == KvTableStatus::ACTIVE) return;
            options_.sleeper(options_.table_wait_delay);
        }

        throw BackendError(std::format(
            "Table {} did not become active within {}ms", options_.table_name,
            options_.table_wait_attempts * options_.table_wait_delay.count()));
    });
}

KvQuery KvBackend::window_query(const std::string& resource,
                                int64_t window_start_ms,
                                std::optional<Priority> priority) const {
    KvQuery query;
    if (priority) {
        query.use_index = true;
        query.partition_value = ResourceKeyCodec::priority_partition(resource, *priority);
    } else {
        query.partition_value = ResourceKeyCodec::record_partition(resource);
    }
    query.sort_at_least = ResourceKeyCodec::record_sort_lower_bound(window_start_ms);
    return query;
}

KvItem KvBackend::build_record_item(const RequestRecord& record, int64_t window_ms) const {
    const std::string sort_key = ResourceKeyCodec::record_sort(record.timestamp_ms,
                                                               record.unique_id);
    KvItem item{
        {kKvPartitionAttr, ResourceKeyCodec::record_partition(record.resource)},
        {kKvSortAttr, sort_key},
        {kTimestampAttr, record.timestamp_ms},
        {kTtlAttr, ttl_seconds(record.timestamp_ms + window_ms)},
    };

    if (record.priority) {
        item[kKvIndexPartitionAttr] =
            ResourceKeyCodec::priority_partition(record.resource, *record.priority);
        item[kKvIndexSortAttr] = sort_key;
        item[kPriorityAttr] = std::string(priority_to_string(*record.priority));
    }
    return item;
}

uint64_t KvBackend::count_in_window(const std::string& resource,
                                    int64_t window_start_ms,
                                    std::optional<Priority> priority) {
    return translate([&] {
        return kv::query_count_all_pages(*client_, options_.table_name,
                                         window_query(resource, window_start_ms, priority));
    });
}

std::optional<int64_t> KvBackend::oldest_in_window(const std::string& resource,
                                                   int64_t window_start_ms,
                                                   std::optional<Priority> priority) {
    return translate([&]() -> std::optional<int64_t> {
        auto query = window_query(resource, window_start_ms, priority);
        query.scan_forward = true;
        const auto items = kv::query_items_all_pages(*client_, options_.table_name,
                                                     std::move(query), 1);
        if (items.empty()) return std::nullopt;
        return kv_get_number(items.front(), kTimestampAttr);
    });
}

void KvBackend::insert_record(const RequestRecord& record, int64_t window_ms) {
    translate([&] {
        client_->put_item(options_.table_name, KvPut{build_record_item(record, window_ms), {}});
    });
}

SlotClaimOutcome KvBackend::try_claim_slot(const SlotClaim& claim,
                                           const RequestRecord& record) {
    if (closed_.load()) {
        throw BackendError("Key-value backend is closed");
    }

    KvPut slot;
    slot.item = KvItem{
        {kKvPartitionAttr, ResourceKeyCodec::slot_partition(claim.resource, claim.priority)},
        {kKvSortAttr, ResourceKeyCodec::slot_sort(claim.slot_index)},
        {kExpiresAtAttr, claim.expires_at_ms()},
        {kTtlAttr, ttl_seconds(claim.expires_at_ms())},
    };
    slot.condition = {KvCondition::Kind::NOT_EXISTS_OR_EXPIRED, kExpiresAtAttr,
                      claim.claimed_at_ms};

    const std::vector<KvPut> puts{
        std::move(slot),
        KvPut{build_record_item(record, claim.window_ms),
              {KvCondition::Kind::NOT_EXISTS, "", 0}},
    };

    try {
        client_->transact_put(options_.table_name, puts);
        return SlotClaimOutcome::CLAIMED;
    } catch (const KvError& e) {
        if (kv::is_conditional_conflict(e)) {
            return SlotClaimOutcome::CONFLICT;
        }
        rethrow(e);
    }
}

std::vector<int64_t> KvBackend::load_recent_timestamps(const std::string& resource,
                                                       Priority priority,
                                                       int64_t since_ms,
                                                       size_t max_count) {
    return translate([&] {
        auto query = window_query(resource, since_ms, priority);
        query.scan_forward = false;
        const auto items = kv::query_items_all_pages(*client_, options_.table_name,
                                                     std::move(query), max_count);

        std::vector<int64_t> timestamps;
        timestamps.reserve(items.size());
        for (const auto& item : items) {
            if (auto ts = kv_get_number(item, kTimestampAttr)) {
                timestamps.push_back(*ts);
            }
        }
        std::sort(timestamps.begin(), timestamps.end());
        return timestamps;
    });
}

void KvBackend::delete_resource(const std::string& resource) {
    translate([&] {
        std::vector<std::string> partitions{
            ResourceKeyCodec::record_partition(resource),
            ResourceKeyCodec::slot_partition(resource, std::nullopt),
        };
        for (const Priority p : kAllPriorities) {
            partitions.push_back(ResourceKeyCodec::slot_partition(resource, p));
        }

        std::vector<KvKey> keys;
        for (const auto& partition : partitions) {
            KvQuery query;
            query.partition_value = partition;
            for (const auto& item : kv::query_items_all_pages(*client_, options_.table_name,
                                                              std::move(query))) {
                if (auto key = kv_key_of(item)) keys.push_back(std::move(*key));
            }
        }

        kv::batch_delete_with_retries(*client_, options_.table_name, keys, options_.sleeper);
    });
}

void KvBackend::delete_all() {
    translate([&] {
        KvScan scan;
        scan.partition_prefixes = {
            std::string(ResourceKeyCodec::kRecordPrefix),
            std::string(ResourceKeyCodec::kSlotPrefix),
            std::string(ResourceKeyCodec::kCooldownPrefix),
        };

        kv::scan_all_pages(*client_, options_.table_name, std::move(scan),
            [&](const std::vector<KvItem>& items) {
                std::vector<KvKey> keys;
                keys.reserve(items.size());
                for (const auto& item : items) {
                    if (auto key = kv_key_of(item)) keys.push_back(std::move(*key));
                }
                kv::batch_delete_with_retries(*client_, options_.table_name, keys,
                                              options_.sleeper);
            });
    });
}

bool KvBackend::is_expired(const KvItem& item, int64_t now_ms,
                           const WindowLookup& window_of) const {
    const auto pk = kv_get_string(item, kKvPartitionAttr);
    if (!pk) return false;

    if (pk->starts_with(ResourceKeyCodec::kSlotPrefix)) {
        const auto expires_at = kv_get_number(item, kExpiresAtAttr);
        return expires_at && *expires_at <= now_ms;
    }
    if (pk->starts_with(ResourceKeyCodec::kCooldownPrefix)) {
        const auto until = kv_get_number(item, kCooldownUntilAttr);
        return until && *until <= now_ms;
    }

    const auto resource = ResourceKeyCodec::resource_from_partition(*pk);
    const auto timestamp = kv_get_number(item, kTimestampAttr);
    if (!resource || !timestamp) return false;
    return *timestamp < now_ms - window_of(*resource);
}

size_t KvBackend::purge_expired(int64_t now_ms, const WindowLookup& window_of) {
    return translate([&] {
        size_t removed = 0;

        KvScan scan;
        scan.partition_prefixes = {
            std::string(ResourceKeyCodec::kRecordPrefix),
            std::string(ResourceKeyCodec::kSlotPrefix),
            std::string(ResourceKeyCodec::kCooldownPrefix),
        };

        kv::scan_all_pages(*client_, options_.table_name, std::move(scan),
            [&](const std::vector<KvItem>& items) {
                std::vector<KvKey> keys;
                for (const auto& item : items) {
                    if (!is_expired(item, now_ms, window_of)) continue;
                    if (auto key = kv_key_of(item)) keys.push_back(std::move(*key));
                }
                kv::batch_delete_with_retries(*client_, options_.table_name, keys,
                                              options_.sleeper);
                removed += keys.size();
            });
        return removed;
    });
}

std::vector<ResourceUsage> KvBackend::record_counts() {
    throw UnsupportedOperationError("resource listing is not supported by the kv backend");
}

void KvBackend::put_cooldown(const std::string& origin, int64_t until_ms) {
    const std::string key = ResourceKeyCodec::cooldown_key(origin);
    translate([&] {
        client_->put_item(options_.table_name, KvPut{KvItem{
            {kKvPartitionAttr, key},
            {kKvSortAttr, key},
            {kCooldownUntilAttr, until_ms},
            {kTtlAttr, ttl_seconds(until_ms)},
        }, {}});
    });
}

std::optional<int64_t> KvBackend::read_cooldown(const std::string& origin) {
    const std::string key = ResourceKeyCodec::cooldown_key(origin);
    return translate([&]() -> std::optional<int64_t> {
        const auto item = client_->get_item(options_.table_name, KvKey{key, key});
        if (!item) return std::nullopt;
        return kv_get_number(*item, kCooldownUntilAttr);
    });
}

void KvBackend::delete_cooldown(const std::string& origin) {
    const std::string key = ResourceKeyCodec::cooldown_key(origin);
    translate([&] {
        client_->delete_item(options_.table_name, KvKey{key, key});
    });
}

void KvBackend::close() {
    // The client is shared with other stores; only this backend stops using it
    closed_.store(true);
}

} // namespace ratekeeper

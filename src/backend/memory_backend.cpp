#include "backend/memory_backend.hpp"
#include "core/resource_key.hpp"

#include <algorithm>
#include <mutex>

namespace ratekeeper {

uint64_t MemoryBackend::count_in_window(const std::string& resource,
                                        int64_t window_start_ms,
                                        std::optional<Priority> priority) {
    std::shared_lock lock(mutex_);
    const auto it = records_.find(resource);
    if (it == records_.end()) return 0;

    return static_cast<uint64_t>(std::count_if(it->second.begin(), it->second.end(),
        [&](const Entry& e) { return matches(e, window_start_ms, priority); }));
}

std::optional<int64_t> MemoryBackend::oldest_in_window(const std::string& resource,
                                                       int64_t window_start_ms,
                                                       std::optional<Priority> priority) {
    std::shared_lock lock(mutex_);
    const auto it = records_.find(resource);
    if (it == records_.end()) return std::nullopt;

    std::optional<int64_t> oldest;
    for (const auto& e : it->second) {
        if (!matches(e, window_start_ms, priority)) continue;
        if (!oldest || e.timestamp_ms < *oldest) oldest = e.timestamp_ms;
    }
    return oldest;
}

void MemoryBackend::insert_record(const RequestRecord& record, int64_t /*window_ms*/) {
    std::unique_lock lock(mutex_);
    records_[record.resource].push_back({record.timestamp_ms, record.priority});
}

SlotClaimOutcome MemoryBackend::try_claim_slot(const SlotClaim& claim,
                                               const RequestRecord& record) {
    const std::string slot_key = ResourceKeyCodec::slot_partition(claim.resource, claim.priority)
                               + ResourceKeyCodec::slot_sort(claim.slot_index);

    std::unique_lock lock(mutex_);
    auto& slots = slots_[claim.resource];
    const auto it = slots.find(slot_key);
    if (it != slots.end() && it->second > claim.claimed_at_ms) {
        return SlotClaimOutcome::CONFLICT;
    }

    slots[slot_key] = claim.expires_at_ms();
    records_[record.resource].push_back({record.timestamp_ms, record.priority});
    return SlotClaimOutcome::CLAIMED;
}

std::vector<int64_t> MemoryBackend::load_recent_timestamps(const std::string& resource,
                                                           Priority priority,
                                                           int64_t since_ms,
                                                           size_t max_count) {
    std::vector<int64_t> result;
    {
        std::shared_lock lock(mutex_);
        const auto it = records_.find(resource);
        if (it == records_.end()) return result;
        for (const auto& e : it->second) {
            if (matches(e, since_ms, priority)) result.push_back(e.timestamp_ms);
        }
    }

    std::sort(result.begin(), result.end());
    if (result.size() > max_count) {
        result.erase(result.begin(),
                     result.begin() + static_cast<std::ptrdiff_t>(result.size() - max_count));
    }
    return result;
}

void MemoryBackend::delete_resource(const std::string& resource) {
    std::unique_lock lock(mutex_);
    records_.erase(resource);
    slots_.erase(resource);
}

void MemoryBackend::delete_all() {
    std::unique_lock lock(mutex_);
    records_.clear();
    slots_.clear();
    cooldowns_.clear();
}

size_t MemoryBackend::purge_expired(int64_t now_ms, const WindowLookup& window_of) {
    size_t removed = 0;
    std::unique_lock lock(mutex_);

    for (auto it = records_.begin(); it != records_.end();) {
        const int64_t window_start = now_ms - window_of(it->first);
        auto& entries = it->second;
        const auto before = entries.size();
        std::erase_if(entries, [&](const Entry& e) { return e.timestamp_ms < window_start; });
        removed += before - entries.size();

        if (entries.empty()) {
            it = records_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = slots_.begin(); it != slots_.end();) {
        removed += std::erase_if(it->second,
            [now_ms](const auto& kv) { return kv.second <= now_ms; });
        if (it->second.empty()) {
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }

    removed += std::erase_if(cooldowns_,
        [now_ms](const auto& kv) { return kv.second <= now_ms; });

    return removed;
}

std::vector<ResourceUsage> MemoryBackend::record_counts() {
    std::shared_lock lock(mutex_);
    std::vector<ResourceUsage> result;
    result.reserve(records_.size());
    for (const auto& [resource, entries] : records_) {
        if (entries.empty()) continue;
        ResourceUsage usage;
        usage.resource = resource;
        usage.request_count = entries.size();
        result.push_back(std::move(usage));
    }
    return result;
}

void MemoryBackend::put_cooldown(const std::string& origin, int64_t until_ms) {
    std::unique_lock lock(mutex_);
    cooldowns_[origin] = until_ms;
}

std::optional<int64_t> MemoryBackend::read_cooldown(const std::string& origin) {
    std::shared_lock lock(mutex_);
    const auto it = cooldowns_.find(origin);
    if (it == cooldowns_.end()) return std::nullopt;
    return it->second;
}

void MemoryBackend::delete_cooldown(const std::string& origin) {
    std::unique_lock lock(mutex_);
    cooldowns_.erase(origin);
}

void MemoryBackend::close() {
    std::unique_lock lock(mutex_);
    records_.clear();
    slots_.clear();
    cooldowns_.clear();
}

} // namespace ratekeeper

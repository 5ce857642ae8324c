#include "core/resource_key.hpp"
#include "core/error.hpp"

#include <format>

namespace ratekeeper {

void ResourceKeyCodec::validate(std::string_view value, std::string_view label) {
    if (value.empty()) {
        throw ValidationError(std::format("{} must not be empty", label));
    }

    for (const char c : value) {
        const auto code = static_cast<unsigned char>(c);
        if (code < 0x20 || code == 0x7f) {
            throw ValidationError(
                std::format("{} contains unsupported control characters", label));
        }
    }

    // std::string holds UTF-8 bytes, so size() is the byte length
    if (value.size() > kMaxKeyBytes) {
        throw ValidationError(
            std::format("{} exceeds maximum length of {} bytes", label, kMaxKeyBytes));
    }
}

void ResourceKeyCodec::validate_resource(std::string_view resource) {
    validate(resource, "resource");

    // RATELIMIT_SLOT#a#user would otherwise name both ("a", user) and ("a#user", none)
    if (resource.find(kKeySeparator) != std::string_view::npos) {
        throw ValidationError(std::format("resource must not contain '{}'", kKeySeparator));
    }
}

std::string ResourceKeyCodec::record_partition(std::string_view resource) {
    std::string key;
    key.reserve(kRecordPrefix.size() + resource.size());
    key = kRecordPrefix;
    key += resource;
    return key;
}

std::string ResourceKeyCodec::record_sort(int64_t timestamp_ms, std::string_view unique_id) {
    return std::format("{}{}#{}", kTimestampPrefix, timestamp_ms, unique_id);
}

std::string ResourceKeyCodec::record_sort_lower_bound(int64_t window_start_ms) {
    return std::format("{}{}", kTimestampPrefix, window_start_ms);
}

std::string ResourceKeyCodec::priority_partition(std::string_view resource, Priority priority) {
    return std::format("{}{}#{}", kRecordPrefix, resource, priority_to_string(priority));
}

std::string ResourceKeyCodec::slot_partition(std::string_view resource,
                                             std::optional<Priority> priority) {
    if (!priority) {
        return std::format("{}{}", kSlotPrefix, resource);
    }
    return std::format("{}{}#{}", kSlotPrefix, resource, priority_to_string(*priority));
}

std::string ResourceKeyCodec::slot_sort(uint32_t slot_index) {
    return std::format("{}{}", kSlotSortPrefix, slot_index);
}

std::string ResourceKeyCodec::cooldown_key(std::string_view origin) {
    return std::format("{}{}", kCooldownPrefix, origin);
}

std::optional<std::string> ResourceKeyCodec::resource_from_partition(std::string_view pk) {
    if (!pk.starts_with(kRecordPrefix)) return std::nullopt;
    return std::string(pk.substr(kRecordPrefix.size()));
}

} // namespace ratekeeper

#include "limiter/cooldown_store.hpp"
#include "core/resource_key.hpp"

namespace ratekeeper {

void CooldownStore::set(const std::string& origin, int64_t until_ms) {
    ResourceKeyCodec::validate_origin(origin);
    backend_.put_cooldown(origin, until_ms);
}

std::optional<int64_t> CooldownStore::get(const std::string& origin, int64_t now_ms) {
    ResourceKeyCodec::validate_origin(origin);

    const auto until = backend_.read_cooldown(origin);
    if (!until) return std::nullopt;

    if (*until <= now_ms) {
        backend_.delete_cooldown(origin);
        return std::nullopt;
    }
    return until;
}

void CooldownStore::clear(const std::string& origin) {
    ResourceKeyCodec::validate_origin(origin);
    backend_.delete_cooldown(origin);
}

} // namespace ratekeeper

#include "limiter/slot_acquirer.hpp"
#include "core/utils.hpp"

namespace ratekeeper {

SlotAcquirer::Result SlotAcquirer::acquire(const std::string& resource,
                                           std::optional<Priority> priority,
                                           uint32_t effective_limit,
                                           uint64_t current_count,
                                           int64_t window_ms,
                                           int64_t now_ms) {
    Result result;
    if (effective_limit == 0 || current_count >= effective_limit) {
        return result;
    }

    RequestRecord record;
    record.resource = resource;
    record.timestamp_ms = now_ms;
    record.priority = priority;

    // Indices are stable identities, so every index is tried, not just the free count
    for (uint32_t index = 0; index < effective_limit; ++index) {
        SlotClaim claim;
        claim.resource = resource;
        claim.priority = priority;
        claim.slot_index = index;
        claim.window_ms = window_ms;
        claim.claimed_at_ms = now_ms;

        record.unique_id = utils::generate_uuid();
        ++result.attempts;

        if (backend_.try_claim_slot(claim, record) == SlotClaimOutcome::CLAIMED) {
            result.acquired = true;
            result.slot_index = index;
            return result;
        }
    }

    return result;
}

} // namespace ratekeeper

#pragma once

#include <optional>
#include "curve_types.hpp"

namespace bonding_curve {

// Fields left empty are kept as they are.
struct PolicyUpdate {
    std::optional<AccountId> fee_recipient;
    std::optional<uint16_t> platform_fee_bps;
    std::optional<bool> paused;
};

GlobalPolicy initialize_policy(
    const AccountId& authority,
    const AccountId& fee_recipient,
    uint16_t platform_fee_bps = DEFAULT_PLATFORM_FEE_BPS
);

// Admin path. Validates the caller and every field before committing any of
// them, so a rejected update leaves the policy unchanged.
void update_policy(GlobalPolicy& policy, const AccountId& caller, const PolicyUpdate& update);

void validate_fee_bps(uint16_t platform_fee_bps);

// Cumulative counters, checked
void record_launch(GlobalPolicy& policy);
void record_volume(GlobalPolicy& policy, const TradeResult& trade);

} // namespace bonding_curve

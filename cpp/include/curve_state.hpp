#pragma once

#include "curve_types.hpp"

namespace bonding_curve {

// Fresh Active curve seeded with virtual reserves. Real base starts at zero,
// real asset at the launch allocation.
CurveState launch_curve(
    const AssetId& asset_id,
    const AccountId& creator_id,
    Amount virtual_base_reserve,
    Amount virtual_asset_reserve,
    Timestamp now,
    Amount initial_real_asset_reserve = INITIAL_REAL_ASSET_RESERVE
);

// Same as launch_curve, additionally rejecting launches while paused.
CurveState launch_curve(
    const GlobalPolicy& policy,
    const AssetDescriptor& descriptor,
    const AccountId& creator_id,
    Amount virtual_base_reserve,
    Amount virtual_asset_reserve,
    Timestamp now
);

void validate_descriptor(const AssetDescriptor& descriptor);

// Throws InvalidCurveState if any stored-state invariant is broken.
void check_invariants(const CurveState& curve);

inline bool is_active(const CurveState& curve) { return !curve.graduated; }

} // namespace bonding_curve

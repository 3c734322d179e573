#include "global_policy.hpp"
#include "curve_errors.hpp"
#include "curve_math.hpp"

namespace bonding_curve {

using Math = curve_math::Math64;

void validate_fee_bps(uint16_t platform_fee_bps) {
    if (platform_fee_bps > MAX_PLATFORM_FEE_BPS) {
        throw CurveError(ErrorCode::InvalidPlatformFee);
    }
}

GlobalPolicy initialize_policy(
    const AccountId& authority,
    const AccountId& fee_recipient,
    uint16_t platform_fee_bps
) {
    validate_fee_bps(platform_fee_bps);
    if (authority.empty()) {
        throw CurveError(ErrorCode::InvalidAuthority);
    }

    GlobalPolicy policy;
    policy.authority = authority;
    policy.fee_recipient = fee_recipient;
    policy.platform_fee_bps = platform_fee_bps;
    policy.paused = false;
    policy.total_assets_launched = 0;
    policy.total_volume = 0;
    return policy;
}

void update_policy(GlobalPolicy& policy, const AccountId& caller, const PolicyUpdate& update) {
    if (caller != policy.authority) {
        throw CurveError(ErrorCode::InvalidAuthority);
    }
    if (update.platform_fee_bps) {
        validate_fee_bps(*update.platform_fee_bps);
    }

    if (update.fee_recipient) policy.fee_recipient = *update.fee_recipient;
    if (update.platform_fee_bps) policy.platform_fee_bps = *update.platform_fee_bps;
    if (update.paused) policy.paused = *update.paused;
}

void record_launch(GlobalPolicy& policy) {
    policy.total_assets_launched = Math::add(policy.total_assets_launched, 1);
}

void record_volume(GlobalPolicy& policy, const TradeResult& trade) {
    policy.total_volume = Math::add(policy.total_volume, trade.gross_base);
}

} // namespace bonding_curve

#ifndef BONDING_CURVE_PRICING_HPP
#define BONDING_CURVE_PRICING_HPP

#include "curve_types.hpp"

namespace bonding_curve {

// Pure quotes over the virtual constant-product curve x * y = k.
// All divisions truncate, which leaves the rounding unit with the curve.
class PricingEngine {
public:
    // virtual_base * SCALE / virtual_asset; 0 when the asset side is empty
    static Amount current_price(const CurveState& curve);

    // current_price * total_supply / SCALE
    static Amount market_cap(const CurveState& curve, Amount total_supply);

    // Buy quote for a net base amount, clamped to the real asset reserve.
    static Amount tokens_out(const CurveState& curve, Amount base_in);

    // Sell quote for an asset amount, clamped to the real base reserve.
    static Amount base_out(const CurveState& curve, Amount asset_in);

    // gross * fee_bps / 10000, truncated
    static Amount platform_fee(Amount gross, uint16_t fee_bps);

    // Gross base a buyer must send so that the buy yields at least asset_out
    // after the fee. Rounds up on both the curve step and the fee gross-up, and
    // never quotes below MIN_TRADE_AMOUNT, so the quoted buy is always accepted.
    static Amount base_in_for_tokens(const CurveState& curve, Amount asset_out, uint16_t fee_bps);

    // Relative move of current_price caused by the trade, in basis points.
    // amount is net base for a buy and asset for a sell.
    static Amount price_impact_bps(const CurveState& curve, Amount amount, TradeSide side);

    // real_base_reserve / GRADUATION_THRESHOLD in basis points, capped at 10000
    static Amount graduation_progress_bps(const CurveState& curve);

    static bool ready_for_graduation(const CurveState& curve);
};

} // namespace bonding_curve

#endif // BONDING_CURVE_PRICING_HPP

#include "pricing.hpp"
#include "curve_errors.hpp"
#include "curve_math.hpp"

#include <algorithm>

namespace bonding_curve {

using Math = curve_math::Math64;
using Wide = Math::Wide;

Amount PricingEngine::current_price(const CurveState& curve) {
    if (curve.virtual_asset_reserve == 0) {
        return 0;
    }
    return Math::mul_div(curve.virtual_base_reserve, SCALE, curve.virtual_asset_reserve);
}

Amount PricingEngine::market_cap(const CurveState& curve, Amount total_supply) {
    return Math::mul_div(current_price(curve), total_supply, SCALE);
}

// ------------------------------ constant-product quotes ------------------------------

Amount PricingEngine::tokens_out(const CurveState& curve, Amount base_in) {
    if (base_in == 0) {
        return 0;
    }

    // (x + dx) * (y - dy) = x * y  =>  dy = y - k / (x + dx)
    Wide k = Math::mul_wide(curve.virtual_base_reserve, curve.virtual_asset_reserve);
    Wide new_virtual_base = Math::wide_add(Math::widen(curve.virtual_base_reserve), Math::widen(base_in));
    Wide new_virtual_asset = Math::wide_div(k, new_virtual_base);
    Wide out = Math::wide_sub(Math::widen(curve.virtual_asset_reserve), new_virtual_asset);

    // Never promise more than the curve actually holds
    out = std::min(out, Math::widen(curve.real_asset_reserve));
    return Math::narrow(out);
}

Amount PricingEngine::base_out(const CurveState& curve, Amount asset_in) {
    if (asset_in == 0) {
        return 0;
    }

    // (x - dx) * (y + dy) = x * y  =>  dx = x - k / (y + dy)
    Wide k = Math::mul_wide(curve.virtual_base_reserve, curve.virtual_asset_reserve);
    Wide new_virtual_asset = Math::wide_add(Math::widen(curve.virtual_asset_reserve), Math::widen(asset_in));
    Wide new_virtual_base = Math::wide_div(k, new_virtual_asset);
    Wide out = Math::wide_sub(Math::widen(curve.virtual_base_reserve), new_virtual_base);

    out = std::min(out, Math::widen(curve.real_base_reserve));
    return Math::narrow(out);
}

Amount PricingEngine::platform_fee(Amount gross, uint16_t fee_bps) {
    return Math::mul_div(gross, fee_bps, BPS_DENOMINATOR);
}

// ------------------------------ auxiliary quotes ------------------------------

Amount PricingEngine::base_in_for_tokens(const CurveState& curve, Amount asset_out, uint16_t fee_bps) {
    if (asset_out == 0) {
        return 0;
    }
    if (fee_bps > MAX_PLATFORM_FEE_BPS) {
        throw CurveError(ErrorCode::InvalidPlatformFee);
    }
    if (asset_out > curve.real_asset_reserve || asset_out >= curve.virtual_asset_reserve) {
        throw CurveError(ErrorCode::TradeExceedsReserves);
    }

    Wide k = Math::mul_wide(curve.virtual_base_reserve, curve.virtual_asset_reserve);
    Wide new_virtual_asset = Math::widen(curve.virtual_asset_reserve - asset_out);

    // ceil(k / new_y) so the truncating buy quote lands on or past new_y
    Wide new_virtual_base = Math::wide_div(k, new_virtual_asset);
    if (new_virtual_base * new_virtual_asset != k) {
        new_virtual_base = Math::wide_add(new_virtual_base, Wide(1));
    }
    Amount net = Math::narrow(Math::wide_sub(new_virtual_base, Math::widen(curve.virtual_base_reserve)));

    // gross - floor(gross * bps / 10000) >= net
    Amount gross = Math::mul_div_up(net, BPS_DENOMINATOR, BPS_DENOMINATOR - fee_bps);
    return std::max(gross, MIN_TRADE_AMOUNT);
}

Amount PricingEngine::price_impact_bps(const CurveState& curve, Amount amount, TradeSide side) {
    Amount before = current_price(curve);
    if (before == 0 || amount == 0) {
        return 0;
    }

    CurveState after = curve;
    if (side == TradeSide::Buy) {
        Amount out = tokens_out(curve, amount);
        after.virtual_base_reserve = Math::add(curve.virtual_base_reserve, amount);
        after.virtual_asset_reserve = Math::sub(curve.virtual_asset_reserve, out);
    } else {
        Amount out = base_out(curve, amount);
        after.virtual_base_reserve = Math::sub(curve.virtual_base_reserve, out);
        after.virtual_asset_reserve = Math::add(curve.virtual_asset_reserve, amount);
    }

    Amount now = current_price(after);
    Amount moved = now > before ? now - before : before - now;
    return Math::mul_div(moved, BPS_DENOMINATOR, before);
}

Amount PricingEngine::graduation_progress_bps(const CurveState& curve) {
    if (curve.graduated) {
        return BPS_DENOMINATOR;
    }
    Amount progress = Math::mul_div(curve.real_base_reserve, BPS_DENOMINATOR, GRADUATION_THRESHOLD);
    return std::min(progress, BPS_DENOMINATOR);
}

bool PricingEngine::ready_for_graduation(const CurveState& curve) {
    return !curve.graduated && curve.real_base_reserve >= GRADUATION_THRESHOLD;
}

} // namespace bonding_curve

#include "settlement.hpp"
#include "curve_errors.hpp"
#include "curve_math.hpp"
#include "curve_state.hpp"
#include "pricing.hpp"

#include <utility>

namespace bonding_curve {

using Math = curve_math::Math64;

namespace {

TradeResult make_result(
    const CurveState& next,
    const TradeRequest& request,
    TradeSide side,
    Amount total_supply
) {
    TradeResult r;
    r.asset_id = next.asset_id;
    r.trader_id = request.trader_id;
    r.side = side;
    r.virtual_base_reserve = next.virtual_base_reserve;
    r.virtual_asset_reserve = next.virtual_asset_reserve;
    r.real_base_reserve = next.real_base_reserve;
    r.real_asset_reserve = next.real_asset_reserve;
    r.price = PricingEngine::current_price(next);
    r.market_cap = PricingEngine::market_cap(next, total_supply);
    r.timestamp = request.now;
    return r;
}

} // namespace

// ------------------------------------ buy ------------------------------------

TradePlan Settlement::plan_buy(
    const CurveState& curve,
    const GlobalPolicy& policy,
    const TradeRequest& request,
    Amount total_supply
) {
    if (policy.paused) {
        throw CurveError(ErrorCode::ProtocolPaused);
    }
    if (request.amount < MIN_TRADE_AMOUNT) {
        throw CurveError(ErrorCode::TradeTooSmall);
    }
    if (curve.graduated) {
        throw CurveError(ErrorCode::AlreadyGraduated);
    }
    if (curve.real_asset_reserve == 0) {
        throw CurveError(ErrorCode::NoLiquidity);
    }

    Amount gross = request.amount;
    Amount fee = PricingEngine::platform_fee(gross, policy.platform_fee_bps);
    Amount net = Math::sub(gross, fee);

    Amount asset_out = PricingEngine::tokens_out(curve, net);
    if (asset_out == 0) {
        throw CurveError(ErrorCode::ZeroAmount);
    }
    if (asset_out < request.min_out) {
        throw CurveError(ErrorCode::SlippageExceeded);
    }
    if (asset_out > curve.real_asset_reserve) {
        throw CurveError(ErrorCode::TradeExceedsReserves);
    }

    // Build the next state on a copy; the input is only replaced on commit
    TradePlan plan;
    plan.next = curve;
    plan.next.virtual_base_reserve = Math::add(curve.virtual_base_reserve, net);
    plan.next.virtual_asset_reserve = Math::sub(curve.virtual_asset_reserve, asset_out);
    plan.next.real_base_reserve = Math::add(curve.real_base_reserve, net);
    plan.next.real_asset_reserve = Math::sub(curve.real_asset_reserve, asset_out);
    plan.next.assets_sold = Math::add(curve.assets_sold, asset_out);
    check_invariants(plan.next);

    plan.result = make_result(plan.next, request, TradeSide::Buy, total_supply);
    plan.result.gross_base = gross;
    plan.result.fee = fee;
    plan.result.net_base = net;
    plan.result.asset_amount = asset_out;
    return plan;
}

// ------------------------------------ sell -----------------------------------

TradePlan Settlement::plan_sell(
    const CurveState& curve,
    const GlobalPolicy& policy,
    const TradeRequest& request,
    Amount total_supply
) {
    if (policy.paused) {
        throw CurveError(ErrorCode::ProtocolPaused);
    }
    if (request.amount == 0) {
        throw CurveError(ErrorCode::ZeroAmount);
    }
    if (curve.graduated) {
        throw CurveError(ErrorCode::AlreadyGraduated);
    }
    if (curve.real_base_reserve == 0) {
        throw CurveError(ErrorCode::NoLiquidity);
    }

    Amount asset_in = request.amount;
    Amount gross_out = PricingEngine::base_out(curve, asset_in);
    if (gross_out == 0) {
        throw CurveError(ErrorCode::ZeroAmount);
    }

    Amount fee = PricingEngine::platform_fee(gross_out, policy.platform_fee_bps);
    Amount net_out = Math::sub(gross_out, fee);
    if (net_out < request.min_out) {
        throw CurveError(ErrorCode::SlippageExceeded);
    }
    if (gross_out > curve.real_base_reserve) {
        throw CurveError(ErrorCode::TradeExceedsReserves);
    }

    TradePlan plan;
    plan.next = curve;
    plan.next.virtual_base_reserve = Math::sub(curve.virtual_base_reserve, gross_out);
    plan.next.virtual_asset_reserve = Math::add(curve.virtual_asset_reserve, asset_in);
    plan.next.real_base_reserve = Math::sub(curve.real_base_reserve, gross_out);
    plan.next.real_asset_reserve = Math::add(curve.real_asset_reserve, asset_in);
    plan.next.assets_sold = Math::sub(curve.assets_sold, asset_in);
    check_invariants(plan.next);

    plan.result = make_result(plan.next, request, TradeSide::Sell, total_supply);
    plan.result.gross_base = gross_out;
    plan.result.fee = fee;
    plan.result.net_base = net_out;
    plan.result.asset_amount = asset_in;
    return plan;
}

// ------------------------------------ commit ---------------------------------

TradeResult Settlement::buy(
    CurveState& curve,
    const GlobalPolicy& policy,
    const TradeRequest& request,
    Amount total_supply
) {
    TradePlan plan = plan_buy(curve, policy, request, total_supply);
    curve = std::move(plan.next);
    return plan.result;
}

TradeResult Settlement::sell(
    CurveState& curve,
    const GlobalPolicy& policy,
    const TradeRequest& request,
    Amount total_supply
) {
    TradePlan plan = plan_sell(curve, policy, request, total_supply);
    curve = std::move(plan.next);
    return plan.result;
}

} // namespace bonding_curve

#include "graduation.hpp"
#include "curve_errors.hpp"
#include "curve_math.hpp"
#include "curve_state.hpp"
#include "pricing.hpp"

#include <utility>

namespace bonding_curve {

using Math = curve_math::Math64;

GraduationPlan Graduation::plan(
    const CurveState& curve,
    const GlobalPolicy& policy,
    Timestamp now,
    Amount total_supply
) {
    if (policy.paused) {
        throw CurveError(ErrorCode::ProtocolPaused);
    }
    if (curve.graduated) {
        throw CurveError(ErrorCode::AlreadyGraduated);
    }
    if (curve.real_base_reserve < GRADUATION_THRESHOLD) {
        throw CurveError(ErrorCode::NotReadyForGraduation);
    }

    const Amount total = curve.real_base_reserve;

    GraduationPlan plan;
    GraduationResult& r = plan.result;
    r.asset_id = curve.asset_id;
    r.creator_id = curve.creator_id;
    r.final_market_cap = PricingEngine::market_cap(curve, total_supply);
    r.total_base = total;
    r.liquidity_base = Math::mul_div(total, GRADUATION_LIQUIDITY_PERCENT, 100);
    r.creator_reward = Math::mul_div(total, GRADUATION_CREATOR_PERCENT, 100);
    r.platform_fee = Math::mul_div(total, GRADUATION_PLATFORM_PERCENT, 100);
    r.liquidity_asset = curve.real_asset_reserve;
    r.rounding_remainder = Math::sub(
        total, Math::add(Math::add(r.liquidity_base, r.creator_reward), r.platform_fee));
    r.timestamp = now;

    plan.next = curve;
    plan.next.graduated = true;
    plan.next.graduated_at = now;
    plan.next.real_base_reserve = 0;
    plan.next.real_asset_reserve = 0;
    check_invariants(plan.next);
    return plan;
}

GraduationResult Graduation::graduate(
    CurveState& curve,
    const GlobalPolicy& policy,
    Timestamp now,
    Amount total_supply
) {
    GraduationPlan p = plan(curve, policy, now, total_supply);
    curve = std::move(p.next);
    return p.result;
}

} // namespace bonding_curve

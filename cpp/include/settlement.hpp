#ifndef BONDING_CURVE_SETTLEMENT_HPP
#define BONDING_CURVE_SETTLEMENT_HPP

#include "curve_types.hpp"

namespace bonding_curve {

struct TradeRequest {
    AccountId trader_id;
    Amount amount = 0;    // gross base in (buy) or asset in (sell)
    Amount min_out = 0;   // asset out (buy) or net base out (sell)
    Timestamp now = 0;
};

// Next curve state plus the record describing it. Nothing is applied until
// the caller commits `next`.
struct TradePlan {
    CurveState next;
    TradeResult result;
};

class Settlement {
public:
    // Fee is taken from the input side: only net base enters the reserves.
    static TradePlan plan_buy(
        const CurveState& curve,
        const GlobalPolicy& policy,
        const TradeRequest& request,
        Amount total_supply = TOTAL_SUPPLY
    );

    // Fee is taken from the output side: reserves release the gross amount.
    static TradePlan plan_sell(
        const CurveState& curve,
        const GlobalPolicy& policy,
        const TradeRequest& request,
        Amount total_supply = TOTAL_SUPPLY
    );

    // Plan and commit in one step. On any error `curve` is left untouched.
    static TradeResult buy(
        CurveState& curve,
        const GlobalPolicy& policy,
        const TradeRequest& request,
        Amount total_supply = TOTAL_SUPPLY
    );

    static TradeResult sell(
        CurveState& curve,
        const GlobalPolicy& policy,
        const TradeRequest& request,
        Amount total_supply = TOTAL_SUPPLY
    );
};

} // namespace bonding_curve

#endif // BONDING_CURVE_SETTLEMENT_HPP

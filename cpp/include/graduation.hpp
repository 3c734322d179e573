#ifndef BONDING_CURVE_GRADUATION_HPP
#define BONDING_CURVE_GRADUATION_HPP

#include "curve_types.hpp"

namespace bonding_curve {

struct GraduationPlan {
    CurveState next;
    GraduationResult result;
};

// One-shot Active -> Graduated transition. Splits the raised base reserve
// 85/10/5 between liquidity migration, creator and platform, hands the whole
// real asset reserve to liquidity migration, and zeroes the real reserves.
class Graduation {
public:
    static GraduationPlan plan(
        const CurveState& curve,
        const GlobalPolicy& policy,
        Timestamp now,
        Amount total_supply = TOTAL_SUPPLY
    );

    // A second call on a graduated curve throws AlreadyGraduated and changes nothing.
    static GraduationResult graduate(
        CurveState& curve,
        const GlobalPolicy& policy,
        Timestamp now,
        Amount total_supply = TOTAL_SUPPLY
    );
};

} // namespace bonding_curve

#endif // BONDING_CURVE_GRADUATION_HPP

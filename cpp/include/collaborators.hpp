#pragma once

#include "curve_types.hpp"

namespace bonding_curve {

// Balance movement for a planned transition. Each call moves every amount of
// the record or throws having moved none; the curve is committed only after
// it returns.
class FundLedger {
public:
    virtual ~FundLedger() = default;
    virtual void settle_launch(const CurveState& curve) = 0;
    virtual void settle_trade(const TradeResult& trade, const AccountId& fee_recipient) = 0;
    virtual void settle_graduation(const GraduationResult& graduation, const AccountId& fee_recipient) = 0;
};

// Receives committed records only.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_launch(const CurveState& curve, const AssetDescriptor& descriptor) = 0;
    virtual void on_trade(const TradeResult& trade) = 0;
    virtual void on_graduation(const GraduationResult& graduation) = 0;
};

// Downstream pool creation. Gets the liquidity split after the curve has
// graduated and the ledger has moved the amounts into the migration escrow.
class LiquidityMigrator {
public:
    virtual ~LiquidityMigrator() = default;
    virtual void migrate(const GraduationResult& graduation) = 0;
};

} // namespace bonding_curve

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include "collaborators.hpp"
#include "global_policy.hpp"
#include "settlement.hpp"

namespace bonding_curve {

// Reference host for the engine. Transitions on one asset are serialized by
// that asset's mutex; different assets proceed in parallel. Trades read the
// policy through a by-value snapshot so a concurrent admin update cannot
// change a quote mid-trade.
//
// Lock order: asset entry -> policy -> ledger. The ledger runs under the
// asset lock so that its movement and the commit are one step; the event sink
// and the migrator are called after every lock is released and may read the
// book back.
class CurveBook {
public:
    CurveBook(
        GlobalPolicy policy,
        FundLedger& ledger,
        EventSink* sink = nullptr,
        LiquidityMigrator* migrator = nullptr
    );

    CurveBook(const CurveBook&) = delete;
    CurveBook& operator=(const CurveBook&) = delete;

    CurveState launch(
        const AssetDescriptor& descriptor,
        const AccountId& creator_id,
        Timestamp now,
        Amount virtual_base_reserve = DEFAULT_VIRTUAL_BASE_RESERVE,
        Amount virtual_asset_reserve = DEFAULT_VIRTUAL_ASSET_RESERVE
    );

    TradeResult buy(const AssetId& asset_id, const TradeRequest& request);
    TradeResult sell(const AssetId& asset_id, const TradeRequest& request);
    // Commits the graduation, reports it to the sink, then hands the liquidity
    // to the migrator. If the migrator throws, the hand-off stays pending and
    // the exception propagates; the curve remains graduated.
    GraduationResult graduate(const AssetId& asset_id, Timestamp now);

    // Re-runs a failed liquidity hand-off. Throws NoPendingMigration when none
    // is outstanding or another hand-off for the asset is in progress.
    GraduationResult retry_migration(const AssetId& asset_id);

    // Graduation record whose hand-off has not completed yet
    std::optional<GraduationResult> pending_migration(const AssetId& asset_id) const;

    void update_policy(const AccountId& caller, const PolicyUpdate& update);

    GlobalPolicy policy() const;
    CurveState curve(const AssetId& asset_id) const;
    AssetDescriptor descriptor(const AssetId& asset_id) const;
    std::vector<AssetId> assets() const;

private:
    struct Entry {
        mutable std::mutex mu;
        CurveState state;
        AssetDescriptor descriptor;
        std::optional<GraduationResult> pending_migration;
        bool migration_in_flight = false;
    };

    Entry& entry(const AssetId& asset_id) const;

    void release_launch_id(const AssetId& asset_id);

    // Hands a claimed pending migration to the migrator and settles the claim.
    void run_migration(Entry& e, const GraduationResult& graduation);

    TradeResult settle(Entry& e, const TradeRequest& request, TradeSide side);

    // Counter reservations, released again if the ledger step fails
    void reserve_volume(const TradeResult& trade);
    void release_volume(Amount gross);

    mutable std::mutex registry_mu_;
    std::map<AssetId, std::unique_ptr<Entry>> entries_;
    std::set<AssetId> launching_;   // ids reserved by launches still in the ledger

    mutable std::mutex policy_mu_;
    GlobalPolicy policy_;

    FundLedger& ledger_;
    EventSink* sink_;
    LiquidityMigrator* migrator_;
};

} // namespace bonding_curve

#include "curve_book.hpp"
#include "curve_errors.hpp"
#include "curve_math.hpp"
#include "curve_state.hpp"
#include "graduation.hpp"

#include <utility>

namespace bonding_curve {

using Math = curve_math::Math64;

CurveBook::CurveBook(
    GlobalPolicy policy,
    FundLedger& ledger,
    EventSink* sink,
    LiquidityMigrator* migrator
)
    : policy_(std::move(policy)), ledger_(ledger), sink_(sink), migrator_(migrator) {
    validate_fee_bps(policy_.platform_fee_bps);
}

CurveBook::Entry& CurveBook::entry(const AssetId& asset_id) const {
    std::lock_guard<std::mutex> lk(registry_mu_);
    auto it = entries_.find(asset_id);
    if (it == entries_.end()) {
        throw CurveError(ErrorCode::UnknownAsset, asset_id);
    }
    // Entries are never erased, so the reference outlives the registry lock
    return *it->second;
}

// ------------------------------------ launch ---------------------------------

CurveState CurveBook::launch(
    const AssetDescriptor& descriptor,
    const AccountId& creator_id,
    Timestamp now,
    Amount virtual_base_reserve,
    Amount virtual_asset_reserve
) {
    CurveState curve = launch_curve(policy(), descriptor, creator_id,
                                    virtual_base_reserve, virtual_asset_reserve, now);

    auto e = std::make_unique<Entry>();
    e->state = curve;
    e->descriptor = descriptor;

    // Reserve the id; the ledger call below runs without the registry lock
    {
        std::lock_guard<std::mutex> reg(registry_mu_);
        if (entries_.count(descriptor.asset_id) || launching_.count(descriptor.asset_id)) {
            throw CurveError(ErrorCode::DuplicateAsset, descriptor.asset_id);
        }
        launching_.insert(descriptor.asset_id);
    }
    try {
        std::lock_guard<std::mutex> lk(policy_mu_);
        record_launch(policy_);
    } catch (...) {
        release_launch_id(descriptor.asset_id);
        throw;
    }
    try {
        ledger_.settle_launch(curve);
    } catch (...) {
        {
            std::lock_guard<std::mutex> lk(policy_mu_);
            policy_.total_assets_launched = Math::sub(policy_.total_assets_launched, 1);
        }
        release_launch_id(descriptor.asset_id);
        throw;
    }
    {
        std::lock_guard<std::mutex> reg(registry_mu_);
        launching_.erase(descriptor.asset_id);
        entries_.emplace(descriptor.asset_id, std::move(e));
    }

    if (sink_) sink_->on_launch(curve, descriptor);
    return curve;
}

void CurveBook::release_launch_id(const AssetId& asset_id) {
    std::lock_guard<std::mutex> reg(registry_mu_);
    launching_.erase(asset_id);
}

// ------------------------------------ trades ---------------------------------

TradeResult CurveBook::buy(const AssetId& asset_id, const TradeRequest& request) {
    return settle(entry(asset_id), request, TradeSide::Buy);
}

TradeResult CurveBook::sell(const AssetId& asset_id, const TradeRequest& request) {
    return settle(entry(asset_id), request, TradeSide::Sell);
}

TradeResult CurveBook::settle(Entry& e, const TradeRequest& request, TradeSide side) {
    TradeResult result;
    {
        std::lock_guard<std::mutex> lk(e.mu);
        const GlobalPolicy snapshot = policy();

        TradePlan plan = (side == TradeSide::Buy)
            ? Settlement::plan_buy(e.state, snapshot, request, e.descriptor.total_supply)
            : Settlement::plan_sell(e.state, snapshot, request, e.descriptor.total_supply);

        reserve_volume(plan.result);
        try {
            ledger_.settle_trade(plan.result, snapshot.fee_recipient);
        } catch (...) {
            release_volume(plan.result.gross_base);
            throw;
        }
        e.state = std::move(plan.next);
        result = std::move(plan.result);
    }

    if (sink_) sink_->on_trade(result);
    return result;
}

void CurveBook::reserve_volume(const TradeResult& trade) {
    std::lock_guard<std::mutex> lk(policy_mu_);
    record_volume(policy_, trade);
}

void CurveBook::release_volume(Amount gross) {
    std::lock_guard<std::mutex> lk(policy_mu_);
    policy_.total_volume = Math::sub(policy_.total_volume, gross);
}

// ---------------------------------- graduation -------------------------------

GraduationResult CurveBook::graduate(const AssetId& asset_id, Timestamp now) {
    Entry& e = entry(asset_id);
    GraduationResult result;
    {
        std::lock_guard<std::mutex> lk(e.mu);
        const GlobalPolicy snapshot = policy();

        GraduationPlan plan = Graduation::plan(e.state, snapshot, now, e.descriptor.total_supply);
        ledger_.settle_graduation(plan.result, snapshot.fee_recipient);
        e.state = std::move(plan.next);
        result = std::move(plan.result);
        if (migrator_) {
            e.pending_migration = result;
            e.migration_in_flight = true;
        }
    }

    if (sink_) sink_->on_graduation(result);
    if (migrator_) run_migration(e, result);
    return result;
}

GraduationResult CurveBook::retry_migration(const AssetId& asset_id) {
    Entry& e = entry(asset_id);
    GraduationResult result;
    {
        std::lock_guard<std::mutex> lk(e.mu);
        if (!e.pending_migration) {
            throw CurveError(ErrorCode::NoPendingMigration, asset_id);
        }
        if (e.migration_in_flight) {
            throw CurveError(ErrorCode::NoPendingMigration, asset_id + " (hand-off in progress)");
        }
        e.migration_in_flight = true;
        result = *e.pending_migration;
    }
    run_migration(e, result);
    return result;
}

std::optional<GraduationResult> CurveBook::pending_migration(const AssetId& asset_id) const {
    Entry& e = entry(asset_id);
    std::lock_guard<std::mutex> lk(e.mu);
    return e.pending_migration;
}

void CurveBook::run_migration(Entry& e, const GraduationResult& graduation) {
    try {
        migrator_->migrate(graduation);
    } catch (...) {
        std::lock_guard<std::mutex> lk(e.mu);
        e.migration_in_flight = false;
        throw;
    }
    std::lock_guard<std::mutex> lk(e.mu);
    e.pending_migration.reset();
    e.migration_in_flight = false;
}

// ------------------------------------ admin ----------------------------------

void CurveBook::update_policy(const AccountId& caller, const PolicyUpdate& update) {
    std::lock_guard<std::mutex> lk(policy_mu_);
    bonding_curve::update_policy(policy_, caller, update);
}

// ------------------------------------ views ----------------------------------

GlobalPolicy CurveBook::policy() const {
    std::lock_guard<std::mutex> lk(policy_mu_);
    return policy_;
}

CurveState CurveBook::curve(const AssetId& asset_id) const {
    Entry& e = entry(asset_id);
    std::lock_guard<std::mutex> lk(e.mu);
    return e.state;
}

AssetDescriptor CurveBook::descriptor(const AssetId& asset_id) const {
    Entry& e = entry(asset_id);
    std::lock_guard<std::mutex> lk(e.mu);
    return e.descriptor;
}

std::vector<AssetId> CurveBook::assets() const {
    std::lock_guard<std::mutex> lk(registry_mu_);
    std::vector<AssetId> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
}

} // namespace bonding_curve

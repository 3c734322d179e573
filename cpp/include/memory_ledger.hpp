#pragma once

#include <map>
#include <mutex>
#include <utility>
#include "collaborators.hpp"

namespace bonding_curve {

// In-memory FundLedger keeping base balances per account and asset balances
// per (asset, account). Curve vaults and migration escrows are ordinary
// accounts named by vault_account() and migration_account().
class MemoryLedger : public FundLedger {
public:
    static AccountId vault_account(const AssetId& asset_id) { return "vault:" + asset_id; }
    static AccountId migration_account(const AssetId& asset_id) { return "migration:" + asset_id; }

    void deposit_base(const AccountId& account, Amount amount);
    void deposit_asset(const AssetId& asset_id, const AccountId& account, Amount amount);

    Amount base_balance(const AccountId& account) const;
    Amount asset_balance(const AssetId& asset_id, const AccountId& account) const;

    // Sum over every account; constant under settlement
    Amount total_base() const;
    Amount total_asset(const AssetId& asset_id) const;

    void settle_launch(const CurveState& curve) override;
    void settle_trade(const TradeResult& trade, const AccountId& fee_recipient) override;
    void settle_graduation(const GraduationResult& graduation, const AccountId& fee_recipient) override;

private:
    using AssetKey = std::pair<AssetId, AccountId>;

    class Batch;

    mutable std::mutex mu_;
    std::map<AccountId, Amount> base_;
    std::map<AssetKey, Amount> asset_;
};

} // namespace bonding_curve

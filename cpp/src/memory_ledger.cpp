#include "memory_ledger.hpp"
#include "curve_errors.hpp"
#include "curve_math.hpp"

namespace bonding_curve {

using Math = curve_math::Math64;

// Staged debits and credits; written back only when every step succeeded.
class MemoryLedger::Batch {
public:
    explicit Batch(MemoryLedger& ledger) : ledger_(ledger) {}

    void debit_base(const AccountId& account, Amount amount) {
        Amount& slot = base_slot(account);
        slot = Math::sub(slot, amount);
    }
    void credit_base(const AccountId& account, Amount amount) {
        Amount& slot = base_slot(account);
        slot = Math::add(slot, amount);
    }
    void debit_asset(const AssetId& asset_id, const AccountId& account, Amount amount) {
        Amount& slot = asset_slot(asset_id, account);
        slot = Math::sub(slot, amount);
    }
    void credit_asset(const AssetId& asset_id, const AccountId& account, Amount amount) {
        Amount& slot = asset_slot(asset_id, account);
        slot = Math::add(slot, amount);
    }

    void commit() {
        for (auto& kv : base_) ledger_.base_[kv.first] = kv.second;
        for (auto& kv : asset_) ledger_.asset_[kv.first] = kv.second;
    }

private:
    Amount& base_slot(const AccountId& account) {
        auto it = base_.find(account);
        if (it == base_.end()) {
            auto cur = ledger_.base_.find(account);
            it = base_.emplace(account, cur == ledger_.base_.end() ? 0 : cur->second).first;
        }
        return it->second;
    }
    Amount& asset_slot(const AssetId& asset_id, const AccountId& account) {
        AssetKey key{asset_id, account};
        auto it = asset_.find(key);
        if (it == asset_.end()) {
            auto cur = ledger_.asset_.find(key);
            it = asset_.emplace(key, cur == ledger_.asset_.end() ? 0 : cur->second).first;
        }
        return it->second;
    }

    MemoryLedger& ledger_;
    std::map<AccountId, Amount> base_;
    std::map<AssetKey, Amount> asset_;
};

void MemoryLedger::deposit_base(const AccountId& account, Amount amount) {
    std::lock_guard<std::mutex> lk(mu_);
    Batch b(*this);
    b.credit_base(account, amount);
    b.commit();
}

void MemoryLedger::deposit_asset(const AssetId& asset_id, const AccountId& account, Amount amount) {
    std::lock_guard<std::mutex> lk(mu_);
    Batch b(*this);
    b.credit_asset(asset_id, account, amount);
    b.commit();
}

Amount MemoryLedger::base_balance(const AccountId& account) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = base_.find(account);
    return it == base_.end() ? 0 : it->second;
}

Amount MemoryLedger::asset_balance(const AssetId& asset_id, const AccountId& account) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = asset_.find(AssetKey{asset_id, account});
    return it == asset_.end() ? 0 : it->second;
}

Amount MemoryLedger::total_base() const {
    std::lock_guard<std::mutex> lk(mu_);
    Amount sum = 0;
    for (const auto& kv : base_) sum = Math::add(sum, kv.second);
    return sum;
}

Amount MemoryLedger::total_asset(const AssetId& asset_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    Amount sum = 0;
    for (const auto& kv : asset_) {
        if (kv.first.first == asset_id) sum = Math::add(sum, kv.second);
    }
    return sum;
}

// ------------------------------ settlement ------------------------------

void MemoryLedger::settle_launch(const CurveState& curve) {
    std::lock_guard<std::mutex> lk(mu_);
    Batch b(*this);
    b.credit_asset(curve.asset_id, vault_account(curve.asset_id), curve.real_asset_reserve);
    b.commit();
}

void MemoryLedger::settle_trade(const TradeResult& trade, const AccountId& fee_recipient) {
    std::lock_guard<std::mutex> lk(mu_);
    const AccountId vault = vault_account(trade.asset_id);
    Batch b(*this);
    if (trade.is_buy()) {
        b.debit_base(trade.trader_id, trade.gross_base);
        b.credit_base(vault, trade.net_base);
        b.credit_base(fee_recipient, trade.fee);
        b.debit_asset(trade.asset_id, vault, trade.asset_amount);
        b.credit_asset(trade.asset_id, trade.trader_id, trade.asset_amount);
    } else {
        b.debit_asset(trade.asset_id, trade.trader_id, trade.asset_amount);
        b.credit_asset(trade.asset_id, vault, trade.asset_amount);
        b.debit_base(vault, trade.gross_base);
        b.credit_base(trade.trader_id, trade.net_base);
        b.credit_base(fee_recipient, trade.fee);
    }
    b.commit();
}

void MemoryLedger::settle_graduation(const GraduationResult& graduation, const AccountId& fee_recipient) {
    std::lock_guard<std::mutex> lk(mu_);
    const AccountId vault = vault_account(graduation.asset_id);
    const AccountId escrow = migration_account(graduation.asset_id);
    Batch b(*this);
    b.debit_base(vault, graduation.total_base);
    b.credit_base(graduation.creator_id, graduation.creator_reward);
    // truncation dust goes to the platform along with its share
    b.credit_base(fee_recipient, Math::add(graduation.platform_fee, graduation.rounding_remainder));
    b.credit_base(escrow, graduation.liquidity_base);
    b.debit_asset(graduation.asset_id, vault, graduation.liquidity_asset);
    b.credit_asset(graduation.asset_id, escrow, graduation.liquidity_asset);
    b.commit();
}

} // namespace bonding_curve

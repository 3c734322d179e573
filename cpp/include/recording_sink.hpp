#pragma once

#include <mutex>
#include <vector>
#include "collaborators.hpp"

namespace bonding_curve {

// EventSink that keeps every committed record in memory.
class RecordingSink : public EventSink {
public:
    void on_launch(const CurveState& curve, const AssetDescriptor&) override {
        std::lock_guard<std::mutex> lk(mu_);
        launches_.push_back(curve);
    }
    void on_trade(const TradeResult& trade) override {
        std::lock_guard<std::mutex> lk(mu_);
        trades_.push_back(trade);
    }
    void on_graduation(const GraduationResult& graduation) override {
        std::lock_guard<std::mutex> lk(mu_);
        graduations_.push_back(graduation);
    }

    std::vector<CurveState> launches() const { std::lock_guard<std::mutex> lk(mu_); return launches_; }
    std::vector<TradeResult> trades() const { std::lock_guard<std::mutex> lk(mu_); return trades_; }
    std::vector<GraduationResult> graduations() const { std::lock_guard<std::mutex> lk(mu_); return graduations_; }

    std::vector<TradeResult> trades_for(const AssetId& asset_id) const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<TradeResult> out;
        for (const auto& t : trades_) {
            if (t.asset_id == asset_id) out.push_back(t);
        }
        return out;
    }

private:
    mutable std::mutex mu_;
    std::vector<CurveState> launches_;
    std::vector<TradeResult> trades_;
    std::vector<GraduationResult> graduations_;
};

} // namespace bonding_curve

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace bonding_curve {

using Amount = uint64_t;
using Timestamp = int64_t;   // unix seconds, always supplied by the caller
using AccountId = std::string;
using AssetId = std::string;

// ------------------------------ Protocol constants ------------------------------

constexpr Amount SCALE = 1'000'000'000;  // price precision

constexpr uint8_t TOKEN_DECIMALS = 6;
constexpr Amount TOTAL_SUPPLY = 1'000'000'000ULL * 1'000'000ULL;

constexpr Amount DEFAULT_VIRTUAL_BASE_RESERVE = 30ULL * 1'000'000'000ULL;
constexpr Amount DEFAULT_VIRTUAL_ASSET_RESERVE = 1'073'000'000ULL * 1'000'000ULL;
constexpr Amount INITIAL_REAL_ASSET_RESERVE = 793'000'000ULL * 1'000'000ULL;

constexpr Amount GRADUATION_THRESHOLD = 85ULL * 1'000'000'000ULL;

constexpr uint16_t DEFAULT_PLATFORM_FEE_BPS = 100;
constexpr uint16_t MAX_PLATFORM_FEE_BPS = 1000;
constexpr Amount BPS_DENOMINATOR = 10'000;

constexpr Amount MIN_TRADE_AMOUNT = 1'000'000;

// Graduation split of the raised base reserve, in percent
constexpr Amount GRADUATION_LIQUIDITY_PERCENT = 85;
constexpr Amount GRADUATION_CREATOR_PERCENT = 10;
constexpr Amount GRADUATION_PLATFORM_PERCENT = 5;
static_assert(GRADUATION_LIQUIDITY_PERCENT + GRADUATION_CREATOR_PERCENT +
              GRADUATION_PLATFORM_PERCENT == 100,
              "graduation split must cover the whole reserve");

constexpr size_t MAX_NAME_LENGTH = 32;
constexpr size_t MAX_SYMBOL_LENGTH = 10;
constexpr size_t MAX_URI_LENGTH = 200;

// Bumped whenever a field is added; new fields must have a usable default.
constexpr uint32_t CURVE_SCHEMA_VERSION = 1;
constexpr uint32_t POLICY_SCHEMA_VERSION = 1;

// ------------------------------ Persistent records ------------------------------

struct GlobalPolicy {
    uint32_t schema_version = POLICY_SCHEMA_VERSION;
    AccountId authority;
    AccountId fee_recipient;
    uint16_t platform_fee_bps = DEFAULT_PLATFORM_FEE_BPS;
    bool paused = false;
    uint64_t total_assets_launched = 0;
    Amount total_volume = 0;
};

struct CurveState {
    uint32_t schema_version = CURVE_SCHEMA_VERSION;
    AssetId asset_id;
    AccountId creator_id;
    Amount virtual_base_reserve = 0;
    Amount virtual_asset_reserve = 0;
    Amount real_base_reserve = 0;
    Amount real_asset_reserve = 0;
    Amount initial_real_asset_reserve = 0;
    Amount assets_sold = 0;
    bool graduated = false;
    Timestamp created_at = 0;
    Timestamp graduated_at = 0;

    bool operator==(const CurveState& o) const {
        return schema_version == o.schema_version && asset_id == o.asset_id &&
               creator_id == o.creator_id &&
               virtual_base_reserve == o.virtual_base_reserve &&
               virtual_asset_reserve == o.virtual_asset_reserve &&
               real_base_reserve == o.real_base_reserve &&
               real_asset_reserve == o.real_asset_reserve &&
               initial_real_asset_reserve == o.initial_real_asset_reserve &&
               assets_sold == o.assets_sold && graduated == o.graduated &&
               created_at == o.created_at && graduated_at == o.graduated_at;
    }
    bool operator!=(const CurveState& o) const { return !(*this == o); }
};

// Metadata owned by the asset-registration layer. Only total_supply couples
// to pricing (market cap).
struct AssetDescriptor {
    AssetId asset_id;
    std::string name;
    std::string symbol;
    std::string uri;
    Amount total_supply = TOTAL_SUPPLY;
    uint8_t decimals = TOKEN_DECIMALS;
};

// ------------------------------ Ephemeral results ------------------------------

enum class TradeSide { Buy, Sell };

// Field set every event sink depends on. For a buy, gross/fee/net are the
// base paid in; for a sell they are the base paid out.
struct TradeResult {
    AssetId asset_id;
    AccountId trader_id;
    TradeSide side = TradeSide::Buy;
    Amount gross_base = 0;
    Amount fee = 0;
    Amount net_base = 0;
    Amount asset_amount = 0;
    Amount virtual_base_reserve = 0;
    Amount virtual_asset_reserve = 0;
    Amount real_base_reserve = 0;
    Amount real_asset_reserve = 0;
    Amount price = 0;
    Amount market_cap = 0;
    Timestamp timestamp = 0;

    bool is_buy() const { return side == TradeSide::Buy; }
};

struct GraduationResult {
    AssetId asset_id;
    AccountId creator_id;
    Amount final_market_cap = 0;
    Amount total_base = 0;
    Amount liquidity_base = 0;
    Amount liquidity_asset = 0;
    Amount creator_reward = 0;
    Amount platform_fee = 0;
    Amount rounding_remainder = 0;  // total_base minus the three truncated shares
    Timestamp timestamp = 0;
};

inline const char* to_string(TradeSide side) {
    return side == TradeSide::Buy ? "buy" : "sell";
}

} // namespace bonding_curve

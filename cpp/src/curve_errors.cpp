#include "curve_errors.hpp"

namespace bonding_curve {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ProtocolPaused:         return "protocol is paused";
        case ErrorCode::InvalidPlatformFee:     return "invalid platform fee (max 1000 bps)";
        case ErrorCode::InvalidAuthority:       return "invalid authority";
        case ErrorCode::ZeroAmount:             return "zero amount";
        case ErrorCode::TradeTooSmall:          return "trade amount too small";
        case ErrorCode::InvalidInitialReserves: return "invalid initial reserves";
        case ErrorCode::InvalidNameLength:      return "invalid name length (1-32)";
        case ErrorCode::InvalidSymbolLength:    return "invalid symbol length (1-10)";
        case ErrorCode::InvalidUriLength:       return "invalid uri length (max 200)";
        case ErrorCode::MathOverflow:           return "math overflow";
        case ErrorCode::MathUnderflow:          return "math underflow";
        case ErrorCode::DivisionByZero:         return "division by zero";
        case ErrorCode::SlippageExceeded:       return "slippage";
        case ErrorCode::TradeExceedsReserves:   return "trade exceeds available reserves";
        case ErrorCode::AlreadyGraduated:       return "curve already graduated";
        case ErrorCode::NotReadyForGraduation:  return "curve not ready for graduation";
        case ErrorCode::NoLiquidity:            return "curve has no liquidity";
        case ErrorCode::InvalidCurveState:      return "invalid curve state";
        case ErrorCode::UnknownAsset:           return "unknown asset";
        case ErrorCode::DuplicateAsset:         return "asset already launched";
        case ErrorCode::NoPendingMigration:     return "no pending liquidity migration";
    }
    return "unknown error";
}

bool is_retryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::ZeroAmount:
        case ErrorCode::TradeTooSmall:
        case ErrorCode::SlippageExceeded:
        case ErrorCode::TradeExceedsReserves:
        case ErrorCode::NotReadyForGraduation:
            return true;
        default:
            return false;
    }
}

} // namespace bonding_curve

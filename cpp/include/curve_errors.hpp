#ifndef CURVE_ERRORS_HPP
#define CURVE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace bonding_curve {

// One code per rejection reason. Callers branch on the code, never on the text.
enum class ErrorCode {
    // policy
    ProtocolPaused,
    InvalidPlatformFee,
    InvalidAuthority,
    // input
    ZeroAmount,
    TradeTooSmall,
    InvalidInitialReserves,
    InvalidNameLength,
    InvalidSymbolLength,
    InvalidUriLength,
    // arithmetic
    MathOverflow,
    MathUnderflow,
    DivisionByZero,
    // curve state
    SlippageExceeded,
    TradeExceedsReserves,
    AlreadyGraduated,
    NotReadyForGraduation,
    NoLiquidity,
    InvalidCurveState,
    // host lookup
    UnknownAsset,
    DuplicateAsset,
    NoPendingMigration,
};

const char* to_string(ErrorCode code);

// True when re-issuing the call with different parameters (amount, min_out)
// or at a later time can succeed.
bool is_retryable(ErrorCode code);

class CurveError : public std::runtime_error {
public:
    explicit CurveError(ErrorCode code)
        : std::runtime_error(to_string(code)), code_(code) {}

    CurveError(ErrorCode code, const std::string& detail)
        : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace bonding_curve

#endif // CURVE_ERRORS_HPP

#include "amount_text.hpp"
#include "curve_errors.hpp"
#include "curve_math.hpp"

#include <stdexcept>

namespace bonding_curve {

using Math = curve_math::Math64;

Amount parse_amount(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("empty amount");
    }
    Amount value = 0;
    for (char ch : text) {
        if (ch < '0' || ch > '9') {
            throw std::invalid_argument("amount must be a non-negative decimal integer: " + text);
        }
        value = Math::add(Math::mul(value, 10), static_cast<Amount>(ch - '0'));
    }
    return value;
}

uint16_t parse_fee_bps(uint64_t raw) {
    if (raw > MAX_PLATFORM_FEE_BPS) {
        throw CurveError(ErrorCode::InvalidPlatformFee, std::to_string(raw) + " bps");
    }
    return static_cast<uint16_t>(raw);
}

} // namespace bonding_curve

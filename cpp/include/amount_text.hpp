#pragma once

#include <string>
#include "curve_types.hpp"

namespace bonding_curve {

// Base-10 amount as carried in JSON inputs. Digits only: a sign, whitespace or
// any other character throws std::invalid_argument, values above 2^64-1 throw
// CurveError(MathOverflow).
Amount parse_amount(const std::string& text);

// Fee in basis points read from a wide input field. Range-checked against
// MAX_PLATFORM_FEE_BPS before narrowing.
uint16_t parse_fee_bps(uint64_t raw);

} // namespace bonding_curve

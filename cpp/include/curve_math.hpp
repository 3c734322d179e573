#ifndef CURVE_MATH_HPP
#define CURVE_MATH_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <limits>
#include "curve_errors.hpp"

namespace curve_math {

using uint128 = boost::multiprecision::uint128_t;
using bonding_curve::CurveError;
using bonding_curve::ErrorCode;

// Wide intermediate for each stored width. Products of two stored values
// always fit the wide type, so mul_wide cannot fail.
template <typename T>
struct WideTraits;

template <>
struct WideTraits<uint64_t> {
    using Wide = uint128;
    static uint64_t to_narrow(const Wide& w) { return w.convert_to<uint64_t>(); }
};

template <>
struct WideTraits<uint32_t> {
    using Wide = uint64_t;
    static uint32_t to_narrow(Wide w) { return static_cast<uint32_t>(w); }
};

// Checked arithmetic over stored values of type T with a wide intermediate.
// Every operation throws CurveError instead of wrapping or truncating.
template <typename T>
class CheckedMath {
public:
    using Traits = WideTraits<T>;
    using Wide = typename Traits::Wide;

    static T max_value() { return std::numeric_limits<T>::max(); }
    static Wide max_wide() { return std::numeric_limits<Wide>::max(); }

    static T add(T a, T b) {
        if (a > max_value() - b) throw CurveError(ErrorCode::MathOverflow);
        return a + b;
    }

    static T sub(T a, T b) {
        if (b > a) throw CurveError(ErrorCode::MathUnderflow);
        return a - b;
    }

    static T mul(T a, T b) {
        if (a != 0 && b > max_value() / a) throw CurveError(ErrorCode::MathOverflow);
        return a * b;
    }

    static T div(T a, T b) {
        if (b == 0) throw CurveError(ErrorCode::DivisionByZero);
        return a / b;
    }

    static Wide widen(T a) { return Wide(a); }

    static T narrow(const Wide& w) {
        if (w > Wide(max_value())) throw CurveError(ErrorCode::MathOverflow);
        return Traits::to_narrow(w);
    }

    static Wide mul_wide(T a, T b) { return widen(a) * widen(b); }

    static Wide wide_add(const Wide& a, const Wide& b) {
        if (a > max_wide() - b) throw CurveError(ErrorCode::MathOverflow);
        return a + b;
    }

    static Wide wide_sub(const Wide& a, const Wide& b) {
        if (b > a) throw CurveError(ErrorCode::MathUnderflow);
        return a - b;
    }

    static Wide wide_mul(const Wide& a, const Wide& b) {
        if (a != 0 && b > max_wide() / a) throw CurveError(ErrorCode::MathOverflow);
        return a * b;
    }

    static Wide wide_div(const Wide& a, const Wide& b) {
        if (b == 0) throw CurveError(ErrorCode::DivisionByZero);
        return a / b;
    }

    // a * b / c, multiplied in the wide type and truncated toward zero
    static T mul_div(T a, T b, T c) {
        return narrow(wide_div(mul_wide(a, b), widen(c)));
    }

    // a * b / c rounded up; used only where the caller must not be undercharged
    static T mul_div_up(T a, T b, T c) {
        if (c == 0) throw CurveError(ErrorCode::DivisionByZero);
        Wide num = mul_wide(a, b);
        Wide q = num / widen(c);
        if (q * widen(c) != num) q = wide_add(q, Wide(1));
        return narrow(q);
    }
};

using Math64 = CheckedMath<uint64_t>;

} // namespace curve_math

#endif // CURVE_MATH_HPP

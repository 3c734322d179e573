#include <boost/test/unit_test.hpp>

#include "curve_math.hpp"
#include "test_fixtures.hpp"

#include <cstdint>
#include <limits>

using namespace bonding_curve;
using namespace bonding_curve::testing;
using curve_math::CheckedMath;
using curve_math::Math64;

BOOST_AUTO_TEST_SUITE(curve_math_tests)

BOOST_AUTO_TEST_CASE(add_sub_mul_checked) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();

    BOOST_CHECK_EQUAL(Math64::add(2, 3), 5u);
    BOOST_CHECK_EQUAL(Math64::add(max - 1, 1), max);
    BOOST_CHECK_EXCEPTION(Math64::add(max, 1), CurveError, has_code{ErrorCode::MathOverflow});

    BOOST_CHECK_EQUAL(Math64::sub(5, 5), 0u);
    BOOST_CHECK_EXCEPTION(Math64::sub(4, 5), CurveError, has_code{ErrorCode::MathUnderflow});

    BOOST_CHECK_EQUAL(Math64::mul(0, max), 0u);
    BOOST_CHECK_EQUAL(Math64::mul(1u << 31, 2), 1ull << 32);
    BOOST_CHECK_EXCEPTION(Math64::mul(1ull << 32, 1ull << 32), CurveError, has_code{ErrorCode::MathOverflow});
}

BOOST_AUTO_TEST_CASE(division_by_zero) {
    BOOST_CHECK_EQUAL(Math64::div(7, 2), 3u);
    BOOST_CHECK_EXCEPTION(Math64::div(7, 0), CurveError, has_code{ErrorCode::DivisionByZero});
    BOOST_CHECK_EXCEPTION(Math64::mul_div(7, 3, 0), CurveError, has_code{ErrorCode::DivisionByZero});
    BOOST_CHECK_EXCEPTION(Math64::mul_div_up(7, 3, 0), CurveError, has_code{ErrorCode::DivisionByZero});
}

BOOST_AUTO_TEST_CASE(mul_div_uses_wide_intermediate) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();

    // max * max overflows 64 bits but the quotient fits
    BOOST_CHECK_EQUAL(Math64::mul_div(max, max, max), max);
    BOOST_CHECK_EQUAL(Math64::mul_div(DEFAULT_VIRTUAL_BASE_RESERVE, DEFAULT_VIRTUAL_ASSET_RESERVE,
                                      DEFAULT_VIRTUAL_ASSET_RESERVE),
                      DEFAULT_VIRTUAL_BASE_RESERVE);

    // Quotient that does not fit is reported, not truncated
    BOOST_CHECK_EXCEPTION(Math64::mul_div(max, 2, 1), CurveError, has_code{ErrorCode::MathOverflow});
}

BOOST_AUTO_TEST_CASE(mul_div_rounding) {
    BOOST_CHECK_EQUAL(Math64::mul_div(10, 3, 4), 7u);
    BOOST_CHECK_EQUAL(Math64::mul_div_up(10, 3, 4), 8u);
    BOOST_CHECK_EQUAL(Math64::mul_div_up(12, 3, 4), 9u);
    BOOST_CHECK_EQUAL(Math64::mul_div(0, 3, 4), 0u);
    BOOST_CHECK_EQUAL(Math64::mul_div_up(0, 3, 4), 0u);
}

BOOST_AUTO_TEST_CASE(wide_operations) {
    using Wide = Math64::Wide;
    Wide k = Math64::mul_wide(DEFAULT_VIRTUAL_BASE_RESERVE, DEFAULT_VIRTUAL_ASSET_RESERVE);
    BOOST_CHECK(k == Wide("32190000000000000000000000"));

    BOOST_CHECK(Math64::wide_div(k, Math64::widen(DEFAULT_VIRTUAL_BASE_RESERVE)) ==
                Math64::widen(DEFAULT_VIRTUAL_ASSET_RESERVE));
    BOOST_CHECK_EXCEPTION(Math64::wide_sub(Wide(1), Wide(2)), CurveError, has_code{ErrorCode::MathUnderflow});
    BOOST_CHECK_EXCEPTION(Math64::wide_div(k, Wide(0)), CurveError, has_code{ErrorCode::DivisionByZero});
    BOOST_CHECK_EXCEPTION(Math64::wide_add(Math64::max_wide(), Wide(1)), CurveError,
                          has_code{ErrorCode::MathOverflow});
    BOOST_CHECK_EXCEPTION(Math64::wide_mul(Math64::max_wide(), Wide(2)), CurveError,
                          has_code{ErrorCode::MathOverflow});
    BOOST_CHECK_EXCEPTION(Math64::narrow(k), CurveError, has_code{ErrorCode::MathOverflow});
}

BOOST_AUTO_TEST_CASE(narrow_width_instantiation) {
    using Math32 = CheckedMath<uint32_t>;
    const uint32_t max = std::numeric_limits<uint32_t>::max();

    BOOST_CHECK_EQUAL(Math32::mul_div(max, max, max), max);
    BOOST_CHECK_EXCEPTION(Math32::add(max, 1), CurveError, has_code{ErrorCode::MathOverflow});
    BOOST_CHECK_EXCEPTION(Math32::mul_div(max, 3, 2), CurveError, has_code{ErrorCode::MathOverflow});
}

BOOST_AUTO_TEST_SUITE_END()

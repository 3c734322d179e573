#include <boost/test/unit_test.hpp>

#include "curve_math.hpp"
#include "pricing.hpp"
#include "test_fixtures.hpp"

#include <map>
#include <random>
#include <string>

using namespace bonding_curve;
using namespace bonding_curve::testing;
using curve_math::Math64;

namespace {

Math64::Wide product(const CurveState& c) {
    return Math64::mul_wide(c.virtual_base_reserve, c.virtual_asset_reserve);
}

} // namespace

BOOST_AUTO_TEST_SUITE(settlement_tests)

// ------------------------------------ buy ------------------------------------

BOOST_AUTO_TEST_CASE(buy_one_base_unit_at_default_fee) {
    CurveState c = make_curve();
    GlobalPolicy p = make_policy();

    TradeResult r = Settlement::buy(c, p, request("alice", 1000000000, 0, 2000));
    BOOST_CHECK(r.is_buy());
    BOOST_CHECK_EQUAL(r.asset_id, "MINT");
    BOOST_CHECK_EQUAL(r.trader_id, "alice");
    BOOST_CHECK_EQUAL(r.gross_base, 1000000000u);
    BOOST_CHECK_EQUAL(r.fee, 10000000u);
    BOOST_CHECK_EQUAL(r.net_base, 990000000u);
    BOOST_CHECK_EQUAL(r.asset_amount, 34277831558568u);
    BOOST_CHECK_EQUAL(r.price, 29834u);
    BOOST_CHECK_EQUAL(r.market_cap, 29834000000u);
    BOOST_CHECK_EQUAL(r.timestamp, 2000);

    BOOST_CHECK_EQUAL(c.virtual_base_reserve, 30990000000u);
    BOOST_CHECK_EQUAL(c.virtual_asset_reserve, 1038722168441432u);
    BOOST_CHECK_EQUAL(c.real_base_reserve, 990000000u);
    BOOST_CHECK_EQUAL(c.real_asset_reserve, INITIAL_REAL_ASSET_RESERVE - 34277831558568u);
    BOOST_CHECK_EQUAL(c.assets_sold, 34277831558568u);
    BOOST_CHECK_EQUAL(r.virtual_base_reserve, c.virtual_base_reserve);
    BOOST_CHECK_EQUAL(r.real_asset_reserve, c.real_asset_reserve);

    BOOST_CHECK(product(c) <= product(make_curve()));
    BOOST_CHECK(product(c) == Math64::Wide("32189999999999977680000000"));
}

BOOST_AUTO_TEST_CASE(buy_rejections_in_order) {
    CurveState c = make_curve();
    GlobalPolicy p = make_policy();

    GlobalPolicy paused = p;
    paused.paused = true;
    // Paused wins over an undersized amount
    BOOST_CHECK_EXCEPTION(Settlement::buy(c, paused, request("a", 1)), CurveError,
                          has_code{ErrorCode::ProtocolPaused});

    BOOST_CHECK_EXCEPTION(Settlement::buy(c, p, request("a", MIN_TRADE_AMOUNT - 1)), CurveError,
                          has_code{ErrorCode::TradeTooSmall});
    BOOST_CHECK_NO_THROW(Settlement::buy(c, p, request("a", MIN_TRADE_AMOUNT)));

    CurveState g = make_curve();
    g.graduated = true;
    g.real_base_reserve = 0;
    g.real_asset_reserve = 0;
    BOOST_CHECK_EXCEPTION(Settlement::buy(g, p, request("a", 1000000000)), CurveError,
                          has_code{ErrorCode::AlreadyGraduated});

    CurveState empty = make_curve();
    empty.real_asset_reserve = 0;
    empty.assets_sold = INITIAL_REAL_ASSET_RESERVE;
    BOOST_CHECK_EXCEPTION(Settlement::buy(empty, p, request("a", 1000000000)), CurveError,
                          has_code{ErrorCode::NoLiquidity});
}

BOOST_AUTO_TEST_CASE(buy_slippage_boundary) {
    GlobalPolicy p = make_policy();

    CurveState c = make_curve();
    BOOST_CHECK_EXCEPTION(Settlement::buy(c, p, request("a", 1000000000, 34277831558569u)), CurveError,
                          has_code{ErrorCode::SlippageExceeded});
    BOOST_CHECK(c == make_curve());

    TradeResult r = Settlement::buy(c, p, request("a", 1000000000, 34277831558568u));
    BOOST_CHECK_EQUAL(r.asset_amount, 34277831558568u);
}

BOOST_AUTO_TEST_CASE(buy_past_allocation_is_clamped) {
    CurveState c = make_curve();
    GlobalPolicy p = make_policy(0);

    TradeResult r = Settlement::buy(c, p, request("whale", 100000000000ull));
    BOOST_CHECK_EQUAL(r.asset_amount, INITIAL_REAL_ASSET_RESERVE);
    BOOST_CHECK_EQUAL(c.real_asset_reserve, 0u);
    BOOST_CHECK_EQUAL(c.assets_sold, INITIAL_REAL_ASSET_RESERVE);
    BOOST_CHECK_EQUAL(c.real_base_reserve, 100000000000ull);
    BOOST_CHECK_NO_THROW(check_invariants(c));

    BOOST_CHECK_EXCEPTION(Settlement::buy(c, p, request("late", 1000000000)), CurveError,
                          has_code{ErrorCode::NoLiquidity});
}

// ------------------------------------ sell -----------------------------------

BOOST_AUTO_TEST_CASE(sell_back_after_buy) {
    CurveState c = make_curve();
    GlobalPolicy p = make_policy();
    TradeResult b = Settlement::buy(c, p, request("alice", 1000000000));

    TradeResult s = Settlement::sell(c, p, request("alice", b.asset_amount, 0, 3000));
    BOOST_CHECK(!s.is_buy());
    BOOST_CHECK_EQUAL(s.asset_amount, b.asset_amount);
    // Clamped to the base the curve actually holds
    BOOST_CHECK_EQUAL(s.gross_base, 990000000u);
    BOOST_CHECK_EQUAL(s.fee, 9900000u);
    BOOST_CHECK_EQUAL(s.net_base, 980100000u);
    BOOST_CHECK_EQUAL(s.timestamp, 3000);

    BOOST_CHECK_EQUAL(c.real_base_reserve, 0u);
    BOOST_CHECK_EQUAL(c.real_asset_reserve, INITIAL_REAL_ASSET_RESERVE);
    BOOST_CHECK_EQUAL(c.assets_sold, 0u);
    BOOST_CHECK_NO_THROW(check_invariants(c));
}

BOOST_AUTO_TEST_CASE(sell_rejections_in_order) {
    GlobalPolicy p = make_policy();
    CurveState c = make_curve();

    GlobalPolicy paused = p;
    paused.paused = true;
    BOOST_CHECK_EXCEPTION(Settlement::sell(c, paused, request("a", 0)), CurveError,
                          has_code{ErrorCode::ProtocolPaused});
    BOOST_CHECK_EXCEPTION(Settlement::sell(c, p, request("a", 0)), CurveError,
                          has_code{ErrorCode::ZeroAmount});
    // Nothing bought yet
    BOOST_CHECK_EXCEPTION(Settlement::sell(c, p, request("a", 1000)), CurveError,
                          has_code{ErrorCode::NoLiquidity});

    CurveState g = make_curve();
    g.graduated = true;
    g.real_asset_reserve = 0;
    BOOST_CHECK_EXCEPTION(Settlement::sell(g, p, request("a", 1000)), CurveError,
                          has_code{ErrorCode::AlreadyGraduated});
}

BOOST_AUTO_TEST_CASE(sell_slippage_and_oversell_leave_state_untouched) {
    GlobalPolicy p = make_policy();
    CurveState c = make_curve();
    TradeResult b = Settlement::buy(c, p, request("alice", 1000000000));
    const CurveState before = c;

    BOOST_CHECK_EXCEPTION(Settlement::sell(c, p, request("alice", b.asset_amount, 980100001)), CurveError,
                          has_code{ErrorCode::SlippageExceeded});
    BOOST_CHECK(c == before);

    // More asset than was ever sold by the curve
    BOOST_CHECK_EXCEPTION(Settlement::sell(c, p, request("alice", b.asset_amount * 2)), CurveError,
                          has_code{ErrorCode::MathUnderflow});
    BOOST_CHECK(c == before);

    BOOST_CHECK_NO_THROW(Settlement::sell(c, p, request("alice", b.asset_amount, 980100000)));
}

BOOST_AUTO_TEST_CASE(plan_does_not_touch_input) {
    GlobalPolicy p = make_policy();
    const CurveState c = make_curve();

    TradePlan plan = Settlement::plan_buy(c, p, request("a", 5000000000ull));
    BOOST_CHECK(c == make_curve());
    BOOST_CHECK_EQUAL(plan.next.assets_sold, plan.result.asset_amount);
    BOOST_CHECK_EQUAL(plan.next.real_base_reserve, plan.result.net_base);
}

// ------------------------------------ fees -----------------------------------

BOOST_AUTO_TEST_CASE(higher_fee_never_pays_more) {
    Amount prev_out = 0;
    Amount prev_net_in = 0;
    Amount prev_net = 0;
    bool first = true;
    for (uint16_t bps = 0; bps <= MAX_PLATFORM_FEE_BPS; bps += 50) {
        GlobalPolicy p = make_policy(bps);

        CurveState c = make_curve();
        TradeResult b = Settlement::buy(c, p, request("a", 3000000000ull));
        // Seed another trader so the sell is not clamped by real base
        CurveState seeded = make_curve();
        Settlement::buy(seeded, make_policy(0), request("seed", 20000000000ull));
        TradeResult s = Settlement::sell(seeded, p, request("seed", 100000000000000ull));

        BOOST_CHECK_EQUAL(b.fee + b.net_base, b.gross_base);
        BOOST_CHECK_EQUAL(s.fee + s.net_base, s.gross_base);
        if (!first) {
            // Each 50 bps step takes a larger fee from the same gross
            BOOST_CHECK_LT(b.net_base, prev_net_in);
            BOOST_CHECK_LT(b.asset_amount, prev_out);
            BOOST_CHECK_LT(s.net_base, prev_net);
        }
        prev_out = b.asset_amount;
        prev_net_in = b.net_base;
        prev_net = s.net_base;
        first = false;
    }
}

BOOST_AUTO_TEST_CASE(round_trip_never_profits) {
    for (uint16_t bps : {0, 1, 100, 1000}) {
        for (Amount x : {1000000ull, 777777777ull, 1000000000ull, 12345678901ull}) {
            GlobalPolicy p = make_policy(bps);

            // Fresh curve
            CurveState c = make_curve();
            TradeResult b = Settlement::buy(c, p, request("rt", x));
            TradeResult s = Settlement::sell(c, p, request("rt", b.asset_amount));
            BOOST_CHECK_LE(s.net_base, x);

            // Curve already holding someone else's base
            CurveState d = make_curve();
            Settlement::buy(d, p, request("other", 7000000000ull));
            b = Settlement::buy(d, p, request("rt", x));
            s = Settlement::sell(d, p, request("rt", b.asset_amount));
            // Truncation can hand back at most one unit above the net deposit
            BOOST_CHECK_LE(s.gross_base, b.net_base + 1);
            if (bps > 0) {
                BOOST_CHECK_LT(s.net_base, x);
            } else {
                BOOST_CHECK_LE(s.net_base, x + 1);
            }
        }
    }
}

// ------------------------------ random sequences ------------------------------

BOOST_AUTO_TEST_CASE(random_sequence_keeps_invariants_and_conserves) {
    std::mt19937_64 rng(20240611);
    GlobalPolicy p = make_policy(100);
    CurveState c = make_curve();
    const CurveState start = c;

    std::map<std::string, Amount> holdings;
    const std::string traders[] = {"t0", "t1", "t2", "t3"};

    Amount base_in = 0;     // net deposited by buys
    Amount base_out = 0;    // gross released by sells
    Amount asset_out = 0;
    Amount asset_in = 0;
    int accepted = 0;

    for (int step = 0; step < 1500; ++step) {
        const std::string& who = traders[rng() % 4];
        const CurveState before = c;
        try {
            if (rng() % 2 == 0 || holdings[who] == 0) {
                Amount gross = MIN_TRADE_AMOUNT + rng() % 200000000ull;
                TradeResult r = Settlement::buy(c, p, request(who, gross));
                holdings[who] += r.asset_amount;
                base_in += r.net_base;
                asset_out += r.asset_amount;
                if (c.real_asset_reserve > 0) {
                    BOOST_CHECK(product(c) <= product(before));
                }
            } else {
                Amount amount = 1 + rng() % holdings[who];
                TradeResult r = Settlement::sell(c, p, request(who, amount));
                holdings[who] -= amount;
                base_out += r.gross_base;
                asset_in += amount;
                if (c.real_base_reserve > 0) {
                    BOOST_CHECK(product(c) <= product(before));
                }
            }
            ++accepted;
        } catch (const CurveError& e) {
            BOOST_CHECK(is_retryable(e.code()) || e.code() == ErrorCode::NoLiquidity);
            BOOST_CHECK(c == before);
        }
        BOOST_REQUIRE_NO_THROW(check_invariants(c));
    }

    BOOST_CHECK_GT(accepted, 1000);
    BOOST_CHECK_EQUAL(c.real_base_reserve, base_in - base_out);
    BOOST_CHECK_EQUAL(c.real_asset_reserve, (start.real_asset_reserve + asset_in) - asset_out);

    Amount held = 0;
    for (const auto& kv : holdings) held += kv.second;
    BOOST_CHECK_EQUAL(held, c.assets_sold);
}

BOOST_AUTO_TEST_SUITE_END()

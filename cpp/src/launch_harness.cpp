// Launch harness: replays action sequences against many curves in parallel
// -------------------------------------------------------------------------
// - Loads a launches file (policy + assets) and a sequences file once.
// - Every launch runs its sequence on a worker thread; curves share one
//   CurveBook, so per-asset locking and policy snapshots are exercised.
// - Writes one JSON result per launch with state snapshots and the events
//   the book emitted.
//
#include <boost/json.hpp>
#include <boost/json/src.hpp>

#include "amount_text.hpp"
#include "curve_book.hpp"
#include "curve_errors.hpp"
#include "memory_ledger.hpp"
#include "pricing.hpp"
#include "recording_sink.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace bonding_curve;
namespace json = boost::json;

namespace {

std::mutex io_mu;

bool trace_enabled() {
    const char* t = std::getenv("TRACE");
    return t && std::string(t) == "1";
}

std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("Cannot open " + path);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Amounts travel as decimal strings; small values may be plain integers.
Amount parse_amount(const json::value& v) {
    if (v.is_string()) return bonding_curve::parse_amount(std::string(v.as_string().c_str()));
    if (v.is_uint64()) return v.as_uint64();
    if (v.is_int64() && v.as_int64() >= 0) return static_cast<Amount>(v.as_int64());
    throw std::invalid_argument("amount must be a non-negative integer or decimal string");
}

std::string get_string(const json::object& o, const char* key, const std::string& fallback = "") {
    if (!o.if_contains(key)) return fallback;
    return std::string(o.at(key).as_string().c_str());
}

Amount get_amount(const json::object& o, const char* key, Amount fallback) {
    return o.if_contains(key) ? parse_amount(o.at(key)) : fallback;
}

std::string to_str(Amount v) { return std::to_string(v); }

// ------------------------------ JSON reports ------------------------------

json::object to_json(const CurveState& c, Amount total_supply) {
    json::object o;
    o["asset_id"] = c.asset_id;
    o["creator"] = c.creator_id;
    o["virtual_base_reserve"] = to_str(c.virtual_base_reserve);
    o["virtual_asset_reserve"] = to_str(c.virtual_asset_reserve);
    o["real_base_reserve"] = to_str(c.real_base_reserve);
    o["real_asset_reserve"] = to_str(c.real_asset_reserve);
    o["assets_sold"] = to_str(c.assets_sold);
    o["graduated"] = c.graduated;
    o["price"] = to_str(PricingEngine::current_price(c));
    o["market_cap"] = to_str(PricingEngine::market_cap(c, total_supply));
    o["progress_bps"] = to_str(PricingEngine::graduation_progress_bps(c));
    o["created_at"] = c.created_at;
    o["graduated_at"] = c.graduated_at;
    return o;
}

json::object to_json(const TradeResult& t) {
    json::object o;
    o["mint"] = t.asset_id;
    o["trader"] = t.trader_id;
    o["is_buy"] = t.is_buy();
    o["gross_amount"] = to_str(t.gross_base);
    o["net_amount"] = to_str(t.net_base);
    o["fee"] = to_str(t.fee);
    o["asset_amount"] = to_str(t.asset_amount);
    o["virtual_base_reserve"] = to_str(t.virtual_base_reserve);
    o["virtual_asset_reserve"] = to_str(t.virtual_asset_reserve);
    o["real_base_reserve"] = to_str(t.real_base_reserve);
    o["real_asset_reserve"] = to_str(t.real_asset_reserve);
    o["price"] = to_str(t.price);
    o["market_cap"] = to_str(t.market_cap);
    o["timestamp"] = t.timestamp;
    return o;
}

json::object to_json(const GraduationResult& g) {
    json::object o;
    o["mint"] = g.asset_id;
    o["creator"] = g.creator_id;
    o["final_market_cap"] = to_str(g.final_market_cap);
    o["liquidity_base"] = to_str(g.liquidity_base);
    o["liquidity_asset"] = to_str(g.liquidity_asset);
    o["creator_reward"] = to_str(g.creator_reward);
    o["platform_fee"] = to_str(g.platform_fee);
    o["rounding_remainder"] = to_str(g.rounding_remainder);
    o["timestamp"] = g.timestamp;
    return o;
}

// Liquidity migration is downstream of this harness; it only reports the hand-off.
class ConsoleMigrator : public LiquidityMigrator {
public:
    void migrate(const GraduationResult& g) override {
        std::lock_guard<std::mutex> lk(io_mu);
        std::cout << "Migrating " << g.asset_id
                  << " base=" << g.liquidity_base
                  << " asset=" << g.liquidity_asset << std::endl;
    }
};

GlobalPolicy policy_from_json(const json::object& o) {
    uint16_t fee_bps = parse_fee_bps(get_amount(o, "platform_fee_bps", DEFAULT_PLATFORM_FEE_BPS));
    GlobalPolicy policy = initialize_policy(get_string(o, "authority"), get_string(o, "fee_recipient"), fee_bps);
    if (o.if_contains("paused") && o.at("paused").as_bool()) {
        update_policy(policy, policy.authority, PolicyUpdate{std::nullopt, std::nullopt, true});
    }
    return policy;
}

} // namespace

// ------------------------------ Per-launch run ------------------------------

static void run_sequence(
    CurveBook& book,
    MemoryLedger& ledger,
    const AssetId& asset_id,
    const json::object& sequence,
    Timestamp start,
    size_t snapshot_every,
    json::object& res
) {
    const bool trace = trace_enabled();
    const Amount supply = book.descriptor(asset_id).total_supply;
    Timestamp now = start;

    if (sequence.if_contains("funding")) {
        for (const auto& kv : sequence.at("funding").as_object()) {
            ledger.deposit_base(std::string(kv.key()), parse_amount(kv.value()));
        }
    }

    json::array states;
    if (snapshot_every != 0) states.push_back(to_json(book.curve(asset_id), supply));

    size_t action_idx = 0;
    for (const auto& a : sequence.at("actions").as_array()) {
        const auto& act = a.as_object();
        bool success = true;
        std::string error;
        std::string code;
        bool retryable = false;
        try {
            std::string type = get_string(act, "type");
            if (type == "buy" || type == "sell") {
                TradeRequest req;
                req.trader_id = get_string(act, "trader");
                req.min_out = get_amount(act, "min_out", 0);
                req.now = now;
                if (type == "sell" && act.if_contains("amount") && act.at("amount").is_string() &&
                    act.at("amount").as_string() == "all") {
                    req.amount = ledger.asset_balance(asset_id, req.trader_id);
                } else {
                    req.amount = get_amount(act, "amount", 0);
                }
                TradeResult r = (type == "buy") ? book.buy(asset_id, req) : book.sell(asset_id, req);
                if (trace) {
                    std::lock_guard<std::mutex> lk(io_mu);
                    std::cout << "TRACE " << to_string(r.side) << " asset=" << asset_id
                              << " gross=" << r.gross_base << " fee=" << r.fee
                              << " net=" << r.net_base << " asset_amount=" << r.asset_amount
                              << " price=" << r.price << "\n";
                }
            } else if (type == "graduate") {
                (void)book.graduate(asset_id, now);
            } else if (type == "time_travel") {
                if (act.if_contains("seconds")) now += act.at("seconds").as_int64();
                else if (act.if_contains("timestamp")) now = act.at("timestamp").as_int64();
            } else {
                throw std::invalid_argument("unknown action type: " + type);
            }
        } catch (const CurveError& e) {
            success = false; error = e.what(); code = std::to_string(static_cast<int>(e.code()));
            retryable = is_retryable(e.code());
        } catch (const std::exception& e) {
            success = false; error = e.what();
        }

        bool last = (action_idx + 1 == sequence.at("actions").as_array().size());
        if (snapshot_every != 0 && (((action_idx + 1) % snapshot_every) == 0 || last)) {
            auto st = to_json(book.curve(asset_id), supply);
            st["action_success"] = success;
            if (!success) {
                st["error"] = error;
                if (!code.empty()) st["error_code"] = code;
                st["retryable"] = retryable;
            }
            states.push_back(st);
        }
        ++action_idx;
    }

    if (snapshot_every == 0) {
        res["final_state"] = to_json(book.curve(asset_id), supply);
    } else {
        res["states"] = states;
    }
}

int run_harness(const std::string& launches_file, const std::string& sequences_file, const std::string& output_file) {
    try {
        json::object cfg = json::parse(read_file(launches_file)).as_object();
        json::array launches = cfg.at("launches").as_array();
        json::array seqs = json::parse(read_file(sequences_file)).as_object().at("sequences").as_array();
        if (seqs.empty()) throw std::runtime_error("No sequences found");

        // Snapshot controls via env
        bool save_last_only = false;
        size_t snapshot_every = 1;
        if (const char* slo = std::getenv("SAVE_LAST_ONLY")) {
            if (std::string(slo) == "1") save_last_only = true;
        }
        if (const char* se = std::getenv("SNAPSHOT_EVERY")) {
            try {
                long v = std::stol(se);
                snapshot_every = v <= 0 ? 0 : static_cast<size_t>(v);
            } catch (const std::exception&) {
                std::cerr << "Ignoring SNAPSHOT_EVERY=" << se << std::endl;
            }
        }
        if (save_last_only) snapshot_every = 0;

        size_t threads = std::max<size_t>(1, std::thread::hardware_concurrency());
        if (const char* thr = std::getenv("CPP_THREADS")) {
            try {
                threads = std::max<size_t>(1, std::stoul(thr));
            } catch (const std::exception&) {
                std::cerr << "Ignoring CPP_THREADS=" << thr << std::endl;
            }
        }

        MemoryLedger ledger;
        RecordingSink sink;
        ConsoleMigrator migrator;
        CurveBook book(policy_from_json(cfg.at("policy").as_object()), ledger, &sink, &migrator);

        std::vector<json::object> results(launches.size());
        std::atomic<size_t> next{0};

        auto worker = [&]() {
            for (;;) {
                size_t idx = next.fetch_add(1);
                if (idx >= launches.size()) break;
                const auto& launch = launches[idx].as_object();

                json::object tr;
                json::object res;
                std::string asset_id = get_string(launch, "asset_id");
                tr["asset_id"] = asset_id;
                try {
                    // Pick the named sequence, else the first one
                    const json::object* sequence = &seqs[0].as_object();
                    std::string wanted = get_string(launch, "sequence");
                    for (const auto& s : seqs) {
                        if (!wanted.empty() && get_string(s.as_object(), "name") == wanted) {
                            sequence = &s.as_object();
                        }
                    }
                    tr["sequence"] = get_string(*sequence, "name");
                    {
                        std::lock_guard<std::mutex> lk(io_mu);
                        std::cout << "Processing " << asset_id << "..." << std::endl;
                    }

                    AssetDescriptor d;
                    d.asset_id = asset_id;
                    d.name = get_string(launch, "name");
                    d.symbol = get_string(launch, "symbol");
                    d.uri = get_string(launch, "uri");
                    d.total_supply = get_amount(launch, "total_supply", TOTAL_SUPPLY);

                    Timestamp start = sequence->if_contains("start_timestamp")
                        ? sequence->at("start_timestamp").as_int64() : 0;
                    book.launch(d, get_string(launch, "creator"), start,
                                get_amount(launch, "virtual_base", DEFAULT_VIRTUAL_BASE_RESERVE),
                                get_amount(launch, "virtual_asset", DEFAULT_VIRTUAL_ASSET_RESERVE));

                    run_sequence(book, ledger, asset_id, *sequence, start, snapshot_every, res);

                    json::array events;
                    for (const auto& t : sink.trades_for(asset_id)) events.push_back(to_json(t));
                    for (const auto& g : sink.graduations()) {
                        if (g.asset_id == asset_id) events.push_back(to_json(g));
                    }
                    res["events"] = events;
                    res["success"] = true;
                } catch (const std::exception& e) {
                    // Per-launch failure should not bring down the whole harness
                    res["success"] = false;
                    res["error"] = e.what();
                    std::lock_guard<std::mutex> lk(io_mu);
                    std::cerr << "Launch " << asset_id << " failed: " << e.what() << std::endl;
                }
                tr["result"] = res;
                results[idx] = std::move(tr);
            }
        };

        std::vector<std::thread> ws;
        ws.reserve(threads);
        for (size_t t = 0; t < threads; ++t) ws.emplace_back(worker);
        for (auto& th : ws) th.join();

        json::array out;
        for (auto& r : results) out.push_back(r);

        GlobalPolicy final_policy = book.policy();
        json::object O;
        O["results"] = out;
        O["metadata"] = json::object{
            {"launches_file", launches_file},
            {"sequences_file", sequences_file},
            {"total_assets_launched", final_policy.total_assets_launched},
            {"total_volume", to_str(final_policy.total_volume)},
            {"ledger_total_base", to_str(ledger.total_base())},
        };
        std::ofstream of(output_file);
        of << json::serialize(O) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <launches.json> <sequences.json> <output.json>" << std::endl;
        return 1;
    }
    return run_harness(argv[1], argv[2], argv[3]);
}

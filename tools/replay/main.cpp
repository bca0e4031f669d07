// lxledger-replay
//
// Replays a JSON operation script against a fresh ledger backed by an
// in-memory bank and prints each operation status and every emitted event
// as one JSON line.

#include <lxledger/ledger.hpp>
#include <lxledger/log.hpp>
#include <lxledger/math.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace lxledger;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string script_path;
    bool verbose = false;
};

void print_usage(const char* prog) {
    std::cout << "LX Ledger operation replay\n\n"
              << "Usage: " << prog << " [options] <config.json> <script.json>\n\n"
              << "Options:\n"
              << "  -v, --verbose        Log rejected operations (debug level)\n"
              << "  -h, --help           Show this help message\n\n"
              << "Script format:\n"
              << "  {\"mint\": [{\"owner\": addr, \"asset\": addr, \"amount\": n}],\n"
              << "   \"ops\":  [{\"op\": \"lend.deposit\", \"caller\": addr, \"block\": n, ...}]}\n\n"
              << "Operations:\n"
              << "  lend.deposit amount            lend.withdraw amount\n"
              << "  lend.borrow amount collateral  lend.repay loan_id amount\n"
              << "  lend.liquidate loan_id         lend.set_oracle_price asset price\n"
              << "  amm.create_pool asset_a asset_b amount_a amount_b\n"
              << "  amm.add_liquidity pool_id amount_a amount_b min_liquidity\n"
              << "  amm.remove_liquidity pool_id liquidity min_a min_b\n"
              << "  amm.swap pool_id amount_in min_amount_out asset_in\n"
              << "  amm.set_fee_rate pool_id fee_rate\n"
              << "  amm.create_farming_pool pool_id reward_per_block start_block end_block\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        std::exit(1);
    }
    options.config_path = positional[0];
    options.script_path = positional[1];
    return options;
}

//------------------------------------------------------------------------------
// Script field access
//------------------------------------------------------------------------------

const json& require(const json& op, const char* key) {
    auto it = op.find(key);
    if (it == op.end()) {
        throw std::invalid_argument(std::string("missing field '") + key + "' in " + op.dump());
    }
    return *it;
}

Address address_arg(const json& op, const char* key) {
    const json& v = require(op, key);
    auto parsed = v.is_string() ? addresses::parse(v.get<std::string>()) : std::nullopt;
    if (!parsed) {
        throw std::invalid_argument(std::string("malformed address in '") + key + "'");
    }
    return *parsed;
}

U128 amount_arg(const json& op, const char* key) {
    const json& v = require(op, key);
    if (v.is_number_unsigned()) return static_cast<U128>(v.get<uint64_t>());
    if (v.is_string()) {
        auto parsed = math::parse_u128(v.get<std::string>());
        if (parsed) return *parsed;
    }
    throw std::invalid_argument(std::string("malformed amount in '") + key + "'");
}

uint64_t id_arg(const json& op, const char* key) {
    const json& v = require(op, key);
    if (!v.is_number_unsigned()) {
        throw std::invalid_argument(std::string("malformed id in '") + key + "'");
    }
    return v.get<uint64_t>();
}

json load_json(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open script file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return json::parse(buffer.str());
}

//------------------------------------------------------------------------------
// Dispatch
//------------------------------------------------------------------------------

int32_t apply(LXLedger& ledger, const std::string& name, const json& op, json& out) {
    TxContext ctx{address_arg(op, "caller"), id_arg(op, "block")};

    if (name == "lend.deposit") {
        return ledger.lend().deposit(ctx, amount_arg(op, "amount"));
    } else if (name == "lend.withdraw") {
        return ledger.lend().withdraw(ctx, amount_arg(op, "amount"));
    } else if (name == "lend.borrow") {
        auto r = ledger.lend().borrow(ctx, amount_arg(op, "amount"), amount_arg(op, "collateral"));
        if (r.status == errors::OK) out["loan_id"] = r.loan_id;
        return r.status;
    } else if (name == "lend.repay") {
        auto r = ledger.lend().repay(ctx, id_arg(op, "loan_id"), amount_arg(op, "amount"));
        if (r.status == errors::OK) out["closed"] = r.loan_closed;
        return r.status;
    } else if (name == "lend.liquidate") {
        return ledger.lend().liquidate(ctx, id_arg(op, "loan_id")).status;
    } else if (name == "lend.set_oracle_price") {
        return ledger.lend().set_oracle_price(ctx, Asset(address_arg(op, "asset")),
                                              amount_arg(op, "price"));
    } else if (name == "amm.create_pool") {
        auto r = ledger.amm().create_pool(ctx, Asset(address_arg(op, "asset_a")),
                                          Asset(address_arg(op, "asset_b")),
                                          amount_arg(op, "amount_a"), amount_arg(op, "amount_b"));
        if (r.status == errors::OK) out["pool_id"] = r.pool_id;
        return r.status;
    } else if (name == "amm.add_liquidity") {
        auto r = ledger.amm().add_liquidity(ctx, id_arg(op, "pool_id"),
                                            amount_arg(op, "amount_a"), amount_arg(op, "amount_b"),
                                            amount_arg(op, "min_liquidity"));
        if (r.status == errors::OK) out["liquidity"] = math::to_string(r.liquidity);
        return r.status;
    } else if (name == "amm.remove_liquidity") {
        return ledger.amm().remove_liquidity(ctx, id_arg(op, "pool_id"),
                                             amount_arg(op, "liquidity"),
                                             amount_arg(op, "min_a"), amount_arg(op, "min_b")).status;
    } else if (name == "amm.swap") {
        auto r = ledger.amm().swap(ctx, id_arg(op, "pool_id"), amount_arg(op, "amount_in"),
                                   amount_arg(op, "min_amount_out"),
                                   Asset(address_arg(op, "asset_in")));
        if (r.status == errors::OK) out["amount_out"] = math::to_string(r.amount_out);
        return r.status;
    } else if (name == "amm.set_fee_rate") {
        return ledger.amm().set_fee_rate(ctx, id_arg(op, "pool_id"), amount_arg(op, "fee_rate"));
    } else if (name == "amm.create_farming_pool") {
        return ledger.amm().create_farming_pool(ctx, id_arg(op, "pool_id"),
                                                amount_arg(op, "reward_per_block"),
                                                id_arg(op, "start_block"),
                                                id_arg(op, "end_block"));
    }

    throw std::invalid_argument("unknown operation: " + name);
}

int run(const Options& options) {
    Config config = Config::from_file(options.config_path);
    if (options.verbose) {
        config.set_log_level("debug");
    }

    json script = load_json(options.script_path);

    InMemoryBank bank;
    MemoryEventSink sink;
    LXLedger ledger(config, bank, &sink);

    if (auto mint = script.find("mint"); mint != script.end()) {
        for (const auto& entry : *mint) {
            bank.mint(address_arg(entry, "owner"), Asset(address_arg(entry, "asset")),
                      amount_arg(entry, "amount"));
        }
    }

    const json& ops = require(script, "ops");
    size_t index = 0;
    for (const auto& op : ops) {
        std::string name = require(op, "op").get<std::string>();
        size_t seen = sink.events().size();

        json out = {{"index", index}, {"op", name}};
        int32_t status = apply(ledger, name, op, out);
        out["status"] = errors::name(status);
        std::cout << out.dump() << "\n";

        for (size_t i = seen; i < sink.events().size(); ++i) {
            std::cout << sink.events()[i].to_json().dump() << "\n";
        }
        ++index;
    }

    auto stats = ledger.get_stats();
    json summary = {
        {"lend", {
            {"total_deposited", math::to_string(stats.lend_stats.total_deposited)},
            {"total_borrowed", math::to_string(stats.lend_stats.total_borrowed)},
            {"active_loans", stats.lend_stats.active_loans},
            {"utilization", math::to_string(ledger.lend().get_utilization_rate())}
        }},
        {"amm", {
            {"total_pools", stats.amm_stats.total_pools},
            {"total_swaps", stats.amm_stats.total_swaps},
            {"total_volume", math::to_string(stats.amm_stats.total_volume)},
            {"total_fees_collected", math::to_string(stats.amm_stats.total_fees_collected)}
        }}
    };
    std::cout << json{{"stats", summary}}.dump() << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        return run(options);
    } catch (const std::exception& e) {
        log::logger()->error("{}", e.what());
        return 1;
    }
}

// LX Ledger - Component Wiring Tests

#include <catch2/catch_test_macros.hpp>
#include <lxledger/ledger.hpp>
#include <lxledger/log.hpp>

#include "test_helpers.hpp"

using namespace lxledger;
using namespace lxledger::testing;

namespace {

Config test_config() {
    Config config;
    config.with_owner(OWNER)
          .with_lending_custodian(LEND_CUSTODIAN)
          .with_amm_custodian(AMM_CUSTODIAN)
          .with_settlement_asset(USD)
          .set_log_level("warn");
    return config;
}

}  // namespace

TEST_CASE("Ledger wiring", "[ledger]") {
    InMemoryBank bank;
    MemoryEventSink sink;
    bank.mint(ALICE, USD, 1000000);
    bank.mint(ALICE, TKA, 1000000);
    bank.mint(BOB, USD, 1000000);

    LXLedger ledger(test_config(), bank, &sink);

    SECTION("Components share the bank and the sink") {
        REQUIRE(ledger.lend().deposit(at(BOB, 1), 50000) == errors::OK);
        REQUIRE(ledger.lend().borrow(at(ALICE, 2), 10000, 20000).status == errors::OK);
        REQUIRE(ledger.amm().create_pool(at(ALICE, 3), TKA, USD, 100000, 100000).status ==
                errors::OK);
        REQUIRE(ledger.amm().swap(at(BOB, 4), 1, 1000, 0, USD).status == errors::OK);

        REQUIRE(sink.events().size() == 4);
        REQUIRE(sink.events()[0].name == "deposit");
        REQUIRE(sink.events()[1].name == "borrow");
        REQUIRE(sink.events()[2].name == "create-pool");
        REQUIRE(sink.events()[3].name == "swap");
        REQUIRE(sink.events()[3].block_height == 4);

        // Custodians are kept apart
        REQUIRE(bank.balance_of(LEND_CUSTODIAN, USD) == 50000 + 20000 - 10000);
        REQUIRE(bank.balance_of(AMM_CUSTODIAN, USD) == 100000 + 1000);
        REQUIRE(bank.balance_of(LEND_CUSTODIAN, TKA) == 0);

        auto stats = ledger.get_stats();
        REQUIRE(stats.lend_stats.total_deposited == 50000);
        REQUIRE(stats.lend_stats.total_borrowed == 10000);
        REQUIRE(stats.lend_stats.active_loans == 1);
        REQUIRE(stats.amm_stats.total_pools == 1);
        REQUIRE(stats.amm_stats.total_swaps == 1);
        REQUIRE(stats.amm_stats.total_volume == 1000);
    }

    SECTION("Configuration reaches both components") {
        REQUIRE(ledger.config().lending.owner == OWNER);
        REQUIRE(ledger.lend().config().custodian == LEND_CUSTODIAN);
        REQUIRE(ledger.amm().config().custodian == AMM_CUSTODIAN);
        REQUIRE(ledger.lend().set_oracle_price(at(OWNER, 1), TKA, 5) == errors::OK);
        REQUIRE(ledger.amm().set_fee_rate(at(OWNER, 1), 1, 5) == errors::NOT_FOUND);
    }

    SECTION("Rejected operations emit nothing") {
        REQUIRE(ledger.lend().withdraw(at(ALICE, 1), 1) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(ledger.amm().swap(at(ALICE, 1), 1, 1, 0, TKA).status == errors::NOT_FOUND);
        REQUIRE(sink.events().empty());
    }

    REQUIRE(std::string(LXLedger::version()) == "1.0.0");
}

TEST_CASE("Event records", "[ledger]") {
    Event event{"repay", 42, {{"loan_id", 3}, {"amount", amount_field(U128_MAX)}}};
    auto j = event.to_json();

    REQUIRE(j["event"] == "repay");
    REQUIRE(j["block"] == 42);
    REQUIRE(j["fields"]["loan_id"] == 3);
    REQUIRE(j["fields"]["amount"] == "340282366920938463463374607431768211455");
    REQUIRE(address_field(BOB) == addresses::to_hex(BOB));

    MemoryEventSink sink;
    REQUIRE(sink.last() == nullptr);
    sink.emit(event);
    REQUIRE(sink.last()->name == "repay");
    sink.clear();
    REQUIRE(sink.events().empty());

    // Log sink formats without throwing
    LogEventSink log_sink;
    REQUIRE_NOTHROW(log_sink.emit(event));
}

TEST_CASE("Log level control", "[ledger]") {
    REQUIRE(log::set_level("debug"));
    REQUIRE(log::logger()->level() == spdlog::level::debug);
    REQUIRE(log::set_level("off"));
    REQUIRE(log::logger()->level() == spdlog::level::off);

    REQUIRE_FALSE(log::set_level("chatty"));
    REQUIRE(log::logger()->level() == spdlog::level::off);

    REQUIRE(log::set_level("warn"));
    REQUIRE(log::logger().get() == log::logger().get());
}

// LX Ledger - AMM Pool Tests

#include <catch2/catch_test_macros.hpp>
#include <lxledger/amm.hpp>
#include <lxledger/math.hpp>

#include "test_helpers.hpp"

#include <memory>
#include <stdexcept>

using namespace lxledger;
using namespace lxledger::testing;

namespace {

struct AmmFixture {
    InMemoryBank bank;
    MemoryEventSink sink;
    AmmConfig config;
    std::unique_ptr<LXAmm> amm;

    AmmFixture() {
        config.owner = OWNER;
        config.custodian = AMM_CUSTODIAN;
        config.default_fee_rate = 30;

        for (const Asset& asset : {TKA, TKB, TKC}) {
            bank.mint(ALICE, asset, 100000000);
            bank.mint(BOB, asset, 100000000);
        }

        amm = std::make_unique<LXAmm>(config, bank, &sink);
    }

    // 1,000,000 / 1,000,000 pool created by ALICE at block 10
    uint64_t seed_pool() {
        auto r = amm->create_pool(at(ALICE, 10), TKA, TKB, 1000000, 1000000);
        REQUIRE(r.status == errors::OK);
        return r.pool_id;
    }

    U128 invariant(uint64_t pool_id) const {
        auto pool = amm->get_pool(pool_id);
        return pool->reserve_a * pool->reserve_b;
    }
};

}  // namespace

TEST_CASE("Create pool", "[amm]") {
    AmmFixture f;

    SECTION("Seeded pool state") {
        auto r = f.amm->create_pool(at(ALICE, 10), TKA, TKB, 1000000, 1000000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.pool_id == 1);
        REQUIRE(r.liquidity == 1000000);

        auto pool = f.amm->get_pool(1);
        REQUIRE(pool.has_value());
        REQUIRE(pool->asset_a == TKA);
        REQUIRE(pool->asset_b == TKB);
        REQUIRE(pool->reserve_a == 1000000);
        REQUIRE(pool->reserve_b == 1000000);
        REQUIRE(pool->total_supply == 1000000);
        REQUIRE(pool->fee_rate == 30);
        REQUIRE(pool->last_price_a == constants::PRECISION);
        REQUIRE(pool->last_price_b == constants::PRECISION);
        REQUIRE(pool->created_at == 10);
        REQUIRE(pool->active);

        REQUIRE(f.amm->get_lp_balance(1, ALICE) == 1000000);
        REQUIRE(f.amm->get_user_pools(ALICE) == std::vector<uint64_t>{1});
        REQUIRE(f.bank.balance_of(AMM_CUSTODIAN, TKA) == 1000000);
        REQUIRE(f.bank.balance_of(AMM_CUSTODIAN, TKB) == 1000000);
        REQUIRE(f.amm->get_protocol_stats().total_pools == 1);
        REQUIRE(f.sink.last()->name == "create-pool");
    }

    SECTION("Asymmetric seed prices") {
        auto r = f.amm->create_pool(at(ALICE, 10), TKA, TKB, 4000000, 1000000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.liquidity == 2000000);
        auto pool = f.amm->get_pool(r.pool_id);
        // reserve_a per unit of b, then reserve_b per unit of a
        REQUIRE(pool->last_price_a == 4000000);
        REQUIRE(pool->last_price_b == 250000);
    }

    SECTION("Rejections") {
        REQUIRE(f.amm->create_pool(at(ALICE, 1), TKA, TKB, 0, 1000).status == errors::INVALID_AMOUNT);
        REQUIRE(f.amm->create_pool(at(ALICE, 1), TKA, TKB, 1000, 0).status == errors::INVALID_AMOUNT);
        REQUIRE(f.amm->create_pool(at(ALICE, 1), TKA, TKA, 1000, 1000).status == errors::INVALID_ASSET);
        // isqrt(999000) = 999
        REQUIRE(f.amm->create_pool(at(ALICE, 1), TKA, TKB, 999, 1000).status ==
                errors::INSUFFICIENT_LIQUIDITY);
        REQUIRE(f.amm->create_pool(at(CAROL, 1), TKA, TKB, 1000, 1000).status ==
                errors::TRANSFER_FAILED);

        REQUIRE(f.amm->get_protocol_stats().total_pools == 0);
        REQUIRE(f.bank.settled_batches() == 0);
        REQUIRE(f.sink.events().empty());
    }

    SECTION("Minimum liquidity boundary") {
        auto r = f.amm->create_pool(at(ALICE, 1), TKA, TKB, 1000, 1000);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.liquidity == constants::MIN_LIQUIDITY);
    }

    SECTION("Pools per creator are capped") {
        for (uint64_t i = 1; i <= constants::MAX_POOLS_PER_USER; ++i) {
            auto r = f.amm->create_pool(at(ALICE, i), TKA, TKB, 1000, 1000);
            REQUIRE(r.status == errors::OK);
            REQUIRE(r.pool_id == i);
        }
        REQUIRE(f.amm->get_user_pools(ALICE).size() == constants::MAX_POOLS_PER_USER);

        uint64_t batches = f.bank.settled_batches();
        U128 balance = f.bank.balance_of(ALICE, TKA);
        auto r = f.amm->create_pool(at(ALICE, 99), TKA, TKC, 1000, 1000);
        REQUIRE(r.status == errors::INVALID_AMOUNT);
        REQUIRE(r.pool_id == 0);
        REQUIRE(f.amm->get_protocol_stats().total_pools == constants::MAX_POOLS_PER_USER);
        REQUIRE(f.amm->get_user_pools(ALICE).size() == constants::MAX_POOLS_PER_USER);
        REQUIRE(f.bank.settled_batches() == batches);
        REQUIRE(f.bank.balance_of(ALICE, TKA) == balance);

        // The cap is per creator
        REQUIRE(f.amm->create_pool(at(BOB, 99), TKA, TKC, 1000, 1000).status == errors::OK);
    }
}

TEST_CASE("Swap", "[amm]") {
    AmmFixture f;
    uint64_t pool_id = f.seed_pool();

    SECTION("Constant product with fee") {
        auto r = f.amm->swap(at(BOB, 20), pool_id, 1000, 990, TKA);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.swap_id == 1);
        REQUIRE(r.amount_out == 996);
        REQUIRE(r.fee == 3);
        REQUIRE(r.price_impact == 9);

        auto pool = f.amm->get_pool(pool_id);
        REQUIRE(pool->reserve_a == 1001000);
        REQUIRE(pool->reserve_b == 999004);
        REQUIRE(pool->last_price_a == 1001997);
        REQUIRE(pool->last_price_b == 998005);

        REQUIRE(f.bank.balance_of(BOB, TKA) == 100000000 - 1000);
        REQUIRE(f.bank.balance_of(BOB, TKB) == 100000000 + 996);

        auto record = f.amm->get_swap(1);
        REQUIRE(record.has_value());
        REQUIRE(record->pool_id == pool_id);
        REQUIRE(record->trader == BOB);
        REQUIRE(record->asset_in == TKA);
        REQUIRE(record->asset_out == TKB);
        REQUIRE(record->amount_in == 1000);
        REQUIRE(record->amount_out == 996);
        REQUIRE(record->block_height == 20);

        auto stats = f.amm->get_protocol_stats();
        REQUIRE(stats.total_swaps == 1);
        REQUIRE(stats.total_volume == 1000);
        REQUIRE(stats.total_fees_collected == 3);

        const Event* ev = f.sink.last();
        REQUIRE(ev->name == "swap");
        REQUIRE(ev->fields["amount_out"] == "996");
    }

    SECTION("Reverse direction") {
        auto r = f.amm->swap(at(BOB, 20), pool_id, 1000, 0, TKB);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.amount_out == 996);
        auto pool = f.amm->get_pool(pool_id);
        REQUIRE(pool->reserve_a == 999004);
        REQUIRE(pool->reserve_b == 1001000);
        REQUIRE(f.amm->get_swap(1)->asset_out == TKA);
    }

    SECTION("Invariant never decreases") {
        U128 k = f.invariant(pool_id);
        const U128 sizes[] = {1, 250, 5000, 77777, 3, 120000};
        for (size_t i = 0; i < sizeof(sizes) / sizeof(sizes[0]); ++i) {
            const Asset& in = (i % 2 == 0) ? TKA : TKB;
            auto r = f.amm->swap(at(BOB, 20 + i), pool_id, sizes[i], 0, in);
            REQUIRE(r.status == errors::OK);
            U128 next = f.invariant(pool_id);
            REQUIRE(next >= k);
            k = next;
        }
        REQUIRE(f.amm->get_protocol_stats().total_swaps == 6);
        REQUIRE(f.amm->get_swap(6).has_value());
        REQUIRE_FALSE(f.amm->get_swap(7).has_value());
    }

    SECTION("Slippage guard") {
        auto r = f.amm->swap(at(BOB, 20), pool_id, 1000, 997, TKA);
        REQUIRE(r.status == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(f.amm->get_pool(pool_id)->reserve_a == 1000000);
        REQUIRE(f.amm->get_protocol_stats().total_swaps == 0);
    }

    SECTION("Rejections") {
        REQUIRE(f.amm->swap(at(BOB, 20), 42, 1000, 0, TKA).status == errors::NOT_FOUND);
        REQUIRE(f.amm->swap(at(BOB, 20), pool_id, 0, 0, TKA).status == errors::INVALID_AMOUNT);
        REQUIRE(f.amm->swap(at(BOB, 20), pool_id, 1000, 0, TKC).status == errors::INVALID_ASSET);
        REQUIRE(f.amm->swap(at(CAROL, 20), pool_id, 1000, 0, TKA).status == errors::TRANSFER_FAILED);

        REQUIRE(f.amm->get_pool(pool_id)->reserve_a == 1000000);
        REQUIRE(f.amm->get_pool(pool_id)->reserve_b == 1000000);
        REQUIRE(f.amm->get_protocol_stats().total_swaps == 0);
    }

    SECTION("Quote matches the executed swap and mutates nothing") {
        auto quote = f.amm->get_swap_quote(pool_id, 5000, TKB);
        auto again = f.amm->get_swap_quote(pool_id, 5000, TKB);
        REQUIRE(quote.status == errors::OK);
        REQUIRE(again.amount_out == quote.amount_out);
        REQUIRE(f.amm->get_pool(pool_id)->reserve_b == 1000000);

        auto r = f.amm->swap(at(BOB, 20), pool_id, 5000, 0, TKB);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.amount_out == quote.amount_out);
        REQUIRE(r.fee == quote.fee);
        REQUIRE(r.price_impact == quote.price_impact);

        REQUIRE(f.amm->get_swap_quote(99, 5000, TKB).status == errors::NOT_FOUND);
        REQUIRE(f.amm->get_swap_quote(pool_id, 0, TKB).status == errors::INVALID_AMOUNT);
        REQUIRE(f.amm->get_swap_quote(pool_id, 5000, TKC).status == errors::INVALID_ASSET);
    }

    SECTION("Zero fee pool") {
        REQUIRE(f.amm->set_fee_rate(at(OWNER, 15), pool_id, 0) == errors::OK);
        auto r = f.amm->swap(at(BOB, 20), pool_id, 1000, 0, TKA);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.fee == 0);
        // 1000 * 1000000 / 1001000
        REQUIRE(r.amount_out == 999);
    }
}

TEST_CASE("Liquidity provision", "[amm]") {
    AmmFixture f;
    uint64_t pool_id = f.seed_pool();
    REQUIRE(f.amm->swap(at(BOB, 20), pool_id, 1000, 0, TKA).status == errors::OK);

    SECTION("Shares follow the scarcer side") {
        auto added = f.amm->add_liquidity(at(BOB, 30), pool_id, 1000, 1000, 999);
        REQUIRE(added.status == errors::OK);
        REQUIRE(added.liquidity == 999);
        REQUIRE(f.amm->get_lp_balance(pool_id, BOB) == 999);

        auto pool = f.amm->get_pool(pool_id);
        REQUIRE(pool->reserve_a == 1002000);
        REQUIRE(pool->reserve_b == 1000004);
        REQUIRE(pool->total_supply == 1000999);
        // Liquidity changes leave the recorded prices alone
        REQUIRE(pool->last_price_a == 1001997);

        REQUIRE(f.amm->get_lp_balance(pool_id, ALICE) + f.amm->get_lp_balance(pool_id, BOB) ==
                pool->total_supply);

        // Withdrawing never returns more than was put in
        auto removed = f.amm->remove_liquidity(at(BOB, 40), pool_id, 999, 0, 0);
        REQUIRE(removed.status == errors::OK);
        REQUIRE(removed.amount_a == 999);
        REQUIRE(removed.amount_b == 997);
        REQUIRE(removed.amount_a <= 1000);
        REQUIRE(removed.amount_b <= 1000);
        REQUIRE(f.amm->get_lp_balance(pool_id, BOB) == 0);
        REQUIRE(f.amm->get_pool(pool_id)->total_supply == 1000000);
        REQUIRE(f.sink.last()->name == "remove-liquidity");
    }

    SECTION("Add rejections") {
        REQUIRE(f.amm->add_liquidity(at(BOB, 30), 9, 1000, 1000, 0).status == errors::NOT_FOUND);
        REQUIRE(f.amm->add_liquidity(at(BOB, 30), pool_id, 0, 1000, 0).status == errors::INVALID_AMOUNT);
        REQUIRE(f.amm->add_liquidity(at(BOB, 30), pool_id, 1000, 1000, 1000).status ==
                errors::SLIPPAGE_EXCEEDED);
        REQUIRE(f.amm->add_liquidity(at(CAROL, 30), pool_id, 1000, 1000, 0).status ==
                errors::TRANSFER_FAILED);
        REQUIRE(f.amm->get_pool(pool_id)->total_supply == 1000000);
        REQUIRE(f.amm->get_lp_balance(pool_id, BOB) == 0);
    }

    SECTION("Remove rejections") {
        REQUIRE(f.amm->remove_liquidity(at(ALICE, 30), 9, 1, 0, 0).status == errors::NOT_FOUND);
        REQUIRE(f.amm->remove_liquidity(at(ALICE, 30), pool_id, 0, 0, 0).status ==
                errors::INVALID_AMOUNT);
        REQUIRE(f.amm->remove_liquidity(at(BOB, 30), pool_id, 1, 0, 0).status ==
                errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.amm->remove_liquidity(at(ALICE, 30), pool_id, 1000001, 0, 0).status ==
                errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.amm->remove_liquidity(at(ALICE, 30), pool_id, 1000, 1002, 0).status ==
                errors::SLIPPAGE_EXCEEDED);
        REQUIRE(f.amm->get_lp_balance(pool_id, ALICE) == 1000000);
    }

    SECTION("Drained pool refuses deposits and swaps") {
        auto removed = f.amm->remove_liquidity(at(ALICE, 30), pool_id, 1000000, 0, 0);
        REQUIRE(removed.status == errors::OK);
        REQUIRE(removed.amount_a == 1001000);
        REQUIRE(removed.amount_b == 999004);

        auto pool = f.amm->get_pool(pool_id);
        REQUIRE(pool->total_supply == 0);
        REQUIRE(pool->reserve_a == 0);
        REQUIRE(pool->reserve_b == 0);
        REQUIRE(pool->active);

        REQUIRE(f.amm->add_liquidity(at(BOB, 40), pool_id, 1000, 1000, 0).status ==
                errors::INSUFFICIENT_LIQUIDITY);
        REQUIRE(f.amm->swap(at(BOB, 40), pool_id, 1000, 0, TKA).status ==
                errors::INSUFFICIENT_LIQUIDITY);
        REQUIRE(f.bank.balance_of(AMM_CUSTODIAN, TKA) == 0);
    }
}

TEST_CASE("Owner operations", "[amm]") {
    AmmFixture f;
    uint64_t pool_id = f.seed_pool();

    SECTION("Fee rate") {
        REQUIRE(f.amm->set_fee_rate(at(ALICE, 11), pool_id, 50) == errors::UNAUTHORIZED);
        REQUIRE(f.amm->set_fee_rate(at(OWNER, 11), 77, 50) == errors::NOT_FOUND);
        REQUIRE(f.amm->set_fee_rate(at(OWNER, 11), pool_id, 1001) == errors::INVALID_AMOUNT);
        REQUIRE(f.amm->get_pool(pool_id)->fee_rate == 30);

        REQUIRE(f.amm->set_fee_rate(at(OWNER, 11), pool_id, constants::MAX_FEE_RATE) == errors::OK);
        REQUIRE(f.amm->get_pool(pool_id)->fee_rate == 1000);
        REQUIRE(f.sink.last()->name == "set-fee-rate");
        REQUIRE(f.sink.last()->fields["previous"] == "30");

        // 1000 * 10% = 100
        REQUIRE(f.amm->get_swap_quote(pool_id, 1000, TKA).fee == 100);
    }

    SECTION("Farming pools are stored, not run") {
        REQUIRE(f.amm->create_farming_pool(at(ALICE, 11), pool_id, 10, 100, 200) ==
                errors::UNAUTHORIZED);
        REQUIRE(f.amm->create_farming_pool(at(OWNER, 11), 5, 10, 100, 200) == errors::NOT_FOUND);
        REQUIRE(f.amm->create_farming_pool(at(OWNER, 11), pool_id, 0, 100, 200) ==
                errors::INVALID_AMOUNT);
        REQUIRE(f.amm->create_farming_pool(at(OWNER, 11), pool_id, 10, 200, 200) ==
                errors::INVALID_AMOUNT);
        REQUIRE_FALSE(f.amm->get_farming_pool(pool_id).has_value());

        REQUIRE(f.amm->create_farming_pool(at(OWNER, 11), pool_id, 10, 100, 200) == errors::OK);
        auto farm = f.amm->get_farming_pool(pool_id);
        REQUIRE(farm.has_value());
        REQUIRE(farm->reward_per_block == 10);
        REQUIRE(farm->start_block == 100);
        REQUIRE(farm->end_block == 200);
        REQUIRE(farm->last_reward_block == 100);
        REQUIRE(farm->total_staked == 0);
        REQUIRE(farm->active);

        REQUIRE(f.amm->create_farming_pool(at(OWNER, 12), pool_id, 10, 100, 200) ==
                errors::ALREADY_EXISTS);

        auto info = f.amm->get_user_farming_info(pool_id, ALICE);
        REQUIRE(info.staked == 0);
        REQUIRE(info.pending_rewards == 0);
    }

    SECTION("Fee above maximum rejected at construction") {
        AmmConfig bad = f.config;
        bad.default_fee_rate = constants::MAX_FEE_RATE + 1;
        REQUIRE_THROWS_AS(LXAmm(bad, f.bank), std::invalid_argument);
    }
}

TEST_CASE("BoundedList", "[amm]") {
    BoundedList<int, 3> list;
    REQUIRE(list.empty());
    list.push_back(4);
    list.push_back(5);
    list.push_back(6);
    REQUIRE(list.full());
    REQUIRE(list.size() == 3);
    REQUIRE(list[1] == 5);
    REQUIRE(list.contains(6));
    REQUIRE_FALSE(list.contains(7));
    REQUIRE_THROWS_AS(list.push_back(7), std::length_error);
    REQUIRE(list.to_vector() == std::vector<int>{4, 5, 6});
}

#ifndef LXLEDGER_AMM_HPP
#define LXLEDGER_AMM_HPP

#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "bounded_list.hpp"
#include "config.hpp"
#include "events.hpp"
#include "transfer.hpp"
#include "types.hpp"

namespace lxledger {

// =============================================================================
// Liquidity Pool Record
// =============================================================================

struct Pool {
    uint64_t pool_id;
    Asset asset_a;
    Asset asset_b;
    U128 reserve_a;
    U128 reserve_b;
    U128 total_supply;         // Outstanding LP shares
    U128 fee_rate;             // Over FEE_DENOMINATOR
    U128 last_price_a;         // reserve_a per unit of b, x PRECISION
    U128 last_price_b;         // reserve_b per unit of a, x PRECISION
    uint64_t created_at;
    bool active;
};

// =============================================================================
// Swap Record (append-only)
// =============================================================================

struct SwapRecord {
    uint64_t swap_id;
    uint64_t pool_id;
    Address trader;
    Asset asset_in;
    Asset asset_out;
    U128 amount_in;
    U128 amount_out;
    U128 fee;
    U128 price_impact;         // Basis points of the pre-trade output reserve
    uint64_t block_height;
};

// =============================================================================
// Farming Extension (storage only)
// =============================================================================

struct FarmingPool {
    uint64_t pool_id;
    U128 reward_per_block;
    uint64_t start_block;
    uint64_t end_block;
    uint64_t last_reward_block;
    U128 acc_reward_per_share;
    U128 total_staked;
    bool active;
};

struct UserFarmingInfo {
    U128 staked;
    U128 reward_debt;
    U128 pending_rewards;
};

// =============================================================================
// Operation Results
// =============================================================================

struct CreatePoolResult {
    int32_t status;
    uint64_t pool_id;
    U128 liquidity;
};

struct AddLiquidityResult {
    int32_t status;
    U128 liquidity;
};

struct RemoveLiquidityResult {
    int32_t status;
    U128 amount_a;
    U128 amount_b;
};

struct SwapQuote {
    int32_t status;
    U128 amount_out;
    U128 fee;
    U128 price_impact;
};

struct SwapResult {
    int32_t status;
    uint64_t swap_id;
    U128 amount_out;
    U128 fee;
    U128 price_impact;
};

using PoolMemberships = BoundedList<uint64_t, constants::MAX_POOLS_PER_USER>;

// =============================================================================
// LXAmm - Constant-Product Pool Engine
// =============================================================================

class LXAmm {
public:
    LXAmm(const AmmConfig& config, ITransferPrimitive& transfers,
          IEventSink* events = nullptr);
    ~LXAmm() = default;

    // Non-copyable
    LXAmm(const LXAmm&) = delete;
    LXAmm& operator=(const LXAmm&) = delete;

    // =========================================================================
    // Core Operations
    // =========================================================================

    // Seed a new pool; creator receives isqrt(initial_a * initial_b) shares
    CreatePoolResult create_pool(const TxContext& ctx, const Asset& asset_a, const Asset& asset_b,
                                 U128 initial_a, U128 initial_b);

    // Shares minted = min of the two proportional contributions
    AddLiquidityResult add_liquidity(const TxContext& ctx, uint64_t pool_id,
                                     U128 amount_a, U128 amount_b, U128 min_liquidity);

    RemoveLiquidityResult remove_liquidity(const TxContext& ctx, uint64_t pool_id,
                                           U128 liquidity, U128 min_a, U128 min_b);

    SwapResult swap(const TxContext& ctx, uint64_t pool_id, U128 amount_in,
                    U128 min_amount_out, const Asset& asset_in);

    // =========================================================================
    // Owner Operations
    // =========================================================================

    int32_t set_fee_rate(const TxContext& ctx, uint64_t pool_id, U128 fee_rate);

    int32_t create_farming_pool(const TxContext& ctx, uint64_t pool_id, U128 reward_per_block,
                                uint64_t start_block, uint64_t end_block);

    // =========================================================================
    // Query Operations
    // =========================================================================

    std::optional<Pool> get_pool(uint64_t pool_id) const;
    U128 get_lp_balance(uint64_t pool_id, const Address& provider) const;
    std::vector<uint64_t> get_user_pools(const Address& account) const;
    std::optional<SwapRecord> get_swap(uint64_t swap_id) const;

    SwapQuote get_swap_quote(uint64_t pool_id, U128 amount_in, const Asset& asset_in) const;

    std::optional<FarmingPool> get_farming_pool(uint64_t pool_id) const;
    UserFarmingInfo get_user_farming_info(uint64_t pool_id, const Address& user) const;

    const AmmConfig& config() const { return config_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pools;
        uint64_t total_swaps;
        U128 total_volume;
        U128 total_fees_collected;
    };
    Stats get_protocol_stats() const;

private:
    const AmmConfig config_;
    ITransferPrimitive& transfers_;
    IEventSink* events_;

    // Pool storage: pool_id -> pool
    std::map<uint64_t, Pool> pools_;
    uint64_t next_pool_id_{1};

    // (pool_id, provider) -> shares
    std::map<std::pair<uint64_t, Address>, U128> lp_balances_;
    std::map<Address, PoolMemberships> user_pools_;

    std::map<uint64_t, SwapRecord> swaps_;

    std::map<uint64_t, FarmingPool> farming_pools_;
    std::map<std::pair<uint64_t, Address>, UserFarmingInfo> user_farming_;

    // Statistics
    uint64_t total_swaps_{0};
    U128 total_volume_{0};
    U128 total_fees_collected_{0};

    // Internal helpers
    static SwapQuote compute_swap(const Pool& pool, U128 amount_in, const Asset& asset_in);
    static std::optional<std::pair<U128, U128>> compute_prices(U128 reserve_a, U128 reserve_b);

    int32_t reject(const char* op, int32_t code) const;
    void emit(const char* name, const TxContext& ctx, nlohmann::json fields);
};

} // namespace lxledger

#endif // LXLEDGER_AMM_HPP

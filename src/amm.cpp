// =============================================================================
// amm.cpp - LXAmm Constant-Product Pool Implementation
// =============================================================================

#include "lxledger/amm.hpp"
#include "lxledger/log.hpp"
#include "lxledger/math.hpp"

#include <algorithm>
#include <stdexcept>

namespace lxledger {

using constants::BPS;
using constants::FEE_DENOMINATOR;
using constants::PRECISION;

// =============================================================================
// Constructor
// =============================================================================

LXAmm::LXAmm(const AmmConfig& config, ITransferPrimitive& transfers, IEventSink* events)
    : config_(config), transfers_(transfers), events_(events) {
    if (config_.default_fee_rate > constants::MAX_FEE_RATE) {
        throw std::invalid_argument("default fee rate above maximum");
    }
}

// =============================================================================
// Internal Helpers
// =============================================================================

int32_t LXAmm::reject(const char* op, int32_t code) const {
    log::logger()->debug("amm.{} rejected: {}", op, errors::name(code));
    return code;
}

void LXAmm::emit(const char* name, const TxContext& ctx, nlohmann::json fields) {
    if (!events_) return;
    events_->emit(Event{name, ctx.block_height, std::move(fields)});
}

// Directional prices: (reserve_a per unit of b, reserve_b per unit of a), 6-decimal fixed point
std::optional<std::pair<U128, U128>> LXAmm::compute_prices(U128 reserve_a, U128 reserve_b) {
    auto price_a = math::mul_div(reserve_a, PRECISION, reserve_b);
    auto price_b = math::mul_div(reserve_b, PRECISION, reserve_a);
    if (!price_a || !price_b) return std::nullopt;
    return std::make_pair(*price_a, *price_b);
}

// amount_in_net = amount_in * (FEE_DENOMINATOR - fee_rate)
// amount_out    = amount_in_net * reserve_out / (reserve_in * FEE_DENOMINATOR + amount_in_net)
SwapQuote LXAmm::compute_swap(const Pool& pool, U128 amount_in, const Asset& asset_in) {
    SwapQuote quote{errors::OK, 0, 0, 0};

    bool a_to_b = asset_in == pool.asset_a;
    if (!a_to_b && asset_in != pool.asset_b) {
        quote.status = errors::INVALID_ASSET;
        return quote;
    }

    U128 reserve_in = a_to_b ? pool.reserve_a : pool.reserve_b;
    U128 reserve_out = a_to_b ? pool.reserve_b : pool.reserve_a;
    if (reserve_in == 0 || reserve_out == 0) {
        quote.status = errors::INSUFFICIENT_LIQUIDITY;
        return quote;
    }

    auto amount_in_net = math::checked_mul(amount_in, FEE_DENOMINATOR - pool.fee_rate);
    auto scaled_reserve = math::checked_mul(reserve_in, FEE_DENOMINATOR);
    if (!amount_in_net || !scaled_reserve) {
        quote.status = errors::ARITHMETIC_OVERFLOW;
        return quote;
    }
    auto denominator = math::checked_add(*scaled_reserve, *amount_in_net);
    if (!denominator) {
        quote.status = errors::ARITHMETIC_OVERFLOW;
        return quote;
    }

    auto amount_out = math::mul_div(*amount_in_net, reserve_out, *denominator);
    auto fee = math::mul_div(amount_in, pool.fee_rate, FEE_DENOMINATOR);
    if (!amount_out || !fee) {
        quote.status = errors::ARITHMETIC_OVERFLOW;
        return quote;
    }

    // Impact against the output reserve before the trade
    auto impact = math::mul_div(*amount_out, BPS, reserve_out);

    quote.amount_out = *amount_out;
    quote.fee = *fee;
    quote.price_impact = impact ? *impact : 0;
    return quote;
}

// =============================================================================
// Create Pool
// =============================================================================

CreatePoolResult LXAmm::create_pool(const TxContext& ctx, const Asset& asset_a,
                                    const Asset& asset_b, U128 initial_a, U128 initial_b) {
    CreatePoolResult result{errors::OK, 0, 0};

    if (initial_a == 0 || initial_b == 0) {
        result.status = reject("create_pool", errors::INVALID_AMOUNT);
        return result;
    }
    if (asset_a == asset_b) {
        result.status = reject("create_pool", errors::INVALID_ASSET);
        return result;
    }

    auto product = math::checked_mul(initial_a, initial_b);
    if (!product) {
        result.status = reject("create_pool", errors::ARITHMETIC_OVERFLOW);
        return result;
    }
    U128 liquidity = math::isqrt(*product);
    if (liquidity < constants::MIN_LIQUIDITY) {
        result.status = reject("create_pool", errors::INSUFFICIENT_LIQUIDITY);
        return result;
    }

    auto memberships = user_pools_.find(ctx.sender);
    if (memberships != user_pools_.end() && memberships->second.full()) {
        log::logger()->debug("amm.create_pool: {} already holds {} pools",
                             addresses::to_hex(ctx.sender), PoolMemberships::capacity());
        result.status = reject("create_pool", errors::INVALID_AMOUNT);
        return result;
    }

    auto prices = compute_prices(initial_a, initial_b);
    if (!prices) {
        result.status = reject("create_pool", errors::ARITHMETIC_OVERFLOW);
        return result;
    }

    bool settled = transfers_.settle({
        AssetTransfer{asset_a, initial_a, ctx.sender, config_.custodian},
        AssetTransfer{asset_b, initial_b, ctx.sender, config_.custodian}
    });
    if (!settled) {
        result.status = reject("create_pool", errors::TRANSFER_FAILED);
        return result;
    }

    uint64_t pool_id = next_pool_id_++;
    pools_[pool_id] = Pool{
        pool_id,
        asset_a,
        asset_b,
        initial_a,
        initial_b,
        liquidity,
        config_.default_fee_rate,
        prices->first,
        prices->second,
        ctx.block_height,
        true
    };
    lp_balances_[{pool_id, ctx.sender}] = liquidity;
    user_pools_[ctx.sender].push_back(pool_id);  // Capacity checked above

    emit("create-pool", ctx, {
        {"pool_id", pool_id},
        {"creator", address_field(ctx.sender)},
        {"asset_a", address_field(asset_a.addr)},
        {"asset_b", address_field(asset_b.addr)},
        {"amount_a", amount_field(initial_a)},
        {"amount_b", amount_field(initial_b)},
        {"liquidity", amount_field(liquidity)}
    });

    result.pool_id = pool_id;
    result.liquidity = liquidity;
    return result;
}

// =============================================================================
// Add/Remove Liquidity
// =============================================================================

AddLiquidityResult LXAmm::add_liquidity(const TxContext& ctx, uint64_t pool_id,
                                        U128 amount_a, U128 amount_b, U128 min_liquidity) {
    AddLiquidityResult result{errors::OK, 0};

    auto it = pools_.find(pool_id);
    if (it == pools_.end()) {
        result.status = reject("add_liquidity", errors::NOT_FOUND);
        return result;
    }
    Pool& pool = it->second;

    if (!pool.active) {
        result.status = reject("add_liquidity", errors::POOL_INACTIVE);
        return result;
    }
    if (amount_a == 0 || amount_b == 0) {
        result.status = reject("add_liquidity", errors::INVALID_AMOUNT);
        return result;
    }
    if (pool.total_supply == 0 || pool.reserve_a == 0 || pool.reserve_b == 0) {
        result.status = reject("add_liquidity", errors::INSUFFICIENT_LIQUIDITY);
        return result;
    }

    auto shares_a = math::mul_div(amount_a, pool.total_supply, pool.reserve_a);
    auto shares_b = math::mul_div(amount_b, pool.total_supply, pool.reserve_b);
    if (!shares_a || !shares_b) {
        result.status = reject("add_liquidity", errors::ARITHMETIC_OVERFLOW);
        return result;
    }
    U128 liquidity = std::min(*shares_a, *shares_b);

    if (liquidity < min_liquidity) {
        result.status = reject("add_liquidity", errors::SLIPPAGE_EXCEEDED);
        return result;
    }

    auto new_reserve_a = math::checked_add(pool.reserve_a, amount_a);
    auto new_reserve_b = math::checked_add(pool.reserve_b, amount_b);
    auto new_supply = math::checked_add(pool.total_supply, liquidity);
    auto new_balance = math::checked_add(get_lp_balance(pool_id, ctx.sender), liquidity);
    if (!new_reserve_a || !new_reserve_b || !new_supply || !new_balance) {
        result.status = reject("add_liquidity", errors::ARITHMETIC_OVERFLOW);
        return result;
    }

    bool settled = transfers_.settle({
        AssetTransfer{pool.asset_a, amount_a, ctx.sender, config_.custodian},
        AssetTransfer{pool.asset_b, amount_b, ctx.sender, config_.custodian}
    });
    if (!settled) {
        result.status = reject("add_liquidity", errors::TRANSFER_FAILED);
        return result;
    }

    pool.reserve_a = *new_reserve_a;
    pool.reserve_b = *new_reserve_b;
    pool.total_supply = *new_supply;
    lp_balances_[{pool_id, ctx.sender}] = *new_balance;

    emit("add-liquidity", ctx, {
        {"pool_id", pool_id},
        {"provider", address_field(ctx.sender)},
        {"amount_a", amount_field(amount_a)},
        {"amount_b", amount_field(amount_b)},
        {"liquidity", amount_field(liquidity)}
    });

    result.liquidity = liquidity;
    return result;
}

RemoveLiquidityResult LXAmm::remove_liquidity(const TxContext& ctx, uint64_t pool_id,
                                              U128 liquidity, U128 min_a, U128 min_b) {
    RemoveLiquidityResult result{errors::OK, 0, 0};

    auto it = pools_.find(pool_id);
    if (it == pools_.end()) {
        result.status = reject("remove_liquidity", errors::NOT_FOUND);
        return result;
    }
    Pool& pool = it->second;

    if (liquidity == 0) {
        result.status = reject("remove_liquidity", errors::INVALID_AMOUNT);
        return result;
    }

    U128 balance = get_lp_balance(pool_id, ctx.sender);
    if (balance < liquidity) {
        result.status = reject("remove_liquidity", errors::INSUFFICIENT_BALANCE);
        return result;
    }

    // liquidity <= balance <= total_supply, so both outputs fit their reserves
    auto amount_a = math::mul_div(liquidity, pool.reserve_a, pool.total_supply);
    auto amount_b = math::mul_div(liquidity, pool.reserve_b, pool.total_supply);
    if (!amount_a || !amount_b) {
        result.status = reject("remove_liquidity", errors::ARITHMETIC_OVERFLOW);
        return result;
    }

    if (*amount_a < min_a || *amount_b < min_b) {
        result.status = reject("remove_liquidity", errors::SLIPPAGE_EXCEEDED);
        return result;
    }

    bool settled = transfers_.settle({
        AssetTransfer{pool.asset_a, *amount_a, config_.custodian, ctx.sender},
        AssetTransfer{pool.asset_b, *amount_b, config_.custodian, ctx.sender}
    });
    if (!settled) {
        result.status = reject("remove_liquidity", errors::TRANSFER_FAILED);
        return result;
    }

    pool.reserve_a -= *amount_a;
    pool.reserve_b -= *amount_b;
    pool.total_supply -= liquidity;
    lp_balances_[{pool_id, ctx.sender}] = balance - liquidity;

    emit("remove-liquidity", ctx, {
        {"pool_id", pool_id},
        {"provider", address_field(ctx.sender)},
        {"liquidity", amount_field(liquidity)},
        {"amount_a", amount_field(*amount_a)},
        {"amount_b", amount_field(*amount_b)}
    });

    result.amount_a = *amount_a;
    result.amount_b = *amount_b;
    return result;
}

// =============================================================================
// Swap
// =============================================================================

SwapResult LXAmm::swap(const TxContext& ctx, uint64_t pool_id, U128 amount_in,
                       U128 min_amount_out, const Asset& asset_in) {
    SwapResult result{errors::OK, 0, 0, 0, 0};

    auto it = pools_.find(pool_id);
    if (it == pools_.end()) {
        result.status = reject("swap", errors::NOT_FOUND);
        return result;
    }
    Pool& pool = it->second;

    if (!pool.active) {
        result.status = reject("swap", errors::POOL_INACTIVE);
        return result;
    }
    if (amount_in == 0) {
        result.status = reject("swap", errors::INVALID_AMOUNT);
        return result;
    }

    SwapQuote quote = compute_swap(pool, amount_in, asset_in);
    if (quote.status != errors::OK) {
        result.status = reject("swap", quote.status);
        return result;
    }
    if (quote.amount_out < min_amount_out) {
        result.status = reject("swap", errors::SLIPPAGE_EXCEEDED);
        return result;
    }

    bool a_to_b = asset_in == pool.asset_a;
    const Asset& asset_out = a_to_b ? pool.asset_b : pool.asset_a;

    // Fees stay in the reserves: the whole amount_in is added
    U128 new_reserve_a = pool.reserve_a;
    U128 new_reserve_b = pool.reserve_b;
    std::optional<U128> grown = math::checked_add(a_to_b ? pool.reserve_a : pool.reserve_b, amount_in);
    if (!grown) {
        result.status = reject("swap", errors::ARITHMETIC_OVERFLOW);
        return result;
    }
    if (a_to_b) {
        new_reserve_a = *grown;
        new_reserve_b -= quote.amount_out;
    } else {
        new_reserve_b = *grown;
        new_reserve_a -= quote.amount_out;
    }

    auto prices = compute_prices(new_reserve_a, new_reserve_b);
    auto new_volume = math::checked_add(total_volume_, amount_in);
    auto new_fees = math::checked_add(total_fees_collected_, quote.fee);
    if (!prices || !new_volume || !new_fees) {
        result.status = reject("swap", errors::ARITHMETIC_OVERFLOW);
        return result;
    }

    bool settled = transfers_.settle({
        AssetTransfer{asset_in, amount_in, ctx.sender, config_.custodian},
        AssetTransfer{asset_out, quote.amount_out, config_.custodian, ctx.sender}
    });
    if (!settled) {
        result.status = reject("swap", errors::TRANSFER_FAILED);
        return result;
    }

    pool.reserve_a = new_reserve_a;
    pool.reserve_b = new_reserve_b;
    pool.last_price_a = prices->first;
    pool.last_price_b = prices->second;

    uint64_t swap_id = total_swaps_ + 1;
    swaps_[swap_id] = SwapRecord{
        swap_id,
        pool_id,
        ctx.sender,
        asset_in,
        asset_out,
        amount_in,
        quote.amount_out,
        quote.fee,
        quote.price_impact,
        ctx.block_height
    };
    total_swaps_ = swap_id;
    total_volume_ = *new_volume;
    total_fees_collected_ = *new_fees;

    emit("swap", ctx, {
        {"swap_id", swap_id},
        {"pool_id", pool_id},
        {"trader", address_field(ctx.sender)},
        {"asset_in", address_field(asset_in.addr)},
        {"asset_out", address_field(asset_out.addr)},
        {"amount_in", amount_field(amount_in)},
        {"amount_out", amount_field(quote.amount_out)},
        {"fee", amount_field(quote.fee)},
        {"price_impact", amount_field(quote.price_impact)}
    });

    result.swap_id = swap_id;
    result.amount_out = quote.amount_out;
    result.fee = quote.fee;
    result.price_impact = quote.price_impact;
    return result;
}

// =============================================================================
// Owner Operations
// =============================================================================

int32_t LXAmm::set_fee_rate(const TxContext& ctx, uint64_t pool_id, U128 fee_rate) {
    if (ctx.sender != config_.owner) {
        return reject("set_fee_rate", errors::UNAUTHORIZED);
    }

    auto it = pools_.find(pool_id);
    if (it == pools_.end()) {
        return reject("set_fee_rate", errors::NOT_FOUND);
    }
    if (fee_rate > constants::MAX_FEE_RATE) {
        return reject("set_fee_rate", errors::INVALID_AMOUNT);
    }

    U128 previous = it->second.fee_rate;
    it->second.fee_rate = fee_rate;

    emit("set-fee-rate", ctx, {
        {"pool_id", pool_id},
        {"previous", amount_field(previous)},
        {"fee_rate", amount_field(fee_rate)}
    });
    return errors::OK;
}

int32_t LXAmm::create_farming_pool(const TxContext& ctx, uint64_t pool_id, U128 reward_per_block,
                                   uint64_t start_block, uint64_t end_block) {
    if (ctx.sender != config_.owner) {
        return reject("create_farming_pool", errors::UNAUTHORIZED);
    }
    if (pools_.find(pool_id) == pools_.end()) {
        return reject("create_farming_pool", errors::NOT_FOUND);
    }
    if (reward_per_block == 0 || start_block >= end_block) {
        return reject("create_farming_pool", errors::INVALID_AMOUNT);
    }
    if (farming_pools_.find(pool_id) != farming_pools_.end()) {
        return reject("create_farming_pool", errors::ALREADY_EXISTS);
    }

    farming_pools_[pool_id] = FarmingPool{
        pool_id,
        reward_per_block,
        start_block,
        end_block,
        start_block,
        0,
        0,
        true
    };

    emit("create-farming-pool", ctx, {
        {"pool_id", pool_id},
        {"reward_per_block", amount_field(reward_per_block)},
        {"start_block", start_block},
        {"end_block", end_block}
    });
    return errors::OK;
}

// =============================================================================
// Query Operations
// =============================================================================

std::optional<Pool> LXAmm::get_pool(uint64_t pool_id) const {
    auto it = pools_.find(pool_id);
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

U128 LXAmm::get_lp_balance(uint64_t pool_id, const Address& provider) const {
    auto it = lp_balances_.find({pool_id, provider});
    return it != lp_balances_.end() ? it->second : 0;
}

std::vector<uint64_t> LXAmm::get_user_pools(const Address& account) const {
    auto it = user_pools_.find(account);
    if (it == user_pools_.end()) return {};
    return it->second.to_vector();
}

std::optional<SwapRecord> LXAmm::get_swap(uint64_t swap_id) const {
    auto it = swaps_.find(swap_id);
    if (it == swaps_.end()) return std::nullopt;
    return it->second;
}

SwapQuote LXAmm::get_swap_quote(uint64_t pool_id, U128 amount_in, const Asset& asset_in) const {
    auto it = pools_.find(pool_id);
    if (it == pools_.end()) {
        return SwapQuote{errors::NOT_FOUND, 0, 0, 0};
    }
    if (amount_in == 0) {
        return SwapQuote{errors::INVALID_AMOUNT, 0, 0, 0};
    }
    return compute_swap(it->second, amount_in, asset_in);
}

std::optional<FarmingPool> LXAmm::get_farming_pool(uint64_t pool_id) const {
    auto it = farming_pools_.find(pool_id);
    if (it == farming_pools_.end()) return std::nullopt;
    return it->second;
}

UserFarmingInfo LXAmm::get_user_farming_info(uint64_t pool_id, const Address& user) const {
    auto it = user_farming_.find({pool_id, user});
    return it != user_farming_.end() ? it->second : UserFarmingInfo{0, 0, 0};
}

// =============================================================================
// Statistics
// =============================================================================

LXAmm::Stats LXAmm::get_protocol_stats() const {
    return Stats{
        static_cast<uint64_t>(pools_.size()),
        total_swaps_,
        total_volume_,
        total_fees_collected_
    };
}

} // namespace lxledger

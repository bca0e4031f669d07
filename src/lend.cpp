// =============================================================================
// lend.cpp - LXLend Collateralized Lending Implementation
// =============================================================================

#include "lxledger/lend.hpp"
#include "lxledger/log.hpp"
#include "lxledger/math.hpp"

#include <utility>

namespace lxledger {

using constants::INTEREST_DENOMINATOR;
using constants::MIN_COLLATERAL_RATIO;

// =============================================================================
// Constructor
// =============================================================================

LXLend::LXLend(const LendingConfig& config, ITransferPrimitive& transfers, IEventSink* events)
    : config_(config), transfers_(transfers), events_(events) {}

// =============================================================================
// Internal Helpers
// =============================================================================

U128 LXLend::balance_or_zero(const std::map<Address, U128>& balances, const Address& account) {
    auto it = balances.find(account);
    return it != balances.end() ? it->second : 0;
}

std::optional<U128> LXLend::interest_since(const Loan& loan, uint64_t from_block,
                                           uint64_t block_height) {
    uint64_t blocks = block_height > from_block ? block_height - from_block : 0;
    auto scaled = math::checked_mul(loan.principal, loan.interest_rate);
    if (!scaled) return std::nullopt;
    return math::mul_div(*scaled, blocks, INTEREST_DENOMINATOR);
}

// collateral * 100 / owed, saturating
U128 LXLend::collateral_ratio(U128 collateral, U128 owed) {
    auto ratio = math::mul_div(collateral, 100, owed);
    return ratio ? *ratio : U128_MAX;
}

int32_t LXLend::reject(const char* op, int32_t code) const {
    log::logger()->debug("lend.{} rejected: {}", op, errors::name(code));
    return code;
}

void LXLend::emit(const char* name, const TxContext& ctx, nlohmann::json fields) {
    if (!events_) return;
    events_->emit(Event{name, ctx.block_height, std::move(fields)});
}

// =============================================================================
// Deposit/Withdraw
// =============================================================================

int32_t LXLend::deposit(const TxContext& ctx, U128 amount) {
    if (amount == 0) {
        return reject("deposit", errors::INVALID_AMOUNT);
    }

    auto new_balance = math::checked_add(balance_or_zero(deposits_, ctx.sender), amount);
    auto new_total = math::checked_add(total_deposited_, amount);
    if (!new_balance || !new_total) {
        return reject("deposit", errors::ARITHMETIC_OVERFLOW);
    }

    if (!transfers_.transfer(config_.settlement_asset, amount, ctx.sender, config_.custodian)) {
        return reject("deposit", errors::TRANSFER_FAILED);
    }

    deposits_[ctx.sender] = *new_balance;
    total_deposited_ = *new_total;

    emit("deposit", ctx, {
        {"account", address_field(ctx.sender)},
        {"amount", amount_field(amount)},
        {"balance", amount_field(*new_balance)}
    });
    return errors::OK;
}

int32_t LXLend::withdraw(const TxContext& ctx, U128 amount) {
    if (amount == 0) {
        return reject("withdraw", errors::INVALID_AMOUNT);
    }

    U128 balance = balance_or_zero(deposits_, ctx.sender);
    if (amount > balance) {
        return reject("withdraw", errors::INSUFFICIENT_BALANCE);
    }

    auto new_total = math::checked_sub(total_deposited_, amount);
    if (!new_total) {
        return reject("withdraw", errors::ARITHMETIC_UNDERFLOW);
    }

    if (!transfers_.transfer(config_.settlement_asset, amount, config_.custodian, ctx.sender)) {
        return reject("withdraw", errors::TRANSFER_FAILED);
    }

    deposits_[ctx.sender] = balance - amount;
    total_deposited_ = *new_total;

    emit("withdraw", ctx, {
        {"account", address_field(ctx.sender)},
        {"amount", amount_field(amount)},
        {"balance", amount_field(balance - amount)}
    });
    return errors::OK;
}

// =============================================================================
// Borrow
// =============================================================================

BorrowResult LXLend::borrow(const TxContext& ctx, U128 amount, U128 collateral_amount) {
    BorrowResult result{errors::OK, 0};

    if (amount == 0 || collateral_amount == 0 || amount > config_.max_loan_amount) {
        result.status = reject("borrow", errors::INVALID_AMOUNT);
        return result;
    }

    // Prospective aggregate position
    auto new_borrowed = math::checked_add(balance_or_zero(borrowed_, ctx.sender), amount);
    auto new_collateral = math::checked_add(balance_or_zero(collateral_, ctx.sender),
                                            collateral_amount);
    auto new_total = math::checked_add(total_borrowed_, amount);
    if (!new_borrowed || !new_collateral || !new_total) {
        result.status = reject("borrow", errors::ARITHMETIC_OVERFLOW);
        return result;
    }

    if (collateral_ratio(*new_collateral, *new_borrowed) < MIN_COLLATERAL_RATIO) {
        result.status = reject("borrow", errors::INVALID_COLLATERAL_RATIO);
        return result;
    }

    // Collateral in, principal out
    bool settled = transfers_.settle({
        AssetTransfer{config_.settlement_asset, collateral_amount, ctx.sender, config_.custodian},
        AssetTransfer{config_.settlement_asset, amount, config_.custodian, ctx.sender}
    });
    if (!settled) {
        result.status = reject("borrow", errors::TRANSFER_FAILED);
        return result;
    }

    uint64_t loan_id = next_loan_id_++;
    loans_[loan_id] = Loan{
        loan_id,
        ctx.sender,
        amount,
        collateral_amount,
        config_.interest_rate_per_block,
        ctx.block_height,
        ctx.block_height
    };
    borrowed_[ctx.sender] = *new_borrowed;
    collateral_[ctx.sender] = *new_collateral;
    total_borrowed_ = *new_total;

    emit("borrow", ctx, {
        {"loan_id", loan_id},
        {"borrower", address_field(ctx.sender)},
        {"amount", amount_field(amount)},
        {"collateral", amount_field(collateral_amount)},
        {"interest_rate", amount_field(config_.interest_rate_per_block)}
    });

    result.loan_id = loan_id;
    return result;
}

// =============================================================================
// Repay
// =============================================================================

RepayResult LXLend::repay(const TxContext& ctx, uint64_t loan_id, U128 amount) {
    RepayResult result{errors::OK, 0, 0, false};

    auto it = loans_.find(loan_id);
    if (it == loans_.end()) {
        result.status = reject("repay", errors::NOT_FOUND);
        return result;
    }
    Loan& loan = it->second;

    if (loan.borrower != ctx.sender) {
        result.status = reject("repay", errors::UNAUTHORIZED);
        return result;
    }

    auto interest = interest_since(loan, loan.last_update_block, ctx.block_height);
    if (!interest) {
        result.status = reject("repay", errors::ARITHMETIC_OVERFLOW);
        return result;
    }
    auto total_owed = math::checked_add(loan.principal, *interest);
    if (!total_owed) {
        result.status = reject("repay", errors::ARITHMETIC_OVERFLOW);
        return result;
    }

    if (amount == 0 || amount > *total_owed) {
        result.status = reject("repay", errors::INVALID_AMOUNT);
        return result;
    }

    result.interest = *interest;
    result.total_owed = *total_owed;
    result.loan_closed = amount >= *total_owed;

    // Full repayment releases the stored principal from the aggregates;
    // a partial one only rewrites the loan record
    std::optional<U128> new_borrowed;
    std::optional<U128> new_total;
    if (result.loan_closed) {
        new_borrowed = math::checked_sub(balance_or_zero(borrowed_, ctx.sender), loan.principal);
        new_total = math::checked_sub(total_borrowed_, loan.principal);
        if (!new_borrowed || !new_total) {
            result.status = reject("repay", errors::ARITHMETIC_UNDERFLOW);
            return result;
        }
    }

    if (!transfers_.transfer(config_.settlement_asset, amount, ctx.sender, config_.custodian)) {
        result.status = reject("repay", errors::TRANSFER_FAILED);
        return result;
    }

    nlohmann::json fields = {
        {"loan_id", loan_id},
        {"borrower", address_field(ctx.sender)},
        {"amount", amount_field(amount)},
        {"interest", amount_field(*interest)},
        {"total_owed", amount_field(*total_owed)},
        {"closed", result.loan_closed}
    };

    if (result.loan_closed) {
        borrowed_[ctx.sender] = *new_borrowed;
        total_borrowed_ = *new_total;
        loans_.erase(it);
    } else {
        loan.principal = *total_owed - amount;
        loan.last_update_block = ctx.block_height;
        fields["remaining"] = amount_field(loan.principal);
    }

    emit("repay", ctx, std::move(fields));
    return result;
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationResult LXLend::liquidate(const TxContext& ctx, uint64_t loan_id) {
    LiquidationResult result{errors::OK, {}, 0, 0};

    auto it = loans_.find(loan_id);
    if (it == loans_.end()) {
        result.status = reject("liquidate", errors::NOT_FOUND);
        return result;
    }
    const Loan& loan = it->second;

    auto interest = interest_since(loan, loan.start_block, ctx.block_height);
    auto total_owed = interest ? math::checked_add(loan.principal, *interest) : std::nullopt;
    if (!total_owed) {
        result.status = reject("liquidate", errors::ARITHMETIC_OVERFLOW);
        return result;
    }

    if (collateral_ratio(loan.collateral, *total_owed) >= MIN_COLLATERAL_RATIO) {
        result.status = reject("liquidate", errors::INVALID_COLLATERAL_RATIO);
        return result;
    }

    auto new_collateral = math::checked_sub(balance_or_zero(collateral_, loan.borrower),
                                            loan.collateral);
    auto new_borrowed = math::checked_sub(balance_or_zero(borrowed_, loan.borrower),
                                          loan.principal);
    auto new_total = math::checked_sub(total_borrowed_, loan.principal);
    if (!new_collateral || !new_borrowed || !new_total) {
        result.status = reject("liquidate", errors::ARITHMETIC_UNDERFLOW);
        return result;
    }

    if (!transfers_.transfer(config_.settlement_asset, loan.collateral,
                             config_.custodian, ctx.sender)) {
        result.status = reject("liquidate", errors::TRANSFER_FAILED);
        return result;
    }

    result.borrower = loan.borrower;
    result.collateral_seized = loan.collateral;
    result.total_owed = *total_owed;

    collateral_[loan.borrower] = *new_collateral;
    borrowed_[loan.borrower] = *new_borrowed;
    total_borrowed_ = *new_total;

    emit("liquidate", ctx, {
        {"loan_id", loan_id},
        {"borrower", address_field(loan.borrower)},
        {"liquidator", address_field(ctx.sender)},
        {"principal", amount_field(loan.principal)},
        {"collateral", amount_field(loan.collateral)},
        {"total_owed", amount_field(*total_owed)}
    });

    loans_.erase(it);
    return result;
}

// =============================================================================
// Oracle Storage
// =============================================================================

int32_t LXLend::set_oracle_price(const TxContext& ctx, const Asset& asset, U128 price) {
    if (ctx.sender != config_.owner) {
        return reject("set_oracle_price", errors::UNAUTHORIZED);
    }
    if (price == 0) {
        return reject("set_oracle_price", errors::INVALID_AMOUNT);
    }

    oracle_[asset] = OraclePrice{price, ctx.block_height};

    emit("set-oracle-price", ctx, {
        {"asset", address_field(asset.addr)},
        {"price", amount_field(price)}
    });
    return errors::OK;
}

std::optional<OraclePrice> LXLend::get_oracle_price(const Asset& asset) const {
    auto it = oracle_.find(asset);
    if (it == oracle_.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Query Operations
// =============================================================================

U128 LXLend::get_deposit_balance(const Address& account) const {
    return balance_or_zero(deposits_, account);
}

U128 LXLend::get_borrowed_balance(const Address& account) const {
    return balance_or_zero(borrowed_, account);
}

U128 LXLend::get_collateral_balance(const Address& account) const {
    return balance_or_zero(collateral_, account);
}

std::optional<Loan> LXLend::get_loan_details(uint64_t loan_id) const {
    auto it = loans_.find(loan_id);
    if (it == loans_.end()) return std::nullopt;
    return it->second;
}

bool LXLend::is_healthy(uint64_t loan_id, uint64_t block_height) const {
    auto it = loans_.find(loan_id);
    if (it == loans_.end()) return false;
    const Loan& loan = it->second;

    auto interest = interest_since(loan, loan.start_block, block_height);
    auto total_owed = interest ? math::checked_add(loan.principal, *interest) : std::nullopt;
    // Debt beyond 128 bits cannot be covered by any collateral
    if (!total_owed) return false;

    return collateral_ratio(loan.collateral, *total_owed) >= MIN_COLLATERAL_RATIO;
}

std::optional<U128> LXLend::current_debt(uint64_t loan_id, uint64_t block_height) const {
    auto it = loans_.find(loan_id);
    if (it == loans_.end()) return std::nullopt;
    const Loan& loan = it->second;

    auto interest = interest_since(loan, loan.last_update_block, block_height);
    if (!interest) return std::nullopt;
    return math::checked_add(loan.principal, *interest);
}

U128 LXLend::get_utilization_rate() const {
    if (total_deposited_ == 0) return 0;
    auto rate = math::mul_div(total_borrowed_, 100, total_deposited_);
    return rate ? *rate : U128_MAX;
}

// =============================================================================
// Statistics
// =============================================================================

LXLend::Stats LXLend::get_protocol_stats() const {
    return Stats{
        total_deposited_,
        total_borrowed_,
        next_loan_id_,
        static_cast<uint64_t>(loans_.size())
    };
}

} // namespace lxledger

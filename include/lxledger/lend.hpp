#ifndef LXLEDGER_LEND_HPP
#define LXLEDGER_LEND_HPP

#include <map>
#include <optional>

#include "config.hpp"
#include "events.hpp"
#include "transfer.hpp"
#include "types.hpp"

namespace lxledger {

// =============================================================================
// Loan Record
// =============================================================================

struct Loan {
    uint64_t loan_id;
    Address borrower;
    U128 principal;            // Outstanding principal (rolled interest after partial repay)
    U128 collateral;           // Collateral posted with this loan
    U128 interest_rate;        // Per block, over INTEREST_DENOMINATOR
    uint64_t start_block;      // Origination
    uint64_t last_update_block;
};

// =============================================================================
// Oracle Entry (storage only)
// =============================================================================

struct OraclePrice {
    U128 price;
    uint64_t last_updated;
};

// =============================================================================
// Operation Results
// =============================================================================

struct BorrowResult {
    int32_t status;
    uint64_t loan_id;
};

struct RepayResult {
    int32_t status;
    U128 interest;
    U128 total_owed;
    bool loan_closed;
};

struct LiquidationResult {
    int32_t status;
    Address borrower;
    U128 collateral_seized;
    U128 total_owed;
};

// =============================================================================
// LXLend - Collateralized Lending Ledger
// =============================================================================

class LXLend {
public:
    LXLend(const LendingConfig& config, ITransferPrimitive& transfers,
           IEventSink* events = nullptr);
    ~LXLend() = default;

    // Non-copyable
    LXLend(const LXLend&) = delete;
    LXLend& operator=(const LXLend&) = delete;

    // =========================================================================
    // Deposit/Withdraw
    // =========================================================================

    int32_t deposit(const TxContext& ctx, U128 amount);
    int32_t withdraw(const TxContext& ctx, U128 amount);

    // =========================================================================
    // Loans
    // =========================================================================

    // Ratio is checked on the caller's aggregate position after this loan
    BorrowResult borrow(const TxContext& ctx, U128 amount, U128 collateral_amount);

    // Interest accrues from the loan's last update block
    RepayResult repay(const TxContext& ctx, uint64_t loan_id, U128 amount);

    // Interest accrues from the loan's origination block. Any caller may
    // liquidate and receives the loan's full collateral.
    LiquidationResult liquidate(const TxContext& ctx, uint64_t loan_id);

    // =========================================================================
    // Oracle Storage (owner only, not read by any transition)
    // =========================================================================

    int32_t set_oracle_price(const TxContext& ctx, const Asset& asset, U128 price);
    std::optional<OraclePrice> get_oracle_price(const Asset& asset) const;

    // =========================================================================
    // Query Operations
    // =========================================================================

    U128 get_deposit_balance(const Address& account) const;
    U128 get_borrowed_balance(const Address& account) const;
    U128 get_collateral_balance(const Address& account) const;

    std::optional<Loan> get_loan_details(uint64_t loan_id) const;

    // Liquidation basis; false when the loan does not exist
    bool is_healthy(uint64_t loan_id, uint64_t block_height) const;

    // Repayment basis: principal + interest since last update
    std::optional<U128> current_debt(uint64_t loan_id, uint64_t block_height) const;

    // total_borrowed * 100 / total_deposited, 0 without deposits
    U128 get_utilization_rate() const;

    const LendingConfig& config() const { return config_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        U128 total_deposited;
        U128 total_borrowed;
        uint64_t next_loan_id;
        uint64_t active_loans;
    };
    Stats get_protocol_stats() const;

private:
    const LendingConfig config_;
    ITransferPrimitive& transfers_;
    IEventSink* events_;

    // Per-account balances (absent = zero)
    std::map<Address, U128> deposits_;
    std::map<Address, U128> borrowed_;
    std::map<Address, U128> collateral_;

    std::map<uint64_t, Loan> loans_;
    std::map<Asset, OraclePrice> oracle_;

    U128 total_deposited_{0};
    U128 total_borrowed_{0};
    uint64_t next_loan_id_{1};

    // Internal helpers
    static U128 balance_or_zero(const std::map<Address, U128>& balances, const Address& account);
    static std::optional<U128> interest_since(const Loan& loan, uint64_t from_block,
                                              uint64_t block_height);
    static U128 collateral_ratio(U128 collateral, U128 owed);

    int32_t reject(const char* op, int32_t code) const;
    void emit(const char* name, const TxContext& ctx, nlohmann::json fields);
};

} // namespace lxledger

#endif // LXLEDGER_LEND_HPP

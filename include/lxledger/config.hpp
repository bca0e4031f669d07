#ifndef LXLEDGER_CONFIG_HPP
#define LXLEDGER_CONFIG_HPP

#include <string>
#include <string_view>

#include "types.hpp"

namespace lxledger {

// General settings
struct GeneralConfig {
    std::string log_level = "info";
};

// Lending ledger deployment settings
struct LendingConfig {
    Address owner{};
    Address custodian{};               // Holds pooled deposits and collateral
    Asset settlement_asset{};
    U128 interest_rate_per_block = constants::DEFAULT_INTEREST_RATE;
    U128 max_loan_amount = constants::DEFAULT_MAX_LOAN_AMOUNT;
};

// AMM deployment settings
struct AmmConfig {
    Address owner{};
    Address custodian{};               // Holds pool reserves
    U128 default_fee_rate = constants::DEFAULT_FEE_RATE;
};

// Main configuration
class Config {
public:
    GeneralConfig general;
    LendingConfig lending;
    AmmConfig amm;

    Config() = default;

    // Load from a JSON file; throws std::runtime_error if unreadable
    static Config from_file(std::string_view path);

    // Parse JSON text; throws std::invalid_argument on malformed values
    static Config from_json(std::string_view content);

    // Builder methods
    Config& with_owner(const Address& owner) {
        lending.owner = owner;
        amm.owner = owner;
        return *this;
    }

    Config& with_lending_custodian(const Address& custodian) {
        lending.custodian = custodian;
        return *this;
    }

    Config& with_amm_custodian(const Address& custodian) {
        amm.custodian = custodian;
        return *this;
    }

    Config& with_settlement_asset(const Asset& asset) {
        lending.settlement_asset = asset;
        return *this;
    }

    Config& set_interest_rate(U128 rate_per_block) {
        lending.interest_rate_per_block = rate_per_block;
        return *this;
    }

    Config& set_max_loan_amount(U128 amount) {
        lending.max_loan_amount = amount;
        return *this;
    }

    Config& set_default_fee_rate(U128 fee_rate) {
        amm.default_fee_rate = fee_rate;
        return *this;
    }

    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }
};

} // namespace lxledger

#endif // LXLEDGER_CONFIG_HPP

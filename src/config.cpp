// =============================================================================
// config.cpp - JSON configuration loading
// =============================================================================

#include "lxledger/config.hpp"
#include "lxledger/math.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace lxledger {

namespace {

using json = nlohmann::json;

Address read_address(const json& section, const char* key, const Address& fallback) {
    auto it = section.find(key);
    if (it == section.end()) return fallback;
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("address expected for ") + key);
    }
    auto parsed = addresses::parse(it->get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("malformed address for " + std::string(key) +
                                    ": " + it->get<std::string>());
    }
    return *parsed;
}

// Amounts may be JSON numbers or decimal strings (for values above 2^64)
U128 read_amount(const json& section, const char* key, U128 fallback) {
    auto it = section.find(key);
    if (it == section.end()) return fallback;
    if (it->is_number_unsigned()) {
        return static_cast<U128>(it->get<uint64_t>());
    }
    if (it->is_string()) {
        auto parsed = math::parse_u128(it->get<std::string>());
        if (parsed) return *parsed;
    }
    throw std::invalid_argument(std::string("non-negative integer expected for ") + key);
}

} // anonymous namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw std::invalid_argument("config root must be an object");
    }

    Config config;

    if (auto it = root.find("general"); it != root.end() && it->is_object()) {
        if (auto level = it->find("log_level"); level != it->end() && level->is_string()) {
            config.general.log_level = level->get<std::string>();
        }
    }

    if (auto it = root.find("lending"); it != root.end() && it->is_object()) {
        const json& s = *it;
        config.lending.owner = read_address(s, "owner", config.lending.owner);
        config.lending.custodian = read_address(s, "custodian", config.lending.custodian);
        config.lending.settlement_asset =
            Asset(read_address(s, "settlement_asset", config.lending.settlement_asset.addr));
        config.lending.interest_rate_per_block =
            read_amount(s, "interest_rate_per_block", config.lending.interest_rate_per_block);
        config.lending.max_loan_amount =
            read_amount(s, "max_loan_amount", config.lending.max_loan_amount);
    }

    if (auto it = root.find("amm"); it != root.end() && it->is_object()) {
        const json& s = *it;
        config.amm.owner = read_address(s, "owner", config.amm.owner);
        config.amm.custodian = read_address(s, "custodian", config.amm.custodian);
        config.amm.default_fee_rate =
            read_amount(s, "default_fee_rate", config.amm.default_fee_rate);
        if (config.amm.default_fee_rate > constants::MAX_FEE_RATE) {
            throw std::invalid_argument("amm.default_fee_rate exceeds " +
                                        math::to_string(constants::MAX_FEE_RATE));
        }
    }

    return config;
}

} // namespace lxledger

// =============================================================================
// types.cpp - Address text form and error names
// =============================================================================

#include "lxledger/types.hpp"

namespace lxledger {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

namespace addresses {

std::string to_hex(const Address& addr) {
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

std::optional<Address> parse(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    Address addr{};
    if (text.size() != addr.size() * 2) return std::nullopt;

    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(text[2 * i]);
        int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case UNAUTHORIZED: return "UNAUTHORIZED";
        case INVALID_AMOUNT: return "INVALID_AMOUNT";
        case INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case NOT_FOUND: return "NOT_FOUND";
        case INVALID_COLLATERAL_RATIO: return "INVALID_COLLATERAL_RATIO";
        case SLIPPAGE_EXCEEDED: return "SLIPPAGE_EXCEEDED";
        case INSUFFICIENT_LIQUIDITY: return "INSUFFICIENT_LIQUIDITY";
        case ALREADY_EXISTS: return "ALREADY_EXISTS";
        case INVALID_ASSET: return "INVALID_ASSET";
        case POOL_INACTIVE: return "POOL_INACTIVE";
        case TRANSFER_FAILED: return "TRANSFER_FAILED";
        case ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case ARITHMETIC_UNDERFLOW: return "ARITHMETIC_UNDERFLOW";
        default: return "UNKNOWN";
    }
}

} // namespace errors

} // namespace lxledger

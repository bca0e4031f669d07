#ifndef LXLEDGER_TYPES_HPP
#define LXLEDGER_TYPES_HPP

#include <cstdint>
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace lxledger {

// =============================================================================
// Identities (20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Build an address whose low 8 bytes hold `n` (big-endian)
constexpr Address from_u64(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) if (b != 0) return false;
    return true;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts an optional "0x" prefix; exactly 40 hex digits
std::optional<Address> parse(std::string_view text);

} // namespace addresses

// =============================================================================
// Integer Amounts
// =============================================================================

using U128 = unsigned __int128;
using I128 = __int128;

constexpr U128 U128_MAX = ~U128(0);

// =============================================================================
// Asset Type (Token Address)
// =============================================================================

struct Asset {
    Address addr;

    Asset() : addr{} {}
    explicit Asset(const Address& a) : addr(a) {}

    bool operator==(const Asset& other) const { return addr == other.addr; }
    bool operator!=(const Asset& other) const { return addr != other.addr; }
    bool operator<(const Asset& other) const { return addr < other.addr; }
};

// =============================================================================
// Transaction Context
// =============================================================================

// Acting identity and the injected block clock for one operation
struct TxContext {
    Address sender;
    uint64_t block_height;
};

// =============================================================================
// Protocol Constants
// =============================================================================

namespace constants {

// Lending
constexpr U128 MIN_COLLATERAL_RATIO = 150;      // percent
constexpr U128 INTEREST_DENOMINATOR = 10000;
constexpr U128 DEFAULT_INTEREST_RATE = 5;       // per block, /10000
constexpr U128 DEFAULT_MAX_LOAN_AMOUNT = 1000000000000ULL;

// AMM
constexpr U128 FEE_DENOMINATOR = 10000;
constexpr U128 DEFAULT_FEE_RATE = 30;           // 0.30%
constexpr U128 MAX_FEE_RATE = 1000;             // 10.00%
constexpr U128 PRECISION = 1000000;             // 6-decimal fixed point
constexpr U128 MIN_LIQUIDITY = 1000;
constexpr size_t MAX_POOLS_PER_USER = 20;
constexpr U128 BPS = 10000;

} // namespace constants

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t UNAUTHORIZED = -1;
constexpr int32_t INVALID_AMOUNT = -2;
constexpr int32_t INSUFFICIENT_BALANCE = -3;
constexpr int32_t NOT_FOUND = -4;
constexpr int32_t INVALID_COLLATERAL_RATIO = -5;
constexpr int32_t SLIPPAGE_EXCEEDED = -6;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -7;
constexpr int32_t ALREADY_EXISTS = -8;
constexpr int32_t INVALID_ASSET = -10;
constexpr int32_t POOL_INACTIVE = -11;
constexpr int32_t TRANSFER_FAILED = -20;
constexpr int32_t ARITHMETIC_OVERFLOW = -30;
constexpr int32_t ARITHMETIC_UNDERFLOW = -31;

const char* name(int32_t code);
}

} // namespace lxledger

#endif // LXLEDGER_TYPES_HPP

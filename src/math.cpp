// =============================================================================
// math.cpp - Integer square root and 256-bit ratio math
// =============================================================================

#include "lxledger/math.hpp"

#include <algorithm>

namespace lxledger {
namespace math {

namespace {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits
};

// Multiply two U128 values to produce U256
U256 mul_u128(U128 a, U128 b) {
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// Restoring long division of U256 by U128; requires num.hi < denom
U128 div_u256_u128(U256 num, U128 denom) {
    U128 rem = num.hi;
    U128 quot = 0;

    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (carry || rem >= denom) {
            rem -= denom;  // Wraps back into range when carry is set
            quot |= 1;
        }
    }
    return quot;
}

} // anonymous namespace

std::optional<U128> mul_div(U128 a, U128 b, U128 denom) {
    if (denom == 0) return std::nullopt;

    U256 product = mul_u128(a, b);
    if (product.hi == 0) return product.lo / denom;
    if (product.hi >= denom) return std::nullopt;

    return div_u256_u128(product, denom);
}

U128 isqrt(U128 x) {
    if (x < 2) return x;

    U128 guess = x / 2;
    for (;;) {
        U128 next = (guess + x / guess) / 2;
        if (next == guess) return guess;
        // Guesses started increasing: the integer iteration is cycling
        // between floor(sqrt(x)) and floor(sqrt(x)) + 1
        if (next > guess) return guess;
        guess = next;
    }
}

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<U128> parse_u128(std::string_view text) {
    if (text.empty()) return std::nullopt;

    U128 v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        auto scaled = checked_mul(v, 10);
        if (!scaled) return std::nullopt;
        auto next = checked_add(*scaled, static_cast<U128>(c - '0'));
        if (!next) return std::nullopt;
        v = *next;
    }
    return v;
}

} // namespace math
} // namespace lxledger

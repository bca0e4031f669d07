#ifndef LXLEDGER_MATH_HPP
#define LXLEDGER_MATH_HPP

#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace lxledger {
namespace math {

// =============================================================================
// Checked 128-bit Arithmetic
// =============================================================================

inline std::optional<U128> checked_add(U128 a, U128 b) {
    U128 r = a + b;
    if (r < a) return std::nullopt;
    return r;
}

inline std::optional<U128> checked_sub(U128 a, U128 b) {
    if (b > a) return std::nullopt;
    return a - b;
}

inline std::optional<U128> checked_mul(U128 a, U128 b) {
    if (a == 0 || b == 0) return U128(0);
    U128 r = a * b;
    if (r / a != b) return std::nullopt;
    return r;
}

// floor(a * b / denom) with a 256-bit intermediate.
// nullopt when denom == 0 or the quotient does not fit in 128 bits.
std::optional<U128> mul_div(U128 a, U128 b, U128 denom);

// Integer square root by Babylonian iteration from x/2, stopping when two
// successive guesses are equal. Always returns floor(sqrt(x)).
U128 isqrt(U128 x);

// =============================================================================
// Decimal Text Form
// =============================================================================

std::string to_string(U128 v);
std::optional<U128> parse_u128(std::string_view text);

} // namespace math
} // namespace lxledger

#endif // LXLEDGER_MATH_HPP

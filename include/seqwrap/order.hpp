#pragma once

#include <compare>
#include <cstdint>
#include <string_view>


namespace seqwrap {

// ===============================================
// SERIAL ORDER
// ===============================================
//
// Result of comparing two serial numbers under RFC 1982.
//
// Undefined is reported for antipodal pairs (circular distance == M/2).
// It is an outcome, not an error: the RFC defines no order there and
// callers decide how to treat it.
//
enum class Order : std::uint8_t {
    Less      = 0,
    Equal     = 1,
    Greater   = 2,
    Undefined = 3
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Order o) noexcept {
    switch (o) {
        case Order::Less:       return "Less";
        case Order::Equal:      return "Equal";
        case Order::Greater:    return "Greater";
        case Order::Undefined:  return "Undefined";
        default:                return "unknown";
    }
}

// Operator symbol, as printed by the tools ("<", "==", ">", "<?>")
[[nodiscard]]
inline constexpr std::string_view to_symbol(Order o) noexcept {
    switch (o) {
        case Order::Less:       return "<";
        case Order::Equal:      return "==";
        case Order::Greater:    return ">";
        case Order::Undefined:  return "<?>";
        default:                return "?";
    }
}

// Swap Less and Greater: compare(b, a) == reverse(compare(a, b))
[[nodiscard]]
inline constexpr Order reverse(Order o) noexcept {
    switch (o) {
        case Order::Less:       return Order::Greater;
        case Order::Greater:    return Order::Less;
        default:                return o;
    }
}

[[nodiscard]]
inline constexpr std::partial_ordering to_partial_ordering(Order o) noexcept {
    switch (o) {
        case Order::Less:       return std::partial_ordering::less;
        case Order::Equal:      return std::partial_ordering::equivalent;
        case Order::Greater:    return std::partial_ordering::greater;
        default:                return std::partial_ordering::unordered;
    }
}

} // namespace seqwrap

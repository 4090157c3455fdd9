#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>

#include "seqwrap/error.hpp"
#include "seqwrap/order.hpp"
#include "seqwrap/storage.hpp"


namespace seqwrap {

/*
================================================================================
SerialNumber<T, BITS>
================================================================================

RFC 1982 serial number of BITS bits, stored in an unsigned T.

Ordering
--------
Two serial numbers are ordered by their circular distance:

    diff = (a - b) mod M

    diff == 0          a == b
    0 < diff < M/2     a >  b
    diff == M/2        undefined (antipodal pair)
    M/2 < diff < M     a <  b

compare() reports the antipodal case as Order::Undefined. operator<=> maps
it to std::partial_ordering::unordered, so <, <=, > and >= are all false for
an antipodal pair. No tie-break is applied.

The order is not transitive around the full circle: do not use SerialNumber
as the key of std::map / std::set. Hashed containers are fine.

Addition
--------
operator+ wraps modulo M and never traps. The result is guaranteed to be
greater than the operand only for 0 < k <= max_increment() (= M/2 - 1);
beyond that bound the value is deterministic but its order relative to the
operand is unspecified. try_add() is the checked variant and rejects such
increments with Error::IncrementOutOfRange.

Properties
----------
- Trivially copyable, sizeof(T), no allocations.
- All operations constexpr and noexcept.
- Immutable: advancing yields a new value.
================================================================================
*/

template<SerialStorage T, unsigned BITS = std::numeric_limits<T>::digits>
class SerialNumber {
public:
    using traits     = serial_traits<T, BITS>;
    using value_type = T;

    constexpr SerialNumber() noexcept = default;

    // Sub-width serials keep only the low BITS bits
    explicit constexpr SerialNumber(T raw) noexcept
        : value_(traits::reduce(raw)) {}

    [[nodiscard]]
    static constexpr SerialNumber from(T raw) noexcept {
        return SerialNumber(raw);
    }

    // -------------------------------------------------------------------------
    // Static properties of the serial space
    // -------------------------------------------------------------------------
    [[nodiscard]] static constexpr unsigned bits() noexcept { return BITS; }
    [[nodiscard]] static constexpr T modulus_mask() noexcept { return traits::mask; }
    [[nodiscard]] static constexpr T half_range() noexcept { return traits::half_range; }
    [[nodiscard]] static constexpr T max_increment() noexcept { return traits::max_increment; }

    [[nodiscard]]
    constexpr T value() const noexcept {
        return value_;
    }

    explicit constexpr operator T() const noexcept {
        return value_;
    }

    // -------------------------------------------------------------------------
    // Comparison
    // -------------------------------------------------------------------------
    [[nodiscard]]
    constexpr Order compare(const SerialNumber& other) const noexcept {
        const T diff = traits::wrapping_sub(value_, other.value_);
        if (diff == T{0}) {
            return Order::Equal;
        }
        if (diff < traits::half_range) {
            return Order::Greater;
        }
        if (diff == traits::half_range) {
            return Order::Undefined;
        }
        return Order::Less;
    }

    friend constexpr bool operator==(const SerialNumber&, const SerialNumber&) noexcept = default;

    friend constexpr std::partial_ordering operator<=>(const SerialNumber& lhs, const SerialNumber& rhs) noexcept {
        return to_partial_ordering(lhs.compare(rhs));
    }

    // -------------------------------------------------------------------------
    // Addition
    // -------------------------------------------------------------------------

    // Wrapping addition. Order relative to *this is guaranteed only for
    // k <= max_increment().
    friend constexpr SerialNumber operator+(const SerialNumber& lhs, T k) noexcept {
        return SerialNumber(traits::wrapping_add(lhs.value_, traits::reduce(k)));
    }

    // Checked addition. On error `out` is left untouched.
    [[nodiscard]]
    constexpr Error try_add(T k, SerialNumber& out) const noexcept {
        if (k > traits::max_increment) {
            return Error::IncrementOutOfRange;
        }
        out = *this + k;
        return Error::None;
    }

    [[nodiscard]]
    constexpr SerialNumber next() const noexcept {
        return *this + T{1};
    }

private:
    T value_{0};
};


// -----------------------------------------------------------------------------
// Free functions
// -----------------------------------------------------------------------------

template<SerialStorage T, unsigned BITS>
[[nodiscard]]
inline constexpr Order compare(const SerialNumber<T, BITS>& a, const SerialNumber<T, BITS>& b) noexcept {
    return a.compare(b);
}

// False only for antipodal pairs
template<SerialStorage T, unsigned BITS>
[[nodiscard]]
inline constexpr bool comparable(const SerialNumber<T, BITS>& a, const SerialNumber<T, BITS>& b) noexcept {
    return a.compare(b) != Order::Undefined;
}

template<SerialStorage T, unsigned BITS>
inline std::ostream& operator<<(std::ostream& os, const SerialNumber<T, BITS>& s) {
    return os << +s.value();
}

template<SerialStorage T, unsigned BITS>
inline std::string to_string(const SerialNumber<T, BITS>& s) {
    return std::to_string(s.value());
}


// -----------------------------------------------------------------------------
// Common widths
// -----------------------------------------------------------------------------
using Serial8  = SerialNumber<std::uint8_t>;
using Serial16 = SerialNumber<std::uint16_t>;
using Serial24 = SerialNumber<std::uint32_t, 24>;
using Serial32 = SerialNumber<std::uint32_t>;
using Serial64 = SerialNumber<std::uint64_t>;

// Layout checks
static_assert(sizeof(Serial8)  == sizeof(std::uint8_t));
static_assert(sizeof(Serial16) == sizeof(std::uint16_t));
static_assert(sizeof(Serial32) == sizeof(std::uint32_t));
static_assert(sizeof(Serial64) == sizeof(std::uint64_t));
static_assert(std::is_trivially_copyable_v<Serial64>);

} // namespace seqwrap


// -----------------------------------------------------------------------------
// std integration
// -----------------------------------------------------------------------------

namespace std {

template<seqwrap::SerialStorage T, unsigned BITS>
struct hash<seqwrap::SerialNumber<T, BITS>> {
    size_t operator()(const seqwrap::SerialNumber<T, BITS>& s) const noexcept {
        return hash<T>{}(s.value());
    }
};

template<seqwrap::SerialStorage T, unsigned BITS>
struct formatter<seqwrap::SerialNumber<T, BITS>> : formatter<T> {
    template<class FormatContext>
    auto format(const seqwrap::SerialNumber<T, BITS>& s, FormatContext& ctx) const {
        return formatter<T>::format(s.value(), ctx);
    }
};

} // namespace std

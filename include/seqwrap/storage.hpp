#pragma once

#include <cstdint>
#include <concepts>
#include <limits>
#include <type_traits>


namespace seqwrap {

// ----------------------------------------------------------------------------
// Storage concept
// ----------------------------------------------------------------------------

template<class T>
concept SerialStorage =
    std::same_as<T, std::uint8_t>  ||
    std::same_as<T, std::uint16_t> ||
    std::same_as<T, std::uint32_t> ||
    std::same_as<T, std::uint64_t>;


/*
================================================================================
serial_traits<T, BITS>
================================================================================

Modular arithmetic over a BITS-wide serial space stored in an unsigned T.

    M             = 2^BITS
    mask          = M - 1
    half_range    = M / 2
    max_increment = M / 2 - 1

All results are reduced to T before masking, so uint8_t / uint16_t operands
never leak integer promotion into the result.
================================================================================
*/

template<SerialStorage T, unsigned BITS>
struct serial_traits {
    static constexpr unsigned storage_bits = std::numeric_limits<T>::digits;

    static_assert(BITS >= 1, "serial width must be at least 1 bit");
    static_assert(BITS <= storage_bits, "serial width exceeds storage width");

    using value_type = T;

    static constexpr unsigned bits = BITS;
    static constexpr bool full_width = (BITS == storage_bits);

    static constexpr T mask = full_width
        ? std::numeric_limits<T>::max()
        : static_cast<T>((T{1} << BITS) - T{1});

    static constexpr T half_range = static_cast<T>(T{1} << (BITS - 1));

    static constexpr T max_increment = static_cast<T>(half_range - T{1});

    [[nodiscard]]
    static constexpr T reduce(T v) noexcept {
        if constexpr (full_width) {
            return v;
        } else {
            return static_cast<T>(v & mask);
        }
    }

    [[nodiscard]]
    static constexpr T wrapping_add(T a, T b) noexcept {
        return reduce(static_cast<T>(a + b));
    }

    [[nodiscard]]
    static constexpr T wrapping_sub(T a, T b) noexcept {
        return reduce(static_cast<T>(a - b));
    }
};

} // namespace seqwrap

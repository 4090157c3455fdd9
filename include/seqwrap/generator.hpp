#pragma once

#include <cstdint>
#include <type_traits>

#include "seqwrap/serial_number.hpp"
#include "seqwrap/log/logger.hpp"


namespace seqwrap {

namespace detail {

template<class S>
struct is_serial_number : std::false_type {};

template<SerialStorage T, unsigned BITS>
struct is_serial_number<SerialNumber<T, BITS>> : std::true_type {};

} // namespace detail


// Monotonic serial number generator (single-threaded).
// Hands out consecutive serial numbers and wraps from M - 1 back to 0.
template<class S>
class alignas(64) SerialGenerator {
    static_assert(detail::is_serial_number<S>::value, "SerialGenerator requires a SerialNumber type");

    S next_;
    std::uint64_t wraps_{0};

public:
    using serial_type = S;

    explicit constexpr SerialGenerator(S start = S{}) noexcept : next_(start) {}
    // Disable copy semantics
    SerialGenerator(const SerialGenerator&) = delete;
    SerialGenerator& operator=(const SerialGenerator&) = delete;
    // Enable move semantics
    SerialGenerator(SerialGenerator&&) noexcept = default;
    SerialGenerator& operator=(SerialGenerator&&) noexcept = default;

    // Return next serial number and advance
    inline S next() {
        const S issued = next_;
        next_ = issued.next();
        if (next_.value() == 0) {
            ++wraps_;
            SW_DEBUG("[seqwrap] " << S::bits() << "-bit generator wrapped after " << issued
                     << " (wraps=" << wraps_ << ")");
        }
        return issued;
    }

    // Peek at the current serial number without advancing
    [[nodiscard]]
    inline S current() const noexcept {
        return next_;
    }

    // Number of times the generator went from M - 1 to 0
    [[nodiscard]]
    inline std::uint64_t wraps() const noexcept {
        return wraps_;
    }

    inline void reset(S start = S{}) noexcept {
        next_ = start;
        wraps_ = 0;
    }
};

static_assert(alignof(SerialGenerator<Serial32>) == 64, "SerialGenerator must be cache-line aligned");

} // namespace seqwrap

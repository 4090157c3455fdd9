#pragma once

#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <stdexcept>
#include <string>

#include "seqwrap/serial_number.hpp"
#include "seqwrap/log/logger.hpp"
#include "common/cli/seqcmp_params.hpp"


namespace seqwrap::examples::seqcmp {

// Exit codes reported by the seqcmp tool
inline constexpr int kExitOrdered   = 0;
inline constexpr int kExitRejected  = 2;
inline constexpr int kExitUndefined = 3;

// -------------------------------------------------------------
// Outcome of one seqcmp run (width-erased)
// -------------------------------------------------------------
struct Outcome {
    unsigned bits           = 0;
    std::uint64_t lhs       = 0;    // after masking
    std::uint64_t rhs       = 0;    // after masking
    std::uint64_t distance  = 0;    // (A - B) mod M
    std::uint64_t half      = 0;    // M / 2
    Order order             = Order::Equal;

    bool has_sum            = false;
    std::uint64_t increment = 0;
    std::uint64_t sum       = 0;
    Order sum_order         = Order::Equal;   // order of A + K relative to A
    Error add_error         = Error::None;
};

template<class S>
[[nodiscard]]
inline Outcome evaluate_as(const cli::seqcmp::Params& params) {
    using T = typename S::value_type;

    const S a{static_cast<T>(params.lhs)};
    const S b{static_cast<T>(params.rhs)};

    Outcome out;
    out.bits     = S::bits();
    out.lhs      = a.value();
    out.rhs      = b.value();
    out.distance = S::traits::wrapping_sub(a.value(), b.value());
    out.half     = S::half_range();
    out.order    = compare(a, b);

    SW_DEBUG("[seqcmp] " << out.bits << "-bit: (" << a << " - " << b << ") mod M = "
             << out.distance << ", M/2 = " << out.half);

    if (params.has_increment) {
        const T k = static_cast<T>(params.increment);
        out.has_sum   = true;
        out.increment = params.increment;

        S sum = a;
        if (params.strict) {
            out.add_error = a.try_add(k, sum);
        } else {
            if (k > S::max_increment()) {
                SW_WARN("[seqcmp] increment " << params.increment << " exceeds M/2 - 1 = "
                        << +S::max_increment() << "; order of the result is unspecified");
            }
            sum = a + k;
        }
        out.sum       = sum.value();
        out.sum_order = compare(sum, a);
    }
    return out;
}

// Dispatch the runtime width onto the matching serial type.
// Throws std::invalid_argument for a width with no serial type.
[[nodiscard]]
inline Outcome evaluate(const cli::seqcmp::Params& params) {
    switch (params.bits) {
        case 8:  return evaluate_as<Serial8>(params);
        case 16: return evaluate_as<Serial16>(params);
        case 24: return evaluate_as<Serial24>(params);
        case 32: return evaluate_as<Serial32>(params);
        case 64: return evaluate_as<Serial64>(params);
        default:
            throw std::invalid_argument("unsupported serial width: " + std::to_string(params.bits));
    }
}

[[nodiscard]]
inline int exit_code(const Outcome& o) noexcept {
    if (o.has_sum && o.add_error != Error::None) {
        return kExitRejected;
    }
    if (o.order == Order::Undefined) {
        return kExitUndefined;
    }
    return kExitOrdered;
}

inline void print(const Outcome& o, std::ostream& os) {
    os << o.lhs << " " << to_symbol(o.order) << " " << o.rhs
       << "  (" << o.bits << "-bit, distance " << o.distance << ", half range " << o.half << ")\n";
    if (!o.has_sum) {
        return;
    }
    if (o.add_error != Error::None) {
        os << o.lhs << " + " << o.increment << " rejected: " << to_string(o.add_error) << "\n";
        return;
    }
    os << o.lhs << " + " << o.increment << " = " << o.sum
       << "  (" << to_symbol(o.sum_order) << " " << o.lhs << ")\n";
}

} // namespace seqwrap::examples::seqcmp

#pragma once

#include <cstdint>
#include <string_view>

namespace seqwrap {

/*
===============================================================================
 seqwrap::Error
===============================================================================

Serial arithmetic error classification.

Construction and comparison are total and never report errors. The only
fallible operation is checked addition, which refuses increments that would
leave the result's order relative to the operand undefined by RFC 1982.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Contract errors (caller responsibility) ----------------------------
    IncrementOutOfRange,   // Increment exceeds M/2 - 1 (RFC 1982, section 3.1)
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                 return "None";
    case Error::IncrementOutOfRange:  return "IncrementOutOfRange";
    default:                          return "Unknown";
    }
}

} // namespace seqwrap

#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include <CLI/CLI.hpp>

#include "seqwrap/log/logger.hpp"


namespace seqwrap::examples::cli {

// -------------------------------------------------------------
// Serial width validator
// -------------------------------------------------------------
inline auto bits_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            auto b = std::stoul(value);
            switch (b) {
                case 8:
                case 16:
                case 24:
                case 32:
                case 64:
                    return {};
                default:
                    return "Width must be one of: 8, 16, 24, 32, 64";
            }
        } catch (const std::exception&) {
            return "Width must be a valid integer";
        }
    },
    "Serial width validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        seqwrap::log::Level lvl;
        if (seqwrap::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal";
    },
    "Log level validator"
);


// -------------------------------------------------------------
// Largest raw value accepted for a serial width
// -------------------------------------------------------------
// Sub-width serials accept any value of their storage type (it is masked).
[[nodiscard]]
inline constexpr std::uint64_t storage_max(unsigned bits) noexcept {
    if (bits <= 8)  return std::numeric_limits<std::uint8_t>::max();
    if (bits <= 16) return std::numeric_limits<std::uint16_t>::max();
    if (bits <= 32) return std::numeric_limits<std::uint32_t>::max();
    return std::numeric_limits<std::uint64_t>::max();
}

} // namespace seqwrap::examples::cli

#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"
#include "common/cli/validators.hpp"

namespace seqwrap::examples::cli::walk {

struct Params {
    std::uint32_t start   = 250;
    std::uint32_t steps   = 600;
    std::string log_level = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n  Start     : " << start
           << "\n  Steps     : " << steps
           << "\n  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--start", params.start, "First 8-bit serial number handed out")->check(CLI::Range(0u, 255u))->default_val(params.start);
    app.add_option("-n,--steps", params.steps, "Number of serial numbers to generate")->check(CLI::PositiveNumber)->default_val(params.steps);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Walks an 8-bit serial generator across the wraparound boundary.\n"
        "Every value must compare greater than its predecessor."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e, std::cout, std::cerr);
        std::exit(EXIT_FAILURE);
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace seqwrap::examples::cli::walk

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


namespace seqwrap::examples::cli::seqcmp {

    // -------------------------------------------------------------
    // seqcmp parameters
    // -------------------------------------------------------------
    struct Params {
        unsigned bits          = 32;
        std::uint64_t lhs      = 0;
        std::uint64_t rhs      = 0;
        bool has_increment     = false;
        std::uint64_t increment = 0;
        bool strict            = false;
        std::string log_level  = "info";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Width     : " << bits << " bits\n"
               << "  A         : " << lhs << "\n"
               << "  B         : " << rhs << "\n"
               << "  Add       : ";
            if (has_increment) { os << increment; } else { os << "-"; }
            os << "\n"
               << "  Strict    : " << (strict ? "true" : "false") << "\n"
               << "  Log Level : " << log_level << "\n";
        }
    };

    // -------------------------------------------------------------
    // Build CLI for seqcmp
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};

        app.add_option("-b,--bits", params.bits, "Serial width in bits (8, 16, 24, 32, 64)")->check(bits_validator)->default_val(params.bits);
        app.add_option("A", params.lhs, "Left-hand serial number")->required();
        app.add_option("B", params.rhs, "Right-hand serial number")->required();
        auto* add_opt = app.add_option("--add", params.increment, "Also compute A + K");
        app.add_flag("--strict", params.strict, "Reject increments above M/2 - 1 instead of wrapping");
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "Compares A to B under RFC 1982 serial number arithmetic.\n"
            "Exit status: 0 ordered, 2 increment rejected (--strict), 3 antipodal (undefined order)."
        );

        try {
            app.parse(argc, argv);
            params.has_increment = add_opt->count() > 0;

            const std::uint64_t max = storage_max(params.bits);
            if (params.lhs > max) {
                throw CLI::ValidationError("A", "value exceeds the storage type of a " + std::to_string(params.bits) + "-bit serial");
            }
            if (params.rhs > max) {
                throw CLI::ValidationError("B", "value exceeds the storage type of a " + std::to_string(params.bits) + "-bit serial");
            }
            if (params.has_increment && params.increment > max) {
                throw CLI::ValidationError("--add", "increment exceeds the storage type of a " + std::to_string(params.bits) + "-bit serial");
            }
        } catch (const CLI::ParseError& e) {
            app.exit(e, std::cout, std::cerr);
            std::exit(EXIT_FAILURE);
        }
        // -------------------------------------------------------------
        // Logging
        // -------------------------------------------------------------
        set_log_level(params.log_level);
        return params;
    }

} // namespace seqwrap::examples::cli::seqcmp

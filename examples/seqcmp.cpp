#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "seqwrap/log/logger.hpp"
#include "common/cli/seqcmp_params.hpp"
#include "common/seqcmp/evaluate.hpp"

using namespace seqwrap::examples;


int main(int argc, char** argv) {
    const auto params = cli::seqcmp::configure(argc, argv, "seqcmp - RFC 1982 serial number comparison");
    if (seqwrap::log::Logger::instance().enabled(seqwrap::log::Level::Debug)) {
        params.dump("[seqcmp] Parameters", std::cout);
    }

    seqcmp::Outcome outcome;
    try {
        outcome = seqcmp::evaluate(params);
    } catch (const std::invalid_argument& e) {
        SW_ERROR("[seqcmp] " << e.what());
        return EXIT_FAILURE;
    }
    seqcmp::print(outcome, std::cout);

    const int rc = seqcmp::exit_code(outcome);
    if (rc == seqcmp::kExitUndefined) {
        SW_WARN("[seqcmp] " << outcome.lhs << " and " << outcome.rhs
                << " are antipodal: RFC 1982 defines no order");
    } else if (rc == seqcmp::kExitRejected) {
        SW_ERROR("[seqcmp] increment " << outcome.increment << " rejected: "
                 << seqwrap::to_string(outcome.add_error));
    }
    return rc;
}

#include <cstdint>
#include <iostream>

#include "seqwrap.hpp"
#include "common/cli/walk_params.hpp"

using namespace seqwrap;


int main(int argc, char** argv) {
    const auto params = examples::cli::walk::configure(argc, argv, "sequence_walk - 8-bit serial numbers across the wrap");
    params.dump("[walk] Parameters", std::cout);

    SerialGenerator<Serial8> gen{Serial8{static_cast<std::uint8_t>(params.start)}};

    Serial8 prev = gen.next();
    std::uint32_t violations = 0;

    for (std::uint32_t i = 1; i < params.steps; ++i) {
        const Serial8 cur = gen.next();
        const Order o = compare(cur, prev);
        if (o != Order::Greater) {
            ++violations;
            SW_ERROR("[walk] " << cur << " " << to_symbol(o) << " " << prev << " (expected >)");
        } else {
            SW_TRACE("[walk] " << cur << " > " << prev);
        }
        prev = cur;
    }

    // first vs last stops reading as "older" once the walk exceeds M/2 steps
    const Serial8 first{static_cast<std::uint8_t>(params.start)};
    SW_INFO("[walk] generated " << params.steps << " serials, wraps=" << gen.wraps()
            << ", last=" << prev << ", first " << to_symbol(compare(first, prev)) << " last");

    if (violations != 0) {
        SW_ERROR("[walk] " << violations << " ordering violations");
        return 1;
    }
    return 0;
}

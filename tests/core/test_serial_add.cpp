#include <cstdint>
#include <iostream>
#include <limits>
#include <random>

#include "seqwrap/serial_number.hpp"
#include "common/test_check.hpp"

using namespace seqwrap;

using Serial14 = SerialNumber<std::uint32_t, 14>;


// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

// Modular closure: from(M - 1) + 1 == from(0)
template<class S>
void check_closure() {
    using T = typename S::value_type;
    const S top{S::modulus_mask()};
    TEST_CHECK(top + T{1} == S{0});
    TEST_CHECK(top.next() == S{0});
    TEST_CHECK(S{0} > top);
}

template<class S>
void check_forward_order(typename S::value_type a_raw, typename S::value_type k) {
    const S a{a_raw};
    const S sum = a + k;
    if (k == 0) {
        TEST_CHECK(sum == a);
    } else {
        TEST_CHECK(sum > a);
        TEST_CHECK(compare(sum, a) == Order::Greater);
    }
}


// -----------------------------------------------------------------------------
// Tests
// -----------------------------------------------------------------------------

void test_modular_closure() {
    std::cout << "[TEST] from(M - 1) + 1 == from(0) for every width..." << std::endl;

    check_closure<Serial8>();
    check_closure<Serial16>();
    check_closure<Serial24>();
    check_closure<Serial32>();
    check_closure<Serial64>();
    check_closure<Serial14>();

    TEST_CHECK(Serial32::from(1000) + 7u == Serial32::from(1007));
    TEST_CHECK(Serial32::from(4'294'967'290u) + 10u == Serial32::from(4));
    TEST_CHECK(Serial64::from(std::numeric_limits<std::uint64_t>::max()) + 2u == Serial64::from(1));
    TEST_CHECK(Serial14::from((1u << 14) - 1) + 2u == Serial14::from(1));

    std::cout << "[TEST] OK\n";
}

void test_addition_preserves_forward_order_8bit() {
    std::cout << "[TEST] a + k > a for every 8-bit a and 0 < k < 128..." << std::endl;

    for (unsigned a = 0; a <= 0xFF; ++a) {
        for (unsigned k = 0; k < 128; ++k) {
            check_forward_order<Serial8>(static_cast<std::uint8_t>(a), static_cast<std::uint8_t>(k));
        }
    }

    std::cout << "[TEST] OK\n";
}

void test_addition_preserves_forward_order_wide() {
    std::cout << "[TEST] a + k > a for sampled 16/32/64-bit values..." << std::endl;

    std::mt19937_64 rng{1982};

    for (int i = 0; i < 10'000; ++i) {
        const std::uint64_t a = rng();
        const std::uint64_t r = rng();

        check_forward_order<Serial16>(static_cast<std::uint16_t>(a),
                                      static_cast<std::uint16_t>(r % Serial16::half_range()));
        check_forward_order<Serial32>(static_cast<std::uint32_t>(a),
                                      static_cast<std::uint32_t>(r % Serial32::half_range()));
        check_forward_order<Serial64>(a, r % Serial64::half_range());
    }

    // Bound itself
    check_forward_order<Serial16>(0xFFFF, Serial16::max_increment());
    check_forward_order<Serial64>(std::numeric_limits<std::uint64_t>::max(), Serial64::max_increment());

    std::cout << "[TEST] OK\n";
}

void test_out_of_range_increment_wraps() {
    std::cout << "[TEST] operator+ beyond M/2 - 1 wraps deterministically..." << std::endl;

    const Serial16 a = Serial16::from(100);

    // k == M/2 lands on the antipode
    const Serial16 opposite = a + Serial16::half_range();
    TEST_CHECK(opposite.value() == 100 + 32768);
    TEST_CHECK(compare(opposite, a) == Order::Undefined);

    // k > M/2 compares as behind a
    const Serial16 behind = a + static_cast<std::uint16_t>(40000);
    TEST_CHECK(behind.value() == static_cast<std::uint16_t>(100 + 40000));
    TEST_CHECK(behind < a);

    // Sub-width: increments are reduced modulo M first
    TEST_CHECK(Serial14{5} + ((1u << 14) + 3u) == Serial14{8});

    std::cout << "[TEST] OK\n";
}

void test_try_add() {
    std::cout << "[TEST] try_add accepts k <= M/2 - 1 and rejects the rest..." << std::endl;

    const Serial8 a = Serial8::from(200);
    Serial8 out = Serial8::from(42);

    TEST_CHECK(a.try_add(127, out) == Error::None);
    TEST_CHECK(out == Serial8::from(static_cast<std::uint8_t>(200 + 127)));
    TEST_CHECK(out > a);

    out = Serial8::from(42);
    TEST_CHECK(a.try_add(128, out) == Error::IncrementOutOfRange);
    TEST_CHECK(out == Serial8::from(42));   // untouched

    TEST_CHECK(a.try_add(255, out) == Error::IncrementOutOfRange);
    TEST_CHECK(out == Serial8::from(42));

    TEST_CHECK(a.try_add(0, out) == Error::None);
    TEST_CHECK(out == a);

    Serial64 wide{};
    TEST_CHECK(Serial64::from(1).try_add(Serial64::max_increment(), wide) == Error::None);
    TEST_CHECK(Serial64::from(1).try_add(Serial64::half_range(), wide) == Error::IncrementOutOfRange);

    TEST_CHECK(to_string(Error::IncrementOutOfRange) == "IncrementOutOfRange");

    std::cout << "[TEST] OK\n";
}

void test_next_does_not_mutate() {
    std::cout << "[TEST] next() yields a new value..." << std::endl;

    const Serial32 x = Serial32::from(0xFFFF'FFFEu);
    const Serial32 y = x.next();
    TEST_CHECK(x.value() == 0xFFFF'FFFEu);
    TEST_CHECK(y == Serial32::from(0xFFFF'FFFFu));
    TEST_CHECK(y.next() == Serial32::from(0));
    TEST_CHECK(y.next() > y);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_modular_closure();
    test_addition_preserves_forward_order_8bit();
    test_addition_preserves_forward_order_wide();
    test_out_of_range_increment_wraps();
    test_try_add();
    test_next_does_not_mutate();
    std::cout << "[TEST] ALL SERIAL ADDITION TESTS PASSED!\n";
    return 0;
}

#pragma once

/*
===============================================================================
seqwrap: Public API Entry Point
===============================================================================

RFC 1982 serial number arithmetic for fixed-width wrapping counters.

    seqwrap::Serial16 a{1000}, b{33000};
    a < b;                      // true: b is ahead across the wrap
    seqwrap::compare(a, b);     // Order::Less

Antipodal pairs (distance exactly M/2) compare as Order::Undefined and every
relational operator returns false for them.
===============================================================================
*/

#include <seqwrap/storage.hpp>
#include <seqwrap/order.hpp>
#include <seqwrap/error.hpp>
#include <seqwrap/serial_number.hpp>
#include <seqwrap/generator.hpp>
#include <seqwrap/log/logger.hpp>

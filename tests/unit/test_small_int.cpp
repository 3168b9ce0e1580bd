// tests/unit/test_small_int.cpp — Bit-sized integers u1..u7 and u24.

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include <numx/numx.hpp>

namespace {

using numx::core::u1;
using numx::core::u24;
using numx::core::u3;
using numx::core::u4;
using numx::core::u5;
using numx::core::u7;

bool test_bounds() {
    bool ok = u1::max().value() == 1 && u3::max().value() == 7 && u5::max().value() == 31 &&
              u7::max().value() == 127 && u24::max().value() == 0xFFFFFFU;
    ok &= u4::BITS == 4 && u4::min() == u4::zero() && u4::one().value() == 1;
    ok &= u5::with(17).as_u8() == 17 && u24::with(0x123456U).as_u32() == 0x123456U;
    try {
        (void)u3::with(8);
        ok = false;
    } catch (const std::out_of_range&) {
    }
    try {
        (void)u4::try_from(16);
        ok = false;
    } catch (const numx::core::overflow_error& error) {
        ok &= error.max() == 15 && error.value() == 16;
        ok &= std::string(error.what()) ==
              "Unable to construct bit-sized integer from a value `16` overflowing max value `15`";
    }
    try {
        (void)u4::try_from(-1);
        ok = false;
    } catch (const std::overflow_error&) {
    }
    ok &= u4::try_from(std::uint64_t{9}).value() == 9;
    if (!ok) {
        std::cerr << "small int bounds mismatch\n";
    }
    return ok;
}

bool test_checked_families() {
    const u4 fourteen = u4::with(14);
    bool ok = fourteen.checked_add(1) == u4::with(15) && !fourteen.checked_add(2);
    ok &= u4::with(3).checked_sub(3) == u4::zero() && !u4::with(3).checked_sub(4);
    ok &= u4::with(5).checked_mul(3) == u4::with(15) && !u4::with(5).checked_mul(4);
    ok &= fourteen.saturating_add(9) == u4::max() && u4::with(2).saturating_sub(5) == u4::min();
    ok &= u4::with(6).saturating_mul(6) == u4::max();
    // Wrapping is modulo 2^BITS.
    ok &= fourteen.overflowing_add(3) == std::make_pair(u4::with(1), true);
    ok &= u4::with(2).overflowing_sub(3) == std::make_pair(u4::with(15), true);
    ok &= u4::with(5).overflowing_mul(4) == std::make_pair(u4::with(4), true);
    ok &= u4::with(5).overflowing_mul(3) == std::make_pair(u4::with(15), false);
    ok &= u1::one().wrapping_add(1) == u1::zero();
    ok &= u24::max().wrapping_add(1) == u24::zero();
    ok &= u24::zero().wrapping_sub(1) == u24::max();
    if (!ok) {
        std::cerr << "small int checked family mismatch\n";
    }
    return ok;
}

bool test_operators() {
    bool ok = (u5::with(20) + u5::with(11)) == u5::max();
    ok &= (u5::with(20) - u5::with(11)) == u5::with(9);
    ok &= (u5::with(6) * u5::with(5)) == u5::with(30);
    ok &= (u5::with(29) / u5::with(4)) == u5::with(7) && (u5::with(29) % u5::with(4)) == u5::with(1);
    ok &= (u5::with(0b10110) & u5::with(0b01111)) == u5::with(0b00110);
    ok &= (u5::with(0b10110) | u5::with(0b01001)) == u5::max();
    ok &= (u5::with(0b10110) ^ u5::with(0b10110)) == u5::zero();
    ok &= (u5::with(3) << 3) == u5::with(24) && (u5::with(24) >> 3) == u5::with(3);
    ok &= (u5::with(24) >> 9) == u5::zero();
    ok &= u5::with(3) < u5::with(4);

    u5 accumulator = u5::with(1);
    accumulator += u5::with(2);
    accumulator *= u5::with(5);
    accumulator -= u5::with(1);
    ok &= accumulator == u5::with(14);

    try {
        (void)(u5::max() + u5::one());
        ok = false;
    } catch (const numx::core::overflow_error&) {
    }
    try {
        (void)(u5::zero() - u5::one());
        ok = false;
    } catch (const std::overflow_error&) {
    }
    try {
        (void)(u5::with(3) << 4);
        ok = false;
    } catch (const std::overflow_error&) {
    }
    ok &= (u7::with(1) << 6) == u7::with(64) && (u7::zero() << 200) == u7::zero();
    ok &= (u24::with(1) << 23) == u24::with(0x800000U);
    for (const unsigned shift : {1U, 7U, 58U, 64U, 300U}) {
        try {
            (void)(u7::with(64) << shift);
            std::cerr << "u7 shift by " << shift << " dropped bits silently\n";
            ok = false;
        } catch (const std::overflow_error&) {
        }
    }
    try {
        (void)(u24::with(2) << 23);
        ok = false;
    } catch (const std::overflow_error&) {
    }
    ok &= u4::try_from(std::uint8_t{15}) == u4::max() && u4::try_from(15U) == u4::max();
    try {
        (void)(u5::one() / u5::zero());
        ok = false;
    } catch (const numx::core::div_error& error) {
        ok &= error.kind() == numx::core::div_error_kind::zero_div;
    }
    if (!ok) {
        std::cerr << "small int operator mismatch\n";
    }
    return ok;
}

bool test_text_and_hash() {
    bool ok = numx::io::to_string(u7::with(100)) == "100" &&
              numx::io::to_string(u7::with(100), 16) == "64";
    ok &= numx::io::from_string<u7>("127") == u7::max();
    ok &= numx::io::from_string<u24>("0xABCDEF", 0) == u24::with(0xABCDEFU);
    try {
        (void)numx::io::from_string<u7>("128");
        ok = false;
    } catch (const std::overflow_error&) {
    }
    std::unordered_set<u4> seen;
    for (unsigned value = 0; value <= u4::MAX_VALUE; ++value) {
        seen.insert(u4::with(static_cast<std::uint8_t>(value)));
    }
    ok &= seen.size() == 16;
    if (!ok) {
        std::cerr << "small int text/hash mismatch\n";
    }
    return ok;
}

} // namespace

int main() {
    if (!test_bounds() || !test_checked_families() || !test_operators() || !test_text_and_hash()) {
        return 1;
    }
    std::cout << "small_int passed\n";
    return 0;
}

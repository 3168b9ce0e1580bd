// tests/unit/test_signed_wide_int.cpp — Two's complement behaviour of i256/i512.

#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

#include <numx/numx.hpp>

namespace {

using numx::core::i256;
using numx::core::i512;
using numx::core::u256;

i256 num(std::int64_t value) { return i256(value); }

bool test_sign_queries() {
    bool ok = num(1).is_positive() && !num(-1).is_positive() && !num(0).is_positive();
    ok &= i256::max().is_positive() && !i256::min().is_positive() && i256::min().is_negative();
    ok &= num(1).checked_add(num(1)) == num(2);
    ok &= num(-5).abs() == num(5) && num(-5).unsigned_abs() == u256(5u);
    ok &= i256::min().unsigned_abs() == (u256::one() << 255);
    try {
        (void)i256::min().abs();
        ok = false;
    } catch (const std::overflow_error&) {
    }
    if (!ok) {
        std::cerr << "sign query mismatch\n";
    }
    return ok;
}

bool test_add_sub() {
    bool ok = num(1).overflowing_add(num(2)) == std::make_pair(num(3), false);
    ok &= num(-1).overflowing_add(num(2)) == std::make_pair(num(1), false);
    ok &= num(-1).overflowing_add(num(-1)) == std::make_pair(num(-2), false);
    ok &= num(0).overflowing_add(num(0)) == std::make_pair(num(0), false);
    ok &= num(1).overflowing_add(i256::max()) == std::make_pair(i256::min(), true);

    ok &= num(1).overflowing_sub(num(2)) == std::make_pair(num(-1), false);
    ok &= num(3).overflowing_sub(num(2)) == std::make_pair(num(1), false);
    ok &= num(-4).overflowing_sub(num(-1)) == std::make_pair(num(-3), false);
    ok &= num(0).overflowing_sub(i256::min()) == std::make_pair(i256::min(), true);
    ok &= num(-1).overflowing_sub(i256::min()) == std::make_pair(i256::max(), false);
    ok &= i256::max().overflowing_sub(i256::max()) == std::make_pair(num(0), false);
    ok &= num(-2).overflowing_sub(i256::max()) == std::make_pair(i256::max(), true);

    ok &= i256::max().saturating_add(num(1)) == i256::max();
    ok &= i256::min().saturating_add(num(-1)) == i256::min();
    ok &= i256::min().saturating_sub(num(1)) == i256::min();
    ok &= i256::max().saturating_sub(num(-1)) == i256::max();
    ok &= !i256::max().checked_add(num(1)) && !i256::min().checked_sub(num(1));
    ok &= i256::max().wrapping_add(num(1)) == i256::min();

    // Subtracting the minimum overflows only for non-negative minuends.
    ok &= !num(0).checked_sub(i256::min()) && num(-1).checked_sub(i256::min()) == i256::max();
    ok &= num(0).saturating_sub(i256::min()) == i256::max();
    ok &= num(-7).saturating_sub(i256::min()) == i256::max() - num(6);
    ok &= i256::min().overflowing_sub(i256::min()) == std::make_pair(num(0), false);
    ok &= num(-1) - i256::min() == i256::max();
    try {
        (void)(num(0) - i256::min());
        ok = false;
    } catch (const std::overflow_error&) {
    }
    if (!ok) {
        std::cerr << "signed add/sub mismatch\n";
    }
    return ok;
}

bool test_negation() {
    bool ok = -num(-1) == num(1) && -num(1) == num(-1) && -num(0) == num(0);
    ok &= i256::min() + num(1) == -i256::max();
    ok &= i256::min().wrapping_neg() == i256::min();
    try {
        (void)-i256::min();
        ok = false;
    } catch (const std::overflow_error&) {
    }
    if (!ok) {
        std::cerr << "negation mismatch\n";
    }
    return ok;
}

bool test_multiplication() {
    bool ok = num(3).overflowing_mul(num(-4)) == std::make_pair(num(-12), false);
    ok &= num(2).overflowing_mul(num(3)) == std::make_pair(num(6), false);
    ok &= num(-6).overflowing_mul(num(-5)) == std::make_pair(num(30), false);
    ok &= i256::max().overflowing_mul(num(2)) == std::make_pair(num(-2), true);
    ok &= i256::min().overflowing_mul(num(2)) == std::make_pair(num(0), true);
    ok &= i256::max().overflowing_mul(i256::max()) == std::make_pair(num(1), true);
    // The minimum is reachable without overflow.
    ok &= (i256::min() >> 1).overflowing_mul(num(2)) == std::make_pair(i256::min(), false);
    ok &= i256::min().overflowing_mul(num(1)) == std::make_pair(i256::min(), false);
    ok &= i256::min().overflowing_mul(num(-1)) == std::make_pair(i256::min(), true);
    ok &= i256::max().saturating_mul(num(-2)) == i256::min();
    ok &= i256::min().saturating_mul(num(-2)) == i256::max();
    if (!ok) {
        std::cerr << "signed multiplication mismatch\n";
    }
    return ok;
}

bool test_shifts() {
    bool ok = (num(-1) >> 1) == num(-1) && (num(-2) >> 1) == num(-1);
    ok &= (num(2) >> 1) == num(1) && (num(1) >> 1) == num(0);
    ok &= (num(-8) >> 300) == num(-1) && (num(8) >> 300) == num(0);
    ok &= (num(-1) << 4) == num(-16);
    if (!ok) {
        std::cerr << "signed shift mismatch\n";
    }
    return ok;
}

bool test_bits_required() {
    bool ok = i256(255).bits_required() == 8 && i256(256).bits_required() == 9 &&
              i256(300).bits_required() == 9 && i256(60000).bits_required() == 16 &&
              i256(70000).bits_required() == 17;
    ok &= num(-128).bits_required() == 8 && num(-129).bits_required() == 9;
    ok &= num(0).bits_required() == 0 && num(-1).bits_required() == 1 &&
          num(-2).bits_required() == 2;
    ok &= i256::min().bits_required() == 256 && i256::max().bits_required() == 255;
    if (!ok) {
        std::cerr << "signed bits_required mismatch\n";
    }
    return ok;
}

bool test_division() {
    bool ok = num(7).div_rem_checked(num(2)) == std::make_pair(num(3), num(1));
    ok &= num(7).div_rem_checked(num(-2)) == std::make_pair(num(-3), num(1));
    ok &= num(-7).div_rem_checked(num(2)) == std::make_pair(num(-3), num(-1));
    ok &= num(-7).div_rem_checked(num(-2)) == std::make_pair(num(3), num(-1));
    ok &= !i256::max().div_rem_checked(num(0)) && !i256::min().div_rem_checked(num(-1));
    ok &= i256::min().div_rem_checked(num(1)) == std::make_pair(i256::min(), num(0));
    ok &= i256::min() / num(2) == -(num(1) << 254);
    try {
        (void)i256::max().div_rem(num(0));
        ok = false;
    } catch (const numx::core::div_error& error) {
        ok &= error.kind() == numx::core::div_error_kind::zero_div;
    }
    try {
        (void)(i256::min() / num(-1));
        ok = false;
    } catch (const numx::core::div_error& error) {
        ok &= error.kind() == numx::core::div_error_kind::overflow;
    }
    if (!ok) {
        std::cerr << "signed division mismatch\n";
    }
    return ok;
}

bool test_ordering_and_conversion() {
    bool ok = i256::zero() < i256::one() && -i256::one() < i256::zero();
    ok &= i256::min() < i256::max() && i256::min() < i256::zero();
    ok &= num(200) < num(10000000) && num(-3) < num(87);
    const i512 widened = num(-42).resize<8, true>();
    ok &= widened == i512(-42) && widened.try_convert<4, true>() == num(-42);
    try {
        (void)num(-1).try_convert<4, false>();
        ok = false;
    } catch (const std::overflow_error&) {
    }
    ok &= std::numeric_limits<i256>::min() == i256::min() && std::numeric_limits<i256>::is_signed;
    if (!ok) {
        std::cerr << "signed ordering/conversion mismatch\n";
    }
    return ok;
}

} // namespace

int main() {
    if (!test_sign_queries() || !test_add_sub() || !test_negation() || !test_multiplication() ||
        !test_shifts() || !test_bits_required() || !test_division() ||
        !test_ordering_and_conversion()) {
        return 1;
    }
    std::cout << "signed_wide_int passed\n";
    return 0;
}

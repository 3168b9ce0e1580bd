// tests/unit/test_wide_int_ops.cpp — Arithmetic, shifts and division of unsigned wide integers.

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <numx/numx.hpp>

namespace {

using numx::core::u1024;
using numx::core::u256;
using numx::core::u512;

u256 words(std::uint64_t w0, std::uint64_t w1, std::uint64_t w2, std::uint64_t w3) {
    return u256::from_words({w0, w1, w2, w3});
}

bool check_equal(const u256& actual, const u256& expected, const std::string& label) {
    if (actual == expected) {
        return true;
    }
    std::cerr << label << " mismatch: " << numx::io::to_full_hex(actual)
              << " != " << numx::io::to_full_hex(expected) << "\n";
    return false;
}

bool test_arithmetic_chain() {
    const u256 init(0xDEADBEEFDEADBEEFULL);
    bool ok = true;
    const u256 add = init + init;
    ok &= check_equal(add, words(0xBD5B7DDFBD5B7DDEULL, 1, 0, 0), "add");
    const u256 shl = add << 88;
    ok &= check_equal(shl, words(0, 0xDFBD5B7DDE000000ULL, 0x1BD5B7D, 0), "shl");
    const u256 shr = shl >> 40;
    ok &= check_equal(shr, words(0x7DDE000000000000ULL, 0x0001BD5B7DDFBD5BULL, 0, 0), "shr");
    u256 incr = shr;
    incr += u256::one();
    ok &= check_equal(incr, words(0x7DDE000000000001ULL, 0x0001BD5B7DDFBD5BULL, 0, 0), "increment");
    const u256 sub = incr - init;
    ok &= check_equal(sub, words(0x9F30411021524112ULL, 0x0001BD5B7DDFBD5AULL, 0, 0), "sub");
    const u256 mult = sub * u256(300u);
    ok &= check_equal(mult, words(0x8C8C3EE70C644118ULL, 0x0209E7378231E632ULL, 0, 0), "mul");
    ok &= check_equal(u256(105u) / u256(5u), u256(21u), "105 / 5");
    ok &= check_equal(mult / u256(300u), sub, "mul / 300");
    ok &= check_equal(u256(105u) % u256(5u), u256::zero(), "105 % 5");
    ok &= check_equal(u256(35498456u) % u256(3435u), u256(1166u), "35498456 % 3435");
    const u256 rem_src = mult * u256(39842u) + u256(9054u);
    ok &= check_equal(rem_src % u256(39842u), u256(9054u), "remainder");
    ok &= check_equal(~u256::zero(), u256::max(), "bit inversion");
    return ok;
}

bool test_multiply_by_u32() {
    const u256 factor(0xFFFFFFFFu);
    const u256 u96 = u256(0xDEADBEEFDEADBEEFULL) * factor;
    const u256 u128 = u96 * factor;
    const u256 u160 = u128 * factor;
    const u256 u192 = u160 * factor;
    const u256 u224 = u192 * factor;
    const u256 full = u224 * factor;
    bool ok = check_equal(u96, words(0xffffffff21524111ULL, 0xDEADBEEE, 0, 0), "u96");
    ok &= check_equal(u128, words(0x21524111DEADBEEFULL, 0xDEADBEEE21524110ULL, 0, 0), "u128");
    ok &= check_equal(u160, words(0xBD5B7DDD21524111ULL, 0x42A4822200000001ULL, 0xDEADBEED, 0),
                      "u160");
    ok &= check_equal(u192,
                      words(0x63F6C333DEADBEEFULL, 0xBD5B7DDFBD5B7DDBULL, 0xDEADBEEC63F6C334ULL, 0),
                      "u192");
    ok &= check_equal(u224,
                      words(0x7AB6FBBB21524111ULL, 0xFFFFFFFBA69B4558ULL, 0x854904485964BAAAULL,
                            0xDEADBEEB),
                      "u224");
    ok &= check_equal(full,
                      words(0xA69B4555DEADBEEFULL, 0xA69B455CD41BB662ULL, 0xD41BB662A69B4550ULL,
                            0xDEADBEEAA69B455CULL),
                      "u256");
    return ok;
}

bool test_multiplication() {
    const u256 value(0xDEADBEEFDEADBEEFULL);
    const u256 squared = value * value;
    bool ok = check_equal(squared, words(0x048D1354216DA321ULL, 0xC1B1CD13A4D13D46ULL, 0, 0),
                          "square");
    ok &= check_equal(squared * squared,
                      words(0xF4E166AAD40D0A41ULL, 0xF5CF7F3618C2C886ULL, 0x4AFCFF6F0375C608ULL,
                            0x928D92B4D7F5DF33ULL),
                      "fourth power");
    return ok;
}

bool test_extreme_shifts() {
    const u256 init(0xDEADBEEFDEADBEEFULL);
    bool ok = check_equal(init << 64, words(0, 0xDEADBEEFDEADBEEFULL, 0, 0), "shl 64");
    const u256 add = (init << 64) + init;
    ok &= check_equal(add, words(0xDEADBEEFDEADBEEFULL, 0xDEADBEEFDEADBEEFULL, 0, 0), "sum");
    ok &= check_equal(add >> 0, add, "shr 0");
    ok &= check_equal(add << 0, add, "shl 0");
    ok &= check_equal(add >> 64, words(0xDEADBEEFDEADBEEFULL, 0, 0, 0), "shr 64");
    ok &= check_equal(add << 64, words(0, 0xDEADBEEFDEADBEEFULL, 0xDEADBEEFDEADBEEFULL, 0),
                      "shl 64 twice");
    ok &= check_equal(add << 256, u256::zero(), "shl 256");
    ok &= check_equal(add >> 1000, u256::zero(), "shr 1000");
    ok &= !add.checked_shl(256).has_value() && !add.checked_shr(300).has_value();
    ok &= add.checked_shl(1) == add << 1;
    return ok;
}

bool test_div_rem_checked() {
    const u256 zero = u256::zero();
    const u256 number_one(0xDEADBEEFu);
    const u256 number_two(UINT64_MAX);
    const u256 max = u256::max();
    bool ok = !max.div_rem_checked(zero) && !number_two.div_rem_checked(zero) &&
              !number_one.div_rem_checked(zero);
    ok &= zero.div_rem_checked(max) == std::make_pair(zero, zero);
    ok &= zero.div_rem_checked(number_one) == std::make_pair(zero, zero);
    ok &= max.div_rem_checked(number_one).has_value();
    ok &= number_two.div_rem_checked(number_one) ==
          std::make_pair(u256(UINT64_MAX / 0xDEADBEEFULL), u256(UINT64_MAX % 0xDEADBEEFULL));
    for (const u256& dividend : {max, number_one, number_two}) {
        try {
            (void)dividend.div_rem(zero);
            ok = false;
        } catch (const numx::core::div_error& error) {
            ok &= error.kind() == numx::core::div_error_kind::zero_div;
        }
    }
    if (!ok) {
        std::cerr << "div_rem_checked mismatch\n";
    }
    return ok;
}

bool test_overflow_families() {
    const u256 max = u256::max();
    const u256 one = u256::one();
    bool ok = max.overflowing_add(one) == std::make_pair(u256::zero(), true);
    ok &= u256::zero().overflowing_sub(one) == std::make_pair(max, true);
    ok &= u256(3u).overflowing_sub(one) == std::make_pair(u256(2u), false);
    ok &= max.overflowing_mul(u256(2u)) == std::make_pair(max - one, true);
    ok &= !max.checked_add(one) && !u256::zero().checked_sub(one) && !max.checked_mul(u256(2u));
    ok &= max.saturating_add(one) == max && u256::zero().saturating_sub(one) == u256::zero();
    ok &= max.saturating_mul(u256(3u)) == max;
    ok &= max.wrapping_add(u256(2u)) == one && u256::zero().wrapping_sub(one) == max;
    ok &= one.wrapping_neg() == max;
    try {
        (void)(max + one);
        ok = false;
    } catch (const std::overflow_error&) {
    }
    try {
        (void)(u256::zero() - one);
        ok = false;
    } catch (const std::overflow_error&) {
    }
    if (!ok) {
        std::cerr << "overflow family mismatch\n";
    }
    return ok;
}

bool test_width_conversions() {
    const u256 value = words(1, 2, 3, 4);
    const u512 widened = value.resize<8, false>();
    bool ok = widened.as_words()[3] == 4 && widened.as_words()[4] == 0;
    ok &= widened.try_convert<4, false>() == value;
    ok &= (widened << 300).resize<4, false>() == u256::zero();
    try {
        (void)(widened << 300).try_convert<4, false>();
        ok = false;
    } catch (const std::overflow_error&) {
    }
    try {
        (void)u256::max().try_convert<4, true>();
        ok = false;
    } catch (const std::overflow_error&) {
    }
    const u1024 big = u1024::one() << 1000;
    ok &= big.bits_required() == 1001 && (big >> 1000) == u1024::one();
    if (!ok) {
        std::cerr << "width conversion mismatch\n";
    }
    return ok;
}

} // namespace

int main() {
    if (!test_arithmetic_chain() || !test_multiply_by_u32() || !test_multiplication() ||
        !test_extreme_shifts() || !test_div_rem_checked() || !test_overflow_families() ||
        !test_width_conversions()) {
        return 1;
    }
    std::cout << "wide_int_ops passed\n";
    return 0;
}

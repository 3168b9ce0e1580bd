// tests/unit/test_ieee_float.cpp — Software binary32/binary64 against hardware and known strings.

#include <cmath>
#include <compare>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <random>
#include <string>

#include <numx/numx.hpp>

namespace {

using numx::fp::ieee_double;
using numx::fp::ieee_single;
using numx::fp::round_mode;
using numx::fp::status;

constexpr round_mode NEAREST = round_mode::nearest_ties_to_even;

double random_double(std::mt19937_64& rng) {
    std::uniform_real_distribution<double> mantissa(-1.0, 1.0);
    std::uniform_int_distribution<int> exponent(-60, 60);
    return std::ldexp(mantissa(rng), exponent(rng));
}

bool same_bits(double lhs, double rhs) {
    return ieee_double::from_double(lhs).bitwise_eq(ieee_double::from_double(rhs));
}

bool test_matches_hardware(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 512; ++iteration) {
        const double a = random_double(rng);
        const double b = random_double(rng);
        const double c = random_double(rng);
        const auto x = ieee_double::from_double(a);
        const auto y = ieee_double::from_double(b);
        const auto z = ieee_double::from_double(c);
        if (!same_bits((x + y).to_double(), a + b) || !same_bits((x - y).to_double(), a - b) ||
            !same_bits((x * y).to_double(), a * b) || !same_bits((x / y).to_double(), a / b)) {
            std::cerr << "basic arithmetic disagrees with hardware for " << a << ", " << b << "\n";
            return false;
        }
        if (!same_bits(x.mul_add_r(y, z, NEAREST).value.to_double(), std::fma(a, b, c))) {
            std::cerr << "fused multiply-add disagrees with std::fma\n";
            return false;
        }
        if (!same_bits(x.c_fmod(y).value.to_double(), std::fmod(a, b)) ||
            !same_bits(x.ieee_rem(y).value.to_double(), std::remainder(a, b))) {
            std::cerr << "remainder disagrees with libm for " << a << ", " << b << "\n";
            return false;
        }
        const float narrowed = static_cast<float>(a);
        bool loses_info = false;
        const auto single = x.convert_r<numx::fp::single_semantics>(NEAREST, loses_info).value;
        if (single.to_float() != narrowed || loses_info != (static_cast<double>(narrowed) != a)) {
            std::cerr << "double to single conversion mismatch\n";
            return false;
        }
    }
    return true;
}

bool test_parse_matches_strtod() {
    for (const char* text : {"0.1", "1e23", "2.2250738585072014e-308", "4.9406564584124654e-324",
                             "1.7976931348623157e308", "123456789012345678901234567890",
                             "-0.000001", "3.14159265358979323846264338327950288"}) {
        const double expected = std::strtod(text, nullptr);
        if (!same_bits(ieee_double::from_str(text).to_double(), expected)) {
            std::cerr << "decimal parse mismatch for " << text << "\n";
            return false;
        }
    }
    if (ieee_double::from_str("0x1.8p+1").to_double() != 3.0 ||
        ieee_double::from_str("-0x1p-2").to_double() != -0.25) {
        std::cerr << "hexadecimal parse mismatch\n";
        return false;
    }
    const auto inexact = ieee_single::from_str_r("0.1", NEAREST);
    if (inexact.flags != status::inexact || inexact.value.to_float() != 0.1f) {
        std::cerr << "single parse status mismatch\n";
        return false;
    }
    for (const char* bad : {"", "0x1.8", "1.2.3", "abc", "--1", "1e+x", "1e", "1e+", "0e-",
                            "1e99999z", "0x1p", "0x1p-"}) {
        try {
            (void)ieee_double::from_str(bad);
            std::cerr << "malformed literal accepted: '" << bad << "'\n";
            return false;
        } catch (const numx::fp::parse_error&) {
        }
    }
    if (!ieee_double::from_str("1e99999").is_infinite() ||
        !ieee_double::from_str("1e-99999").is_zero() ||
        ieee_double::from_str("25E-1").to_double() != 2.5) {
        std::cerr << "exponent clamp mismatch\n";
        return false;
    }
    return true;
}

bool test_to_string() {
    struct format_case {
        double value;
        unsigned precision;
        unsigned padding;
        const char* expected;
    };
    const format_case cases[] = {
        {10.0, 6, 3, "10"},
        {10.0, 6, 0, "1.0E+1"},
        {1.01e4, 5, 2, "10100"},
        {1.01e4, 4, 2, "1.01E+4"},
        {1.01e-2, 5, 2, "0.0101"},
        {1.01e-2, 5, 1, "1.01E-2"},
        {0.78539816339744830961, 0, 3, "0.78539816339744828"},
        {4.9406564584124654e-324, 0, 3, "4.9406564584124654E-324"},
        {873.1834, 0, 1, "873.18340000000001"},
        {873.1834, 0, 0, "8.7318340000000001E+2"},
    };
    for (const auto& entry : cases) {
        const std::string actual =
            ieee_double::from_double(entry.value).to_string(entry.precision, entry.padding);
        if (actual != entry.expected) {
            std::cerr << "to_string mismatch: " << actual << " != " << entry.expected << "\n";
            return false;
        }
    }
    if (ieee_double::from_double(1.0).to_hex_string() != "0x1p+0" ||
        ieee_double::from_double(-1.5).to_hex_string() != "-0x1.8p+0" ||
        ieee_double::zero().to_hex_string() != "0x0p+0" ||
        ieee_double::from_double(1.5).to_hex_string(0, true) != "0X1.8P+0") {
        std::cerr << "to_hex_string mismatch\n";
        return false;
    }
    if (ieee_double::inf(true).to_string() != "-Inf" || ieee_double::nan().to_string() != "NaN") {
        std::cerr << "special rendering mismatch: " << ieee_double::inf(true).to_string() << "\n";
        return false;
    }
    return true;
}

bool test_status_flags() {
    const auto one = ieee_double::from_double(1.0);
    const auto by_zero = one.div_r(ieee_double::zero(), NEAREST);
    bool ok = by_zero.flags == status::div_by_zero && by_zero.value.is_infinite();
    const auto overflow = ieee_double::largest().mul_r(ieee_double::from_double(2.0), NEAREST);
    ok &= overflow.flags == (status::overflow | status::inexact) && overflow.value.is_infinite();
    const auto toward_zero =
        ieee_double::largest().mul_r(ieee_double::from_double(2.0), round_mode::toward_zero);
    ok &= toward_zero.value.is_largest();
    const auto underflow = ieee_double::smallest().mul_r(ieee_double::from_double(0.5), NEAREST);
    ok &= underflow.flags == (status::underflow | status::inexact) && underflow.value.is_zero();
    const auto invalid = ieee_double::inf().sub_r(ieee_double::inf(), NEAREST);
    ok &= invalid.flags == status::invalid_op && invalid.value.is_nan();
    ok &= ieee_double::snan(std::nullopt).add_r(one, NEAREST).flags == status::invalid_op;
    const auto rem_by_zero = one.ieee_rem(ieee_double::zero());
    ok &= rem_by_zero.flags == status::invalid_op && rem_by_zero.value.is_nan();
    const auto rem_of_inf = ieee_double::inf(true).ieee_rem(one);
    ok &= rem_of_inf.flags == status::invalid_op && rem_of_inf.value.is_nan();
    ok &= one.ieee_rem(ieee_double::inf()).value.to_double() == 1.0;
    for (const double huge : {1e40, 1e300, -std::numeric_limits<double>::max()}) {
        const auto rem = ieee_double::from_double(huge).ieee_rem(ieee_double::from_double(3.0));
        ok &= rem.flags == status::ok && same_bits(rem.value.to_double(), std::remainder(huge, 3.0));
    }
    ok &= numx::fp::has(status::overflow | status::inexact, status::inexact);
    ok &= (status::overflow | status::inexact) - status::inexact == status::overflow;
    if (!ok) {
        std::cerr << "status flag mismatch\n";
    }
    return ok;
}

bool test_rounding_modes() {
    const auto third = ieee_double::from_double(1.0).div_r(ieee_double::from_double(3.0),
                                                           round_mode::toward_positive);
    const auto third_down = ieee_double::from_double(1.0).div_r(ieee_double::from_double(3.0),
                                                                round_mode::toward_negative);
    bool ok = third.value > third_down.value && third.value.next_down().value == third_down.value;
    const auto half = ieee_double::from_double(2.5);
    ok &= half.round_to_integral(NEAREST).value.to_double() == 2.0;
    ok &= half.round_to_integral(round_mode::nearest_ties_to_away).value.to_double() == 3.0;
    ok &= half.round_to_integral(round_mode::toward_zero).value.to_double() == 2.0;
    ok &= (-half).round_to_integral(round_mode::toward_positive).value.to_double() == -2.0;
    ok &= (-half).round_to_integral(round_mode::toward_negative).value.to_double() == -3.0;
    ok &= numx::fp::negate(round_mode::toward_positive) == round_mode::toward_negative;
    if (!ok) {
        std::cerr << "rounding mode mismatch\n";
    }
    return ok;
}

bool test_queries_and_exponents() {
    bool ok = ieee_double::smallest().is_denormal() && ieee_double::smallest().is_smallest();
    ok &= !ieee_double::smallest_normalized().is_denormal();
    ok &= ieee_double::largest().to_double() == std::numeric_limits<double>::max();
    ok &= ieee_double::smallest().to_double() == std::numeric_limits<double>::denorm_min();
    ok &= ieee_double::from_double(8.0).ilogb() == 3;
    ok &= ieee_double::inf().ilogb() == numx::fp::IEK_INF;
    ok &= ieee_double::nan().ilogb() == numx::fp::IEK_NAN;
    ok &= ieee_double::from_double(3.0).scalbn(4).to_double() == 48.0;
    int exp = 0;
    ok &= ieee_double::from_double(12.0).frexp(exp).to_double() == 0.75 && exp == 4;
    const auto inverse = ieee_double::from_double(4.0).get_exact_inverse();
    ok &= inverse && inverse->to_double() == 0.25;
    ok &= !ieee_double::from_double(10.0).get_exact_inverse();
    ok &= ieee_double::from_double(7.0).is_integer() && !ieee_double::from_double(7.5).is_integer();
    ok &= ieee_double::from_double(-2.0).copy_sign(ieee_double::from_double(1.0)).to_double() == 2.0;
    ok &= ieee_double::zero(true).compare(ieee_double::zero()) == std::partial_ordering::equivalent;
    ok &= !ieee_double::zero(true).bitwise_eq(ieee_double::zero());
    ok &= ieee_double::nan().compare(ieee_double::nan()) == std::partial_ordering::unordered;
    ok &= ieee_double::from_double(1.0).next_up().value.to_double() ==
          std::nextafter(1.0, 2.0);
    ok &= ieee_double::largest().next_up().value.is_infinite();
    ok &= ieee_double::from_bits(0x3ff0000000000000ULL).to_double() == 1.0;
    ok &= ieee_single::from_float(1.5f).to_bits() == 0x3fc00000U;
    if (!ok) {
        std::cerr << "query/exponent mismatch\n";
    }
    return ok;
}

bool test_integer_conversions() {
    bool is_exact = false;
    const auto value = ieee_double::from_double(-1234.75);
    const auto truncated = value.to_i128_r(32, round_mode::toward_zero, is_exact);
    bool ok = truncated.value == -1234 && !is_exact && truncated.flags == status::inexact;
    const auto too_big = ieee_double::from_double(1e20).to_i128_r(64, round_mode::toward_zero, is_exact);
    ok &= too_big.flags == status::invalid_op;
    const auto negative_unsigned =
        ieee_double::from_double(-1.0).to_u128_r(64, round_mode::toward_zero, is_exact);
    ok &= negative_unsigned.flags == status::invalid_op;
    const unsigned __int128 big = (static_cast<unsigned __int128>(1) << 80) + 1;
    const auto rounded = ieee_double::from_u128_r(big, NEAREST);
    ok &= rounded.flags == status::inexact && rounded.value.to_double() == std::ldexp(1.0, 80);
    ok &= ieee_double::from_i128(-42).to_double() == -42.0;
    if (!ok) {
        std::cerr << "integer conversion mismatch\n";
    }
    return ok;
}

} // namespace

int main() {
    std::mt19937_64 rng(0xf10a7);
    if (!test_matches_hardware(rng) || !test_parse_matches_strtod() || !test_to_string() ||
        !test_status_flags() || !test_rounding_modes() || !test_queries_and_exponents() ||
        !test_integer_conversions()) {
        return 1;
    }
    std::cout << "ieee_float passed\n";
    return 0;
}

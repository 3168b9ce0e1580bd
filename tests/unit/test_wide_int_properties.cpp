// tests/unit/test_wide_int_properties.cpp — Randomized identities for wide integers.

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <random>

#include <numx/numx.hpp>

namespace {

using numx::core::i256;
using numx::core::u1024;
using numx::core::u256;
using numx::core::u512;

constexpr int ITERATIONS = 256;

bool test_matches_native(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < ITERATIONS; ++iteration) {
        const std::uint64_t a = rng();
        const std::uint64_t b = rng() | 1;
        const unsigned __int128 wide_a = a;
        const unsigned __int128 wide_b = b;
        const u256 x(a);
        const u256 y(b);
        if ((x * y).low_u128() != wide_a * wide_b || (x + y).low_u128() != wide_a + wide_b) {
            std::cerr << "product/sum disagrees with native 128-bit arithmetic\n";
            return false;
        }
        const auto [quotient, remainder] = x.div_rem(y);
        if (quotient.low_u64() != a / b || remainder.low_u64() != a % b) {
            std::cerr << "division disagrees with native arithmetic\n";
            return false;
        }
        const std::int64_t sa = static_cast<std::int64_t>(a);
        const std::int64_t sb = static_cast<std::int64_t>(b) | 1;
        if (sa == INT64_MIN) {
            continue;
        }
        const auto [sq, sr] = i256(sa).div_rem(i256(sb));
        if (sq != i256(sa / sb) || sr != i256(sa % sb)) {
            std::cerr << "signed division disagrees with native truncation\n";
            return false;
        }
    }
    return true;
}

bool test_division_identity(std::mt19937_64& rng) {
    std::uniform_int_distribution<std::size_t> active(1, 8);
    for (int iteration = 0; iteration < ITERATIONS; ++iteration) {
        const u512 dividend = numx::util::random_wide<8>(rng);
        u512 divisor = numx::util::random_wide<8>(rng, active(rng));
        if (divisor.is_zero()) {
            divisor = u512::one();
        }
        const auto [quotient, remainder] = dividend.div_rem(divisor);
        if (!(remainder < divisor) || quotient * divisor + remainder != dividend) {
            std::cerr << "q * d + r != n for u512\n";
            return false;
        }
    }
    return true;
}

bool test_shift_identities(std::mt19937_64& rng) {
    std::uniform_int_distribution<std::size_t> shift_dist(0, 1023);
    for (int iteration = 0; iteration < ITERATIONS; ++iteration) {
        const u1024 value = numx::util::random_wide<16>(rng);
        const std::size_t shift = shift_dist(rng);
        const u1024 mask = shift == 0 ? u1024::max() : (u1024::max() >> shift);
        if (((value << shift) >> shift) != (value & mask)) {
            std::cerr << "shift round trip lost bits at " << shift << "\n";
            return false;
        }
        if ((value >> shift).bits_required() != (value.bits_required() > shift
                                                     ? value.bits_required() - shift
                                                     : 0)) {
            std::cerr << "bits_required inconsistent with shift\n";
            return false;
        }
    }
    return true;
}

bool test_wrapping_agrees_with_signed(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < ITERATIONS; ++iteration) {
        const u256 a = numx::util::random_wide<4>(rng);
        const u256 b = numx::util::random_wide<4>(rng);
        const i256 sa = a.resize<4, true>();
        const i256 sb = b.resize<4, true>();
        if (sa.wrapping_add(sb).resize<4, false>() != a.wrapping_add(b) ||
            sa.wrapping_sub(sb).resize<4, false>() != a.wrapping_sub(b) ||
            sa.wrapping_mul(sb).resize<4, false>() != a.wrapping_mul(b)) {
            std::cerr << "two's complement wrapping disagrees with unsigned wrapping\n";
            return false;
        }
        const auto [sum, carry] = a.overflowing_add(b);
        if (carry != (sum < a)) {
            std::cerr << "carry flag mismatch\n";
            return false;
        }
    }
    return true;
}

bool test_bitwise_laws(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < ITERATIONS; ++iteration) {
        const u256 a = numx::util::random_wide<4>(rng);
        const u256 b = numx::util::random_wide<4>(rng);
        if (~(a & b) != (~a | ~b) || (a ^ b ^ b) != a ||
            (a & b).count_ones() + (a | b).count_ones() != a.count_ones() + b.count_ones()) {
            std::cerr << "bitwise law violated\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main() {
    std::mt19937_64 rng(0x5eed1234);
    if (!test_matches_native(rng) || !test_division_identity(rng) || !test_shift_identities(rng) ||
        !test_wrapping_agrees_with_signed(rng) || !test_bitwise_laws(rng)) {
        return 1;
    }
    std::cout << "wide_int_properties passed\n";
    return 0;
}

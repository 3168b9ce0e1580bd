#include <iostream>

#include <numx/numx.hpp>

using numx::core::u256;

int main() {
    // 2^255 - 19, the Curve25519 field prime.
    const u256 prime = (u256::one() << 255) - u256(19u);
    const u256 base(0xDEADBEEFu);

    const auto [wide_square, overflowed] = base.overflowing_mul(base);
    const auto [quotient, remainder] = (wide_square * wide_square * wide_square).div_rem(prime);

    std::cout << "p       = " << numx::io::to_string(prime) << '\n';
    std::cout << "p (hex) = " << numx::io::to_hex(prime, false, true) << '\n';
    std::cout << "b^6 / p = " << numx::io::to_string(quotient) << " rem "
              << numx::io::to_string(remainder) << '\n';
    std::cout << "b^2 overflowed: " << std::boolalpha << overflowed << '\n';
    std::cout << "max + 1 checked: " << (u256::max().checked_add(u256::one()) ? "some" : "none")
              << '\n';
    return 0;
}

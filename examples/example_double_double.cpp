#include <iostream>

#include <numx/numx.hpp>

using numx::fp::double_double;

int main() {
    const double_double one = double_double::from_double(1.0);
    const double_double three = double_double::from_double(3.0);
    const double_double third = one / three;

    std::cout << "1/3 as double        = " << third.to_double() << '\n';
    std::cout << "1/3 as double-double = " << third.to_string(32) << '\n';
    std::cout << "hi/lo                = " << third.hi().to_hex_string() << " + "
              << third.lo().to_hex_string() << '\n';

    // 1 + 2^-80 is lost in binary64 but kept in the low half.
    const double_double tiny = one.scalbn(-80);
    const auto sum = one.add_r(tiny, numx::fp::round_mode::nearest_ties_to_even);
    std::cout << "(1 + 2^-80) - 1      = " << (sum.value - one).to_string() << '\n';
    std::cout << "bits                 = ";
    numx::util::dump(std::cout, sum.value) << '\n';
    return 0;
}

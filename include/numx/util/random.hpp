// include/numx/util/random.hpp — Random generators for property tests and benchmarks.

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

#include <numx/core/wide_int.hpp>
#include <numx/fp/double_double.hpp>

namespace numx::util {

template <std::size_t Words, bool Signed = false>
core::wide_int<Words, Signed> random_wide(std::mt19937_64& generator) {
    typename core::wide_int<Words, Signed>::words_type words{};
    for (auto& word : words) {
        word = generator();
    }
    return core::wide_int<Words, Signed>::from_words(words);
}

// Random value with only the low `active_words` words populated.
template <std::size_t Words, bool Signed = false>
core::wide_int<Words, Signed> random_wide(std::mt19937_64& generator, std::size_t active_words) {
    typename core::wide_int<Words, Signed>::words_type words{};
    for (std::size_t index = 0; index < active_words && index < Words; ++index) {
        words[index] = generator();
    }
    return core::wide_int<Words, Signed>::from_words(words);
}

// Normalized finite value: hi in [-2^exp_range, 2^exp_range], lo the rounding residue of a
// second random double below half an ulp of hi.
inline fp::double_double random_double_double(std::mt19937_64& generator, int exp_range = 64) {
    std::uniform_real_distribution<double> mantissa(-1.0, 1.0);
    std::uniform_int_distribution<int> exponent(-exp_range, exp_range);
    const fp::double_double hi =
        fp::double_double::from_double(mantissa(generator)).scalbn(exponent(generator));
    if (hi.is_zero()) {
        return hi;
    }
    const fp::double_double lo =
        fp::double_double::from_double(mantissa(generator)).scalbn(hi.ilogb() - 54);
    return hi + lo;
}

} // namespace numx::util

// include/numx/io/format.hpp — Text rendering for wide integers, small integers and software floats.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

#include <numx/core/detail/bignum.hpp>
#include <numx/core/small_int.hpp>
#include <numx/core/wide_int.hpp>
#include <numx/fp/double_double.hpp>
#include <numx/fp/ieee_float.hpp>

namespace numx::io {

namespace detail {

inline char digit_char(unsigned digit, bool upper = false) {
    if (digit < 10) {
        return static_cast<char>('0' + digit);
    }
    return static_cast<char>((upper ? 'A' : 'a') + digit - 10);
}

// Digits of one word in a power-of-two radix, most significant first.
inline std::string word_digits(std::uint64_t word, unsigned shift, std::size_t pad_to, bool upper) {
    const std::uint64_t mask = (std::uint64_t{1} << shift) - 1;
    std::string digits;
    do {
        digits.push_back(digit_char(static_cast<unsigned>(word & mask), upper));
        word >>= shift;
    } while (word != 0);
    while (digits.size() < pad_to) {
        digits.push_back('0');
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

// Leading zero words are skipped; later words keep their full digit count.
template <std::size_t Words, bool Signed>
std::string chunked(const core::wide_int<Words, Signed>& value, unsigned shift,
                    std::size_t digits_per_word, const char* prefix, std::size_t width,
                    bool upper) {
    const auto& words = value.as_words();
    std::string digits;
    for (std::size_t index = Words; index-- > 0;) {
        if (digits.empty()) {
            if (words[index] != 0) {
                digits = word_digits(words[index], shift, 0, upper);
            }
        } else {
            digits += word_digits(words[index], shift, digits_per_word, upper);
        }
    }
    if (digits.empty()) {
        digits = "0";
    }
    std::string result = prefix;
    if (result.size() + digits.size() < width) {
        result.append(width - result.size() - digits.size(), '0');
    }
    return result + digits;
}

inline std::string u64_to_string(std::uint64_t value, int base) {
    if (base < 2 || base > 36) {
        throw std::invalid_argument("supported bases are 2..36");
    }
    std::string digits;
    do {
        digits.push_back(digit_char(static_cast<unsigned>(value % static_cast<unsigned>(base))));
        value /= static_cast<unsigned>(base);
    } while (value != 0);
    std::reverse(digits.begin(), digits.end());
    return digits;
}

} // namespace detail

template <std::size_t Words, bool Signed>
std::string to_string(const core::wide_int<Words, Signed>& value, int base = 10) {
    if (base < 2 || base > 36) {
        throw std::invalid_argument("supported bases are 2..36");
    }
    if (value.is_zero()) {
        return "0";
    }
    const bool negative = value.is_negative();
    const auto magnitude = value.unsigned_abs();
    auto cursor = core::detail::bignum::from_words(magnitude.as_words().data(), Words);
    std::string digits;
    while (!cursor.is_zero()) {
        digits.push_back(detail::digit_char(
            static_cast<unsigned>(cursor.div_small(static_cast<core::detail::word>(base)))));
    }
    if (negative) {
        digits.push_back('-');
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

// `0x` and every word as 16 hex digits, most significant first.
template <std::size_t Words, bool Signed>
std::string to_full_hex(const core::wide_int<Words, Signed>& value) {
    std::string result = "0x";
    result.reserve(2 + Words * 16);
    const auto& words = value.as_words();
    for (std::size_t index = Words; index-- > 0;) {
        result += detail::word_digits(words[index], 4, 16, false);
    }
    return result;
}

template <std::size_t Words, bool Signed>
std::string to_hex(const core::wide_int<Words, Signed>& value, bool upper = false,
                   bool prefix = false, std::size_t width = 0) {
    return detail::chunked(value, 4, 16, prefix ? "0x" : "", width, upper);
}

template <std::size_t Words, bool Signed>
std::string to_octal(const core::wide_int<Words, Signed>& value, bool prefix = false,
                     std::size_t width = 0) {
    return detail::chunked(value, 3, 22, prefix ? "0o" : "", width, false);
}

template <std::size_t Words, bool Signed>
std::string to_binary(const core::wide_int<Words, Signed>& value, bool prefix = false,
                      std::size_t width = 0) {
    return detail::chunked(value, 1, 64, prefix ? "0b" : "", width, false);
}

template <unsigned Bits, typename Storage>
std::string to_string(const core::small_uint<Bits, Storage>& value, int base = 10) {
    return detail::u64_to_string(value.value(), base);
}

template <class Semantics>
std::string to_string(const fp::ieee_float<Semantics>& value) {
    return value.to_string();
}

inline std::string to_string(const fp::double_double& value) { return value.to_string(); }

template <std::size_t Words, bool Signed>
std::ostream& operator<<(std::ostream& os, const core::wide_int<Words, Signed>& value) {
    return os << to_full_hex(value);
}

template <unsigned Bits, typename Storage>
std::ostream& operator<<(std::ostream& os, const core::small_uint<Bits, Storage>& value) {
    return os << to_string(value);
}

template <class Semantics>
std::ostream& operator<<(std::ostream& os, const fp::ieee_float<Semantics>& value) {
    return os << value.to_string();
}

inline std::ostream& operator<<(std::ostream& os, const fp::double_double& value) {
    return os << value.to_string();
}

} // namespace numx::io

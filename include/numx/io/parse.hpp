// include/numx/io/parse.hpp — Parsing wide and small integers from text.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include <numx/core/error.hpp>
#include <numx/core/small_int.hpp>
#include <numx/core/wide_int.hpp>

namespace numx::io {

namespace detail {

template <typename T>
struct is_wide_int : std::false_type {};

template <std::size_t Words, bool Signed>
struct is_wide_int<core::wide_int<Words, Signed>> : std::true_type {};

template <typename T>
struct is_small_uint : std::false_type {};

template <unsigned Bits, typename Storage>
struct is_small_uint<core::small_uint<Bits, Storage>> : std::true_type {};

inline int digit_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'z') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'Z') {
        return ch - 'A' + 10;
    }
    return -1;
}

struct literal {
    bool negative = false;
    int base = 10;
    std::string_view digits;
};

// Splits sign and radix prefix; base 0 selects the radix from the prefix.
inline literal split_literal(std::string_view text, int base) {
    if (base != 0 && (base < 2 || base > 36)) {
        throw std::invalid_argument("supported bases are 2..36");
    }
    if (text.empty()) {
        throw std::invalid_argument("empty string");
    }
    literal result;
    std::size_t index = 0;
    if (text[0] == '+' || text[0] == '-') {
        result.negative = (text[0] == '-');
        ++index;
        if (index == text.size()) {
            throw std::invalid_argument("string has only a sign");
        }
    }
    result.base = base == 0 ? 10 : base;
    if (base == 0 && text.size() - index > 2 && text[index] == '0') {
        switch (text[index + 1]) {
        case 'x':
        case 'X':
            result.base = 16;
            index += 2;
            break;
        case 'o':
        case 'O':
            result.base = 8;
            index += 2;
            break;
        case 'b':
        case 'B':
            result.base = 2;
            index += 2;
            break;
        default:
            break;
        }
    }
    result.digits = text.substr(index);
    for (const char ch : result.digits) {
        const int digit = digit_value(ch);
        if (digit < 0 || digit >= result.base) {
            throw std::invalid_argument("invalid digit in string");
        }
    }
    return result;
}

} // namespace detail

template <typename Int>
Int from_string(std::string_view text, int base = 10) {
    static_assert(detail::is_wide_int<Int>::value || detail::is_small_uint<Int>::value,
                  "from_string supports wide_int and small_uint");
    const detail::literal parsed = detail::split_literal(text, base);

    if constexpr (detail::is_small_uint<Int>::value) {
        if (parsed.negative) {
            throw std::overflow_error("negative value for an unsigned type");
        }
        std::uint64_t accumulator = 0;
        for (const char ch : parsed.digits) {
            accumulator = accumulator * static_cast<std::uint64_t>(parsed.base) +
                          static_cast<std::uint64_t>(detail::digit_value(ch));
            if (accumulator > Int::MAX_VALUE) {
                throw core::overflow_error(Int::MAX_VALUE, static_cast<std::size_t>(accumulator));
            }
        }
        return Int::with(static_cast<typename Int::storage_type>(accumulator));
    } else {
        using magnitude_type = core::wide_int<Int::WORDS, false>;
        const magnitude_type radix(parsed.base);
        magnitude_type accumulator;
        for (const char ch : parsed.digits) {
            const auto scaled = accumulator.checked_mul(radix);
            const auto next =
                scaled ? scaled->checked_add(magnitude_type(detail::digit_value(ch))) : std::nullopt;
            if (!next) {
                throw std::overflow_error("value does not fit the target width");
            }
            accumulator = *next;
        }
        if constexpr (Int::IS_SIGNED) {
            // Negative values may reach 2^(BITS-1); positive ones stop one short.
            const magnitude_type limit = magnitude_type::one() << (Int::BITS - 1);
            if (accumulator > limit || (!parsed.negative && accumulator == limit)) {
                throw std::overflow_error("value does not fit the target width");
            }
            const Int value = accumulator.template resize<Int::WORDS, true>();
            return parsed.negative ? value.wrapping_neg() : value;
        } else {
            if (parsed.negative && !accumulator.is_zero()) {
                throw std::overflow_error("negative value for an unsigned type");
            }
            return accumulator;
        }
    }
}

} // namespace numx::io

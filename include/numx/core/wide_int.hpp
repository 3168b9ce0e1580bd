// include/numx/core/wide_int.hpp — Fixed-width multi-word integers (u256/u512/u1024, i256/i512/i1024).

#pragma once

#include <array>
#include <bit>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <numx/core/detail/word_ops.hpp>
#include <numx/core/error.hpp>

namespace numx::core {

template <std::size_t Words, bool Signed>
class wide_int {
public:
    static_assert(Words >= 2, "wide_int needs at least two words");

    using word_type = std::uint64_t;
    using words_type = std::array<word_type, Words>;

    static constexpr std::size_t WORDS = Words;
    static constexpr std::size_t BITS = Words * 64;
    static constexpr std::size_t BYTES = Words * 8;
    static constexpr bool IS_SIGNED = Signed;

    using bytes_type = std::array<std::uint8_t, BYTES>;

    constexpr wide_int() noexcept : words_{} {}

    template <typename Int,
              typename = std::enable_if_t<std::is_integral_v<Int>>>
    constexpr explicit wide_int(Int value) : words_{} {
        if constexpr (std::is_signed_v<Int>) {
            if (value < 0) {
                if constexpr (!Signed) {
                    throw std::overflow_error("wide_int value out of representable range");
                }
                words_.fill(~word_type{0});
            }
        }
        words_[0] = static_cast<word_type>(static_cast<std::int64_t>(value));
    }

    static constexpr wide_int zero() noexcept { return wide_int(); }
    static constexpr wide_int one() noexcept { return from_low_word(1); }

    static constexpr wide_int min() noexcept {
        wide_int result;
        if constexpr (Signed) {
            result.words_[Words - 1] = word_type{1} << 63;
        }
        return result;
    }

    static constexpr wide_int max() noexcept {
        wide_int result;
        result.words_.fill(~word_type{0});
        if constexpr (Signed) {
            result.words_[Words - 1] >>= 1;
        }
        return result;
    }

    static constexpr wide_int from_words(const words_type& words) noexcept {
        wide_int result;
        result.words_ = words;
        return result;
    }

    static wide_int try_from_words(std::span<const word_type> words) {
        if (words.size() != Words) {
            throw parse_length_error(words.size(), Words);
        }
        wide_int result;
        for (std::size_t index = 0; index < Words; ++index) {
            result.words_[index] = words[index];
        }
        return result;
    }

    static constexpr wide_int from_u128(unsigned __int128 value) noexcept {
        wide_int result;
        result.words_[0] = static_cast<word_type>(value);
        result.words_[1] = static_cast<word_type>(value >> 64);
        return result;
    }

    static constexpr wide_int from_i128(__int128_t value) noexcept {
        wide_int result = from_u128(static_cast<unsigned __int128>(value));
        if (value < 0) {
            for (std::size_t index = 2; index < Words; ++index) {
                result.words_[index] = ~word_type{0};
            }
        }
        return result;
    }

    static constexpr wide_int from_be_bytes(const bytes_type& bytes) noexcept {
        wide_int result;
        for (std::size_t index = 0; index < Words; ++index) {
            word_type value = 0;
            for (std::size_t offset = 0; offset < 8; ++offset) {
                value = (value << 8) | bytes[index * 8 + offset];
            }
            result.words_[Words - 1 - index] = value;
        }
        return result;
    }

    static constexpr wide_int from_le_bytes(const bytes_type& bytes) noexcept {
        wide_int result;
        for (std::size_t index = 0; index < Words; ++index) {
            word_type value = 0;
            for (std::size_t offset = 8; offset-- > 0;) {
                value = (value << 8) | bytes[index * 8 + offset];
            }
            result.words_[index] = value;
        }
        return result;
    }

    static wide_int from_be_slice(std::span<const std::uint8_t> bytes) {
        return from_be_bytes(checked_bytes(bytes));
    }

    static wide_int from_le_slice(std::span<const std::uint8_t> bytes) {
        return from_le_bytes(checked_bytes(bytes));
    }

    constexpr bytes_type to_be_bytes() const noexcept {
        bytes_type bytes{};
        for (std::size_t index = 0; index < Words; ++index) {
            const word_type value = words_[Words - 1 - index];
            for (std::size_t offset = 0; offset < 8; ++offset) {
                bytes[index * 8 + offset] = static_cast<std::uint8_t>(value >> (56 - 8 * offset));
            }
        }
        return bytes;
    }

    constexpr bytes_type to_le_bytes() const noexcept {
        bytes_type bytes{};
        for (std::size_t index = 0; index < Words; ++index) {
            const word_type value = words_[index];
            for (std::size_t offset = 0; offset < 8; ++offset) {
                bytes[index * 8 + offset] = static_cast<std::uint8_t>(value >> (8 * offset));
            }
        }
        return bytes;
    }

    constexpr const words_type& as_words() const noexcept { return words_; }
    constexpr word_type word_at(std::size_t index) const {
        if (index >= Words) {
            throw std::out_of_range("wide_int word index out of range");
        }
        return words_[index];
    }

    constexpr std::uint32_t low_u32() const noexcept {
        return static_cast<std::uint32_t>(words_[0]);
    }
    constexpr std::uint64_t low_u64() const noexcept { return words_[0]; }
    constexpr unsigned __int128 low_u128() const noexcept {
        return (static_cast<unsigned __int128>(words_[1]) << 64) | words_[0];
    }

    constexpr bool bit(std::size_t index) const {
        if (index >= BITS) {
            throw std::out_of_range("wide_int bit index out of range");
        }
        return detail::tc_extract_bit(words_.data(), static_cast<unsigned>(index));
    }

    constexpr bool is_zero() const noexcept { return detail::tc_is_zero(words_.data(), Words); }

    constexpr bool is_negative() const noexcept {
        if constexpr (Signed) {
            return (words_[Words - 1] >> 63) != 0;
        } else {
            return false;
        }
    }

    constexpr bool is_positive() const noexcept { return !is_zero() && !is_negative(); }

    // Width of the shortest encoding: magnitude bits when non-negative, two's complement bits otherwise.
    constexpr std::size_t bits_required() const noexcept {
        if (is_negative()) {
            const wide_int inverted = ~*this;
            return detail::tc_omsb(inverted.words_.data(), Words) + 1;
        }
        return detail::tc_omsb(words_.data(), Words);
    }

    constexpr std::size_t leading_zeros() const noexcept {
        return BITS - detail::tc_omsb(words_.data(), Words);
    }

    constexpr std::size_t trailing_zeros() const noexcept {
        const unsigned lsb = detail::tc_lsb(words_.data(), Words);
        return lsb == detail::NO_BIT ? BITS : lsb;
    }

    constexpr std::size_t count_ones() const noexcept {
        std::size_t total = 0;
        for (const auto part : words_) {
            total += static_cast<std::size_t>(std::popcount(part));
        }
        return total;
    }

    constexpr wide_int abs() const {
        if (!is_negative()) {
            return *this;
        }
        if (*this == min()) {
            throw std::overflow_error("wide_int abs of minimum value overflows");
        }
        return wrapping_neg();
    }

    // Magnitude as an unsigned value of the same width; exact even for min().
    constexpr wide_int<Words, false> unsigned_abs() const noexcept {
        auto result = wide_int<Words, false>::from_words(words_);
        if (is_negative()) {
            result = result.wrapping_neg();
        }
        return result;
    }

    constexpr std::pair<wide_int, bool> overflowing_add(const wide_int& rhs) const noexcept {
        wide_int result = *this;
        const auto carry = detail::tc_add(result.words_.data(), rhs.words_.data(), 0, Words);
        if constexpr (Signed) {
            return {result, is_negative() == rhs.is_negative() &&
                                is_negative() != result.is_negative()};
        } else {
            return {result, carry != 0};
        }
    }

    constexpr std::pair<wide_int, bool> overflowing_sub(const wide_int& rhs) const noexcept {
        wide_int result = *this;
        const auto borrow = detail::tc_subtract(result.words_.data(), rhs.words_.data(), 0, Words);
        if constexpr (Signed) {
            return {result, is_negative() != rhs.is_negative() &&
                                is_negative() != result.is_negative()};
        } else {
            return {result, borrow != 0};
        }
    }

    constexpr std::pair<wide_int, bool> overflowing_mul(const wide_int& rhs) const noexcept {
        if constexpr (Signed) {
            const auto lhs_abs = unsigned_abs();
            const auto rhs_abs = rhs.unsigned_abs();
            std::array<word_type, Words * 2> product{};
            detail::tc_full_multiply(product.data(), lhs_abs.as_words().data(),
                                     rhs_abs.as_words().data(), Words, Words);
            const bool negative = is_negative() != rhs.is_negative() && !is_zero() && !rhs.is_zero();
            bool overflow = !detail::tc_is_zero(product.data() + Words, Words);
            const unsigned top = detail::tc_msb(product.data(), Words);
            if (!overflow && top == BITS - 1) {
                // Only -2^(BITS-1) survives with the top bit set.
                overflow = !negative || detail::tc_lsb(product.data(), Words) != BITS - 1;
            }
            return {wrapping_mul_words(rhs), overflow};
        } else {
            std::array<word_type, Words * 2> product{};
            detail::tc_full_multiply(product.data(), words_.data(), rhs.words_.data(), Words, Words);
            wide_int result;
            detail::tc_assign(result.words_.data(), product.data(), Words);
            return {result, !detail::tc_is_zero(product.data() + Words, Words)};
        }
    }

    constexpr std::optional<wide_int> checked_add(const wide_int& rhs) const noexcept {
        const auto [result, overflow] = overflowing_add(rhs);
        return overflow ? std::nullopt : std::optional<wide_int>(result);
    }

    constexpr std::optional<wide_int> checked_sub(const wide_int& rhs) const noexcept {
        const auto [result, overflow] = overflowing_sub(rhs);
        return overflow ? std::nullopt : std::optional<wide_int>(result);
    }

    constexpr std::optional<wide_int> checked_mul(const wide_int& rhs) const noexcept {
        const auto [result, overflow] = overflowing_mul(rhs);
        return overflow ? std::nullopt : std::optional<wide_int>(result);
    }

    constexpr wide_int saturating_add(const wide_int& rhs) const noexcept {
        const auto [result, overflow] = overflowing_add(rhs);
        if (!overflow) {
            return result;
        }
        return (Signed && rhs.is_negative()) ? min() : max();
    }

    constexpr wide_int saturating_sub(const wide_int& rhs) const noexcept {
        const auto [result, overflow] = overflowing_sub(rhs);
        if (!overflow) {
            return result;
        }
        if constexpr (Signed) {
            return rhs.is_negative() ? max() : min();
        } else {
            return min();
        }
    }

    constexpr wide_int saturating_mul(const wide_int& rhs) const noexcept {
        const auto [result, overflow] = overflowing_mul(rhs);
        if (!overflow) {
            return result;
        }
        return (Signed && is_negative() != rhs.is_negative()) ? min() : max();
    }

    constexpr wide_int wrapping_add(const wide_int& rhs) const noexcept {
        return overflowing_add(rhs).first;
    }
    constexpr wide_int wrapping_sub(const wide_int& rhs) const noexcept {
        return overflowing_sub(rhs).first;
    }
    constexpr wide_int wrapping_mul(const wide_int& rhs) const noexcept {
        return wrapping_mul_words(rhs);
    }

    constexpr wide_int wrapping_neg() const noexcept {
        wide_int result = *this;
        detail::tc_negate(result.words_.data(), Words);
        return result;
    }

    constexpr std::optional<wide_int> checked_shl(std::uint32_t shift) const noexcept {
        if (shift >= BITS) {
            return std::nullopt;
        }
        return *this << shift;
    }

    constexpr std::optional<wide_int> checked_shr(std::uint32_t shift) const noexcept {
        if (shift >= BITS) {
            return std::nullopt;
        }
        return *this >> shift;
    }

    // Truncating division; the remainder takes the sign of the dividend.
    constexpr std::pair<wide_int, wide_int> div_rem(const wide_int& rhs) const {
        if (rhs.is_zero()) {
            throw div_error(div_error_kind::zero_div);
        }
        if constexpr (Signed) {
            if (*this == min() && rhs == wide_int(-1)) {
                throw div_error(div_error_kind::overflow);
            }
        }
        auto [quotient, remainder] = unsigned_div_rem(unsigned_abs(), rhs.unsigned_abs());
        wide_int q = wide_int::from_words(quotient.as_words());
        wide_int r = wide_int::from_words(remainder.as_words());
        if (is_negative() != rhs.is_negative()) {
            q = q.wrapping_neg();
        }
        if (is_negative()) {
            r = r.wrapping_neg();
        }
        return {q, r};
    }

    constexpr std::optional<std::pair<wide_int, wide_int>> div_rem_checked(
        const wide_int& rhs) const noexcept {
        if (rhs.is_zero()) {
            return std::nullopt;
        }
        if constexpr (Signed) {
            if (*this == min() && rhs == wide_int(-1)) {
                return std::nullopt;
            }
        }
        return div_rem(rhs);
    }

    template <std::size_t OtherWords, bool OtherSigned>
    constexpr wide_int<OtherWords, OtherSigned> resize() const noexcept {
        typename wide_int<OtherWords, OtherSigned>::words_type words{};
        const word_type fill = is_negative() ? ~word_type{0} : 0;
        for (std::size_t index = 0; index < OtherWords; ++index) {
            words[index] = index < Words ? words_[index] : fill;
        }
        return wide_int<OtherWords, OtherSigned>::from_words(words);
    }

    template <std::size_t OtherWords, bool OtherSigned>
    wide_int<OtherWords, OtherSigned> try_convert() const {
        const auto converted = resize<OtherWords, OtherSigned>();
        if (converted.template resize<Words, Signed>() != *this ||
            converted.is_negative() != is_negative()) {
            throw std::overflow_error("wide_int value out of representable range");
        }
        return converted;
    }

    constexpr wide_int operator~() const noexcept {
        wide_int result;
        for (std::size_t index = 0; index < Words; ++index) {
            result.words_[index] = ~words_[index];
        }
        return result;
    }

    constexpr wide_int operator-() const
        requires Signed
    {
        if (*this == min()) {
            throw std::overflow_error("attempt to negate the minimum value");
        }
        return wrapping_neg();
    }

    constexpr wide_int& operator+=(const wide_int& rhs) { return *this = *this + rhs; }
    constexpr wide_int& operator-=(const wide_int& rhs) { return *this = *this - rhs; }
    constexpr wide_int& operator*=(const wide_int& rhs) { return *this = *this * rhs; }
    constexpr wide_int& operator/=(const wide_int& rhs) { return *this = *this / rhs; }
    constexpr wide_int& operator%=(const wide_int& rhs) { return *this = *this % rhs; }
    constexpr wide_int& operator&=(const wide_int& rhs) noexcept { return *this = *this & rhs; }
    constexpr wide_int& operator|=(const wide_int& rhs) noexcept { return *this = *this | rhs; }
    constexpr wide_int& operator^=(const wide_int& rhs) noexcept { return *this = *this ^ rhs; }
    constexpr wide_int& operator<<=(std::size_t shift) noexcept { return *this = *this << shift; }
    constexpr wide_int& operator>>=(std::size_t shift) noexcept { return *this = *this >> shift; }

    friend constexpr wide_int operator+(const wide_int& lhs, const wide_int& rhs) {
        const auto [result, overflow] = lhs.overflowing_add(rhs);
        if (overflow) {
            throw std::overflow_error("attempt to add with overflow");
        }
        return result;
    }

    friend constexpr wide_int operator-(const wide_int& lhs, const wide_int& rhs) {
        const auto [result, overflow] = lhs.overflowing_sub(rhs);
        if (overflow) {
            throw std::overflow_error("attempt to subtract with overflow");
        }
        return result;
    }

    friend constexpr wide_int operator*(const wide_int& lhs, const wide_int& rhs) {
        const auto [result, overflow] = lhs.overflowing_mul(rhs);
        if (overflow) {
            throw std::overflow_error("attempt to multiply with overflow");
        }
        return result;
    }

    friend constexpr wide_int operator/(const wide_int& lhs, const wide_int& rhs) {
        return lhs.div_rem(rhs).first;
    }

    friend constexpr wide_int operator%(const wide_int& lhs, const wide_int& rhs) {
        return lhs.div_rem(rhs).second;
    }

    friend constexpr wide_int operator&(const wide_int& lhs, const wide_int& rhs) noexcept {
        wide_int result;
        for (std::size_t index = 0; index < Words; ++index) {
            result.words_[index] = lhs.words_[index] & rhs.words_[index];
        }
        return result;
    }

    friend constexpr wide_int operator|(const wide_int& lhs, const wide_int& rhs) noexcept {
        wide_int result;
        for (std::size_t index = 0; index < Words; ++index) {
            result.words_[index] = lhs.words_[index] | rhs.words_[index];
        }
        return result;
    }

    friend constexpr wide_int operator^(const wide_int& lhs, const wide_int& rhs) noexcept {
        wide_int result;
        for (std::size_t index = 0; index < Words; ++index) {
            result.words_[index] = lhs.words_[index] ^ rhs.words_[index];
        }
        return result;
    }

    // Shifts of BITS or more clear every word instead of reaching native shift UB.
    friend constexpr wide_int operator<<(const wide_int& value, std::size_t shift) noexcept {
        wide_int result = value;
        if (shift >= BITS) {
            return wide_int();
        }
        detail::tc_shift_left(result.words_.data(), Words, static_cast<unsigned>(shift));
        return result;
    }

    // Arithmetic for signed values: vacated bits copy the sign.
    friend constexpr wide_int operator>>(const wide_int& value, std::size_t shift) noexcept {
        const bool negative = value.is_negative();
        if (shift >= BITS) {
            return negative ? ~wide_int() : wide_int();
        }
        wide_int result = value;
        detail::tc_shift_right(result.words_.data(), Words, static_cast<unsigned>(shift));
        if (negative && shift != 0) {
            wide_int fill = ~wide_int();
            detail::tc_shift_left(fill.words_.data(), Words, static_cast<unsigned>(BITS - shift));
            result = result | fill;
        }
        return result;
    }

    friend constexpr bool operator==(const wide_int& lhs, const wide_int& rhs) noexcept {
        return lhs.words_ == rhs.words_;
    }

    // Walks from the most significant word; signed values order negatives first.
    friend constexpr std::strong_ordering operator<=>(const wide_int& lhs,
                                                      const wide_int& rhs) noexcept {
        if (lhs.is_negative() != rhs.is_negative()) {
            return lhs.is_negative() ? std::strong_ordering::less : std::strong_ordering::greater;
        }
        const int cmp = detail::tc_compare(lhs.words_.data(), rhs.words_.data(), Words);
        if (cmp < 0) {
            return std::strong_ordering::less;
        }
        return cmp > 0 ? std::strong_ordering::greater : std::strong_ordering::equal;
    }

private:
    static constexpr wide_int from_low_word(word_type value) noexcept {
        wide_int result;
        result.words_[0] = value;
        return result;
    }

    static bytes_type checked_bytes(std::span<const std::uint8_t> bytes) {
        if (bytes.size() != BYTES) {
            throw parse_length_error(bytes.size(), BYTES);
        }
        bytes_type copy{};
        for (std::size_t index = 0; index < BYTES; ++index) {
            copy[index] = bytes[index];
        }
        return copy;
    }

    constexpr wide_int wrapping_mul_words(const wide_int& rhs) const noexcept {
        std::array<word_type, Words * 2> product{};
        detail::tc_full_multiply(product.data(), words_.data(), rhs.words_.data(), Words, Words);
        wide_int result;
        detail::tc_assign(result.words_.data(), product.data(), Words);
        return result;
    }

    // Restoring binary long division over magnitudes.
    static constexpr std::pair<wide_int<Words, false>, wide_int<Words, false>> unsigned_div_rem(
        const wide_int<Words, false>& dividend, const wide_int<Words, false>& divisor) noexcept {
        using magnitude = wide_int<Words, false>;
        typename magnitude::words_type quotient{};
        auto remainder = dividend.as_words();
        const auto& divisor_words = divisor.as_words();
        const unsigned dividend_bits = detail::tc_omsb(remainder.data(), Words);
        const unsigned divisor_bits = detail::tc_omsb(divisor_words.data(), Words);
        if (dividend_bits < divisor_bits) {
            return {magnitude(), dividend};
        }
        unsigned shift = dividend_bits - divisor_bits;
        auto shifted = divisor_words;
        detail::tc_shift_left(shifted.data(), Words, shift);
        while (true) {
            if (detail::tc_compare(remainder.data(), shifted.data(), Words) >= 0) {
                detail::tc_subtract(remainder.data(), shifted.data(), 0, Words);
                detail::tc_set_bit(quotient.data(), shift);
            }
            if (shift == 0) {
                break;
            }
            detail::tc_shift_right(shifted.data(), Words, 1);
            --shift;
        }
        return {magnitude::from_words(quotient), magnitude::from_words(remainder)};
    }

    words_type words_;
};

using u256 = wide_int<4, false>;
using u512 = wide_int<8, false>;
using u1024 = wide_int<16, false>;
using i256 = wide_int<4, true>;
using i512 = wide_int<8, true>;
using i1024 = wide_int<16, true>;

template <std::size_t Words, bool Signed>
inline std::size_t canonical_hash(const wide_int<Words, Signed>& value) noexcept {
    constexpr std::uint64_t FNV_OFFSET = 1469598103934665603ULL;
    constexpr std::uint64_t FNV_PRIME = 1099511628211ULL;
    std::uint64_t hash = FNV_OFFSET;
    for (auto byte : value.to_le_bytes()) {
        hash ^= byte;
        hash *= FNV_PRIME;
    }
    if constexpr (sizeof(std::size_t) >= 8) {
        return static_cast<std::size_t>(hash);
    }
    return static_cast<std::size_t>((hash >> 32) ^ (hash & 0xFFFFFFFFULL));
}

} // namespace numx::core

namespace std {

template <std::size_t Words, bool Signed>
class numeric_limits<numx::core::wide_int<Words, Signed>> {
public:
    using value_type = numx::core::wide_int<Words, Signed>;

    static constexpr bool is_specialized = true;

    static constexpr value_type min() noexcept { return value_type::min(); }
    static constexpr value_type max() noexcept { return value_type::max(); }
    static constexpr value_type lowest() noexcept { return value_type::min(); }
    static constexpr value_type epsilon() noexcept { return value_type::zero(); }
    static constexpr value_type round_error() noexcept { return value_type::zero(); }
    static constexpr value_type denorm_min() noexcept { return value_type::zero(); }
    static constexpr value_type infinity() noexcept { return value_type::zero(); }
    static constexpr value_type quiet_NaN() noexcept { return value_type::zero(); }
    static constexpr value_type signaling_NaN() noexcept { return value_type::zero(); }

    static constexpr int digits = static_cast<int>(value_type::BITS) - (Signed ? 1 : 0);
    // floor(digits * log10(2)) with log10(2) ~ 643/2136.
    static constexpr int digits10 = digits * 643 / 2136;
    static constexpr int max_digits10 = 0;
    static constexpr int radix = 2;
    static constexpr int min_exponent = 0;
    static constexpr int max_exponent = 0;
    static constexpr int min_exponent10 = 0;
    static constexpr int max_exponent10 = 0;

    static constexpr bool is_signed = Signed;
    static constexpr bool is_integer = true;
    static constexpr bool is_exact = true;
    static constexpr bool has_infinity = false;
    static constexpr bool has_quiet_NaN = false;
    static constexpr bool has_signaling_NaN = false;
    static constexpr bool has_denorm_loss = false;
    static constexpr bool is_bounded = true;
    static constexpr bool is_modulo = !Signed;
    static constexpr bool traps = true;
    static constexpr bool tinyness_before = false;
    static constexpr float_round_style round_style = round_toward_zero;
    static constexpr bool is_iec559 = false;
};

template <std::size_t Words, bool Signed>
struct hash<numx::core::wide_int<Words, Signed>> {
    std::size_t operator()(const numx::core::wide_int<Words, Signed>& value) const noexcept {
        return numx::core::canonical_hash(value);
    }
};

} // namespace std

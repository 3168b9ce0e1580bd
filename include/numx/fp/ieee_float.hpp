// include/numx/fp/ieee_float.hpp — Software IEEE-754 binary floats with explicit rounding and status.

#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <climits>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <numx/core/detail/bignum.hpp>
#include <numx/core/detail/word_ops.hpp>
#include <numx/fp/round.hpp>

namespace numx::fp {

class parse_error : public std::invalid_argument {
public:
    explicit parse_error(const std::string& message) : std::invalid_argument(message) {}
};

// Format parameters: significand precision including the integer bit, the
// exponent range of normal numbers and the width of the interchange encoding.
struct single_semantics {
    static constexpr unsigned precision = 24;
    static constexpr int max_exponent = 127;
    static constexpr int min_exponent = -126;
    static constexpr unsigned bits = 32;
};

struct double_semantics {
    static constexpr unsigned precision = 53;
    static constexpr int max_exponent = 1023;
    static constexpr int min_exponent = -1022;
    static constexpr unsigned bits = 64;
};

// Exact sum of a double-double: the minimum exponent keeps the low half of
// a denormal pair representable.
struct double_double_fallback_semantics {
    static constexpr unsigned precision = 106;
    static constexpr int max_exponent = 1023;
    static constexpr int min_exponent = -1022 + 53;
    static constexpr unsigned bits = 0;
};

// Same precision with the full double exponent range, used as a bridge
// when splitting an exact sum back into its two halves.
struct double_double_fallback_extended_semantics {
    static constexpr unsigned precision = 106;
    static constexpr int max_exponent = 1023;
    static constexpr int min_exponent = -1022;
    static constexpr unsigned bits = 0;
};

namespace detail {

using core::detail::NO_BIT;
using core::detail::word;
using core::detail::WORD_BITS;

inline constexpr loss through_truncation(const word* parts, std::size_t n, unsigned bits) noexcept {
    if (bits == 0) {
        return loss::exactly_zero;
    }
    const unsigned half_bit = bits - 1;
    const std::size_t half_index = half_bit / WORD_BITS;
    word half_word = 0;
    std::size_t rest = n;
    if (half_index < n) {
        half_word = parts[half_index];
        rest = half_index;
    }
    const word half = word{1} << (half_bit % WORD_BITS);
    const bool has_half = (half_word & half) != 0;
    const bool has_rest = (half_word & (half - 1)) != 0 || !core::detail::tc_is_zero(parts, rest);
    if (has_half) {
        return has_rest ? loss::more_than_half : loss::exactly_half;
    }
    return has_rest ? loss::less_than_half : loss::exactly_zero;
}

// Shifts right, adding the shift to the exponent; returns what fell off.
inline constexpr loss shift_right(word* parts, std::size_t n, int& exp, unsigned bits) noexcept {
    exp += static_cast<int>(bits);
    const loss lost = through_truncation(parts, n, bits);
    core::detail::tc_shift_right(parts, n, bits);
    return lost;
}

inline constexpr void shift_left(word* parts, std::size_t n, int& exp, unsigned bits) noexcept {
    exp -= static_cast<int>(bits);
    core::detail::tc_shift_left(parts, n, bits);
}

// Adds or subtracts two significands aligned by exponent, writing the
// magnitude into `a`. The caller guarantees one bit of headroom.
inline constexpr loss add_or_sub(word* a, int& a_exp, bool& a_sign, word* b, int b_exp, bool b_sign,
                       std::size_t n) noexcept {
    const int bits = a_exp - b_exp;
    int scratch = 0;
    if (a_sign != b_sign) {
        bool reverse = false;
        loss lost = loss::exactly_zero;
        if (bits == 0) {
            reverse = core::detail::tc_compare(a, b, n) < 0;
        } else if (bits > 0) {
            lost = shift_right(b, n, scratch, static_cast<unsigned>(bits - 1));
            shift_left(a, n, a_exp, 1);
        } else {
            lost = shift_right(a, n, a_exp, static_cast<unsigned>(-bits - 1));
            shift_left(b, n, scratch, 1);
            reverse = true;
        }
        const word borrow = lost != loss::exactly_zero ? 1 : 0;
        if (reverse) {
            core::detail::tc_subtract(b, a, borrow, n);
            core::detail::tc_assign(a, b, n);
            a_sign = !a_sign;
        } else {
            core::detail::tc_subtract(a, b, borrow, n);
        }
        // The borrow turned the truncated fraction into its complement.
        if (lost == loss::less_than_half) {
            return loss::more_than_half;
        }
        if (lost == loss::more_than_half) {
            return loss::less_than_half;
        }
        return lost;
    }
    loss lost = loss::exactly_zero;
    if (bits > 0) {
        lost = shift_right(b, n, scratch, static_cast<unsigned>(bits));
    } else {
        lost = shift_right(a, n, a_exp, static_cast<unsigned>(-bits));
    }
    core::detail::tc_add(a, b, 0, n);
    return lost;
}

inline constexpr int saturate_exponent(long long value) noexcept {
    return static_cast<int>(std::clamp<long long>(value, -32767, 32767));
}

} // namespace detail

template <class Semantics>
class ieee_float {
public:
    using semantics = Semantics;
    using word = detail::word;

    static constexpr unsigned PRECISION = Semantics::precision;
    static constexpr int MAX_EXP = Semantics::max_exponent;
    static constexpr int MIN_EXP = Semantics::min_exponent;
    static constexpr std::size_t PARTS = core::detail::word_count(PRECISION + 1);
    static constexpr unsigned QNAN_BIT = PRECISION - 2;

    static_assert(PARTS <= 2, "ieee_float significands are limited to 127 bits");

    using sig_type = std::array<word, PARTS>;

    constexpr ieee_float() noexcept = default;

    static constexpr ieee_float zero(bool negative = false) noexcept {
        return ieee_float(sig_type{}, MIN_EXP - 1, category::zero, negative);
    }

    static constexpr ieee_float inf(bool negative = false) noexcept {
        return ieee_float(sig_type{}, MAX_EXP + 1, category::infinity, negative);
    }

    static constexpr ieee_float nan() noexcept { return qnan(std::nullopt); }

    static constexpr ieee_float qnan(std::optional<unsigned __int128> payload) noexcept {
        sig_type sig{};
        if (payload) {
            store_u128(sig, *payload & low_mask(QNAN_BIT));
        }
        core::detail::tc_set_bit(sig.data(), QNAN_BIT);
        return ieee_float(sig, MAX_EXP + 1, category::nan, false);
    }

    static constexpr ieee_float snan(std::optional<unsigned __int128> payload) noexcept {
        ieee_float result = qnan(payload);
        core::detail::tc_clear_bit(result.sig_.data(), QNAN_BIT);
        if (core::detail::tc_is_zero(result.sig_.data(), PARTS)) {
            core::detail::tc_set_bit(result.sig_.data(), QNAN_BIT - 1);
        }
        return result;
    }

    static constexpr ieee_float largest() noexcept {
        sig_type sig{};
        store_u128(sig, low_mask(PRECISION));
        return ieee_float(sig, MAX_EXP, category::normal, false);
    }

    static constexpr ieee_float smallest() noexcept {
        sig_type sig{};
        sig[0] = 1;
        return ieee_float(sig, MIN_EXP, category::normal, false);
    }

    static constexpr ieee_float smallest_normalized() noexcept {
        sig_type sig{};
        core::detail::tc_set_bit(sig.data(), PRECISION - 1);
        return ieee_float(sig, MIN_EXP, category::normal, false);
    }

    // Queries

    constexpr category kind() const noexcept { return category_; }
    constexpr bool is_negative() const noexcept { return sign_; }
    constexpr bool is_zero() const noexcept { return category_ == category::zero; }
    constexpr bool is_nan() const noexcept { return category_ == category::nan; }
    constexpr bool is_infinite() const noexcept { return category_ == category::infinity; }
    constexpr bool is_finite() const noexcept { return !is_nan() && !is_infinite(); }
    constexpr bool is_finite_non_zero() const noexcept { return category_ == category::normal; }
    constexpr bool is_normal() const noexcept { return is_finite_non_zero() && !is_denormal(); }

    constexpr bool is_signaling() const noexcept {
        return is_nan() && !core::detail::tc_extract_bit(sig_.data(), QNAN_BIT);
    }

    constexpr bool is_denormal() const noexcept {
        return is_finite_non_zero() && exp_ == MIN_EXP &&
               !core::detail::tc_extract_bit(sig_.data(), PRECISION - 1);
    }

    constexpr bool is_smallest() const noexcept {
        return is_finite_non_zero() && exp_ == MIN_EXP &&
               core::detail::tc_omsb(sig_.data(), PARTS) == 1;
    }

    constexpr bool is_largest() const noexcept {
        return is_finite_non_zero() && exp_ == MAX_EXP && load_u128(sig_) == low_mask(PRECISION);
    }

    bool is_integer() const {
        if (!is_finite()) {
            return false;
        }
        return round_to_integral(round_mode::toward_zero).value.bitwise_eq(*this);
    }

    constexpr const sig_type& significand() const noexcept { return sig_; }
    constexpr int exponent() const noexcept { return exp_; }

    // Sign manipulation

    constexpr ieee_float operator-() const noexcept {
        ieee_float result = *this;
        result.sign_ = !sign_;
        return result;
    }

    constexpr ieee_float abs() const noexcept {
        ieee_float result = *this;
        result.sign_ = false;
        return result;
    }

    constexpr ieee_float copy_sign(const ieee_float& rhs) const noexcept {
        ieee_float result = *this;
        result.sign_ = rhs.sign_;
        return result;
    }

    // Comparison

    constexpr bool bitwise_eq(const ieee_float& rhs) const noexcept {
        if (category_ != rhs.category_ || sign_ != rhs.sign_) {
            return false;
        }
        if (category_ == category::zero || category_ == category::infinity) {
            return true;
        }
        if (is_finite_non_zero() && exp_ != rhs.exp_) {
            return false;
        }
        return sig_ == rhs.sig_;
    }

    // Magnitude order of two finite non-zero values.
    constexpr std::strong_ordering compare_abs_normal(const ieee_float& rhs) const noexcept {
        if (exp_ != rhs.exp_) {
            return exp_ <=> rhs.exp_;
        }
        return core::detail::tc_compare(sig_.data(), rhs.sig_.data(), PARTS) <=> 0;
    }

    constexpr std::optional<std::strong_ordering> partial_cmp(const ieee_float& rhs) const noexcept {
        const category lhs_kind = category_;
        const category rhs_kind = rhs.category_;
        if (lhs_kind == category::nan || rhs_kind == category::nan) {
            return std::nullopt;
        }
        if (lhs_kind == category::infinity && rhs_kind == category::infinity) {
            return (!sign_) <=> (!rhs.sign_);
        }
        if (lhs_kind == category::zero && rhs_kind == category::zero) {
            return std::strong_ordering::equal;
        }
        if (lhs_kind == category::infinity ||
            (lhs_kind == category::normal && rhs_kind == category::zero)) {
            return (!sign_) <=> sign_;
        }
        if (rhs_kind == category::infinity ||
            (lhs_kind == category::zero && rhs_kind == category::normal)) {
            return rhs.sign_ <=> (!rhs.sign_);
        }
        const auto by_sign = (!sign_) <=> (!rhs.sign_);
        if (by_sign != 0) {
            return by_sign;
        }
        const auto by_magnitude = compare_abs_normal(rhs);
        return sign_ ? 0 <=> by_magnitude : by_magnitude;
    }

    constexpr std::partial_ordering compare(const ieee_float& rhs) const noexcept {
        const auto ordering = partial_cmp(rhs);
        if (!ordering) {
            return std::partial_ordering::unordered;
        }
        return *ordering;
    }

    friend constexpr std::partial_ordering operator<=>(const ieee_float& lhs,
                                                       const ieee_float& rhs) noexcept {
        return lhs.compare(rhs);
    }

    friend constexpr bool operator==(const ieee_float& lhs, const ieee_float& rhs) noexcept {
        return lhs.compare(rhs) == std::partial_ordering::equivalent;
    }

    // Arithmetic

    status_and<ieee_float> add_r(const ieee_float& rhs, round_mode round) const noexcept {
        ieee_float result = *this;
        status flags = status::ok;
        const category lhs_kind = category_;
        const category rhs_kind = rhs.category_;
        if (lhs_kind == category::infinity && rhs_kind == category::infinity) {
            if (sign_ != rhs.sign_) {
                result = nan();
                flags = status::invalid_op;
            }
        } else if (rhs_kind == category::zero || lhs_kind == category::nan ||
                   (lhs_kind == category::infinity && rhs_kind == category::normal)) {
            // Keep the left operand.
        } else if (lhs_kind == category::zero || rhs_kind == category::nan ||
                   rhs_kind == category::infinity) {
            result = rhs;
        } else {
            sig_type addend = rhs.sig_;
            const loss lost = detail::add_or_sub(result.sig_.data(), result.exp_, result.sign_,
                                                 addend.data(), rhs.exp_, rhs.sign_, PARTS);
            result = result.normalize(round, lost).unpack(flags);
        }
        // An exact zero sum is positive unless rounding down, except for two like-signed zeros.
        if (result.category_ == category::zero &&
            (rhs.category_ != category::zero || sign_ != rhs.sign_)) {
            result.sign_ = round == round_mode::toward_negative;
        }
        return {flags, result};
    }

    status_and<ieee_float> sub_r(const ieee_float& rhs, round_mode round) const noexcept {
        return add_r(-rhs, round);
    }

    status_and<ieee_float> mul_r(const ieee_float& rhs, round_mode round) const noexcept {
        ieee_float result = *this;
        result.sign_ = sign_ != rhs.sign_;
        const category lhs_kind = category_;
        const category rhs_kind = rhs.category_;
        if (lhs_kind == category::nan) {
            result.sign_ = false;
            return {status::ok, result};
        }
        if (rhs_kind == category::nan) {
            return {status::ok, rhs.abs()};
        }
        if ((lhs_kind == category::zero && rhs_kind == category::infinity) ||
            (lhs_kind == category::infinity && rhs_kind == category::zero)) {
            return {status::invalid_op, nan()};
        }
        if (lhs_kind == category::infinity || rhs_kind == category::infinity) {
            result.category_ = category::infinity;
            result.exp_ = MAX_EXP + 1;
            result.sig_ = {};
            return {status::ok, result};
        }
        if (lhs_kind == category::zero || rhs_kind == category::zero) {
            result.category_ = category::zero;
            result.exp_ = MIN_EXP - 1;
            result.sig_ = {};
            return {status::ok, result};
        }
        result.exp_ += rhs.exp_;
        std::array<word, 2 * PARTS> wide{};
        const loss lost = multiply_significands(wide, result.exp_, sig_, rhs.sig_);
        std::copy_n(wide.begin(), PARTS, result.sig_.begin());
        status flags = status::ok;
        result = result.normalize(round, lost).unpack(flags);
        if (lost != loss::exactly_zero) {
            flags |= status::inexact;
        }
        return {flags, result};
    }

    status_and<ieee_float> div_r(const ieee_float& rhs, round_mode round) const noexcept {
        ieee_float result = *this;
        result.sign_ = sign_ != rhs.sign_;
        const category lhs_kind = category_;
        const category rhs_kind = rhs.category_;
        if (lhs_kind == category::nan) {
            result.sign_ = false;
            return {status::ok, result};
        }
        if (rhs_kind == category::nan) {
            return {status::ok, rhs.abs()};
        }
        if ((lhs_kind == category::infinity && rhs_kind == category::infinity) ||
            (lhs_kind == category::zero && rhs_kind == category::zero)) {
            return {status::invalid_op, nan()};
        }
        if (lhs_kind == category::infinity || lhs_kind == category::zero) {
            return {status::ok, result};
        }
        if (rhs_kind == category::infinity) {
            return {status::ok, zero(result.sign_)};
        }
        if (rhs_kind == category::zero) {
            return {status::div_by_zero, inf(result.sign_)};
        }
        result.exp_ -= rhs.exp_;
        sig_type dividend = sig_;
        sig_type divisor = rhs.sig_;
        const loss lost = divide_significands(result.sig_, result.exp_, dividend, divisor);
        status flags = status::ok;
        result = result.normalize(round, lost).unpack(flags);
        if (lost != loss::exactly_zero) {
            flags |= status::inexact;
        }
        return {flags, result};
    }

    // this * multiplicand + addend with a single rounding.
    status_and<ieee_float> mul_add_r(const ieee_float& multiplicand, const ieee_float& addend,
                                     round_mode round) const noexcept {
        if (!is_finite_non_zero() || !multiplicand.is_finite_non_zero() || !addend.is_finite()) {
            status flags = status::ok;
            ieee_float product = mul_r(multiplicand, round).unpack(flags);
            if (flags == status::ok) {
                product = product.add_r(addend, round).unpack(flags);
            }
            return {flags, product};
        }

        ieee_float result = *this;
        result.sign_ = sign_ != multiplicand.sign_;
        std::array<word, 2 * PARTS> wide{};
        core::detail::tc_full_multiply(wide.data(), sig_.data(), multiplicand.sig_.data(), PARTS,
                                       PARTS);
        loss lost = loss::exactly_zero;
        unsigned omsb = core::detail::tc_omsb(wide.data(), wide.size());
        result.exp_ += multiplicand.exp_ + 2;

        if (!addend.is_zero()) {
            // Leave the top bit clear so the addition can carry into it.
            constexpr unsigned EXT_PRECISION = 2 * PRECISION + 1;
            if (omsb != EXT_PRECISION - 1) {
                detail::shift_left(wide.data(), wide.size(), result.exp_,
                                   (EXT_PRECISION - 1) - omsb);
            }
            std::array<word, 2 * PARTS> wide_addend{};
            std::copy(addend.sig_.begin(), addend.sig_.end(), wide_addend.begin());
            int scratch = 0;
            detail::shift_left(wide_addend.data(), wide_addend.size(), scratch,
                               EXT_PRECISION - 1 - PRECISION);
            lost = detail::add_or_sub(wide.data(), result.exp_, result.sign_, wide_addend.data(),
                                      addend.exp_ + 1, addend.sign_, wide.size());
            omsb = core::detail::tc_omsb(wide.data(), wide.size());
        }

        result.exp_ -= static_cast<int>(PRECISION) + 1;
        if (omsb > PRECISION) {
            lost = combine(detail::shift_right(wide.data(), wide.size(), result.exp_,
                                               omsb - PRECISION),
                           lost);
        }
        std::copy_n(wide.begin(), PARTS, result.sig_.begin());
        status flags = status::ok;
        result = result.normalize(round, lost).unpack(flags);
        if (result.is_zero() && !has(flags, status::underflow) && result.sign_ != addend.sign_) {
            result.sign_ = round == round_mode::toward_negative;
        }
        return {flags, result};
    }

    // Remainder of the truncated quotient, as C fmod.
    status_and<ieee_float> c_fmod(const ieee_float& rhs) const noexcept {
        const category lhs_kind = category_;
        const category rhs_kind = rhs.category_;
        if (lhs_kind == category::nan ||
            (lhs_kind == category::zero &&
             (rhs_kind == category::infinity || rhs_kind == category::normal)) ||
            (lhs_kind == category::normal && rhs_kind == category::infinity)) {
            return {status::ok, *this};
        }
        if (rhs_kind == category::nan) {
            return {status::ok, rhs.abs()};
        }
        if (lhs_kind == category::infinity || rhs_kind == category::zero) {
            return {status::invalid_op, nan()};
        }
        ieee_float result = *this;
        while (result.is_finite_non_zero() && rhs.is_finite_non_zero() &&
               result.compare_abs_normal(rhs) != std::strong_ordering::less) {
            ieee_float step = rhs.scalbn(result.ilogb() - rhs.ilogb());
            if (result.compare_abs_normal(step) == std::strong_ordering::less) {
                step = step.scalbn(-1);
            }
            step.sign_ = result.sign_;
            result = result.sub_r(step, round_mode::nearest_ties_to_even).value;
        }
        return {status::ok, result};
    }

    // Remainder of the quotient rounded to nearest, as IEEE remainder(). Always exact.
    status_and<ieee_float> ieee_rem(const ieee_float& rhs) const noexcept {
        if (category_ == category::nan) {
            return {status::ok, *this};
        }
        if (rhs.category_ == category::nan) {
            return {status::ok, rhs};
        }
        if (category_ == category::infinity || rhs.category_ == category::zero) {
            return {status::invalid_op, nan()};
        }
        if (category_ == category::zero || rhs.category_ == category::infinity) {
            return {status::ok, *this};
        }
        constexpr round_mode NEAREST = round_mode::nearest_ties_to_even;
        const ieee_float divisor = rhs.abs();
        ieee_float result = abs();
        // Reduce below 2|rhs| first so the parity of the quotient is known.
        const ieee_float doubled = divisor.add_r(divisor, NEAREST).value;
        if (doubled.is_finite()) {
            result = result.c_fmod(doubled).value;
        }
        // 2r may overflow to infinity, which still compares correctly against |rhs|.
        if (result.add_r(result, NEAREST).value.compare(divisor) == std::partial_ordering::greater) {
            result = result.sub_r(divisor, NEAREST).value;
            if (result.add_r(result, NEAREST).value.compare(divisor) !=
                std::partial_ordering::less) {
                result = result.sub_r(divisor, NEAREST).value;
            }
        }
        if (result.is_zero()) {
            return {status::ok, zero(sign_)};
        }
        result.sign_ = result.sign_ != sign_;
        return {status::ok, result};
    }

    status_and<ieee_float> round_to_integral(round_mode round) const noexcept {
        // Values this large are already integral and adding the magic constant could overflow.
        if (is_finite_non_zero() && exp_ + 1 >= static_cast<int>(PRECISION)) {
            return {status::ok, *this};
        }
        // Adding then subtracting 2^(p-1) rounds away every fraction bit in the requested mode.
        status flags = status::ok;
        const ieee_float magic =
            from_u128_r(static_cast<unsigned __int128>(1) << (PRECISION - 1),
                        round_mode::nearest_ties_to_even)
                .unpack(flags)
                .copy_sign(*this);
        if (flags != status::ok) {
            return {flags, *this};
        }
        const auto shifted = add_r(magic, round);
        if (shifted.flags != status::ok && shifted.flags != status::inexact) {
            return {shifted.flags, *this};
        }
        const auto restored = shifted.value.sub_r(magic, round);
        return {restored.flags, restored.value.copy_sign(*this)};
    }

    // Smallest representable value greater than this one.
    status_and<ieee_float> next_up() const noexcept {
        ieee_float result = *this;
        switch (category_) {
        case category::infinity:
            return {status::ok, sign_ ? -largest() : result};
        case category::nan:
            if (is_signaling()) {
                return {status::invalid_op, nan().copy_sign(*this)};
            }
            return {status::ok, result};
        case category::zero:
            return {status::ok, smallest()};
        case category::normal:
            break;
        }
        if (is_smallest() && sign_) {
            return {status::ok, zero(true)};
        }
        if (is_largest() && !sign_) {
            return {status::ok, inf()};
        }
        const unsigned __int128 fraction_mask = low_mask(PRECISION - 1);
        const unsigned __int128 fraction = load_u128(sig_) & fraction_mask;
        if (sign_) {
            const bool crossing_binade = exp_ != MIN_EXP && fraction == 0;
            core::detail::tc_decrement(result.sig_.data(), PARTS);
            if (crossing_binade) {
                core::detail::tc_set_bit(result.sig_.data(), PRECISION - 1);
                --result.exp_;
            }
        } else {
            const bool crossing_binade = !is_denormal() && fraction == fraction_mask;
            if (crossing_binade) {
                result.sig_ = {};
                core::detail::tc_set_bit(result.sig_.data(), PRECISION - 1);
                ++result.exp_;
            } else {
                core::detail::tc_increment(result.sig_.data(), PARTS);
            }
        }
        return {status::ok, result};
    }

    status_and<ieee_float> next_down() const noexcept {
        return (-*this).next_up().map([](const ieee_float& value) { return -value; });
    }

    // Arithmetic operators round to nearest and drop the status.

    friend ieee_float operator+(const ieee_float& lhs, const ieee_float& rhs) noexcept {
        return lhs.add_r(rhs, round_mode::nearest_ties_to_even).value;
    }
    friend ieee_float operator-(const ieee_float& lhs, const ieee_float& rhs) noexcept {
        return lhs.sub_r(rhs, round_mode::nearest_ties_to_even).value;
    }
    friend ieee_float operator*(const ieee_float& lhs, const ieee_float& rhs) noexcept {
        return lhs.mul_r(rhs, round_mode::nearest_ties_to_even).value;
    }
    friend ieee_float operator/(const ieee_float& lhs, const ieee_float& rhs) noexcept {
        return lhs.div_r(rhs, round_mode::nearest_ties_to_even).value;
    }
    friend ieee_float operator%(const ieee_float& lhs, const ieee_float& rhs) noexcept {
        return lhs.c_fmod(rhs).value;
    }
    ieee_float& operator+=(const ieee_float& rhs) noexcept { return *this = *this + rhs; }
    ieee_float& operator-=(const ieee_float& rhs) noexcept { return *this = *this - rhs; }
    ieee_float& operator*=(const ieee_float& rhs) noexcept { return *this = *this * rhs; }
    ieee_float& operator/=(const ieee_float& rhs) noexcept { return *this = *this / rhs; }
    ieee_float& operator%=(const ieee_float& rhs) noexcept { return *this = *this % rhs; }

    // Exponent manipulation

    // Unbiased exponent of the value as if it were normalized, or one of the IEK_ sentinels.
    int ilogb() const noexcept {
        if (is_nan()) {
            return IEK_NAN;
        }
        if (is_zero()) {
            return IEK_ZERO;
        }
        if (is_infinite()) {
            return IEK_INF;
        }
        if (!is_denormal()) {
            return exp_;
        }
        constexpr int SIG_BITS = static_cast<int>(PRECISION) - 1;
        ieee_float scaled = *this;
        scaled.exp_ += SIG_BITS;
        scaled = scaled.normalize(round_mode::nearest_ties_to_even, loss::exactly_zero).value;
        return scaled.exp_ - SIG_BITS;
    }

    ieee_float scalbn_r(int exp, round_mode round) const noexcept {
        // Clamp one past either end of the reachable range so normalize sees the overflow.
        constexpr int SIG_BITS = static_cast<int>(PRECISION) - 1;
        constexpr int MAX_CHANGE = MAX_EXP - (MIN_EXP - SIG_BITS) + 1;
        const int change = std::clamp(exp, -MAX_CHANGE - 1, MAX_CHANGE);
        ieee_float result = *this;
        result.exp_ = detail::saturate_exponent(static_cast<long long>(exp_) + change);
        result = result.normalize(round, loss::exactly_zero).value;
        if (result.is_nan()) {
            core::detail::tc_set_bit(result.sig_.data(), QNAN_BIT);
        }
        return result;
    }

    ieee_float scalbn(int exp) const noexcept {
        return scalbn_r(exp, round_mode::nearest_ties_to_even);
    }

    // Fraction in [0.5, 1) with the matching power of two stored into exp.
    ieee_float frexp_r(int& exp, round_mode round) const noexcept {
        exp = ilogb();
        if (exp == IEK_NAN) {
            ieee_float quiet = *this;
            core::detail::tc_set_bit(quiet.sig_.data(), QNAN_BIT);
            return quiet;
        }
        if (exp == IEK_INF) {
            return *this;
        }
        if (exp == IEK_ZERO) {
            exp = 0;
        } else {
            ++exp;
        }
        return scalbn_r(-exp, round);
    }

    ieee_float frexp(int& exp) const noexcept {
        return frexp_r(exp, round_mode::nearest_ties_to_even);
    }

    std::optional<ieee_float> get_exact_inverse() const noexcept {
        if (!is_finite_non_zero() || load_u128(sig_) != integer_bit()) {
            return std::nullopt;
        }
        const auto reciprocal = from_u128(1).div_r(*this, round_mode::nearest_ties_to_even);
        if (reciprocal.flags != status::ok || reciprocal.value.is_denormal()) {
            return std::nullopt;
        }
        return reciprocal.value;
    }

    // Conversions between formats

    template <class Target>
    status_and<ieee_float<Target>> convert_r(round_mode round, bool& loses_info) const noexcept {
        using target_type = ieee_float<Target>;
        constexpr std::size_t WIDE = std::max(PARTS, target_type::PARTS);
        std::array<word, WIDE> sig{};
        std::copy(sig_.begin(), sig_.end(), sig.begin());
        int exp = exp_;

        // Narrowing a denormal into a wider exponent range adjusts the
        // exponent instead of shifting significant bits out.
        int shift = static_cast<int>(target_type::PRECISION) - static_cast<int>(PRECISION);
        if (shift < 0 && is_finite_non_zero()) {
            int change = static_cast<int>(core::detail::tc_omsb(sig_.data(), PARTS)) -
                         static_cast<int>(PRECISION);
            if (exp + change < target_type::MIN_EXP) {
                change = target_type::MIN_EXP - exp;
            }
            change = std::max(change, shift);
            if (change < 0) {
                shift -= change;
                exp += change;
            }
        }

        loss lost = loss::exactly_zero;
        int scratch = 0;
        const bool has_payload = is_finite_non_zero() || is_nan();
        if (shift < 0 && has_payload) {
            lost = detail::shift_right(sig.data(), WIDE, scratch, static_cast<unsigned>(-shift));
        } else if (shift > 0 && has_payload) {
            detail::shift_left(sig.data(), WIDE, scratch, static_cast<unsigned>(shift));
        }

        typename target_type::sig_type target_sig{};
        std::copy_n(sig.begin(), target_type::PARTS, target_sig.begin());
        switch (category_) {
        case category::normal: {
            const auto rounded = target_type(target_sig, exp, category::normal, sign_)
                                     .normalize(round, lost);
            loses_info = rounded.flags != status::ok;
            return rounded;
        }
        case category::nan: {
            loses_info = lost != loss::exactly_zero;
            target_type quiet(target_sig, target_type::MAX_EXP + 1, category::nan, sign_);
            core::detail::tc_set_bit(quiet.sig_.data(), target_type::QNAN_BIT);
            return {status::ok, quiet};
        }
        case category::infinity:
            loses_info = false;
            return {status::ok, target_type::inf(sign_)};
        case category::zero:
            break;
        }
        loses_info = false;
        return {status::ok, target_type::zero(sign_)};
    }

    // Interchange encoding

    static constexpr ieee_float from_bits(unsigned __int128 bits) noexcept
        requires(Semantics::bits > 0)
    {
        constexpr unsigned FRACTION_BITS = PRECISION - 1;
        constexpr unsigned EXPONENT_BITS = Semantics::bits - 1 - FRACTION_BITS;
        ieee_float result;
        result.sign_ = ((bits >> (Semantics::bits - 1)) & 1) != 0;
        result.exp_ = static_cast<int>((bits >> FRACTION_BITS) & low_mask(EXPONENT_BITS)) - MAX_EXP;
        store_u128(result.sig_, bits & low_mask(FRACTION_BITS));
        const bool empty = (bits & low_mask(FRACTION_BITS)) == 0;
        if (result.exp_ == MIN_EXP - 1 && empty) {
            result.category_ = category::zero;
        } else if (result.exp_ == MAX_EXP + 1 && empty) {
            result.category_ = category::infinity;
        } else if (result.exp_ == MAX_EXP + 1) {
            result.category_ = category::nan;
        } else {
            result.category_ = category::normal;
            if (result.exp_ == MIN_EXP - 1) {
                result.exp_ = MIN_EXP;
            } else {
                core::detail::tc_set_bit(result.sig_.data(), FRACTION_BITS);
            }
        }
        return result;
    }

    constexpr unsigned __int128 to_bits() const noexcept
        requires(Semantics::bits > 0)
    {
        constexpr unsigned FRACTION_BITS = PRECISION - 1;
        unsigned __int128 fraction = load_u128(sig_) & low_mask(FRACTION_BITS);
        int exponent = exp_;
        switch (category_) {
        case category::normal:
            if (exp_ == MIN_EXP && !core::detail::tc_extract_bit(sig_.data(), FRACTION_BITS)) {
                exponent = MIN_EXP - 1;
            }
            break;
        case category::zero:
            fraction = 0;
            exponent = MIN_EXP - 1;
            break;
        case category::infinity:
            fraction = 0;
            exponent = MAX_EXP + 1;
            break;
        case category::nan:
            exponent = MAX_EXP + 1;
            break;
        }
        const auto biased = static_cast<unsigned __int128>(exponent + MAX_EXP);
        return (static_cast<unsigned __int128>(sign_) << (Semantics::bits - 1)) |
               (biased << FRACTION_BITS) | fraction;
    }

    static ieee_float from_double(double value) noexcept
        requires(Semantics::bits == 64)
    {
        return from_bits(std::bit_cast<std::uint64_t>(value));
    }

    double to_double() const noexcept
        requires(Semantics::bits == 64)
    {
        return std::bit_cast<double>(static_cast<std::uint64_t>(to_bits()));
    }

    static ieee_float from_float(float value) noexcept
        requires(Semantics::bits == 32)
    {
        return from_bits(std::bit_cast<std::uint32_t>(value));
    }

    float to_float() const noexcept
        requires(Semantics::bits == 32)
    {
        return std::bit_cast<float>(static_cast<std::uint32_t>(to_bits()));
    }

    // Integer conversions

    static status_and<ieee_float> from_u128_r(unsigned __int128 value, round_mode round) noexcept {
        std::array<word, 2> wide{static_cast<word>(value), static_cast<word>(value >> 64)};
        int exp = static_cast<int>(PRECISION) - 1;
        loss lost = loss::exactly_zero;
        const unsigned omsb = core::detail::tc_omsb(wide.data(), wide.size());
        if (omsb > PRECISION) {
            lost = detail::shift_right(wide.data(), wide.size(), exp, omsb - PRECISION);
        }
        sig_type sig{};
        std::copy_n(wide.begin(), PARTS, sig.begin());
        return ieee_float(sig, exp, category::normal, false).normalize(round, lost);
    }

    static status_and<ieee_float> from_i128_r(__int128 value, round_mode round) noexcept {
        if (value < 0) {
            const auto magnitude = static_cast<unsigned __int128>(0) - static_cast<unsigned __int128>(value);
            return from_u128_r(magnitude, negate(round)).map([](const ieee_float& v) { return -v; });
        }
        return from_u128_r(static_cast<unsigned __int128>(value), round);
    }

    static ieee_float from_u128(unsigned __int128 value) noexcept {
        return from_u128_r(value, round_mode::nearest_ties_to_even).value;
    }

    static ieee_float from_i128(__int128 value) noexcept {
        return from_i128_r(value, round_mode::nearest_ties_to_even).value;
    }

    // Converts to an unsigned integer of `width` bits; out of range values saturate with invalid_op.
    status_and<unsigned __int128> to_u128_r(unsigned width, round_mode round,
                                            bool& is_exact) const noexcept {
        const unsigned __int128 overflow =
            sign_ || width == 0 ? 0 : ~static_cast<unsigned __int128>(0) >> (128 - width);
        is_exact = false;
        switch (category_) {
        case category::nan:
            return {status::invalid_op, 0};
        case category::infinity:
            return {status::invalid_op, overflow};
        case category::zero:
            // Negative zero has no integer representation.
            is_exact = !sign_;
            return {status::ok, 0};
        case category::normal:
            break;
        }

        unsigned __int128 result = 0;
        unsigned truncated_bits = 0;
        if (exp_ < 0) {
            truncated_bits = PRECISION - 1 + static_cast<unsigned>(-exp_);
        } else {
            const unsigned bits = static_cast<unsigned>(exp_) + 1;
            if (bits > width) {
                return {status::invalid_op, overflow};
            }
            if (bits < PRECISION) {
                truncated_bits = PRECISION - bits;
                result = load_u128(sig_) >> truncated_bits;
            } else {
                result = load_u128(sig_) << (bits - PRECISION);
            }
        }

        loss lost = loss::exactly_zero;
        if (truncated_bits > 0) {
            lost = detail::through_truncation(sig_.data(), PARTS, truncated_bits);
            if (lost != loss::exactly_zero && round_away_from_zero(round, lost, truncated_bits)) {
                if (++result == 0) {
                    return {status::invalid_op, overflow};
                }
            }
        }
        if (result > overflow || (sign_ && result != 0)) {
            return {status::invalid_op, overflow};
        }
        if (lost == loss::exactly_zero) {
            is_exact = true;
            return {status::ok, result};
        }
        return {status::inexact, result};
    }

    status_and<__int128> to_i128_r(unsigned width, round_mode round, bool& is_exact) const noexcept {
        if (sign_) {
            status flags = status::ok;
            const unsigned __int128 magnitude = (-*this).to_u128_r(width, negate(round), is_exact).unpack(flags);
            if (is_zero()) {
                is_exact = false;
            }
            const unsigned __int128 limit = static_cast<unsigned __int128>(1) << (width - 1);
            if (magnitude > limit) {
                is_exact = false;
                return {status::invalid_op, static_cast<__int128>(static_cast<unsigned __int128>(0) - limit)};
            }
            return {flags, static_cast<__int128>(static_cast<unsigned __int128>(0) - magnitude)};
        }
        return to_u128_r(width - 1, round, is_exact).map(
            [](unsigned __int128 value) { return static_cast<__int128>(value); });
    }

    // Text

    // Parses decimal, hexadecimal (0x1.8p+1) and special spellings; throws parse_error.
    static status_and<ieee_float> from_str_r(std::string_view text, round_mode round) {
        if (text.empty()) {
            throw parse_error("Invalid string length");
        }
        if (const auto special = parse_special(text)) {
            return {status::ok, *special};
        }
        const bool minus = text.front() == '-';
        if (minus || text.front() == '+') {
            text.remove_prefix(1);
            if (text.empty()) {
                throw parse_error("String has no digits");
            }
        }
        // Round the magnitude; the sign is applied afterwards.
        if (minus) {
            round = negate(round);
        }
        status_and<ieee_float> result;
        if (text.starts_with("0x") || text.starts_with("0X")) {
            text.remove_prefix(2);
            if (text.empty()) {
                throw parse_error("Invalid string");
            }
            result = from_hexadecimal_string(text, round);
        } else {
            result = from_decimal_string(text, round);
        }
        if (minus) {
            result.value = -result.value;
        }
        return result;
    }

    static ieee_float from_str(std::string_view text) {
        return from_str_r(text, round_mode::nearest_ties_to_even).value;
    }

    // Shortest decimal form that round-trips when precision is 0; values
    // needing more than max_padding zeros switch to scientific notation.
    std::string to_string(unsigned precision = 0, unsigned max_padding = 3,
                          bool truncate_zero = true) const {
        std::string out;
        switch (category_) {
        case category::infinity:
            return sign_ ? "-Inf" : "+Inf";
        case category::nan:
            return "NaN";
        case category::zero:
            if (sign_) {
                out.push_back('-');
            }
            if (max_padding == 0) {
                if (truncate_zero) {
                    out += "0.0E+0";
                } else {
                    out += "0.0";
                    if (precision > 1) {
                        out.append(precision - 1, '0');
                    }
                    out += "e+00";
                }
            } else {
                out.push_back('0');
            }
            return out;
        case category::normal:
            break;
        }
        if (sign_) {
            out.push_back('-');
        }
        if (precision == 0) {
            precision = 2 + PRECISION * 59 / 196;
        }

        // Rewrite sig * 2^exp as an integer times a power of ten.
        int exp = exp_ - (static_cast<int>(PRECISION) - 1);
        core::detail::bignum value = core::detail::bignum::from_words(sig_.data(), PARTS);
        const unsigned trailing = value.lowest_set_bit();
        exp += static_cast<int>(trailing);
        value >>= trailing;
        if (exp > 0) {
            value <<= static_cast<unsigned>(exp);
            exp = 0;
        } else if (exp < 0) {
            value = value * core::detail::bignum::pow5(static_cast<unsigned>(-exp));
        }
        truncate_to_precision(value, exp, precision);

        // Least significant digit first.
        std::string buffer;
        bool in_trail = true;
        while (!value.is_zero()) {
            const auto digit = value.div_small(10);
            if (in_trail && digit == 0) {
                ++exp;
            } else {
                buffer.push_back(static_cast<char>('0' + digit));
                in_trail = false;
            }
        }
        round_to_precision(buffer, exp, precision);
        const auto digits = static_cast<unsigned>(buffer.size());

        bool scientific = false;
        if (max_padding == 0) {
            scientific = true;
        } else if (exp >= 0) {
            scientific = static_cast<unsigned>(exp) > max_padding ||
                         digits + static_cast<unsigned>(exp) > precision;
        } else {
            const int msd = exp + static_cast<int>(digits) - 1;
            scientific = msd < 0 && static_cast<unsigned>(-msd) > max_padding;
        }

        if (scientific) {
            exp += static_cast<int>(digits) - 1;
            out.push_back(buffer[digits - 1]);
            out.push_back('.');
            if (digits == 1 && truncate_zero) {
                out.push_back('0');
            } else {
                for (unsigned index = 1; index != digits; ++index) {
                    out.push_back(buffer[digits - 1 - index]);
                }
            }
            if (!truncate_zero && precision > digits - 1) {
                out.append(precision - digits + 1, '0');
            }
            out.push_back(truncate_zero ? 'E' : 'e');
            out.push_back(exp >= 0 ? '+' : '-');
            std::string exponent_text = std::to_string(exp < 0 ? -exp : exp);
            if (!truncate_zero && exponent_text.size() < 2) {
                exponent_text.insert(exponent_text.begin(), '0');
            }
            out += exponent_text;
            return out;
        }

        if (exp >= 0) {
            out.append(buffer.rbegin(), buffer.rend());
            out.append(static_cast<std::size_t>(exp), '0');
            return out;
        }

        const int whole_digits = exp + static_cast<int>(digits);
        unsigned index = 0;
        if (whole_digits > 0) {
            for (; index != static_cast<unsigned>(whole_digits); ++index) {
                out.push_back(buffer[digits - index - 1]);
            }
            out.push_back('.');
        } else {
            out += "0.";
            out.append(static_cast<std::size_t>(-whole_digits), '0');
        }
        for (; index != digits; ++index) {
            out.push_back(buffer[digits - index - 1]);
        }
        return out;
    }

    // Hexadecimal significand with a binary exponent, e.g. 0x1.8p+1. A digit
    // count of zero prints every significant digit.
    std::string to_hex_string(unsigned hex_digits = 0, bool upper = false,
                              round_mode round = round_mode::nearest_ties_to_even) const {
        std::string out;
        if (sign_) {
            out.push_back('-');
        }
        switch (category_) {
        case category::infinity:
            return out + (upper ? "INFINITY" : "infinity");
        case category::nan:
            return out + (upper ? "NAN" : "nan");
        case category::zero:
            out += upper ? "0X0" : "0x0";
            if (hex_digits > 1) {
                out.push_back('.');
                out.append(hex_digits - 1, '0');
            }
            out += upper ? "P+0" : "p+0";
            return out;
        case category::normal:
            break;
        }

        out += upper ? "0X" : "0x";
        const char* digit_chars = upper ? "0123456789ABCDEF0" : "0123456789abcdef0";
        // Three virtual leading zero bits put the integer bit alone in the first digit.
        constexpr unsigned VALUE_BITS = PRECISION + 3;
        constexpr unsigned SHIFT = detail::WORD_BITS - VALUE_BITS % detail::WORD_BITS;
        static_assert(SHIFT < detail::WORD_BITS, "hex digits must straddle a word boundary");
        unsigned output_digits =
            (VALUE_BITS - core::detail::tc_lsb(sig_.data(), PARTS) + 3) / 4;
        bool round_up = false;
        if (hex_digits != 0) {
            if (hex_digits < output_digits) {
                const unsigned dropped = VALUE_BITS - hex_digits * 4;
                const loss lost = detail::through_truncation(sig_.data(), PARTS, dropped);
                round_up = round_away_from_zero(round, lost, dropped);
            }
            output_digits = hex_digits;
        }

        std::string digits;
        std::size_t count = (VALUE_BITS + detail::WORD_BITS - 1) / detail::WORD_BITS;
        while (output_digits != 0 && count != 0) {
            word part = 0;
            if (--count != PARTS) {
                part = sig_[count] << SHIFT;
            }
            if (count != 0) {
                part |= sig_[count - 1] >> (detail::WORD_BITS - SHIFT);
            }
            const unsigned current = std::min(detail::WORD_BITS / 4, output_digits);
            part >>= detail::WORD_BITS - 4 * current;
            std::string chunk(current, '0');
            for (unsigned index = current; index-- > 0;) {
                chunk[index] = digit_chars[part & 0xF];
                part >>= 4;
            }
            digits += chunk;
            output_digits -= current;
        }
        if (round_up) {
            std::size_t index = digits.size();
            do {
                --index;
                digits[index] = digit_chars[hex_digit_value(digits[index]) + 1];
            } while (digits[index] == '0' && index != 0);
        } else {
            digits.append(output_digits, '0');
        }

        out.push_back(digits[0]);
        if (digits.size() > 1) {
            out.push_back('.');
            out.append(digits, 1, std::string::npos);
        }
        out.push_back(upper ? 'P' : 'p');
        if (exp_ >= 0) {
            out.push_back('+');
        }
        out += std::to_string(exp_);
        return out;
    }

private:
    template <class> friend class ieee_float;

    constexpr ieee_float(const sig_type& sig, int exp, category kind, bool sign) noexcept
        : sig_(sig), exp_(exp), category_(kind), sign_(sign) {}

    static constexpr unsigned __int128 low_mask(unsigned bits) noexcept {
        return bits >= 128 ? ~static_cast<unsigned __int128>(0)
                           : (static_cast<unsigned __int128>(1) << bits) - 1;
    }

    static constexpr unsigned __int128 integer_bit() noexcept {
        return static_cast<unsigned __int128>(1) << (PRECISION - 1);
    }

    static constexpr void store_u128(sig_type& sig, unsigned __int128 value) noexcept {
        sig[0] = static_cast<word>(value);
        if constexpr (PARTS > 1) {
            sig[1] = static_cast<word>(value >> 64);
        }
    }

    static constexpr unsigned __int128 load_u128(const sig_type& sig) noexcept {
        unsigned __int128 value = sig[0];
        if constexpr (PARTS > 1) {
            value |= static_cast<unsigned __int128>(sig[1]) << 64;
        }
        return value;
    }

    constexpr bool round_away_from_zero(round_mode round, loss lost, unsigned bit) const noexcept {
        if (lost == loss::exactly_zero) {
            return false;
        }
        switch (round) {
        case round_mode::nearest_ties_to_away:
            return lost == loss::exactly_half || lost == loss::more_than_half;
        case round_mode::nearest_ties_to_even:
            if (lost == loss::more_than_half) {
                return true;
            }
            if (lost == loss::exactly_half && category_ != category::zero &&
                bit < PARTS * detail::WORD_BITS) {
                return core::detail::tc_extract_bit(sig_.data(), bit);
            }
            return false;
        case round_mode::toward_zero:
            return false;
        case round_mode::toward_positive:
            return !sign_;
        case round_mode::toward_negative:
            return sign_;
        }
        return false;
    }

    static constexpr status_and<ieee_float> overflow_result(round_mode round) noexcept {
        switch (round) {
        case round_mode::toward_negative:
        case round_mode::toward_zero:
            return {status::inexact, largest()};
        default:
            return {status::overflow | status::inexact, inf()};
        }
    }

    // Rounds a significand of any width to PRECISION bits, handling overflow
    // to infinity and gradual underflow.
    constexpr status_and<ieee_float> normalize(round_mode round, loss lost) const noexcept {
        if (!is_finite_non_zero()) {
            return {status::ok, *this};
        }
        ieee_float result = *this;
        unsigned omsb = core::detail::tc_omsb(result.sig_.data(), PARTS);
        if (omsb > 0) {
            int final_exp = result.exp_ + static_cast<int>(omsb) - static_cast<int>(PRECISION);
            if (final_exp > MAX_EXP) {
                return overflow_result(sign_ ? negate(round) : round)
                    .map([this](const ieee_float& value) { return value.copy_sign(*this); });
            }
            final_exp = std::max(final_exp, MIN_EXP);
            if (final_exp < result.exp_) {
                detail::shift_left(result.sig_.data(), PARTS, result.exp_,
                                   static_cast<unsigned>(result.exp_ - final_exp));
                return {status::ok, result};
            }
            if (final_exp > result.exp_) {
                const auto change = static_cast<unsigned>(final_exp - result.exp_);
                lost = combine(detail::shift_right(result.sig_.data(), PARTS, result.exp_, change),
                               lost);
                omsb = omsb > change ? omsb - change : 0;
            }
        }

        if (lost == loss::exactly_zero) {
            if (omsb == 0) {
                result.category_ = category::zero;
            }
            return {status::ok, result};
        }

        if (result.round_away_from_zero(round, lost, 0)) {
            if (omsb == 0) {
                result.exp_ = MIN_EXP;
            }
            core::detail::tc_increment(result.sig_.data(), PARTS);
            omsb = core::detail::tc_omsb(result.sig_.data(), PARTS);
            // Rounding carried into a new binade.
            if (omsb == PRECISION + 1) {
                if (result.exp_ == MAX_EXP) {
                    return {status::overflow | status::inexact, inf(sign_)};
                }
                detail::shift_right(result.sig_.data(), PARTS, result.exp_, 1);
                return {status::inexact, result};
            }
        }

        if (omsb == PRECISION) {
            return {status::inexact, result};
        }
        if (omsb == 0) {
            result.category_ = category::zero;
        }
        return {status::underflow | status::inexact, result};
    }

    static loss multiply_significands(std::array<word, 2 * PARTS>& wide, int& exp,
                                      const sig_type& lhs, const sig_type& rhs) noexcept {
        core::detail::tc_full_multiply(wide.data(), lhs.data(), rhs.data(), PARTS, PARTS);
        // The product of two 1.x significands has two integer bits.
        exp += 2;
        exp -= static_cast<int>(PRECISION) + 1;
        const unsigned omsb = core::detail::tc_omsb(wide.data(), wide.size());
        if (omsb <= PRECISION) {
            return loss::exactly_zero;
        }
        return detail::shift_right(wide.data(), wide.size(), exp, omsb - PRECISION);
    }

    static loss divide_significands(sig_type& quotient, int& exp, sig_type& dividend,
                                    sig_type& divisor) noexcept {
        int scratch = 0;
        unsigned bits = PRECISION - core::detail::tc_omsb(divisor.data(), PARTS);
        detail::shift_left(divisor.data(), PARTS, scratch, bits);
        exp += static_cast<int>(bits);
        bits = PRECISION - core::detail::tc_omsb(dividend.data(), PARTS);
        detail::shift_left(dividend.data(), PARTS, exp, bits);

        quotient = {};
        // Division by a power of two.
        if (core::detail::tc_lsb(divisor.data(), PARTS) + 1 == PRECISION) {
            quotient = dividend;
            return loss::exactly_zero;
        }
        if (core::detail::tc_compare(dividend.data(), divisor.data(), PARTS) < 0) {
            detail::shift_left(dividend.data(), PARTS, exp, 1);
        }
        for (unsigned bit = PRECISION; bit-- > 0;) {
            if (core::detail::tc_compare(dividend.data(), divisor.data(), PARTS) >= 0) {
                core::detail::tc_subtract(dividend.data(), divisor.data(), 0, PARTS);
                core::detail::tc_set_bit(quotient.data(), bit);
            }
            detail::shift_left(dividend.data(), PARTS, scratch, 1);
        }

        const int remainder = core::detail::tc_compare(dividend.data(), divisor.data(), PARTS);
        if (remainder > 0) {
            return loss::more_than_half;
        }
        if (remainder == 0) {
            return loss::exactly_half;
        }
        return core::detail::tc_is_zero(dividend.data(), PARTS) ? loss::exactly_zero
                                                                : loss::less_than_half;
    }

    static constexpr bool is_decimal_digit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

    static constexpr unsigned hex_digit_value(char ch) noexcept {
        if (ch >= '0' && ch <= '9') {
            return static_cast<unsigned>(ch - '0');
        }
        if (ch >= 'a' && ch <= 'f') {
            return static_cast<unsigned>(ch - 'a' + 10);
        }
        if (ch >= 'A' && ch <= 'F') {
            return static_cast<unsigned>(ch - 'A' + 10);
        }
        return 16;
    }

    // inf, nan, snan and nan(payload) spellings; nullopt when text is not one of them.
    static std::optional<ieee_float> parse_special(std::string_view text) noexcept {
        if (text == "inf" || text == "INFINITY" || text == "+Inf") {
            return inf();
        }
        if (text == "-inf" || text == "-INFINITY" || text == "-Inf") {
            return inf(true);
        }
        bool negative = false;
        if (text.starts_with('-')) {
            negative = true;
            text.remove_prefix(1);
        }
        if (text.size() < 3) {
            return std::nullopt;
        }
        const bool signaling = text.front() == 's' || text.front() == 'S';
        if (signaling) {
            text.remove_prefix(1);
            if (text.size() < 3) {
                return std::nullopt;
            }
        }
        if (!text.starts_with("nan") && !text.starts_with("NaN")) {
            return std::nullopt;
        }
        text.remove_prefix(3);

        std::optional<unsigned __int128> payload;
        if (!text.empty()) {
            if (text.front() == '(') {
                if (text.size() <= 2 || text.back() != ')') {
                    return std::nullopt;
                }
                text = text.substr(1, text.size() - 2);
            }
            unsigned radix = 10;
            if (text.front() == '0') {
                if (text.size() > 1 && (text[1] == 'x' || text[1] == 'X')) {
                    text.remove_prefix(2);
                    radix = 16;
                } else {
                    radix = 8;
                }
            }
            if (text.empty()) {
                return std::nullopt;
            }
            unsigned __int128 value = 0;
            for (char ch : text) {
                const unsigned digit = hex_digit_value(ch);
                if (digit >= radix) {
                    return std::nullopt;
                }
                value = value * radix + digit;
            }
            payload = value;
        }
        ieee_float result = signaling ? snan(payload) : qnan(payload);
        result.sign_ = negative;
        return result;
    }

    static status_and<ieee_float> from_hexadecimal_string(std::string_view text, round_mode round) {
        ieee_float result(sig_type{}, 0, category::normal, false);
        bool any_digits = false;
        bool has_exp = false;
        long long bit_pos = static_cast<long long>(PARTS * detail::WORD_BITS);
        std::optional<loss> lost;
        std::optional<std::size_t> first_sig_digit;
        std::size_t dot = text.size();
        long long exponent = 0;

        for (std::size_t pos = 0; pos < text.size(); ++pos) {
            const char ch = text[pos];
            if (ch == '.') {
                if (dot != text.size()) {
                    throw parse_error("String contains multiple dots");
                }
                dot = pos;
                continue;
            }
            const unsigned hex_value = hex_digit_value(ch);
            if (hex_value < 16) {
                any_digits = true;
                if (!first_sig_digit) {
                    if (hex_value == 0) {
                        continue;
                    }
                    first_sig_digit = pos;
                }
                bit_pos -= 4;
                if (bit_pos >= 0) {
                    result.sig_[static_cast<std::size_t>(bit_pos) / detail::WORD_BITS] |=
                        static_cast<word>(hex_value) << (bit_pos % detail::WORD_BITS);
                } else if (!lost) {
                    if (hex_value == 0) {
                        lost = loss::exactly_zero;
                    } else if (hex_value < 8) {
                        lost = loss::less_than_half;
                    } else if (hex_value == 8) {
                        lost = loss::exactly_half;
                    } else {
                        lost = loss::more_than_half;
                    }
                } else if (hex_value != 0) {
                    lost = combine(*lost, loss::less_than_half);
                }
                continue;
            }
            if (ch == 'p' || ch == 'P') {
                if (!any_digits) {
                    throw parse_error("Significand has no digits");
                }
                if (dot == text.size()) {
                    dot = pos;
                }
                std::size_t cursor = pos + 1;
                const bool exp_minus = cursor < text.size() && text[cursor] == '-';
                if (exp_minus || (cursor < text.size() && text[cursor] == '+')) {
                    ++cursor;
                }
                for (; cursor < text.size(); ++cursor) {
                    if (!is_decimal_digit(text[cursor])) {
                        throw parse_error("Invalid character in exponent");
                    }
                    has_exp = true;
                    exponent = detail::saturate_exponent(exponent * 10 + (text[cursor] - '0'));
                }
                if (!has_exp) {
                    throw parse_error("Exponent has no digits");
                }
                if (exp_minus) {
                    exponent = -exponent;
                }
                break;
            }
            throw parse_error("Invalid character in significand");
        }

        if (!has_exp) {
            throw parse_error("Hex strings require an exponent");
        }
        if (!first_sig_digit) {
            return {status::ok, zero()};
        }

        // Account for the digits before the point and for filling the
        // significand from its most significant nibble.
        long long adjustment = 0;
        if (dot > *first_sig_digit) {
            adjustment = static_cast<long long>(dot - *first_sig_digit);
        } else {
            adjustment = -static_cast<long long>(*first_sig_digit - dot - 1);
        }
        adjustment = detail::saturate_exponent(adjustment * 4 - 1 + static_cast<long long>(PRECISION) -
                                               static_cast<long long>(PARTS * detail::WORD_BITS));
        result.exp_ = detail::saturate_exponent(exponent + adjustment);
        return result.normalize(round, lost.value_or(loss::exactly_zero));
    }

    static int read_exponent(std::string_view text) {
        // Caps the magnitude well past any exponent range that can be reached.
        constexpr unsigned OVERLARGE_EXPONENT = 24000;
        const bool negative = !text.empty() && text[0] == '-';
        std::size_t cursor = 0;
        if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
            ++cursor;
        }
        if (cursor == text.size()) {
            throw parse_error("Exponent has no digits");
        }
        unsigned value = 0;
        for (; cursor < text.size(); ++cursor) {
            if (!is_decimal_digit(text[cursor])) {
                throw parse_error("Invalid character in exponent");
            }
            if (value < OVERLARGE_EXPONENT) {
                value = std::min(value * 10 + static_cast<unsigned>(text[cursor] - '0'),
                                 OVERLARGE_EXPONENT);
            }
        }
        return negative ? -static_cast<int>(value) : static_cast<int>(value);
    }

    static status_and<ieee_float> from_decimal_string(std::string_view text, round_mode round) {
        const std::size_t end = text.size();
        std::size_t dot = end;
        std::size_t pos = 0;
        while (pos != end && text[pos] == '0') {
            ++pos;
        }
        if (pos != end && text[pos] == '.') {
            dot = pos++;
            if (end == 1) {
                throw parse_error("Significand has no digits");
            }
            while (pos != end && text[pos] == '0') {
                ++pos;
            }
        }
        const std::size_t first_sig = pos;

        for (; pos != end; ++pos) {
            if (text[pos] == '.') {
                if (dot != end) {
                    throw parse_error("String contains multiple dots");
                }
                dot = pos++;
                if (pos == end) {
                    break;
                }
            }
            if (!is_decimal_digit(text[pos])) {
                break;
            }
        }

        long long exponent = 0;
        if (pos != end) {
            if (text[pos] != 'e' && text[pos] != 'E') {
                throw parse_error("Invalid character in significand");
            }
            if (pos == 0 || (dot != end && pos == 1)) {
                throw parse_error("Significand has no digits");
            }
            exponent = read_exponent(text.substr(pos + 1));
            if (dot == end) {
                dot = pos;
            }
        }

        // All zeros: any exponent is accepted.
        if (first_sig == end || !is_decimal_digit(text[first_sig])) {
            return {status::ok, zero()};
        }

        // Drop insignificant trailing zeros and a trailing point.
        if (pos != 0) {
            do {
                do {
                    --pos;
                } while (pos != 0 && text[pos] == '0');
            } while (pos != 0 && text[pos] == '.');
        }
        const std::size_t last_sig = pos;
        const auto signed_dot = static_cast<long long>(dot);
        const auto signed_last = static_cast<long long>(last_sig);
        exponent += (signed_dot - signed_last) - (dot > last_sig ? 1 : 0);
        const long long normalized_exponent =
            exponent + (signed_last - static_cast<long long>(first_sig)) -
            (dot > first_sig && dot < last_sig ? 1 : 0);

        // Bounds on log2(10): 42039/12655 < L < 28738/8651.
        if ((normalized_exponent + 1) * 28738 <=
            8651LL * (MIN_EXP - static_cast<long long>(PRECISION))) {
            return ieee_float(sig_type{}, MIN_EXP - 1, category::normal, false)
                .normalize(round, loss::less_than_half);
        }
        if ((normalized_exponent - 1) * 42039 >= 12655LL * MAX_EXP) {
            return overflow_result(round);
        }

        core::detail::bignum mantissa;
        for (std::size_t index = first_sig; index <= last_sig; ++index) {
            if (text[index] == '.') {
                continue;
            }
            mantissa.mul_small(10);
            mantissa.add_small(static_cast<word>(text[index] - '0'));
        }
        return from_decimal_parts(std::move(mantissa), static_cast<int>(exponent), round);
    }

    // Correctly rounded mantissa * 10^exponent.
    static status_and<ieee_float> from_decimal_parts(core::detail::bignum mantissa, int exponent,
                                                     round_mode round) {
        using core::detail::bignum;
        loss remainder_lost = loss::exactly_zero;
        long long exp = static_cast<long long>(PRECISION) - 1;
        bignum scaled;
        if (exponent >= 0) {
            scaled = mantissa * bignum::pow5(static_cast<unsigned>(exponent));
            exp += exponent;
        } else {
            const auto power = static_cast<unsigned>(-exponent);
            const bignum divisor = bignum::pow5(power);
            // Keep at least PRECISION + 2 quotient bits.
            const long long headroom = static_cast<long long>(PRECISION) + 2 +
                                       static_cast<long long>(divisor.bit_length()) -
                                       static_cast<long long>(mantissa.bit_length());
            const unsigned shift = headroom > 0 ? static_cast<unsigned>(headroom) : 0;
            mantissa <<= shift;
            auto [quotient, remainder] = bignum::div_rem(mantissa, divisor);
            scaled = std::move(quotient);
            if (!remainder.is_zero()) {
                remainder_lost = loss::less_than_half;
            }
            exp -= static_cast<long long>(shift) + power;
        }

        loss lost = loss::exactly_zero;
        const unsigned length = scaled.bit_length();
        if (length > PRECISION) {
            const unsigned dropped = length - PRECISION;
            lost = detail::through_truncation(scaled.words().data(), scaled.words().size(), dropped);
            scaled >>= dropped;
            exp += dropped;
        }
        lost = combine(lost, remainder_lost);

        sig_type sig{};
        const auto& words = scaled.words();
        std::copy_n(words.begin(), std::min(words.size(), PARTS), sig.begin());
        return ieee_float(sig, detail::saturate_exponent(exp), category::normal, false)
            .normalize(round, lost);
    }

    // Drops decimal digits that cannot affect the printed precision.
    static void truncate_to_precision(core::detail::bignum& value, int& exp, unsigned precision) {
        const unsigned bits = value.bit_length();
        // 196/59 slightly overestimates log2(10).
        const unsigned bits_required = (precision * 196 + 58) / 59;
        if (bits <= bits_required) {
            return;
        }
        const unsigned removable = (bits - bits_required) * 59 / 196;
        if (removable == 0) {
            return;
        }
        exp += static_cast<int>(removable);
        core::detail::bignum divisor = core::detail::bignum::pow5(removable);
        divisor <<= removable;
        value = core::detail::bignum::div_rem(value, divisor).first;
    }

    // Rounds half up to `precision` digits; buffer holds the least significant digit first.
    static void round_to_precision(std::string& buffer, int& exp, unsigned precision) {
        const auto size = static_cast<unsigned>(buffer.size());
        if (size <= precision) {
            return;
        }
        unsigned first_significant = size - precision;
        if (buffer[first_significant - 1] < '5') {
            while (first_significant < size && buffer[first_significant] == '0') {
                ++first_significant;
            }
            exp += static_cast<int>(first_significant);
            buffer.erase(0, first_significant);
            return;
        }
        for (unsigned index = first_significant; index != size; ++index) {
            if (buffer[index] == '9') {
                ++first_significant;
            } else {
                ++buffer[index];
                break;
            }
        }
        exp += static_cast<int>(first_significant);
        if (first_significant == size) {
            buffer = "1";
            return;
        }
        buffer.erase(0, first_significant);
    }

    sig_type sig_{};
    int exp_ = MIN_EXP - 1;
    category category_ = category::zero;
    bool sign_ = false;
};

using ieee_single = ieee_float<single_semantics>;
using ieee_double = ieee_float<double_semantics>;

} // namespace numx::fp

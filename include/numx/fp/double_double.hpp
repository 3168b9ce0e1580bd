// include/numx/fp/double_double.hpp — PowerPC-style double-double: an unevaluated sum of two doubles.

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <numx/core/wide_int.hpp>
#include <numx/fp/ieee_float.hpp>
#include <numx/fp/round.hpp>

namespace numx::fp {

// hi + lo with |lo| <= ulp(hi) / 2. Arithmetic follows the compensated
// algorithms of the PowerPC runtime; operations without a cheap
// compensated form go through the exact 106-bit fallback format.
class double_double {
public:
    using half_type = ieee_double;
    using fallback_type = ieee_float<double_double_fallback_semantics>;
    using fallback_extended_type = ieee_float<double_double_fallback_extended_semantics>;

    static constexpr unsigned PRECISION = fallback_type::PRECISION;
    static constexpr int MAX_EXP = fallback_type::MAX_EXP;
    static constexpr int MIN_EXP = fallback_type::MIN_EXP;

    constexpr double_double() noexcept = default;

    constexpr double_double(const half_type& hi, const half_type& lo) noexcept : hi_(hi), lo_(lo) {}

    static double_double from_double(double value) noexcept {
        return double_double(half_type::from_double(value), half_type::zero());
    }

    static constexpr double_double zero(bool negative = false) noexcept {
        return double_double(half_type::zero(negative), half_type::zero());
    }

    static constexpr double_double inf(bool negative = false) noexcept {
        return double_double(half_type::inf(negative), half_type::zero());
    }

    static constexpr double_double nan() noexcept {
        return double_double(half_type::nan(), half_type::zero());
    }

    static constexpr double_double qnan(std::optional<unsigned __int128> payload) noexcept {
        return double_double(half_type::qnan(payload), half_type::zero());
    }

    static constexpr double_double snan(std::optional<unsigned __int128> payload) noexcept {
        return double_double(half_type::snan(payload), half_type::zero());
    }

    // DBL_MAX plus the largest low half that does not round hi upward.
    static double_double largest() noexcept {
        const half_type hi = half_type::largest();
        const half_type lo =
            hi.scalbn(-static_cast<int>(half_type::PRECISION + 1)).next_down().value;
        return double_double(hi, lo);
    }

    static constexpr double_double smallest() noexcept {
        return double_double(half_type::smallest(), half_type::zero());
    }

    static double_double smallest_normalized() noexcept {
        return double_double(
            half_type::smallest_normalized().scalbn(static_cast<int>(half_type::PRECISION)),
            half_type::zero());
    }

    constexpr const half_type& hi() const noexcept { return hi_; }
    constexpr const half_type& lo() const noexcept { return lo_; }

    double to_double() const noexcept { return hi_.to_double(); }

    // Queries

    constexpr category kind() const noexcept { return hi_.kind(); }
    constexpr bool is_negative() const noexcept { return hi_.is_negative(); }
    constexpr bool is_zero() const noexcept { return hi_.is_zero(); }
    constexpr bool is_nan() const noexcept { return hi_.is_nan(); }
    constexpr bool is_infinite() const noexcept { return hi_.is_infinite(); }
    constexpr bool is_finite() const noexcept { return hi_.is_finite(); }
    constexpr bool is_finite_non_zero() const noexcept { return hi_.is_finite_non_zero(); }
    constexpr bool is_signaling() const noexcept { return hi_.is_signaling(); }

    // A pair whose rounded sum is not hi is outside the normalized form.
    bool is_denormal() const noexcept {
        return kind() == category::normal &&
               (hi_.is_denormal() || lo_.is_denormal() || !(hi_ + lo_).bitwise_eq(hi_));
    }

    bool is_smallest() const noexcept {
        return is_finite_non_zero() && smallest().copy_sign(*this).bitwise_eq(*this);
    }

    bool is_largest() const noexcept {
        return is_finite_non_zero() && largest().copy_sign(*this).bitwise_eq(*this);
    }

    bool is_integer() const noexcept {
        if (!is_finite()) {
            return false;
        }
        return round_to_integral(round_mode::toward_zero).value.bitwise_eq(*this);
    }

    // Sign manipulation

    constexpr double_double operator-() const noexcept {
        return double_double(-hi_, lo_.is_finite_non_zero() ? -lo_ : lo_);
    }

    constexpr double_double abs() const noexcept { return is_negative() ? -*this : *this; }

    constexpr double_double copy_sign(const double_double& rhs) const noexcept {
        return is_negative() != rhs.is_negative() ? -*this : *this;
    }

    // Comparison

    constexpr bool bitwise_eq(const double_double& rhs) const noexcept {
        return hi_.bitwise_eq(rhs.hi_) && lo_.bitwise_eq(rhs.lo_);
    }

    // Magnitude order of two finite non-zero values. A low half pointing
    // against hi reduces the magnitude.
    constexpr std::strong_ordering compare_abs_normal(const double_double& rhs) const noexcept {
        const auto by_hi = hi_.compare_abs_normal(rhs.hi_);
        if (by_hi != 0) {
            return by_hi;
        }
        const auto by_lo = half_abs_order(lo_, rhs.lo_);
        if (by_lo == 0) {
            return by_lo;
        }
        const bool against = hi_.is_negative() != lo_.is_negative();
        const bool rhs_against = rhs.hi_.is_negative() != rhs.lo_.is_negative();
        const auto by_direction = (!against) <=> (!rhs_against);
        if (by_direction != 0) {
            return by_direction;
        }
        return against ? 0 <=> by_lo : by_lo;
    }

    constexpr std::optional<std::strong_ordering> partial_cmp(const double_double& rhs) const noexcept {
        const auto by_hi = hi_.partial_cmp(rhs.hi_);
        if (by_hi == std::strong_ordering::equal) {
            return lo_.partial_cmp(rhs.lo_);
        }
        return by_hi;
    }

    constexpr std::partial_ordering compare(const double_double& rhs) const noexcept {
        const auto ordering = partial_cmp(rhs);
        if (!ordering) {
            return std::partial_ordering::unordered;
        }
        return *ordering;
    }

    friend constexpr std::partial_ordering operator<=>(const double_double& lhs,
                                                       const double_double& rhs) noexcept {
        return lhs.compare(rhs);
    }

    friend constexpr bool operator==(const double_double& lhs, const double_double& rhs) noexcept {
        return lhs.compare(rhs) == std::partial_ordering::equivalent;
    }

    // Arithmetic

    status_and<double_double> add_r(const double_double& rhs, round_mode round) const noexcept {
        const category lhs_kind = kind();
        const category rhs_kind = rhs.kind();
        if (lhs_kind == category::infinity && rhs_kind == category::infinity) {
            if (is_negative() != rhs.is_negative()) {
                return {status::invalid_op, nan().copy_sign(*this)};
            }
            return {status::ok, *this};
        }
        if (rhs_kind == category::zero || lhs_kind == category::nan ||
            (lhs_kind == category::infinity && rhs_kind == category::normal)) {
            return {status::ok, *this};
        }
        if (lhs_kind == category::zero || rhs_kind == category::nan ||
            rhs_kind == category::infinity) {
            return {status::ok, rhs};
        }

        // Linnainmaa's compensated sum of (a + aa) and (c + cc).
        status flags = status::ok;
        const half_type& a = hi_;
        const half_type& aa = lo_;
        const half_type& c = rhs.hi_;
        const half_type& cc = rhs.lo_;
        half_type z = a.add_r(c, round).unpack(flags);
        double_double result;

        if (!z.is_finite()) {
            if (!z.is_infinite()) {
                return {flags, double_double(z, half_type::zero())};
            }
            // The leading sum overflowed; retry adding the small parts first.
            flags = status::ok;
            const bool a_greater = a.compare_abs_normal(c) == std::strong_ordering::greater;
            z = cc.add_r(aa, round).unpack(flags);
            if (a_greater) {
                z = z.add_r(c, round).unpack(flags);
                z = z.add_r(a, round).unpack(flags);
            } else {
                z = z.add_r(a, round).unpack(flags);
                z = z.add_r(c, round).unpack(flags);
            }
            if (!z.is_finite()) {
                return {flags, double_double(z, half_type::zero())};
            }
            result.hi_ = z;
            const half_type zz = aa.add_r(cc, round).unpack(flags);
            half_type lo = a_greater ? a : c;
            lo = lo.sub_r(z, round).unpack(flags);
            lo = lo.add_r(a_greater ? c : a, round).unpack(flags);
            lo = lo.add_r(zz, round).unpack(flags);
            result.lo_ = lo;
            return {flags, result};
        }

        // zz = q + c + (a - (q + z)) + aa + cc with q = a - z.
        half_type q = a.sub_r(z, round).unpack(flags);
        half_type zz = q.add_r(c, round).unpack(flags);
        q = q.add_r(z, round).unpack(flags);
        q = q.sub_r(a, round).unpack(flags);
        q = -q;
        zz = zz.add_r(q, round).unpack(flags);
        zz = zz.add_r(aa, round).unpack(flags);
        zz = zz.add_r(cc, round).unpack(flags);
        if (zz.is_zero() && !zz.is_negative()) {
            return {status::ok, double_double(z, half_type::zero())};
        }
        result.hi_ = z.add_r(zz, round).unpack(flags);
        if (!result.hi_.is_finite()) {
            result.lo_ = half_type::zero();
            return {flags, result};
        }
        half_type lo = z.sub_r(result.hi_, round).unpack(flags);
        result.lo_ = lo.add_r(zz, round).unpack(flags);
        return {flags, result};
    }

    status_and<double_double> sub_r(const double_double& rhs, round_mode round) const noexcept {
        return add_r(-rhs, round);
    }

    status_and<double_double> mul_r(const double_double& rhs, round_mode round) const noexcept {
        // Special results are the nearest common ancestor in NaN > {Zero, Inf} > Normal.
        const category lhs_kind = kind();
        const category rhs_kind = rhs.kind();
        if (lhs_kind == category::nan) {
            return {status::ok, *this};
        }
        if (rhs_kind == category::nan) {
            return {status::ok, rhs};
        }
        if ((lhs_kind == category::zero && rhs_kind == category::infinity) ||
            (lhs_kind == category::infinity && rhs_kind == category::zero)) {
            return {status::ok, nan()};
        }
        if (lhs_kind == category::zero || lhs_kind == category::infinity) {
            return {status::ok, *this};
        }
        if (rhs_kind == category::zero || rhs_kind == category::infinity) {
            return {status::ok, rhs};
        }

        // Dekker product: t + tau = a * c exactly, then the cross terms.
        status flags = status::ok;
        const half_type& a = hi_;
        const half_type& b = lo_;
        const half_type& c = rhs.hi_;
        const half_type& d = rhs.lo_;
        half_type t = a.mul_r(c, round).unpack(flags);
        if (!t.is_finite_non_zero()) {
            return {flags, double_double(t, half_type::zero())};
        }
        half_type tau = a.mul_add_r(c, -t, round).unpack(flags);
        half_type v = a.mul_r(d, round).unpack(flags);
        const half_type w = b.mul_r(c, round).unpack(flags);
        v = v.add_r(w, round).unpack(flags);
        tau = tau.add_r(v, round).unpack(flags);
        const half_type u = t.add_r(tau, round).unpack(flags);
        double_double result;
        result.hi_ = u;
        if (!u.is_finite()) {
            result.lo_ = half_type::zero();
        } else {
            t = t.sub_r(u, round).unpack(flags);
            result.lo_ = t.add_r(tau, round).unpack(flags);
        }
        return {flags, result};
    }

    status_and<double_double> div_r(const double_double& rhs, round_mode round) const noexcept {
        return to_fallback().div_r(rhs.to_fallback(), round).map(from_fallback);
    }

    status_and<double_double> mul_add_r(const double_double& multiplicand,
                                        const double_double& addend,
                                        round_mode round) const noexcept {
        return to_fallback()
            .mul_add_r(multiplicand.to_fallback(), addend.to_fallback(), round)
            .map(from_fallback);
    }

    double_double mul_add(const double_double& multiplicand,
                          const double_double& addend) const noexcept {
        return mul_add_r(multiplicand, addend, round_mode::nearest_ties_to_even).value;
    }

    // Remainder of the truncated quotient.
    status_and<double_double> c_fmod(const double_double& rhs) const noexcept {
        return to_fallback().c_fmod(rhs.to_fallback()).map(from_fallback);
    }

    // Remainder of the quotient rounded to nearest even.
    status_and<double_double> ieee_rem(const double_double& rhs) const noexcept {
        return to_fallback().ieee_rem(rhs.to_fallback()).map(from_fallback);
    }

    status_and<double_double> round_to_integral(round_mode round) const noexcept {
        return to_fallback().round_to_integral(round).map(from_fallback);
    }

    status_and<double_double> next_up() const noexcept {
        return to_fallback().next_up().map(from_fallback);
    }

    status_and<double_double> next_down() const noexcept {
        return (-*this).next_up().map([](const double_double& value) { return -value; });
    }

    std::optional<double_double> get_exact_inverse() const noexcept {
        const auto inverse = to_fallback().get_exact_inverse();
        if (!inverse) {
            return std::nullopt;
        }
        return from_fallback(*inverse);
    }

    friend double_double operator+(const double_double& lhs, const double_double& rhs) noexcept {
        return lhs.add_r(rhs, round_mode::nearest_ties_to_even).value;
    }
    friend double_double operator-(const double_double& lhs, const double_double& rhs) noexcept {
        return lhs.sub_r(rhs, round_mode::nearest_ties_to_even).value;
    }
    friend double_double operator*(const double_double& lhs, const double_double& rhs) noexcept {
        return lhs.mul_r(rhs, round_mode::nearest_ties_to_even).value;
    }
    friend double_double operator/(const double_double& lhs, const double_double& rhs) noexcept {
        return lhs.div_r(rhs, round_mode::nearest_ties_to_even).value;
    }
    friend status_and<double_double> operator%(const double_double& lhs,
                                               const double_double& rhs) noexcept {
        return lhs.c_fmod(rhs);
    }
    double_double& operator+=(const double_double& rhs) noexcept { return *this = *this + rhs; }
    double_double& operator-=(const double_double& rhs) noexcept { return *this = *this - rhs; }
    double_double& operator*=(const double_double& rhs) noexcept { return *this = *this * rhs; }
    double_double& operator/=(const double_double& rhs) noexcept { return *this = *this / rhs; }

    // Exponent manipulation

    int ilogb() const noexcept { return hi_.ilogb(); }

    double_double scalbn_r(int exp, round_mode round) const noexcept {
        return double_double(hi_.scalbn_r(exp, round), lo_.scalbn_r(exp, round));
    }

    double_double scalbn(int exp) const noexcept {
        return scalbn_r(exp, round_mode::nearest_ties_to_even);
    }

    double_double frexp_r(int& exp, round_mode round) const noexcept {
        const half_type hi = hi_.frexp_r(exp, round);
        half_type lo = lo_;
        if (kind() == category::normal) {
            lo = lo.scalbn_r(-exp, round);
        }
        return double_double(hi, lo);
    }

    double_double frexp(int& exp) const noexcept {
        return frexp_r(exp, round_mode::nearest_ties_to_even);
    }

    // Integer conversions

    static status_and<double_double> from_u128_r(unsigned __int128 value, round_mode round) noexcept {
        return fallback_type::from_u128_r(value, round).map(from_fallback);
    }

    static status_and<double_double> from_i128_r(__int128 value, round_mode round) noexcept {
        return fallback_type::from_i128_r(value, round).map(from_fallback);
    }

    static double_double from_u128(unsigned __int128 value) noexcept {
        return from_u128_r(value, round_mode::nearest_ties_to_even).value;
    }

    static double_double from_i128(__int128 value) noexcept {
        return from_i128_r(value, round_mode::nearest_ties_to_even).value;
    }

    status_and<unsigned __int128> to_u128_r(unsigned width, round_mode round,
                                            bool& is_exact) const noexcept {
        return to_fallback().to_u128_r(width, round, is_exact);
    }

    status_and<__int128> to_i128_r(unsigned width, round_mode round, bool& is_exact) const noexcept {
        return to_fallback().to_i128_r(width, round, is_exact);
    }

    // Interchange encoding: the low 128 bits hold (lo << 64) | hi.

    static double_double from_bits(const core::u256& bits) noexcept {
        const unsigned __int128 raw = bits.low_u128();
        return double_double(half_type::from_bits(static_cast<std::uint64_t>(raw)),
                             half_type::from_bits(static_cast<std::uint64_t>(raw >> 64)));
    }

    core::u256 to_bits() const noexcept {
        return core::u256::from_u128(hi_.to_bits() | (lo_.to_bits() << 64));
    }

    // Text

    static status_and<double_double> from_str_r(std::string_view text, round_mode round) {
        return fallback_type::from_str_r(text, round).map(from_fallback);
    }

    static double_double from_str(std::string_view text) {
        return from_str_r(text, round_mode::nearest_ties_to_even).value;
    }

    std::string to_string(unsigned precision = 0, unsigned max_padding = 3,
                          bool truncate_zero = true) const {
        return to_fallback().to_string(precision, max_padding, truncate_zero);
    }

    std::string to_hex_string(unsigned hex_digits = 0, bool upper = false,
                              round_mode round = round_mode::nearest_ties_to_even) const {
        return to_fallback().to_hex_string(hex_digits, upper, round);
    }

    // Exact value of hi + lo; specials carry over from hi.
    fallback_type to_fallback() const noexcept {
        bool loses_info = false;
        const fallback_type hi =
            hi_.convert_r<double_double_fallback_semantics>(round_mode::nearest_ties_to_even,
                                                            loses_info)
                .value;
        if (!hi.is_finite_non_zero()) {
            return hi;
        }
        const fallback_type lo =
            lo_.convert_r<double_double_fallback_semantics>(round_mode::nearest_ties_to_even,
                                                            loses_info)
                .value;
        return hi + lo;
    }

    // Splits an exact 106-bit value into the nearest double and its residue.
    static double_double from_fallback(const fallback_type& value) noexcept {
        bool loses_info = false;
        const fallback_extended_type extended =
            value.convert_r<double_double_fallback_extended_semantics>(
                     round_mode::nearest_ties_to_even, loses_info)
                .value;
        const half_type hi =
            extended.convert_r<double_semantics>(round_mode::nearest_ties_to_even, loses_info).value;
        if (value.is_signaling()) {
            // Conversion quiets NaNs; drop the quiet bit again.
            constexpr std::uint64_t QUIET = std::uint64_t{1} << 51;
            constexpr std::uint64_t FRACTION = (std::uint64_t{1} << 52) - 1;
            std::uint64_t bits = static_cast<std::uint64_t>(hi.to_bits()) & ~QUIET;
            if ((bits & FRACTION) == 0) {
                bits |= QUIET >> 1;
            }
            return double_double(half_type::from_bits(bits), half_type::zero());
        }
        if (!hi.is_finite_non_zero() || !loses_info) {
            return double_double(hi, half_type::zero());
        }
        const fallback_extended_type rounded =
            hi.convert_r<double_double_fallback_extended_semantics>(
                  round_mode::nearest_ties_to_even, loses_info)
                .value;
        const half_type lo = (extended - rounded)
                                 .convert_r<double_semantics>(round_mode::nearest_ties_to_even,
                                                              loses_info)
                                 .value;
        return double_double(hi, lo);
    }

private:
    // Zero halves order below every non-zero magnitude.
    static constexpr std::strong_ordering half_abs_order(const half_type& lhs,
                                                         const half_type& rhs) noexcept {
        if (lhs.is_zero() || rhs.is_zero()) {
            return (!lhs.is_zero()) <=> (!rhs.is_zero());
        }
        return lhs.compare_abs_normal(rhs);
    }

    half_type hi_{};
    half_type lo_{};
};

} // namespace numx::fp

namespace std {

template <>
struct hash<numx::fp::double_double> {
    std::size_t operator()(const numx::fp::double_double& value) const noexcept {
        return numx::core::canonical_hash(value.to_bits());
    }
};

} // namespace std

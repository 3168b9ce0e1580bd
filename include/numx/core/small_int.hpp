// include/numx/core/small_int.hpp — Bit-sized unsigned integers (u1..u7, u24) over a native carrier.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <numx/core/error.hpp>

namespace numx::core {

template <unsigned Bits, typename Storage>
class small_uint {
public:
    static_assert(std::is_unsigned_v<Storage>, "small_uint storage must be unsigned");
    static_assert(Bits > 0 && Bits < sizeof(Storage) * 8, "small_uint must be narrower than its storage");

    using storage_type = Storage;

    static constexpr unsigned BITS = Bits;
    static constexpr Storage MAX_VALUE = static_cast<Storage>((Storage{1} << Bits) - 1);

    constexpr small_uint() noexcept = default;

    static constexpr small_uint zero() noexcept { return small_uint(); }
    static constexpr small_uint one() noexcept { return raw(1); }
    static constexpr small_uint min() noexcept { return small_uint(); }
    static constexpr small_uint max() noexcept { return raw(MAX_VALUE); }

    // Contract-checked construction for values known to fit.
    static constexpr small_uint with(Storage value) {
        if (value > MAX_VALUE) {
            throw std::out_of_range("small_uint value exceeds max()");
        }
        return raw(value);
    }

    template <typename Int,
              typename = std::enable_if_t<std::is_integral_v<Int>>>
    static constexpr small_uint try_from(Int value) {
        if constexpr (std::is_signed_v<Int>) {
            if (value < 0) {
                throw overflow_error(MAX_VALUE, static_cast<std::size_t>(value));
            }
        }
        if (static_cast<std::uint64_t>(value) > MAX_VALUE) {
            throw overflow_error(MAX_VALUE, static_cast<std::size_t>(value));
        }
        return raw(static_cast<Storage>(value));
    }

    constexpr Storage value() const noexcept { return value_; }
    constexpr std::uint8_t as_u8() const noexcept
        requires(sizeof(Storage) == 1)
    {
        return value_;
    }
    constexpr std::uint32_t as_u32() const noexcept { return value_; }

    constexpr std::optional<small_uint> checked_add(Storage rhs) const noexcept {
        return checked(static_cast<std::uint64_t>(value_) + rhs);
    }
    constexpr std::optional<small_uint> checked_sub(Storage rhs) const noexcept {
        if (rhs > value_) {
            return std::nullopt;
        }
        return raw(static_cast<Storage>(value_ - rhs));
    }
    constexpr std::optional<small_uint> checked_mul(Storage rhs) const noexcept {
        return checked(static_cast<std::uint64_t>(value_) * rhs);
    }

    constexpr small_uint saturating_add(Storage rhs) const noexcept {
        return checked_add(rhs).value_or(max());
    }
    constexpr small_uint saturating_sub(Storage rhs) const noexcept {
        return checked_sub(rhs).value_or(min());
    }
    constexpr small_uint saturating_mul(Storage rhs) const noexcept {
        return checked_mul(rhs).value_or(max());
    }

    constexpr std::pair<small_uint, bool> overflowing_add(Storage rhs) const noexcept {
        return wrapped(static_cast<std::uint64_t>(value_) + rhs);
    }
    constexpr std::pair<small_uint, bool> overflowing_sub(Storage rhs) const noexcept {
        return {raw(static_cast<Storage>((value_ - rhs) & MAX_VALUE)), rhs > value_};
    }
    constexpr std::pair<small_uint, bool> overflowing_mul(Storage rhs) const noexcept {
        return wrapped(static_cast<std::uint64_t>(value_) * rhs);
    }

    constexpr small_uint wrapping_add(Storage rhs) const noexcept { return overflowing_add(rhs).first; }
    constexpr small_uint wrapping_sub(Storage rhs) const noexcept { return overflowing_sub(rhs).first; }
    constexpr small_uint wrapping_mul(Storage rhs) const noexcept { return overflowing_mul(rhs).first; }

    friend constexpr small_uint operator+(small_uint lhs, small_uint rhs) {
        return lhs.require(static_cast<std::uint64_t>(lhs.value_) + rhs.value_);
    }
    friend constexpr small_uint operator-(small_uint lhs, small_uint rhs) {
        if (rhs.value_ > lhs.value_) {
            throw std::overflow_error("attempt to subtract with overflow");
        }
        return raw(static_cast<Storage>(lhs.value_ - rhs.value_));
    }
    friend constexpr small_uint operator*(small_uint lhs, small_uint rhs) {
        return lhs.require(static_cast<std::uint64_t>(lhs.value_) * rhs.value_);
    }
    friend constexpr small_uint operator/(small_uint lhs, small_uint rhs) {
        if (rhs.value_ == 0) {
            throw div_error(div_error_kind::zero_div);
        }
        return raw(static_cast<Storage>(lhs.value_ / rhs.value_));
    }
    friend constexpr small_uint operator%(small_uint lhs, small_uint rhs) {
        if (rhs.value_ == 0) {
            throw div_error(div_error_kind::zero_div);
        }
        return raw(static_cast<Storage>(lhs.value_ % rhs.value_));
    }
    friend constexpr small_uint operator&(small_uint lhs, small_uint rhs) noexcept {
        return raw(static_cast<Storage>(lhs.value_ & rhs.value_));
    }
    friend constexpr small_uint operator|(small_uint lhs, small_uint rhs) noexcept {
        return raw(static_cast<Storage>(lhs.value_ | rhs.value_));
    }
    friend constexpr small_uint operator^(small_uint lhs, small_uint rhs) noexcept {
        return raw(static_cast<Storage>(lhs.value_ ^ rhs.value_));
    }
    friend constexpr small_uint operator<<(small_uint lhs, unsigned shift) {
        if (lhs.value_ == 0) {
            return lhs;
        }
        if (shift >= Bits || lhs.value_ > (MAX_VALUE >> shift)) {
            throw std::overflow_error("attempt to shift left with overflow");
        }
        return raw(static_cast<Storage>(lhs.value_ << shift));
    }
    friend constexpr small_uint operator>>(small_uint lhs, unsigned shift) noexcept {
        return shift >= Bits ? small_uint() : raw(static_cast<Storage>(lhs.value_ >> shift));
    }

    constexpr small_uint& operator+=(small_uint rhs) { return *this = *this + rhs; }
    constexpr small_uint& operator-=(small_uint rhs) { return *this = *this - rhs; }
    constexpr small_uint& operator*=(small_uint rhs) { return *this = *this * rhs; }
    constexpr small_uint& operator/=(small_uint rhs) { return *this = *this / rhs; }
    constexpr small_uint& operator%=(small_uint rhs) { return *this = *this % rhs; }
    constexpr small_uint& operator&=(small_uint rhs) noexcept { return *this = *this & rhs; }
    constexpr small_uint& operator|=(small_uint rhs) noexcept { return *this = *this | rhs; }
    constexpr small_uint& operator^=(small_uint rhs) noexcept { return *this = *this ^ rhs; }
    constexpr small_uint& operator<<=(unsigned shift) { return *this = *this << shift; }
    constexpr small_uint& operator>>=(unsigned shift) noexcept { return *this = *this >> shift; }

    friend constexpr bool operator==(small_uint, small_uint) noexcept = default;
    friend constexpr auto operator<=>(small_uint, small_uint) noexcept = default;

private:
    static constexpr small_uint raw(Storage value) noexcept {
        small_uint result;
        result.value_ = value;
        return result;
    }

    static constexpr std::optional<small_uint> checked(std::uint64_t value) noexcept {
        if (value > MAX_VALUE) {
            return std::nullopt;
        }
        return raw(static_cast<Storage>(value));
    }

    // Reduction is modulo 2^Bits.
    static constexpr std::pair<small_uint, bool> wrapped(std::uint64_t value) noexcept {
        return {raw(static_cast<Storage>(value & MAX_VALUE)), value > MAX_VALUE};
    }

    constexpr small_uint require(std::uint64_t value) const {
        if (value > MAX_VALUE) {
            throw overflow_error(MAX_VALUE, static_cast<std::size_t>(value));
        }
        return raw(static_cast<Storage>(value));
    }

    Storage value_{};
};

using u1 = small_uint<1, std::uint8_t>;
using u2 = small_uint<2, std::uint8_t>;
using u3 = small_uint<3, std::uint8_t>;
using u4 = small_uint<4, std::uint8_t>;
using u5 = small_uint<5, std::uint8_t>;
using u6 = small_uint<6, std::uint8_t>;
using u7 = small_uint<7, std::uint8_t>;
using u24 = small_uint<24, std::uint32_t>;

} // namespace numx::core

namespace std {

template <unsigned Bits, typename Storage>
struct hash<numx::core::small_uint<Bits, Storage>> {
    std::size_t operator()(const numx::core::small_uint<Bits, Storage>& value) const noexcept {
        return std::hash<Storage>{}(value.value());
    }
};

} // namespace std

// include/numx/fp/round.hpp — Rounding modes, categories and status flags for the software floats.

#pragma once

#include <climits>
#include <cstdint>
#include <utility>

namespace numx::fp {

enum class round_mode : std::uint8_t {
    nearest_ties_to_even,
    toward_positive,
    toward_negative,
    toward_zero,
    nearest_ties_to_away,
};

// Rounding mode to use for the magnitude of a negated value.
constexpr round_mode negate(round_mode mode) noexcept {
    switch (mode) {
    case round_mode::toward_positive:
        return round_mode::toward_negative;
    case round_mode::toward_negative:
        return round_mode::toward_positive;
    default:
        return mode;
    }
}

enum class category : std::uint8_t {
    infinity,
    nan,
    normal,
    zero,
};

enum class status : std::uint8_t {
    ok = 0x00,
    invalid_op = 0x01,
    div_by_zero = 0x02,
    overflow = 0x04,
    underflow = 0x08,
    inexact = 0x10,
};

constexpr status operator|(status lhs, status rhs) noexcept {
    return static_cast<status>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

constexpr status operator&(status lhs, status rhs) noexcept {
    return static_cast<status>(static_cast<std::uint8_t>(lhs) & static_cast<std::uint8_t>(rhs));
}

constexpr status operator-(status lhs, status rhs) noexcept {
    return static_cast<status>(static_cast<std::uint8_t>(lhs) &
                               ~static_cast<std::uint8_t>(rhs));
}

constexpr status& operator|=(status& lhs, status rhs) noexcept {
    lhs = lhs | rhs;
    return lhs;
}

constexpr bool has(status flags, status flag) noexcept { return (flags & flag) != status::ok; }

// An operation result together with the exceptions it raised.
template <typename T>
struct status_and {
    status flags = status::ok;
    T value{};

    // Accumulates flags into `into` and yields the value.
    constexpr T unpack(status& into) const {
        into |= flags;
        return value;
    }

    template <typename F>
    constexpr auto map(F&& fn) const -> status_and<decltype(fn(value))> {
        return {flags, fn(value)};
    }

    friend constexpr bool operator==(const status_and&, const status_and&) = default;
};

template <typename T>
constexpr status_and<T> with_status(status flags, T value) {
    return {flags, std::move(value)};
}

// Truncated bits of a significand relative to the retained lsb.
enum class loss : std::uint8_t {
    exactly_zero,
    less_than_half,
    exactly_half,
    more_than_half,
};

// Merges the fraction from a less significant shift into a more significant one.
constexpr loss combine(loss more_significant, loss less_significant) noexcept {
    if (less_significant != loss::exactly_zero) {
        if (more_significant == loss::exactly_zero) {
            return loss::less_than_half;
        }
        if (more_significant == loss::exactly_half) {
            return loss::more_than_half;
        }
    }
    return more_significant;
}

inline constexpr int IEK_INF = INT_MAX;
inline constexpr int IEK_NAN = INT_MIN;
inline constexpr int IEK_ZERO = INT_MIN + 1;

} // namespace numx::fp

// include/numx/core/detail/word_ops.hpp — Multi-word (limb array) primitives shared by the engines.

#pragma once

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace numx::core::detail {

#if !defined(__SIZEOF_INT128__)
#error "numx requires __int128 support"
#endif

using word = std::uint64_t;
using dword = unsigned __int128;
using sdword = __int128_t;

inline constexpr unsigned WORD_BITS = 64;
inline constexpr unsigned NO_BIT = std::numeric_limits<unsigned>::max();

inline constexpr std::size_t word_count(unsigned bits) noexcept {
    return (bits + WORD_BITS - 1) / WORD_BITS;
}

inline constexpr word low_bit_mask(unsigned bits) noexcept {
    return bits >= WORD_BITS ? ~word{0} : (word{1} << bits) - 1;
}

inline constexpr void tc_set(word* dst, word value, std::size_t parts) noexcept {
    if (parts == 0) {
        return;
    }
    dst[0] = value;
    for (std::size_t index = 1; index < parts; ++index) {
        dst[index] = 0;
    }
}

inline constexpr void tc_assign(word* dst, const word* src, std::size_t parts) noexcept {
    for (std::size_t index = 0; index < parts; ++index) {
        dst[index] = src[index];
    }
}

inline constexpr bool tc_is_zero(const word* src, std::size_t parts) noexcept {
    for (std::size_t index = 0; index < parts; ++index) {
        if (src[index] != 0) {
            return false;
        }
    }
    return true;
}

inline constexpr bool tc_extract_bit(const word* parts, unsigned bit) noexcept {
    return (parts[bit / WORD_BITS] >> (bit % WORD_BITS)) & 1u;
}

inline constexpr void tc_set_bit(word* parts, unsigned bit) noexcept {
    parts[bit / WORD_BITS] |= word{1} << (bit % WORD_BITS);
}

inline constexpr void tc_clear_bit(word* parts, unsigned bit) noexcept {
    parts[bit / WORD_BITS] &= ~(word{1} << (bit % WORD_BITS));
}

// Index of the lowest set bit, NO_BIT when zero.
inline constexpr unsigned tc_lsb(const word* parts, std::size_t n) noexcept {
    for (std::size_t index = 0; index < n; ++index) {
        if (parts[index] != 0) {
            return static_cast<unsigned>(index * WORD_BITS) +
                   static_cast<unsigned>(std::countr_zero(parts[index]));
        }
    }
    return NO_BIT;
}

// Index of the highest set bit, NO_BIT when zero.
inline constexpr unsigned tc_msb(const word* parts, std::size_t n) noexcept {
    for (std::size_t index = n; index-- > 0;) {
        if (parts[index] != 0) {
            return static_cast<unsigned>(index * WORD_BITS) +
                   static_cast<unsigned>(std::bit_width(parts[index])) - 1;
        }
    }
    return NO_BIT;
}

// One-based position of the highest set bit, zero for a zero value.
inline constexpr unsigned tc_omsb(const word* parts, std::size_t n) noexcept {
    const unsigned msb = tc_msb(parts, n);
    return msb == NO_BIT ? 0 : msb + 1;
}

inline constexpr void tc_shift_left(word* dst, std::size_t words, unsigned count) noexcept {
    if (count == 0) {
        return;
    }
    const std::size_t word_shift = std::min<std::size_t>(count / WORD_BITS, words);
    const unsigned bit_shift = count % WORD_BITS;
    for (std::size_t index = words; index-- > word_shift;) {
        dst[index] = dst[index - word_shift] << bit_shift;
        if (bit_shift != 0 && index > word_shift) {
            dst[index] |= dst[index - word_shift - 1] >> (WORD_BITS - bit_shift);
        }
    }
    for (std::size_t index = 0; index < word_shift; ++index) {
        dst[index] = 0;
    }
}

inline constexpr void tc_shift_right(word* dst, std::size_t words, unsigned count) noexcept {
    if (count == 0) {
        return;
    }
    const std::size_t word_shift = std::min<std::size_t>(count / WORD_BITS, words);
    const unsigned bit_shift = count % WORD_BITS;
    const std::size_t moved = words - word_shift;
    for (std::size_t index = 0; index < moved; ++index) {
        dst[index] = dst[index + word_shift] >> bit_shift;
        if (bit_shift != 0 && index + 1 < moved) {
            dst[index] |= dst[index + word_shift + 1] << (WORD_BITS - bit_shift);
        }
    }
    for (std::size_t index = moved; index < words; ++index) {
        dst[index] = 0;
    }
}

// Copies src_bits bits of src starting at src_lsb into dst, zero filling the rest.
inline constexpr void tc_extract(word* dst, std::size_t dst_count, const word* src,
                                 unsigned src_bits, unsigned src_lsb) noexcept {
    const std::size_t dst_parts = word_count(src_bits);
    const std::size_t first_src_part = src_lsb / WORD_BITS;
    tc_assign(dst, src + first_src_part, dst_parts);
    const unsigned shift = src_lsb % WORD_BITS;
    tc_shift_right(dst, dst_parts, shift);
    const unsigned filled = static_cast<unsigned>(dst_parts * WORD_BITS) - shift;
    if (filled < src_bits) {
        const word mask = low_bit_mask(src_bits - filled);
        dst[dst_parts - 1] |= (src[first_src_part + dst_parts] & mask) << (filled % WORD_BITS);
    } else if (filled > src_bits && src_bits % WORD_BITS != 0) {
        dst[dst_parts - 1] &= low_bit_mask(src_bits % WORD_BITS);
    }
    for (std::size_t index = dst_parts; index < dst_count; ++index) {
        dst[index] = 0;
    }
}

inline constexpr word tc_add(word* dst, const word* rhs, word carry, std::size_t parts) noexcept {
    for (std::size_t index = 0; index < parts; ++index) {
        const word lhs = dst[index];
        if (carry != 0) {
            dst[index] += rhs[index] + 1;
            carry = dst[index] <= lhs ? 1 : 0;
        } else {
            dst[index] += rhs[index];
            carry = dst[index] < lhs ? 1 : 0;
        }
    }
    return carry;
}

inline constexpr word tc_subtract(word* dst, const word* rhs, word borrow,
                                  std::size_t parts) noexcept {
    for (std::size_t index = 0; index < parts; ++index) {
        const word lhs = dst[index];
        if (borrow != 0) {
            dst[index] -= rhs[index] + 1;
            borrow = dst[index] >= lhs ? 1 : 0;
        } else {
            dst[index] -= rhs[index];
            borrow = dst[index] > lhs ? 1 : 0;
        }
    }
    return borrow;
}

inline constexpr word tc_increment(word* dst, std::size_t parts) noexcept {
    for (std::size_t index = 0; index < parts; ++index) {
        if (++dst[index] != 0) {
            return 0;
        }
    }
    return 1;
}

inline constexpr word tc_decrement(word* dst, std::size_t parts) noexcept {
    for (std::size_t index = 0; index < parts; ++index) {
        if (dst[index]-- != 0) {
            return 0;
        }
    }
    return 1;
}

inline constexpr void tc_negate(word* dst, std::size_t parts) noexcept {
    for (std::size_t index = 0; index < parts; ++index) {
        dst[index] = ~dst[index];
    }
    tc_increment(dst, parts);
}

inline constexpr int tc_compare(const word* lhs, const word* rhs, std::size_t parts) noexcept {
    for (std::size_t index = parts; index-- > 0;) {
        if (lhs[index] != rhs[index]) {
            return lhs[index] > rhs[index] ? 1 : -1;
        }
    }
    return 0;
}

// dst[0..dst_parts) (+)= src * multiplier + carry; returns 1 when the product did not fit.
inline constexpr int tc_multiply_part(word* dst, const word* src, word multiplier, word carry,
                                      std::size_t src_parts, std::size_t dst_parts,
                                      bool add) noexcept {
    const std::size_t n = std::min(dst_parts, src_parts);
    for (std::size_t index = 0; index < n; ++index) {
        word low = carry;
        word high = 0;
        if (multiplier != 0 && src[index] != 0) {
            const dword full = static_cast<dword>(src[index]) * multiplier;
            low = static_cast<word>(full);
            high = static_cast<word>(full >> WORD_BITS);
            low += carry;
            if (low < carry) {
                ++high;
            }
        }
        if (add) {
            if (low + dst[index] < low) {
                ++high;
            }
            dst[index] += low;
        } else {
            dst[index] = low;
        }
        carry = high;
    }
    if (src_parts < dst_parts) {
        dst[src_parts] = carry;
        return 0;
    }
    if (carry != 0) {
        return 1;
    }
    if (multiplier != 0) {
        for (std::size_t index = dst_parts; index < src_parts; ++index) {
            if (src[index] != 0) {
                return 1;
            }
        }
    }
    return 0;
}

// dst receives lhs_parts + rhs_parts words of the exact product.
inline constexpr void tc_full_multiply(word* dst, const word* lhs, const word* rhs,
                                       std::size_t lhs_parts, std::size_t rhs_parts) noexcept {
    if (lhs_parts > rhs_parts) {
        tc_full_multiply(dst, rhs, lhs, rhs_parts, lhs_parts);
        return;
    }
    tc_set(dst, 0, rhs_parts);
    for (std::size_t index = 0; index < lhs_parts; ++index) {
        tc_multiply_part(&dst[index], rhs, lhs[index], 0, rhs_parts, rhs_parts + 1, true);
    }
}

} // namespace numx::core::detail

// include/numx/core/detail/bignum.hpp — Growable scratch integer used by exact decimal conversion.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include <numx/core/detail/word_ops.hpp>

namespace numx::core::detail {

// Unsigned magnitude with little-endian words; never carries a leading zero word.
class bignum {
public:
    bignum() = default;

    explicit bignum(word value) {
        if (value != 0) {
            words_.push_back(value);
        }
    }

    static bignum from_words(const word* parts, std::size_t count) {
        bignum result;
        result.words_.assign(parts, parts + count);
        result.trim();
        return result;
    }

    static bignum pow5(unsigned exponent) {
        // 5^27 is the largest power of five below 2^63.
        constexpr word FIVE_27 = 7450580596923828125ULL;
        bignum result(1);
        while (exponent >= 27) {
            result.mul_small(FIVE_27);
            exponent -= 27;
        }
        word tail = 1;
        while (exponent-- > 0) {
            tail *= 5;
        }
        result.mul_small(tail);
        return result;
    }

    bool is_zero() const noexcept { return words_.empty(); }

    const std::vector<word>& words() const noexcept { return words_; }

    unsigned bit_length() const noexcept {
        return tc_omsb(words_.data(), words_.size());
    }

    bool test_bit(unsigned bit) const noexcept {
        if (bit / WORD_BITS >= words_.size()) {
            return false;
        }
        return tc_extract_bit(words_.data(), bit);
    }

    // Index of the lowest set bit, NO_BIT when zero.
    unsigned lowest_set_bit() const noexcept { return tc_lsb(words_.data(), words_.size()); }

    void mul_small(word multiplier) {
        if (multiplier == 0) {
            words_.clear();
            return;
        }
        word carry = 0;
        for (auto& part : words_) {
            const dword full = static_cast<dword>(part) * multiplier + carry;
            part = static_cast<word>(full);
            carry = static_cast<word>(full >> WORD_BITS);
        }
        if (carry != 0) {
            words_.push_back(carry);
        }
    }

    void add_small(word addend) {
        for (auto& part : words_) {
            part += addend;
            if (part >= addend) {
                return;
            }
            addend = 1;
        }
        if (addend != 0) {
            words_.push_back(addend);
        }
    }

    // Divides in place and returns the remainder.
    word div_small(word divisor) {
        dword remainder = 0;
        for (std::size_t index = words_.size(); index-- > 0;) {
            const dword current = (remainder << WORD_BITS) | words_[index];
            words_[index] = static_cast<word>(current / divisor);
            remainder = current % divisor;
        }
        trim();
        return static_cast<word>(remainder);
    }

    bignum operator*(const bignum& rhs) const {
        if (is_zero() || rhs.is_zero()) {
            return bignum();
        }
        bignum result;
        result.words_.assign(words_.size() + rhs.words_.size(), 0);
        tc_full_multiply(result.words_.data(), words_.data(), rhs.words_.data(), words_.size(),
                         rhs.words_.size());
        result.trim();
        return result;
    }

    bignum& operator<<=(unsigned count) {
        if (is_zero() || count == 0) {
            return *this;
        }
        words_.resize(words_.size() + count / WORD_BITS + 1, 0);
        tc_shift_left(words_.data(), words_.size(), count);
        trim();
        return *this;
    }

    bignum& operator>>=(unsigned count) {
        tc_shift_right(words_.data(), words_.size(), count);
        trim();
        return *this;
    }

    friend int compare(const bignum& lhs, const bignum& rhs) noexcept {
        if (lhs.words_.size() != rhs.words_.size()) {
            return lhs.words_.size() < rhs.words_.size() ? -1 : 1;
        }
        return tc_compare(lhs.words_.data(), rhs.words_.data(), lhs.words_.size());
    }

    void subtract(const bignum& rhs) {
        std::vector<word> padded(words_.size(), 0);
        std::copy(rhs.words_.begin(), rhs.words_.end(), padded.begin());
        tc_subtract(words_.data(), padded.data(), 0, words_.size());
        trim();
    }

    // Restoring binary long division; divisor must be non-zero.
    static std::pair<bignum, bignum> div_rem(const bignum& dividend, const bignum& divisor) {
        bignum quotient;
        bignum remainder = dividend;
        if (compare(dividend, divisor) < 0) {
            return {quotient, remainder};
        }
        unsigned shift = dividend.bit_length() - divisor.bit_length();
        bignum shifted = divisor;
        shifted <<= shift;
        quotient.words_.assign(shift / WORD_BITS + 1, 0);
        while (true) {
            if (compare(remainder, shifted) >= 0) {
                remainder.subtract(shifted);
                tc_set_bit(quotient.words_.data(), shift);
            }
            if (shift == 0) {
                break;
            }
            shifted >>= 1;
            --shift;
        }
        quotient.trim();
        return {quotient, remainder};
    }

private:
    void trim() {
        while (!words_.empty() && words_.back() == 0) {
            words_.pop_back();
        }
    }

    std::vector<word> words_;
};

} // namespace numx::core::detail

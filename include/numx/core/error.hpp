// include/numx/core/error.hpp — Error types raised by the integer engine.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace numx::core {

class overflow_error : public std::overflow_error {
public:
    overflow_error(std::size_t max, std::size_t value)
        : std::overflow_error("Unable to construct bit-sized integer from a value `" +
                              std::to_string(value) + "` overflowing max value `" +
                              std::to_string(max) + "`"),
          max_(max), value_(value) {}

    std::size_t max() const noexcept { return max_; }
    std::size_t value() const noexcept { return value_; }

private:
    std::size_t max_;
    std::size_t value_;
};

class parse_length_error : public std::invalid_argument {
public:
    parse_length_error(std::size_t actual, std::size_t expected)
        : std::invalid_argument("Invalid length: got " + std::to_string(actual) +
                                ", expected " + std::to_string(expected)),
          actual_(actual), expected_(expected) {}

    std::size_t actual() const noexcept { return actual_; }
    std::size_t expected() const noexcept { return expected_; }

private:
    std::size_t actual_;
    std::size_t expected_;
};

enum class div_error_kind { zero_div, overflow };

class div_error : public std::domain_error {
public:
    explicit div_error(div_error_kind kind)
        : std::domain_error(kind == div_error_kind::zero_div ? "division by zero"
                                                             : "division with overflow"),
          kind_(kind) {}

    div_error_kind kind() const noexcept { return kind_; }

private:
    div_error_kind kind_;
};

} // namespace numx::core

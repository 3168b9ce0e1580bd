// include/numx/util/debug.hpp — Type-tagged diagnostic dumps.

#pragma once

#include <cstddef>
#include <ostream>

#include <numx/core/small_int.hpp>
#include <numx/core/wide_int.hpp>
#include <numx/fp/double_double.hpp>
#include <numx/fp/ieee_float.hpp>
#include <numx/io/format.hpp>

namespace numx::util {

template <std::size_t Words, bool Signed>
std::ostream& dump(std::ostream& os, const core::wide_int<Words, Signed>& value) {
    return os << (Signed ? 'i' : 'u') << core::wide_int<Words, Signed>::BITS << '('
              << io::to_full_hex(value) << ')';
}

template <unsigned Bits, typename Storage>
std::ostream& dump(std::ostream& os, const core::small_uint<Bits, Storage>& value) {
    return os << 'u' << Bits << '(' << io::to_string(value) << ')';
}

template <class Semantics>
std::ostream& dump(std::ostream& os, const fp::ieee_float<Semantics>& value) {
    return os << "ieee_float(" << value.to_hex_string() << " / " << value.to_string() << ')';
}

inline std::ostream& dump(std::ostream& os, const fp::double_double& value) {
    return os << "double_double(" << io::to_full_hex(value.to_bits()) << " / "
              << value.to_string() << ')';
}

} // namespace numx::util

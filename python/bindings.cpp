// python/bindings.cpp — Pybind11 bindings for the numx module.

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <numx/numx.hpp>

namespace py = pybind11;
namespace core = numx::core;
namespace fp = numx::fp;

namespace {

template <typename Int>
py::int_ to_python_int(const Int& value) {
    const auto builtins = py::module_::import("builtins");
    return builtins.attr("int")(numx::io::to_string(value));
}

// Python ints arrive through their decimal text so any width round-trips.
template <typename Int>
Int from_python_int(const py::int_& value) {
    return numx::io::from_string<Int>(py::str(value).cast<std::string>());
}

py::tuple with_flags(fp::status flags, py::object value) {
    return py::make_tuple(std::move(value), static_cast<std::uint8_t>(flags));
}

template <std::size_t Words, bool Signed>
void bind_wide_int(py::module_& module, const char* name, const char* doc) {
    using Int = core::wide_int<Words, Signed>;
    py::class_<Int> cls(module, name, doc);
    cls.def(py::init<>())
        .def(py::init(&from_python_int<Int>), py::arg("value"))
        .def_static("from_str", &numx::io::from_string<Int>, py::arg("text"), py::arg("base") = 10,
                    "Parse text in the given base; base 0 reads a 0x/0o/0b prefix")
        .def_static("min", &Int::min)
        .def_static("max", &Int::max)
        .def_readonly_static("BITS", &Int::BITS)
        .def("to_str", [](const Int& self, int base) { return numx::io::to_string(self, base); },
             py::arg("base") = 10)
        .def("to_hex", [](const Int& self) { return numx::io::to_hex(self, false, true); })
        .def("bits_required", &Int::bits_required)
        .def("count_ones", &Int::count_ones)
        .def("leading_zeros", &Int::leading_zeros)
        .def("trailing_zeros", &Int::trailing_zeros)
        .def("to_be_bytes",
             [](const Int& self) {
                 const auto bytes = self.to_be_bytes();
                 return py::bytes(reinterpret_cast<const char*>(bytes.data()), bytes.size());
             })
        .def("wrapping_add", &Int::wrapping_add)
        .def("wrapping_sub", &Int::wrapping_sub)
        .def("wrapping_mul", &Int::wrapping_mul)
        .def("checked_add", &Int::checked_add)
        .def("checked_sub", &Int::checked_sub)
        .def("checked_mul", &Int::checked_mul)
        .def("saturating_add", &Int::saturating_add)
        .def("saturating_sub", &Int::saturating_sub)
        .def("overflowing_add", &Int::overflowing_add)
        .def("overflowing_mul", &Int::overflowing_mul)
        .def("div_rem", &Int::div_rem)
        .def("__int__", &to_python_int<Int>)
        .def("__index__", &to_python_int<Int>)
        .def("__str__", [](const Int& self) { return numx::io::to_string(self); })
        .def("__repr__",
             [name](const Int& self) {
                 return std::string(name) + "(" + numx::io::to_string(self) + ")";
             })
        .def("__bool__", [](const Int& self) { return !self.is_zero(); })
        .def("__hash__", [](const Int& self) { return std::hash<Int>{}(self); })
        .def("__add__", [](const Int& a, const Int& b) { return a + b; })
        .def("__sub__", [](const Int& a, const Int& b) { return a - b; })
        .def("__mul__", [](const Int& a, const Int& b) { return a * b; })
        .def("__floordiv__", [](const Int& a, const Int& b) { return a / b; })
        .def("__mod__", [](const Int& a, const Int& b) { return a % b; })
        .def("__and__", [](const Int& a, const Int& b) { return a & b; })
        .def("__or__", [](const Int& a, const Int& b) { return a | b; })
        .def("__xor__", [](const Int& a, const Int& b) { return a ^ b; })
        .def("__invert__", [](const Int& a) { return ~a; })
        .def("__lshift__", [](const Int& a, std::size_t shift) { return a << shift; })
        .def("__rshift__", [](const Int& a, std::size_t shift) { return a >> shift; })
        .def("__lt__", [](const Int& a, const Int& b) { return a < b; })
        .def("__le__", [](const Int& a, const Int& b) { return a <= b; })
        .def("__eq__", [](const Int& a, const Int& b) { return a == b; })
        .def("__ne__", [](const Int& a, const Int& b) { return a != b; })
        .def("__gt__", [](const Int& a, const Int& b) { return a > b; })
        .def("__ge__", [](const Int& a, const Int& b) { return a >= b; });
    if constexpr (Signed) {
        cls.def("__neg__", [](const Int& a) { return -a; })
            .def("__abs__", &Int::abs)
            .def("is_negative", &Int::is_negative);
    }
}

} // namespace

PYBIND11_MODULE(numx, module) {
    module.doc() = "Pybind11 bindings for the numx fixed-width integers and double-double floats";

    py::register_exception<core::div_error>(module, "DivError", PyExc_ZeroDivisionError);
    py::register_exception<fp::parse_error>(module, "ParseError", PyExc_ValueError);

    py::enum_<fp::round_mode>(module, "Round", "IEEE-754 rounding direction")
        .value("NEAREST_TIES_TO_EVEN", fp::round_mode::nearest_ties_to_even)
        .value("TOWARD_POSITIVE", fp::round_mode::toward_positive)
        .value("TOWARD_NEGATIVE", fp::round_mode::toward_negative)
        .value("TOWARD_ZERO", fp::round_mode::toward_zero)
        .value("NEAREST_TIES_TO_AWAY", fp::round_mode::nearest_ties_to_away);

    py::enum_<fp::category>(module, "Category", "Classification of a floating-point value")
        .value("INFINITY", fp::category::infinity)
        .value("NAN", fp::category::nan)
        .value("NORMAL", fp::category::normal)
        .value("ZERO", fp::category::zero);

    module.attr("STATUS_INVALID_OP") = static_cast<std::uint8_t>(fp::status::invalid_op);
    module.attr("STATUS_DIV_BY_ZERO") = static_cast<std::uint8_t>(fp::status::div_by_zero);
    module.attr("STATUS_OVERFLOW") = static_cast<std::uint8_t>(fp::status::overflow);
    module.attr("STATUS_UNDERFLOW") = static_cast<std::uint8_t>(fp::status::underflow);
    module.attr("STATUS_INEXACT") = static_cast<std::uint8_t>(fp::status::inexact);

    bind_wide_int<4, false>(module, "U256", "256-bit unsigned integer");
    bind_wide_int<4, true>(module, "I256", "256-bit two's complement integer");
    bind_wide_int<8, false>(module, "U512", "512-bit unsigned integer");
    bind_wide_int<8, true>(module, "I512", "512-bit two's complement integer");

    using fp::double_double;
    constexpr fp::round_mode NEAREST = fp::round_mode::nearest_ties_to_even;
    py::class_<double_double> py_dd(module, "DoubleDouble",
                                    "Pair of binary64 values with a 106-bit significand");
    py_dd.def(py::init<>())
        .def(py::init(&double_double::from_double), py::arg("value"))
        .def(py::init([](double hi, double lo) {
                 return double_double(fp::ieee_double::from_double(hi),
                                      fp::ieee_double::from_double(lo));
             }),
             py::arg("hi"), py::arg("lo"))
        .def_static("from_str", &double_double::from_str, py::arg("text"))
        .def_static("from_bits",
                    [](const py::int_& bits) {
                        return double_double::from_bits(from_python_int<core::u256>(bits));
                    })
        .def_static("zero", &double_double::zero, py::arg("negative") = false)
        .def_static("inf", &double_double::inf, py::arg("negative") = false)
        .def_static("nan", &double_double::nan)
        .def_static("largest", &double_double::largest)
        .def_static("smallest", &double_double::smallest)
        .def_property_readonly("hi", [](const double_double& self) { return self.hi().to_double(); })
        .def_property_readonly("lo", [](const double_double& self) { return self.lo().to_double(); })
        .def_property_readonly("category", &double_double::kind)
        .def("to_bits", [](const double_double& self) { return to_python_int(self.to_bits()); })
        .def("to_hex", [](const double_double& self) { return self.to_hex_string(); })
        .def("is_nan", &double_double::is_nan)
        .def("is_infinite", &double_double::is_infinite)
        .def("is_zero", &double_double::is_zero)
        .def("is_negative", &double_double::is_negative)
        .def("is_denormal", &double_double::is_denormal)
        .def("ilogb", &double_double::ilogb)
        .def("scalbn", &double_double::scalbn, py::arg("exp"))
        .def("add", [](const double_double& a, const double_double& b, fp::round_mode round) {
                 const auto result = a.add_r(b, round);
                 return with_flags(result.flags, py::cast(result.value));
             },
             py::arg("rhs"), py::arg("round") = NEAREST)
        .def("mul", [](const double_double& a, const double_double& b, fp::round_mode round) {
                 const auto result = a.mul_r(b, round);
                 return with_flags(result.flags, py::cast(result.value));
             },
             py::arg("rhs"), py::arg("round") = NEAREST)
        .def("div", [](const double_double& a, const double_double& b, fp::round_mode round) {
                 const auto result = a.div_r(b, round);
                 return with_flags(result.flags, py::cast(result.value));
             },
             py::arg("rhs"), py::arg("round") = NEAREST)
        .def("fma",
             [](const double_double& a, const double_double& b, const double_double& c,
                fp::round_mode round) {
                 const auto result = a.mul_add_r(b, c, round);
                 return with_flags(result.flags, py::cast(result.value));
             },
             py::arg("multiplicand"), py::arg("addend"), py::arg("round") = NEAREST)
        .def("round_to_integral",
             [](const double_double& a, fp::round_mode round) {
                 const auto result = a.round_to_integral(round);
                 return with_flags(result.flags, py::cast(result.value));
             },
             py::arg("round") = NEAREST)
        .def("__float__", [](const double_double& self) { return self.to_double(); })
        .def("__str__", [](const double_double& self) { return self.to_string(); })
        .def("__repr__",
             [](const double_double& self) { return "DoubleDouble(" + self.to_string() + ")"; })
        .def("__hash__", [](const double_double& self) { return std::hash<double_double>{}(self); })
        .def("__add__", [](const double_double& a, const double_double& b) { return a + b; })
        .def("__sub__", [](const double_double& a, const double_double& b) { return a - b; })
        .def("__mul__", [](const double_double& a, const double_double& b) { return a * b; })
        .def("__truediv__", [](const double_double& a, const double_double& b) { return a / b; })
        .def("__mod__", [](const double_double& a, const double_double& b) { return (a % b).value; })
        .def("__neg__", [](const double_double& a) { return -a; })
        .def("__abs__", &double_double::abs)
        .def("__lt__", [](const double_double& a, const double_double& b) { return a < b; })
        .def("__le__", [](const double_double& a, const double_double& b) { return a <= b; })
        .def("__eq__", [](const double_double& a, const double_double& b) { return a == b; })
        .def("__ne__", [](const double_double& a, const double_double& b) { return a != b; })
        .def("__gt__", [](const double_double& a, const double_double& b) { return a > b; })
        .def("__ge__", [](const double_double& a, const double_double& b) { return a >= b; });
}

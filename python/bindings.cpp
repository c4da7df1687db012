// python/bindings.cpp — Pybind11 bindings for the fxpoint module.

#include <optional>
#include <string>
#include <utility>

#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <fxpoint/fxpoint.hpp>

namespace py = pybind11;
namespace core = fxpoint::core;

using fxpoint::Format;
using fxpoint::Number;

static py::int_ to_python_int(const core::bigint& value) {
    const auto builtins = py::module_::import("builtins");
    return builtins.attr("int")(fxpoint::io::to_string(value));
}

static core::bigint from_python_int(const py::int_& value) {
    return fxpoint::io::parse_bigint(py::str(value).cast<std::string>());
}

static Format format_from_python(std::optional<int> integer_bits, int fraction_bits) {
    return Format(fraction_bits, integer_bits);
}

PYBIND11_MODULE(fxpoint, module) {
    module.doc() = "Arbitrary-precision binary fixed-point arithmetic";
    module.attr("__version__") = std::to_string(fxpoint::FXPOINT_VERSION_MAJOR) + "." +
                                 std::to_string(fxpoint::FXPOINT_VERSION_MINOR) + "." +
                                 std::to_string(fxpoint::FXPOINT_VERSION_PATCH);

    py::register_exception<fxpoint::OverflowError>(module, "OverflowError", PyExc_OverflowError);
    py::register_exception<fxpoint::DomainError>(module, "DomainError", PyExc_ValueError);
    py::register_exception<fxpoint::DivisionByZero>(module, "DivisionByZero", PyExc_ZeroDivisionError);
    py::register_exception<fxpoint::ValueError>(module, "ValueError", PyExc_ValueError);

    py::class_<Format> py_format(module, "Format", "Fixed-point format: fraction bits and optional integer bits");
    py_format.def(py::init(&format_from_python), py::arg("integer_bits") = std::nullopt,
                  py::arg("fraction_bits") = fxpoint::DEFAULT_FRACTION_BITS)
        .def_property_readonly("fraction_bits", &Format::fraction_bits)
        .def_property_readonly("integer_bits", &Format::integer_bits)
        .def_property_readonly("total_bits", &Format::total_bits)
        .def_property_readonly("is_bounded", &Format::is_bounded)
        .def_property_readonly("min_scaled", [](const Format& self) -> py::object {
            const auto value = self.min_scaled();
            return value ? py::object(to_python_int(*value)) : py::none();
        })
        .def_property_readonly("max_scaled", [](const Format& self) -> py::object {
            const auto value = self.max_scaled();
            return value ? py::object(to_python_int(*value)) : py::none();
        })
        .def("from_int", [](const Format& self, const py::int_& value) {
            return self.from_int(from_python_int(value));
        }, py::arg("value"))
        .def("from_rational", [](const Format& self, const py::int_& numerator, const py::int_& denominator) {
            return self.from_rational(from_python_int(numerator), from_python_int(denominator));
        }, py::arg("numerator"), py::arg("denominator"))
        .def("from_string", [](const Format& self, const std::string& text) {
            return self.from_string(text);
        }, py::arg("text"))
        .def("from_float", &Format::from_double, py::arg("value"))
        .def("from_scaled", [](const Format& self, const py::int_& scaled) {
            return self.from_scaled(from_python_int(scaled));
        }, py::arg("scaled"))
        .def("convert", &Format::convert, py::arg("value"))
        .def("zero", &Format::zero)
        .def("one", &Format::one)
        .def("pi", &Format::pi)
        .def("ln2", &Format::ln2)
        .def("e", &Format::e)
        .def_static("common", &Format::common, py::arg("lhs"), py::arg("rhs"))
        .def("__eq__", [](const Format& a, const Format& b) { return a == b; })
        .def("__ne__", [](const Format& a, const Format& b) { return a != b; })
        .def("__hash__", [](const Format& self) {
            return py::hash(py::make_tuple(self.integer_bits(), self.fraction_bits()));
        })
        .def("__repr__", &Format::to_string);

    module.def("make_format", &fxpoint::make_format, py::arg("integer_bits"), py::arg("fraction_bits"));

    py::class_<Number> py_number(module, "Number", "Immutable fixed-point value bound to a Format");
    py_number.def(py::init([](const Format& format, const py::int_& scaled) {
        return Number(format, from_python_int(scaled));
    }), py::arg("format"), py::arg("scaled"))
        .def_property_readonly("format", &Number::format)
        .def_property_readonly("scaled", [](const Number& self) { return to_python_int(self.scaled_value()); })
        .def("to_format", &Number::to_format, py::arg("format"))
        .def("is_integer", &Number::is_integer)
        .def("sqrt", py::overload_cast<>(&Number::sqrt, py::const_))
        .def("sqrt", py::overload_cast<const Format&>(&Number::sqrt, py::const_), py::arg("format"))
        .def("ln", py::overload_cast<>(&Number::ln, py::const_))
        .def("ln", py::overload_cast<const Format&>(&Number::ln, py::const_), py::arg("format"))
        .def("log2", py::overload_cast<>(&Number::log2, py::const_))
        .def("log2", py::overload_cast<const Format&>(&Number::log2, py::const_), py::arg("format"))
        .def("exp", py::overload_cast<>(&Number::exp, py::const_))
        .def("exp", py::overload_cast<const Format&>(&Number::exp, py::const_), py::arg("format"))
        .def("sin", py::overload_cast<>(&Number::sin, py::const_))
        .def("sin", py::overload_cast<const Format&>(&Number::sin, py::const_), py::arg("format"))
        .def("cos", py::overload_cast<>(&Number::cos, py::const_))
        .def("cos", py::overload_cast<const Format&>(&Number::cos, py::const_), py::arg("format"))
        .def("sincos", py::overload_cast<>(&Number::sincos, py::const_))
        .def("sincos", py::overload_cast<const Format&>(&Number::sincos, py::const_), py::arg("format"))
        .def("tan", py::overload_cast<>(&Number::tan, py::const_))
        .def("tan", py::overload_cast<const Format&>(&Number::tan, py::const_), py::arg("format"))
        .def("asin", py::overload_cast<>(&Number::asin, py::const_))
        .def("asin", py::overload_cast<const Format&>(&Number::asin, py::const_), py::arg("format"))
        .def("acos", py::overload_cast<>(&Number::acos, py::const_))
        .def("acos", py::overload_cast<const Format&>(&Number::acos, py::const_), py::arg("format"))
        .def("atan", py::overload_cast<>(&Number::atan, py::const_))
        .def("atan", py::overload_cast<const Format&>(&Number::atan, py::const_), py::arg("format"))
        .def("pow", py::overload_cast<long long>(&Number::pow, py::const_), py::arg("exponent"))
        .def("pow", py::overload_cast<const Number&>(&Number::pow, py::const_), py::arg("exponent"))
        .def("to_decimal_string", &Number::to_decimal_string, py::arg("digits") = std::nullopt)
        .def("to_binary_string", &Number::to_binary_string, py::arg("twos_complement") = false)
        .def("to_octal_string", &Number::to_octal_string, py::arg("twos_complement") = false)
        .def("to_hex_string", &Number::to_hex_string, py::arg("twos_complement") = false)
        .def_static("from_repr", [](const std::string& text) { return Number::from_repr(text); }, py::arg("text"))
        .def("__int__", [](const Number& self) { return to_python_int(self.to_bigint()); })
        .def("__float__", &Number::to_double)
        .def("__bool__", [](const Number& self) { return !self.is_zero(); })
        .def("__str__", [](const Number& self) { return self.to_decimal_string(); })
        .def("__repr__", &Number::to_repr)
        .def("__neg__", [](const Number& a) { return -a; })
        .def("__pos__", [](const Number& a) { return +a; })
        .def("__abs__", [](const Number& a) { return a.abs(); })
        .def("__lshift__", [](const Number& a, int count) { return a << count; })
        .def("__rshift__", [](const Number& a, int count) { return a >> count; })
        .def("__add__", [](const Number& a, const Number& b) { return a + b; })
        .def("__sub__", [](const Number& a, const Number& b) { return a - b; })
        .def("__mul__", [](const Number& a, const Number& b) { return a * b; })
        .def("__truediv__", [](const Number& a, const Number& b) { return a / b; })
        .def("__mod__", [](const Number& a, const Number& b) { return a % b; })
        .def("__pow__", [](const Number& a, const Number& b) { return a.pow(b); })
        .def("__add__", [](const Number& a, long long b) { return a + b; })
        .def("__radd__", [](const Number& a, long long b) { return b + a; })
        .def("__sub__", [](const Number& a, long long b) { return a - b; })
        .def("__rsub__", [](const Number& a, long long b) { return b - a; })
        .def("__mul__", [](const Number& a, long long b) { return a * b; })
        .def("__rmul__", [](const Number& a, long long b) { return b * a; })
        .def("__truediv__", [](const Number& a, long long b) { return a / b; })
        .def("__rtruediv__", [](const Number& a, long long b) { return b / a; })
        .def("__pow__", [](const Number& a, long long b) { return a.pow(b); })
        .def("__lt__", [](const Number& a, const Number& b) { return a < b; })
        .def("__le__", [](const Number& a, const Number& b) { return a <= b; })
        .def("__eq__", [](const Number& a, const Number& b) { return a == b; })
        .def("__ne__", [](const Number& a, const Number& b) { return a != b; })
        .def("__gt__", [](const Number& a, const Number& b) { return a > b; })
        .def("__ge__", [](const Number& a, const Number& b) { return a >= b; })
        .def("__lt__", [](const Number& a, long long b) { return a < b; })
        .def("__le__", [](const Number& a, long long b) { return a <= b; })
        .def("__eq__", [](const Number& a, long long b) { return a == b; })
        .def("__ne__", [](const Number& a, long long b) { return a != b; })
        .def("__gt__", [](const Number& a, long long b) { return a > b; })
        .def("__ge__", [](const Number& a, long long b) { return a >= b; });

    module.def("add", &fxpoint::add, py::arg("lhs"), py::arg("rhs"), py::arg("format"));
    module.def("sub", &fxpoint::sub, py::arg("lhs"), py::arg("rhs"), py::arg("format"));
    module.def("mul", &fxpoint::mul, py::arg("lhs"), py::arg("rhs"), py::arg("format"));
    module.def("div", &fxpoint::div, py::arg("lhs"), py::arg("rhs"), py::arg("format"));
    module.def("mod", &fxpoint::mod, py::arg("lhs"), py::arg("rhs"), py::arg("format"));
}

// python/bindings.cpp — Pybind11 bindings for the numtext module.

#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <numtext/numtext.hpp>

namespace py = pybind11;
namespace core = numtext::core;
namespace io = numtext::io;

static const core::alphabet& alphabet_by_name(const std::string& name) {
    if (name == "base2") {
        return core::alphabet::base2();
    }
    if (name == "base8") {
        return core::alphabet::base8();
    }
    if (name == "base10") {
        return core::alphabet::base10();
    }
    if (name == "base16") {
        return core::alphabet::base16();
    }
    if (name == "base36") {
        return core::alphabet::base36();
    }
    if (name == "base64") {
        return core::alphabet::base64();
    }
    if (name == "uri_safe") {
        return core::alphabet::uri_safe();
    }
    if (name == "simple64") {
        return core::alphabet::simple64();
    }
    if (name == "base86") {
        return core::alphabet::base86();
    }
    throw py::value_error("unknown alphabet name: " + name);
}

PYBIND11_MODULE(numtext, module) {
    module.doc() = "Pybind11 bindings for the numtext configurable-radix text codec";
    module.attr("MIN_RADIX") = core::detail::MIN_RADIX;
    module.attr("MAX_RADIX") = core::detail::MAX_RADIX;

    py::class_<core::alphabet>(module, "Alphabet")
        .def(py::init<std::string_view, bool, char, char, char>(),
             py::arg("digits"),
             py::arg("case_insensitive") = false,
             py::arg("padding") = '$',
             py::arg("positive") = '+',
             py::arg("negative") = '-')
        .def_static("standard",
                    [](const std::string& name) { return alphabet_by_name(name); },
                    py::arg("name"))
        .def_static("scrambled",
                    [](std::uint64_t seed) {
                        std::mt19937_64 generator(seed);
                        return core::alphabet::scrambled(generator);
                    },
                    py::arg("seed"))
        .def_static("deserialize", &core::alphabet::deserialize, py::arg("text"))
        .def("serialize", &core::alphabet::serialize)
        .def_property_readonly("radix", &core::alphabet::radix)
        .def_property_readonly("digits", [](const core::alphabet& self) { return std::string(self.digits()); })
        .def_property_readonly("case_insensitive", &core::alphabet::case_insensitive)
        .def("encode_int64", [](const core::alphabet& self, std::int64_t value) { return self.encode_signed(value); })
        .def("encode_int32", [](const core::alphabet& self, std::int32_t value) { return self.encode_signed(value); })
        .def("encode_unsigned64",
             [](const core::alphabet& self, std::int64_t value) { return self.encode_unsigned(value); })
        .def("encode_double_exact",
             [](const core::alphabet& self, double value) { return self.encode_signed(value); })
        .def("read_int64",
             [](const core::alphabet& self, const std::string& text) { return self.read_int64(text); })
        .def("read_int32",
             [](const core::alphabet& self, const std::string& text) { return self.read_int32(text); })
        .def("read_double_exact",
             [](const core::alphabet& self, const std::string& text) { return self.read_double_exact(text); })
        .def("read_double",
             [](const core::alphabet& self, const std::string& text) { return self.read_double(text); })
        .def("join",
             [](const core::alphabet& self, const std::string& delimiter, const std::vector<std::int64_t>& values) {
                 return io::join(self, delimiter, values);
             },
             py::arg("delimiter"),
             py::arg("values"))
        .def("split",
             [](const core::alphabet& self, const std::string& text, const std::string& delimiter) {
                 return io::split<std::int64_t>(self, text, delimiter);
             },
             py::arg("text"),
             py::arg("delimiter"))
        .def("__eq__", [](const core::alphabet& lhs, const core::alphabet& rhs) { return lhs == rhs; })
        .def("__repr__", [](const core::alphabet& self) { return "Alphabet(" + self.serialize() + ")"; });

    module.def("general", [](double value) { return io::general(value); }, py::arg("value"));
    module.def("scientific", [](double value) { return io::scientific(value); }, py::arg("value"));
    module.def("friendly", [](double value) { return io::friendly(value); }, py::arg("value"));
    module.def("decimal",
               [](double value, int length_limit, int precision) {
                   return io::decimal(value, length_limit, precision);
               },
               py::arg("value"),
               py::arg("length_limit") = io::no_limit,
               py::arg("precision") = io::no_limit);
    module.def("read_double", [](const std::string& text) { return io::read_double(text); }, py::arg("text"));

    py::register_exception<std::invalid_argument>(module, "InvalidAlphabet", PyExc_ValueError);
}

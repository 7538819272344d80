#pragma once

#include <cstdint>
#include <ostream>

#include <numtext/core/alphabet.hpp>
#include <numtext/core/bit_conversion.hpp>
#include <numtext/io/decimal.hpp>

namespace numtext::util {

inline std::ostream& dump(std::ostream& os, const numtext::core::alphabet& value) {
    return os << "alphabet(radix=" << value.radix() << ", digits=\"" << value.digits()
              << "\", case_insensitive=" << (value.case_insensitive() ? "true" : "false")
              << ", padding='" << value.padding_char() << "', signs='" << value.positive_sign()
              << value.negative_sign() << "')";
}

inline std::ostream& dump(std::ostream& os, double value) {
    return os << "double(" << numtext::io::general(value) << ", bits=0x"
              << numtext::core::alphabet::base16().encode_unsigned(
                     static_cast<std::int64_t>(numtext::core::double_bits(value)))
              << ')';
}

inline std::ostream& dump(std::ostream& os, float value) {
    return os << "float(" << numtext::io::general(value) << ", bits=0x"
              << numtext::core::alphabet::base16().encode_unsigned(
                     static_cast<std::int32_t>(numtext::core::float_bits(value)))
              << ')';
}

} // namespace numtext::util

// include/numtext/core/bit_conversion.hpp — Bit reinterpretation between floating and integer types.

#pragma once

#include <bit>
#include <cstdint>
#include <limits>

namespace numtext::core {

    static_assert(std::numeric_limits<double>::is_iec559 && sizeof(double) == 8,
                  "numtext requires IEEE-754 binary64 doubles");
    static_assert(std::numeric_limits<float>::is_iec559 && sizeof(float) == 4,
                  "numtext requires IEEE-754 binary32 floats");

    inline constexpr std::uint64_t reverse_bytes(std::uint64_t value) noexcept {
        value = ((value & 0x00FF00FF00FF00FFULL) << 8) | ((value >> 8) & 0x00FF00FF00FF00FFULL);
        value = ((value & 0x0000FFFF0000FFFFULL) << 16) | ((value >> 16) & 0x0000FFFF0000FFFFULL);
        return (value << 32) | (value >> 32);
    }

    inline constexpr std::uint32_t reverse_bytes(std::uint32_t value) noexcept {
        value = ((value & 0x00FF00FFU) << 8) | ((value >> 8) & 0x00FF00FFU);
        return (value << 16) | (value >> 16);
    }

    inline constexpr std::uint64_t double_bits(double value) noexcept {
        return std::bit_cast<std::uint64_t>(value);
    }

    inline constexpr double bits_to_double(std::uint64_t bits) noexcept {
        return std::bit_cast<double>(bits);
    }

    inline constexpr std::uint32_t float_bits(float value) noexcept {
        return std::bit_cast<std::uint32_t>(value);
    }

    inline constexpr float bits_to_float(std::uint32_t bits) noexcept {
        return std::bit_cast<float>(bits);
    }

    // Byte-reversed patterns put the sign and exponent in the low bytes, so common values
    // such as 1.0 or -2.5 have few significant digits and encode to short signed text.
    inline constexpr std::int64_t double_to_reversed_bits(double value) noexcept {
        return static_cast<std::int64_t>(reverse_bytes(double_bits(value)));
    }

    inline constexpr double reversed_bits_to_double(std::int64_t bits) noexcept {
        return bits_to_double(reverse_bytes(static_cast<std::uint64_t>(bits)));
    }

    inline constexpr std::int32_t float_to_reversed_bits(float value) noexcept {
        return static_cast<std::int32_t>(reverse_bytes(float_bits(value)));
    }

    inline constexpr float reversed_bits_to_float(std::int32_t bits) noexcept {
        return bits_to_float(reverse_bytes(static_cast<std::uint32_t>(bits)));
    }

} // namespace numtext::core

#pragma once

#include <cmath>
#include <cstdint>
#include <random>
#include <type_traits>

#include <numtext/core/alphabet.hpp>
#include <numtext/core/bit_conversion.hpp>

namespace numtext::util {

inline numtext::core::alphabet random_alphabet(std::mt19937_64& generator) {
    return numtext::core::alphabet::scrambled(generator);
}

// Uniform bit pattern of a codec integer width.
template <typename T>
inline T random_integer(std::mt19937_64& generator) {
    static_assert(numtext::core::is_codec_integer_v<T>, "random_integer expects a codec integer type");
    using unsigned_type = std::make_unsigned_t<T>;
    return static_cast<T>(static_cast<unsigned_type>(generator()));
}

// Any bit pattern, including NaN payloads, infinities and subnormals.
inline double random_double_bits(std::mt19937_64& generator) {
    return numtext::core::bits_to_double(generator());
}

inline float random_float_bits(std::mt19937_64& generator) {
    return numtext::core::bits_to_float(static_cast<std::uint32_t>(generator() >> 32));
}

// Finite values spread across the whole exponent range.
inline double random_finite_double(std::mt19937_64& generator) {
    double value = random_double_bits(generator);
    while (!std::isfinite(value)) {
        value = random_double_bits(generator);
    }
    return value;
}

inline float random_finite_float(std::mt19937_64& generator) {
    float value = random_float_bits(generator);
    while (!std::isfinite(value)) {
        value = random_float_bits(generator);
    }
    return value;
}

} // namespace numtext::util

// include/numtext/io/decimal.hpp — Shortest round-trip decimal formatting and reading.

#pragma once

#include <climits>
#include <cstddef>
#include <string>
#include <string_view>

namespace numtext::io {

    // Decimal exponents in [low, high) print positionally; anything else prints as
    // d.ddd<marker>exp.
    struct notation {
        int low;
        int high;
        char marker = 'E';
    };

    inline constexpr notation general_window{-3, 7, 'E'};
    inline constexpr notation friendly_window{-10, 10, 'E'};
    inline constexpr notation positional_window{INT_MIN, INT_MAX, 'E'};

    // "No constraint" for the length_limit and precision arguments of decimal().
    inline constexpr int no_limit = -10000;

    inline constexpr std::size_t npos = std::string_view::npos;

    std::string &append_general(std::string &out, double value, const notation &window = general_window);
    std::string &append_general(std::string &out, float value, const notation &window = general_window);

    std::string &append_scientific(std::string &out, double value, char marker = 'E');
    std::string &append_scientific(std::string &out, float value, char marker = 'E');

    // Positional notation only. precision >= 0 fixes the number of fractional digits,
    // rounding the shortest digit string half-to-even; length_limit > 0 caps the
    // characters written by this call, padding short output.
    std::string &append_decimal(std::string &out, double value, int length_limit = no_limit, int precision = no_limit);
    std::string &append_decimal(std::string &out, float value, int length_limit = no_limit, int precision = no_limit);

    inline std::string &append_friendly(std::string &out, double value) {
        return append_general(out, value, friendly_window);
    }
    inline std::string &append_friendly(std::string &out, float value) {
        return append_general(out, value, friendly_window);
    }

    template <typename Float> std::string general(Float value, const notation &window = general_window) {
        std::string out;
        return append_general(out, value, window);
    }

    template <typename Float> std::string scientific(Float value, char marker = 'E') {
        std::string out;
        return append_scientific(out, value, marker);
    }

    template <typename Float>
    std::string decimal(Float value, int length_limit = no_limit, int precision = no_limit) {
        std::string out;
        return append_decimal(out, value, length_limit, precision);
    }

    template <typename Float> std::string friendly(Float value) {
        std::string out;
        return append_general(out, value, friendly_window);
    }

    // Inverse of every mode above and of plain decimal literals. Accepts NaN, Infinity,
    // an optional sign ('+', '-' or minus), an exponent introduced by e, E or marker, an
    // optional f/F/d/D suffix and surrounding spaces. Anything else reads as 0.0.
    double read_double(std::string_view text,
                       std::size_t start = 0,
                       std::size_t end = npos,
                       char marker = 'E',
                       char minus = '-') noexcept;
    float read_float(std::string_view text,
                     std::size_t start = 0,
                     std::size_t end = npos,
                     char marker = 'E',
                     char minus = '-') noexcept;

    // Strict pre-checks for callers that must not accept the lenient readers' zero
    // fallback. is_valid_floating_point accepts [+-]digits[.digits][(e|E)[+-]digits]
    // with at least one mantissa digit and an optional f/F/d/D suffix; NaN, Infinity and
    // surrounding spaces are rejected. is_valid_number_literal also accepts integer
    // literals in hex (0x1F), octal (017) and with an l/L suffix.
    bool is_valid_floating_point(std::string_view text, std::size_t start = 0, std::size_t end = npos) noexcept;
    bool is_valid_number_literal(std::string_view text, std::size_t start = 0, std::size_t end = npos) noexcept;

} // namespace numtext::io

// src/io/decimal_render.cpp — General, scientific, friendly and positional renderings.

#include <numtext/io/decimal.hpp>

#include <array>
#include <cmath>
#include <cstdint>
#include <string>

#include <numtext/core/bit_conversion.hpp>
#include <numtext/io/detail/ryu.hpp>

namespace numtext::io {

    namespace {

        using detail::decimal_parts;

        // Writes NaN, the infinities and the signed zeros; returns false for other values.
        template <typename Float>
        bool append_special(std::string &out, Float value, std::string_view zero_suffix) {
            if (std::isnan(value)) {
                out.append("NaN");
                return true;
            }
            if (std::isinf(value)) {
                out.append(value < 0 ? "-Infinity" : "Infinity");
                return true;
            }
            if (value == 0) {
                out.append(std::signbit(value) ? "-0.0" : "0.0");
                out.append(zero_suffix);
                return true;
            }
            return false;
        }

        decimal_parts decompose(double value, int low, int high) {
            return detail::shortest_double(core::double_bits(value), low, high);
        }

        decimal_parts decompose(float value, int low, int high) {
            return detail::shortest_float(core::float_bits(value), low, high);
        }

        std::string_view digit_text(const decimal_parts &parts, std::array<char, 24> &buffer) {
            std::uint64_t cursor = parts.digits;
            for (int index = parts.length - 1; index >= 0; --index) {
                buffer[static_cast<std::size_t>(index)] = static_cast<char>('0' + cursor % 10);
                cursor /= 10;
            }
            return std::string_view(buffer.data(), static_cast<std::size_t>(parts.length));
        }

        void append_exponent(std::string &out, int exponent, char marker) {
            out.push_back(marker);
            if (exponent < 0) {
                out.push_back('-');
                exponent = -exponent;
            }
            if (exponent >= 100) {
                out.push_back(static_cast<char>('0' + exponent / 100));
                exponent %= 100;
                out.push_back(static_cast<char>('0' + exponent / 10));
            } else if (exponent >= 10) {
                out.push_back(static_cast<char>('0' + exponent / 10));
            }
            out.push_back(static_cast<char>('0' + exponent % 10));
        }

        void append_scientific_parts(std::string &out, const decimal_parts &parts, char marker) {
            std::array<char, 24> buffer{};
            const std::string_view digits = digit_text(parts, buffer);
            if (parts.negative) {
                out.push_back('-');
            }
            out.push_back(digits[0]);
            out.push_back('.');
            if (digits.size() == 1) {
                out.push_back('0');
            } else {
                out.append(digits.substr(1));
            }
            append_exponent(out, parts.exponent, marker);
        }

        void append_positional_parts(std::string &out, const decimal_parts &parts) {
            std::array<char, 24> buffer{};
            const std::string_view digits = digit_text(parts, buffer);
            const int exponent = parts.exponent;
            const int length = parts.length;
            if (parts.negative) {
                out.push_back('-');
            }
            if (exponent < 0) {
                out.append("0.");
                out.append(static_cast<std::size_t>(-exponent - 1), '0');
                out.append(digits);
            } else if (exponent + 1 >= length) {
                out.append(digits);
                out.append(static_cast<std::size_t>(exponent + 1 - length), '0');
                out.append(".0");
            } else {
                const auto split = static_cast<std::size_t>(exponent + 1);
                out.append(digits.substr(0, split));
                out.push_back('.');
                out.append(digits.substr(split));
            }
        }

        // Adds one unit in the last place of a decimal digit string.
        void increment_digits(std::string &digits) {
            for (std::size_t index = digits.size(); index-- > 0;) {
                if (digits[index] != '9') {
                    ++digits[index];
                    return;
                }
                digits[index] = '0';
            }
            digits.insert(digits.begin(), '1');
        }

        // The shortest digits rounded half-to-even to `precision` fractional places.
        void append_fixed_parts(std::string &out, const decimal_parts &parts, int precision) {
            std::array<char, 24> buffer{};
            const std::string_view digits = digit_text(parts, buffer);
            const int keep = parts.exponent + precision + 1;

            // Integer whose last `precision` digits are the fraction.
            std::string scaled;
            if (keep >= parts.length) {
                scaled.assign(digits);
                scaled.append(static_cast<std::size_t>(keep - parts.length), '0');
            } else if (keep >= 0) {
                scaled.assign(digits.substr(0, static_cast<std::size_t>(keep)));
                const std::string_view dropped = digits.substr(static_cast<std::size_t>(keep));
                bool round_up = dropped[0] > '5';
                if (dropped[0] == '5') {
                    const bool beyond_half = dropped.find_first_not_of('0', 1) != std::string_view::npos;
                    const bool odd = !scaled.empty() && ((scaled.back() - '0') & 1) != 0;
                    round_up = beyond_half || odd;
                }
                if (round_up) {
                    increment_digits(scaled);
                }
            }
            if (scaled.empty()) {
                scaled = "0";
            }
            const auto fraction = static_cast<std::size_t>(precision);
            if (scaled.size() < fraction + 1) {
                scaled.insert(0, fraction + 1 - scaled.size(), '0');
            }
            if (parts.negative) {
                out.push_back('-');
            }
            const std::size_t whole = scaled.size() - fraction;
            out.append(scaled, 0, whole);
            if (fraction > 0) {
                out.push_back('.');
                out.append(scaled, whole, fraction);
            }
        }

        void apply_length_limit(std::string &out, std::size_t origin, int length_limit, bool numeric) {
            const auto limit = static_cast<std::size_t>(length_limit);
            const std::size_t written = out.size() - origin;
            if (written > limit) {
                out.resize(origin + limit);
                return;
            }
            const std::size_t missing = limit - written;
            if (!numeric) {
                out.append(missing, ' ');
            } else if (out.find('.', origin) != std::string::npos) {
                out.append(missing, '0');
            } else {
                out.insert(origin, missing, ' ');
            }
        }

        template <typename Float>
        std::string &append_general_impl(std::string &out, Float value, const notation &window) {
            if (append_special(out, value, {})) {
                return out;
            }
            const decimal_parts parts = decompose(value, window.low, window.high);
            if (parts.scientific) {
                append_scientific_parts(out, parts, window.marker);
            } else {
                append_positional_parts(out, parts);
            }
            return out;
        }

        template <typename Float>
        std::string &append_scientific_impl(std::string &out, Float value, char marker) {
            const char zero_suffix[] = {marker, '0', '\0'};
            if (append_special(out, value, zero_suffix)) {
                return out;
            }
            // An empty window forces scientific notation for every exponent.
            append_scientific_parts(out, decompose(value, 0, 0), marker);
            return out;
        }

        template <typename Float>
        std::string &append_decimal_impl(std::string &out, Float value, int length_limit, int precision) {
            const std::size_t origin = out.size();
            const bool numeric = std::isfinite(value);
            if (value == 0 && precision >= 0) {
                const decimal_parts zero{static_cast<bool>(std::signbit(value)), 0, 1, 0, false};
                append_fixed_parts(out, zero, precision);
            } else if (!append_special(out, value, {})) {
                const decimal_parts parts =
                    decompose(value, positional_window.low, positional_window.high);
                if (precision >= 0) {
                    append_fixed_parts(out, parts, precision);
                } else {
                    append_positional_parts(out, parts);
                }
            }
            if (length_limit > 0) {
                apply_length_limit(out, origin, length_limit, numeric);
            }
            return out;
        }

    } // namespace

    std::string &append_general(std::string &out, double value, const notation &window) {
        return append_general_impl(out, value, window);
    }

    std::string &append_general(std::string &out, float value, const notation &window) {
        return append_general_impl(out, value, window);
    }

    std::string &append_scientific(std::string &out, double value, char marker) {
        return append_scientific_impl(out, value, marker);
    }

    std::string &append_scientific(std::string &out, float value, char marker) {
        return append_scientific_impl(out, value, marker);
    }

    std::string &append_decimal(std::string &out, double value, int length_limit, int precision) {
        return append_decimal_impl(out, value, length_limit, precision);
    }

    std::string &append_decimal(std::string &out, float value, int length_limit, int precision) {
        return append_decimal_impl(out, value, length_limit, precision);
    }

} // namespace numtext::io

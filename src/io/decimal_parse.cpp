// src/io/decimal_parse.cpp — Lenient reader for decimal floating-point text.

#include <numtext/io/decimal.hpp>

#include <algorithm>
#include <charconv>
#include <limits>
#include <string>
#include <system_error>

namespace numtext::io {

    namespace {

        bool is_digit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

        template <typename Float>
        Float read_decimal(std::string_view text, std::size_t start, std::size_t end, char marker, char minus) noexcept {
            if (end > text.size()) {
                end = text.size();
            }
            while (start < end && text[start] == ' ') {
                ++start;
            }
            while (end > start && text[end - 1] == ' ') {
                --end;
            }
            if (start >= end) {
                return Float{};
            }
            std::string_view body = text.substr(start, end - start);

            bool negative = false;
            const bool custom_minus = minus != '-' && !is_digit(minus) && minus != '.' &&
                                      minus != 'e' && minus != 'E' && minus != marker;
            if (body[0] == '-' || (custom_minus && body[0] == minus)) {
                negative = true;
                body.remove_prefix(1);
            } else if (body[0] == '+') {
                body.remove_prefix(1);
            }
            if (body == "NaN") {
                return std::numeric_limits<Float>::quiet_NaN();
            }
            if (body == "Infinity") {
                return negative ? -std::numeric_limits<Float>::infinity()
                                : std::numeric_limits<Float>::infinity();
            }
            if (!body.empty()) {
                const char suffix = body.back();
                if (suffix == 'f' || suffix == 'F' || suffix == 'd' || suffix == 'D') {
                    body.remove_suffix(1);
                }
            }

            // Validate digits[.digits][marker[sign]digits] and note the decimal magnitude
            // so that out-of-range results can be resolved to zero or infinity.
            std::string normalized;
            normalized.reserve(body.size());
            std::size_t index = 0;
            int mantissa_digits = 0;
            int magnitude = 0;
            bool seen_nonzero = false;
            bool in_fraction = false;
            for (; index < body.size(); ++index) {
                const char ch = body[index];
                if (is_digit(ch)) {
                    ++mantissa_digits;
                    if (ch != '0' && !seen_nonzero) {
                        seen_nonzero = true;
                        magnitude = in_fraction ? -magnitude - 1 : 0;
                    } else if (seen_nonzero && !in_fraction) {
                        ++magnitude;
                    } else if (!seen_nonzero && in_fraction) {
                        ++magnitude;
                    }
                    normalized.push_back(ch);
                } else if (ch == '.' && !in_fraction) {
                    in_fraction = true;
                    normalized.push_back(ch);
                } else {
                    break;
                }
            }
            if (mantissa_digits == 0) {
                return Float{};
            }
            if (index < body.size()) {
                const char ch = body[index];
                if (ch != 'e' && ch != 'E' && ch != marker) {
                    return Float{};
                }
                normalized.push_back('e');
                ++index;
                if (index < body.size() && (body[index] == '-' || body[index] == '+')) {
                    normalized.push_back(body[index]);
                    ++index;
                }
                if (index == body.size()) {
                    return Float{};
                }
                long long exponent = 0;
                const bool exponent_negative = normalized.back() == '-';
                for (; index < body.size(); ++index) {
                    if (!is_digit(body[index])) {
                        return Float{};
                    }
                    normalized.push_back(body[index]);
                    if (exponent < 100000) {
                        exponent = exponent * 10 + (body[index] - '0');
                    }
                }
                magnitude += static_cast<int>(exponent_negative ? -exponent : exponent);
            }

            Float value{};
            const char *first = normalized.data();
            const char *last = first + normalized.size();
            const auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::general);
            if (ec == std::errc::result_out_of_range) {
                value = seen_nonzero && magnitude > 0 ? std::numeric_limits<Float>::infinity() : Float{};
            } else if (ec != std::errc{} || ptr != last) {
                return Float{};
            }
            return negative ? -value : value;
        }

        bool is_hex_digit(char ch) noexcept {
            return is_digit(ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
        }

        std::string_view clamp_range(std::string_view text, std::size_t start, std::size_t end) noexcept {
            if (end > text.size()) {
                end = text.size();
            }
            if (start >= end) {
                return {};
            }
            return text.substr(start, end - start);
        }

        std::size_t skip_digits(std::string_view body, std::size_t index) noexcept {
            while (index < body.size() && is_digit(body[index])) {
                ++index;
            }
            return index;
        }

        // digits[.digits][(e|E)[+-]digits], at least one mantissa digit, nothing after.
        bool is_plain_decimal(std::string_view body, bool &fractional) noexcept {
            std::size_t index = skip_digits(body, 0);
            std::size_t mantissa_digits = index;
            fractional = false;
            if (index < body.size() && body[index] == '.') {
                fractional = true;
                const std::size_t fraction = index + 1;
                index = skip_digits(body, fraction);
                mantissa_digits += index - fraction;
            }
            if (mantissa_digits == 0) {
                return false;
            }
            if (index < body.size() && (body[index] == 'e' || body[index] == 'E')) {
                fractional = true;
                ++index;
                if (index < body.size() && (body[index] == '+' || body[index] == '-')) {
                    ++index;
                }
                const std::size_t exponent = index;
                index = skip_digits(body, exponent);
                if (index == exponent) {
                    return false;
                }
            }
            return index == body.size();
        }

        std::string_view strip_sign(std::string_view body) noexcept {
            if (!body.empty() && (body.front() == '+' || body.front() == '-')) {
                body.remove_prefix(1);
            }
            return body;
        }

        // Unsigned decimal with an optional f/F/d/D suffix.
        bool is_floating_body(std::string_view body) noexcept {
            if (!body.empty()) {
                const char suffix = body.back();
                if (suffix == 'f' || suffix == 'F' || suffix == 'd' || suffix == 'D') {
                    body.remove_suffix(1);
                }
            }
            bool fractional = false;
            return is_plain_decimal(body, fractional);
        }

    } // namespace

    bool is_valid_floating_point(std::string_view text, std::size_t start, std::size_t end) noexcept {
        return is_floating_body(strip_sign(clamp_range(text, start, end)));
    }

    bool is_valid_number_literal(std::string_view text, std::size_t start, std::size_t end) noexcept {
        const std::string_view body = strip_sign(clamp_range(text, start, end));
        if (body.size() > 1 && body[0] == '0' && body.find('.') == std::string_view::npos) {
            if (body[1] == 'x' || body[1] == 'X') {
                const std::string_view digits = body.substr(2);
                return !digits.empty() &&
                       std::all_of(digits.begin(), digits.end(), [](char ch) { return is_hex_digit(ch); });
            }
            if (is_digit(body[1])) {
                return std::all_of(body.begin() + 1, body.end(), [](char ch) { return ch >= '0' && ch <= '7'; });
            }
        }
        if (!body.empty() && (body.back() == 'l' || body.back() == 'L')) {
            bool fractional = false;
            return is_plain_decimal(body.substr(0, body.size() - 1), fractional) && !fractional;
        }
        return is_floating_body(body);
    }

    double read_double(std::string_view text, std::size_t start, std::size_t end, char marker, char minus) noexcept {
        return read_decimal<double>(text, start, end, marker, minus);
    }

    float read_float(std::string_view text, std::size_t start, std::size_t end, char marker, char minus) noexcept {
        return read_decimal<float>(text, start, end, marker, minus);
    }

} // namespace numtext::io

// src/core/alphabet.cpp — Alphabet validation, standard alphabets and exact floating reads.

#include <numtext/core/alphabet.hpp>

#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <numtext/io/decimal.hpp>

namespace numtext::core {

    namespace {

        bool collides(const detail::digit_table &lookup, char ch) noexcept {
            return detail::lookup_digit(lookup, ch) >= 0;
        }

        constexpr int DECIMAL_RADIX = 10;

        char shortest_marker(const alphabet &base) noexcept {
            const int value = base.digit_value('E');
            return value >= 0 && value < DECIMAL_RADIX ? base.padding_char() : 'E';
        }

        template <typename Float>
        std::string &append_shortest_text(const alphabet &base, std::string &out, Float value) {
            if (base.radix() < DECIMAL_RADIX) {
                throw std::invalid_argument("shortest decimal text needs a radix of at least 10");
            }
            const std::size_t first = out.size();
            io::append_general(out, value);
            const char marker = shortest_marker(base);
            for (std::size_t index = first; index < out.size(); ++index) {
                char &ch = out[index];
                if (ch >= '0' && ch <= '9') {
                    ch = base.digit_char(ch - '0');
                } else if (ch == '-') {
                    ch = base.negative_sign();
                } else if (ch == 'E') {
                    ch = marker;
                }
            }
            return out;
        }

        template <typename Float>
        Float read_shortest_text(const alphabet &base, std::string_view text, std::size_t start, std::size_t end) noexcept {
            if (end > text.size()) {
                end = text.size();
            }
            if (start >= end || base.radix() < DECIMAL_RADIX) {
                return Float{};
            }
            std::string_view body = text.substr(start, end - start);
            const bool negative = body.front() == base.negative_sign();
            if (negative) {
                body.remove_prefix(1);
            }
            if (body == "NaN") {
                return std::numeric_limits<Float>::quiet_NaN();
            }
            if (body == "Infinity") {
                return negative ? -std::numeric_limits<Float>::infinity() : std::numeric_limits<Float>::infinity();
            }

            const char marker = shortest_marker(base);
            std::string ascii;
            ascii.reserve(end - start);
            for (std::size_t index = start; index < end; ++index) {
                const char ch = text[index];
                const int value = base.digit_value(ch);
                if (value >= 0 && value < DECIMAL_RADIX) {
                    ascii.push_back(static_cast<char>('0' + value));
                } else if (ch == base.negative_sign()) {
                    ascii.push_back('-');
                } else if (ch == marker) {
                    ascii.push_back('E');
                } else if (ch == '.' || ch == ' ') {
                    ascii.push_back(ch);
                } else {
                    return Float{};
                }
            }
            if constexpr (std::is_same_v<Float, double>) {
                return io::read_double(ascii);
            } else {
                return io::read_float(ascii);
            }
        }

    } // namespace

    alphabet::alphabet(std::string_view digits,
                       bool case_insensitive,
                       char padding,
                       char positive,
                       char negative)
        : digits_(digits), case_insensitive_(case_insensitive), padding_(padding),
          positive_(positive), negative_(negative), lookup_(detail::empty_digit_table()) {
        const int size = static_cast<int>(digits_.size());
        if (size < detail::MIN_RADIX || size > detail::MAX_RADIX) {
            throw std::invalid_argument("alphabet radix must be within 2..90");
        }
        for (int value = 0; value < size; ++value) {
            const char ch = digits_[static_cast<std::size_t>(value)];
            if (!detail::is_printable(ch)) {
                throw std::invalid_argument("alphabet digits must be printable ASCII");
            }
            if (ch == '.') {
                throw std::invalid_argument("'.' is reserved for exact floating encodings");
            }
            if (collides(lookup_, ch) ||
                (case_insensitive_ && collides(lookup_, detail::other_case(ch)))) {
                throw std::invalid_argument(std::string("duplicate alphabet digit '") + ch + '\'');
            }
            lookup_[static_cast<unsigned char>(ch)] = static_cast<std::int8_t>(value);
            if (case_insensitive_) {
                lookup_[static_cast<unsigned char>(detail::other_case(ch))] =
                    static_cast<std::int8_t>(value);
            }
        }
        for (const char ch : {padding_, positive_, negative_}) {
            if (!detail::is_printable(ch)) {
                throw std::invalid_argument("alphabet signs and padding must be printable ASCII");
            }
            if (collides(lookup_, ch)) {
                throw std::invalid_argument(std::string("alphabet sign or padding '") + ch +
                                            "' is also a digit");
            }
        }
        if (positive_ == negative_ || padding_ == positive_ || padding_ == negative_) {
            throw std::invalid_argument("alphabet signs and padding must be distinct");
        }
        if (padding_ == '.' || positive_ == '.') {
            throw std::invalid_argument("'.' is reserved for the decimal point");
        }
        if (negative_ == '.' || negative_ == 'e' || negative_ == 'E') {
            throw std::invalid_argument("negative sign conflicts with decimal notation");
        }
        lengths_ = {detail::fixed_length(size, 8), detail::fixed_length(size, 16),
                    detail::fixed_length(size, 32), detail::fixed_length(size, 64)};
    }

    const alphabet &alphabet::base2() {
        static const alphabet value(detail::BASE2_DIGITS, true, '$', '+', '-');
        return value;
    }

    const alphabet &alphabet::base8() {
        static const alphabet value(detail::BASE8_DIGITS, true, '$', '+', '-');
        return value;
    }

    const alphabet &alphabet::base10() {
        static const alphabet value(detail::BASE10_DIGITS, true, '$', '+', '-');
        return value;
    }

    const alphabet &alphabet::base16() {
        static const alphabet value(detail::BASE16_DIGITS, true, 'p', '+', '-');
        return value;
    }

    const alphabet &alphabet::base36() {
        static const alphabet value(detail::BASE36_DIGITS, true, '$', '+', '-');
        return value;
    }

    const alphabet &alphabet::base64() {
        static const alphabet value(detail::BASE64_DIGITS, false, '=', '*', '-');
        return value;
    }

    const alphabet &alphabet::uri_safe() {
        static const alphabet value(detail::URI_SAFE_DIGITS, false, '$', '*', '!');
        return value;
    }

    const alphabet &alphabet::simple64() {
        static const alphabet value(detail::SIMPLE64_DIGITS, false, '$', '+', '-');
        return value;
    }

    const alphabet &alphabet::base86() {
        static const alphabet value(detail::BASE86_DIGITS, false, '\\', '+', '-');
        return value;
    }

    const std::array<const alphabet *, 9> &alphabet::standard_alphabets() {
        static const std::array<const alphabet *, 9> values = {
            &base2(), &base8(), &base10(), &base16(), &base36(),
            &base64(), &uri_safe(), &simple64(), &base86()};
        return values;
    }

    std::string alphabet::serialize() const {
        std::string text = digits_;
        text.push_back(case_insensitive_ ? '1' : '0');
        text.push_back(padding_);
        text.push_back(positive_);
        text.push_back(negative_);
        return text;
    }

    alphabet alphabet::deserialize(std::string_view text) {
        if (text.size() < 5) {
            throw std::invalid_argument("serialized alphabet is too short");
        }
        const std::size_t tail = text.size() - 4;
        const char flag = text[tail];
        if (flag != '0' && flag != '1') {
            throw std::invalid_argument("serialized alphabet has no case flag");
        }
        return alphabet(text.substr(0, tail), flag == '1', text[tail + 1], text[tail + 2],
                        text[tail + 3]);
    }

    double alphabet::read_double_exact(std::string_view text, std::size_t start, std::size_t end) const noexcept {
        if (end > text.size()) {
            end = text.size();
        }
        if (start >= end) {
            return 0.0;
        }
        if (text[start] == '.') {
            return bits_to_double(static_cast<std::uint64_t>(read_int64(text, start + 1, end)));
        }
        return reversed_bits_to_double(read_int64(text, start, end));
    }

    float alphabet::read_float_exact(std::string_view text, std::size_t start, std::size_t end) const noexcept {
        if (end > text.size()) {
            end = text.size();
        }
        if (start >= end) {
            return 0.0f;
        }
        if (text[start] == '.') {
            return bits_to_float(static_cast<std::uint32_t>(read_int32(text, start + 1, end)));
        }
        return reversed_bits_to_float(read_int32(text, start, end));
    }

    double alphabet::read_double(std::string_view text, std::size_t start, std::size_t end) const noexcept {
        return io::read_double(text, start, end, io::general_window.marker, negative_);
    }

    float alphabet::read_float(std::string_view text, std::size_t start, std::size_t end) const noexcept {
        return io::read_float(text, start, end, io::general_window.marker, negative_);
    }

    std::string &alphabet::append_shortest(std::string &out, double value) const {
        return append_shortest_text(*this, out, value);
    }

    std::string &alphabet::append_shortest(std::string &out, float value) const {
        return append_shortest_text(*this, out, value);
    }

    double alphabet::read_double_shortest(std::string_view text, std::size_t start, std::size_t end) const noexcept {
        return read_shortest_text<double>(*this, text, start, end);
    }

    float alphabet::read_float_shortest(std::string_view text, std::size_t start, std::size_t end) const noexcept {
        return read_shortest_text<float>(*this, text, start, end);
    }

} // namespace numtext::core

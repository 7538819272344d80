// src/io/readable.cpp — Source-literal renderings and their readers.

#include <numtext/io/readable.hpp>

#include <numtext/core/alphabet.hpp>
#include <numtext/io/decimal.hpp>

namespace numtext::io {

    namespace {

        using core::alphabet;

        constexpr int UNICODE_ESCAPE_DIGITS = 4;

        void clamp_range(std::string_view text, std::size_t &end) noexcept {
            if (end > text.size()) {
                end = text.size();
            }
        }

        std::size_t strip_suffix(std::string_view text, std::size_t start, std::size_t end, char lower, char upper) noexcept {
            if (end > start && (text[end - 1] == lower || text[end - 1] == upper)) {
                return end - 1;
            }
            return end;
        }

        char named_escape(char16_t value) noexcept {
            switch (value) {
            case u'\b':
                return 'b';
            case u'\t':
                return 't';
            case u'\n':
                return 'n';
            case u'\f':
                return 'f';
            case u'\r':
                return 'r';
            case u'\'':
                return '\'';
            case u'\\':
                return '\\';
            default:
                return '\0';
            }
        }

        char16_t unescape(char ch) noexcept {
            switch (ch) {
            case 'b':
                return u'\b';
            case 't':
                return u'\t';
            case 'n':
                return u'\n';
            case 'f':
                return u'\f';
            case 'r':
                return u'\r';
            case '\'':
                return u'\'';
            case '\\':
                return u'\\';
            default:
                return u'\0';
            }
        }

    } // namespace

    std::string &append_readable(std::string &out, std::int32_t value) {
        return alphabet::base10().append_signed(out, value);
    }

    std::string &append_readable(std::string &out, std::int64_t value) {
        alphabet::base10().append_signed(out, value);
        out.push_back('L');
        return out;
    }

    std::string &append_readable(std::string &out, double value) {
        return append_general(out, value);
    }

    std::string &append_readable(std::string &out, float value) {
        append_general(out, value);
        out.push_back('f');
        return out;
    }

    std::string &append_readable(std::string &out, char16_t value) {
        out.push_back('\'');
        if (const char escape = named_escape(value); escape != '\0') {
            out.push_back('\\');
            out.push_back(escape);
        } else if (value >= u'!' && value <= u'~') {
            out.push_back(static_cast<char>(value));
        } else {
            out.append("\\u");
            alphabet::base16().append_unsigned(out, value);
        }
        out.push_back('\'');
        return out;
    }

    std::int32_t read_readable_int32(std::string_view text, std::size_t start, std::size_t end) noexcept {
        clamp_range(text, end);
        return alphabet::base10().read_int32(text, start, end);
    }

    std::int64_t read_readable_int64(std::string_view text, std::size_t start, std::size_t end) noexcept {
        clamp_range(text, end);
        return alphabet::base10().read_int64(text, start, strip_suffix(text, start, end, 'l', 'L'));
    }

    double read_readable_double(std::string_view text, std::size_t start, std::size_t end) noexcept {
        return read_double(text, start, end);
    }

    float read_readable_float(std::string_view text, std::size_t start, std::size_t end) noexcept {
        return read_float(text, start, end);
    }

    char16_t read_readable_char16(std::string_view text, std::size_t start, std::size_t end) noexcept {
        clamp_range(text, end);
        if (start >= end || end - start < 3 || text[start] != '\'' || text[end - 1] != '\'') {
            return u'\0';
        }
        const std::string_view body = text.substr(start + 1, end - start - 2);
        if (body.size() == 1) {
            return static_cast<char16_t>(static_cast<unsigned char>(body[0]));
        }
        if (body.size() == 2 && body[0] == '\\') {
            return unescape(body[1]);
        }
        if (body.size() == 2 + UNICODE_ESCAPE_DIGITS && body[0] == '\\' && body[1] == 'u') {
            return alphabet::base16().read_char16(body, 2);
        }
        return u'\0';
    }

} // namespace numtext::io

// include/numtext/io/readable.hpp — Source-literal renderings: 12, 12L, 1.5, 1.5f, '\n'.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace numtext::io {

    std::string &append_readable(std::string &out, std::int32_t value);
    std::string &append_readable(std::string &out, std::int64_t value);
    std::string &append_readable(std::string &out, double value);
    std::string &append_readable(std::string &out, float value);
    std::string &append_readable(std::string &out, char16_t value);

    template <typename T> std::string readable(T value) {
        std::string out;
        return append_readable(out, value);
    }

    // Inverses of the literal forms above; a missing suffix is tolerated and malformed
    // text reads as zero.
    std::int32_t read_readable_int32(std::string_view text, std::size_t start, std::size_t end) noexcept;
    std::int64_t read_readable_int64(std::string_view text, std::size_t start, std::size_t end) noexcept;
    double read_readable_double(std::string_view text, std::size_t start, std::size_t end) noexcept;
    float read_readable_float(std::string_view text, std::size_t start, std::size_t end) noexcept;
    char16_t read_readable_char16(std::string_view text, std::size_t start, std::size_t end) noexcept;

    template <typename T>
    T read_readable(std::string_view text, std::size_t start = 0, std::size_t end = std::string_view::npos) noexcept {
        if constexpr (std::is_same_v<T, std::int32_t>) {
            return read_readable_int32(text, start, end);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return read_readable_int64(text, start, end);
        } else if constexpr (std::is_same_v<T, double>) {
            return read_readable_double(text, start, end);
        } else if constexpr (std::is_same_v<T, float>) {
            return read_readable_float(text, start, end);
        } else {
            static_assert(std::is_same_v<T, char16_t>, "no readable literal form for this type");
            return read_readable_char16(text, start, end);
        }
    }

} // namespace numtext::io

// include/numtext/core/detail/digit_sets.hpp — Standard digit strings and lookup helpers.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace numtext::core::detail {

    inline constexpr int MIN_RADIX = 2;
    // 94 printable characters, less '.', padding and the two signs.
    inline constexpr int MAX_RADIX = 90;

    // Printable ASCII without space; every digit, sign and padding character lives here.
    inline constexpr char FIRST_PRINTABLE = '!';
    inline constexpr char LAST_PRINTABLE = '~';

    inline constexpr std::string_view BASE2_DIGITS = "01";
    inline constexpr std::string_view BASE8_DIGITS = "01234567";
    inline constexpr std::string_view BASE10_DIGITS = "0123456789";
    inline constexpr std::string_view BASE16_DIGITS = "0123456789ABCDEF";
    inline constexpr std::string_view BASE36_DIGITS = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    inline constexpr std::string_view BASE64_DIGITS =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    inline constexpr std::string_view URI_SAFE_DIGITS =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+-";
    inline constexpr std::string_view SIMPLE64_DIGITS =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz!?";
    inline constexpr std::string_view BASE86_DIGITS =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz'/!@#$%^&*()[]{}<>:?;|_=";

    // Candidate characters for randomized alphabets; the first SCRAMBLED_RADIX after a
    // shuffle become digits and the remainder supply padding and signs.
    inline constexpr std::string_view SCRAMBLE_POOL =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789?!@#$%^&*-|=+;";
    inline constexpr int SCRAMBLED_RADIX = 72;

    inline constexpr bool is_printable(char ch) noexcept {
        return ch >= FIRST_PRINTABLE && ch <= LAST_PRINTABLE;
    }

    inline constexpr char other_case(char ch) noexcept {
        if (ch >= 'a' && ch <= 'z') {
            return static_cast<char>(ch - 'a' + 'A');
        }
        if (ch >= 'A' && ch <= 'Z') {
            return static_cast<char>(ch - 'A' + 'a');
        }
        return ch;
    }

    using digit_table = std::array<std::int8_t, 128>;

    inline constexpr digit_table empty_digit_table() noexcept {
        digit_table table{};
        table.fill(-1);
        return table;
    }

    inline constexpr int lookup_digit(const digit_table &table, char ch) noexcept {
        const auto index = static_cast<unsigned char>(ch);
        if (index >= table.size()) {
            return -1;
        }
        return table[index];
    }

    // Smallest L such that radix^L >= 2^bits: the width of a fixed-length unsigned
    // encoding of a bits-wide value.
    inline constexpr int fixed_length(int radix, int bits) noexcept {
        unsigned __int128 reach = 1;
        const unsigned __int128 needed = static_cast<unsigned __int128>(1) << bits;
        int length = 0;
        while (reach < needed) {
            reach *= static_cast<unsigned>(radix);
            ++length;
        }
        return length;
    }

} // namespace numtext::core::detail

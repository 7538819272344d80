// include/numtext/core/alphabet.hpp — Digit alphabets and the fixed/variable-width integer codec.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <numtext/core/bit_conversion.hpp>
#include <numtext/core/detail/digit_sets.hpp>

namespace numtext::core {

#if !defined(__SIZEOF_INT128__)
#error "numtext::core::alphabet requires __int128 support"
#endif

    // Integer widths the codec understands. char16_t is always read as an unsigned
    // 16-bit quantity; the others are two's-complement signed types.
    template <typename T> struct is_codec_integer : std::false_type {};

    template <> struct is_codec_integer<std::int8_t> : std::true_type {};
    template <> struct is_codec_integer<std::int16_t> : std::true_type {};
    template <> struct is_codec_integer<char16_t> : std::true_type {};
    template <> struct is_codec_integer<std::int32_t> : std::true_type {};
    template <> struct is_codec_integer<std::int64_t> : std::true_type {};

    template <typename T> inline constexpr bool is_codec_integer_v = is_codec_integer<T>::value;

    namespace detail {

        template <typename T> struct codec_width {
            static constexpr int BITS = std::numeric_limits<std::make_unsigned_t<T>>::digits;
            static constexpr int SLOT = BITS == 8 ? 0 : BITS == 16 ? 1 : BITS == 32 ? 2 : 3;
        };

        // Unbiased-enough bounded draw from a 64-bit generator: the high word of a
        // 64x64 product. Depends only on the generator's output stream.
        template <typename URBG> inline std::size_t bounded_index(URBG &generator, std::size_t bound) {
            static_assert(URBG::min() == 0 &&
                              URBG::max() == std::numeric_limits<std::uint64_t>::max(),
                          "alphabet scrambling expects a full-range 64-bit generator");
            const auto draw = static_cast<std::uint64_t>(generator());
            return static_cast<std::size_t>(
                (static_cast<unsigned __int128>(draw) * static_cast<std::uint64_t>(bound)) >> 64);
        }

        template <typename URBG> inline void shuffle_chars(std::string &chars, URBG &generator) {
            for (std::size_t index = chars.size(); index > 1; --index) {
                const std::size_t other = bounded_index(generator, index);
                std::swap(chars[index - 1], chars[other]);
            }
        }

    } // namespace detail

    class alphabet {
    public:
        static constexpr std::size_t npos = std::string_view::npos;

        alphabet(std::string_view digits,
                 bool case_insensitive = false,
                 char padding = '$',
                 char positive = '+',
                 char negative = '-');

        static const alphabet &base2();
        static const alphabet &base8();
        static const alphabet &base10();
        static const alphabet &base16();
        static const alphabet &base36();
        static const alphabet &base64();
        static const alphabet &uri_safe();
        static const alphabet &simple64();
        static const alphabet &base86();
        static const std::array<const alphabet *, 9> &standard_alphabets();

        template <typename URBG> static alphabet scrambled(URBG &generator) {
            std::string pool(detail::SCRAMBLE_POOL);
            detail::shuffle_chars(pool, generator);
            std::string spare;
            for (std::size_t index = detail::SCRAMBLED_RADIX; index < pool.size(); ++index) {
                if (pool[index] != 'e' && pool[index] != 'E') {
                    spare.push_back(pool[index]);
                }
            }
            return alphabet(std::string_view(pool).substr(0, detail::SCRAMBLED_RADIX), false,
                            spare[0], spare[1], spare[2]);
        }

        // Same digits, signs and padding in a shuffled order.
        template <typename URBG> alphabet scramble(URBG &generator) const {
            std::string shuffled = digits_;
            detail::shuffle_chars(shuffled, generator);
            return alphabet(shuffled, case_insensitive_, padding_, positive_, negative_);
        }

        std::string serialize() const;
        static alphabet deserialize(std::string_view text);

        const std::string &digits() const noexcept { return digits_; }
        int radix() const noexcept { return static_cast<int>(digits_.size()); }
        bool case_insensitive() const noexcept { return case_insensitive_; }
        char padding_char() const noexcept { return padding_; }
        char positive_sign() const noexcept { return positive_; }
        char negative_sign() const noexcept { return negative_; }

        char digit_char(int value) const noexcept { return digits_[static_cast<std::size_t>(value)]; }
        int digit_value(char ch) const noexcept { return detail::lookup_digit(lookup_, ch); }

        template <typename T> int fixed_length() const noexcept {
            static_assert(is_codec_integer_v<T>, "fixed_length expects a codec integer type");
            return lengths_[detail::codec_width<T>::SLOT];
        }

        int length_8() const noexcept { return lengths_[0]; }
        int length_16() const noexcept { return lengths_[1]; }
        int length_32() const noexcept { return lengths_[2]; }
        int length_64() const noexcept { return lengths_[3]; }

        template <typename T> std::string &append_unsigned(std::string &out, T value) const {
            static_assert(is_codec_integer_v<T>, "append_unsigned expects a codec integer type");
            using unsigned_type = std::make_unsigned_t<T>;
            const int length = fixed_length<T>();
            const auto base = static_cast<std::uint64_t>(radix());
            auto cursor = static_cast<std::uint64_t>(static_cast<unsigned_type>(value));
            const std::size_t origin = out.size();
            out.append(static_cast<std::size_t>(length), digits_[0]);
            for (int index = length - 1; index >= 0 && cursor != 0; --index) {
                out[origin + static_cast<std::size_t>(index)] = digits_[cursor % base];
                cursor /= base;
            }
            return out;
        }

        template <typename T> std::string encode_unsigned(T value) const {
            std::string out;
            return append_unsigned(out, value);
        }

        template <typename T> std::string &append_signed(std::string &out, T value) const {
            static_assert(is_codec_integer_v<T>, "append_signed expects a codec integer type");
            using unsigned_type = std::make_unsigned_t<T>;
            bool negative = false;
            auto magnitude = static_cast<unsigned_type>(value);
            if constexpr (std::is_signed_v<T>) {
                if (value < 0) {
                    negative = true;
                    magnitude = static_cast<unsigned_type>(unsigned_type{0} - magnitude);
                }
            }
            std::array<char, 72> scratch{};
            std::size_t used = 0;
            auto cursor = static_cast<std::uint64_t>(magnitude);
            const auto base = static_cast<std::uint64_t>(radix());
            do {
                scratch[used++] = digits_[cursor % base];
                cursor /= base;
            } while (cursor != 0);
            if (negative) {
                out.push_back(negative_);
            }
            while (used > 0) {
                out.push_back(scratch[--used]);
            }
            return out;
        }

        template <typename T> std::string encode_signed(T value) const {
            std::string out;
            return append_signed(out, value);
        }

        // Signed form left-padded with the padding character up to width.
        template <typename T>
        std::string &append_padded(std::string &out, T value, std::size_t width) const {
            const std::size_t origin = out.size();
            append_signed(out, value);
            const std::size_t written = out.size() - origin;
            if (written < width) {
                out.insert(origin, width - written, padding_);
            }
            return out;
        }

        template <typename T> std::string encode_padded(T value, std::size_t width) const {
            std::string out;
            return append_padded(out, value, width);
        }

        // Exact floating encodings. The signed form is the signed encoding of the
        // byte-reversed bit pattern; the unsigned form is '.' plus the fixed-width raw bits.
        std::string &append_signed(std::string &out, double value) const {
            return append_signed(out, double_to_reversed_bits(value));
        }
        std::string &append_signed(std::string &out, float value) const {
            return append_signed(out, float_to_reversed_bits(value));
        }
        std::string &append_unsigned(std::string &out, double value) const {
            out.push_back('.');
            return append_unsigned(out, static_cast<std::int64_t>(double_bits(value)));
        }
        std::string &append_unsigned(std::string &out, float value) const {
            out.push_back('.');
            return append_unsigned(out, static_cast<std::int32_t>(float_bits(value)));
        }
        std::string encode_signed(double value) const {
            std::string out;
            return append_signed(out, value);
        }
        std::string encode_signed(float value) const {
            std::string out;
            return append_signed(out, value);
        }
        std::string encode_unsigned(double value) const {
            std::string out;
            return append_unsigned(out, value);
        }
        std::string encode_unsigned(float value) const {
            std::string out;
            return append_unsigned(out, value);
        }

        // Shortest round-trip decimal in general notation, spelled with digits 0..9 of this
        // alphabet and its negative sign. The exponent marker is 'E', or the padding char
        // when 'E' is one of those ten digits. Throws std::invalid_argument below radix 10.
        std::string &append_shortest(std::string &out, double value) const;
        std::string &append_shortest(std::string &out, float value) const;
        std::string encode_shortest(double value) const {
            std::string out;
            return append_shortest(out, value);
        }
        std::string encode_shortest(float value) const {
            std::string out;
            return append_shortest(out, value);
        }

        // Reads either the signed or the unsigned form of a T from text[start, end).
        // Malformed text of any kind yields 0; this never throws.
        template <typename T>
        T read_integer(std::string_view text, std::size_t start = 0, std::size_t end = npos) const noexcept {
            static_assert(is_codec_integer_v<T>, "read_integer expects a codec integer type");
            using unsigned_type = std::make_unsigned_t<T>;
            constexpr int BITS = detail::codec_width<T>::BITS;
            if (end > text.size()) {
                end = text.size();
            }
            std::size_t index = start;
            while (index < end && text[index] == padding_) {
                ++index;
            }
            if (index >= end) {
                return T{};
            }
            bool negative = false;
            if (text[index] == negative_) {
                negative = true;
                ++index;
            } else if (text[index] == positive_) {
                ++index;
            }
            const std::size_t count = end - index;
            if (count == 0 || count > static_cast<std::size_t>(fixed_length<T>())) {
                return T{};
            }
            unsigned __int128 accumulator = 0;
            const auto base = static_cast<unsigned>(radix());
            for (; index < end; ++index) {
                const int digit = digit_value(text[index]);
                if (digit < 0) {
                    return T{};
                }
                accumulator = accumulator * base + static_cast<unsigned>(digit);
            }
            constexpr unsigned __int128 LIMIT = static_cast<unsigned __int128>(1) << BITS;
            if (accumulator >= LIMIT) {
                return T{};
            }
            auto bits = static_cast<unsigned_type>(accumulator);
            if (negative) {
                bits = static_cast<unsigned_type>(unsigned_type{0} - bits);
            }
            return static_cast<T>(bits);
        }

        std::int8_t read_int8(std::string_view text, std::size_t start = 0, std::size_t end = npos) const noexcept {
            return read_integer<std::int8_t>(text, start, end);
        }
        std::int16_t read_int16(std::string_view text, std::size_t start = 0, std::size_t end = npos) const noexcept {
            return read_integer<std::int16_t>(text, start, end);
        }
        char16_t read_char16(std::string_view text, std::size_t start = 0, std::size_t end = npos) const noexcept {
            return read_integer<char16_t>(text, start, end);
        }
        std::int32_t read_int32(std::string_view text, std::size_t start = 0, std::size_t end = npos) const noexcept {
            return read_integer<std::int32_t>(text, start, end);
        }
        std::int64_t read_int64(std::string_view text, std::size_t start = 0, std::size_t end = npos) const noexcept {
            return read_integer<std::int64_t>(text, start, end);
        }

        double read_double_exact(std::string_view text, std::size_t start = 0, std::size_t end = npos) const noexcept;
        float read_float_exact(std::string_view text, std::size_t start = 0, std::size_t end = npos) const noexcept;
        double read_double_shortest(std::string_view text, std::size_t start = 0, std::size_t end = npos) const noexcept;
        float read_float_shortest(std::string_view text, std::size_t start = 0, std::size_t end = npos) const noexcept;

        // Decimal text in any of the general/scientific/decimal/friendly forms; this
        // alphabet's negative sign is accepted in place of '-'.
        double read_double(std::string_view text, std::size_t start = 0, std::size_t end = npos) const noexcept;
        float read_float(std::string_view text, std::size_t start = 0, std::size_t end = npos) const noexcept;

        bool operator==(const alphabet &other) const noexcept {
            return digits_ == other.digits_ && case_insensitive_ == other.case_insensitive_ &&
                   padding_ == other.padding_ && positive_ == other.positive_ &&
                   negative_ == other.negative_;
        }

    private:
        std::string digits_;
        bool case_insensitive_;
        char padding_;
        char positive_;
        char negative_;
        detail::digit_table lookup_;
        std::array<int, 4> lengths_{};
    };

} // namespace numtext::core

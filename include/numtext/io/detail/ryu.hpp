// include/numtext/io/detail/ryu.hpp — Ryu digit generation shared by the decimal renderers.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace numtext::io::detail {

    using uint128 = unsigned __int128;

    // Shortest decimal expansion of a finite, non-zero value: digits * 10^(exponent - length + 1).
    struct decimal_parts {
        bool negative = false;
        std::uint64_t digits = 0;
        int length = 0;
        int exponent = 0;
        bool scientific = false;
    };

    // Bit length of 5^e for 0 <= e <= 3528.
    inline constexpr int pow5_bits(int e) noexcept {
        return static_cast<int>((static_cast<std::uint32_t>(e) * 1217359U) >> 19) + 1;
    }

    inline constexpr int decimal_length(std::uint64_t value) noexcept {
        int length = 1;
        while (value >= 10) {
            value /= 10;
            ++length;
        }
        return length;
    }

    inline constexpr int pow5_factor(std::uint64_t value) noexcept {
        int count = 0;
        while (value != 0 && value % 5 == 0) {
            value /= 5;
            ++count;
        }
        return count;
    }

    inline constexpr bool multiple_of_pow5(std::uint64_t value, int exponent) noexcept {
        return pow5_factor(value) >= exponent;
    }

    // floor(m * factor / 2^shift) for shift >= 64, exact for m < 2^64 and factor < 2^128.
    inline std::uint64_t mul_shift(std::uint64_t m, uint128 factor, int shift) noexcept {
        const uint128 low = static_cast<uint128>(m) * static_cast<std::uint64_t>(factor);
        const uint128 high = static_cast<uint128>(m) * static_cast<std::uint64_t>(factor >> 64);
        return static_cast<std::uint64_t>((high + (low >> 64)) >> (shift - 64));
    }

    // Little-endian base-2^32 integer, just large enough to build the power-of-five
    // tables exactly at startup.
    class pow5_accumulator {
    public:
        pow5_accumulator() : limbs_{1} {}

        void multiply_by_five() {
            std::uint64_t carry = 0;
            for (auto &limb : limbs_) {
                const std::uint64_t product = static_cast<std::uint64_t>(limb) * 5 + carry;
                limb = static_cast<std::uint32_t>(product);
                carry = product >> 32;
            }
            if (carry != 0) {
                limbs_.push_back(static_cast<std::uint32_t>(carry));
            }
        }

        int bit_length() const noexcept {
            const std::uint32_t top = limbs_.back();
            int bits = 0;
            for (std::uint32_t cursor = top; cursor != 0; cursor >>= 1) {
                ++bits;
            }
            return static_cast<int>(limbs_.size() - 1) * 32 + bits;
        }

        bool bit(int index) const noexcept {
            const auto word = static_cast<std::size_t>(index / 32);
            if (index < 0 || word >= limbs_.size()) {
                return false;
            }
            return ((limbs_[word] >> (index % 32)) & 1U) != 0;
        }

        // floor(value * 2^(width - bit_length())): the top `width` bits, zero-extended.
        uint128 leading_bits(int width) const {
            if (width > 127) {
                throw std::logic_error("pow5 table entry wider than 127 bits");
            }
            const int length = bit_length();
            uint128 result = 0;
            for (int index = length - 1; index >= 0 && index >= length - width; --index) {
                result = (result << 1) | static_cast<uint128>(bit(index));
            }
            if (length < width) {
                result <<= (width - length);
            }
            return result;
        }

        // floor(2^exponent / value), which must fit in 127 bits.
        uint128 reciprocal(int exponent) const {
            std::vector<std::uint32_t> remainder(limbs_.size() + 1, 0);
            uint128 quotient = 0;
            for (int index = exponent; index >= 0; --index) {
                std::uint32_t carry = index == exponent ? 1U : 0U;
                for (auto &limb : remainder) {
                    const std::uint32_t next = limb >> 31;
                    limb = (limb << 1) | carry;
                    carry = next;
                }
                const bool fits = !less_than(remainder);
                if (fits) {
                    subtract_from(remainder);
                }
                if ((quotient >> 126) != 0) {
                    throw std::logic_error("pow5 reciprocal exceeds 127 bits");
                }
                quotient = (quotient << 1) | static_cast<uint128>(fits);
            }
            return quotient;
        }

    private:
        bool less_than(const std::vector<std::uint32_t> &other) const noexcept {
            for (std::size_t index = other.size(); index-- > 0;) {
                const std::uint32_t mine = index < limbs_.size() ? limbs_[index] : 0U;
                if (other[index] != mine) {
                    return other[index] < mine;
                }
            }
            return false;
        }

        void subtract_from(std::vector<std::uint32_t> &other) const noexcept {
            std::int64_t borrow = 0;
            for (std::size_t index = 0; index < other.size(); ++index) {
                const std::int64_t mine = index < limbs_.size() ? limbs_[index] : 0;
                std::int64_t difference = static_cast<std::int64_t>(other[index]) - mine - borrow;
                borrow = difference < 0 ? 1 : 0;
                if (difference < 0) {
                    difference += static_cast<std::int64_t>(1) << 32;
                }
                other[index] = static_cast<std::uint32_t>(difference);
            }
        }

        std::vector<std::uint32_t> limbs_;
    };

    // Both tables hold 5^i scaled to `pow5_width` bits and 2^(bits(5^i) - 1 + inv_width) / 5^i + 1.
    template <std::size_t PosSize, std::size_t InvSize> struct pow5_tables {
        std::array<uint128, PosSize> pow5{};
        std::array<uint128, InvSize> pow5_inv{};
    };

    template <std::size_t PosSize, std::size_t InvSize>
    pow5_tables<PosSize, InvSize> build_pow5_tables(int pow5_width, int inv_width) {
        pow5_tables<PosSize, InvSize> tables;
        pow5_accumulator power;
        for (std::size_t index = 0; index < PosSize; ++index) {
            const int length = power.bit_length();
            if (length != pow5_bits(static_cast<int>(index))) {
                throw std::logic_error("pow5_bits disagrees with the bit length of 5^i");
            }
            tables.pow5[index] = power.leading_bits(pow5_width);
            if (index < InvSize) {
                tables.pow5_inv[index] = power.reciprocal(length - 1 + inv_width) + 1;
            }
            power.multiply_by_five();
        }
        return tables;
    }

    // Windowed shortest-digit generation. Exponents outside [low, high) keep at least
    // two significant digits, matching the scientific rendering.
    decimal_parts shortest_double(std::uint64_t bits, int low, int high);
    decimal_parts shortest_float(std::uint32_t bits, int low, int high);

} // namespace numtext::io::detail

// src/io/ryu_double.cpp — Shortest decimal digits for binary64 values.

#include <algorithm>
#include <cstdint>

#include <numtext/io/detail/ryu.hpp>

namespace numtext::io::detail {

    namespace {

        constexpr int MANTISSA_BITS = 52;
        constexpr int EXPONENT_BITS = 11;
        constexpr int EXPONENT_BIAS = (1 << (EXPONENT_BITS - 1)) - 1;
        constexpr std::uint64_t MANTISSA_MASK = (std::uint64_t{1} << MANTISSA_BITS) - 1;

        constexpr std::size_t POS_TABLE_SIZE = 326;
        constexpr std::size_t INV_TABLE_SIZE = 291;
        constexpr int POW5_BITCOUNT = 121;
        constexpr int POW5_INV_BITCOUNT = 122;

        const pow5_tables<POS_TABLE_SIZE, INV_TABLE_SIZE> &tables() {
            static const auto values =
                build_pow5_tables<POS_TABLE_SIZE, INV_TABLE_SIZE>(POW5_BITCOUNT, POW5_INV_BITCOUNT);
            return values;
        }

    } // namespace

    decimal_parts shortest_double(std::uint64_t bits, int low, int high) {
        const auto &table = tables();
        const int ieee_exponent = static_cast<int>((bits >> MANTISSA_BITS) & ((1U << EXPONENT_BITS) - 1));
        const std::uint64_t ieee_mantissa = bits & MANTISSA_MASK;

        int e2 = 0;
        std::uint64_t m2 = 0;
        if (ieee_exponent == 0) {
            e2 = 1 - EXPONENT_BIAS - MANTISSA_BITS;
            m2 = ieee_mantissa;
        } else {
            e2 = ieee_exponent - EXPONENT_BIAS - MANTISSA_BITS;
            m2 = ieee_mantissa | (std::uint64_t{1} << MANTISSA_BITS);
        }

        decimal_parts parts;
        parts.negative = (bits >> 63) != 0;

        const bool even = (m2 & 1) == 0;
        const std::uint64_t mv = 4 * m2;
        const std::uint64_t mp = 4 * m2 + 2;
        const int mm_shift = (m2 != (std::uint64_t{1} << MANTISSA_BITS) || ieee_exponent == 1) ? 1 : 0;
        const std::uint64_t mm = 4 * m2 - 1 - static_cast<std::uint64_t>(mm_shift);
        e2 -= 2;

        std::uint64_t dv = 0;
        std::uint64_t dp = 0;
        std::uint64_t dm = 0;
        int e10 = 0;
        bool dm_trailing_zeros = false;
        bool dv_trailing_zeros = false;
        if (e2 >= 0) {
            const int q = std::max(0, static_cast<int>((static_cast<std::uint32_t>(e2) * 78913U) >> 18) - 1);
            const int k = POW5_INV_BITCOUNT + pow5_bits(q) - 1;
            const int i = -e2 + q + k;
            const uint128 factor = table.pow5_inv[static_cast<std::size_t>(q)];
            dv = mul_shift(mv, factor, i);
            dp = mul_shift(mp, factor, i);
            dm = mul_shift(mm, factor, i);
            e10 = q;
            if (q <= 21) {
                if (mv % 5 == 0) {
                    dv_trailing_zeros = multiple_of_pow5(mv, q);
                } else if (even) {
                    dm_trailing_zeros = multiple_of_pow5(mm, q);
                } else if (multiple_of_pow5(mp, q)) {
                    --dp;
                }
            }
        } else {
            const int q = std::max(0, static_cast<int>((static_cast<std::uint32_t>(-e2) * 732923U) >> 20) - 1);
            const int i = -e2 - q;
            const int k = pow5_bits(i) - POW5_BITCOUNT;
            const int j = q - k;
            const uint128 factor = table.pow5[static_cast<std::size_t>(i)];
            dv = mul_shift(mv, factor, j);
            dp = mul_shift(mp, factor, j);
            dm = mul_shift(mm, factor, j);
            e10 = q + e2;
            if (q <= 1) {
                dv_trailing_zeros = true;
                if (even) {
                    dm_trailing_zeros = mm_shift == 1;
                } else {
                    --dp;
                }
            } else if (q < 63) {
                // The full product has at least q trailing zeros iff mv has q trailing zero bits.
                dv_trailing_zeros = (mv & ((std::uint64_t{1} << q) - 1)) == 0;
            }
        }

        const int vp_length = decimal_length(dp);
        const int exponent = e10 + vp_length - 1;
        const bool scientific = !(exponent >= low && exponent < high);

        int removed = 0;
        int last_removed_digit = 0;
        std::uint64_t output = 0;
        if (dm_trailing_zeros || dv_trailing_zeros) {
            while (dp / 10 > dm / 10) {
                if (dp < 100 && scientific) {
                    break;
                }
                dm_trailing_zeros &= dm % 10 == 0;
                dv_trailing_zeros &= last_removed_digit == 0;
                last_removed_digit = static_cast<int>(dv % 10);
                dp /= 10;
                dv /= 10;
                dm /= 10;
                ++removed;
            }
            if (dm_trailing_zeros) {
                while (dm % 10 == 0) {
                    if (dp < 100 && scientific) {
                        break;
                    }
                    dv_trailing_zeros &= last_removed_digit == 0;
                    last_removed_digit = static_cast<int>(dv % 10);
                    dp /= 10;
                    dv /= 10;
                    dm /= 10;
                    ++removed;
                }
            }
            if (dv_trailing_zeros && last_removed_digit == 5 && (dv & 1) == 0) {
                // Exactly halfway: round to even.
                last_removed_digit = 4;
            }
            output = dv + (((dv == dm && !dm_trailing_zeros) || last_removed_digit >= 5) ? 1 : 0);
        } else {
            while (dp / 10 > dm / 10) {
                if (dp < 100 && scientific) {
                    break;
                }
                last_removed_digit = static_cast<int>(dv % 10);
                dp /= 10;
                dv /= 10;
                dm /= 10;
                ++removed;
            }
            output = dv + ((dv == dm || last_removed_digit >= 5) ? 1 : 0);
        }

        int length = vp_length - removed;
        int rounded_exponent = exponent;
        if (decimal_length(output) > length) {
            // Rounding the forced second digit up carried into a new leading digit.
            output /= 10;
            ++rounded_exponent;
        }
        parts.digits = output;
        parts.length = length;
        parts.exponent = rounded_exponent;
        parts.scientific = scientific;
        return parts;
    }

} // namespace numtext::io::detail

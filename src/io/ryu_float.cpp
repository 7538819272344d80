// src/io/ryu_float.cpp — Shortest decimal digits for binary32 values.

#include <cstdint>

#include <numtext/io/detail/ryu.hpp>

namespace numtext::io::detail {

    namespace {

        constexpr int MANTISSA_BITS = 23;
        constexpr int EXPONENT_BITS = 8;
        constexpr int EXPONENT_BIAS = (1 << (EXPONENT_BITS - 1)) - 1;
        constexpr std::uint32_t MANTISSA_MASK = (1U << MANTISSA_BITS) - 1;

        // floor(10^7 * log10(2)) and floor(10^7 * log10(5)).
        constexpr std::int64_t LOG10_2_NUMERATOR = 3010299;
        constexpr std::int64_t LOG10_5_NUMERATOR = 6989700;
        constexpr std::int64_t LOG10_DENOMINATOR = 10000000;

        constexpr std::size_t POS_TABLE_SIZE = 48;
        constexpr std::size_t INV_TABLE_SIZE = 31;
        constexpr int POW5_BITCOUNT = 61;
        constexpr int POW5_INV_BITCOUNT = 59;

        const pow5_tables<POS_TABLE_SIZE, INV_TABLE_SIZE> &tables() {
            static const auto values =
                build_pow5_tables<POS_TABLE_SIZE, INV_TABLE_SIZE>(POW5_BITCOUNT, POW5_INV_BITCOUNT);
            return values;
        }

        // Products stay below 2^90, so a single 128-bit multiply is exact.
        std::uint32_t mul_pow5_div_pow2(std::uint32_t m, int i, int j) {
            return static_cast<std::uint32_t>((static_cast<uint128>(m) * tables().pow5[static_cast<std::size_t>(i)]) >> j);
        }

        std::uint32_t mul_pow5_inv_div_pow2(std::uint32_t m, int q, int j) {
            return static_cast<std::uint32_t>((static_cast<uint128>(m) * tables().pow5_inv[static_cast<std::size_t>(q)]) >> j);
        }

    } // namespace

    decimal_parts shortest_float(std::uint32_t bits, int low, int high) {
        const int ieee_exponent = static_cast<int>((bits >> MANTISSA_BITS) & ((1U << EXPONENT_BITS) - 1));
        const std::uint32_t ieee_mantissa = bits & MANTISSA_MASK;

        int e2 = 0;
        std::uint32_t m2 = 0;
        if (ieee_exponent == 0) {
            e2 = 1 - EXPONENT_BIAS - MANTISSA_BITS;
            m2 = ieee_mantissa;
        } else {
            e2 = ieee_exponent - EXPONENT_BIAS - MANTISSA_BITS;
            m2 = ieee_mantissa | (1U << MANTISSA_BITS);
        }

        decimal_parts parts;
        parts.negative = (bits >> 31) != 0;

        const bool even = (m2 & 1) == 0;
        const std::uint32_t mv = m2 << 2;
        const std::uint32_t mp = (m2 << 2) + 2;
        const std::uint32_t mm = (m2 << 2) - ((m2 != (1U << MANTISSA_BITS) || ieee_exponent == 1) ? 2U : 1U);
        e2 -= 2;

        std::uint32_t dp = 0;
        std::uint32_t dv = 0;
        std::uint32_t dm = 0;
        int e10 = 0;
        bool dp_trailing_zeros = false;
        bool dv_trailing_zeros = false;
        bool dm_trailing_zeros = false;
        int last_removed_digit = 0;
        if (e2 >= 0) {
            const int q = static_cast<int>(e2 * LOG10_2_NUMERATOR / LOG10_DENOMINATOR);
            const int k = POW5_INV_BITCOUNT + pow5_bits(q) - 1;
            const int i = -e2 + q + k;
            dv = mul_pow5_inv_div_pow2(mv, q, i);
            dp = mul_pow5_inv_div_pow2(mp, q, i);
            dm = mul_pow5_inv_div_pow2(mm, q, i);
            if (q != 0 && (dp - 1) / 10 <= dm / 10) {
                // The digit just below the shortest interval decides the rounding.
                const int l = POW5_INV_BITCOUNT + pow5_bits(q - 1) - 1;
                last_removed_digit = static_cast<int>(mul_pow5_inv_div_pow2(mv, q - 1, -e2 + q - 1 + l) % 10);
            }
            e10 = q;
            dp_trailing_zeros = pow5_factor(mp) >= q;
            dv_trailing_zeros = pow5_factor(mv) >= q;
            dm_trailing_zeros = pow5_factor(mm) >= q;
        } else {
            const int q = static_cast<int>(-e2 * LOG10_5_NUMERATOR / LOG10_DENOMINATOR);
            const int i = -e2 - q;
            const int k = pow5_bits(i) - POW5_BITCOUNT;
            int j = q - k;
            dv = mul_pow5_div_pow2(mv, i, j);
            dp = mul_pow5_div_pow2(mp, i, j);
            dm = mul_pow5_div_pow2(mm, i, j);
            if (q != 0 && (dp - 1) / 10 <= dm / 10) {
                j = q - 1 - (pow5_bits(i + 1) - POW5_BITCOUNT);
                last_removed_digit = static_cast<int>(mul_pow5_div_pow2(mv, i + 1, j) % 10);
            }
            e10 = q + e2;
            dp_trailing_zeros = 1 >= q;
            dv_trailing_zeros = q <= 1 || (q < 31 && (mv & ((1U << (q - 1)) - 1)) == 0);
            dm_trailing_zeros = static_cast<int>(~mm & 1U) >= q;
        }

        const int dp_length = decimal_length(dp);
        const int exponent = e10 + dp_length - 1;
        const bool scientific = !(exponent >= low && exponent < high);

        int removed = 0;
        if (dp_trailing_zeros && !even) {
            --dp;
        }
        while (dp / 10 > dm / 10) {
            if (dp < 100 && scientific) {
                break;
            }
            dm_trailing_zeros &= dm % 10 == 0;
            dv_trailing_zeros &= last_removed_digit == 0;
            dp /= 10;
            last_removed_digit = static_cast<int>(dv % 10);
            dv /= 10;
            dm /= 10;
            ++removed;
        }
        if (dm_trailing_zeros && even) {
            while (dm % 10 == 0) {
                if (dp < 100 && scientific) {
                    break;
                }
                dv_trailing_zeros &= last_removed_digit == 0;
                dp /= 10;
                last_removed_digit = static_cast<int>(dv % 10);
                dv /= 10;
                dm /= 10;
                ++removed;
            }
        }
        if (dv_trailing_zeros && last_removed_digit == 5 && (dv & 1) == 0) {
            // Exactly halfway: round to even.
            last_removed_digit = 4;
        }
        std::uint32_t output =
            dv + (((dv == dm && !(dm_trailing_zeros && even)) || last_removed_digit >= 5) ? 1U : 0U);

        int length = dp_length - removed;
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

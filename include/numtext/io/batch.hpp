// include/numtext/io/batch.hpp — Delimited join/split of 1-D and 2-D arrays.

#pragma once

#include <algorithm>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <numtext/core/alphabet.hpp>
#include <numtext/io/decimal.hpp>
#include <numtext/io/readable.hpp>

namespace numtext::io {

    namespace detail {

        // Element policies: how one value is written to and read from a field.
        struct plain_codec {
            template <typename T>
            static void append(std::string &out, const core::alphabet &base, T value) {
                if constexpr (std::is_floating_point_v<T>) {
                    append_general(out, value);
                } else {
                    base.append_signed(out, value);
                }
            }

            template <typename T>
            static T read(const core::alphabet &base, std::string_view text, std::size_t start, std::size_t end) noexcept {
                if constexpr (std::is_same_v<T, double>) {
                    return base.read_double(text, start, end);
                } else if constexpr (std::is_same_v<T, float>) {
                    return base.read_float(text, start, end);
                } else {
                    return base.template read_integer<T>(text, start, end);
                }
            }
        };

        struct exact_codec {
            template <typename T>
            static void append(std::string &out, const core::alphabet &base, T value) {
                static_assert(std::is_floating_point_v<T>, "exact joins are for float and double");
                base.append_signed(out, value);
            }

            template <typename T>
            static T read(const core::alphabet &base, std::string_view text, std::size_t start, std::size_t end) noexcept {
                if constexpr (std::is_same_v<T, double>) {
                    return base.read_double_exact(text, start, end);
                } else {
                    static_assert(std::is_same_v<T, float>, "exact splits are for float and double");
                    return base.read_float_exact(text, start, end);
                }
            }
        };

        struct readable_codec {
            template <typename T>
            static void append(std::string &out, const core::alphabet &, T value) {
                append_readable(out, value);
            }

            template <typename T>
            static T read(const core::alphabet &, std::string_view text, std::size_t start, std::size_t end) noexcept {
                return read_readable<T>(text, start, end);
            }
        };

        struct decimal_codec {
            int length_limit;

            template <typename T> void append(std::string &out, const core::alphabet &, T value) const {
                append_decimal(out, value, length_limit);
            }
        };

        inline std::size_t clamp_end(std::string_view text, std::size_t end) noexcept {
            return std::min(end, text.size());
        }

        // Position of delimiter in text[from, end), or npos.
        inline std::size_t find_in_range(std::string_view text,
                                         std::string_view delimiter,
                                         std::size_t from,
                                         std::size_t end) noexcept {
            return text.substr(0, end).find(delimiter, from);
        }

        template <typename Codec, typename T>
        std::string &append_joined_as(const Codec &codec,
                                      std::string &out,
                                      const core::alphabet &base,
                                      std::string_view delimiter,
                                      std::span<const T> elements,
                                      std::size_t start,
                                      std::size_t count) {
            if (start >= elements.size()) {
                return out;
            }
            const std::size_t stop = start + std::min(count, elements.size() - start);
            for (std::size_t index = start; index < stop; ++index) {
                if (index != start) {
                    out.append(delimiter);
                }
                codec.append(out, base, elements[index]);
            }
            return out;
        }

        template <typename Codec, typename T>
        std::vector<T> split_as(const core::alphabet &base,
                                std::string_view text,
                                std::string_view delimiter,
                                std::size_t start,
                                std::size_t end) {
            end = clamp_end(text, end);
            std::vector<T> values;
            if (delimiter.empty() || start >= end) {
                return values;
            }
            std::size_t field = start;
            for (;;) {
                const std::size_t found = find_in_range(text, delimiter, field, end);
                if (found == std::string_view::npos) {
                    values.push_back(Codec::template read<T>(base, text, field, end));
                    return values;
                }
                values.push_back(Codec::template read<T>(base, text, field, found));
                field = found + delimiter.size();
            }
        }

        inline void check_2d_delimiters(std::string_view group, std::string_view delimiter) {
            if (group.empty() || delimiter.empty()) {
                throw std::invalid_argument("2-D delimiters must not be empty");
            }
            if (group == delimiter) {
                throw std::invalid_argument("2-D group and element delimiters must differ");
            }
        }

        template <typename Codec, typename T>
        std::string &append_joined_2d_as(const Codec &codec,
                                         std::string &out,
                                         const core::alphabet &base,
                                         std::string_view group,
                                         std::string_view delimiter,
                                         const std::vector<std::vector<T>> &rows) {
            check_2d_delimiters(group, delimiter);
            for (std::size_t row = 0; row < rows.size(); ++row) {
                if (row != 0) {
                    out.append(delimiter);
                }
                out.append(group);
                append_joined_as(codec, out, base, delimiter, std::span<const T>(rows[row]), 0,
                                 rows[row].size());
                out.append(group);
            }
            return out;
        }

        template <typename Codec, typename T>
        std::vector<std::vector<T>> split_2d_as(const core::alphabet &base,
                                                std::string_view text,
                                                std::string_view group,
                                                std::string_view delimiter,
                                                std::size_t start,
                                                std::size_t end) {
            check_2d_delimiters(group, delimiter);
            end = clamp_end(text, end);
            std::vector<std::vector<T>> rows;
            std::size_t cursor = start;
            while (cursor < end) {
                const std::size_t open = find_in_range(text, group, cursor, end);
                if (open == std::string_view::npos) {
                    break;
                }
                const std::size_t body = open + group.size();
                const std::size_t close = find_in_range(text, group, body, end);
                if (close == std::string_view::npos) {
                    break;
                }
                rows.push_back(split_as<Codec, T>(base, text, delimiter, body, close));
                cursor = close + group.size();
            }
            return rows;
        }

    } // namespace detail

    // Number of complete delimiter occurrences inside text[start, end).
    inline std::size_t count(std::string_view text,
                             std::string_view delimiter,
                             std::size_t start = 0,
                             std::size_t end = npos) noexcept {
        end = detail::clamp_end(text, end);
        if (delimiter.empty() || start >= end) {
            return 0;
        }
        std::size_t occurrences = 0;
        std::size_t cursor = start;
        for (;;) {
            const std::size_t found = detail::find_in_range(text, delimiter, cursor, end);
            if (found == std::string_view::npos) {
                return occurrences;
            }
            ++occurrences;
            cursor = found + delimiter.size();
        }
    }

    // Fields split() would produce for the same range.
    inline std::size_t count_fields(std::string_view text,
                                    std::string_view delimiter,
                                    std::size_t start = 0,
                                    std::size_t end = npos) noexcept {
        end = detail::clamp_end(text, end);
        if (delimiter.empty() || start >= end) {
            return 0;
        }
        return io::count(text, delimiter, start, end) + 1;
    }

    // Integers use the signed form; floating values use general notation.
    template <typename T>
    std::string &append_joined(std::string &out,
                               const core::alphabet &base,
                               std::string_view delimiter,
                               std::span<const T> elements,
                               std::size_t start = 0,
                               std::size_t count = npos) {
        return detail::append_joined_as(detail::plain_codec{}, out, base, delimiter, elements, start, count);
    }

    template <typename T>
    std::string join(const core::alphabet &base, std::string_view delimiter, const std::vector<T> &elements) {
        std::string out;
        return append_joined(out, base, delimiter, std::span<const T>(elements));
    }

    template <typename T>
    std::vector<T> split(const core::alphabet &base,
                         std::string_view text,
                         std::string_view delimiter,
                         std::size_t start = 0,
                         std::size_t end = npos) {
        return detail::split_as<detail::plain_codec, T>(base, text, delimiter, start, end);
    }

    template <typename T>
    std::string &append_joined_exact(std::string &out,
                                     const core::alphabet &base,
                                     std::string_view delimiter,
                                     std::span<const T> elements,
                                     std::size_t start = 0,
                                     std::size_t count = npos) {
        return detail::append_joined_as(detail::exact_codec{}, out, base, delimiter, elements, start, count);
    }

    template <typename T>
    std::string join_exact(const core::alphabet &base, std::string_view delimiter, const std::vector<T> &elements) {
        std::string out;
        return append_joined_exact(out, base, delimiter, std::span<const T>(elements));
    }

    template <typename T>
    std::vector<T> split_exact(const core::alphabet &base,
                               std::string_view text,
                               std::string_view delimiter,
                               std::size_t start = 0,
                               std::size_t end = npos) {
        return detail::split_as<detail::exact_codec, T>(base, text, delimiter, start, end);
    }

    // Positional text with every element capped or padded to length_limit; read back with split().
    template <typename T>
    std::string &append_joined_decimal(std::string &out,
                                       std::string_view delimiter,
                                       int length_limit,
                                       std::span<const T> elements,
                                       std::size_t start = 0,
                                       std::size_t count = npos) {
        return detail::append_joined_as(detail::decimal_codec{length_limit}, out, core::alphabet::base10(),
                                        delimiter, elements, start, count);
    }

    template <typename T>
    std::string join_decimal(std::string_view delimiter, int length_limit, const std::vector<T> &elements) {
        std::string out;
        return append_joined_decimal(out, delimiter, length_limit, std::span<const T>(elements));
    }

    template <typename T>
    std::string &append_joined_readable(std::string &out,
                                        std::string_view delimiter,
                                        std::span<const T> elements,
                                        std::size_t start = 0,
                                        std::size_t count = npos) {
        return detail::append_joined_as(detail::readable_codec{}, out, core::alphabet::base10(), delimiter,
                                        elements, start, count);
    }

    template <typename T>
    std::string join_readable(std::string_view delimiter, const std::vector<T> &elements) {
        std::string out;
        return append_joined_readable(out, delimiter, std::span<const T>(elements));
    }

    template <typename T>
    std::vector<T> split_readable(std::string_view text,
                                  std::string_view delimiter,
                                  std::size_t start = 0,
                                  std::size_t end = npos) {
        return detail::split_as<detail::readable_codec, T>(core::alphabet::base10(), text, delimiter, start, end);
    }

    // <group>row0<group><delimiter><group>row1<group>...; rows may differ in length.
    template <typename T>
    std::string &append_joined_2d(std::string &out,
                                  const core::alphabet &base,
                                  std::string_view group,
                                  std::string_view delimiter,
                                  const std::vector<std::vector<T>> &rows) {
        return detail::append_joined_2d_as(detail::plain_codec{}, out, base, group, delimiter, rows);
    }

    template <typename T>
    std::string join_2d(const core::alphabet &base,
                        std::string_view group,
                        std::string_view delimiter,
                        const std::vector<std::vector<T>> &rows) {
        std::string out;
        return append_joined_2d(out, base, group, delimiter, rows);
    }

    template <typename T>
    std::vector<std::vector<T>> split_2d(const core::alphabet &base,
                                         std::string_view text,
                                         std::string_view group,
                                         std::string_view delimiter,
                                         std::size_t start = 0,
                                         std::size_t end = npos) {
        return detail::split_2d_as<detail::plain_codec, T>(base, text, group, delimiter, start, end);
    }

    template <typename T>
    std::string join_2d_exact(const core::alphabet &base,
                              std::string_view group,
                              std::string_view delimiter,
                              const std::vector<std::vector<T>> &rows) {
        std::string out;
        return detail::append_joined_2d_as(detail::exact_codec{}, out, base, group, delimiter, rows);
    }

    template <typename T>
    std::vector<std::vector<T>> split_2d_exact(const core::alphabet &base,
                                               std::string_view text,
                                               std::string_view group,
                                               std::string_view delimiter,
                                               std::size_t start = 0,
                                               std::size_t end = npos) {
        return detail::split_2d_as<detail::exact_codec, T>(base, text, group, delimiter, start, end);
    }

} // namespace numtext::io

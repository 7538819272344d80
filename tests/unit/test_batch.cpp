// tests/unit/test_batch.cpp — Tests for delimited joins and splits of 1-D and 2-D arrays.

#include <cstdint>
#include <iostream>
#include <limits>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <numtext/numtext.hpp>

namespace {

    using numtext::core::alphabet;

    template <typename T> std::vector<T> sample_values(std::mt19937_64 &generator) {
        std::vector<T> values = {T{0}, T{1}, std::numeric_limits<T>::max(), std::numeric_limits<T>::min()};
        for (int index = 0; index < 50; ++index) {
            values.push_back(numtext::util::random_integer<T>(generator));
        }
        return values;
    }

    template <typename T> bool round_trips(const alphabet &base, std::mt19937_64 &generator) {
        const std::vector<T> values = sample_values<T>(generator);
        const std::string text = numtext::io::join(base, " ", values);
        return numtext::io::split<T>(base, text, " ") == values &&
               numtext::io::count_fields(text, " ") == values.size();
    }

    template <typename T> T random_element(std::mt19937_64 &generator) {
        if constexpr (std::is_same_v<T, double>) {
            return numtext::util::random_finite_double(generator);
        } else if constexpr (std::is_same_v<T, float>) {
            return numtext::util::random_finite_float(generator);
        } else {
            return numtext::util::random_integer<T>(generator);
        }
    }

    // Irregular rows, including empty ones, through join_2d and back.
    template <typename T> bool grid_round_trips(const alphabet &base, std::mt19937_64 &generator) {
        std::vector<std::vector<T>> rows(6);
        for (std::size_t row = 0; row < rows.size(); ++row) {
            const std::size_t width = (row * 3) % 5;
            for (std::size_t column = 0; column < width; ++column) {
                rows[row].push_back(random_element<T>(generator));
            }
        }
        rows.back().push_back(T{0});
        const std::string text = numtext::io::join_2d(base, "\n", " ", rows);
        return numtext::io::split_2d<T>(base, text, "\n", " ") == rows;
    }

} // namespace

int main() {
    bool all_good = true;
    const auto expect = [&](bool condition, const char *message) {
        if (!condition) {
            all_good = false;
            std::cerr << "batch test failure: " << message << '\n';
        }
    };

    namespace io = numtext::io;
    const alphabet &dec = alphabet::base10();

    const std::vector<std::int32_t> edge = {1, -1, 2147483647, std::numeric_limits<std::int32_t>::min()};
    expect(io::join(dec, " ", edge) == "1 -1 2147483647 -2147483648", "decimal join");
    expect(io::join(alphabet::base16(), ",", edge) == "1,-1,7FFFFFFF,-80000000", "hex join");
    expect(io::split<std::int32_t>(dec, "1 -1 2147483647 -2147483648", " ") == edge, "decimal split");

    std::mt19937_64 generator(8080);
    std::vector<alphabet> bases;
    for (const alphabet *base : alphabet::standard_alphabets()) {
        bases.push_back(*base);
    }
    bases.push_back(numtext::util::random_alphabet(generator));
    bases.push_back(numtext::util::random_alphabet(generator));
    for (const alphabet &base : bases) {
        expect(io::split<std::int32_t>(base, io::join(base, " ", edge), " ") == edge, "edge values round trip");
        expect(round_trips<std::int8_t>(base, generator), "int8 arrays round trip");
        expect(round_trips<std::int16_t>(base, generator), "int16 arrays round trip");
        expect(round_trips<char16_t>(base, generator), "char16_t arrays round trip");
        expect(round_trips<std::int32_t>(base, generator), "int32 arrays round trip");
        expect(round_trips<std::int64_t>(base, generator), "int64 arrays round trip");
        expect(grid_round_trips<std::int8_t>(base, generator), "int8 grids round trip");
        expect(grid_round_trips<std::int16_t>(base, generator), "int16 grids round trip");
        expect(grid_round_trips<char16_t>(base, generator), "char16_t grids round trip");
        expect(grid_round_trips<std::int32_t>(base, generator), "int32 grids round trip");
        expect(grid_round_trips<std::int64_t>(base, generator), "int64 grids round trip");
        expect(grid_round_trips<double>(base, generator), "double grids round trip");
        expect(grid_round_trips<float>(base, generator), "float grids round trip");
    }

    expect(io::count("a,b,,c", ",") == 3, "count reports delimiter occurrences");
    expect(io::count_fields("a,b,,c", ",") == 4, "count_fields reports fields");
    expect(io::count("1::2::3", "::") == 2, "multi-character delimiters");
    expect(io::count("1::2::3", "::", 2, 5) == 0, "count honours the range");
    expect(io::count("1,2", "") == 0 && io::count_fields("", ",") == 0, "degenerate counts");
    expect(io::count_fields("5", ",") == 1, "one field without delimiters");

    const std::vector<std::int32_t> sequence = {1, 2, 3, 4, 5, 6};
    std::string partial;
    io::append_joined(partial, dec, " ", std::span<const std::int32_t>(sequence), 2, 4);
    expect(partial == "3 4 5 6", "sub-range join");
    expect(io::count(partial, " ") == 3, "sub-range join has count - 1 delimiters");
    std::string clamped = "[";
    io::append_joined(clamped, dec, " ", std::span<const std::int32_t>(sequence), 4, 100);
    clamped.push_back(']');
    expect(clamped == "[5 6]", "count is clamped to the array");
    std::string untouched = "keep";
    io::append_joined(untouched, dec, " ", std::span<const std::int32_t>(sequence), 10);
    expect(untouched == "keep", "start past the array appends nothing");

    expect(io::split<std::int32_t>(dec, " 5 6", " ", 1) == std::vector<std::int32_t>{5, 6}, "split from an offset");
    expect(io::split<std::int32_t>(dec, "5 6 7", " ", 0, 3) == std::vector<std::int32_t>{5, 6},
           "split up to an end position");
    expect(io::split<std::int32_t>(dec, "5", " ") == std::vector<std::int32_t>{5}, "single field");
    expect(io::split<std::int32_t>(dec, "", " ").empty(), "empty text gives no fields");
    expect(io::split<std::int32_t>(dec, "1 2", "").empty(), "empty delimiter gives no fields");
    expect(io::split<std::int32_t>(dec, "1 x 3", " ") == std::vector<std::int32_t>{1, 0, 3},
           "malformed fields read as zero");
    expect(io::split<std::int32_t>(dec, "1 2 ", " ") == std::vector<std::int32_t>{1, 2, 0},
           "a trailing delimiter yields an empty field");

    const std::vector<std::vector<std::int32_t>> rows = {{1, 2, 3}, {}, {-4}, {5, 6}};
    const std::string grid = io::join_2d(dec, "\"", " ", rows);
    expect(grid == "\"1 2 3\" \"\" \"-4\" \"5 6\"", "2-D join wraps each row in the group delimiter");
    expect(io::split_2d<std::int32_t>(dec, grid, "\"", " ") == rows, "2-D split restores irregular rows");
    std::string framed = "rows=";
    io::append_joined_2d(framed, alphabet::base16(), "|", ",", rows);
    expect(framed == "rows=|1,2,3|,||,|-4|,|5,6|", "2-D append keeps existing content");
    expect(io::split_2d<std::int32_t>(alphabet::base16(), framed, "|", ",", 5) == rows, "2-D split from an offset");
    expect(io::join_2d(dec, "\"", " ", std::vector<std::vector<std::int32_t>>{}).empty(), "no rows, no text");

    const auto rejects = [](auto &&call) {
        try {
            call();
        } catch (const std::invalid_argument &) {
            return true;
        }
        return false;
    };
    expect(rejects([&] { io::join_2d(dec, " ", " ", rows); }), "equal 2-D delimiters are rejected");
    expect(rejects([&] { io::join_2d(dec, "", " ", rows); }), "empty group delimiter is rejected");
    expect(rejects([&] { io::split_2d<std::int32_t>(dec, grid, "\"", "\""); }), "2-D split checks delimiters");

    const std::vector<double> measurements = {1.5, -2.25, 3.0};
    const std::string columns = io::join_decimal(" ", 6, measurements);
    expect(columns == "1.5000 -2.250 3.0000", "decimal join pads every column");
    expect(io::split<double>(dec, columns, " ") == measurements, "decimal columns read back");
    expect(io::join(dec, ",", std::vector<double>{0.1, 1.0e7}) == "0.1,1.0E7", "floating join uses general form");

    const std::vector<double> specials = {1.0, std::numeric_limits<double>::quiet_NaN(), -0.0,
                                          std::numeric_limits<double>::denorm_min()};
    const alphabet &hex = alphabet::base16();
    const std::string exact = io::join_exact(hex, " ", specials);
    const std::vector<double> exact_back = io::split_exact<double>(hex, exact, " ");
    bool bits_match = exact_back.size() == specials.size();
    for (std::size_t index = 0; bits_match && index < specials.size(); ++index) {
        bits_match = numtext::core::double_bits(exact_back[index]) == numtext::core::double_bits(specials[index]);
    }
    expect(bits_match, "exact join keeps every bit");
    expect(exact.substr(0, 5) == "F03F ", "exact join uses the short signed form");

    const std::vector<std::vector<float>> float_rows = {{1.5f, -0.0f}, {std::numeric_limits<float>::infinity()}};
    const std::string float_grid = io::join_2d_exact(hex, "[", ";", float_rows);
    const auto float_back = io::split_2d_exact<float>(hex, float_grid, "[", ";");
    expect(float_back.size() == 2 && float_back[0].size() == 2 && float_back[1].size() == 1,
           "exact 2-D split keeps the shape");
    expect(float_back[0][0] == 1.5f && numtext::core::float_bits(float_back[0][1]) == 0x80000000U &&
               float_back[1][0] == std::numeric_limits<float>::infinity(),
           "exact 2-D split keeps the values");

    const std::vector<std::vector<double>> double_rows = {{1.5, -2.25}, {}, {0.1}};
    const std::string double_grid = io::join_2d(dec, "\"", ",", double_rows);
    expect(double_grid == "\"1.5,-2.25\",\"\",\"0.1\"", "2-D floating join uses general form");
    expect(io::split_2d<double>(dec, double_grid, "\"", ",") == double_rows, "2-D floating split");
    const std::vector<std::vector<float>> single_rows = {{0.1f}, {-3.0f, 1.0e10f}};
    expect(io::split_2d<float>(hex, io::join_2d(hex, "\"", ",", single_rows), "\"", ",") == single_rows,
           "2-D float split");

    std::string exact_part;
    io::append_joined_exact(exact_part, hex, " ", std::span<const double>(specials), 0, 1);
    expect(exact_part == "F03F", "exact sub-range join");
    std::string exact_tail;
    io::append_joined_exact(exact_tail, hex, " ", std::span<const double>(specials), 2, 100);
    const std::vector<double> tail_back = io::split_exact<double>(hex, exact_tail, " ");
    expect(tail_back.size() == 2 && numtext::core::double_bits(tail_back[0]) == numtext::core::double_bits(-0.0) &&
               tail_back[1] == std::numeric_limits<double>::denorm_min(),
           "exact sub-range count is clamped");
    std::string decimal_part = "(";
    io::append_joined_decimal(decimal_part, " ", 6, std::span<const double>(measurements), 1, 1);
    decimal_part.push_back(')');
    expect(decimal_part == "(-2.250)", "decimal sub-range join");
    std::string decimal_none;
    io::append_joined_decimal(decimal_none, " ", 6, std::span<const double>(measurements), 3);
    expect(decimal_none.empty(), "decimal sub-range past the array appends nothing");

    const std::vector<std::int64_t> longs = {1, -20, 300};
    std::string readable_part;
    io::append_joined_readable(readable_part, ", ", std::span<const std::int64_t>(longs), 1);
    expect(readable_part == "-20L, 300L", "readable sub-range join");
    const std::string literals = io::join_readable(", ", longs);
    expect(literals == "1L, -20L, 300L", "readable join");
    expect(io::split_readable<std::int64_t>(literals, ", ") == longs, "readable split");

    if (!all_good) {
        std::cerr << "batch tests failed\n";
        return 1;
    }
    std::cout << "batch tests passed\n";
    return 0;
}

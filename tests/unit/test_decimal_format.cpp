// tests/unit/test_decimal_format.cpp — Tests for the general, scientific, decimal and friendly renderings.

#include <charconv>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <numtext/numtext.hpp>

namespace {

    // Significant digits of a rendering, with leading and trailing zeros removed.
    std::string significant_digits(std::string_view text) {
        std::string digits;
        for (const char ch : text) {
            if (ch == 'e' || ch == 'E') {
                break;
            }
            if (ch >= '0' && ch <= '9') {
                digits.push_back(ch);
            }
        }
        const auto first = digits.find_first_not_of('0');
        if (first == std::string::npos) {
            return "0";
        }
        digits.erase(0, first);
        digits.erase(digits.find_last_not_of('0') + 1);
        return digits;
    }

    template <typename Float> std::string reference_digits(Float value) {
        char buffer[64];
        const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::scientific);
        return significant_digits(std::string_view(buffer, static_cast<std::size_t>(result.ptr - buffer)));
    }

} // namespace

int main() {
    bool all_good = true;
    const auto expect = [&](bool condition, const char *message) {
        if (!condition) {
            all_good = false;
            std::cerr << "decimal format test failure: " << message << '\n';
        }
    };

    namespace io = numtext::io;
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    constexpr double inf = std::numeric_limits<double>::infinity();

    expect(io::general(nan) == "NaN", "NaN literal");
    expect(io::general(inf) == "Infinity", "positive infinity literal");
    expect(io::general(-inf) == "-Infinity", "negative infinity literal");
    expect(io::general(0.0) == "0.0", "positive zero");
    expect(io::general(-0.0) == "-0.0", "negative zero keeps its sign");
    expect(io::general(1.0) == "1.0", "one");
    expect(io::general(-2.5) == "-2.5", "negative value");
    expect(io::general(0.1) == "0.1", "shortest digits of 0.1");
    expect(io::general(100.0) == "100.0", "trailing integer zeros");
    expect(io::general(123456.0) == "123456.0", "inside the general window");
    expect(io::general(1234567.0) == "1234567.0", "last exponent inside the general window");
    expect(io::general(1.0e7) == "1.0E7", "first exponent past the general window");
    expect(io::general(123456789012.0) == "1.23456789012E11", "large values switch to scientific");
    expect(io::general(0.001) == "0.001", "lowest exponent inside the window");
    expect(io::general(0.0001) == "1.0E-4", "below the window");
    expect(io::general(1.0e21) == "1.0E21", "powers of ten");
    expect(io::general(std::numeric_limits<double>::max()) == "1.7976931348623157E308", "double maximum");
    expect(io::general(std::numeric_limits<double>::denorm_min()) == "4.9E-324",
           "smallest subnormal keeps two digits");
    expect(io::general(2.2250738585072014E-308) == "2.2250738585072014E-308", "smallest normal");
    expect(io::general(1.5, io::notation{-3, 7, 'e'}) == "1.5", "marker is irrelevant inside the window");
    expect(io::general(1.5e10, io::notation{-3, 7, 'e'}) == "1.5e10", "custom exponent marker");

    expect(io::scientific(0.0) == "0.0E0", "scientific zero");
    expect(io::scientific(-0.0) == "-0.0E0", "scientific negative zero");
    expect(io::scientific(1.0) == "1.0E0", "scientific one");
    expect(io::scientific(123.456) == "1.23456E2", "scientific mantissa");
    expect(io::scientific(-0.001) == "-1.0E-3", "scientific negative exponent");
    expect(io::scientific(1.5, 'e') == "1.5e0", "scientific custom marker");
    expect(io::scientific(nan) == "NaN", "scientific NaN");

    expect(io::friendly(1.0e9) == "1000000000.0", "friendly window reaches 10^9");
    expect(io::friendly(1.0e10) == "1.0E10", "friendly window stops at 10^10");
    expect(io::friendly(1.0e-10) == "0.0000000001", "friendly window reaches 10^-10");
    expect(io::friendly(1.0e-11) == "1.0E-11", "friendly window stops below 10^-10");

    expect(io::decimal(nan) == "NaN", "decimal NaN");
    expect(io::decimal(-inf) == "-Infinity", "decimal negative infinity");
    expect(io::decimal(-0.0) == "-0.0", "decimal negative zero");
    expect(io::decimal(1.0e21) == "1000000000000000000000.0", "decimal never uses scientific");
    expect(io::decimal(1.0e-5) == "0.00001", "decimal small values");
    expect(io::decimal(0.1, io::no_limit, 3) == "0.100", "precision pads fractional digits");
    expect(io::decimal(0.125, io::no_limit, 2) == "0.12", "precision rounds half to even");
    expect(io::decimal(0.375, io::no_limit, 2) == "0.38", "precision rounds half to even upwards");
    expect(io::decimal(0.999, io::no_limit, 2) == "1.00", "rounding carries into the integer part");
    expect(io::decimal(0.006, io::no_limit, 2) == "0.01", "rounding from below the last place");
    expect(io::decimal(0.0004, io::no_limit, 2) == "0.00", "tiny values round to zero");
    expect(io::decimal(2.5, io::no_limit, 0) == "2", "precision zero drops the point");
    expect(io::decimal(3.5, io::no_limit, 0) == "4", "precision zero rounds half to even");
    expect(io::decimal(-1.25, io::no_limit, 1) == "-1.2", "negative precision rounding");
    expect(io::decimal(0.0, io::no_limit, 2) == "0.00", "zero with precision");
    expect(io::decimal(123.456, 6) == "123.45", "length limit truncates");
    expect(io::decimal(1.5, 6) == "1.5000", "length limit pads numbers with zeros");
    expect(io::decimal(nan, 5) == "NaN  ", "length limit pads literals with spaces");
    expect(io::decimal(12345.0, 8, 0) == "   12345", "length limit pads integers on the left");
    expect(io::decimal(-1.25, 10, 1) == "-1.2000000", "precision then length limit");

    constexpr float fnan = std::numeric_limits<float>::quiet_NaN();
    expect(io::general(fnan) == "NaN", "float NaN");
    expect(io::general(-0.0f) == "-0.0", "float negative zero");
    expect(io::general(1.0f) == "1.0", "float one");
    expect(io::general(0.1f) == "0.1", "float shortest digits of 0.1");
    expect(io::general(123456.7f) == "123456.7", "float inside the window");
    expect(io::general(1.0e7f) == "1.0E7", "float past the window");
    expect(io::general(std::numeric_limits<float>::max()) == "3.4028235E38", "float maximum");
    expect(io::general(std::numeric_limits<float>::denorm_min()) == "1.4E-45", "float smallest subnormal");
    expect(io::scientific(1.0e-10f) == "1.0E-10", "float scientific");
    expect(io::decimal(0.5f, io::no_limit, 3) == "0.500", "float precision");

    using numtext::core::alphabet;
    const alphabet letters("abcdefghij");
    expect(alphabet::base10().encode_shortest(-1.5) == "-1.5", "decimal alphabet spells plain digits");
    expect(alphabet::base16().encode_shortest(1.0e10) == "1.0E10", "hex alphabet keeps the E marker");
    expect(letters.encode_shortest(-12.5) == "-bc.f", "digits come from the alphabet");
    expect(letters.encode_shortest(1.0e-5) == "b.aE-f", "exponent digits come from the alphabet");
    expect(letters.encode_shortest(nan) == "NaN", "literals are not respelled");
    expect(alphabet::uri_safe().encode_shortest(-inf) == "!Infinity", "alphabet negative sign on literals");
    const alphabet e_digits("EFGHIJKLMN");
    expect(e_digits.encode_shortest(1.0e10) == "F.E$FE", "padding replaces a marker that is also a digit");
    expect(e_digits.read_double_shortest("F.E$FE") == 1.0e10, "respelled marker reads back");
    expect(letters.read_double_shortest("-bc.f") == -12.5, "alphabet digits read back");
    expect(std::isnan(letters.read_double_shortest("NaN")), "NaN reads back");
    expect(alphabet::uri_safe().read_double_shortest("!Infinity") == -inf, "negative infinity reads back");
    expect(letters.read_double_shortest("b.5") == 0.0, "plain digits outside the alphabet read as zero");
    expect(letters.read_float_shortest(letters.encode_shortest(0.1f)) == 0.1f, "float shortest round trip");
    bool rejected = false;
    try {
        (void)alphabet::base8().encode_shortest(1.0);
    } catch (const std::invalid_argument &) {
        rejected = true;
    }
    expect(rejected, "shortest text needs ten digits");

    std::string shared = "[";
    io::append_general(shared, 2.5);
    shared.push_back(',');
    io::append_friendly(shared, 3.0f);
    shared.push_back(']');
    expect(shared == "[2.5,3.0]", "append forms extend the caller's buffer");

    std::mt19937_64 generator(31337);
    const alphabet scrambled = numtext::util::random_alphabet(generator);
    for (int round = 0; round < 20000; ++round) {
        const double value = numtext::util::random_finite_double(generator);
        const std::string positional = io::decimal(value);
        expect(significant_digits(positional) == reference_digits(value),
               "decimal digits match the shortest round-trip digits");
        expect(io::read_double(io::general(value)) == value, "general round trip");
        expect(io::read_double(io::scientific(value)) == value, "scientific round trip");
        expect(io::read_double(io::friendly(value)) == value, "friendly round trip");
        expect(io::read_double(positional) == value, "decimal round trip");
        expect(scrambled.read_double_shortest(scrambled.encode_shortest(value)) == value,
               "shortest text round trip with a scrambled alphabet");

        const float single = numtext::util::random_finite_float(generator);
        const std::string single_positional = io::decimal(single);
        expect(significant_digits(single_positional) == reference_digits(single),
               "float decimal digits match the shortest round-trip digits");
        expect(io::read_float(io::general(single)) == single, "float general round trip");
        expect(io::read_float(io::scientific(single)) == single, "float scientific round trip");
        expect(io::read_float(io::friendly(single)) == single, "float friendly round trip");
        expect(io::read_float(single_positional) == single, "float decimal round trip");
    }

    // No shared scratch state: concurrent callers never see each other's output.
    std::vector<std::thread> workers;
    std::vector<int> mismatches(4, 0);
    for (int worker = 0; worker < 4; ++worker) {
        workers.emplace_back([worker, &mismatches] {
            const double value = 1.25 + worker;
            const std::string expected = io::general(value);
            for (int round = 0; round < 5000; ++round) {
                if (io::general(value) != expected || io::read_double(expected) != value) {
                    ++mismatches[static_cast<std::size_t>(worker)];
                }
            }
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }
    for (const int count : mismatches) {
        expect(count == 0, "concurrent formatting is isolated");
    }

    if (!all_good) {
        std::cerr << "decimal format tests failed\n";
        return 1;
    }
    std::cout << "decimal format tests passed\n";
    return 0;
}

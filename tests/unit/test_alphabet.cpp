// tests/unit/test_alphabet.cpp — Tests for alphabet construction, serialization and scrambling.

#include <algorithm>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

#include <numtext/numtext.hpp>

int main() {
    bool all_good = true;
    const auto expect = [&](bool condition, const char *message) {
        if (!condition) {
            all_good = false;
            std::cerr << "alphabet test failure: " << message << '\n';
        }
    };

    using numtext::core::alphabet;

    const auto rejects = [](auto &&build) {
        try {
            build();
        } catch (const std::invalid_argument &) {
            return true;
        }
        return false;
    };

    expect(alphabet::base2().radix() == 2, "base2 radix");
    expect(alphabet::base16().radix() == 16, "base16 radix");
    expect(alphabet::base64().radix() == 64, "base64 radix");
    expect(alphabet::base86().radix() == 86, "base86 radix");
    expect(alphabet::standard_alphabets().size() == 9, "nine standard alphabets");

    expect(alphabet::base2().length_8() == 8 && alphabet::base2().length_64() == 64,
           "binary fixed widths equal the bit widths");
    expect(alphabet::base10().length_8() == 3, "255 needs three decimal digits");
    expect(alphabet::base10().length_16() == 5, "65535 needs five decimal digits");
    expect(alphabet::base10().length_32() == 10, "4294967295 needs ten decimal digits");
    expect(alphabet::base10().length_64() == 20, "2^64 - 1 needs twenty decimal digits");
    expect(alphabet::base16().length_32() == 8 && alphabet::base16().length_64() == 16,
           "hex fixed widths");
    expect(alphabet::base36().length_64() == 13, "base36 64-bit width");
    expect(alphabet::base64().length_8() == 2 && alphabet::base64().length_16() == 3 &&
               alphabet::base64().length_32() == 6 && alphabet::base64().length_64() == 11,
           "base64 fixed widths");
    expect(alphabet::base16().fixed_length<char16_t>() == 4, "char16_t uses the 16-bit width");

    expect(rejects([] { alphabet("0"); }), "a single digit is not an alphabet");
    expect(rejects([] { alphabet("0120"); }), "duplicate digits are rejected");
    expect(rejects([] { alphabet("0aA", true); }), "case-folded duplicates are rejected");
    expect(!rejects([] { alphabet("0aA", false); }), "case-sensitive alphabets may mix cases");
    expect(rejects([] { alphabet("01", false, '$', '+', '1'); }), "negative sign may not be a digit");
    expect(rejects([] { alphabet("01", false, '0', '+', '-'); }), "padding may not be a digit");
    expect(rejects([] { alphabet("0123456789ABCDEF", true, '$', '+', 'a'); }),
           "signs collide with case-folded digits");
    expect(rejects([] { alphabet("01", false, '$', '+', 'e'); }), "negative sign may not be e");
    expect(rejects([] { alphabet("01", false, '$', '+', '.'); }), "negative sign may not be '.'");
    expect(rejects([] { alphabet("0.1"); }), "'.' is reserved");
    expect(rejects([] { alphabet("0 1"); }), "space is not a printable digit");
    expect(rejects([] { alphabet("01", false, '$', '-', '-'); }), "signs must differ");
    expect(rejects([] { alphabet(std::string(95, 'x')); }), "oversized digit strings are rejected");
    expect(rejects([] { alphabet("01", false, '.', '+', '-'); }), "padding may not be '.'");
    expect(rejects([] { alphabet("01", false, '$', '.', '-'); }), "positive sign may not be '.'");

    std::string widest;
    for (char ch = '!'; ch <= '~'; ++ch) {
        if (ch != '.' && ch != '$' && ch != '+' && ch != '-') {
            widest.push_back(ch);
        }
    }
    expect(widest.size() == 90 && !rejects([&] { alphabet{widest}; }), "radix 90 is the widest alphabet");
    expect(rejects([&] { alphabet(widest + '$', false, '#', '+', '-'); }), "radix 91 is rejected");

    // With 'E' among the first ten digits the padding char marks the exponent, so it
    // must never be the decimal point.
    const alphabet e_first("EFGHIJKLMN", false, '#', '+', '-');
    for (const double value : {1.5e10, 2.5, -0.125, 1.0e-5}) {
        expect(e_first.read_double_shortest(e_first.encode_shortest(value)) == value,
               "shortest text survives an exponent marker taken from the padding");
    }

    expect(alphabet::base16().digit_value('f') == 15 && alphabet::base16().digit_value('F') == 15,
           "case-insensitive lookup accepts both cases");
    expect(alphabet::base64().digit_value('a') == 26 && alphabet::base64().digit_value('A') == 0,
           "case-sensitive lookup distinguishes cases");
    expect(alphabet::base10().digit_value('x') == -1, "unknown characters have no value");
    expect(alphabet::base10().digit_value(static_cast<char>(0xC3)) == -1,
           "non-ASCII bytes have no value");

    for (const alphabet *base : alphabet::standard_alphabets()) {
        const std::string serialized = base->serialize();
        expect(alphabet::deserialize(serialized) == *base, "serialize/deserialize restores the alphabet");
    }
    expect(alphabet::base16().serialize() == "0123456789ABCDEF1p+-", "hex serialization layout");
    expect(rejects([] { alphabet::deserialize("abc"); }), "short serialized text is rejected");
    expect(rejects([] { alphabet::deserialize("01x$+-"); }), "missing case flag is rejected");
    expect(!(alphabet::base64() == alphabet::uri_safe()), "different alphabets compare unequal");

    std::mt19937_64 first(42);
    std::mt19937_64 second(42);
    const alphabet scrambled_a = alphabet::scrambled(first);
    const alphabet scrambled_b = alphabet::scrambled(second);
    expect(scrambled_a == scrambled_b, "same seed gives the same scrambled alphabet");
    expect(scrambled_a.radix() == 72, "scrambled alphabets have 72 digits");
    expect(!scrambled_a.case_insensitive(), "scrambled alphabets are case-sensitive");
    expect(scrambled_a.negative_sign() != 'e' && scrambled_a.negative_sign() != 'E',
           "scrambled negative sign avoids exponent markers");
    expect(scrambled_a.digit_value(scrambled_a.negative_sign()) < 0,
           "scrambled negative sign is not a digit");
    expect(alphabet::deserialize(scrambled_a.serialize()) == scrambled_a,
           "scrambled alphabets serialize");

    std::mt19937_64 other(7);
    const alphabet scrambled_c = alphabet::scrambled(other);
    expect(!(scrambled_c == scrambled_a), "different seeds give different alphabets");

    std::mt19937_64 shuffler(99);
    const alphabet shuffled = alphabet::base36().scramble(shuffler);
    std::string original_digits = alphabet::base36().digits();
    std::string shuffled_digits = shuffled.digits();
    std::sort(original_digits.begin(), original_digits.end());
    std::sort(shuffled_digits.begin(), shuffled_digits.end());
    expect(original_digits == shuffled_digits, "scramble keeps the digit set");
    expect(shuffled.digits() != alphabet::base36().digits(), "scramble reorders the digits");
    expect(shuffled.negative_sign() == '-' && shuffled.case_insensitive(),
           "scramble keeps signs and case handling");

    std::ostringstream dumped;
    numtext::util::dump(dumped, alphabet::base16());
    expect(dumped.str().find("radix=16") != std::string::npos, "dump names the radix");

    if (!all_good) {
        std::cerr << "alphabet tests failed\n";
        return 1;
    }
    std::cout << "alphabet tests passed\n";
    return 0;
}

// examples/example_decimal.cpp — Shows the decimal renderings side by side.

#include <iostream>

#include <numtext/numtext.hpp>

int
main() {
    namespace io = numtext::io;

    for (const double value : {0.1, 1234567.0, 12345678.0, 0.000123, 6.02214076e23}) {
        std::cout << "general=" << io::general(value) << "  scientific=" << io::scientific(value)
                  << "  friendly=" << io::friendly(value) << "  decimal(12,3)=[" << io::decimal(value, 12, 3)
                  << "]\n";
    }

    const double third = 1.0 / 3.0;
    std::cout << "1/3 as float literal: " << io::readable(static_cast<float>(third)) << "\n";
    std::cout << "exact base86 bits of 1/3: " << numtext::Alphabet::base86().encode_signed(third) << "\n";
    std::cout << "read back: " << io::general(io::read_double(io::general(third))) << "\n";
    return 0;
}

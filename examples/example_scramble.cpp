// examples/example_scramble.cpp — Obfuscates a saved score table with a per-install scrambled alphabet.

#include <cstdint>
#include <iostream>
#include <random>
#include <vector>

#include <numtext/numtext.hpp>

int
main() {
    using numtext::Alphabet;

    std::mt19937_64 install_seed(0xC0FFEE);
    const Alphabet key = Alphabet::scrambled(install_seed);
    const std::string stored_key = key.serialize();

    const std::vector<std::int32_t> scores = {1200, -35, 987654, 0};
    const std::string save_file = numtext::io::join(key, " ", scores);
    std::cout << "alphabet key: " << stored_key << "\n";
    std::cout << "saved scores: " << save_file << "\n";

    const Alphabet restored = Alphabet::deserialize(stored_key);
    const auto loaded = numtext::io::split<std::int32_t>(restored, save_file, " ");
    std::cout << "loaded scores:";
    for (const auto score : loaded) {
        std::cout << ' ' << score;
    }
    std::cout << "\n";

    std::cout << "tampered entry reads as " << restored.read_int32("not a score") << "\n";
    return loaded == scores ? 0 : 1;
}

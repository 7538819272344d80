// bench/bench_integer_codec.cpp — Benchmark for integer encoding and lenient reads.

#include <cstdint>
#include <random>
#include <string>

#include <benchmark/benchmark.h>

#include <numtext/core/alphabet.hpp>
#include <numtext/util/random.hpp>

namespace {

    inline std::int64_t random_int64(std::mt19937_64 &rng) { return numtext::util::random_integer<std::int64_t>(rng); }

} // namespace

static void bench_encode_signed_base64(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()));
    const auto &base = numtext::core::alphabet::base64();
    std::string out;
    while (state.KeepRunning()) {
        out.clear();
        base.append_signed(out, random_int64(rng));
        benchmark::DoNotOptimize(out.data());
    }
}

static void bench_encode_unsigned_base10(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x10);
    const auto &base = numtext::core::alphabet::base10();
    std::string out;
    while (state.KeepRunning()) {
        out.clear();
        base.append_unsigned(out, random_int64(rng));
        benchmark::DoNotOptimize(out.data());
    }
}

static void bench_read_int64_base16(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x20);
    const auto &base = numtext::core::alphabet::base16();
    const std::string text = base.encode_signed(random_int64(rng));
    while (state.KeepRunning()) {
        const auto value = base.read_int64(text);
        benchmark::DoNotOptimize(value);
    }
}

static void bench_scrambled_alphabet(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x30);
    while (state.KeepRunning()) {
        const auto base = numtext::core::alphabet::scrambled(rng);
        benchmark::DoNotOptimize(base.radix());
    }
}

BENCHMARK(bench_encode_signed_base64);
BENCHMARK(bench_encode_unsigned_base10);
BENCHMARK(bench_read_int64_base16);
BENCHMARK(bench_scrambled_alphabet);

BENCHMARK_MAIN();

// bench/bench_decimal.cpp — Benchmark for shortest decimal rendering, reading and batch joins.

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include <numtext/numtext.hpp>

static void bench_general_double(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()));
    std::string out;
    while (state.KeepRunning()) {
        out.clear();
        numtext::io::append_general(out, numtext::util::random_finite_double(rng));
        benchmark::DoNotOptimize(out.data());
    }
}

static void bench_general_float(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x10);
    std::string out;
    while (state.KeepRunning()) {
        out.clear();
        numtext::io::append_general(out, numtext::util::random_finite_float(rng));
        benchmark::DoNotOptimize(out.data());
    }
}

static void bench_decimal_limited(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x20);
    std::string out;
    while (state.KeepRunning()) {
        out.clear();
        numtext::io::append_decimal(out, numtext::util::random_finite_double(rng), 12, 4);
        benchmark::DoNotOptimize(out.data());
    }
}

static void bench_read_double(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x30);
    const std::string text = numtext::io::general(numtext::util::random_finite_double(rng));
    while (state.KeepRunning()) {
        const double value = numtext::io::read_double(text);
        benchmark::DoNotOptimize(value);
    }
}

static void bench_join_split_int32(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x40);
    std::vector<std::int32_t> values(static_cast<std::size_t>(state.range(0)));
    for (auto &value : values) {
        value = numtext::util::random_integer<std::int32_t>(rng);
    }
    const auto &base = numtext::core::alphabet::base86();
    while (state.KeepRunning()) {
        const std::string text = numtext::io::join(base, " ", values);
        const auto back = numtext::io::split<std::int32_t>(base, text, " ");
        benchmark::DoNotOptimize(back.data());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}

BENCHMARK(bench_general_double);
BENCHMARK(bench_general_float);
BENCHMARK(bench_decimal_limited);
BENCHMARK(bench_read_double);
BENCHMARK(bench_join_split_int32)->Arg(16)->Arg(1024);

BENCHMARK_MAIN();

// bench/bench_wide_int.cpp — Benchmarks for fixed-width integer arithmetic.

#include <cstddef>
#include <random>

#include <benchmark/benchmark.h>

#include <numx/core/wide_int.hpp>
#include <numx/io/format.hpp>
#include <numx/util/random.hpp>

namespace {

using numx::core::i256;
using numx::core::u1024;
using numx::core::u256;
using numx::core::u512;

} // namespace

static void bench_u256_add(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()));
    const u256 lhs = numx::util::random_wide<4>(rng);
    const u256 rhs = numx::util::random_wide<4>(rng);
    for (auto _ : state) {
        const auto result = lhs.wrapping_add(rhs);
        benchmark::DoNotOptimize(result);
    }
}

static void bench_u256_mul(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x10);
    const u256 lhs = numx::util::random_wide<4>(rng);
    const u256 rhs = numx::util::random_wide<4>(rng);
    for (auto _ : state) {
        const auto result = lhs.overflowing_mul(rhs);
        benchmark::DoNotOptimize(result.first);
    }
}

static void bench_i256_mul(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x20);
    const i256 lhs = numx::util::random_wide<4, true>(rng, 2);
    const i256 rhs = -numx::util::random_wide<4, true>(rng, 1);
    for (auto _ : state) {
        const auto result = lhs.checked_mul(rhs);
        benchmark::DoNotOptimize(result);
    }
}

static void bench_u512_div_rem(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x30);
    const u512 dividend = numx::util::random_wide<8>(rng);
    u512 divisor = numx::util::random_wide<8>(rng, static_cast<std::size_t>(state.range(0)));
    if (divisor.is_zero()) {
        divisor = u512::one();
    }
    for (auto _ : state) {
        const auto result = dividend.div_rem(divisor);
        benchmark::DoNotOptimize(result.first);
        benchmark::DoNotOptimize(result.second);
    }
}

static void bench_u1024_shift(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x40);
    const u1024 value = numx::util::random_wide<16>(rng);
    for (auto _ : state) {
        const auto result = (value << 333) >> 71;
        benchmark::DoNotOptimize(result);
    }
}

static void bench_u256_to_decimal(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x50);
    const u256 value = numx::util::random_wide<4>(rng);
    for (auto _ : state) {
        auto text = numx::io::to_string(value);
        benchmark::DoNotOptimize(text.data());
    }
}

BENCHMARK(bench_u256_add);
BENCHMARK(bench_u256_mul);
BENCHMARK(bench_i256_mul);
BENCHMARK(bench_u512_div_rem)->Arg(1)->Arg(4)->Arg(8);
BENCHMARK(bench_u1024_shift);
BENCHMARK(bench_u256_to_decimal);

BENCHMARK_MAIN();

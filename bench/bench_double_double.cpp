// bench/bench_double_double.cpp — Benchmarks for double-double arithmetic.

#include <random>

#include <benchmark/benchmark.h>

#include <numx/fp/double_double.hpp>
#include <numx/fp/ieee_float.hpp>
#include <numx/util/random.hpp>

namespace {

using numx::fp::double_double;
using numx::fp::round_mode;

constexpr round_mode NEAREST = round_mode::nearest_ties_to_even;

} // namespace

static void BM_DoubleDoubleAdd(benchmark::State& state) {
    std::mt19937_64 rng(0xdd0001);
    const double_double lhs = numx::util::random_double_double(rng);
    const double_double rhs = numx::util::random_double_double(rng);
    for (auto _ : state) {
        auto sum = lhs.add_r(rhs, NEAREST);
        benchmark::DoNotOptimize(sum.value);
    }
}
BENCHMARK(BM_DoubleDoubleAdd);

static void BM_DoubleDoubleMultiply(benchmark::State& state) {
    std::mt19937_64 rng(0xdd0002);
    const double_double lhs = numx::util::random_double_double(rng);
    const double_double rhs = numx::util::random_double_double(rng);
    for (auto _ : state) {
        auto product = lhs.mul_r(rhs, NEAREST);
        benchmark::DoNotOptimize(product.value);
    }
}
BENCHMARK(BM_DoubleDoubleMultiply);

static void BM_DoubleDoubleDivide(benchmark::State& state) {
    std::mt19937_64 rng(0xdd0003);
    const double_double lhs = numx::util::random_double_double(rng);
    const double_double rhs = numx::util::random_double_double(rng);
    for (auto _ : state) {
        auto quotient = lhs.div_r(rhs, NEAREST);
        benchmark::DoNotOptimize(quotient.value);
    }
}
BENCHMARK(BM_DoubleDoubleDivide);

static void BM_DoubleDoubleToString(benchmark::State& state) {
    std::mt19937_64 rng(0xdd0004);
    const double_double value = numx::util::random_double_double(rng);
    for (auto _ : state) {
        auto text = value.to_string();
        benchmark::DoNotOptimize(text.data());
    }
}
BENCHMARK(BM_DoubleDoubleToString);

static void BM_IeeeDoubleMultiply(benchmark::State& state) {
    const auto lhs = numx::fp::ieee_double::from_double(1.0 / 3.0);
    const auto rhs = numx::fp::ieee_double::from_double(2.718281828459045);
    for (auto _ : state) {
        auto product = lhs.mul_r(rhs, NEAREST);
        benchmark::DoNotOptimize(product.value);
    }
}
BENCHMARK(BM_IeeeDoubleMultiply);

BENCHMARK_MAIN();

#include "domain/fixed.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>

static void BM_ToFixed(benchmark::State& state) {
  const double value = -1.0;
  const uint8_t precision = 1;
  for (auto _ : state) {
    benchmark::DoNotOptimize(to_fixed(value, precision));
  }
}
BENCHMARK(BM_ToFixed);

static void BM_ToFixedMaxPrecision(benchmark::State& state) {
  const double value = -0.000000001;
  for (auto _ : state) {
    benchmark::DoNotOptimize(to_fixed(value, FIXED_PRECISION_MAX));
  }
}
BENCHMARK(BM_ToFixedMaxPrecision);

// Every precision, so the table lookup is not constant-folded away.
static void BM_ToFixedByPrecision(benchmark::State& state) {
  const uint8_t precision = static_cast<uint8_t>(state.range(0));
  double value = 1.25;
  for (auto _ : state) {
    benchmark::DoNotOptimize(value);
    benchmark::DoNotOptimize(to_fixed(value, precision));
  }
}
BENCHMARK(BM_ToFixedByPrecision)->DenseRange(0, FIXED_PRECISION_MAX);

static void BM_ToFloat(benchmark::State& state) {
  const int64_t raw = -10;
  const uint8_t precision = 1;
  for (auto _ : state) {
    benchmark::DoNotOptimize(to_float(raw, precision));
  }
}
BENCHMARK(BM_ToFloat);

static void BM_RoundTrip(benchmark::State& state) {
  double value = 2450.12;
  for (auto _ : state) {
    benchmark::DoNotOptimize(value);
    benchmark::DoNotOptimize(to_float(to_fixed(value, 2), 2));
  }
}
BENCHMARK(BM_RoundTrip);

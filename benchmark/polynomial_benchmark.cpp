#include "../include/FixedPoly.hpp"
#include <benchmark/benchmark.h>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <llvm/ADT/SmallVector.h>

using namespace fixedpoly;

// every monomial in `n` variables of total degree at most `d`
static auto denseExponents(size_t n, int64_t d) -> ExponentMatrix {
  ExponentMatrix E(Row{0}, Col{n});
  llvm::SmallVector<int64_t, 8> e(n, 0);
  for (;;) {
    if (math::totalDegree(e) <= d) E.pushRow(e);
    size_t i = 0;
    for (; i < n; ++i) {
      if (++e[i] <= d) break;
      e[i] = 0;
    }
    if (i == n) return E;
  }
}

template <typename T> static auto densePoly(size_t n, int64_t d) -> Poly<T> {
  ExponentMatrix E = denseExponents(n, d);
  llvm::SmallVector<T, 64> c;
  for (size_t j = 0, M = size_t(E.numRow()); j < M; ++j)
    c.push_back(T(int64_t(j % 7) - 3));
  return Poly<T>{std::move(E), c};
}

static void BM_Construct_Dense(benchmark::State &state) {
  ExponentMatrix E = denseExponents(4, state.range(0));
  llvm::SmallVector<int64_t, 64> c(size_t(E.numRow()), 1);
  for (auto _ : state) {
    Poly<int64_t> p{E, c};
    benchmark::DoNotOptimize(p);
  }
}
// Register the function as a benchmark
BENCHMARK(BM_Construct_Dense)->DenseRange(2, 8, 2);

static void BM_Evaluate_Dense(benchmark::State &state) {
  Poly<double> p = densePoly<double>(4, state.range(0));
  llvm::SmallVector<double, 4> x{0.5, -1.25, 2.0, 0.75};
  for (auto _ : state) benchmark::DoNotOptimize(evaluate(p, x));
}
BENCHMARK(BM_Evaluate_Dense)->DenseRange(2, 8, 2);

static void BM_Evaluate_Complex(benchmark::State &state) {
  using C = std::complex<double>;
  Poly<int64_t> p = densePoly<int64_t>(3, state.range(0));
  llvm::SmallVector<C, 4> x{C{0.5, 1.0}, C{-1.0, 0.25}, C{0.0, -2.0}};
  for (auto _ : state) benchmark::DoNotOptimize(evaluate(p, x));
}
BENCHMARK(BM_Evaluate_Complex)->DenseRange(2, 8, 2);

static void BM_Gradient_Dense(benchmark::State &state) {
  Poly<int64_t> p = densePoly<int64_t>(4, state.range(0));
  for (auto _ : state) benchmark::DoNotOptimize(gradient(p));
}
BENCHMARK(BM_Gradient_Dense)->DenseRange(2, 8, 2);

static void BM_Substitute_Dense(benchmark::State &state) {
  Poly<int64_t> p = densePoly<int64_t>(4, state.range(0));
  for (auto _ : state) benchmark::DoNotOptimize(substitute(p, 1, int64_t(3)));
}
BENCHMARK(BM_Substitute_Dense)->DenseRange(2, 8, 2);

static void BM_Homogenize_Dense(benchmark::State &state) {
  Poly<int64_t> p = densePoly<int64_t>(4, state.range(0));
  for (auto _ : state) benchmark::DoNotOptimize(homogenize(p));
}
BENCHMARK(BM_Homogenize_Dense)->DenseRange(2, 8, 2);

static void BM_WeylNorm_Dense(benchmark::State &state) {
  Poly<int64_t> p = homogenize(densePoly<int64_t>(3, state.range(0)));
  for (auto _ : state) benchmark::DoNotOptimize(weylNorm(p));
}
BENCHMARK(BM_WeylNorm_Dense)->DenseRange(2, 8, 2);

static void BM_WeylDot_Dense(benchmark::State &state) {
  Poly<int64_t> f = homogenize(densePoly<int64_t>(3, state.range(0)));
  Poly<int64_t> g{f};
  for (auto _ : state) benchmark::DoNotOptimize(weylDot(f, g));
}
BENCHMARK(BM_WeylDot_Dense)->DenseRange(2, 8, 2);

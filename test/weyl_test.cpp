#include "../include/Math/Combinatorics.hpp"
#include "../include/MatrixStringParse.hpp"
#include "../include/Polynomials/Poly.hpp"
#include "../include/Polynomials/Weyl.hpp"
#include <cmath>
#include <complex>
#include <cstdint>
#include <gtest/gtest.h>
#include <llvm/ADT/SmallVector.h>
#include <type_traits>

using namespace fixedpoly;

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(MultinomialTest, BasicAssertions) {
  llvm::SmallVector<int64_t> a{2, 1}, b{1, 1, 1}, c, d{2, 2}, e{0, 3, 0};
  EXPECT_EQ(multinomial(a), 3);
  EXPECT_EQ(multinomial(b), 6);
  EXPECT_EQ(multinomial(c), 1);
  EXPECT_EQ(multinomial(d), 6);
  EXPECT_EQ(multinomial(e), 1);
  EXPECT_EQ(math::binomial(10, 3), 120);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(WeylNormTest, BasicAssertions) {
  Poly<int64_t> m{"[2]"_exps, {3}};
  auto n = weylNorm(m);
  static_assert(std::is_same_v<decltype(n), double>);
  EXPECT_DOUBLE_EQ(n, 3.0);
  // (x0 + x1)^2
  Poly<int64_t> f{"[2 0; 1 1; 0 2]"_exps, {1, 2, 1}};
  EXPECT_DOUBLE_EQ(weylDot(f, f), 4.0);
  EXPECT_DOUBLE_EQ(weylNorm(f), 2.0);
  // an equal but distinct object goes through term matching
  Poly<int64_t> g{"[0 2; 2 0; 1 1]"_exps, {1, 1, 2}};
  ASSERT_EQ(f, g);
  EXPECT_DOUBLE_EQ(weylDot(f, g), 4.0);
  EXPECT_DOUBLE_EQ(weylDot(g, f), 4.0);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(WeylDotUnmatchedTest, BasicAssertions) {
  Poly<double> f{"[2 0; 1 1]"_exps, {1.0, 1.0}};
  Poly<double> g{"[1 1; 0 2]"_exps, {1.0, 1.0}};
  // only x0 x1 appears in both
  EXPECT_DOUBLE_EQ(weylDot(f, g), 0.5);
  EXPECT_DOUBLE_EQ(weylDot(g, f), 0.5);
  Poly<double> z{Col{2}};
  EXPECT_EQ(weylDot(f, z), 0.0);
  EXPECT_EQ(weylNorm(z), 0.0);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(ComplexWeylTest, BasicAssertions) {
  using C = std::complex<double>;
  // (1 + i) x0 x1 + 2 x0^2
  Poly<C> f{"[1 1; 2 0]"_exps, {C{1.0, 1.0}, C{2.0, 0.0}}};
  C d = weylDot(f, f);
  EXPECT_DOUBLE_EQ(d.real(), 5.0);
  EXPECT_DOUBLE_EQ(d.imag(), 0.0);
  auto n = weylNorm(f);
  static_assert(std::is_same_v<decltype(n), double>);
  EXPECT_DOUBLE_EQ(n, std::sqrt(5.0));
  Poly<C> g{"[2 0; 1 1]"_exps, {C{2.0, 0.0}, C{1.0, 1.0}}};
  C e = weylDot(f, g);
  EXPECT_DOUBLE_EQ(e.real(), 5.0);
  EXPECT_DOUBLE_EQ(e.imag(), 0.0);
  // conjugate linear in the second argument
  Poly<C> h{"[1 1]"_exps, {C{0.0, 1.0}}};
  C k = weylDot(f, h);
  EXPECT_DOUBLE_EQ(k.real(), 0.5);
  EXPECT_DOUBLE_EQ(k.imag(), -0.5);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(WeylUnitaryInvarianceTest, BasicAssertions) {
  // x0^2 under the rotation x0 -> (x0 + x1) / sqrt(2)
  Poly<double> f{"[2 0]"_exps, {1.0}};
  Poly<double> g{"[2 0; 1 1; 0 2]"_exps, {0.5, 1.0, 0.5}};
  EXPECT_DOUBLE_EQ(weylNorm(f), 1.0);
  EXPECT_DOUBLE_EQ(weylNorm(g), 1.0);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(LargeMultinomialTest, BasicAssertions) {
  // binomial(62, 31): the running product exceeds int64 before dividing
  llvm::SmallVector<int64_t> k{31, 31};
  EXPECT_EQ(multinomial(k), 465428353255261088);
  EXPECT_EQ(math::binomial(62, 31), 465428353255261088);
  Poly<double> f{"[31 31]"_exps, {1.0}};
  double n = weylNorm(f);
  EXPECT_GT(n, 0.0);
  EXPECT_DOUBLE_EQ(n, 1.0 / std::sqrt(465428353255261088.0));
  Poly<double> g{"[31 31]"_exps, {1.0}};
  EXPECT_DOUBLE_EQ(weylDot(f, g), 1.0 / 465428353255261088.0);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(LargeCoefficientWeylTest, BasicAssertions) {
  // the square of the coefficient does not fit in int64
  Poly<int64_t> f{"[1 1]"_exps, {4000000000}};
  Poly<int64_t> g{"[1 1]"_exps, {4000000000}};
  EXPECT_DOUBLE_EQ(weylDot(f, f), 8.0e18);
  EXPECT_DOUBLE_EQ(weylDot(f, g), 8.0e18);
  EXPECT_DOUBLE_EQ(weylNorm(f), std::sqrt(8.0e18));
}

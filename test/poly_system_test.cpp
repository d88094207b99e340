#include "../include/MatrixStringParse.hpp"
#include "../include/Polynomials/PolySystem.hpp"
#include <array>
#include <cmath>
#include <cstdint>
#include <gtest/gtest.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/raw_ostream.h>
#include <string>
#include <type_traits>
#include <utility>

using namespace fixedpoly;

static auto makeSystem() -> PolySystem<int64_t> {
  // x0^2 + x1 - 1, x0 x1 - 2
  Poly<int64_t> f{"[2 0; 0 1; 0 0]"_exps, {1, 1, -1}};
  Poly<int64_t> g{"[1 1; 0 0]"_exps, {1, -2}};
  return {f, g};
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(PolySystemTest, BasicAssertions) {
  PolySystem<int64_t> F = makeSystem();
  llvm::errs() << F << "\n";
  EXPECT_EQ(F.size(), 2);
  EXPECT_EQ(F.numVars(), 2);
  llvm::SmallVector<int64_t> d = F.degrees();
  ASSERT_EQ(d.size(), 2);
  EXPECT_EQ(d[0], 2);
  EXPECT_EQ(d[1], 2);
  EXPECT_FALSE(F.homogenized());
  EXPECT_FALSE(isHomogeneous(F));
  EXPECT_EQ(F[1], (Poly<int64_t>{"[1 1; 0 0]"_exps, {1, -2}}));
  std::string s;
  llvm::raw_string_ostream os{s};
  os << F;
  os.flush();
  EXPECT_EQ(s.find("PolySystem(2 polys, 2 vars: x0 x1)"), 0);
  ASSERT_EQ(F.variables().size(), 2);
  EXPECT_EQ(F.variables()[0], "x0");
  EXPECT_EQ(F.variables()[1], "x1");
  PolySystem<int64_t> empty;
  EXPECT_EQ(empty.size(), 0);
  EXPECT_EQ(empty.numVars(), 0);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(PolySystemEvaluateTest, BasicAssertions) {
  PolySystem<int64_t> F = makeSystem();
  llvm::SmallVector<int64_t> x{1, 2};
  auto y = evaluate(F, x);
  static_assert(std::is_same_v<decltype(y), llvm::SmallVector<int64_t>>);
  ASSERT_EQ(y.size(), 2);
  EXPECT_EQ(y[0], 2);
  EXPECT_EQ(y[1], 0);
  auto z = F(x);
  EXPECT_EQ(z, y);
  std::array<double, 2> out{-1.0, -1.0};
  std::array<double, 2> xd{0.5, 4.0};
  evaluate(out, F, xd);
  EXPECT_DOUBLE_EQ(out[0], 3.25);
  EXPECT_DOUBLE_EQ(out[1], 0.0);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(JacobianTest, BasicAssertions) {
  PolySystem<int64_t> F = makeSystem();
  auto J = differentiate(F);
  ASSERT_EQ(J.size(), 2);
  ASSERT_EQ(J[0].size(), 2);
  ASSERT_EQ(J[1].size(), 2);
  EXPECT_EQ(J[0][0], (Poly<int64_t>{"[1 0]"_exps, {2}}));
  EXPECT_EQ(J[0][1], (Poly<int64_t>{"[0 0]"_exps, {1}}));
  EXPECT_EQ(J[1][0], (Poly<int64_t>{"[0 1]"_exps, {1}}));
  EXPECT_EQ(J[1][1], (Poly<int64_t>{"[1 0]"_exps, {1}}));
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(PolySystemHomogenizeTest, BasicAssertions) {
  PolySystem<int64_t> F = makeSystem();
  PolySystem<int64_t> H = homogenize(F);
  EXPECT_TRUE(H.homogenized());
  EXPECT_TRUE(isHomogeneous(H));
  EXPECT_EQ(H.numVars(), 3);
  EXPECT_EQ(H[1], (Poly<int64_t>{"[0 1 1; 2 0 0]"_exps, {1, -2}}));
  ASSERT_EQ(H.variables().size(), 3);
  EXPECT_EQ(H.variables()[0], "h");
  EXPECT_EQ(H.variables()[1], "x0");
  // already homogenized, so nothing is added
  PolySystem<int64_t> HH = homogenize(H);
  EXPECT_EQ(HH, H);
  EXPECT_TRUE(HH.variables() == H.variables());
  PolySystem<int64_t> D = dehomogenize(H);
  EXPECT_EQ(D, F);
  EXPECT_FALSE(D.homogenized());
  EXPECT_TRUE(D.variables() == F.variables());
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(NamedPolySystemTest, BasicAssertions) {
  PolySystem<int64_t> F = makeSystem();
  llvm::SmallVector<Poly<int64_t>, 0> ps(F.begin(), F.end());
  PolySystem<int64_t> G(std::move(ps), {"u", "v"});
  EXPECT_EQ(G.variables()[0], "u");
  EXPECT_EQ(G.variables()[1], "v");
  // names do not take part in equality
  EXPECT_EQ(G, F);
  std::string s;
  llvm::raw_string_ostream os{s};
  os << G;
  os.flush();
  EXPECT_EQ(s.find("PolySystem(2 polys, 2 vars: u v)"), 0);
  // a system without polynomials still has its variables
  PolySystem<int64_t> E({}, {"a", "b", "c"});
  EXPECT_EQ(E.size(), 0);
  EXPECT_EQ(E.numVars(), 3);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(PolySystemWeylTest, BasicAssertions) {
  PolySystem<int64_t> G{Poly<int64_t>{"[2 0]"_exps, {3}},
                        Poly<int64_t>{"[1 1]"_exps, {2}}};
  EXPECT_DOUBLE_EQ(weylDot(G, G), 11.0);
  EXPECT_DOUBLE_EQ(weylNorm(G), std::sqrt(11.0));
  PolySystem<int64_t> K{Poly<int64_t>{"[2 0]"_exps, {1}},
                        Poly<int64_t>{"[0 2]"_exps, {1}}};
  // 3 * 1 / 1 + 0
  EXPECT_DOUBLE_EQ(weylDot(G, K), 3.0);
}

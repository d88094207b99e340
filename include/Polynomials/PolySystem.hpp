#pragma once
#include "Math/ScalarTraits.hpp"
#include "Polynomials/Calculus.hpp"
#include "Polynomials/Evaluate.hpp"
#include "Polynomials/Homogeneity.hpp"
#include "Polynomials/Poly.hpp"
#include "Polynomials/Weyl.hpp"
#include "TypePromotion.hpp"
#include "Utilities/Invariant.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/raw_ostream.h>
#include <ostream>
#include <ranges>
#include <string>
#include <utility>

namespace fixedpoly {

/// PolySystem
///
/// An ordered collection of polynomials in the same variables. All the
/// algebra is done per polynomial by the `Poly` functions.
/// Variables are named for printing; unnamed ones are `x0`, `x1`, ...
/// Names do not take part in equality.
template <math::Ring T> class PolySystem {
  llvm::SmallVector<Poly<T>, 0> polys;
  llvm::SmallVector<std::string, 0> names;
  size_t nVars{0};

  void checkVariables() {
    for (const Poly<T> &p : polys) utils::invariant(nVars, p.numVars());
    utils::invariant(nVars, names.size());
  }

public:
  using value_type = T;

  PolySystem() = default;
  PolySystem(llvm::SmallVector<Poly<T>, 0> ps) : polys(std::move(ps)) {
    if (!polys.empty()) nVars = polys.front().numVars();
    for (size_t i = 0; i < nVars; ++i)
      names.push_back("x" + std::to_string(i));
    checkVariables();
  }
  PolySystem(llvm::SmallVector<Poly<T>, 0> ps,
             llvm::SmallVector<std::string, 0> variableNames)
    : polys(std::move(ps)), names(std::move(variableNames)),
      nVars(names.size()) {
    checkVariables();
  }
  PolySystem(std::initializer_list<Poly<T>> ps)
    : PolySystem(llvm::SmallVector<Poly<T>, 0>(ps)) {}

  [[nodiscard]] auto polynomials() const -> llvm::ArrayRef<Poly<T>> {
    return polys;
  }
  [[nodiscard]] auto size() const -> size_t { return polys.size(); }
  [[nodiscard]] auto numVars() const -> size_t { return nVars; }
  [[nodiscard]] auto variables() const -> llvm::ArrayRef<std::string> {
    return names;
  }
  [[nodiscard]] auto operator[](size_t i) const -> const Poly<T> & {
    utils::invariant(i < polys.size());
    return polys[i];
  }
  [[nodiscard]] auto begin() const { return polys.begin(); }
  [[nodiscard]] auto end() const { return polys.end(); }
  /// `true` if every polynomial was homogenized
  [[nodiscard]] auto homogenized() const -> bool {
    return std::all_of(polys.begin(), polys.end(),
                       [](const Poly<T> &p) { return p.homogenized(); });
  }
  [[nodiscard]] auto degrees() const -> llvm::SmallVector<int64_t> {
    llvm::SmallVector<int64_t> d;
    d.reserve(polys.size());
    for (const Poly<T> &p : polys) d.push_back(p.degree());
    return d;
  }

  template <std::ranges::random_access_range V>
  [[nodiscard]] auto operator()(const V &x) const {
    return evaluate(*this, x);
  }
  [[nodiscard]] auto operator==(const PolySystem &other) const -> bool {
    return nVars == other.nVars && polys == other.polys;
  }

  friend inline auto operator<<(llvm::raw_ostream &os, const PolySystem &F)
    -> llvm::raw_ostream & {
    os << "PolySystem(" << F.size() << " polys, " << F.nVars << " vars:";
    for (const std::string &name : F.names) os << " " << name;
    os << ")";
    for (const Poly<T> &p : F.polys) os << "\n" << p;
    return os;
  }
  friend inline void PrintTo(const PolySystem &F, std::ostream *os) {
    utils::llvmOStreamPrint(*os, F);
  }
#ifndef NDEBUG
  [[gnu::used]] void dump() const { llvm::errs() << *this << "\n"; }
#endif
};

/// evaluate(out, F, x)
/// Writes `F[i](x)` into `out[i]`.
template <std::ranges::random_access_range O, typename T,
          std::ranges::random_access_range V>
void evaluate(O &&out, const PolySystem<T> &F, const V &x) {
  using R = std::ranges::range_value_t<O>;
  utils::invariant(F.size(), size_t(std::ranges::size(out)));
  for (size_t i = 0, M = F.size(); i < M; ++i) out[i] = R(evaluate(F[i], x));
}
template <typename T, std::ranges::random_access_range V>
[[nodiscard]] auto evaluate(const PolySystem<T> &F, const V &x)
  -> llvm::SmallVector<utils::promote_type_t<T, std::ranges::range_value_t<V>>> {
  llvm::SmallVector<utils::promote_type_t<T, std::ranges::range_value_t<V>>>
    res(F.size());
  evaluate(res, F, x);
  return res;
}

/// differentiate(F)
/// The Jacobian of `F`: row `i` is the gradient of `F[i]`.
template <typename T>
[[nodiscard]] auto differentiate(const PolySystem<T> &F)
  -> llvm::SmallVector<llvm::SmallVector<Poly<T>, 0>, 0> {
  llvm::SmallVector<llvm::SmallVector<Poly<T>, 0>, 0> J;
  J.reserve(F.size());
  for (const Poly<T> &p : F) J.push_back(differentiate(p));
  return J;
}

template <typename T>
[[nodiscard]] auto isHomogeneous(const PolySystem<T> &F) -> bool {
  return std::all_of(F.begin(), F.end(),
                     [](const Poly<T> &p) { return isHomogeneous(p); });
}
/// The slack variable is named `h` and comes first.
template <typename T>
[[nodiscard]] auto homogenize(const PolySystem<T> &F) -> PolySystem<T> {
  if (F.size() && F.homogenized()) return F;
  llvm::SmallVector<Poly<T>, 0> ps;
  ps.reserve(F.size());
  for (const Poly<T> &p : F) ps.push_back(homogenize(p));
  llvm::SmallVector<std::string, 0> names{"h"};
  names.append(F.variables().begin(), F.variables().end());
  return PolySystem<T>(std::move(ps), std::move(names));
}
template <typename T>
[[nodiscard]] auto dehomogenize(const PolySystem<T> &F) -> PolySystem<T> {
  utils::invariant(F.numVars() > 0);
  llvm::SmallVector<Poly<T>, 0> ps;
  ps.reserve(F.size());
  for (const Poly<T> &p : F) ps.push_back(dehomogenize(p));
  llvm::ArrayRef<std::string> vars = F.variables().drop_front();
  llvm::SmallVector<std::string, 0> names(vars.begin(), vars.end());
  return PolySystem<T>(std::move(ps), std::move(names));
}

/// weylDot(F, G) = sum_i <F[i], G[i]>
template <math::WeylScalar T>
[[nodiscard]] auto weylDot(const PolySystem<T> &F, const PolySystem<T> &G)
  -> math::weyl_type_t<T> {
  utils::invariant(F.size(), G.size());
  math::weyl_type_t<T> result{};
  for (size_t i = 0, M = F.size(); i < M; ++i) result += weylDot(F[i], G[i]);
  return result;
}
template <math::WeylScalar T>
[[nodiscard]] auto weylNorm(const PolySystem<T> &F)
  -> math::real_t<math::weyl_type_t<T>> {
  return std::sqrt(math::real(weylDot(F, F)));
}

} // namespace fixedpoly

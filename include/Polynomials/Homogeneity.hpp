#pragma once
#include "Math/Comparisons.hpp"
#include "Polynomials/Poly.hpp"
#include "Utilities/Invariant.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace fixedpoly {

/// isHomogeneous(p)
/// `true` if every term has the same total degree. A polynomial without
/// terms is homogeneous.
template <typename T>
[[nodiscard]] auto isHomogeneous(const Poly<T> &p) -> bool {
  if (!p.termCount()) return true;
  int64_t d = p.degree();
  for (auto t : p)
    if (math::totalDegree(t.exponents) != d) return false;
  return true;
}

/// homogenize(p)
/// Prepends a slack variable whose exponent lifts every term to the
/// maximal total degree. Returns `p` itself if it is already flagged as
/// homogenized.
template <typename T> [[nodiscard]] auto homogenize(const Poly<T> &p) -> Poly<T> {
  if (p.homogenized()) return p;
  const ExponentMatrix &E = p.exponents();
  size_t M = p.termCount(), N = p.numVars();
  int64_t D = 0;
  for (size_t j = 0; j < M; ++j) D = std::max(D, math::totalDegree(E[j]));
  ExponentMatrix H(Row{M}, Col{N + 1});
  for (size_t j = 0; j < M; ++j) {
    auto row = H.row(j);
    row[0] = D - math::totalDegree(E[j]);
    std::copy(E[j].begin(), E[j].end(), row.begin() + 1);
  }
  return Poly<T>{std::move(H), p.coefficients(), true};
}

/// dehomogenize(p)
/// Drops the leading variable. This is a purely structural operation: it
/// does not check that `p` was homogenized, nor that the dropped exponents
/// are consistent with it.
template <typename T>
[[nodiscard]] auto dehomogenize(const Poly<T> &p) -> Poly<T> {
  utils::invariant(p.numVars() > 0);
  return Poly<T>{p.exponents().deleteCol(0), p.coefficients(), false};
}

} // namespace fixedpoly

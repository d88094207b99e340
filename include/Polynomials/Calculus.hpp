#pragma once
#include "Math/Power.hpp"
#include "Polynomials/Poly.hpp"
#include "TypePromotion.hpp"
#include "Utilities/Invariant.hpp"
#include <cstddef>
#include <cstdint>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/DenseMap.h>
#include <llvm/ADT/SmallVector.h>
#include <utility>

namespace fixedpoly {

/// differentiate(p, v)
/// Partial derivative of `p` with respect to the `v`th (zero-based)
/// variable. Terms that do not depend on `v` vanish. The `homogenized`
/// flag is carried over unchanged.
template <typename T>
[[nodiscard]] auto differentiate(const Poly<T> &p, size_t v) -> Poly<T> {
  utils::invariant(v < p.numVars());
  const ExponentMatrix &E = p.exponents();
  ExponentMatrix D(Row{0}, E.numCol());
  D.reserve(E.numRow());
  llvm::SmallVector<T, 4> coefs;
  for (size_t j = 0, M = p.termCount(); j < M; ++j) {
    int64_t k = E(j, v);
    if (!k) continue;
    D.pushRow(E[j]);
    D(size_t(D.numRow()) - 1, v) = k - 1;
    coefs.push_back(p.coefficient(j) * T(k));
  }
  return Poly<T>{std::move(D), coefs, p.homogenized()};
}

/// differentiate(p)
/// The gradient of `p`: one partial derivative per variable, in order.
template <typename T>
[[nodiscard]] auto differentiate(const Poly<T> &p)
  -> llvm::SmallVector<Poly<T>, 0> {
  llvm::SmallVector<Poly<T>, 0> grad;
  grad.reserve(p.numVars());
  for (size_t v = 0, N = p.numVars(); v < N; ++v)
    grad.push_back(differentiate(p, v));
  return grad;
}
template <typename T>
[[nodiscard]] auto gradient(const Poly<T> &p)
  -> llvm::SmallVector<Poly<T>, 0> {
  return differentiate(p);
}

/// substitute(p, v, x)
/// Sets the `v`th (zero-based) variable to `x`, removing it from the
/// polynomial. Terms whose remaining exponents coincide are merged, and the
/// first of them decides where the merged term goes before sorting.
template <typename T, typename S>
[[nodiscard]] auto substitute(const Poly<T> &p, size_t v, S x)
  -> Poly<utils::promote_type_t<T, S>> {
  using R = utils::promote_type_t<T, S>;
  utils::invariant(v < p.numVars());
  const ExponentMatrix &E = p.exponents();
  // all reduced rows are materialized first, so the keys below stay valid
  ExponentMatrix reduced = E.deleteCol(v);
  ExponentMatrix merged(Row{0}, reduced.numCol());
  llvm::SmallVector<R, 4> coefs;
  llvm::DenseMap<llvm::ArrayRef<int64_t>, unsigned> index;
  for (size_t j = 0, M = p.termCount(); j < M; ++j) {
    R c = R(p.coefficient(j)) * math::pow(R(x), E(j, v));
    auto [it, inserted] = index.try_emplace(reduced[j], coefs.size());
    if (inserted) {
      merged.pushRow(reduced[j]);
      coefs.push_back(c);
    } else coefs[it->second] += c;
  }
  return Poly<R>{std::move(merged), coefs, p.homogenized()};
}

} // namespace fixedpoly

#pragma once
#include "Math/Power.hpp"
#include "Polynomials/Poly.hpp"
#include "TypePromotion.hpp"
#include "Utilities/Invariant.hpp"
#include <cstddef>
#include <cstdint>
#include <llvm/ADT/ArrayRef.h>
#include <ranges>

namespace fixedpoly {

/// evaluate(p, x) = sum_j c_j * prod_i x_i^e_ji
/// The result is accumulated in the promotion of the coefficient type and
/// the element type of `x`; a polynomial without terms evaluates to zero.
template <typename T, std::ranges::random_access_range V>
[[nodiscard]] auto evaluate(const Poly<T> &p, const V &x)
  -> utils::promote_type_t<T, std::ranges::range_value_t<V>> {
  using R = utils::promote_type_t<T, std::ranges::range_value_t<V>>;
  size_t N = p.numVars();
  utils::invariant(N, size_t(std::ranges::size(x)));
  const ExponentMatrix &E = p.exponents();
  llvm::ArrayRef<T> C = p.coefficients();
  R res{};
  for (size_t j = 0, M = p.termCount(); j < M; ++j) {
    R term = R(C[j]);
    for (size_t i = 0; i < N; ++i) term *= math::pow(R(x[i]), E(j, i));
    res += term;
  }
  return res;
}

} // namespace fixedpoly

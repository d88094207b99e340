#pragma once
#include "Math/Combinatorics.hpp"
#include "Math/ScalarTraits.hpp"
#include "Polynomials/Poly.hpp"
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace fixedpoly {
using math::multinomial;

/// weylDot(f, g)
///
/// Bombieri-Weyl inner product of `f` and `g`,
///   <f, g> = sum_e f_e * conj(g_e) / multinomial(e)
/// summed over the exponent vectors `e` appearing in `f`.
/// `f` and `g` are assumed to be homogeneous in the same variables; this is
/// not checked. Passing the same object twice sums |f_e|^2 directly instead
/// of matching terms. Integral coefficients are widened before any product.
/// See https://en.wikipedia.org/wiki/Bombieri_norm
template <math::WeylScalar T>
[[nodiscard]] auto weylDot(const Poly<T> &f, const Poly<T> &g)
  -> math::weyl_type_t<T> {
  using R = math::weyl_type_t<T>;
  R result{};
  if (&f == &g) {
    for (auto [c, e] : f) result += R(math::abs2(R(c))) / R(multinomial(e));
    return result;
  }
  for (auto [cf, ef] : f) {
    R normalizer = R(multinomial(ef));
    for (auto [cg, eg] : g) {
      if (ef != eg) continue;
      result += R(cf) * R(math::conj(cg)) / normalizer;
      break;
    }
  }
  return result;
}

/// weylNorm(f) = sqrt(<f, f>)
template <math::WeylScalar T>
[[nodiscard]] auto weylNorm(const Poly<T> &f)
  -> math::real_t<math::weyl_type_t<T>> {
  return std::sqrt(math::real(weylDot(f, f)));
}

} // namespace fixedpoly

#pragma once
#include "Utilities/Invariant.hpp"
#include <cstdint>

namespace fixedpoly::math {

/// x^k for k >= 0 by repeated squaring; x^0 == T{1} for every x.
template <typename T> constexpr auto pow(T x, int64_t k) -> T {
  utils::invariant(k >= 0);
  T r{1};
  for (; k; k >>= 1) {
    if (k & 1) r *= x;
    if (k > 1) x *= x;
  }
  return r;
}

static_assert(pow(int64_t(3), 4) == 81);
static_assert(pow(int64_t(0), 0) == 1);
static_assert(pow(2.0, 10) == 1024.0);

} // namespace fixedpoly::math

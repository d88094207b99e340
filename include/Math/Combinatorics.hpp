#pragma once
#include "Utilities/Invariant.hpp"
#include <cstdint>
#include <limits>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/MathExtras.h>

namespace fixedpoly::math {

constexpr auto widen(int64_t x) -> __int128_t { return x; }

/// binomial(n, k); the result must fit in `int64_t`
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
constexpr auto binomial(int64_t n, int64_t k) -> int64_t {
  if ((k < 0) || (k > n)) return 0;
  if (k > n - k) k = n - k;
  int64_t r = 1;
  // r * (n - i) is always divisible by (i + 1); r grows with i, so checking
  // every step checks the result
  for (int64_t i = 0; i < k; ++i) {
    __int128_t q = (widen(r) * (n - i)) / (i + 1);
    utils::invariant(q <= std::numeric_limits<int64_t>::max());
    r = int64_t(q);
  }
  return r;
}

/// multinomial(k) = (sum(k))! / prod(k_i!)
/// built from binomials so that no factorial is ever formed; the result
/// must fit in `int64_t`
inline auto multinomial(llvm::ArrayRef<int64_t> k) -> int64_t {
  int64_t s = 0;
  int64_t result = 1;
  for (int64_t i : k) {
    utils::invariant(i >= 0);
    s += i;
    bool overflow = llvm::MulOverflow(result, binomial(s, i), result);
    utils::invariant(!overflow);
  }
  return result;
}

static_assert(binomial(5, 2) == 10);
static_assert(binomial(4, 0) == 1);
static_assert(binomial(2, 3) == 0);
static_assert(binomial(62, 31) == 465428353255261088);

} // namespace fixedpoly::math

#pragma once
#include <algorithm>
#include <compare>
#include <cstdint>
#include <llvm/ADT/ArrayRef.h>
#include <numeric>

namespace fixedpoly::math {

constexpr auto allGEZero(const auto &x) -> bool {
  return std::all_of(x.begin(), x.end(), [](auto a) { return a >= 0; });
}

inline auto totalDegree(llvm::ArrayRef<int64_t> a) -> int64_t {
  return std::reduce(a.begin(), a.end(), int64_t(0));
}

/// Graded lexicographic comparison of two exponent vectors: total degree
/// first, then the first differing entry from the left.
inline auto compareByDegree(llvm::ArrayRef<int64_t> a,
                            llvm::ArrayRef<int64_t> b) -> std::strong_ordering {
  if (auto c = totalDegree(a) <=> totalDegree(b); c != 0) return c;
  for (size_t i = 0, N = std::min(a.size(), b.size()); i < N; ++i)
    if (a[i] != b[i]) return a[i] <=> b[i];
  return a.size() <=> b.size();
}
/// `true` if `a` sorts strictly before `b` in canonical (descending) order.
inline auto totalDegreeGreater(llvm::ArrayRef<int64_t> a,
                               llvm::ArrayRef<int64_t> b) -> bool {
  return compareByDegree(a, b) > 0;
}

} // namespace fixedpoly::math

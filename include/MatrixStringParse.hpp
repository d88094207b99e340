#pragma once

#include "Math/AxisTypes.hpp"
#include "Math/ExponentMatrix.hpp"
#include "Utilities/Invariant.hpp"
#include <cstddef>
#include <cstdint>
#include <llvm/ADT/SmallVector.h>

namespace fixedpoly {

constexpr auto cstoll(const char *s, size_t &cur) -> int64_t {
  int64_t res = 0;
  bool neg = false;
  while (s[cur] == ' ') ++cur;
  if (s[cur] == '-') {
    neg = true;
    ++cur;
  }
  while (s[cur] >= '0' && s[cur] <= '9') {
    res = res * 10 + (s[cur] - '0');
    ++cur;
  }
  return neg ? -res : res;
}

/// "[3 1 0; 1 1 2]"_exps is the exponent matrix with one term per row.
[[nodiscard]] inline auto operator"" _exps(const char *s, size_t)
  -> math::ExponentMatrix {
  utils::invariant(s[0] == '[');
  llvm::SmallVector<int64_t, 16> content;
  size_t cur = 1;
  size_t numRows = 1;
  while (s[cur] != ']') {
    char c = s[cur];
    if (c == ' ') {
      ++cur;
      continue;
    } else if (c == ';') {
      numRows += 1;
      ++cur;
      continue;
    }
    size_t start = cur;
    content.push_back(cstoll(s, cur));
    utils::invariant(cur != start);
  }
  size_t numCols = content.size() / numRows;
  utils::invariant(content.size() % numRows == 0);
  return {math::Row{numRows}, math::Col{numCols}, content};
}

} // namespace fixedpoly

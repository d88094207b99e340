#pragma once

#include "Math/AxisTypes.hpp"
#include "Utilities/Invariant.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/raw_os_ostream.h>
#include <llvm/Support/raw_ostream.h>
#include <ostream>

namespace fixedpoly::math {

/// Dense row-major matrix of exponents.
/// Row `i` holds the exponent vector of term `i`, so a term's exponents are
/// contiguous and can be handed out as an `llvm::ArrayRef`.
/// The column count is kept even when there are no rows, so that an empty
/// polynomial still knows how many variables it has.
class ExponentMatrix {
  llvm::SmallVector<int64_t, 16> mem;
  size_t M{0};
  size_t N{0};

public:
  using value_type = int64_t;
  ExponentMatrix() = default;
  ExponentMatrix(Row m, Col n) : mem(*m * *n, 0), M(*m), N(*n) {}
  ExponentMatrix(Row m, Col n, llvm::ArrayRef<int64_t> data)
    : mem(data.begin(), data.end()), M(*m), N(*n) {
    utils::invariant(*m * *n, data.size());
  }

  [[nodiscard]] auto numRow() const -> Row { return M; }
  [[nodiscard]] auto numCol() const -> Col { return N; }
  [[nodiscard]] auto empty() const -> bool { return M == 0; }
  [[nodiscard]] auto data() const -> llvm::ArrayRef<int64_t> { return mem; }

  auto operator()(size_t r, size_t c) -> int64_t & {
    utils::invariant(r < M);
    utils::invariant(c < N);
    return mem[r * N + c];
  }
  auto operator()(size_t r, size_t c) const -> int64_t {
    utils::invariant(r < M);
    utils::invariant(c < N);
    return mem[r * N + c];
  }
  /// the exponent vector of term `r`
  auto operator[](size_t r) const -> llvm::ArrayRef<int64_t> {
    utils::invariant(r < M);
    return {mem.data() + r * N, N};
  }
  auto row(size_t r) -> llvm::MutableArrayRef<int64_t> {
    utils::invariant(r < M);
    return {mem.data() + r * N, N};
  }
  void pushRow(llvm::ArrayRef<int64_t> x) {
    utils::invariant(N, x.size());
    mem.append(x.begin(), x.end());
    ++M;
  }
  void reserve(Row m) { mem.reserve(*m * N); }

  /// Copy of the matrix with column `c` removed.
  [[nodiscard]] auto deleteCol(size_t c) const -> ExponentMatrix {
    utils::invariant(c < N);
    ExponentMatrix A(Row{M}, Col{N - 1});
    for (size_t m = 0; m < M; ++m) {
      auto src = (*this)[m];
      auto dst = A.row(m);
      std::copy(src.begin(), src.begin() + c, dst.begin());
      std::copy(src.begin() + c + 1, src.end(), dst.begin() + c);
    }
    return A;
  }
  /// Copy of the matrix with the rows reordered so that row `i` of the
  /// result is row `perm[i]` of `*this`.
  [[nodiscard]] auto permuteRows(llvm::ArrayRef<unsigned> perm) const
    -> ExponentMatrix {
    utils::invariant(M, perm.size());
    ExponentMatrix A;
    A.N = N;
    A.mem.reserve(mem.size());
    for (unsigned p : perm) A.pushRow((*this)[p]);
    return A;
  }

  [[nodiscard]] auto operator==(const ExponentMatrix &other) const -> bool {
    return M == other.M && N == other.N && mem == other.mem;
  }

  friend inline auto operator<<(llvm::raw_ostream &os, const ExponentMatrix &A)
    -> llvm::raw_ostream & {
    if ((!A.M) || (!A.N)) return os << "[ ]";
    // exponents are non-negative, so the widest entry decides the padding
    llvm::SmallVector<unsigned, 8> maxDigits(A.N, 1);
    for (size_t i = 0; i < A.M; ++i)
      for (size_t j = 0; j < A.N; ++j)
        maxDigits[j] = std::max(maxDigits[j], countDigits(A(i, j)));
    for (size_t i = 0; i < A.M; ++i) {
      if (i) os << "  ";
      else os << "\n[ ";
      for (size_t j = 0; j < A.N; ++j) {
        int64_t Aij = A(i, j);
        os.indent(maxDigits[j] - countDigits(Aij));
        os << Aij;
        if (j != A.N - 1) os << " ";
        else if (i != A.M - 1) os << "\n";
      }
    }
    return os << " ]";
  }
  friend inline void PrintTo(const ExponentMatrix &A, std::ostream *os) {
    llvm::raw_os_ostream llos{*os};
    llos << A;
  }
#ifndef NDEBUG
  [[gnu::used]] void dump() const {
    llvm::errs() << "Size: " << numRow() << ", " << numCol() << *this << "\n";
  }
#endif

private:
  static auto countDigits(int64_t x) -> unsigned {
    unsigned d = x < 0 ? 2 : 1;
    for (x = x < 0 ? -x : x; x >= 10; x /= 10) ++d;
    return d;
  }
};

} // namespace fixedpoly::math

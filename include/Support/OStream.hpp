#pragma once

#include <concepts>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/raw_ostream.h>
#include <ostream>
#include <sstream>
#include <string_view>

namespace fixedpoly::utils {

template <typename T>
concept Printable = requires(llvm::raw_ostream &os, T x) {
  { os << x } -> std::same_as<llvm::raw_ostream &>;
};

// we go through ostringstream to adapt `std::ostream` print methods to
// `llvm::raw_ostream`, e.g. for `std::complex`
template <typename T>
inline auto printScalar(llvm::raw_ostream &os, const T &x)
  -> llvm::raw_ostream & {
  if constexpr (Printable<T>) return os << x;
  else {
    std::ostringstream sos;
    sos << x;
    return os << sos.str();
  }
}
inline void llvmOStreamPrint(std::ostream &os, const auto &x) {
  llvm::SmallVector<char> buff;
  llvm::raw_svector_ostream llos{buff};
  llos << x;
  os << std::string_view(llos.str());
}

} // namespace fixedpoly::utils

#pragma once

#include <llvm/Support/raw_ostream.h>

#ifndef NDEBUG
#include <cstdlib>
#include <source_location>
#include <string>
#endif

/// Precondition checks for the polynomial operations.
///
/// Debug builds report the failed check, with the caller's location, on
/// `llvm::errs()` and abort. Under `NDEBUG` a failed check is unreachable.
namespace fixedpoly::utils {
#ifndef NDEBUG
[[noreturn]] inline void reportViolation(llvm::StringRef detail,
                                         std::source_location location) {
  llvm::errs() << "invariant violation" << detail << "\n  at "
               << location.file_name() << ":" << location.line() << ":"
               << location.column() << " in `" << location.function_name()
               << "`\n";
  std::abort();
}
template <typename T>
[[noreturn]] void reportMismatch(const T &expected, const T &actual,
                                 std::source_location location) {
  std::string detail;
  llvm::raw_string_ostream os{detail};
  os << ": dimension mismatch, " << expected << " != " << actual;
  reportViolation(os.str(), location);
}

[[gnu::artificial]] constexpr inline void
invariant(bool condition,
          std::source_location location = std::source_location::current()) {
  if (!condition) reportViolation("", location);
}
/// Two extents that must agree, e.g. the length of an evaluation point and
/// the variable count. Both are named in the report.
template <typename T>
[[gnu::artificial]] constexpr inline void
invariant(const T &expected, const T &actual,
          std::source_location location = std::source_location::current()) {
  if (expected != actual) reportMismatch(expected, actual, location);
}
#else
[[gnu::artificial]] constexpr inline void invariant(bool condition) {
  if (!condition) __builtin_unreachable();
}
template <typename T>
[[gnu::artificial]] constexpr inline void invariant(const T &expected,
                                                    const T &actual) {
  if (expected != actual) __builtin_unreachable();
}
#endif
} // namespace fixedpoly::utils

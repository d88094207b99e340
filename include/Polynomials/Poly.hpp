#pragma once
// We'll follow Julia style, so anything that's not a constructor, destructor,
// nor an operator will be outside of the struct/class.

#include "Math/AxisTypes.hpp"
#include "Math/Comparisons.hpp"
#include "Math/ExponentMatrix.hpp"
#include "Math/ScalarTraits.hpp"
#include "Support/OStream.hpp"
#include "TypePromotion.hpp"
#include "Utilities/Invariant.hpp"
#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/raw_ostream.h>
#include <numeric>
#include <ostream>
#include <ranges>
#include <utility>

namespace fixedpoly {
using math::Col;
using math::ExponentMatrix;
using math::Row;

/// One summand of a `Poly`, viewed in place.
template <typename T> struct Term {
  const T &coefficient;
  llvm::ArrayRef<int64_t> exponents;
};

/// Poly
///
/// Sparse multivariate polynomial for fast evaluation.
/// Row `i` of `exponents` is the exponent vector of term `i`, and
/// `coefficients[i]` its coefficient. Terms are kept sorted descending by
/// total degree, ties broken lexicographically (see `compareByDegree`),
/// e.g. `3XYZ^2 - 2X^3Y` is stored as
///
///   exponents:    [ 3 1 0
///                   1 1 2 ]
///   coefficients: [ -2, 3 ]
///
/// The `homogenized` flag records whether `homogenize` introduced a leading
/// slack variable. It is never re-derived from the exponents.
///
/// A `Poly` is never modified after construction; every operation returns
/// a new one.
template <math::Ring T> class Poly {
  ExponentMatrix exps;
  llvm::SmallVector<T, 4> coeffs;
  bool isHomogenized{false};

  void canonicalize() {
    utils::invariant(size_t(exps.numRow()), coeffs.size());
    utils::invariant(math::allGEZero(exps.data()));
    size_t M = coeffs.size();
    llvm::SmallVector<unsigned, 16> perm(M);
    std::iota(perm.begin(), perm.end(), 0U);
    // stable, so that exact duplicates keep their input order
    std::stable_sort(perm.begin(), perm.end(), [&](unsigned i, unsigned j) {
      return math::totalDegreeGreater(exps[i], exps[j]);
    });
    if (std::is_sorted(perm.begin(), perm.end())) return;
    exps = exps.permuteRows(perm);
    llvm::SmallVector<T, 4> sorted;
    sorted.reserve(M);
    for (unsigned p : perm) sorted.push_back(std::move(coeffs[p]));
    coeffs = std::move(sorted);
  }

public:
  using value_type = T;

  class TermIterator {
    const Poly *p{nullptr};
    size_t i{0};

  public:
    using value_type = Term<T>;
    using difference_type = ptrdiff_t;
    using iterator_category = std::forward_iterator_tag;
    TermIterator() = default;
    TermIterator(const Poly *q, size_t j) : p(q), i(j) {}
    auto operator*() const -> Term<T> { return {p->coeffs[i], p->exps[i]}; }
    auto operator++() -> TermIterator & {
      ++i;
      return *this;
    }
    auto operator++(int) -> TermIterator {
      TermIterator t{*this};
      ++i;
      return t;
    }
    auto operator==(const TermIterator &other) const -> bool {
      return i == other.i;
    }
  };

  Poly() = default;
  /// A polynomial with no terms in `numVars` variables.
  explicit Poly(Col numVars) : exps(Row{0}, numVars) {}
  Poly(ExponentMatrix exponents, std::initializer_list<T> coefficients,
       bool homogenized = false)
    : exps(std::move(exponents)), coeffs(coefficients),
      isHomogenized(homogenized) {
    canonicalize();
  }
  /// Coefficients of any type convertible to `T` are widened here.
  template <std::ranges::input_range R>
  requires(std::convertible_to<std::ranges::range_value_t<R>, T>)
  Poly(ExponentMatrix exponents, const R &coefficients,
       bool homogenized = false)
    : exps(std::move(exponents)), isHomogenized(homogenized) {
    for (const auto &c : coefficients) coeffs.push_back(T(c));
    canonicalize();
  }
  /// The monomial `coefficient * x^exponent`.
  Poly(llvm::ArrayRef<int64_t> exponent, T coefficient,
       bool homogenized = false)
    : exps(Row{1}, Col{exponent.size()}, exponent), coeffs({coefficient}),
      isHomogenized(homogenized) {
    utils::invariant(math::allGEZero(exponent));
  }
  template <std::convertible_to<T> U>
  requires(!std::same_as<U, T>)
  explicit Poly(const Poly<U> &p)
    : exps(p.exponents()), isHomogenized(p.homogenized()) {
    coeffs.reserve(p.termCount());
    for (const U &c : p.coefficients()) coeffs.push_back(T(c));
  }

  [[nodiscard]] auto exponents() const -> const ExponentMatrix & {
    return exps;
  }
  [[nodiscard]] auto coefficients() const -> llvm::ArrayRef<T> {
    return coeffs;
  }
  [[nodiscard]] auto homogenized() const -> bool { return isHomogenized; }
  [[nodiscard]] auto termCount() const -> size_t { return coeffs.size(); }
  [[nodiscard]] auto numVars() const -> size_t {
    return size_t(exps.numCol());
  }
  /// exponent vector of the `i`th term
  [[nodiscard]] auto exponent(size_t i) const -> llvm::ArrayRef<int64_t> {
    return exps[i];
  }
  [[nodiscard]] auto coefficient(size_t i) const -> const T & {
    utils::invariant(i < coeffs.size());
    return coeffs[i];
  }
  /// Total degree of the leading term; 0 when there are no terms.
  [[nodiscard]] auto degree() const -> int64_t {
    return exps.empty() ? 0 : math::totalDegree(exps[0]);
  }

  [[nodiscard]] auto begin() const -> TermIterator { return {this, 0}; }
  [[nodiscard]] auto end() const -> TermIterator {
    return {this, coeffs.size()};
  }
  [[nodiscard]] auto size() const -> size_t { return coeffs.size(); }

  /// Structural equality of the canonical representations. The
  /// `homogenized` flag does not participate.
  [[nodiscard]] auto operator==(const Poly &other) const -> bool {
    return exps == other.exps && coeffs == other.coeffs;
  }

  // defined in `Polynomials/Evaluate.hpp`
  template <std::ranges::random_access_range V>
  [[nodiscard]] auto operator()(const V &x) const {
    return evaluate(*this, x);
  }

  friend inline auto operator<<(llvm::raw_ostream &os, const Poly &p)
    -> llvm::raw_ostream & {
    os << "Poly(" << p.termCount() << " terms, " << p.numVars() << " vars";
    if (p.isHomogenized) os << ", homogenized";
    os << ")\ncoefficients: [";
    for (size_t i = 0; i < p.coeffs.size(); ++i) {
      if (i) os << ", ";
      utils::printScalar(os, p.coeffs[i]);
    }
    return os << "]\nexponents:" << p.exps;
  }
  friend inline void PrintTo(const Poly &p, std::ostream *os) {
    utils::llvmOStreamPrint(*os, p);
  }
#ifndef NDEBUG
  [[gnu::used]] void dump() const { llvm::errs() << *this << "\n"; }
#endif
};

template <std::ranges::input_range R>
Poly(ExponentMatrix, const R &) -> Poly<std::ranges::range_value_t<R>>;
template <std::ranges::input_range R>
Poly(ExponentMatrix, const R &, bool) -> Poly<std::ranges::range_value_t<R>>;

template <typename P> using coefficient_type_t = utils::eltype_t<P>;

static_assert(std::same_as<coefficient_type_t<Poly<double>>, double>);

} // namespace fixedpoly

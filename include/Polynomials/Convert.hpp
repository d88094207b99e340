#pragma once
#include "Polynomials/Poly.hpp"
#include "Polynomials/PolySystem.hpp"
#include "Support/OStream.hpp"
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/raw_ostream.h>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>

namespace fixedpoly {

// Any term-wise polynomial representation is accepted as long as, through
// argument dependent lookup, `terms(p)` lists its terms, and for each term
// `t`, `coefficient(t)` and `degree(t, var)` are defined.
template <typename P>
using term_range_t = decltype(terms(std::declval<const P &>()));
template <typename P>
using term_t = std::ranges::range_reference_t<term_range_t<P>>;

template <typename P, typename V>
concept TermwisePolynomial = requires(const P &p) {
  { terms(p) } -> std::ranges::input_range;
} && requires(term_t<P> t, const V &var) {
  coefficient(t);
  { degree(t, var) } -> std::convertible_to<int64_t>;
};

template <typename P>
using external_coefficient_t =
  std::remove_cvref_t<decltype(coefficient(std::declval<term_t<P>>()))>;

/// fromPolynomial<C>(p, vars)
/// Reads the terms of `p` with respect to the variable order `vars`: term
/// `j` gets the coefficient of the `j`th term of `p` converted to `C`, and
/// exponent `i` is the degree of `vars[i]` in it.
template <typename C, typename P, std::ranges::random_access_range Vars>
requires(TermwisePolynomial<P, std::ranges::range_value_t<Vars>>)
[[nodiscard]] auto fromPolynomial(const P &p, const Vars &vars) -> Poly<C> {
  size_t N = std::ranges::size(vars);
  ExponentMatrix E(Row{0}, Col{N});
  llvm::SmallVector<C, 4> coefs;
  llvm::SmallVector<int64_t, 8> e(N);
  for (auto &&t : terms(p)) {
    coefs.push_back(C(coefficient(t)));
    for (size_t i = 0; i < N; ++i) e[i] = degree(t, vars[i]);
    E.pushRow(e);
  }
  return Poly<C>{std::move(E), coefs, false};
}
template <typename P, std::ranges::random_access_range Vars>
requires(TermwisePolynomial<P, std::ranges::range_value_t<Vars>>)
[[nodiscard]] auto fromPolynomial(const P &p, const Vars &vars) {
  return fromPolynomial<external_coefficient_t<P>>(p, vars);
}
/// Uses the variables of `p`, in the order `variables(p)` lists them.
template <typename P>
[[nodiscard]] auto fromPolynomial(const P &p)
  -> decltype(fromPolynomial(p, variables(p))) {
  return fromPolynomial(p, variables(p));
}

/// fromPolynomials<C>(ps, vars)
/// The system of the polynomials `ps`, all read in the variable order `vars`.
/// Each variable is named the way it prints.
template <typename C, std::ranges::input_range Ps,
          std::ranges::random_access_range Vars>
requires(TermwisePolynomial<std::ranges::range_value_t<Ps>,
                            std::ranges::range_value_t<Vars>>)
[[nodiscard]] auto fromPolynomials(const Ps &ps, const Vars &vars)
  -> PolySystem<C> {
  llvm::SmallVector<Poly<C>, 0> polys;
  for (const auto &p : ps) polys.push_back(fromPolynomial<C>(p, vars));
  llvm::SmallVector<std::string, 0> names;
  names.reserve(std::ranges::size(vars));
  for (const auto &v : vars) {
    std::string name;
    llvm::raw_string_ostream os{name};
    utils::printScalar(os, v);
    names.push_back(os.str());
  }
  return PolySystem<C>(std::move(polys), std::move(names));
}
template <std::ranges::input_range Ps, std::ranges::random_access_range Vars>
requires(TermwisePolynomial<std::ranges::range_value_t<Ps>,
                            std::ranges::range_value_t<Vars>>)
[[nodiscard]] auto fromPolynomials(const Ps &ps, const Vars &vars) {
  return fromPolynomials<
    external_coefficient_t<std::ranges::range_value_t<Ps>>>(ps, vars);
}

} // namespace fixedpoly

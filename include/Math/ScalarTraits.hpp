#pragma once
#include "TypePromotion.hpp"
#include <cmath>
#include <complex>
#include <concepts>
#include <cstdint>
#include <type_traits>

namespace fixedpoly::math {

/// Coefficient ring: `+`, `*`, an additive identity `T{}`, and integers
/// embedded via construction (`T{1}` is the multiplicative identity).
template <typename T>
concept Ring = std::regular<T> && requires(T x, T y) {
  { x + y } -> std::convertible_to<T>;
  { x * y } -> std::convertible_to<T>;
  { x += y };
  { x *= y };
} && std::constructible_from<T, int64_t>;

// always call these qualified; ADL would otherwise also find `std::conj`
constexpr auto conj(std::integral auto x) { return x; }
constexpr auto conj(std::floating_point auto x) { return x; }
constexpr auto conj(utils::Complex auto x) { return std::conj(x); }

constexpr auto real(std::integral auto x) { return x; }
constexpr auto real(std::floating_point auto x) { return x; }
constexpr auto real(utils::Complex auto x) { return x.real(); }

constexpr auto abs2(std::integral auto x) { return x * x; }
constexpr auto abs2(std::floating_point auto x) { return x * x; }
constexpr auto abs2(utils::Complex auto x) { return std::norm(x); }

/// Scalars for which the Bombieri-Weyl form is defined.
template <typename T>
concept WeylScalar = Ring<T> && requires(T x) {
  { math::conj(x) } -> std::convertible_to<T>;
  math::abs2(x);
  math::real(x);
};

// integer coefficients are divided by multinomials, so go through `double`
template <typename T> struct WeylType {
  using value_type = T;
};
template <std::integral T> struct WeylType<T> {
  using value_type = double;
};
template <typename T> using weyl_type_t = typename WeylType<T>::value_type;

template <typename T> struct RealType {
  using value_type = T;
};
template <typename T> struct RealType<std::complex<T>> {
  using value_type = T;
};
template <typename T> using real_t = typename RealType<T>::value_type;

static_assert(Ring<int64_t>);
static_assert(Ring<double>);
static_assert(WeylScalar<std::complex<double>>);
static_assert(std::is_same_v<weyl_type_t<int64_t>, double>);
static_assert(std::is_same_v<real_t<weyl_type_t<std::complex<float>>>, float>);

} // namespace fixedpoly::math

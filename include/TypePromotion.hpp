#pragma once
#include <complex>
#include <concepts>
#include <cstdint>
#include <type_traits>

namespace fixedpoly::utils {

template <typename T>
concept HasEltype = requires(T) {
  std::is_scalar_v<typename std::remove_reference_t<T>::value_type>;
};

template <typename A> struct GetEltype {
  using value_type = A;
};
template <HasEltype A> struct GetEltype<A> {
  using value_type = typename A::value_type;
};

template <typename T>
using eltype_t = typename GetEltype<std::remove_reference_t<T>>::value_type;

template <typename T> struct IsComplex : std::false_type {};
template <typename T> struct IsComplex<std::complex<T>> : std::true_type {};
template <typename T>
concept Complex = IsComplex<std::remove_cvref_t<T>>::value;
template <typename T>
concept Arithmetic = std::is_arithmetic_v<T>;

template <typename A, typename B> struct PromoteType {
  using value_type = decltype(std::declval<A>() + std::declval<B>());
};
template <std::signed_integral A, std::signed_integral B>
struct PromoteType<A, B> {
  using value_type = std::conditional_t<sizeof(A) >= sizeof(B), A, B>;
};
template <std::unsigned_integral A, std::unsigned_integral B>
struct PromoteType<A, B> {
  using value_type = std::conditional_t<sizeof(A) >= sizeof(B), A, B>;
};
template <std::signed_integral A, std::unsigned_integral B>
struct PromoteType<A, B> {
  using value_type = A;
};
template <std::unsigned_integral A, std::signed_integral B>
struct PromoteType<A, B> {
  using value_type = B;
};
template <std::floating_point A, std::integral B> struct PromoteType<A, B> {
  using value_type = A;
};
template <std::integral A, std::floating_point B> struct PromoteType<A, B> {
  using value_type = B;
};
template <std::floating_point A, std::floating_point B>
struct PromoteType<A, B> {
  using value_type = decltype(A() + B());
};
template <typename A, typename B>
using promote_type_t = typename PromoteType<A, B>::value_type;

// `std::complex` only mixes with its own value type, so route everything
// through the promoted real type.
template <typename A, typename B>
struct PromoteType<std::complex<A>, std::complex<B>> {
  using value_type = std::complex<promote_type_t<A, B>>;
};
template <typename A, Arithmetic B> struct PromoteType<std::complex<A>, B> {
  using value_type = std::complex<promote_type_t<A, B>>;
};
template <Arithmetic A, typename B> struct PromoteType<A, std::complex<B>> {
  using value_type = std::complex<promote_type_t<A, B>>;
};

static_assert(std::is_same_v<promote_type_t<int64_t, double>, double>);
static_assert(std::is_same_v<promote_type_t<int, int64_t>, int64_t>);
static_assert(std::is_same_v<promote_type_t<int64_t, std::complex<double>>,
                             std::complex<double>>);
static_assert(std::is_same_v<promote_type_t<std::complex<float>, double>,
                             std::complex<double>>);

} // namespace fixedpoly::utils

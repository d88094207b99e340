#pragma once
#include <cstddef>
#include <llvm/Support/raw_ostream.h>
#include <type_traits>

/// Strong typing for exponent matrix extents.
///
/// Exponent matrices are indexed by term (`Row`) and variable (`Col`).
/// Wrapping the sizes keeps `ExponentMatrix(Row{terms}, Col{vars})` from
/// silently accepting swapped arguments.
namespace fixedpoly::math {
enum class AxisType {
  Row,
  Column,
};

template <AxisType T> struct Extent {
  size_t value{0};
  constexpr Extent() = default;
  constexpr Extent(size_t v) : value(v) {}
  explicit constexpr operator size_t() const { return value; }
  constexpr auto operator*() const -> size_t { return value; }

  friend inline auto operator<<(llvm::raw_ostream &os, Extent x)
    -> llvm::raw_ostream & {
    return os << (T == AxisType::Row ? "Row{" : "Col{") << x.value << "}";
  }
};
using Row = Extent<AxisType::Row>;
using Col = Extent<AxisType::Column>;

static_assert(std::is_trivially_copyable_v<Row>);
static_assert(sizeof(Col) == sizeof(size_t));

} // namespace fixedpoly::math

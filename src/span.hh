#pragma once

#include <span>

#include "int.hh"

namespace chacha {

constexpr Size DynamicExtent = std::dynamic_extent;

// Wrapper around std::span with some quality-of-life improvements.
template <class T = char, Size Extent = DynamicExtent>
struct Span : std::span<T, Extent> {
  using std::span<T, Extent>::span;

  template <Size ExtentRhs>
  constexpr inline Span(std::span<T, ExtentRhs> s) : std::span<T, Extent>(s) {}

  template <Size ExtentRhs>
  inline Span& operator=(const std::span<T, ExtentRhs>& rhs) {
    std::span<T, Extent>::operator=(rhs);
    return *this;
  }

  auto RemovePrefix(Size n) {
    *this = this->subspan(n);
    return *this;
  }
};

}  // namespace chacha

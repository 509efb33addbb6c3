#pragma once

#include <array>

#include "span.hh"

namespace chacha {

// Wrapper around std::array.
//
// Arr converts implicitly to `Span<T, N>` and `Span<T>` through the std::span
// constructors.
template <typename T, Size N>
struct Arr : std::array<T, N> {};

}  // namespace chacha

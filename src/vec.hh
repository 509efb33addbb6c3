#pragma once

#include <vector>

#include "span.hh"

namespace chacha {

template <typename T = char>
struct Vec : std::vector<T> {
  using std::vector<T>::vector;

  // Appends every element of the given span at the end of this vector.
  void AppendRange(Span<const T> range) { this->insert(this->end(), range.begin(), range.end()); }
};

}  // namespace chacha

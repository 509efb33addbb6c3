#pragma once

#include "int.hh"
#include "span.hh"
#include "str.hh"
#include "vec.hh"

namespace chacha {

using MemView = Span<U8>;

using MemBuf = Vec<U8>;

inline MemView MemViewOf(Str &s) { return MemView((U8 *)s.data(), s.size()); }

inline Span<const U8> MemViewOf(StrView s) {
  return Span<const U8>((const U8 *)s.data(), s.size());
}

inline StrView StrViewOf(Span<const U8> mem) {
  return StrView((const char *)mem.data(), mem.size());
}

} // namespace chacha

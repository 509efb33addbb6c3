#pragma once

#include "arr.hh"
#include "int.hh"
#include "span.hh"
#include "status.hh"

namespace chacha {

// Explicit little-endian codec for 32-bit words.
//
// The conversions are built from shifts and ORs so they behave the same on
// every host regardless of its native byte order.

constexpr U32 BytesToWordLE(U8 b0, U8 b1, U8 b2, U8 b3) {
  return (U32)b0 | ((U32)b1 << 8) | ((U32)b2 << 16) | ((U32)b3 << 24);
}

constexpr Arr<U8, 4> WordToBytesLE(U32 word) {
  return {{(U8)(word & 0xff), (U8)((word >> 8) & 0xff), (U8)((word >> 16) & 0xff),
           (U8)((word >> 24) & 0xff)}};
}

static_assert(BytesToWordLE(0x00, 0x01, 0x02, 0x03) == 0x03020100);
static_assert(WordToBytesLE(0x4a000000)[3] == 0x4a);

// Unchecked variants. Use only when the span is known to hold 4 bytes.
constexpr U32 LoadLE32(Span<const U8, 4> s) { return BytesToWordLE(s[0], s[1], s[2], s[3]); }

constexpr void StoreLE32(Span<U8, 4> s, U32 word) {
  s[0] = (U8)(word & 0xff);
  s[1] = (U8)((word >> 8) & 0xff);
  s[2] = (U8)((word >> 16) & 0xff);
  s[3] = (U8)((word >> 24) & 0xff);
}

// Reads the word at `offset`. Reports `Error::IndexOutOfRange` and returns 0
// when fewer than 4 bytes are available there.
U32 LoadLE32(Span<const U8> s, Size offset, Status &status);

// Writes the word at `offset`. Leaves the span untouched and reports
// `Error::IndexOutOfRange` when fewer than 4 bytes are available there.
void StoreLE32(Span<U8> s, Size offset, U32 word, Status &status);

} // namespace chacha

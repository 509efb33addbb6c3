#pragma once

#include "arr.hh"
#include "mem.hh"
#include "span.hh"
#include "str.hh"

namespace chacha {

// Decodes pairs of hex digits into bytes. Characters other than hex digits are
// treated as zero nibbles so the input must be validated by the caller.
void HexToBytesUnchecked(StrView hex, U8* out_bytes);

Str BytesToHex(Span<const U8> bytes);

constexpr U8 HexToU8(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return 0;
}

constexpr U8 HexToU8(const char c[2]) { return (HexToU8(c[0]) << 4) | HexToU8(c[1]); }

inline MemBuf operator""_HexVec(const char* str, size_t len) {
  MemBuf buf;
  buf.resize(len / 2);
  HexToBytesUnchecked({str, len}, buf.data());
  return buf;
}

// Fixed-size byte array from a hex literal.
//
//   Arr<U8, 12> nonce = HexArr("000000090000004a00000000");
template <size_t N>
constexpr Arr<U8, (N - 1) / 2> HexArr(const char (&str)[N]) {
  Arr<U8, (N - 1) / 2> arr = {};
  for (size_t i = 0; i < (N - 1) / 2; ++i) {
    arr[i] = HexToU8(&str[i * 2]);
  }
  return arr;
}

// Print the given bytes as a hex dump.
//
// Each printed line covers 16 bytes.
// Left side has hex offsets, then 16-column hex string with spaces between
// every 4 bytes and on the right side - ASCII (or '.').
Str HexDump(Span<const U8> bytes);

}  // namespace chacha

#include "little_endian.hh"

#include "format.hh"

namespace chacha {

U32 LoadLE32(Span<const U8> s, Size offset, Status &status) {
  if (offset > s.size() || s.size() - offset < 4) {
    AppendErrorMessage(status, Error::IndexOutOfRange) +=
        f("Can't read 4 bytes at offset %zu from a %zu byte buffer", offset, s.size());
    return 0;
  }
  return BytesToWordLE(s[offset], s[offset + 1], s[offset + 2], s[offset + 3]);
}

void StoreLE32(Span<U8> s, Size offset, U32 word, Status &status) {
  if (offset > s.size() || s.size() - offset < 4) {
    AppendErrorMessage(status, Error::IndexOutOfRange) +=
        f("Can't write 4 bytes at offset %zu into a %zu byte buffer", offset, s.size());
    return;
  }
  StoreLE32(s.subspan(offset).first<4>(), word);
}

} // namespace chacha

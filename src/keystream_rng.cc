#include "keystream_rng.hh"

#include "little_endian.hh"

namespace chacha {

KeystreamRng::KeystreamRng(Span<const U8, kKeySize> key, Span<const U8, kNonceSize> nonce,
                           U32 counter)
    : initial(InitState(key, counter, nonce)), block(), position(kStateWords) {}

void KeystreamRng::Refill() {
  block = BlockFunction(initial);
  initial[12] += 1;
  position = 0;
}

U32 KeystreamRng::NextU32() {
  if (position == kStateWords) {
    Refill();
  }
  return block[position++];
}

void KeystreamRng::Fill(MemView out) {
  while (out.size() >= 4) {
    StoreLE32(out.first<4>(), NextU32());
    out.RemovePrefix(4);
  }
  if (!out.empty()) {
    auto tail = WordToBytesLE(NextU32());
    for (Size i = 0; i < out.size(); ++i) {
      out[i] = tail[i];
    }
  }
}

U32 KeystreamRng::Counter() const {
  return position == kStateWords ? initial[12] : initial[12] - 1;
}

} // namespace chacha

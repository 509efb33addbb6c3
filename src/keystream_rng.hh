#pragma once

#include <limits>

#include "chacha20.hh"
#include "int.hh"
#include "mem.hh"
#include "span.hh"

namespace chacha {

// Deterministic word generator built on the ChaCha20 block function.
//
// Block n yields the 16 words of `BlockFunction(key, counter + n, nonce)`, in
// index order. `Fill` produces the serialized form of the same keystream, so
// bytes and words can be mixed. A request that isn't a multiple of 4 bytes
// discards the unused tail of its last word.
//
// Satisfies std::uniform_random_bit_generator so it can drive the
// distributions from <random>.
struct KeystreamRng {
  using result_type = U32;

  KeystreamRng(Span<const U8, kKeySize> key, Span<const U8, kNonceSize> nonce, U32 counter = 0);

  static constexpr result_type min() { return std::numeric_limits<result_type>::min(); }
  static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

  result_type operator()() { return NextU32(); }

  U32 NextU32();

  void Fill(MemView out);

  // Counter of the block that the next word will come from.
  U32 Counter() const;

 private:
  void Refill();

  State initial;
  State block;
  Size position;  // next word in `block`, kStateWords when exhausted
};

} // namespace chacha

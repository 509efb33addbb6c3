#pragma once

#include <bit>

#include "arr.hh"
#include "int.hh"
#include "mem.hh"
#include "span.hh"
#include "status.hh"
#include "str.hh"

namespace chacha {

constexpr Size kKeySize = 32;
constexpr Size kNonceSize = 12;
constexpr Size kBlockSize = 64;
constexpr Size kStateWords = 16;

// "expand 32-byte k" read as four little-endian words.
constexpr U32 kSigma[4] = {0x61707865, 0x3320646e, 0x79622d32, 0x6b206574};

// ChaCha state viewed as a row-major 4x4 matrix of words:
//
//   cccccccc  cccccccc  cccccccc  cccccccc
//   kkkkkkkk  kkkkkkkk  kkkkkkkk  kkkkkkkk
//   kkkkkkkk  kkkkkkkk  kkkkkkkk  kkkkkkkk
//   bbbbbbbb  nnnnnnnn  nnnnnnnn  nnnnnnnn
//
// c = constant, k = key, b = block counter, n = nonce.
using State = Arr<U32, kStateWords>;

// Serialized keystream block.
using Block = Arr<U8, kBlockSize>;

struct QuarterRoundResult {
  U32 a, b, c, d;

  bool operator==(const QuarterRoundResult &) const = default;
};

// The ARX mixing step. All additions wrap around modulo 2^32.
constexpr QuarterRoundResult QuarterRound(U32 a, U32 b, U32 c, U32 d) {
  a += b;
  d ^= a;
  d = std::rotl(d, 16);
  c += d;
  b ^= c;
  b = std::rotl(b, 12);
  a += b;
  d ^= a;
  d = std::rotl(d, 8);
  c += d;
  b ^= c;
  b = std::rotl(b, 7);
  return {a, b, c, d};
}

static_assert(QuarterRound(0x11111111, 0x01020304, 0x9b8d6f43, 0x01234567) ==
              QuarterRoundResult{0xea2a92f4, 0xcb1cf8ce, 0x4581472e, 0x5881c4bb});

// Runs the quarter round on state[x], state[y], state[z] & state[w]. Other
// words are left untouched.
//
// Reports `Error::IndexOutOfRange` (and leaves the state as is) if any index
// is 16 or larger.
void ApplyQuarterRound(State &, Size x, Size y, Size z, Size w, Status &);

// Initial state from key, block counter and nonce.
State InitState(Span<const U8, kKeySize> key, U32 counter, Span<const U8, kNonceSize> nonce);

// Same as above but checks the lengths first. On `Error::InvalidKeyLength` or
// `Error::InvalidNonceLength` returns an all-zero state without reading the
// inputs.
State InitState(Span<const U8> key, U32 counter, Span<const U8> nonce, Status &);

// Twenty rounds over a copy of `initial`, added back word by word.
State BlockFunction(const State &initial);

State BlockFunction(Span<const U8> key, U32 counter, Span<const U8> nonce, Status &);

// Writes every word little-endian, in index order.
Block Serialize(const State &);

// Encrypts or decrypts `data` in place.
//
// Block j of the data is XORed with the keystream block for `counter + j`
// (wrapping modulo 2^32). The last block may be partial. Nothing is written if
// the key or nonce has the wrong length.
void CryptInPlace(Span<const U8> key, U32 counter, Span<const U8> nonce, MemView data,
                  Status &);

// Copying version of `CryptInPlace`. Returns an empty buffer on error.
MemBuf Crypt(Span<const U8> key, U32 counter, Span<const U8> nonce, Span<const U8> data,
             Status &);

// XORs `data` with the keystream that starts at `initial[12]`. Used by the
// sequential and the parallel paths once the lengths have been validated.
void XorKeystream(const State &initial, MemView data);

// RFC 7539 altered the original ChaCha20 specification to use a 96-bit nonce
// and RFC 8439 kept it. It is kept in a separate namespace so that if the
// 64-bit nonce variant is ever needed it can be made available in another
// namespace.
namespace rfc8439 {

// Keystream position that survives between calls.
//
// The nonce must never be reused with the same key.
struct ChaCha20 {
  Arr<U8, kKeySize> key;
  U32 counter;
  Arr<U8, kNonceSize> nonce;

  ChaCha20(Span<const U8, kKeySize> key, U32 counter, Span<const U8, kNonceSize> nonce);

  // Validates the lengths of dynamically sized inputs. On error the returned
  // object has an all-zero key & nonce and must not be used.
  static ChaCha20 Make(Span<const U8> key, U32 counter, Span<const U8> nonce, Status &);

  // Encrypt/decrypt the given buffer in-place.
  //
  // `counter` will be updated by the number of blocks used (a partial block
  // counts as a full one).
  void Crypt(MemView);

  // Overwrites `out` with raw keystream. Advances `counter` like `Crypt`.
  void Keystream(MemView out);

  // Counter & nonce in hex. The key is never printed.
  Str ToStr() const;
};

} // namespace rfc8439

using ChaCha20 = rfc8439::ChaCha20;

} // namespace chacha

#include "chacha20.hh"

#include <algorithm>

#include "format.hh"
#include "hex.hh"
#include "little_endian.hh"

namespace chacha {

static constexpr int kDoubleRounds = 10;

static void CheckLengths(Span<const U8> key, Span<const U8> nonce, Status &status) {
  if (key.size() != kKeySize) {
    AppendErrorMessage(status, Error::InvalidKeyLength) +=
        f("ChaCha20 key must be %zu bytes long, got %zu", kKeySize, key.size());
    return;
  }
  if (nonce.size() != kNonceSize) {
    AppendErrorMessage(status, Error::InvalidNonceLength) +=
        f("ChaCha20 nonce must be %zu bytes long, got %zu", kNonceSize, nonce.size());
  }
}

// Unchecked. Indices must be below 16.
static inline void QR(State &s, Size x, Size y, Size z, Size w) {
  auto [a, b, c, d] = QuarterRound(s[x], s[y], s[z], s[w]);
  s[x] = a;
  s[y] = b;
  s[z] = c;
  s[w] = d;
}

void ApplyQuarterRound(State &state, Size x, Size y, Size z, Size w, Status &status) {
  for (Size i : {x, y, z, w}) {
    if (i >= kStateWords) {
      AppendErrorMessage(status, Error::IndexOutOfRange) +=
          f("Quarter round index %zu is outside of the %zu word state", i, kStateWords);
      return;
    }
  }
  QR(state, x, y, z, w);
}

State InitState(Span<const U8, kKeySize> key, U32 counter, Span<const U8, kNonceSize> nonce) {
  State state;
  for (Size i = 0; i < 4; ++i) {
    state[i] = kSigma[i];
  }
  for (Size i = 0; i < 8; ++i) {
    state[4 + i] = LoadLE32(key.subspan(4 * i).first<4>());
  }
  state[12] = counter;
  for (Size i = 0; i < 3; ++i) {
    state[13 + i] = LoadLE32(nonce.subspan(4 * i).first<4>());
  }
  return state;
}

State InitState(Span<const U8> key, U32 counter, Span<const U8> nonce, Status &status) {
  CheckLengths(key, nonce, status);
  if (!OK(status)) {
    return State{};
  }
  return InitState(key.first<kKeySize>(), counter, nonce.first<kNonceSize>());
}

State BlockFunction(const State &initial) {
  State x = initial;
  for (int i = 0; i < kDoubleRounds; ++i) {
    // Column round
    QR(x, 0, 4, 8, 12);
    QR(x, 1, 5, 9, 13);
    QR(x, 2, 6, 10, 14);
    QR(x, 3, 7, 11, 15);
    // Diagonal round
    QR(x, 0, 5, 10, 15);
    QR(x, 1, 6, 11, 12);
    QR(x, 2, 7, 8, 13);
    QR(x, 3, 4, 9, 14);
  }
  for (Size i = 0; i < kStateWords; ++i) {
    x[i] += initial[i];
  }
  return x;
}

State BlockFunction(Span<const U8> key, U32 counter, Span<const U8> nonce, Status &status) {
  State initial = InitState(key, counter, nonce, status);
  RETURN_VAL_ON_ERROR(status, State{});
  return BlockFunction(initial);
}

Block Serialize(const State &state) {
  Block block;
  for (Size i = 0; i < kStateWords; ++i) {
    StoreLE32(Span<U8, 4>(block.data() + 4 * i, 4), state[i]);
  }
  return block;
}

void XorKeystream(const State &initial, MemView data) {
  State input = initial;
  while (!data.empty()) {
    Block keystream = Serialize(BlockFunction(input));
    Size n = std::min(data.size(), kBlockSize);
    for (Size i = 0; i < n; ++i) {
      data[i] ^= keystream[i];
    }
    data.RemovePrefix(n);
    input[12] += 1;
  }
}

void CryptInPlace(Span<const U8> key, U32 counter, Span<const U8> nonce, MemView data,
                  Status &status) {
  State initial = InitState(key, counter, nonce, status);
  RETURN_ON_ERROR(status);
  XorKeystream(initial, data);
}

MemBuf Crypt(Span<const U8> key, U32 counter, Span<const U8> nonce, Span<const U8> data,
             Status &status) {
  CheckLengths(key, nonce, status);
  RETURN_VAL_ON_ERROR(status, MemBuf{});
  MemBuf out;
  out.AppendRange(data);
  CryptInPlace(key, counter, nonce, out, status);
  return out;
}

namespace rfc8439 {

ChaCha20::ChaCha20(Span<const U8, kKeySize> key, U32 counter, Span<const U8, kNonceSize> nonce)
    : counter(counter) {
  std::copy(key.begin(), key.end(), this->key.begin());
  std::copy(nonce.begin(), nonce.end(), this->nonce.begin());
}

ChaCha20 ChaCha20::Make(Span<const U8> key, U32 counter, Span<const U8> nonce, Status &status) {
  CheckLengths(key, nonce, status);
  if (!OK(status)) {
    return ChaCha20(Arr<U8, kKeySize>{}, counter, Arr<U8, kNonceSize>{});
  }
  return ChaCha20(key.first<kKeySize>(), counter, nonce.first<kNonceSize>());
}

void ChaCha20::Crypt(MemView data) {
  XorKeystream(InitState(key, counter, nonce), data);
  counter += (data.size() + kBlockSize - 1) / kBlockSize;
}

void ChaCha20::Keystream(MemView out) {
  std::fill(out.begin(), out.end(), 0);
  Crypt(out);
}

Str ChaCha20::ToStr() const {
  return f("ChaCha20(counter=%u, nonce=%s)", counter, BytesToHex(nonce).c_str());
}

} // namespace rfc8439

} // namespace chacha

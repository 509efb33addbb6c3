#include "selftest.hh"

#include "chacha20.hh"
#include "format.hh"
#include "hex.hh"
#include "log.hh"

namespace chacha {

namespace {

// RFC 8439 sections 2.3.2, 2.4.2 and A.1.
const KnownAnswer kKnownAnswers[] = {
    {
        .name = "block function (2.3.2)",
        .key_hex = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f",
        .nonce_hex = "000000090000004a00000000",
        .counter = 1,
        .plaintext_hex = "",
        .ciphertext_hex = "10f1e7e4d13b5915500fdd1fa32071c4c7d1f4c733c068030422aa9ac3d46c4e"
                          "d2826446079faa0914c2d705d98b02a2b5129cd1de164eb9cbd083e8a2503c4e",
    },
    {
        .name = "sunscreen (2.4.2)",
        .key_hex = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f",
        .nonce_hex = "000000000000004a00000000",
        .counter = 1,
        .plaintext_hex = "4c616469657320616e642047656e746c656d656e206f662074686520636c6173"
                         "73206f66202739393a204966204920636f756c64206f6666657220796f75206f"
                         "6e6c79206f6e652074697020666f7220746865206675747572652c2073756e73"
                         "637265656e20776f756c642062652069742e",
        .ciphertext_hex = "6e2e359a2568f98041ba0728dd0d6981e97e7aec1d4360c20a27afccfd9fae0b"
                          "f91b65c5524733ab8f593dabcd62b3571639d624e65152ab8f530c359f0861d8"
                          "07ca0dbf500d6a6156a38e088a22b65e52bc514d16ccf806818ce91ab7793736"
                          "5af90bbf74a35be6b40b8eedf2785e42874d",
    },
    {
        .name = "keystream test vector #1 (A.1)",
        .key_hex = "0000000000000000000000000000000000000000000000000000000000000000",
        .nonce_hex = "000000000000000000000000",
        .counter = 0,
        .plaintext_hex = "",
        .ciphertext_hex = "76b8e0ada0f13d90405d6ae55386bd28bdd219b8a08ded1aa836efcc8b770dc7"
                          "da41597c5157488d7724e03fb8d84a376a43b8f41518a11cc387b669b2ee6586",
    },
};

MemBuf FromHex(StrView hex) {
  MemBuf bytes(hex.size() / 2);
  HexToBytesUnchecked(hex, bytes.data());
  return bytes;
}

// Returns an empty string when the vector passes, otherwise a description of
// the mismatch.
Str Check(const KnownAnswer &kat) {
  MemBuf plaintext = kat.plaintext_hex.empty() ? MemBuf(kat.ciphertext_hex.size() / 2, 0)
                                               : FromHex(kat.plaintext_hex);
  Status status;
  MemBuf ciphertext =
      Crypt(FromHex(kat.key_hex), kat.counter, FromHex(kat.nonce_hex), plaintext, status);
  if (!OK(status)) {
    return status.ToStr();
  }
  if (BytesToHex(ciphertext) != kat.ciphertext_hex) {
    return "got\n" + HexDump(ciphertext) + "expected\n" + HexDump(FromHex(kat.ciphertext_hex));
  }
  // Decryption is the same operation.
  MemBuf decrypted =
      Crypt(FromHex(kat.key_hex), kat.counter, FromHex(kat.nonce_hex), ciphertext, status);
  if (!OK(status)) {
    return status.ToStr();
  }
  if (decrypted != plaintext) {
    return "decryption didn't restore the plaintext";
  }
  return "";
}

} // namespace

void RunKnownAnswers(Span<const KnownAnswer> kats, Status &status) {
  int failed = 0;
  int total = 0;

  ++total;
  QuarterRoundResult qr = QuarterRound(0x11111111, 0x01020304, 0x9b8d6f43, 0x01234567);
  if (qr != QuarterRoundResult{0xea2a92f4, 0xcb1cf8ce, 0x4581472e, 0x5881c4bb}) {
    ++failed;
    ERROR << f("ChaCha20 self test \"quarter round (2.1.1)\" failed: got %08x %08x %08x %08x",
               qr.a, qr.b, qr.c, qr.d);
  }

  for (const KnownAnswer &kat : kats) {
    ++total;
    Str problem = Check(kat);
    if (!problem.empty()) {
      ++failed;
      ERROR << f("ChaCha20 self test \"%s\" failed: %s", kat.name, problem.c_str());
    }
  }

  if (failed) {
    AppendErrorMessage(status, Error::SelfTestFailed) +=
        f("%d of %d ChaCha20 known-answer tests failed", failed, total);
    return;
  }
  LOG << f("ChaCha20 self test: %d known-answer tests passed", total);
}

void SelfTest(Status &status) { RunKnownAnswers(kKnownAnswers, status); }

} // namespace chacha

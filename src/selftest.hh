#pragma once

#include "int.hh"
#include "span.hh"
#include "status.hh"
#include "str.hh"

namespace chacha {

// One encryption vector. Decrypting `ciphertext_hex` must give the plaintext
// back.
struct KnownAnswer {
  const char *name;
  StrView key_hex;
  StrView nonce_hex;
  U32 counter;
  // Empty means "as many zero bytes as the expected output has".
  StrView plaintext_hex;
  StrView ciphertext_hex;
};

// Checks the RFC 8439 quarter round vector and then every entry of `kats`.
//
// Every failure is logged with ERROR. A one-line summary is logged with LOG
// when everything passes, otherwise `status` receives
// `Error::SelfTestFailed`.
void RunKnownAnswers(Span<const KnownAnswer> kats, Status &status);

// `RunKnownAnswers` with the built-in RFC 8439 vectors.
void SelfTest(Status &status);

} // namespace chacha

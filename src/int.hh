#pragma once

#include <cstddef>
#include <cstdint>

namespace chacha {

using U8 = unsigned char;
using U32 = unsigned int;
using U64 = unsigned long long;

// ChaCha words are exactly 32 bits wide. Everything in chacha20.cc relies on
// unsigned wrap-around of U32 for the mod 2^32 additions.
static_assert(sizeof(U32) == 4);
static_assert(sizeof(U64) == 8);

using Size = size_t;

} // namespace chacha

#pragma once

#include "str.hh"

namespace chacha {

// TODO: replace this with std::format once every supported toolchain ships it
Str f(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace chacha

#include "format.hh"

#include <cstdarg>
#include <cstdio>

namespace chacha {

Str f(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  va_list args2;
  va_copy(args2, args);
  int n = vsnprintf(NULL, 0, fmt, args) + 1;
  va_end(args);
  Str ret(n, '\0');
  vsnprintf(ret.data(), n, fmt, args2);
  va_end(args2);
  ret.resize(n - 1);
  return ret;
}

} // namespace chacha

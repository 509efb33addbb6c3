#pragma once

#include <memory>
#include <source_location>

#include "str.hh"

namespace chacha {

// Kinds of errors that the library can report.
//
// `Other` is used for context entries appended by callers on top of a more
// specific root cause.
enum class Error {
  Other,
  InvalidKeyLength,
  InvalidNonceLength,
  IndexOutOfRange,
  SelfTestFailed,
};

Str ToStr(Error);

struct Status {
  struct Entry {
    std::unique_ptr<Entry> next;
    std::source_location location;
    Error code;
    Str message;
    Str advice;
  };

  std::unique_ptr<Entry> entry;

  Status();

  Str &operator()(const std::source_location location_arg =
                      std::source_location::current());

  Str &operator()(Error code, const std::source_location location_arg =
                                  std::source_location::current());

  bool Ok() const;
  Str ToStr() const;
  void Reset();

  // Code of the earliest (root cause) error or `Error::Other` when the status
  // only carries plain messages. Meaningless when `Ok()`.
  Error Code() const;
};

inline bool OK(const Status &status) { return status.Ok(); }
inline Str ErrorMessage(const Status &s) { return s.ToStr(); }
inline Str &AppendErrorMessage(
    Status &status,
    const std::source_location location_arg = std::source_location::current()) {
  return status(location_arg);
}
inline Str &AppendErrorMessage(
    Status &status, Error code,
    const std::source_location location_arg = std::source_location::current()) {
  return status(code, location_arg);
}
void AppendErrorAdvice(Status &, StrView advice);

#define RETURN_ON_ERROR(status)                                                \
  if (!OK(status)) {                                                           \
    AppendErrorMessage(status) += __FUNCTION__;                                \
    return;                                                                    \
  }

#define RETURN_VAL_ON_ERROR(status, value)                                     \
  if (!OK(status)) {                                                           \
    AppendErrorMessage(status) += __FUNCTION__;                                \
    return value;                                                              \
  }

} // namespace chacha

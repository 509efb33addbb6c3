#pragma once

// Functions for logging human-readable messages.
//
// Usage:
//
//   LOG << "regular message";
//   ERROR << "error message";
//   FATAL << "stop the execution";
//
// Logging can also accept other types - integers, `Status` & anything else
// that has a `ToStr` overload.
//
// Logged messages can have multiple lines - the extra lines are not indented or
// treated in any special way.
//
// There is no need to add a new line character at the end of the logged message
// - it's added there automatically.

#include <functional>
#include <source_location>
#include <vector>

#include "status.hh"
#include "str.hh"

namespace chacha {

enum class LogLevel { Info, Error, Fatal };

// Appends the logged message when destroyed.
struct LogEntry {
  LogLevel log_level;
  std::source_location location;
  mutable Str buffer;

  LogEntry(LogLevel, const std::source_location location = std::source_location::current());
  ~LogEntry();
};

using Logger = std::function<void(const LogEntry&)>;

// Prints Info messages to stdout and everything else to stderr.
void DefaultLogger(const LogEntry& e);

// Every logger in this vector receives every entry. `DefaultLogger` is
// registered at startup. Tests may replace it to capture the output.
extern std::vector<Logger> loggers;

#define LOG chacha::LogEntry(chacha::LogLevel::Info, std::source_location::current())

#define ERROR chacha::LogEntry(chacha::LogLevel::Error, std::source_location::current())
#define FATAL chacha::LogEntry(chacha::LogLevel::Fatal, std::source_location::current())

const LogEntry& operator<<(const LogEntry&, StrView);
const LogEntry& operator<<(const LogEntry&, const Status& status);

const LogEntry& operator<<(const LogEntry& logger, const Stringer auto& t) {
  return logger << StrView(ToStr(t));
}

}  // namespace chacha

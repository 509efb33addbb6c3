#include "log.hh"

#include <cstdio>
#include <cstdlib>

#include "format.hh"

namespace chacha {

std::vector<Logger> loggers;

LogEntry::LogEntry(LogLevel log_level, const std::source_location location)
    : log_level(log_level),
      location(location),
      buffer() {}

LogEntry::~LogEntry() {
  if (log_level == LogLevel::Fatal) {
    buffer += f(". Crashing in %s:%d [%s].", location.file_name(), (int)location.line(),
                location.function_name());
  }

  for (auto& logger : loggers) {
    logger(*this);
  }

  if (log_level == LogLevel::Fatal) {
    fflush(stdout);
    fflush(stderr);
    abort();
  }
}

void DefaultLogger(const LogEntry& e) {
  if (e.log_level == LogLevel::Info) {
    printf("%s\n", e.buffer.c_str());
  } else {
    fprintf(stderr, "%s\n", e.buffer.c_str());
  }
}

void __attribute__((__constructor__)) InitDefaultLoggers() { loggers.emplace_back(DefaultLogger); }

const LogEntry& operator<<(const LogEntry& logger, StrView s) {
  logger.buffer += s;
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, const Status& status) {
  logger.buffer += status.ToStr();
  return logger;
}

}  // namespace chacha

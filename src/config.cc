#include "config.hh"

#include <cerrno>
#include <cstdlib>
#include <thread>

#include "format.hh"
#include "str.hh"

namespace chacha::config {

const char *kKnownEnvironmentVariables[] = {"CHACHA_THREADS", "CHACHA_PARALLEL_MIN_BLOCKS",
                                            nullptr};

static unsigned DefaultWorkerThreads() {
  unsigned n = std::thread::hardware_concurrency();
  return n ? n : 1;
}

// Default values may be overwritten during startup.
unsigned worker_threads = DefaultWorkerThreads();
Size parallel_min_blocks = kDefaultParallelMinBlocks;

// Parses a non-negative decimal number from the environment variable `name`.
// Returns false if the variable is not set.
static bool GetEnvNumber(const char *name, U64 max, U64 &out,
                         Status &status) {
  const char *env = getenv(name);
  if (env == nullptr) {
    return false;
  }
  Str text = env;
  StripWhitespace(text);
  const char *begin = text.c_str();
  char *end = nullptr;
  errno = 0;
  U64 value = strtoull(begin, &end, 10);
  if (end == begin || *end != '\0' || errno == ERANGE || begin[0] == '-' || value > max) {
    AppendErrorMessage(status) += f("Environment variable %s=\"%s\" is not a number in the "
                                    "range [0, %llu]",
                                    name, env, max);
    return false;
  }
  out = value;
  return true;
}

void LoadFromEnvironment(Status &status) {
  U64 value;
  if (GetEnvNumber("CHACHA_THREADS", 1024, value, status)) {
    worker_threads = value ? value : 1;
  }
  if (GetEnvNumber("CHACHA_PARALLEL_MIN_BLOCKS", 1ull << 32, value, status)) {
    parallel_min_blocks = value;
  }
  if (!OK(status)) {
    AppendErrorAdvice(status, "Unset the variable to use the default value.");
  }
}

void Reset() {
  worker_threads = DefaultWorkerThreads();
  parallel_min_blocks = kDefaultParallelMinBlocks;
}

} // namespace chacha::config

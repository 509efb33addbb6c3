#pragma once

#include "int.hh"
#include "status.hh"

namespace chacha::config {

// Environment variables read by `LoadFromEnvironment`. Null-terminated.
extern const char *kKnownEnvironmentVariables[];

// Number of threads used by `CryptParallel`. Values below 2 disable the worker
// threads.
//
// Default: the number of hardware threads (or 1 if it can't be determined).
// Environment: CHACHA_THREADS.
extern unsigned worker_threads;

// Inputs shorter than this many 64-byte blocks are always processed on the
// calling thread.
//
// Environment: CHACHA_PARALLEL_MIN_BLOCKS.
extern Size parallel_min_blocks;

constexpr Size kDefaultParallelMinBlocks = 64;

// Overrides the defaults with values from the environment. Variables that are
// not set are ignored. A malformed value keeps the default and appends an error
// to `status`, the remaining variables are still read.
void LoadFromEnvironment(Status &status);

// Restores the built-in defaults.
void Reset();

} // namespace chacha::config

#pragma once

#include <functional>
#include <thread>

#include "chacha20.hh"
#include "int.hh"
#include "mem.hh"
#include "span.hh"
#include "status.hh"

namespace chacha {

// Multi-threaded `CryptInPlace`.
//
// The output is byte-for-byte identical to `CryptInPlace`. The data is split
// into contiguous, block-aligned ranges and every range is processed by its own
// thread, starting at `counter + index of its first block`. Threads share only
// the read-only initial state and write to disjoint parts of `data`.
//
// Short inputs (see `config::parallel_min_blocks`) and `config::worker_threads`
// below 2 fall back to the calling thread.
void CryptParallel(Span<const U8> key, U32 counter, Span<const U8> nonce, MemView data,
                   Status &);

// Starts the thread that XORs `range` with the keystream beginning at
// `initial`. Throws `std::system_error` when the thread can't be created, in
// which case `CryptParallel` logs an ERROR and finishes the rest of the data on
// the calling thread. Tests may replace it.
extern std::function<std::thread(const State &initial, MemView range)> start_worker;

// Number of workers `CryptParallel` would use for `size` bytes of data.
unsigned ParallelWorkers(Size size);

} // namespace chacha

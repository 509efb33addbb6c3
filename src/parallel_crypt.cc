#include "parallel_crypt.hh"

#include <algorithm>
#include <system_error>
#include <thread>
#include <vector>

#include "chacha20.hh"
#include "config.hh"
#include "log.hh"

namespace chacha {

std::function<std::thread(const State &, MemView)> start_worker = [](const State &initial,
                                                                   MemView range) {
  return std::thread(XorKeystream, initial, range);
};

unsigned ParallelWorkers(Size size) {
  Size n_blocks = (size + kBlockSize - 1) / kBlockSize;
  if (config::worker_threads < 2 || n_blocks < std::max<Size>(config::parallel_min_blocks, 2)) {
    return 1;
  }
  return std::min<Size>(config::worker_threads, n_blocks);
}

void CryptParallel(Span<const U8> key, U32 counter, Span<const U8> nonce, MemView data,
                   Status &status) {
  State initial = InitState(key, counter, nonce, status);
  RETURN_ON_ERROR(status);

  unsigned n_workers = ParallelWorkers(data.size());
  if (n_workers <= 1) {
    XorKeystream(initial, data);
    return;
  }

  Size n_blocks = (data.size() + kBlockSize - 1) / kBlockSize;
  Size blocks_per_worker = (n_blocks + n_workers - 1) / n_workers;

  std::vector<std::thread> workers;
  workers.reserve(n_workers);
  Size first_block = 0;
  for (; first_block < n_blocks; first_block += blocks_per_worker) {
    Size offset = first_block * kBlockSize;
    MemView range = data.subspan(offset, std::min(blocks_per_worker * kBlockSize,
                                                  data.size() - offset));
    State range_initial = initial;
    range_initial[12] += (U32)first_block;
    try {
      workers.push_back(start_worker(range_initial, range));
    } catch (const std::system_error &e) {
      ERROR << "Couldn't start a ChaCha20 worker thread (" << StrView(e.what())
            << "). Continuing on the calling thread.";
      break;
    }
  }
  // Whatever couldn't be handed to a worker is done here.
  if (first_block < n_blocks) {
    State rest_initial = initial;
    rest_initial[12] += (U32)first_block;
    XorKeystream(rest_initial, data.subspan(first_block * kBlockSize));
  }
  for (auto &worker : workers) {
    worker.join();
  }
}

} // namespace chacha

#include "parallel_crypt.hh"

#include <gtest/gtest.h>

#include <system_error>

#include "chacha20.hh"
#include "config.hh"
#include "hex.hh"
#include "log.hh"

using namespace chacha;

namespace {

constexpr auto kKey = HexArr("1c9240a5eb55d38af333888604f6b5f0473917c1402b80099dca5cbc207075c0");
constexpr auto kNonce = HexArr("000000000102030405060708");

class ParallelCryptTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config::worker_threads = 4;
    config::parallel_min_blocks = 2;
  }
  void TearDown() override {
    config::Reset();
    start_worker = saved_start_worker;
  }

  std::function<std::thread(const State &, MemView)> saved_start_worker = start_worker;
};

MemBuf Pattern(Size len) {
  MemBuf data(len);
  for (Size i = 0; i < len; ++i) {
    data[i] = (U8)(i ^ (i >> 8));
  }
  return data;
}

}  // namespace

TEST_F(ParallelCryptTest, MatchesSequential) {
  for (Size len : {0, 1, 64, 65, 128, 129, 255, 256, 1000, 4096, 10000}) {
    MemBuf sequential = Pattern(len);
    MemBuf parallel = Pattern(len);
    Status status;
    CryptInPlace(kKey, 7, kNonce, sequential, status);
    ASSERT_TRUE(OK(status)) << status.ToStr();
    CryptParallel(kKey, 7, kNonce, parallel, status);
    ASSERT_TRUE(OK(status)) << status.ToStr();
    EXPECT_EQ(BytesToHex(parallel), BytesToHex(sequential)) << "length " << len;
  }
}

TEST_F(ParallelCryptTest, CounterWrapsInsideWorkers) {
  MemBuf sequential = Pattern(64 * 9);
  MemBuf parallel = sequential;
  Status status;
  CryptInPlace(kKey, 0xfffffffc, kNonce, sequential, status);
  CryptParallel(kKey, 0xfffffffc, kNonce, parallel, status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  EXPECT_EQ(parallel, sequential);
}

TEST_F(ParallelCryptTest, RoundTrip) {
  MemBuf data = Pattern(5000);
  MemBuf original = data;
  Status status;
  CryptParallel(kKey, 1, kNonce, data, status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  EXPECT_NE(data, original);
  CryptParallel(kKey, 1, kNonce, data, status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  EXPECT_EQ(data, original);
}

TEST_F(ParallelCryptTest, WorkerCount) {
  EXPECT_EQ(ParallelWorkers(0), 1u);
  EXPECT_EQ(ParallelWorkers(64), 1u);
  EXPECT_EQ(ParallelWorkers(65), 2u);
  EXPECT_EQ(ParallelWorkers(64 * 3), 3u);
  EXPECT_EQ(ParallelWorkers(64 * 100), 4u);

  config::parallel_min_blocks = 10;
  EXPECT_EQ(ParallelWorkers(64 * 9), 1u);
  EXPECT_EQ(ParallelWorkers(64 * 10), 4u);

  config::worker_threads = 1;
  EXPECT_EQ(ParallelWorkers(64 * 100), 1u);
}

TEST_F(ParallelCryptTest, RejectsBadLengths) {
  MemBuf data = Pattern(1000);
  MemBuf original = data;
  Status status;
  CryptParallel(Span<const U8>(kKey).first(31), 1, kNonce, data, status);
  ASSERT_FALSE(OK(status));
  EXPECT_EQ(status.Code(), Error::InvalidKeyLength);
  EXPECT_EQ(data, original);
}

TEST_F(ParallelCryptTest, ShorterLastRange) {
  // 10 blocks over 4 workers: ranges of 3, 3, 3 and 1 block, the last one
  // partial.
  Size len = 64 * 10 - 5;
  ASSERT_EQ(ParallelWorkers(len), 4u);
  MemBuf sequential = Pattern(len);
  MemBuf parallel = sequential;
  std::vector<Size> range_sizes;
  std::vector<U32> range_counters;
  auto default_start = start_worker;
  start_worker = [&](const State &initial, MemView range) {
    range_sizes.push_back(range.size());
    range_counters.push_back(initial[12]);
    return default_start(initial, range);
  };
  Status status;
  CryptInPlace(kKey, 100, kNonce, sequential, status);
  CryptParallel(kKey, 100, kNonce, parallel, status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  EXPECT_EQ(parallel, sequential);
  EXPECT_EQ(range_sizes, (std::vector<Size>{192, 192, 192, 59}));
  EXPECT_EQ(range_counters, (std::vector<U32>{100, 103, 106, 109}));
}

TEST_F(ParallelCryptTest, FallsBackToCallingThread) {
  std::vector<Logger> saved_loggers = loggers;
  std::vector<Str> errors;
  loggers = {[&](const LogEntry &e) {
    if (e.log_level == LogLevel::Error) {
      errors.push_back(e.buffer);
    }
  }};
  int started = 0;
  auto default_start = start_worker;
  start_worker = [&](const State &initial, MemView range) {
    if (started == 1) {
      throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    }
    ++started;
    return default_start(initial, range);
  };

  MemBuf sequential = Pattern(64 * 20 + 7);
  MemBuf parallel = sequential;
  Status status;
  CryptInPlace(kKey, 3, kNonce, sequential, status);
  CryptParallel(kKey, 3, kNonce, parallel, status);
  loggers = saved_loggers;

  ASSERT_TRUE(OK(status)) << status.ToStr();
  EXPECT_EQ(started, 1);
  EXPECT_EQ(parallel, sequential);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("Continuing on the calling thread"), Str::npos) << errors[0];
}

#include "keystream_rng.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <random>

#include "hex.hh"

using namespace chacha;

namespace {

constexpr auto kSequentialKey =
    HexArr("000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f");

constexpr Arr<U8, kNonceSize> kZeroNonce = {};

}  // namespace

static_assert(std::uniform_random_bit_generator<KeystreamRng>);

TEST(KeystreamRngTest, FirstTwoBlocks) {
  const U32 expected[] = {
      2100034873, 1780073945, 1996733837, 1229642936, 1876440458, 3429555900, 1283312818,
      2451892952, 3888915243, 2871222434, 1777274431, 1686095930, 3929375269, 765720497,
      2690787266, 205609800,  826456088,  3517376173, 1633444115, 659440559,  4126388728,
      1549512161, 318568684,  1551185194, 1829242994, 1564274385, 609780125,  1006636644,
      1593221275, 3461963230, 2135566861, 3445265713,
  };
  KeystreamRng rng(kSequentialKey, kZeroNonce);
  for (Size i = 0; i < std::size(expected); ++i) {
    EXPECT_EQ(rng.NextU32(), expected[i]) << "word " << i;
  }
}

TEST(KeystreamRngTest, MatchesBlockFunction) {
  KeystreamRng rng(kSequentialKey, kZeroNonce, 5);
  EXPECT_EQ(rng.Counter(), 5u);
  State block = BlockFunction(InitState(kSequentialKey, 5, kZeroNonce));
  for (Size i = 0; i < kStateWords; ++i) {
    EXPECT_EQ(rng(), block[i]);
    EXPECT_EQ(rng.Counter(), i + 1 < kStateWords ? 5u : 6u);
  }
}

TEST(KeystreamRngTest, FillMatchesSerializedKeystream) {
  KeystreamRng rng(kSequentialKey, kZeroNonce, 0);
  MemBuf bytes(100);
  rng.Fill(bytes);
  Block block0 = Serialize(BlockFunction(InitState(kSequentialKey, 0, kZeroNonce)));
  Block block1 = Serialize(BlockFunction(InitState(kSequentialKey, 1, kZeroNonce)));
  EXPECT_TRUE(std::equal(block0.begin(), block0.end(), bytes.begin()));
  EXPECT_TRUE(std::equal(bytes.begin() + 64, bytes.end(), block1.begin()));
}

TEST(KeystreamRngTest, FillDropsTailOfLastWord) {
  KeystreamRng rng(kSequentialKey, kZeroNonce);
  MemBuf bytes(3);
  rng.Fill(bytes);
  EXPECT_EQ(bytes, (MemBuf{0x39, 0xfd, 0x2b}));  // 2100034873 = 0x7d2bfd39
  EXPECT_EQ(rng.NextU32(), 1780073945u);
}

TEST(KeystreamRngTest, DrivesStandardDistributions) {
  KeystreamRng a(kSequentialKey, kZeroNonce);
  KeystreamRng b(kSequentialKey, kZeroNonce);
  std::uniform_int_distribution<int> dice(1, 6);
  for (int i = 0; i < 100; ++i) {
    int x = dice(a);
    EXPECT_GE(x, 1);
    EXPECT_LE(x, 6);
    EXPECT_EQ(x, dice(b));
  }
}

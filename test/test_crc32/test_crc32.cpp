#include <gtest/gtest.h>
#include <zlib.h>

#include <string>
#include <vector>

#include "mslog/crc32.h"

using namespace mslog;

TEST(Crc32, CheckValue) {
  const std::string s = "123456789";
  EXPECT_EQ(crc32Buffer(s.data(), s.size()), 0xCBF43926u);
}

TEST(Crc32, EmptyInputIsZero) {
  EXPECT_EQ(crc32Buffer(nullptr, 0), 0u);
  const uint8_t b = 0x55;
  EXPECT_EQ(crc32Buffer(&b, 0), 0u);
}

TEST(Crc32, MatchesZlib) {
  std::vector<uint8_t> buf(5000);
  uint32_t x = 0x12345678u;
  for (auto& b : buf) {
    x = x * 1103515245u + 12345u;
    b = static_cast<uint8_t>(x >> 16);
  }

  for (size_t len : {1u, 7u, 64u, 255u, 1024u, 5000u}) {
    const uint32_t expected = static_cast<uint32_t>(::crc32(0L, buf.data(), static_cast<uInt>(len)));
    EXPECT_EQ(crc32Buffer(buf.data(), len), expected) << "len=" << len;
  }
}

TEST(Crc32, IncrementalEqualsOneShot) {
  const std::string s = "{\"temperature_c\":30.5,\"humidity_pct\":65.2}\n";
  const auto* p = reinterpret_cast<const uint8_t*>(s.data());

  uint32_t crc = 0;
  crc = crc32Update(crc, p, 10);
  crc = crc32Update(crc, p + 10, s.size() - 10);
  EXPECT_EQ(crc, crc32Buffer(s.data(), s.size()));
}

TEST(Crc32, SingleBitFlipChangesCrc) {
  std::vector<uint8_t> buf(256, 0xAB);
  const uint32_t before = crc32Buffer(buf.data(), buf.size());
  buf[100] ^= 0x04;
  EXPECT_NE(crc32Buffer(buf.data(), buf.size()), before);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

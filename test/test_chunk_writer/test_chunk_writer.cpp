#include <gtest/gtest.h>
#include <zlib.h>

#include <string>
#include <vector>

#include "mslog/byte_io.h"
#include "mslog/chunk_writer.h"
#include "mslog/compression.h"
#include "mslog/log_format.h"

using namespace mslog;

namespace {

constexpr uint64_t kNode = 0x1020BA4DF03Cull;

std::vector<uint8_t> bytesOf(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

// Deterministic noise that deflate cannot shrink
std::vector<uint8_t> noise(size_t len) {
  std::vector<uint8_t> out(len);
  uint32_t x = 0xC0FFEEu;
  for (auto& b : out) {
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    b = static_cast<uint8_t>(x);
  }
  return out;
}

class FailingSink : public ByteSink {
public:
  bool write(const uint8_t*, size_t) override { return false; }
  std::string lastError() const override { return "disk full"; }
};

}  // namespace

TEST(ChunkWriter, SmallJsonStaysRaw) {
  const std::vector<uint8_t> payload = bytesOf("{\"a\":1}");
  MemorySink sink;
  ChunkWriter writer;
  ChunkHeader hdr = {};

  ASSERT_TRUE(writer.write(sink, payload.data(), payload.size(), kNode, 1700000000u, &hdr));

  EXPECT_EQ(hdr.algo, 0);
  EXPECT_EQ(hdr.raw_len, 7u);
  EXPECT_EQ(hdr.data_len, 7u);
  EXPECT_EQ(hdr.crc32, static_cast<uint32_t>(::crc32(0L, payload.data(), 7)));
  EXPECT_EQ(hdr.reserved, 0u);

  const std::vector<uint8_t>& out = sink.bytes();
  ASSERT_EQ(out.size(), kHeaderSize + 7u);
  ChunkHeader parsed = {};
  ASSERT_TRUE(decodeHeader(out.data(), out.size(), &parsed));
  EXPECT_EQ(parsed.magic, kLogMagic);
  EXPECT_EQ(parsed.version, kLogVersion);
  EXPECT_EQ(parsed.node_id, kNode);
  EXPECT_EQ(parsed.timestamp, 1700000000u);
  EXPECT_EQ(std::string(out.begin() + kHeaderSize, out.end()), "{\"a\":1}");
}

TEST(ChunkWriter, CompressibleLargePayloadIsDeflated) {
  std::string text;
  while (text.size() < 4096) text += "{\"temperature_c\":30.5,\"humidity_pct\":65.2}\n";
  const std::vector<uint8_t> payload = bytesOf(text);

  ChunkWriter writer;
  std::vector<uint8_t> stored;
  const ChunkHeader hdr = writer.encode(payload.data(), payload.size(), kNode, 0, &stored);

  EXPECT_EQ(hdr.algo, static_cast<uint8_t>(Algo::DEFLATE));
  EXPECT_EQ(hdr.level, 3);
  EXPECT_EQ(hdr.raw_len, payload.size());
  EXPECT_EQ(hdr.data_len, stored.size());
  EXPECT_LT(stored.size() + kHeaderSize, payload.size() - payload.size() * 5 / 100);
  EXPECT_EQ(hdr.crc32, static_cast<uint32_t>(::crc32(0L, stored.data(), static_cast<uInt>(stored.size()))));

  std::vector<uint8_t> back;
  ASSERT_EQ(decompressRaw(stored.data(), stored.size(), hdr.raw_len, &back), CodecStatus::OK);
  EXPECT_EQ(back, payload);
}

TEST(ChunkWriter, BelowThresholdIsNeverCompressed) {
  const std::vector<uint8_t> payload(1023, 'x');
  ChunkWriter writer;
  std::vector<uint8_t> stored;
  const ChunkHeader hdr = writer.encode(payload.data(), payload.size(), kNode, 0, &stored);
  EXPECT_EQ(hdr.algo, 0);
  EXPECT_EQ(stored, payload);

  const std::vector<uint8_t> at_threshold(1024, 'x');
  const ChunkHeader hdr2 = writer.encode(at_threshold.data(), at_threshold.size(), kNode, 0, &stored);
  EXPECT_EQ(hdr2.algo, 1);
}

TEST(ChunkWriter, IncompressiblePayloadFallsBackToRaw) {
  const std::vector<uint8_t> payload = noise(4096);
  ChunkWriter writer;
  std::vector<uint8_t> stored;
  const ChunkHeader hdr = writer.encode(payload.data(), payload.size(), kNode, 0, &stored);

  EXPECT_EQ(hdr.algo, 0);
  EXPECT_EQ(hdr.level, 0);
  EXPECT_EQ(hdr.data_len, hdr.raw_len);
  EXPECT_EQ(stored, payload);
}

TEST(ChunkWriter, SavingsGateHonoursConfig) {
  std::string text;
  while (text.size() < 2048) text += "abcdefgh";
  const std::vector<uint8_t> payload = bytesOf(text);

  WriterConfig config;
  config.min_savings_pct = 100;  // nothing can save 100%
  ChunkWriter strict(config);
  std::vector<uint8_t> stored;
  EXPECT_EQ(strict.encode(payload.data(), payload.size(), kNode, 0, &stored).algo, 0);

  config.min_savings_pct = 5;
  config.compression_enabled = false;
  ChunkWriter off(config);
  EXPECT_EQ(off.encode(payload.data(), payload.size(), kNode, 0, &stored).algo, 0);
}

TEST(ChunkWriter, SavingsAboveHundredPercentKeepsRaw) {
  const std::vector<uint8_t> payload(4096, 'a');
  WriterConfig config;
  config.min_savings_pct = 200;
  ChunkWriter writer(config);
  std::vector<uint8_t> stored;

  const ChunkHeader hdr = writer.encode(payload.data(), payload.size(), kNode, 0, &stored);
  EXPECT_EQ(hdr.algo, 0);
  EXPECT_EQ(stored, payload);
}

TEST(ChunkWriter, EmptyAndOversizedPayloadsAreRefused) {
  MemorySink sink;
  ChunkWriter writer;
  const std::vector<uint8_t> one = bytesOf("x");

  EXPECT_FALSE(writer.write(sink, one.data(), 0, kNode, 0));
  EXPECT_EQ(writer.lastError(), "empty payload");
  EXPECT_FALSE(writer.write(sink, nullptr, 5, kNode, 0));
  EXPECT_TRUE(sink.bytes().empty());

  const std::vector<uint8_t> big(kMaxChunkBytes + 1u, '{');
  EXPECT_FALSE(writer.write(sink, big.data(), big.size(), kNode, 0));
  EXPECT_NE(writer.lastError().find("exceeds"), std::string::npos);
  EXPECT_TRUE(sink.bytes().empty());

  const std::vector<uint8_t> max(kMaxChunkBytes, '{');
  EXPECT_TRUE(writer.write(sink, max.data(), max.size(), kNode, 0));
  EXPECT_TRUE(writer.lastError().empty());
}

TEST(ChunkWriter, SinkFailurePropagates) {
  const std::vector<uint8_t> payload = bytesOf("{\"a\":1}");
  FailingSink sink;
  ChunkWriter writer;
  EXPECT_FALSE(writer.write(sink, payload.data(), payload.size(), kNode, 0));
  EXPECT_EQ(writer.lastError(), "disk full");
}

TEST(ChunkWriter, ChunksConcatenate) {
  MemorySink sink;
  ChunkWriter writer;
  const std::vector<uint8_t> a = bytesOf("{\"a\":1}");
  const std::vector<uint8_t> b = bytesOf("{\"b\":22}");
  ASSERT_TRUE(writer.write(sink, a.data(), a.size(), kNode, 1));
  ASSERT_TRUE(writer.write(sink, b.data(), b.size(), kNode, 2));

  const std::vector<uint8_t>& out = sink.bytes();
  ASSERT_EQ(out.size(), 2 * kHeaderSize + a.size() + b.size());
  ChunkHeader second = {};
  ASSERT_TRUE(decodeHeader(out.data() + kHeaderSize + a.size(), kHeaderSize, &second));
  EXPECT_EQ(second.magic, kLogMagic);
  EXPECT_EQ(second.raw_len, 8u);
  EXPECT_EQ(second.timestamp, 2u);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

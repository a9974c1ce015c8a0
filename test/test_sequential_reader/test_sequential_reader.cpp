#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mslog/byte_io.h"
#include "mslog/chunk_writer.h"
#include "mslog/compression.h"
#include "mslog/crc32.h"
#include "mslog/log_format.h"
#include "mslog/sequential_reader.h"

using namespace mslog;

namespace {

constexpr uint64_t kNode = 0x1020BA4DF03Cull;

class FakeLogger : public ILogger {
public:
  struct Entry {
    LogLevel lvl;
    std::string msg;
  };
  std::vector<Entry> entries;

  void log(LogLevel level, const std::string& message) override {
    entries.push_back({level, message});
  }
  size_t count(LogLevel level) const {
    size_t n = 0;
    for (const auto& e : entries) n += (e.lvl == level) ? 1u : 0u;
    return n;
  }
};

class FailingSource : public ByteSource {
public:
  size_t read(uint8_t*, size_t) override { return 0; }
  bool failed() const override { return true; }
  std::string lastError() const override { return "read: Input/output error"; }
};

struct Log {
  std::vector<uint8_t> bytes;
  std::vector<size_t> offsets;  // header offset of each chunk
};

Log buildLog(int chunks) {
  Log log;
  MemorySink sink;
  ChunkWriter writer;
  for (int i = 0; i < chunks; ++i) {
    const std::string line = "{\"seq\":" + std::to_string(i) + ",\"battery_pct\":" + std::to_string(28 - i) + "}\n";
    log.offsets.push_back(sink.bytes().size());
    EXPECT_TRUE(writer.write(sink, reinterpret_cast<const uint8_t*>(line.data()), line.size(),
                             kNode, 1700000000u + static_cast<uint32_t>(i) * 60u));
  }
  log.bytes = sink.bytes();
  return log;
}

// Hand-built chunk with a CRC that matches whatever stored bytes it carries.
std::vector<uint8_t> rawChunk(uint8_t algo, uint32_t raw_len, const std::vector<uint8_t>& stored) {
  ChunkHeader h = {};
  h.magic = kLogMagic;
  h.version = kLogVersion;
  h.algo = algo;
  h.raw_len = raw_len;
  h.data_len = static_cast<uint32_t>(stored.size());
  h.crc32 = crc32Buffer(stored.data(), stored.size());
  h.node_id = kNode;
  const HeaderBytes hb = encodeHeader(h);
  std::vector<uint8_t> out(hb.begin(), hb.end());
  out.insert(out.end(), stored.begin(), stored.end());
  return out;
}

std::string payloadText(const DecodedChunk& c) {
  return std::string(c.payload.begin(), c.payload.end());
}

}  // namespace

TEST(SequentialReader, ReadsCleanLog) {
  const Log log = buildLog(3);
  BufferSource src(log.bytes);
  SequentialReader reader(src);

  const ReadSummary s = reader.readAll();
  EXPECT_TRUE(s.cleanEnd());
  ASSERT_EQ(s.chunks.size(), 3u);
  EXPECT_EQ(s.headers_read, 3u);
  EXPECT_EQ(s.crc_failures, 0u);
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(s.chunks[i].index, i + 1);
    EXPECT_EQ(s.chunks[i].offset, log.offsets[i]);
    EXPECT_EQ(s.chunks[i].node_id, "10:20:BA:4D:F0:3C");
    EXPECT_TRUE(s.chunks[i].crc_valid);
  }
  EXPECT_EQ(payloadText(s.chunks[1]), "{\"seq\":1,\"battery_pct\":27}\n");
  EXPECT_EQ(s.terminal_offset, log.bytes.size());
  EXPECT_TRUE(reader.done());
}

TEST(SequentialReader, SingleSmallJsonChunk) {
  MemorySink sink;
  ChunkWriter writer;
  const std::string json = "{\"a\":1}";
  ASSERT_TRUE(writer.write(sink, reinterpret_cast<const uint8_t*>(json.data()), json.size(), kNode, 0));

  BufferSource src(sink.bytes());
  SequentialReader reader(src);
  const ReadResult r = reader.next();
  ASSERT_EQ(r.status, ChunkStatus::OK);
  EXPECT_EQ(r.chunk.header.algo, 0);
  EXPECT_EQ(r.chunk.header.raw_len, 7u);
  EXPECT_EQ(r.chunk.header.data_len, 7u);
  EXPECT_EQ(r.chunk.header.crc32, crc32Buffer(json.data(), json.size()));
  EXPECT_TRUE(r.chunk.crc_checked);
  EXPECT_TRUE(r.chunk.crc_valid);
  EXPECT_EQ(payloadText(r.chunk), json);
  EXPECT_EQ(reader.next().status, ChunkStatus::END_OF_STREAM);
}

TEST(SequentialReader, TruncatedPayloadKeepsEarlierChunks) {
  const Log log = buildLog(5);
  // Cut halfway into chunk 4's payload
  const size_t cut = log.offsets[3] + kHeaderSize + 5;
  std::vector<uint8_t> damaged(log.bytes.begin(), log.bytes.begin() + cut);

  BufferSource src(damaged);
  FakeLogger logger;
  SequentialReader reader(src, ReaderOptions(), &logger);
  const ReadSummary s = reader.readAll();

  EXPECT_EQ(s.chunks.size(), 3u);
  EXPECT_EQ(s.terminal_status, ChunkStatus::TRUNCATED_PAYLOAD);
  EXPECT_EQ(s.terminal_offset, log.offsets[3]);
  EXPECT_FALSE(s.cleanEnd());
  EXPECT_EQ(logger.count(LogLevel::ERROR), 1u);
}

TEST(SequentialReader, TruncatedHeader) {
  const Log log = buildLog(2);
  std::vector<uint8_t> damaged(log.bytes.begin(), log.bytes.begin() + log.offsets[1] + 20);

  BufferSource src(damaged);
  SequentialReader reader(src);
  const ReadSummary s = reader.readAll();
  EXPECT_EQ(s.chunks.size(), 1u);
  EXPECT_EQ(s.terminal_status, ChunkStatus::TRUNCATED_HEADER);
  EXPECT_EQ(s.terminal_offset, log.offsets[1]);
}

TEST(SequentialReader, BitFlipIsIsolatedToOneChunk) {
  Log log = buildLog(3);
  log.bytes[log.offsets[1] + kHeaderSize + 3] ^= 0x10;

  BufferSource src(log.bytes);
  FakeLogger logger;
  SequentialReader reader(src, ReaderOptions(), &logger);

  EXPECT_EQ(reader.next().status, ChunkStatus::OK);
  const ReadResult bad = reader.next();
  EXPECT_EQ(bad.status, ChunkStatus::CRC_MISMATCH);
  EXPECT_EQ(bad.offset, log.offsets[1]);
  EXPECT_NE(bad.detail.find("expected 0x"), std::string::npos);
  EXPECT_FALSE(bad.chunk.crc_valid);
  EXPECT_NE(bad.chunk.computed_crc, bad.chunk.header.crc32);

  const ReadResult third = reader.next();
  ASSERT_EQ(third.status, ChunkStatus::OK);
  EXPECT_EQ(third.chunk.index, 3u);
  EXPECT_EQ(reader.next().status, ChunkStatus::END_OF_STREAM);

  ASSERT_EQ(logger.count(LogLevel::ERROR), 1u);
  EXPECT_NE(logger.entries[0].msg.find("CRC32 mismatch"), std::string::npos);
}

TEST(SequentialReader, SummaryCountsSkippedChunks) {
  Log log = buildLog(4);
  log.bytes[log.offsets[2] + kHeaderSize] ^= 0x01;

  BufferSource src(log.bytes);
  SequentialReader reader(src);
  const ReadSummary s = reader.readAll();
  EXPECT_EQ(s.headers_read, 4u);
  EXPECT_EQ(s.crc_failures, 1u);
  ASSERT_EQ(s.chunks.size(), 3u);
  EXPECT_EQ(s.chunks[2].index, 4u);
  EXPECT_TRUE(s.cleanEnd());
}

TEST(SequentialReader, NoVerifyTrustsPayload) {
  Log log = buildLog(1);
  log.bytes[kHeaderSize + 2] = 'X';

  BufferSource src(log.bytes);
  ReaderOptions opts;
  opts.verify_crc = false;
  SequentialReader reader(src, opts);
  const ReadResult r = reader.next();
  ASSERT_EQ(r.status, ChunkStatus::OK);
  EXPECT_FALSE(r.chunk.crc_checked);
  EXPECT_EQ(r.chunk.payload[2], 'X');
}

TEST(SequentialReader, InvalidMagicIsTerminal) {
  std::vector<uint8_t> bytes(64, 0x00);
  const Log log = buildLog(1);
  bytes.insert(bytes.end(), log.bytes.begin(), log.bytes.end());

  BufferSource src(bytes);
  SequentialReader reader(src);
  EXPECT_EQ(reader.next().status, ChunkStatus::INVALID_MAGIC);
  EXPECT_EQ(reader.next().status, ChunkStatus::INVALID_MAGIC);
  EXPECT_TRUE(reader.done());
}

TEST(SequentialReader, VersionMismatchWarnsAndContinues) {
  Log log = buildLog(2);
  log.bytes[4] = 3;

  BufferSource src(log.bytes);
  FakeLogger logger;
  SequentialReader reader(src, ReaderOptions(), &logger);
  const ReadResult r = reader.next();
  ASSERT_EQ(r.status, ChunkStatus::OK);
  EXPECT_TRUE(r.chunk.version_mismatch);
  EXPECT_EQ(logger.count(LogLevel::WARN), 1u);
  EXPECT_EQ(reader.next().status, ChunkStatus::OK);
}

TEST(SequentialReader, DecompressFailureSkipsOneChunk) {
  std::vector<uint8_t> bytes = rawChunk(1, 100, {0xFF, 0xFF, 0xFF, 0xFF});
  const Log tail = buildLog(1);
  bytes.insert(bytes.end(), tail.bytes.begin(), tail.bytes.end());

  BufferSource src(bytes);
  SequentialReader reader(src);
  const ReadResult bad = reader.next();
  EXPECT_EQ(bad.status, ChunkStatus::DECOMPRESS_FAILED);
  EXPECT_FALSE(bad.detail.empty());
  EXPECT_EQ(reader.next().status, ChunkStatus::OK);
  EXPECT_EQ(reader.next().status, ChunkStatus::END_OF_STREAM);
}

TEST(SequentialReader, LengthMismatchIsFlagged) {
  std::string text;
  while (text.size() < 2000) text += "{\"x\":1}\n";
  std::vector<uint8_t> packed;
  ASSERT_EQ(compressRaw(reinterpret_cast<const uint8_t*>(text.data()), text.size(), 3, &packed),
            CodecStatus::OK);
  const std::vector<uint8_t> bytes = rawChunk(1, static_cast<uint32_t>(text.size() + 10), packed);

  BufferSource src(bytes);
  SequentialReader reader(src);
  const ReadResult r = reader.next();
  ASSERT_EQ(r.status, ChunkStatus::OK);
  EXPECT_TRUE(r.chunk.length_mismatch);
  EXPECT_EQ(payloadText(r.chunk), text);
}

TEST(SequentialReader, EmptyStream) {
  BufferSource src(nullptr, 0);
  SequentialReader reader(src);
  const ReadSummary s = reader.readAll();
  EXPECT_TRUE(s.chunks.empty());
  EXPECT_TRUE(s.cleanEnd());
}

TEST(SequentialReader, SourceFailureIsIoError) {
  FailingSource src;
  SequentialReader reader(src);
  const ReadResult r = reader.next();
  EXPECT_EQ(r.status, ChunkStatus::IO_ERROR);
  EXPECT_EQ(r.detail, "read: Input/output error");
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

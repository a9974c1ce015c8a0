#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

#include "mslog/byte_io.h"
#include "mslog/chunk_writer.h"
#include "mslog/sequential_reader.h"

using namespace mslog;

namespace {

std::string tempPath(const std::string& name) {
  return ::testing::TempDir() + "mslog_" + name;
}

void removeAll(const RotatingFileSink& sink) {
  std::remove(sink.path().c_str());
  std::remove(sink.oldPath().c_str());
  std::remove(sink.backupPath().c_str());
}

}  // namespace

TEST(ByteIo, BufferSourceReadsInSteps) {
  const std::vector<uint8_t> data = {1, 2, 3, 4, 5};
  BufferSource src(data);
  uint8_t buf[3];
  EXPECT_EQ(src.read(buf, 3), 3u);
  EXPECT_EQ(buf[2], 3);
  EXPECT_EQ(src.read(buf, 3), 2u);
  EXPECT_EQ(src.read(buf, 3), 0u);
  EXPECT_EQ(src.position(), 5u);
  EXPECT_FALSE(src.failed());
}

TEST(ByteIo, MissingFileReportsError) {
  FileSource src(tempPath("does_not_exist.log"));
  EXPECT_FALSE(src.isOpen());
  EXPECT_TRUE(src.failed());
  EXPECT_NE(src.lastError().find("does_not_exist"), std::string::npos);

  std::vector<uint8_t> out;
  std::string error;
  EXPECT_FALSE(readFile(tempPath("does_not_exist.log"), &out, &error));
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(fileSize(tempPath("does_not_exist.log")), -1);
}

TEST(ByteIo, FileSinkAppendsAndFileSourceReadsBack) {
  const std::string path = tempPath("append.log");
  std::remove(path.c_str());

  FileSink sink(path);
  ChunkWriter writer;
  const std::string a = "{\"a\":1}";
  const std::string b = "{\"b\":2}";
  ASSERT_TRUE(writer.write(sink, reinterpret_cast<const uint8_t*>(a.data()), a.size(), 1, 0));
  ASSERT_TRUE(writer.write(sink, reinterpret_cast<const uint8_t*>(b.data()), b.size(), 1, 0));
  EXPECT_EQ(fileSize(path), static_cast<long long>(2 * kHeaderSize + a.size() + b.size()));

  FileSource src(path);
  ASSERT_TRUE(src.isOpen());
  SequentialReader reader(src);
  const ReadSummary s = reader.readAll();
  EXPECT_TRUE(s.cleanEnd());
  ASSERT_EQ(s.chunks.size(), 2u);
  EXPECT_EQ(std::string(s.chunks[1].payload.begin(), s.chunks[1].payload.end()), b);

  std::remove(path.c_str());
}

TEST(ByteIo, RotationPathsKeepExtension) {
  RotatingFileSink sink("/data/msn.log", 1024);
  EXPECT_EQ(sink.oldPath(), "/data/msn_old.log");
  EXPECT_EQ(sink.backupPath(), "/data/msn_backup.log");

  RotatingFileSink bare("/data.d/msn", 1024);
  EXPECT_EQ(bare.oldPath(), "/data.d/msn_old");
}

TEST(ByteIo, RotatesThroughThreeGenerations) {
  RotatingFileSink sink(tempPath("rotate.log"), 200);
  removeAll(sink);

  ChunkWriter writer;
  const std::string line(50, 'r');  // 86 bytes per chunk
  const auto* p = reinterpret_cast<const uint8_t*>(line.data());

  ASSERT_TRUE(writer.write(sink, p, line.size(), 1, 0));
  ASSERT_TRUE(writer.write(sink, p, line.size(), 1, 0));
  EXPECT_EQ(sink.rotations(), 0u);
  EXPECT_EQ(fileSize(sink.path()), 172);

  ASSERT_TRUE(writer.write(sink, p, line.size(), 1, 0));
  EXPECT_EQ(sink.rotations(), 1u);
  EXPECT_EQ(fileSize(sink.oldPath()), 172);
  EXPECT_EQ(fileSize(sink.path()), 86);

  ASSERT_TRUE(writer.write(sink, p, line.size(), 1, 0));
  ASSERT_TRUE(writer.write(sink, p, line.size(), 1, 0));
  EXPECT_EQ(sink.rotations(), 2u);
  EXPECT_EQ(fileSize(sink.backupPath()), 172);
  EXPECT_EQ(fileSize(sink.oldPath()), 172);
  EXPECT_EQ(fileSize(sink.path()), 86);

  removeAll(sink);
}

TEST(ByteIo, ChunkReachingLimitExactlyRotates) {
  RotatingFileSink sink(tempPath("rotate_exact.log"), 172);
  removeAll(sink);

  ChunkWriter writer;
  const std::string line(50, 'e');  // 86 bytes per chunk
  const auto* p = reinterpret_cast<const uint8_t*>(line.data());

  ASSERT_TRUE(writer.write(sink, p, line.size(), 1, 0));
  EXPECT_EQ(sink.rotations(), 0u);

  // 86 + 86 lands exactly on the limit
  ASSERT_TRUE(writer.write(sink, p, line.size(), 1, 0));
  EXPECT_EQ(sink.rotations(), 1u);
  EXPECT_EQ(fileSize(sink.oldPath()), 86);
  EXPECT_EQ(fileSize(sink.path()), 86);

  removeAll(sink);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

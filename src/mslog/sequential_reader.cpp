#include "mslog/sequential_reader.h"

#include <algorithm>
#include <cstdio>
#include <utility>

#include "mslog/chunk_decoder.h"
#include "mslog/node_identity.h"

namespace mslog {
namespace {

constexpr size_t kReadStep = 64u * 1024u;

}  // namespace

SequentialReader::SequentialReader(ByteSource& source, ReaderOptions options, ILogger* logger)
    : source_(source),
      options_(options),
      logger_(logger),
      position_(0u),
      chunk_num_(0u),
      done_(false) {}

ReadResult SequentialReader::finish(ChunkStatus status, uint64_t offset, std::string detail) {
  done_ = true;
  terminal_ = ReadResult();
  terminal_.status = status;
  terminal_.offset = offset;
  terminal_.detail = std::move(detail);
  return terminal_;
}

// Grows the buffer as bytes arrive so a corrupt data_len cannot force a huge allocation.
bool SequentialReader::readPayload(uint32_t data_len, std::vector<uint8_t>* out) {
  out->clear();
  size_t remaining = data_len;
  while (remaining > 0u) {
    const size_t step = std::min(remaining, kReadStep);
    const size_t at = out->size();
    out->resize(at + step);
    const size_t n = source_.read(out->data() + at, step);
    out->resize(at + n);
    position_ += n;
    if (n < step) return false;
    remaining -= n;
  }
  return true;
}

ReadResult SequentialReader::next() {
  if (done_) return terminal_;

  const uint64_t offset = position_;
  uint8_t hdr_bytes[kHeaderSize];
  const size_t got = source_.read(hdr_bytes, sizeof(hdr_bytes));
  position_ += got;

  if (source_.failed()) {
    logf(logger_, LogLevel::ERROR, "Read failed at offset 0x%08llX: %s",
         static_cast<unsigned long long>(offset), source_.lastError().c_str());
    return finish(ChunkStatus::IO_ERROR, offset, source_.lastError());
  }
  if (got == 0u) {
    return finish(ChunkStatus::END_OF_STREAM, offset, std::string());
  }
  if (got < kHeaderSize) {
    logf(logger_, LogLevel::WARN, "Incomplete header at chunk %u (%zu/%zu bytes), truncated file?",
         static_cast<unsigned>(chunk_num_ + 1u), got, kHeaderSize);
    return finish(ChunkStatus::TRUNCATED_HEADER, offset,
                  std::to_string(got) + "/" + std::to_string(kHeaderSize) + " header bytes");
  }

  ReadResult result;
  result.offset = offset;
  DecodedChunk& chunk = result.chunk;
  decodeHeader(hdr_bytes, sizeof(hdr_bytes), &chunk.header);
  chunk.index = ++chunk_num_;
  chunk.offset = offset;
  chunk.node_id = formatNodeId(chunk.header.node_id);

  if (chunk.header.magic != kLogMagic) {
    logf(logger_, LogLevel::ERROR, "Invalid magic 0x%08X at chunk %u (offset 0x%08llX), expected 0x%08X",
         static_cast<unsigned>(chunk.header.magic), static_cast<unsigned>(chunk.index),
         static_cast<unsigned long long>(offset), static_cast<unsigned>(kLogMagic));
    return finish(ChunkStatus::INVALID_MAGIC, offset, std::string());
  }

  if (chunk.header.version != kLogVersion) {
    chunk.version_mismatch = true;
    logf(logger_, LogLevel::WARN, "Chunk %u version %u != expected %u",
         static_cast<unsigned>(chunk.index), static_cast<unsigned>(chunk.header.version),
         static_cast<unsigned>(kLogVersion));
  }

  std::vector<uint8_t> stored;
  if (!readPayload(chunk.header.data_len, &stored)) {
    if (source_.failed()) {
      return finish(ChunkStatus::IO_ERROR, offset, source_.lastError());
    }
    logf(logger_, LogLevel::ERROR, "Chunk %u truncated payload (%zu/%u bytes)",
         static_cast<unsigned>(chunk.index), stored.size(), static_cast<unsigned>(chunk.header.data_len));
    return finish(ChunkStatus::TRUNCATED_PAYLOAD, offset,
                  std::to_string(stored.size()) + "/" + std::to_string(chunk.header.data_len) + " payload bytes");
  }

  if (options_.verify_crc && !checkCrc(stored.data(), stored.size(), &chunk)) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "expected 0x%08X, got 0x%08X",
                  static_cast<unsigned>(chunk.header.crc32), static_cast<unsigned>(chunk.computed_crc));
    logf(logger_, LogLevel::ERROR, "Chunk %u CRC32 mismatch! %s", static_cast<unsigned>(chunk.index), buf);
    result.status = ChunkStatus::CRC_MISMATCH;
    result.detail = buf;
    return result;
  }

  std::string detail;
  const ChunkStatus decoded = decodeStored(stored.data(), stored.size(), &chunk, &detail);
  if (decoded != ChunkStatus::OK) {
    logf(logger_, LogLevel::ERROR, "Chunk %u decompression failed: %s",
         static_cast<unsigned>(chunk.index), detail.c_str());
    result.status = decoded;
    result.detail = detail;
    return result;
  }
  if (chunk.length_mismatch) {
    logf(logger_, LogLevel::WARN, "Chunk %u decompressed size mismatch (%zu/%u)",
         static_cast<unsigned>(chunk.index), chunk.payload.size(), static_cast<unsigned>(chunk.header.raw_len));
    result.detail = detail;
  }

  result.status = ChunkStatus::OK;
  return result;
}

ReadSummary SequentialReader::readAll() {
  ReadSummary summary;
  while (true) {
    ReadResult r = next();
    if (isTerminal(r.status)) {
      summary.terminal_status = r.status;
      summary.terminal_offset = r.offset;
      summary.terminal_detail = r.detail;
      break;
    }
    ++summary.headers_read;
    if (r.status == ChunkStatus::CRC_MISMATCH) {
      ++summary.crc_failures;
    } else if (r.status == ChunkStatus::DECOMPRESS_FAILED) {
      ++summary.decode_failures;
    } else {
      summary.chunks.push_back(std::move(r.chunk));
    }
  }
  return summary;
}

}  // namespace mslog

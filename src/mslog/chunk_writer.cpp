#include "mslog/chunk_writer.h"

#include <string>
#include <vector>

#include "mslog/compression.h"
#include "mslog/crc32.h"

namespace mslog {

ChunkWriter::ChunkWriter(WriterConfig config, ILogger* logger)
    : config_(config), logger_(logger) {
  if (config_.min_savings_pct > 100u) config_.min_savings_pct = 100u;
}

bool ChunkWriter::shouldKeepCompressed(size_t raw_len, size_t compressed_len) const {
  const size_t min_savings = (raw_len * config_.min_savings_pct) / 100u;
  if (min_savings >= raw_len) return false;
  return compressed_len + kHeaderSize < raw_len - min_savings;
}

ChunkHeader ChunkWriter::encode(const uint8_t* payload, size_t len, uint64_t node_id,
                                uint32_t timestamp, std::vector<uint8_t>* stored) const {
  ChunkHeader header = {};
  header.magic = kLogMagic;
  header.version = kLogVersion;
  header.algo = static_cast<uint8_t>(Algo::RAW);
  header.level = 0u;
  header.raw_len = static_cast<uint32_t>(len);
  header.node_id = node_id;
  header.timestamp = timestamp;
  header.reserved = 0u;

  stored->clear();
  bool compressed = false;

  if (config_.compression_enabled && len >= config_.compress_threshold) {
    std::vector<uint8_t> out;
    const CodecStatus rc = compressRaw(payload, len, config_.compress_level, &out);
    if (rc != CodecStatus::OK) {
      logf(logger_, LogLevel::WARN, "compress failed (%s), storing raw", toString(rc));
    } else if (shouldKeepCompressed(len, out.size())) {
      stored->swap(out);
      compressed = true;
    }
  }

  if (compressed) {
    header.algo = static_cast<uint8_t>(Algo::DEFLATE);
    header.level = static_cast<uint8_t>(config_.compress_level);
  } else if (len > 0u) {
    stored->assign(payload, payload + len);
  }

  header.data_len = static_cast<uint32_t>(stored->size());
  header.crc32 = crc32Buffer(stored->data(), stored->size());
  return header;
}

bool ChunkWriter::write(ByteSink& sink, const uint8_t* payload, size_t len,
                        uint64_t node_id, uint32_t timestamp, ChunkHeader* out_header) {
  // Readers reject data_len == 0 and anything above kMaxChunkBytes
  if (payload == nullptr || len == 0u) {
    error_ = "empty payload";
    return false;
  }
  if (len > kMaxChunkBytes) {
    error_ = "payload exceeds " + std::to_string(kMaxChunkBytes) + " bytes";
    return false;
  }

  std::vector<uint8_t> stored;
  const ChunkHeader header = encode(payload, len, node_id, timestamp, &stored);
  const HeaderBytes bytes = encodeHeader(header);

  if (!sink.prepare(bytes.size() + stored.size())) {
    error_ = sink.lastError();
    return false;
  }
  if (!sink.write(bytes.data(), bytes.size()) ||
      (!stored.empty() && !sink.write(stored.data(), stored.size()))) {
    error_ = sink.lastError();
    return false;
  }

  if (header.algo == static_cast<uint8_t>(Algo::DEFLATE)) {
    logf(logger_, LogLevel::INFO, "Chunk written: DEFLATE %u->%u bytes (%.1f%%) | CRC32=0x%08X",
         static_cast<unsigned>(header.raw_len), static_cast<unsigned>(header.data_len),
         100.0 * header.data_len / header.raw_len, static_cast<unsigned>(header.crc32));
  } else {
    logf(logger_, LogLevel::INFO, "Chunk written: RAW %u bytes | CRC32=0x%08X",
         static_cast<unsigned>(header.raw_len), static_cast<unsigned>(header.crc32));
  }

  if (out_header != nullptr) *out_header = header;
  error_.clear();
  return true;
}

}  // namespace mslog

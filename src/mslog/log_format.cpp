#include "mslog/log_format.h"

namespace mslog {

const char* toString(ChunkStatus status) {
  switch (status) {
    case ChunkStatus::OK: return "ok";
    case ChunkStatus::END_OF_STREAM: return "end of stream";
    case ChunkStatus::MALFORMED_HEADER: return "malformed header";
    case ChunkStatus::TRUNCATED_HEADER: return "truncated header";
    case ChunkStatus::INVALID_MAGIC: return "invalid magic";
    case ChunkStatus::TRUNCATED_PAYLOAD: return "truncated payload";
    case ChunkStatus::CRC_MISMATCH: return "crc mismatch";
    case ChunkStatus::DECOMPRESS_FAILED: return "decompression failed";
    case ChunkStatus::IO_ERROR: return "i/o error";
  }
  return "unknown";
}

bool isTerminal(ChunkStatus status) {
  switch (status) {
    case ChunkStatus::OK:
    case ChunkStatus::CRC_MISMATCH:
    case ChunkStatus::DECOMPRESS_FAILED:
      return false;
    default:
      return true;
  }
}

void writeU16LE(uint8_t* dst, uint16_t value) {
  dst[0] = static_cast<uint8_t>(value & 0xFFu);
  dst[1] = static_cast<uint8_t>((value >> 8) & 0xFFu);
}

void writeU32LE(uint8_t* dst, uint32_t value) {
  dst[0] = static_cast<uint8_t>(value & 0xFFu);
  dst[1] = static_cast<uint8_t>((value >> 8) & 0xFFu);
  dst[2] = static_cast<uint8_t>((value >> 16) & 0xFFu);
  dst[3] = static_cast<uint8_t>((value >> 24) & 0xFFu);
}

void writeU64LE(uint8_t* dst, uint64_t value) {
  writeU32LE(dst, static_cast<uint32_t>(value & 0xFFFFFFFFu));
  writeU32LE(dst + 4, static_cast<uint32_t>(value >> 32));
}

uint16_t readU16LE(const uint8_t* src) {
  return static_cast<uint16_t>(src[0] | (static_cast<uint16_t>(src[1]) << 8));
}

uint32_t readU32LE(const uint8_t* src) {
  return (static_cast<uint32_t>(src[0])) |
         (static_cast<uint32_t>(src[1]) << 8) |
         (static_cast<uint32_t>(src[2]) << 16) |
         (static_cast<uint32_t>(src[3]) << 24);
}

uint64_t readU64LE(const uint8_t* src) {
  return static_cast<uint64_t>(readU32LE(src)) |
         (static_cast<uint64_t>(readU32LE(src + 4)) << 32);
}

HeaderBytes encodeHeader(const ChunkHeader& header) {
  HeaderBytes out = {};
  writeU32LE(&out[0], header.magic);
  writeU16LE(&out[4], header.version);
  out[6] = header.algo;
  out[7] = header.level;
  writeU32LE(&out[8], header.raw_len);
  writeU32LE(&out[12], header.data_len);
  writeU32LE(&out[16], header.crc32);
  writeU64LE(&out[20], header.node_id);
  writeU32LE(&out[28], header.timestamp);
  writeU32LE(&out[32], header.reserved);
  return out;
}

bool decodeHeader(const uint8_t* data, size_t len, ChunkHeader* out_header) {
  if (data == nullptr || out_header == nullptr || len < kHeaderSize) return false;

  ChunkHeader header = {};
  header.magic = readU32LE(data);
  header.version = readU16LE(data + 4);
  header.algo = data[6];
  header.level = data[7];
  header.raw_len = readU32LE(data + 8);
  header.data_len = readU32LE(data + 12);
  header.crc32 = readU32LE(data + 16);
  header.node_id = readU64LE(data + 20);
  header.timestamp = readU32LE(data + 28);
  header.reserved = readU32LE(data + 32);

  *out_header = header;
  return true;
}

bool hasPlausibleLengths(const ChunkHeader& header, uint32_t max_bytes) {
  if (header.data_len == 0u || header.data_len > max_bytes) return false;
  if (header.raw_len == 0u || header.raw_len > max_bytes) return false;
  return true;
}

}  // namespace mslog

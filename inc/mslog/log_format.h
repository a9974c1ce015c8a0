#ifndef INC_MSLOG_LOG_FORMAT_H_
#define INC_MSLOG_LOG_FORMAT_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mslog {

constexpr uint32_t kLogMagic = 0x4D534C47u;  // "MSLG"
constexpr uint16_t kLogVersion = 2;
constexpr size_t kHeaderSize = 36;
constexpr uint32_t kMaxChunkBytes = 1024u * 1024u;  // plausibility bound

enum class Algo : uint8_t {
  RAW = 0,
  DEFLATE = 1
};

enum class ChunkStatus : uint8_t {
  OK = 0,
  END_OF_STREAM = 1,
  MALFORMED_HEADER = 2,
  TRUNCATED_HEADER = 3,
  INVALID_MAGIC = 4,
  TRUNCATED_PAYLOAD = 5,
  CRC_MISMATCH = 6,
  DECOMPRESS_FAILED = 7,
  IO_ERROR = 8
};

const char* toString(ChunkStatus status);

// Framing errors end sequential parsing; integrity and codec errors skip one chunk.
bool isTerminal(ChunkStatus status);

/**
 * On-wire chunk header, 36 bytes little-endian:
 *   [0..3] magic, [4..5] version, [6] algo, [7] level, [8..11] raw_len,
 *   [12..15] data_len, [16..19] crc32, [20..27] node_id,
 *   [28..31] timestamp, [32..35] reserved
 */
struct ChunkHeader {
  uint32_t magic;
  uint16_t version;
  uint8_t algo;
  uint8_t level;
  uint32_t raw_len;
  uint32_t data_len;
  uint32_t crc32;
  uint64_t node_id;
  uint32_t timestamp;  // unix seconds, 0 = not available
  uint32_t reserved;
};

using HeaderBytes = std::array<uint8_t, kHeaderSize>;

HeaderBytes encodeHeader(const ChunkHeader& header);

/** Unpack a header. Returns false if fewer than kHeaderSize bytes are given. */
bool decodeHeader(const uint8_t* data, size_t len, ChunkHeader* out_header);

/** Both length fields within (0, max_bytes]. */
bool hasPlausibleLengths(const ChunkHeader& header, uint32_t max_bytes = kMaxChunkBytes);

// Little-endian helpers shared by the codec and the tests.
void writeU16LE(uint8_t* dst, uint16_t value);
void writeU32LE(uint8_t* dst, uint32_t value);
void writeU64LE(uint8_t* dst, uint64_t value);
uint16_t readU16LE(const uint8_t* src);
uint32_t readU32LE(const uint8_t* src);
uint64_t readU64LE(const uint8_t* src);

// One decoded chunk as handed to consumers.
struct DecodedChunk {
  uint32_t index = 0;    // 1-based header ordinal within the read or scan
  uint64_t offset = 0;   // byte offset of the header
  ChunkHeader header = {};
  std::string node_id;   // "AA:BB:CC:DD:EE:FF"
  std::vector<uint8_t> payload;  // decoded application bytes
  bool crc_checked = false;
  bool crc_valid = false;
  uint32_t computed_crc = 0;
  bool version_mismatch = false;
  bool length_mismatch = false;  // decompressed size != raw_len
  bool truncated = false;        // stored bytes cut short by end of dump

  bool compressed() const { return header.algo == static_cast<uint8_t>(Algo::DEFLATE); }
};

}  // namespace mslog

#endif  // INC_MSLOG_LOG_FORMAT_H_

#ifndef INC_MSLOG_REPORT_H_
#define INC_MSLOG_REPORT_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "mslog/log_format.h"

namespace mslog {

// Totals printed at the end of every tool run.
struct ReportTotals {
  uint32_t chunks = 0;
  uint64_t raw_bytes = 0;         // decoded payload bytes
  uint64_t stored_bytes = 0;      // data_len over all chunks
  uint64_t compressed_bytes = 0;  // data_len over deflate chunks only
  uint64_t compressed_raw_bytes = 0;
  uint32_t crc_checked = 0;
  uint32_t crc_pass = 0;
  uint32_t crc_fail = 0;
  uint32_t skipped = 0;  // chunks dropped by the reader or scanner
};

ReportTotals summarize(const std::vector<DecodedChunk>& chunks);

/**
 * Multi-line "=== Summary ===" block.
 * @param verified Include the CRC pass line
 */
std::string formatSummary(const ReportTotals& totals, bool verified);

// "Chunk 3: DEFLATE | 2048 bytes | CRC32=0x1234ABCD PASS | Node: ... | Time: ..."
std::string describeChunk(const DecodedChunk& chunk);

/**
 * Wrap a chunk whose payload is one JSON value as
 * {"chunk":N,"node_id":"..","timestamp":"..","sensors":<payload>}.
 * Returns false for binary or otherwise non-JSON payloads.
 */
bool chunkToJson(const DecodedChunk& chunk, std::string* out, bool pretty = true);

/** Lowercase hex, two digits per byte, no separators. */
std::string hexString(const uint8_t* data, size_t len);

}  // namespace mslog

#endif  // INC_MSLOG_REPORT_H_

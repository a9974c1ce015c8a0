#include "mslog/recovery_scanner.h"

#include <algorithm>
#include <string>
#include <utility>

#include "mslog/chunk_decoder.h"
#include "mslog/node_identity.h"

namespace mslog {
namespace {

// kLogMagic as it appears on disk.
constexpr uint8_t kMagicBytes[4] = {0x47, 0x4C, 0x53, 0x4D};

}  // namespace

bool isValidLayout(const FlashLayout& layout) {
  return layout.page_size > 0u && layout.header_size < layout.page_size;
}

std::vector<uint8_t> deinterleavePages(const uint8_t* data, size_t size, size_t offset,
                                       size_t length, const FlashLayout& layout) {
  std::vector<uint8_t> out;
  if (data == nullptr || !isValidLayout(layout)) return out;
  out.reserve(length);

  size_t page_idx = offset / layout.page_size;
  size_t current = offset;
  size_t remaining = length;
  // An offset inside a page header starts at that page's data area
  if (offset % layout.page_size < layout.header_size) {
    current = page_idx * layout.page_size + layout.header_size;
  }

  while (remaining > 0u && current < size) {
    const size_t page_end = std::min((page_idx + 1u) * layout.page_size, size);
    const size_t in_page = page_end - current;
    const size_t take = std::min(remaining, in_page);
    out.insert(out.end(), data + current, data + current + take);
    remaining -= take;

    ++page_idx;
    current = page_idx * layout.page_size + layout.header_size;
  }
  return out;
}

RecoveryScanner::RecoveryScanner(ScanOptions options, ILogger* logger)
    : options_(options), logger_(logger) {}

ScanReport RecoveryScanner::scan(const uint8_t* data, size_t len) const {
  ScanReport report;
  ScanStats& stats = report.stats;
  if (data == nullptr) return report;
  stats.bytes_scanned = len;

  if (options_.flash_pages && !isValidLayout(options_.layout)) {
    logf(logger_, LogLevel::ERROR, "Invalid flash layout: page=%u header=%u",
         static_cast<unsigned>(options_.layout.page_size),
         static_cast<unsigned>(options_.layout.header_size));
    return report;
  }

  const uint8_t* end = data + len;
  size_t cursor = 0u;

  while (cursor + kHeaderSize <= len) {
    const uint8_t* hit = std::search(data + cursor, end, kMagicBytes, kMagicBytes + sizeof(kMagicBytes));
    if (hit == end) break;
    const size_t pos = static_cast<size_t>(hit - data);
    if (pos + kHeaderSize > len) break;
    ++stats.candidates;

    DecodedChunk chunk;
    chunk.offset = pos;
    decodeHeader(data + pos, len - pos, &chunk.header);
    const ChunkHeader& hdr = chunk.header;

    if (hdr.magic != kLogMagic || hdr.version != kLogVersion) {
      logf(logger_, LogLevel::DEBUG, "Version %u at 0x%08zX, skipping", static_cast<unsigned>(hdr.version), pos);
      ++stats.rejected_version;
      cursor = pos + 1u;
      continue;
    }

    if (!hasPlausibleLengths(hdr, options_.max_chunk_bytes)) {
      logf(logger_, LogLevel::DEBUG, "Invalid data_len=%u raw_len=%u at 0x%08zX",
           static_cast<unsigned>(hdr.data_len), static_cast<unsigned>(hdr.raw_len), pos);
      ++stats.rejected_lengths;
      cursor = pos + 1u;
      continue;
    }

    const size_t data_start = pos + kHeaderSize;
    std::vector<uint8_t> stored;
    if (options_.flash_pages) {
      stored = deinterleavePages(data, len, data_start, hdr.data_len, options_.layout);
    } else if (data_start + hdr.data_len <= len) {
      stored.assign(data + data_start, data + data_start + hdr.data_len);
    }
    if (stored.size() != hdr.data_len) {
      // Flash dumps keep a cut-off final chunk when the CRC gate is not enforced
      const bool keep = options_.flash_pages && !stored.empty() &&
                        (options_.force || !options_.verify_crc);
      if (!keep) {
        logf(logger_, LogLevel::DEBUG, "Payload runs past end of dump at 0x%08zX", pos);
        ++stats.rejected_truncated;
        cursor = pos + 1u;
        continue;
      }
      logf(logger_, LogLevel::DEBUG, "Payload cut short at 0x%08zX: %zu of %u bytes",
           pos, stored.size(), static_cast<unsigned>(hdr.data_len));
      chunk.truncated = true;
    }

    const bool crc_ok = checkCrc(stored.data(), stored.size(), &chunk) && !chunk.truncated;
    if (chunk.truncated) chunk.crc_valid = false;
    if (options_.verify_crc && !crc_ok) {
      logf(logger_, LogLevel::DEBUG, "CRC FAIL at 0x%08zX: expected=0x%08X, computed=0x%08X, data_len=%u, algo=%u",
           pos, static_cast<unsigned>(hdr.crc32), static_cast<unsigned>(chunk.computed_crc),
           static_cast<unsigned>(hdr.data_len), static_cast<unsigned>(hdr.algo));
      if ((chunk.computed_crc ^ 0xFFFFFFFFu) == hdr.crc32) {
        logf(logger_, LogLevel::DEBUG, "  (matches inverted CRC32)");
      }
      if (!options_.force) {
        ++stats.rejected_crc;
        cursor = pos + 1u;
        continue;
      }
    }

    std::string detail;
    if (decodeStored(stored.data(), stored.size(), &chunk, &detail) != ChunkStatus::OK) {
      logf(logger_, LogLevel::DEBUG, "Decompression failed at 0x%08zX: %s", pos, detail.c_str());
      ++stats.rejected_decompress;
      cursor = pos + 1u;
      continue;
    }

    chunk.index = ++stats.accepted;
    chunk.node_id = formatNodeId(hdr.node_id);
    if (!chunk.crc_valid) ++stats.accepted_crc_invalid;
    stats.payload_bytes += chunk.payload.size();
    stats.stored_bytes += stored.size();

    logf(logger_, LogLevel::DEBUG, "Chunk %u at offset 0x%08zX: %zu bytes | CRC32: %s",
         static_cast<unsigned>(chunk.index), pos, chunk.payload.size(), chunk.crc_valid ? "PASS" : "FAIL");

    // Approximate jump; a chunk overlapping this one's tail can be missed.
    cursor = pos + hdr.data_len;
    report.chunks.push_back(std::move(chunk));
  }

  return report;
}

}  // namespace mslog

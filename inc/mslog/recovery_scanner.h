#ifndef INC_MSLOG_RECOVERY_SCANNER_H_
#define INC_MSLOG_RECOVERY_SCANNER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "mslog/diag_logger.h"
#include "mslog/log_config.h"
#include "mslog/log_format.h"

namespace mslog {

// Physical flash page geometry used when chunks were dumped page by page.
struct FlashLayout {
  uint32_t page_size = kDefaultFlashPageSize;
  uint32_t header_size = kDefaultFlashPageHeader;
};

/** True when 0 <= header_size < page_size. */
bool isValidLayout(const FlashLayout& layout);

/**
 * Reassemble `length` logical bytes that start at physical `offset` in a dump
 * where every page begins with a page header.
 *
 * The first read runs from `offset` to the end of its page; each following
 * page contributes its bytes after the header. Reading stops early at the end
 * of `data`, so the result can be shorter than `length`.
 *
 * Precondition: isValidLayout(layout). Returns empty otherwise.
 */
std::vector<uint8_t> deinterleavePages(const uint8_t* data, size_t size, size_t offset,
                                       size_t length, const FlashLayout& layout);

struct ScanOptions {
  bool verify_crc = true;
  bool force = false;        // keep CRC-invalid chunks, flagged
  bool flash_pages = false;  // strip page headers from payloads
  FlashLayout layout;
  uint32_t max_chunk_bytes = kMaxChunkBytes;
};

struct ScanStats {
  uint64_t bytes_scanned = 0;
  uint32_t candidates = 0;
  uint32_t rejected_version = 0;
  uint32_t rejected_lengths = 0;
  uint32_t rejected_truncated = 0;
  uint32_t rejected_crc = 0;
  uint32_t rejected_decompress = 0;
  uint32_t accepted = 0;
  uint32_t accepted_crc_invalid = 0;
  uint64_t payload_bytes = 0;  // decoded bytes across accepted chunks
  uint64_t stored_bytes = 0;
};

struct ScanReport {
  std::vector<DecodedChunk> chunks;
  ScanStats stats;
};

/**
 * Best-effort chunk finder for raw partition dumps.
 *
 * Candidates are located by magic signature. A rejected candidate moves the
 * cursor one byte past it; an accepted one moves it to offset + data_len.
 * The cursor strictly increases, so the scan always terminates.
 */
class RecoveryScanner {
public:
  explicit RecoveryScanner(ScanOptions options = ScanOptions(), ILogger* logger = nullptr);

  ScanReport scan(const uint8_t* data, size_t len) const;
  ScanReport scan(const std::vector<uint8_t>& data) const { return scan(data.data(), data.size()); }

private:
  ScanOptions options_;
  ILogger* logger_;
};

inline ScanReport scanBuffer(const uint8_t* data, size_t len, const ScanOptions& options,
                             ILogger* logger = nullptr) {
  return RecoveryScanner(options, logger).scan(data, len);
}

}  // namespace mslog

#endif  // INC_MSLOG_RECOVERY_SCANNER_H_

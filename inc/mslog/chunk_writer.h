#ifndef INC_MSLOG_CHUNK_WRITER_H_
#define INC_MSLOG_CHUNK_WRITER_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "mslog/byte_io.h"
#include "mslog/diag_logger.h"
#include "mslog/log_config.h"
#include "mslog/log_format.h"

namespace mslog {

struct WriterConfig {
  uint32_t compress_threshold = kDefaultCompressThreshold;  // payloads below stay raw
  uint8_t min_savings_pct = kDefaultMinSavingsPct;
  int compress_level = kDefaultCompressLevel;
  bool compression_enabled = true;
};

/**
 * Encodes payloads into chunks and appends them to a sink.
 *
 * Compression is attempted at or above `compress_threshold` and kept only if
 * compressed + header < raw - raw * min_savings_pct / 100. A percentage
 * above 100 is clamped to 100, which keeps every payload raw.
 */
class ChunkWriter {
public:
  explicit ChunkWriter(WriterConfig config = WriterConfig(), ILogger* logger = nullptr);

  /**
   * Write one chunk. Returns false for an empty payload, one above
   * kMaxChunkBytes, or when the sink refused the bytes; the reason is then
   * in lastError().
   * @param out_header Optional, receives the header that was written.
   */
  bool write(ByteSink& sink, const uint8_t* payload, size_t len,
             uint64_t node_id, uint32_t timestamp, ChunkHeader* out_header = nullptr);

  /**
   * Build the header and stored bytes without writing them.
   * `stored` receives either the payload or its raw deflate form.
   */
  ChunkHeader encode(const uint8_t* payload, size_t len, uint64_t node_id,
                     uint32_t timestamp, std::vector<uint8_t>* stored) const;

  const std::string& lastError() const { return error_; }

private:
  bool shouldKeepCompressed(size_t raw_len, size_t compressed_len) const;

  WriterConfig config_;
  ILogger* logger_;
  std::string error_;
};

}  // namespace mslog

#endif  // INC_MSLOG_CHUNK_WRITER_H_

#ifndef INC_MSLOG_SEQUENTIAL_READER_H_
#define INC_MSLOG_SEQUENTIAL_READER_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "mslog/byte_io.h"
#include "mslog/diag_logger.h"
#include "mslog/log_format.h"

namespace mslog {

struct ReaderOptions {
  bool verify_crc = true;
};

struct ReadResult {
  ChunkStatus status = ChunkStatus::END_OF_STREAM;
  uint64_t offset = 0;  // header offset of the chunk this result is about
  DecodedChunk chunk;   // filled for OK; header-only for skipped chunks
  std::string detail;
};

struct ReadSummary {
  std::vector<DecodedChunk> chunks;
  uint32_t headers_read = 0;
  uint32_t crc_failures = 0;
  uint32_t decode_failures = 0;
  ChunkStatus terminal_status = ChunkStatus::END_OF_STREAM;
  uint64_t terminal_offset = 0;
  std::string terminal_detail;

  bool cleanEnd() const { return terminal_status == ChunkStatus::END_OF_STREAM; }
};

/**
 * Strict forward parser over a well-formed log.
 *
 * Each next() consumes one chunk. Framing errors (truncation, bad magic,
 * read failure) are terminal: every later call repeats that status.
 * CRC_MISMATCH and DECOMPRESS_FAILED skip the one chunk and leave the
 * reader positioned on the following header.
 */
class SequentialReader {
public:
  explicit SequentialReader(ByteSource& source, ReaderOptions options = ReaderOptions(),
                            ILogger* logger = nullptr);

  ReadResult next();

  /** Drain the remaining stream, keeping only OK chunks. */
  ReadSummary readAll();

  bool done() const { return done_; }
  uint64_t position() const { return position_; }

private:
  ReadResult finish(ChunkStatus status, uint64_t offset, std::string detail);
  bool readPayload(uint32_t data_len, std::vector<uint8_t>* out);

  ByteSource& source_;
  ReaderOptions options_;
  ILogger* logger_;
  uint64_t position_;
  uint32_t chunk_num_;
  bool done_;
  ReadResult terminal_;
};

}  // namespace mslog

#endif  // INC_MSLOG_SEQUENTIAL_READER_H_

#ifndef INC_MSLOG_LINE_LOGGER_H_
#define INC_MSLOG_LINE_LOGGER_H_

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "mslog/byte_io.h"
#include "mslog/chunk_writer.h"
#include "mslog/diag_logger.h"
#include "mslog/log_config.h"

namespace mslog {

// Seconds since boot.
class Clock {
public:
  virtual ~Clock() = default;
  virtual uint32_t uptimeSeconds() const = 0;
};

class SteadyClock : public Clock {
public:
  SteadyClock();
  uint32_t uptimeSeconds() const override;

private:
  uint64_t start_ms_;
};

struct LineLoggerConfig {
  size_t block_capacity = kDefaultBlockCapacity;
  size_t flush_threshold = kDefaultFlushThreshold;
};

/**
 * Node-side telemetry appender.
 *
 * Lines are buffered with a trailing '\n' and written as one chunk when the
 * buffer reaches the flush threshold, when the next line does not fit, or on
 * flush(). A line larger than the whole buffer gets a chunk of its own.
 * Call flush() before power-down.
 */
class LineLogger {
public:
  LineLogger(ByteSink& sink, ChunkWriter& writer, const Clock& clock, uint64_t node_id,
             LineLoggerConfig config = LineLoggerConfig(), ILogger* logger = nullptr);

  bool appendLine(const std::string& line);
  bool flush();

  /** Sync wall-clock time; later chunks carry boot_time + uptime. */
  void setTime(uint32_t unix_timestamp);

  /** Unix time once synced, otherwise seconds since boot. */
  uint32_t timestamp() const;

  size_t pendingBytes() const;
  uint32_t chunksWritten() const { return chunks_written_; }
  uint64_t nodeId() const { return node_id_; }

private:
  bool flushLocked();
  uint32_t timestampLocked() const;
  bool writeChunk(const uint8_t* data, size_t len);

  ByteSink& sink_;
  ChunkWriter& writer_;
  const Clock& clock_;
  uint64_t node_id_;
  LineLoggerConfig config_;
  ILogger* logger_;

  mutable std::mutex mutex_;
  std::vector<uint8_t> block_;
  uint32_t boot_timestamp_;
  uint32_t chunks_written_;
};

}  // namespace mslog

#endif  // INC_MSLOG_LINE_LOGGER_H_

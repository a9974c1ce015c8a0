#include "mslog/line_logger.h"

#include <chrono>

namespace mslog {
namespace {

uint64_t steadyMillis() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now().time_since_epoch()).count());
}

}  // namespace

SteadyClock::SteadyClock() : start_ms_(steadyMillis()) {}

uint32_t SteadyClock::uptimeSeconds() const {
  return static_cast<uint32_t>((steadyMillis() - start_ms_) / 1000u);
}

LineLogger::LineLogger(ByteSink& sink, ChunkWriter& writer, const Clock& clock, uint64_t node_id,
                       LineLoggerConfig config, ILogger* logger)
    : sink_(sink),
      writer_(writer),
      clock_(clock),
      node_id_(node_id),
      config_(config),
      logger_(logger),
      boot_timestamp_(0u),
      chunks_written_(0u) {
  if (config_.flush_threshold == 0u || config_.flush_threshold > config_.block_capacity) {
    config_.flush_threshold = config_.block_capacity;
  }
  block_.reserve(config_.block_capacity);
}

void LineLogger::setTime(uint32_t unix_timestamp) {
  std::lock_guard<std::mutex> lock(mutex_);
  const uint32_t uptime = clock_.uptimeSeconds();
  boot_timestamp_ = unix_timestamp - uptime;
  logf(logger_, LogLevel::INFO, "Time synced: Unix=%u Boot=%u Uptime=%u",
       static_cast<unsigned>(unix_timestamp), static_cast<unsigned>(boot_timestamp_),
       static_cast<unsigned>(uptime));
}

uint32_t LineLogger::timestamp() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timestampLocked();
}

uint32_t LineLogger::timestampLocked() const {
  const uint32_t uptime = clock_.uptimeSeconds();
  if (boot_timestamp_ > 0u) return boot_timestamp_ + uptime;
  return uptime;
}

size_t LineLogger::pendingBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return block_.size();
}

bool LineLogger::writeChunk(const uint8_t* data, size_t len) {
  if (!writer_.write(sink_, data, len, node_id_, timestampLocked())) {
    logf(logger_, LogLevel::ERROR, "Chunk write failed: %s", writer_.lastError().c_str());
    return false;
  }
  ++chunks_written_;
  return true;
}

bool LineLogger::flushLocked() {
  if (block_.empty()) return true;
  logf(logger_, LogLevel::DEBUG, "Flush start: %zu bytes", block_.size());
  if (!writeChunk(block_.data(), block_.size())) return false;
  block_.clear();
  return true;
}

bool LineLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  return flushLocked();
}

bool LineLogger::appendLine(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t need = line.size() + 1u;  // + '\n'

  if (need > config_.block_capacity) {
    if (!flushLocked()) return false;
    std::vector<uint8_t> own(line.begin(), line.end());
    own.push_back('\n');
    return writeChunk(own.data(), own.size());
  }

  if (block_.size() + need > config_.block_capacity) {
    if (!flushLocked()) return false;
  }

  block_.insert(block_.end(), line.begin(), line.end());
  block_.push_back('\n');

  if (block_.size() >= config_.flush_threshold) {
    return flushLocked();
  }
  return true;
}

}  // namespace mslog

#include "mslog/diag_logger.h"

#include <cstdarg>

namespace mslog {

const char* toString(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
  }
  return "?";
}

void MultiLogger::addSink(ILogger* sink) {
  if (sink != nullptr) sinks.push_back(sink);
}

void MultiLogger::log(LogLevel level, const std::string& message) {
  for (auto* sink : sinks) {
    sink->log(level, message);
  }
}

StreamLogger::StreamLogger(std::FILE* stream, LogLevel minLevel)
    : stream(stream), minLevel(minLevel) {}

void StreamLogger::log(LogLevel level, const std::string& message) {
  if (stream == nullptr || level < minLevel) return;
  std::fprintf(stream, "[%s] %s\n", toString(level), message.c_str());
}

void logf(ILogger* logger, LogLevel level, const char* fmt, ...) {
  if (logger == nullptr || fmt == nullptr) return;

  char buf[512];
  va_list args;
  va_start(args, fmt);
  const int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);
  if (n < 0) return;

  if (static_cast<size_t>(n) < sizeof(buf)) {
    logger->log(level, std::string(buf, static_cast<size_t>(n)));
    return;
  }

  std::string big(static_cast<size_t>(n) + 1u, '\0');
  va_start(args, fmt);
  std::vsnprintf(&big[0], big.size(), fmt, args);
  va_end(args);
  big.resize(static_cast<size_t>(n));
  logger->log(level, big);
}

}  // namespace mslog

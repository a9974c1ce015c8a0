#ifndef INC_MSLOG_DIAG_LOGGER_H_
#define INC_MSLOG_DIAG_LOGGER_H_

#include <cstdio>
#include <string>
#include <vector>

namespace mslog {

// Diagnostic levels
enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARN = 2,
  ERROR = 3
};

const char* toString(LogLevel level);

// Logger interface
class ILogger {
public:
  virtual ~ILogger() = default;
  virtual void log(LogLevel level, const std::string& message) = 0;
};

// Multi-logger that dispatches to multiple sinks
class MultiLogger : public ILogger {
private:
  std::vector<ILogger*> sinks;

public:
  void addSink(ILogger* sink);
  void log(LogLevel level, const std::string& message) override;
};

// Writes "[LEVEL] message" lines to a stdio stream, dropping anything below `minLevel`
class StreamLogger : public ILogger {
private:
  std::FILE* stream;
  LogLevel minLevel;

public:
  explicit StreamLogger(std::FILE* stream, LogLevel minLevel = LogLevel::INFO);
  void setMinLevel(LogLevel level) { minLevel = level; }
  LogLevel getMinLevel() const { return minLevel; }
  void log(LogLevel level, const std::string& message) override;
};

// printf-style helper; a null logger is a no-op
void logf(ILogger* logger, LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

}  // namespace mslog

#endif  // INC_MSLOG_DIAG_LOGGER_H_

#include "mslog/salvage.h"

#include <ArduinoJson.h>

#include <sstream>

namespace mslog {
namespace {

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

std::string trim(const char* begin, const char* end) {
  while (begin < end && isSpace(*begin)) ++begin;
  while (end > begin && isSpace(*(end - 1))) --end;
  return std::string(begin, end);
}

}  // namespace

bool validateRecord(const std::string& line, std::string* out) {
  JsonDocument doc;
  std::istringstream in(line);
  DeserializationError error = deserializeJson(doc, in);
  if (error) return false;
  if (!doc.is<JsonObject>()) return false;

  // The parser stops after the first value; anything but whitespace after it is junk.
  in >> std::ws;
  if (in.peek() != std::char_traits<char>::eof()) return false;
  if (out != nullptr) {
    out->clear();
    serializeJson(doc, *out);
  }
  return true;
}

void salvageLines(const uint8_t* data, size_t len, SalvageResult* result) {
  if (data == nullptr || result == nullptr) return;
  const char* text = reinterpret_cast<const char*>(data);
  const char* end = text + len;

  while (text < end) {
    const char* nl = text;
    while (nl < end && *nl != '\n' && *nl != '\r') ++nl;
    const std::string line = trim(text, nl);
    text = (nl < end) ? nl + 1 : end;

    if (line.empty()) continue;
    ++result->lines_seen;
    // Heuristic: records start with { and end with }
    if (line.front() != '{' || line.back() != '}') continue;
    ++result->candidates;

    std::string minified;
    if (validateRecord(line, &minified)) {
      result->records.push_back(minified);
    } else {
      ++result->rejected;
    }
  }
}

SalvageResult salvageLines(const std::vector<DecodedChunk>& chunks) {
  SalvageResult result;
  for (const auto& chunk : chunks) {
    ++result.chunks_used;
    salvageLines(chunk.payload.data(), chunk.payload.size(), &result);
  }
  return result;
}

SalvageResult salvageDump(const uint8_t* data, size_t len, ScanOptions options, ILogger* logger) {
  options.force = true;
  const ScanReport report = RecoveryScanner(options, logger).scan(data, len);

  SalvageResult result = salvageLines(report.chunks);
  if (report.chunks.empty()) {
    logf(logger, LogLevel::WARN, "No chunk framing recovered, salvaging raw buffer (%zu bytes)", len);
    result.used_whole_buffer = true;
    salvageLines(data, len, &result);
  }
  logf(logger, LogLevel::INFO, "Extracted %zu valid JSON lines", result.records.size());
  return result;
}

}  // namespace mslog

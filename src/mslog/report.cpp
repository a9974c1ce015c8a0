#include "mslog/report.h"

#include <ArduinoJson.h>

#include <cstdio>
#include <sstream>

#include "mslog/node_identity.h"

namespace mslog {
namespace {

// Whole payload must be one JSON value, optionally followed by whitespace.
bool parsePayload(const std::vector<uint8_t>& payload, JsonDocument* doc) {
  if (payload.empty()) return false;
  std::istringstream in(std::string(payload.begin(), payload.end()));
  if (deserializeJson(*doc, in)) return false;
  in >> std::ws;
  return in.peek() == std::char_traits<char>::eof();
}

}  // namespace

ReportTotals summarize(const std::vector<DecodedChunk>& chunks) {
  ReportTotals totals;
  for (const auto& chunk : chunks) {
    ++totals.chunks;
    totals.raw_bytes += chunk.payload.size();
    totals.stored_bytes += chunk.header.data_len;
    if (chunk.compressed()) {
      totals.compressed_bytes += chunk.header.data_len;
      totals.compressed_raw_bytes += chunk.header.raw_len;
    }
    if (chunk.crc_checked) {
      ++totals.crc_checked;
      if (chunk.crc_valid) {
        ++totals.crc_pass;
      } else {
        ++totals.crc_fail;
      }
    }
  }
  return totals;
}

std::string formatSummary(const ReportTotals& totals, bool verified) {
  char line[128];
  std::string out = "\n=== Summary ===\n";

  std::snprintf(line, sizeof(line), "Total chunks: %u\n", static_cast<unsigned>(totals.chunks));
  out += line;
  std::snprintf(line, sizeof(line), "Total raw data: %llu bytes\n",
                static_cast<unsigned long long>(totals.raw_bytes));
  out += line;
  std::snprintf(line, sizeof(line), "Total stored: %llu bytes\n",
                static_cast<unsigned long long>(totals.stored_bytes));
  out += line;
  if (totals.compressed_bytes > 0u && totals.compressed_raw_bytes > 0u) {
    std::snprintf(line, sizeof(line), "Total compressed: %llu bytes (%.1f%%)\n",
                  static_cast<unsigned long long>(totals.compressed_bytes),
                  100.0 * static_cast<double>(totals.compressed_bytes) /
                      static_cast<double>(totals.compressed_raw_bytes));
    out += line;
  }
  if (verified) {
    std::snprintf(line, sizeof(line), "CRC32 validation: %u/%u PASS\n",
                  static_cast<unsigned>(totals.crc_pass), static_cast<unsigned>(totals.chunks));
    out += line;
  }
  if (totals.skipped > 0u) {
    std::snprintf(line, sizeof(line), "Skipped chunks: %u\n", static_cast<unsigned>(totals.skipped));
    out += line;
  }
  return out;
}

std::string describeChunk(const DecodedChunk& chunk) {
  const char* crc_state = "";
  if (chunk.crc_checked) crc_state = chunk.crc_valid ? " PASS" : " FAIL";

  char line[256];
  std::snprintf(line, sizeof(line), "Chunk %u: %s | %u bytes | CRC32=0x%08X%s | Node: %s | Time: %s",
                static_cast<unsigned>(chunk.index), chunk.compressed() ? "DEFLATE" : "RAW",
                static_cast<unsigned>(chunk.header.raw_len), static_cast<unsigned>(chunk.header.crc32),
                crc_state, chunk.node_id.c_str(), formatTimestamp(chunk.header.timestamp).c_str());
  std::string out = line;
  if (chunk.compressed() && chunk.header.raw_len > 0u) {
    std::snprintf(line, sizeof(line), "\n           Compressed: %u bytes (%.1f%%)",
                  static_cast<unsigned>(chunk.header.data_len),
                  100.0 * chunk.header.data_len / chunk.header.raw_len);
    out += line;
  }
  if (chunk.truncated) out += "\n           Truncated by end of dump";
  return out;
}

bool chunkToJson(const DecodedChunk& chunk, std::string* out, bool pretty) {
  if (out == nullptr) return false;

  JsonDocument sensors;
  if (!parsePayload(chunk.payload, &sensors)) return false;

  JsonDocument doc;
  doc["chunk"] = chunk.index;
  doc["node_id"] = chunk.node_id;
  doc["timestamp"] = formatTimestamp(chunk.header.timestamp, "NO_TIMESTAMP");
  doc["sensors"] = sensors.as<JsonVariantConst>();

  out->clear();
  if (pretty) {
    serializeJsonPretty(doc, *out);
  } else {
    serializeJson(doc, *out);
  }
  return true;
}

std::string hexString(const uint8_t* data, size_t len) {
  static const char kDigits[] = "0123456789abcdef";
  std::string out;
  if (data == nullptr) return out;
  out.reserve(len * 2u);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0Fu]);
  }
  return out;
}

}  // namespace mslog

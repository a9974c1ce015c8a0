#include "mslog/settings.h"

#include <ArduinoJson.h>

#include <vector>

#include "mslog/byte_io.h"
#include "mslog/node_identity.h"

namespace mslog {

bool parseSettings(const std::string& json, Settings* settings, std::string* error) {
  if (settings == nullptr) return false;

  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    if (error != nullptr) *error = err.c_str();
    return false;
  }
  if (!doc.is<JsonObject>()) {
    if (error != nullptr) *error = "settings must be a JSON object";
    return false;
  }

  if (doc["verify_crc"].is<bool>()) {
    settings->verify_crc = doc["verify_crc"].as<bool>();
  }
  if (doc["force"].is<bool>()) {
    settings->force = doc["force"].as<bool>();
  }
  if (doc["flash_pages"].is<bool>()) {
    settings->flash_pages = doc["flash_pages"].as<bool>();
  }
  if (doc["flash_page_size"].is<uint32_t>()) {
    settings->flash_page_size = doc["flash_page_size"].as<uint32_t>();
  }
  if (doc["flash_page_header"].is<uint32_t>()) {
    settings->flash_page_header = doc["flash_page_header"].as<uint32_t>();
  }
  if (doc["max_chunk_bytes"].is<uint32_t>()) {
    settings->max_chunk_bytes = doc["max_chunk_bytes"].as<uint32_t>();
  }
  if (doc["compress_threshold"].is<uint32_t>()) {
    settings->compress_threshold = doc["compress_threshold"].as<uint32_t>();
  }
  if (doc["min_savings_pct"].is<int>()) {
    const int pct = doc["min_savings_pct"].as<int>();
    settings->min_savings_pct = static_cast<uint8_t>((pct < 0 || pct > 255) ? 255 : pct);
  }
  if (doc["compress_level"].is<int>()) {
    settings->compress_level = doc["compress_level"].as<int>();
  }
  if (doc["max_file_bytes"].is<uint32_t>()) {
    settings->max_file_bytes = doc["max_file_bytes"].as<uint32_t>();
  }

  if (doc["node_id"].is<const char*>()) {
    uint64_t node_id = 0;
    if (!parseNodeId(doc["node_id"].as<std::string>(), &node_id)) {
      if (error != nullptr) *error = "node_id must look like AA:BB:CC:DD:EE:FF";
      return false;
    }
    settings->node_id = node_id;
  } else if (doc["node_id"].is<uint64_t>()) {
    settings->node_id = doc["node_id"].as<uint64_t>();
  }

  return true;
}

bool loadSettings(const std::string& path, Settings* settings, std::string* error) {
  std::vector<uint8_t> bytes;
  if (!readFile(path, &bytes, error)) return false;
  return parseSettings(std::string(bytes.begin(), bytes.end()), settings, error);
}

bool sanitizeSettings(Settings* settings) {
  if (settings == nullptr) return false;
  const Settings defaults;
  bool changed = false;

  // Page header has to leave room for data in every page
  if (settings->flash_page_size == 0u || settings->flash_page_header >= settings->flash_page_size) {
    settings->flash_page_size = defaults.flash_page_size;
    settings->flash_page_header = defaults.flash_page_header;
    changed = true;
  }

  if (settings->max_chunk_bytes == 0u || settings->max_chunk_bytes > kMaxChunkBytes) {
    settings->max_chunk_bytes = defaults.max_chunk_bytes;
    changed = true;
  }

  if (settings->min_savings_pct > 100u) {
    settings->min_savings_pct = defaults.min_savings_pct;
    changed = true;
  }

  // deflate levels 1..9
  if (settings->compress_level < 1 || settings->compress_level > 9) {
    settings->compress_level = defaults.compress_level;
    changed = true;
  }

  // A rotation limit smaller than one header would rotate on every write
  if (settings->max_file_bytes < kHeaderSize) {
    settings->max_file_bytes = defaults.max_file_bytes;
    changed = true;
  }

  // 48-bit MAC space
  if (settings->node_id > 0xFFFFFFFFFFFFull) {
    settings->node_id &= 0xFFFFFFFFFFFFull;
    changed = true;
  }

  return changed;
}

std::string settingsToJson(const Settings& settings) {
  JsonDocument doc;

  doc["verify_crc"] = settings.verify_crc;
  doc["force"] = settings.force;
  doc["flash_pages"] = settings.flash_pages;
  doc["flash_page_size"] = settings.flash_page_size;
  doc["flash_page_header"] = settings.flash_page_header;
  doc["max_chunk_bytes"] = settings.max_chunk_bytes;
  doc["compress_threshold"] = settings.compress_threshold;
  doc["min_savings_pct"] = settings.min_savings_pct;
  doc["compress_level"] = settings.compress_level;
  doc["max_file_bytes"] = settings.max_file_bytes;
  doc["node_id"] = formatNodeId(settings.node_id);

  std::string out;
  serializeJson(doc, out);
  return out;
}

WriterConfig toWriterConfig(const Settings& settings) {
  WriterConfig config;
  config.compress_threshold = settings.compress_threshold;
  config.min_savings_pct = settings.min_savings_pct;
  config.compress_level = settings.compress_level;
  return config;
}

ScanOptions toScanOptions(const Settings& settings) {
  ScanOptions options;
  options.verify_crc = settings.verify_crc;
  options.force = settings.force;
  options.flash_pages = settings.flash_pages;
  options.layout.page_size = settings.flash_page_size;
  options.layout.header_size = settings.flash_page_header;
  options.max_chunk_bytes = settings.max_chunk_bytes;
  return options;
}

ReaderOptions toReaderOptions(const Settings& settings) {
  ReaderOptions options;
  options.verify_crc = settings.verify_crc;
  return options;
}

}  // namespace mslog

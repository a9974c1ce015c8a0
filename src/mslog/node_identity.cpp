#include "mslog/node_identity.h"

#include <cstdio>
#include <ctime>

namespace mslog {
namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

uint64_t nodeIdFromMac(const uint8_t mac[6]) {
  return (static_cast<uint64_t>(mac[0]) << 40) |
         (static_cast<uint64_t>(mac[1]) << 32) |
         (static_cast<uint64_t>(mac[2]) << 24) |
         (static_cast<uint64_t>(mac[3]) << 16) |
         (static_cast<uint64_t>(mac[4]) << 8) |
         (static_cast<uint64_t>(mac[5]));
}

std::string formatNodeId(uint64_t node_id) {
  uint8_t mac[6];
  for (int i = 0; i < 6; ++i) {
    mac[5 - i] = static_cast<uint8_t>((node_id >> (i * 8)) & 0xFFu);
  }
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
  return std::string(buf);
}

bool parseNodeId(const std::string& text, uint64_t* out_node_id) {
  if (out_node_id == nullptr || text.size() != 17u) return false;
  uint8_t mac[6];
  for (size_t i = 0; i < 6u; ++i) {
    const size_t at = i * 3u;
    if (i > 0u && text[at - 1u] != ':') return false;
    const int hi = hexValue(text[at]);
    const int lo = hexValue(text[at + 1u]);
    if (hi < 0 || lo < 0) return false;
    mac[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  *out_node_id = nodeIdFromMac(mac);
  return true;
}

std::string formatTimestamp(uint32_t timestamp, const char* none_text) {
  if (timestamp == 0u) return std::string(none_text == nullptr ? "" : none_text);
  const std::time_t t = static_cast<std::time_t>(timestamp);
  std::tm tm_utc = {};
  if (gmtime_r(&t, &tm_utc) == nullptr) return std::string(none_text == nullptr ? "" : none_text);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_utc);
  return std::string(buf);
}

}  // namespace mslog

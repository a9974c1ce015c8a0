#include "mslog/crc32.h"

namespace mslog {

uint32_t crc32Update(uint32_t crc, const uint8_t* data, size_t len) {
  crc = ~crc;
  for (size_t i = 0; i < len; ++i) {
    crc ^= data[i];
    for (int bit = 0; bit < 8; ++bit) {
      crc = (crc >> 1) ^ (kCrc32PolyReflected & static_cast<uint32_t>(-(static_cast<int32_t>(crc & 1u))));
    }
  }
  return ~crc;
}

uint32_t crc32Buffer(const void* data, size_t len) {
  if (data == nullptr || len == 0u) return 0u;
  return crc32Update(0u, reinterpret_cast<const uint8_t*>(data), len);
}

}  // namespace mslog

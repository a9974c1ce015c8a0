#ifndef INC_MSLOG_CRC32_H_
#define INC_MSLOG_CRC32_H_

#include <cstddef>
#include <cstdint>

namespace mslog {

constexpr uint32_t kCrc32PolyReflected = 0xEDB88320u;

/**
 * Standard CRC-32 (IEEE 802.3, reflected, init and final xor 0xFFFFFFFF).
 * Chains the same way as zlib's crc32(): pass the previous result as `crc`,
 * start from 0.
 */
uint32_t crc32Update(uint32_t crc, const uint8_t* data, size_t len);

uint32_t crc32Buffer(const void* data, size_t len);

}  // namespace mslog

#endif  // INC_MSLOG_CRC32_H_

#ifndef INC_MSLOG_CHUNK_DECODER_H_
#define INC_MSLOG_CHUNK_DECODER_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "mslog/log_format.h"

namespace mslog {

// Validation steps shared by the sequential reader and the recovery scanner.
// `chunk->header` must be filled in before calling either.

/**
 * Recompute the CRC over the stored bytes. Sets crc_checked, crc_valid and
 * computed_crc on `chunk`.
 * @return true if the CRC matches the header
 */
bool checkCrc(const uint8_t* stored, size_t len, DecodedChunk* chunk);

/**
 * Turn stored bytes into the application payload: a copy for raw chunks,
 * an inflate for deflate chunks. A decompressed size that differs from
 * raw_len sets length_mismatch but still returns OK.
 * @param detail Receives the codec message on DECOMPRESS_FAILED
 */
ChunkStatus decodeStored(const uint8_t* stored, size_t len, DecodedChunk* chunk,
                         std::string* detail = nullptr);

}  // namespace mslog

#endif  // INC_MSLOG_CHUNK_DECODER_H_

#include "mslog/chunk_decoder.h"

#include <vector>

#include "mslog/compression.h"
#include "mslog/crc32.h"

namespace mslog {

bool checkCrc(const uint8_t* stored, size_t len, DecodedChunk* chunk) {
  if (chunk == nullptr) return false;
  chunk->computed_crc = crc32Buffer(stored, len);
  chunk->crc_checked = true;
  chunk->crc_valid = (chunk->computed_crc == chunk->header.crc32);
  return chunk->crc_valid;
}

ChunkStatus decodeStored(const uint8_t* stored, size_t len, DecodedChunk* chunk,
                         std::string* detail) {
  if (chunk == nullptr) return ChunkStatus::DECOMPRESS_FAILED;

  if (chunk->header.algo != static_cast<uint8_t>(Algo::DEFLATE)) {
    chunk->payload.assign(stored, stored + len);
    return ChunkStatus::OK;
  }

  std::string error;
  const CodecStatus rc = decompressRaw(stored, len, chunk->header.raw_len, &chunk->payload, &error);
  if (rc == CodecStatus::DECOMPRESS_FAILED) {
    if (detail != nullptr) *detail = error;
    chunk->payload.clear();
    return ChunkStatus::DECOMPRESS_FAILED;
  }
  chunk->length_mismatch = (rc == CodecStatus::LENGTH_MISMATCH);
  if (detail != nullptr) *detail = error;
  return ChunkStatus::OK;
}

}  // namespace mslog

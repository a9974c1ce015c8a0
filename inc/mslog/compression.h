#ifndef INC_MSLOG_COMPRESSION_H_
#define INC_MSLOG_COMPRESSION_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mslog {

enum class CodecStatus : uint8_t {
  OK = 0,
  LENGTH_MISMATCH = 1,    // stream decoded, but not to the expected size
  DECOMPRESS_FAILED = 2,
  COMPRESS_FAILED = 3
};

const char* toString(CodecStatus status);

// Upper bound on decompressed output, guards against runaway streams.
constexpr size_t kMaxInflateBytes = 64u * 1024u * 1024u;

/** Worst-case raw deflate size for `in_len` input bytes. */
size_t rawDeflateBound(size_t in_len);

/**
 * Raw deflate (no zlib header or adler trailer).
 * @param level 1 (fastest) .. 9 (best ratio)
 */
CodecStatus compressRaw(const uint8_t* in, size_t in_len, int level,
                        std::vector<uint8_t>* out);

/**
 * Inflate a raw deflate stream. A size that differs from `expected_len`
 * yields LENGTH_MISMATCH with `out` still filled. Pass 0 to skip the check.
 */
CodecStatus decompressRaw(const uint8_t* in, size_t in_len, size_t expected_len,
                          std::vector<uint8_t>* out, std::string* error = nullptr);

}  // namespace mslog

#endif  // INC_MSLOG_COMPRESSION_H_

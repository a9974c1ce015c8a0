#include "mslog/compression.h"

#include <zlib.h>

#include <algorithm>

namespace mslog {
namespace {

constexpr int kRawDeflateWindowBits = -15;
constexpr int kMemLevel = 8;
constexpr size_t kInflateStep = 16u * 1024u;

void setError(std::string* error, const z_stream& strm, const char* fallback) {
  if (error == nullptr) return;
  *error = (strm.msg != nullptr) ? strm.msg : fallback;
}

}  // namespace

const char* toString(CodecStatus status) {
  switch (status) {
    case CodecStatus::OK: return "ok";
    case CodecStatus::LENGTH_MISMATCH: return "length mismatch";
    case CodecStatus::DECOMPRESS_FAILED: return "decompression failed";
    case CodecStatus::COMPRESS_FAILED: return "compression failed";
  }
  return "unknown";
}

size_t rawDeflateBound(size_t in_len) {
  // deflateBound() for raw streams, plus slack for stored blocks.
  return in_len + (in_len >> 12) + (in_len >> 14) + (in_len >> 25) + 13u + 64u;
}

CodecStatus compressRaw(const uint8_t* in, size_t in_len, int level,
                        std::vector<uint8_t>* out) {
  if (out == nullptr || (in == nullptr && in_len > 0u)) return CodecStatus::COMPRESS_FAILED;
  level = std::min(std::max(level, 1), 9);

  z_stream strm = {};
  if (deflateInit2(&strm, level, Z_DEFLATED, kRawDeflateWindowBits, kMemLevel,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    return CodecStatus::COMPRESS_FAILED;
  }

  out->resize(std::max<size_t>(deflateBound(&strm, static_cast<uLong>(in_len)), rawDeflateBound(in_len)));
  strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in));
  strm.avail_in = static_cast<uInt>(in_len);
  strm.next_out = reinterpret_cast<Bytef*>(out->data());
  strm.avail_out = static_cast<uInt>(out->size());

  const int rc = deflate(&strm, Z_FINISH);
  const size_t produced = strm.total_out;
  deflateEnd(&strm);

  if (rc != Z_STREAM_END) {
    out->clear();
    return CodecStatus::COMPRESS_FAILED;
  }
  out->resize(produced);
  return CodecStatus::OK;
}

CodecStatus decompressRaw(const uint8_t* in, size_t in_len, size_t expected_len,
                          std::vector<uint8_t>* out, std::string* error) {
  if (out == nullptr) return CodecStatus::DECOMPRESS_FAILED;
  out->clear();
  if (in == nullptr || in_len == 0u) {
    if (error != nullptr) *error = "empty input";
    return CodecStatus::DECOMPRESS_FAILED;
  }

  z_stream strm = {};
  if (inflateInit2(&strm, kRawDeflateWindowBits) != Z_OK) {
    setError(error, strm, "inflateInit2 failed");
    return CodecStatus::DECOMPRESS_FAILED;
  }

  strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in));
  strm.avail_in = static_cast<uInt>(in_len);

  const size_t first = (expected_len > 0u) ? std::min(expected_len, kMaxInflateBytes) : kInflateStep;
  out->resize(first);
  size_t produced = 0u;
  int rc = Z_OK;

  while (true) {
    if (produced == out->size()) {
      if (out->size() >= kMaxInflateBytes) {
        inflateEnd(&strm);
        out->clear();
        if (error != nullptr) *error = "output exceeds inflate limit";
        return CodecStatus::DECOMPRESS_FAILED;
      }
      out->resize(std::min(out->size() + kInflateStep, kMaxInflateBytes));
    }
    strm.next_out = reinterpret_cast<Bytef*>(out->data() + produced);
    strm.avail_out = static_cast<uInt>(out->size() - produced);

    rc = inflate(&strm, Z_NO_FLUSH);
    produced = out->size() - strm.avail_out;

    if (rc == Z_STREAM_END) break;
    if (rc == Z_OK) continue;
    if (rc == Z_BUF_ERROR && strm.avail_out == 0u) continue;

    // Z_BUF_ERROR with output room left means the input ran out mid-stream.
    setError(error, strm, rc == Z_BUF_ERROR ? "incomplete or truncated stream" : "invalid deflate stream");
    inflateEnd(&strm);
    out->clear();
    return CodecStatus::DECOMPRESS_FAILED;
  }

  inflateEnd(&strm);
  out->resize(produced);

  if (expected_len > 0u && produced != expected_len) {
    if (error != nullptr) {
      *error = "decompressed " + std::to_string(produced) + " bytes, expected " + std::to_string(expected_len);
    }
    return CodecStatus::LENGTH_MISMATCH;
  }
  return CodecStatus::OK;
}

}  // namespace mslog

#include "mslog/byte_io.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace mslog {
namespace {

std::string errnoText(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

std::string stripExtension(const std::string& path, std::string* ext) {
  const size_t slash = path.find_last_of('/');
  const size_t dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    ext->clear();
    return path;
  }
  *ext = path.substr(dot);
  return path.substr(0, dot);
}

}  // namespace

BufferSource::BufferSource(const uint8_t* data, size_t len)
    : data_(data), len_(data == nullptr ? 0u : len), pos_(0u) {}

BufferSource::BufferSource(const std::vector<uint8_t>& data)
    : data_(data.data()), len_(data.size()), pos_(0u) {}

size_t BufferSource::read(uint8_t* dst, size_t len) {
  const size_t available = len_ - pos_;
  const size_t n = (len < available) ? len : available;
  if (n > 0u) {
    std::memcpy(dst, data_ + pos_, n);
    pos_ += n;
  }
  return n;
}

FileSource::FileSource(const std::string& path)
    : file_(std::fopen(path.c_str(), "rb")), failed_(false) {
  if (file_ == nullptr) {
    failed_ = true;
    error_ = errnoText(path);
  }
}

FileSource::~FileSource() {
  if (file_ != nullptr) std::fclose(file_);
}

size_t FileSource::read(uint8_t* dst, size_t len) {
  if (file_ == nullptr) return 0u;
  size_t total = 0u;
  while (total < len) {
    const size_t n = std::fread(dst + total, 1, len - total, file_);
    total += n;
    if (n == 0u) {
      if (std::ferror(file_)) {
        failed_ = true;
        error_ = errnoText("read");
      }
      break;
    }
  }
  return total;
}

bool MemorySink::write(const uint8_t* data, size_t len) {
  if (len == 0u) return true;
  bytes_.insert(bytes_.end(), data, data + len);
  return true;
}

FileSink::FileSink(std::string path) : path_(std::move(path)) {}

bool FileSink::write(const uint8_t* data, size_t len) {
  std::FILE* f = std::fopen(path_.c_str(), "ab");
  if (f == nullptr) {
    error_ = errnoText(path_);
    return false;
  }
  bool ok = true;
  if (len > 0u && std::fwrite(data, 1, len, f) != len) {
    error_ = errnoText("write " + path_);
    ok = false;
  }
  if (std::fclose(f) != 0 && ok) {
    error_ = errnoText("close " + path_);
    ok = false;
  }
  return ok;
}

RotatingFileSink::RotatingFileSink(std::string path, uint32_t maxBytes)
    : FileSink(std::move(path)), maxBytes_(maxBytes), rotations_(0u) {}

std::string RotatingFileSink::oldPath() const {
  std::string ext;
  const std::string stem = stripExtension(path_, &ext);
  return stem + "_old" + ext;
}

std::string RotatingFileSink::backupPath() const {
  std::string ext;
  const std::string stem = stripExtension(path_, &ext);
  return stem + "_backup" + ext;
}

bool RotatingFileSink::prepare(size_t total_len) {
  const long long current = fileSize(path_);
  if (current <= 0) return true;  // nothing to rotate yet

  const unsigned long long projected = static_cast<unsigned long long>(current) + total_len;
  if (projected < maxBytes_) return true;

  // Older generations may not exist yet
  if (std::remove(backupPath().c_str()) != 0 && errno != ENOENT) {
    error_ = errnoText("remove " + backupPath());
    return false;
  }
  if (std::rename(oldPath().c_str(), backupPath().c_str()) != 0 && errno != ENOENT) {
    error_ = errnoText("rotate " + oldPath());
    return false;
  }
  if (std::rename(path_.c_str(), oldPath().c_str()) != 0) {
    error_ = errnoText("rotate " + path_);
    return false;
  }
  ++rotations_;
  return true;
}

long long fileSize(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return -1;
  return static_cast<long long>(st.st_size);
}

bool readFile(const std::string& path, std::vector<uint8_t>* out, std::string* error) {
  if (out == nullptr) return false;
  out->clear();

  FileSource source(path);
  if (!source.isOpen()) {
    if (error != nullptr) *error = source.lastError();
    return false;
  }

  uint8_t buf[64 * 1024];
  while (true) {
    const size_t n = source.read(buf, sizeof(buf));
    out->insert(out->end(), buf, buf + n);
    if (n < sizeof(buf)) break;
  }
  if (source.failed()) {
    if (error != nullptr) *error = source.lastError();
    return false;
  }
  return true;
}

}  // namespace mslog

#ifndef INC_MSLOG_BYTE_IO_H_
#define INC_MSLOG_BYTE_IO_H_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace mslog {

// Blocking byte source. read() returns fewer bytes than asked only at end of
// data or on failure; failed() tells the two apart.
class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual size_t read(uint8_t* dst, size_t len) = 0;
  virtual bool failed() const = 0;
  virtual std::string lastError() const = 0;
};

// Append-only byte sink.
class ByteSink {
public:
  virtual ~ByteSink() = default;
  virtual bool write(const uint8_t* data, size_t len) = 0;
  virtual std::string lastError() const = 0;
  // Called before a chunk of `total_len` bytes is written.
  virtual bool prepare(size_t total_len) { (void)total_len; return true; }
};

class BufferSource : public ByteSource {
public:
  BufferSource(const uint8_t* data, size_t len);
  explicit BufferSource(const std::vector<uint8_t>& data);
  size_t read(uint8_t* dst, size_t len) override;
  bool failed() const override { return false; }
  std::string lastError() const override { return std::string(); }
  size_t position() const { return pos_; }

private:
  const uint8_t* data_;
  size_t len_;
  size_t pos_;
};

class FileSource : public ByteSource {
public:
  explicit FileSource(const std::string& path);
  ~FileSource() override;
  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  bool isOpen() const { return file_ != nullptr; }
  size_t read(uint8_t* dst, size_t len) override;
  bool failed() const override { return failed_; }
  std::string lastError() const override { return error_; }

private:
  std::FILE* file_;
  bool failed_;
  std::string error_;
};

class MemorySink : public ByteSink {
public:
  bool write(const uint8_t* data, size_t len) override;
  std::string lastError() const override { return std::string(); }
  const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
  std::vector<uint8_t> bytes_;
};

// Opens, appends and closes per write so a reset mid-session keeps earlier chunks.
class FileSink : public ByteSink {
public:
  explicit FileSink(std::string path);
  bool write(const uint8_t* data, size_t len) override;
  std::string lastError() const override { return error_; }
  const std::string& path() const { return path_; }

protected:
  std::string path_;
  std::string error_;
};

/**
 * File sink with a three-generation rotation: when the next chunk would take
 * `path` past `maxBytes`, `path_backup` is dropped, `path_old` becomes
 * `path_backup` and `path` becomes `path_old`.
 */
class RotatingFileSink : public FileSink {
public:
  RotatingFileSink(std::string path, uint32_t maxBytes);
  bool prepare(size_t total_len) override;

  std::string oldPath() const;
  std::string backupPath() const;
  uint32_t rotations() const { return rotations_; }

private:
  uint32_t maxBytes_;
  uint32_t rotations_;
};

/** Size in bytes of a regular file, or -1 if it cannot be stat'ed. */
long long fileSize(const std::string& path);

/** Read a whole file. Returns false with `error` set on failure. */
bool readFile(const std::string& path, std::vector<uint8_t>* out, std::string* error = nullptr);

}  // namespace mslog

#endif  // INC_MSLOG_BYTE_IO_H_

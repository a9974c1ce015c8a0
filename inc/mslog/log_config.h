#ifndef INC_MSLOG_LOG_CONFIG_H_
#define INC_MSLOG_LOG_CONFIG_H_

#include <cstddef>
#include <cstdint>

// Build-time defaults. Runtime overrides live in mslog::Settings.

#ifndef MSLOG_COMPRESS_LEVEL
#define MSLOG_COMPRESS_LEVEL 3
#endif

#ifndef MSLOG_MIN_COMPRESS_BYTES
#define MSLOG_MIN_COMPRESS_BYTES 1024
#endif

// Require at least ~5% savings to store as compressed.
#ifndef MSLOG_MIN_SAVINGS_PCT
#define MSLOG_MIN_SAVINGS_PCT 5
#endif

#ifndef MSLOG_BLOCK_CAP
#define MSLOG_BLOCK_CAP (16 * 1024)
#endif

#ifndef MSLOG_FLUSH_THRESHOLD
#define MSLOG_FLUSH_THRESHOLD (16 * 1024)
#endif

#ifndef MSLOG_MAX_FILE_SIZE
#define MSLOG_MAX_FILE_SIZE (1024 * 1024)  // 1MB before rotation
#endif

#ifndef MSLOG_FLASH_PAGE_SIZE
#define MSLOG_FLASH_PAGE_SIZE 256
#endif

#ifndef MSLOG_FLASH_PAGE_HEADER
#define MSLOG_FLASH_PAGE_HEADER 12
#endif

namespace mslog {

constexpr int kDefaultCompressLevel = MSLOG_COMPRESS_LEVEL;
constexpr uint32_t kDefaultCompressThreshold = MSLOG_MIN_COMPRESS_BYTES;
constexpr uint8_t kDefaultMinSavingsPct = MSLOG_MIN_SAVINGS_PCT;
constexpr size_t kDefaultBlockCapacity = MSLOG_BLOCK_CAP;
constexpr size_t kDefaultFlushThreshold = MSLOG_FLUSH_THRESHOLD;
constexpr uint32_t kDefaultMaxFileBytes = MSLOG_MAX_FILE_SIZE;
constexpr uint32_t kDefaultFlashPageSize = MSLOG_FLASH_PAGE_SIZE;
constexpr uint32_t kDefaultFlashPageHeader = MSLOG_FLASH_PAGE_HEADER;

}  // namespace mslog

#endif  // INC_MSLOG_LOG_CONFIG_H_

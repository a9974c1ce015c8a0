#ifndef INC_MSLOG_SETTINGS_H_
#define INC_MSLOG_SETTINGS_H_

#include <cstdint>
#include <string>

#include "mslog/chunk_writer.h"
#include "mslog/log_config.h"
#include "mslog/log_format.h"
#include "mslog/recovery_scanner.h"
#include "mslog/sequential_reader.h"

namespace mslog {

// Tool settings. Keys in the JSON file match the field names.
struct Settings {
  bool verify_crc = true;
  bool force = false;
  bool flash_pages = false;
  uint32_t flash_page_size = kDefaultFlashPageSize;
  uint32_t flash_page_header = kDefaultFlashPageHeader;
  uint32_t max_chunk_bytes = kMaxChunkBytes;
  uint32_t compress_threshold = kDefaultCompressThreshold;
  uint8_t min_savings_pct = kDefaultMinSavingsPct;
  int compress_level = kDefaultCompressLevel;
  uint32_t max_file_bytes = kDefaultMaxFileBytes;
  uint64_t node_id = 0x1020BA4DF03Cull;
};

/**
 * Apply the keys present in a JSON object onto `settings`. Unknown keys are
 * ignored. `node_id` accepts a MAC string or a number.
 * @return false if the text is not a JSON object
 */
bool parseSettings(const std::string& json, Settings* settings, std::string* error = nullptr);

bool loadSettings(const std::string& path, Settings* settings, std::string* error = nullptr);

/**
 * Validates and sanitizes settings so every value is within its usable range.
 * Out-of-range values fall back to their defaults.
 *
 * @return true if any values were changed during sanitization, false if all valid
 */
bool sanitizeSettings(Settings* settings);

std::string settingsToJson(const Settings& settings);

WriterConfig toWriterConfig(const Settings& settings);
ScanOptions toScanOptions(const Settings& settings);
ReaderOptions toReaderOptions(const Settings& settings);

}  // namespace mslog

#endif  // INC_MSLOG_SETTINGS_H_

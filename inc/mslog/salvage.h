#ifndef INC_MSLOG_SALVAGE_H_
#define INC_MSLOG_SALVAGE_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "mslog/diag_logger.h"
#include "mslog/log_format.h"
#include "mslog/recovery_scanner.h"

namespace mslog {

struct SalvageResult {
  std::vector<std::string> records;  // minified JSON, one per recovered line
  uint32_t lines_seen = 0;
  uint32_t candidates = 0;  // lines shaped like {...}
  uint32_t rejected = 0;    // candidates that failed to parse
  uint32_t chunks_used = 0;
  bool used_whole_buffer = false;
};

/** True if `line` parses as a JSON object on its own. Minified form goes to `out`. */
bool validateRecord(const std::string& line, std::string* out = nullptr);

/** Collect brace-delimited JSON lines from a text buffer. */
void salvageLines(const uint8_t* data, size_t len, SalvageResult* result);

/** Same, over every chunk's payload regardless of its CRC state. */
SalvageResult salvageLines(const std::vector<DecodedChunk>& chunks);

/**
 * Line-level recovery of a damaged dump: scan in force mode and salvage the
 * chunks found; when no chunk framing survives, salvage the raw buffer.
 */
SalvageResult salvageDump(const uint8_t* data, size_t len, ScanOptions options,
                          ILogger* logger = nullptr);

}  // namespace mslog

#endif  // INC_MSLOG_SALVAGE_H_

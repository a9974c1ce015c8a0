// mslogtool: decode, scan and salvage node telemetry logs.

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <vector>

#include <ArduinoJson.h>

#include "mslog/byte_io.h"
#include "mslog/chunk_writer.h"
#include "mslog/diag_logger.h"
#include "mslog/node_identity.h"
#include "mslog/recovery_scanner.h"
#include "mslog/report.h"
#include "mslog/salvage.h"
#include "mslog/sequential_reader.h"
#include "mslog/settings.h"
#include "mslog/version.h"

using namespace mslog;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitNoData = 1;
constexpr int kExitUsage = 2;

enum class OutputMode : uint8_t {
  SUMMARY = 0,
  JSON = 1,
  HEX = 2,
  RAW = 3
};

struct CliOptions {
  std::string command;
  std::string path;
  std::string config_path;
  OutputMode output = OutputMode::SUMMARY;
  bool quiet = false;
  bool verbose = false;
  bool no_verify = false;
  bool force = false;
  bool flash = false;
  long page_size = -1;
  long page_header = -1;
  long long time = -1;
};

void printUsage() {
  std::fprintf(stderr,
               "mslogtool " MSLOG_VERSION_STRING "\n"
               "usage: mslogtool <command> [options] <file>\n"
               "\n"
               "commands:\n"
               "  decode <log>      strict sequential decode of a log file\n"
               "  scan <dump>       recover chunks from a raw partition dump\n"
               "  salvage <dump>    extract valid JSON lines from a damaged dump\n"
               "  generate <out>    write a fixture log\n"
               "\n"
               "options:\n"
               "  --json            print JSON payloads wrapped with chunk metadata\n"
               "  --hex             print payloads as hex\n"
               "  --raw             write payload bytes to stdout\n"
               "  --no-verify       skip CRC32 verification\n"
               "  --force           keep chunks that fail CRC32 (scan)\n"
               "  --flash           strip flash page headers (scan, salvage)\n"
               "  --page-size N     flash page size, default %u\n"
               "  --page-header N   flash page header size, default %u\n"
               "  --time N          base unix time for generate\n"
               "  --config FILE     JSON settings file\n"
               "  --quiet           errors only\n"
               "  --verbose         include debug output\n",
               static_cast<unsigned>(kDefaultFlashPageSize), static_cast<unsigned>(kDefaultFlashPageHeader));
}

bool parseNumber(const char* text, long long* out) {
  if (text == nullptr || *text == '\0') return false;
  char* end = nullptr;
  const long long value = std::strtoll(text, &end, 0);
  if (*end != '\0' || value < 0) return false;
  *out = value;
  return true;
}

bool parseArgs(int argc, char** argv, CliOptions* opts) {
  if (argc < 2) return false;
  opts->command = argv[1];

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    long long value = 0;

    if (arg == "--json") {
      opts->output = OutputMode::JSON;
    } else if (arg == "--hex") {
      opts->output = OutputMode::HEX;
    } else if (arg == "--raw") {
      opts->output = OutputMode::RAW;
    } else if (arg == "--no-verify") {
      opts->no_verify = true;
    } else if (arg == "--force") {
      opts->force = true;
    } else if (arg == "--flash") {
      opts->flash = true;
    } else if (arg == "--quiet") {
      opts->quiet = true;
    } else if (arg == "--verbose") {
      opts->verbose = true;
    } else if (arg == "--page-size" || arg == "--page-header" || arg == "--time") {
      if (i + 1 >= argc || !parseNumber(argv[i + 1], &value)) {
        std::fprintf(stderr, "ERROR: %s needs a non-negative number\n", arg.c_str());
        return false;
      }
      ++i;
      if (arg == "--page-size") {
        opts->page_size = static_cast<long>(value);
      } else if (arg == "--page-header") {
        opts->page_header = static_cast<long>(value);
      } else {
        opts->time = value;
      }
    } else if (arg == "--config") {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "ERROR: --config needs a file\n");
        return false;
      }
      opts->config_path = argv[++i];
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::fprintf(stderr, "ERROR: unknown option %s\n", arg.c_str());
      return false;
    } else if (opts->path.empty()) {
      opts->path = arg;
    } else {
      std::fprintf(stderr, "ERROR: unexpected argument %s\n", arg.c_str());
      return false;
    }
  }
  return !opts->path.empty();
}

// File settings first, then flags on top.
bool buildSettings(const CliOptions& opts, ILogger* logger, Settings* settings) {
  if (!opts.config_path.empty()) {
    std::string error;
    if (!loadSettings(opts.config_path, settings, &error)) {
      logf(logger, LogLevel::ERROR, "Could not load settings %s: %s", opts.config_path.c_str(), error.c_str());
      return false;
    }
  }
  if (opts.no_verify) settings->verify_crc = false;
  if (opts.force) settings->force = true;
  if (opts.flash) settings->flash_pages = true;
  if (opts.page_size >= 0) settings->flash_page_size = static_cast<uint32_t>(opts.page_size);
  if (opts.page_header >= 0) settings->flash_page_header = static_cast<uint32_t>(opts.page_header);

  if (sanitizeSettings(settings)) {
    logf(logger, LogLevel::WARN, "Settings out of range were reset: %s", settingsToJson(*settings).c_str());
  }
  return true;
}

void emitChunks(const std::vector<DecodedChunk>& chunks, OutputMode mode, ILogger* logger) {
  for (const auto& chunk : chunks) {
    switch (mode) {
      case OutputMode::SUMMARY:
        logf(logger, LogLevel::INFO, "%s", describeChunk(chunk).c_str());
        break;
      case OutputMode::JSON: {
        std::string json;
        if (chunkToJson(chunk, &json)) {
          std::printf("%s\n", json.c_str());
        } else {
          logf(logger, LogLevel::INFO, "Chunk %u: Binary data (%u bytes)",
               static_cast<unsigned>(chunk.index), static_cast<unsigned>(chunk.header.raw_len));
        }
        break;
      }
      case OutputMode::HEX:
        std::printf("\n=== Chunk %u ===\n%s\n", static_cast<unsigned>(chunk.index),
                    hexString(chunk.payload.data(), chunk.payload.size()).c_str());
        break;
      case OutputMode::RAW:
        if (!chunk.payload.empty() &&
            std::fwrite(chunk.payload.data(), 1, chunk.payload.size(), stdout) != chunk.payload.size()) {
          logf(logger, LogLevel::ERROR, "stdout write failed");
          return;
        }
        break;
    }
  }
  std::fflush(stdout);
}

void printTotals(const ReportTotals& totals, bool verified, const CliOptions& opts) {
  if (opts.quiet) return;
  std::fputs(formatSummary(totals, verified).c_str(), stderr);
}

int runDecode(const CliOptions& opts, const Settings& settings, ILogger* logger) {
  FileSource source(opts.path);
  if (!source.isOpen()) {
    logf(logger, LogLevel::ERROR, "File not found: %s", source.lastError().c_str());
    return kExitNoData;
  }

  SequentialReader reader(source, toReaderOptions(settings), logger);
  ReadSummary summary = reader.readAll();
  if (!summary.cleanEnd()) {
    logf(logger, LogLevel::WARN, "Stopped at offset 0x%08llX: %s%s%s",
         static_cast<unsigned long long>(summary.terminal_offset), toString(summary.terminal_status),
         summary.terminal_detail.empty() ? "" : " - ", summary.terminal_detail.c_str());
  }

  if (summary.chunks.empty()) {
    logf(logger, LogLevel::ERROR, "No valid chunks found");
    return kExitNoData;
  }

  emitChunks(summary.chunks, opts.output, logger);
  ReportTotals totals = summarize(summary.chunks);
  totals.skipped = summary.crc_failures + summary.decode_failures;
  printTotals(totals, settings.verify_crc, opts);
  return kExitOk;
}

int runScan(const CliOptions& opts, const Settings& settings, ILogger* logger) {
  std::vector<uint8_t> dump;
  std::string error;
  if (!readFile(opts.path, &dump, &error)) {
    logf(logger, LogLevel::ERROR, "File not found: %s", error.c_str());
    return kExitNoData;
  }

  logf(logger, LogLevel::INFO, "Scanning %zu bytes for log chunks...", dump.size());
  const ScanReport report = scanBuffer(dump.data(), dump.size(), toScanOptions(settings), logger);
  logf(logger, LogLevel::INFO, "%u candidates, %u accepted (%u with bad CRC32)",
       static_cast<unsigned>(report.stats.candidates), static_cast<unsigned>(report.stats.accepted),
       static_cast<unsigned>(report.stats.accepted_crc_invalid));

  if (report.chunks.empty()) {
    logf(logger, LogLevel::ERROR, "No valid chunks found");
    return kExitNoData;
  }

  emitChunks(report.chunks, opts.output, logger);
  ReportTotals totals = summarize(report.chunks);
  totals.skipped = report.stats.rejected_crc + report.stats.rejected_decompress;
  printTotals(totals, settings.verify_crc, opts);
  return kExitOk;
}

int runSalvage(const CliOptions& opts, const Settings& settings, ILogger* logger) {
  std::vector<uint8_t> dump;
  std::string error;
  if (!readFile(opts.path, &dump, &error)) {
    logf(logger, LogLevel::ERROR, "File not found: %s", error.c_str());
    return kExitNoData;
  }

  const SalvageResult result = salvageDump(dump.data(), dump.size(), toScanOptions(settings), logger);
  for (const auto& record : result.records) {
    std::printf("%s\n", record.c_str());
  }
  std::fflush(stdout);

  logf(logger, LogLevel::INFO, "%u lines seen, %u candidates, %u rejected, %u chunks used%s",
       static_cast<unsigned>(result.lines_seen), static_cast<unsigned>(result.candidates),
       static_cast<unsigned>(result.rejected), static_cast<unsigned>(result.chunks_used),
       result.used_whole_buffer ? " (raw buffer)" : "");
  return result.records.empty() ? kExitNoData : kExitOk;
}

// One sensor snapshot in the node's pretty-printed record format.
void fillSensorRecord(JsonObject record, uint32_t timestamp, uint64_t node_id, int step) {
  record["timestamp"] = timestamp;
  record["node_id"] = formatNodeId(node_id);
  record["battery_pct"] = 28 - step;
  record["mode"] = "POWER_SAVE";

  JsonObject sensors = record["sensors"].to<JsonObject>();
  JsonObject bme280 = sensors["bme280"].to<JsonObject>();
  bme280["temperature_c"] = 30.5 + step * 0.2;
  bme280["humidity_pct"] = 65.2;
  bme280["pressure_hpa"] = 1013.25;

  JsonObject aht21 = sensors["aht21"].to<JsonObject>();
  aht21["temperature_c"] = 30.1;
  aht21["humidity_pct"] = 62.9;

  JsonObject ens160 = sensors["ens160"].to<JsonObject>();
  ens160["aqi"] = 1;
  ens160["tvoc_ppb"] = 35;
  ens160["eco2_ppm"] = 426;
  ens160["status"] = 0x8B;

  JsonObject gy271 = sensors["gy271"].to<JsonObject>();
  gy271["x"] = -6222;
  gy271["y"] = 1550;
  gy271["z"] = -1122;

  JsonObject ina219 = sensors["ina219"].to<JsonObject>();
  ina219["bus_voltage_v"] = 3.552;
  ina219["shunt_voltage_mv"] = 7.49;
  ina219["current_ma"] = 74.9;
}

int runGenerate(const CliOptions& opts, const Settings& settings, ILogger* logger) {
  if (std::remove(opts.path.c_str()) != 0 && fileSize(opts.path) >= 0) {
    logf(logger, LogLevel::ERROR, "Could not replace %s", opts.path.c_str());
    return kExitNoData;
  }

  const uint32_t base_time = opts.time >= 0 ? static_cast<uint32_t>(opts.time)
                                            : static_cast<uint32_t>(std::time(nullptr));
  FileSink sink(opts.path);
  ChunkWriter writer(toWriterConfig(settings), logger);

  JsonDocument last;
  for (int i = 0; i < 5; ++i) {
    const uint32_t ts = base_time + static_cast<uint32_t>(i * 60);
    JsonDocument doc;
    fillSensorRecord(doc.to<JsonObject>(), ts, settings.node_id, i);
    last = doc;

    std::string text;
    serializeJsonPretty(doc, text);
    if (!writer.write(sink, reinterpret_cast<const uint8_t*>(text.data()), text.size(), settings.node_id, ts)) {
      logf(logger, LogLevel::ERROR, "Write failed: %s", writer.lastError().c_str());
      return kExitNoData;
    }
  }

  // Large repetitive chunk so the compressed path is exercised.
  JsonDocument batch;
  JsonArray records = batch.to<JsonArray>();
  for (int i = 0; i < 20; ++i) {
    records.add(last.as<JsonVariantConst>());
  }
  std::string text;
  serializeJsonPretty(batch, text);
  const uint32_t ts = base_time + 5u * 60u;
  if (!writer.write(sink, reinterpret_cast<const uint8_t*>(text.data()), text.size(), settings.node_id, ts)) {
    logf(logger, LogLevel::ERROR, "Write failed: %s", writer.lastError().c_str());
    return kExitNoData;
  }

  logf(logger, LogLevel::INFO, "Test log file created: %s (%lld bytes)", opts.path.c_str(), fileSize(opts.path));
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions opts;
  if (!parseArgs(argc, argv, &opts)) {
    printUsage();
    return kExitUsage;
  }

  StreamLogger console(stderr, LogLevel::INFO);
  if (opts.quiet) console.setMinLevel(LogLevel::ERROR);
  if (opts.verbose) console.setMinLevel(LogLevel::DEBUG);
  MultiLogger logger;
  logger.addSink(&console);

  Settings settings;
  if (opts.command == "salvage") settings.force = true;
  if (!buildSettings(opts, &logger, &settings)) return kExitUsage;

  if (opts.command == "decode") return runDecode(opts, settings, &logger);
  if (opts.command == "scan") return runScan(opts, settings, &logger);
  if (opts.command == "salvage") return runSalvage(opts, settings, &logger);
  if (opts.command == "generate") return runGenerate(opts, settings, &logger);

  std::fprintf(stderr, "ERROR: unknown command %s\n", opts.command.c_str());
  printUsage();
  return kExitUsage;
}

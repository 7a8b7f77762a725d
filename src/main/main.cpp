#include "bms_capture/capture_pipeline.hpp"
#include "bms_capture/chunk_reader.hpp"
#include "bms_capture/csv_writer.hpp"
#include "bms_capture/duration_parse.hpp"
#include "bms_capture/fault_names.hpp"
#include "bms_capture/path_utils.hpp"
#include "bms_capture/run_json.hpp"
#include "bms_capture/serial_port.hpp"

#include <atomic>
#include <climits>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

enum ExitCode { kOk = 0, kInputError = 1, kWriteError = 2, kStrictAbort = 3 };

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

struct Cli {
  std::string input;            // static capture ("-" = stdin)
  std::string serial_port;      // live capture
  std::string output;
  int baudrate = 115200;
  std::string duration;         // "20s", "5m", "4h"
  std::optional<std::uint64_t> max_frames;
  std::string source_c;         // firmware source with fault names
  std::string summary_json;
  std::size_t max_frame_bytes = 1024 * 1024;
  bool strict = false;
  bool progress = true;
  bool help = false;
};

const char* kUsage =
  "Usage: bms-chain-capture (--input=<log>|--serial-port=<dev>) --output=<csv>\n"
  "                         [--baudrate=N] [--duration=20s|5m|4h] [--max-frames=N]\n"
  "                         [--source-c=<AEK_POW_BMS63CHAIN_app_mng.c>] [--strict]\n"
  "                         [--no-progress] [--max-frame-bytes=N] [--summary-json=<path>]\n";

bool parse_cli(int argc, char** argv, Cli& c, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    // "--key=value" or "--key value"
    auto eat = [&](const char* key, std::string* out){
      const std::string k(key);
      if (a.rfind(k + "=", 0) == 0) { *out = a.substr(k.size() + 1); return true; }
      if (a == k) {
        if (i + 1 >= argc) { err = "missing value for " + k; *out = ""; return true; }
        *out = argv[++i];
        return true;
      }
      return false;
    };
    auto eat_u = [&](const char* key, std::uint64_t* out){
      std::string v;
      if (!eat(key, &v)) return false;
      if (!err.empty()) return true;
      try {
        std::size_t used = 0;
        const unsigned long long x = std::stoull(v, &used);
        if (used != v.size() || v.empty() || v[0] == '-') throw std::invalid_argument(v);
        *out = x;
      } catch (const std::exception&) {
        err = std::string("invalid value for ") + key + ": '" + v + "'";
      }
      return true;
    };

    std::uint64_t u = 0;
    if (eat("--input", &c.input)) continue;
    if (eat("--serial-port", &c.serial_port)) continue;
    if (eat("--output", &c.output)) continue;
    if (eat_u("--baudrate", &u)) {
      if (!err.empty()) continue;
      if (u == 0 || u > static_cast<std::uint64_t>(INT_MAX))
        err = "invalid value for --baudrate: '" + std::to_string(u) + "'";
      else
        c.baudrate = static_cast<int>(u);
      continue;
    }
    if (eat("--duration", &c.duration)) continue;
    if (eat_u("--max-frames", &u)) { c.max_frames = u; continue; }
    if (eat("--source-c", &c.source_c)) continue;
    if (eat("--summary-json", &c.summary_json)) continue;
    if (eat_u("--max-frame-bytes", &u)) { c.max_frame_bytes = static_cast<std::size_t>(u); continue; }
    if (a == "--strict")      { c.strict = true; continue; }
    if (a == "--no-progress") { c.progress = false; continue; }
    if (a == "-h" || a == "--help") { c.help = true; return true; }
    err = "unknown argument: " + a;
    return false;
  }
  if (!err.empty()) return false;
  if (c.input.empty() == c.serial_port.empty()) {
    err = "exactly one of --input or --serial-port is required";
    return false;
  }
  if (c.output.empty()) { err = "--output is required"; return false; }
  return true;
}

}

int main(int argc, char** argv) {
  Cli cli;
  std::string cli_err;
  if (!parse_cli(argc, argv, cli, cli_err)) {
    std::cerr << "[ERROR] " << cli_err << "\n" << kUsage;
    return kInputError;
  }
  if (cli.help) { std::cout << kUsage; return kOk; }

  bc::PipelineConfig cfg;
  cfg.policy.on_error = cli.strict ? bc::ParsePolicy::OnError::Strict : bc::ParsePolicy::OnError::Lenient;
  cfg.limits.max_frames = cli.max_frames;
  cfg.accumulator.max_frame_bytes = cli.max_frame_bytes;
  cfg.cancel = &g_stop;

  if (!cli.duration.empty()) {
    auto d = bc::parse_duration_s(cli.duration);
    if (!d) {
      std::cerr << "[ERROR] Invalid --duration format. Use examples like: 20s, 5m, 4h, 30\n";
      return kInputError;
    }
    if (cli.input.empty()) cfg.limits.duration_s = *d;
    else std::cerr << "[WARN] --duration applies to --serial-port capture only; ignored\n";
  }

  // Fault-name source: explicit path, else the firmware tree next to us.
  std::error_code ec;
  const std::filesystem::path fault_src = cli.source_c.empty()
      ? bc::discover_fault_source(bc::executable_dir(argv[0]), std::filesystem::current_path(ec))
      : std::filesystem::path(cli.source_c);
  bc::FaultNameResolver faults(fault_src);

  // --- source
  std::unique_ptr<bc::ChunkSource> source;
  if (!cli.input.empty()) {
    if (cli.input != "-" && !std::filesystem::is_regular_file(cli.input, ec)) {
      std::cerr << "[ERROR] Input file not found: " << cli.input << "\n";
      return kInputError;
    }
    source = std::make_unique<bc::ChunkReader>(cli.input);
  } else {
    if (bc::SerialPort::map_baud(cli.baudrate) == B0) {
      std::cerr << "[ERROR] Unsupported baud rate: " << cli.baudrate << "\n";
      return kInputError;
    }
    bc::SerialChunkSource::Config scfg;
    scfg.baud = cli.baudrate;
    auto serial = std::make_unique<bc::SerialChunkSource>(cli.serial_port, scfg);
    if (!serial->open()) {
      std::cerr << "[ERROR] Cannot open serial port " << cli.serial_port << ": "
                << std::strerror(serial->last_error()) << "\n";
      return kInputError;
    }
    cfg.show_progress = cli.progress;
    source = std::move(serial);
  }

  // --- destination
  bc::CsvRowWriter writer(cli.output);
  if (!writer.open()) {
    std::cerr << "[ERROR] " << writer.error() << "\n";
    return kWriteError;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  bc::CapturePipeline pipeline(cfg, faults);
  bc::RunResult res = pipeline.run(*source, writer);

  if (!writer.close() && res.status == bc::RunStatus::Completed) {
    res.status = bc::RunStatus::WriteFailed;
    res.message = "destination write failed: " + writer.error();
  }

  if (!cli.summary_json.empty()) {
    bc::RunJsonPayload p;
    p.mode = cli.input.empty() ? "serial" : "file";
    p.input = cli.input.empty() ? cli.serial_port : cli.input;
    p.output = cli.output;
    p.error_policy = bc::to_string(cfg.policy.on_error);
    p.status = bc::to_string(res.status);
    bc::fill_from_stats(p, res.stats);
    p.columns = res.columns;
    if (faults.resolved()) {
      const bc::FaultNameTable& t = faults.resolve();
      p.fault_names_from_source = t.from_source;
      p.fault_names_note = t.note;
    }
    std::string err;
    if (!bc::RunJsonWriter::write_file(cli.summary_json, p, &err))
      std::cerr << "[WARN] summary not written: " << err << "\n";
  }

  switch (res.status) {
    case bc::RunStatus::Completed:
      break;
    case bc::RunStatus::StrictAbort:
      std::cerr << "[ERROR] " << res.message << "\n";
      return kStrictAbort;
    case bc::RunStatus::WriteFailed:
      std::cerr << "[ERROR] " << res.message << "\n";
      return kWriteError;
    case bc::RunStatus::SourceFailed:
    case bc::RunStatus::InternalError:
      std::cerr << "[ERROR] " << res.message << "\n";
      return kInputError;
  }

  if (res.stats.frames_accepted == 0) {
    std::cerr << "[ERROR] No valid frames could be parsed\n";
    return kInputError;
  }

  std::cout << "[INFO] Wrote CSV: " << cli.output
            << " (frames=" << res.stats.frames_accepted
            << ", skipped=" << res.stats.frames_skipped
            << ", stop=" << bc::to_string(res.stop) << ")\n";
  return kOk;
}

#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "bms_capture/metrics.hpp"

namespace bc {

struct RunJsonPayload {
  // Run identity
  std::string mode;        // "file" | "serial"
  std::string input;       // path or port
  std::string output;
  std::string error_policy;
  std::string status;

  // Top-level KPIs
  std::uint64_t frames_attempted = 0;
  std::uint64_t frames_accepted = 0;
  std::uint64_t frames_skipped = 0;
  std::uint64_t bytes = 0;
  std::uint64_t incomplete_bytes_dropped = 0;
  std::uint64_t oversize_drops = 0;
  double wall_time_ms = 0.0;
  double frames_per_sec = 0.0;

  // Schema
  std::uint64_t columns = 0;
  bool fault_names_from_source = false;
  std::string fault_names_note;

  // Stages and errors
  std::vector<std::pair<std::string, std::uint64_t>> stage_times;
  std::unordered_map<std::string, std::uint64_t> errors_by_section;
  std::string last_diagnostic;
};

// Copies the counters of `s` into `p`.
void fill_from_stats(RunJsonPayload& p, const CaptureStats& s);

class RunJsonWriter {
public:
  // Serialize payload to a JSON string.
  static std::string to_json(const RunJsonPayload& p);

  // Writes to_json(p) to `path`, creating parent directories.
  static bool write_file(const std::string& path, const RunJsonPayload& p,
                         std::string* err_out = nullptr);
};

}

#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bc {

struct StageTiming {
  std::string name;
  std::uint64_t duration_us = 0;
};

struct CaptureStats {
  std::uint64_t frames_attempted = 0;
  std::uint64_t frames_accepted = 0;
  std::uint64_t frames_skipped = 0;
  std::uint64_t bytes = 0;
  std::uint64_t incomplete_bytes_dropped = 0;
  std::uint64_t oversize_drops = 0;
  double wall_ms = 0.0;
  double frames_per_sec = 0.0;

  std::string last_diagnostic;
  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> errors_by_section;
};

class MetricsRegistry {
public:
  void reset();
  void add_attempted() noexcept { ++attempted_; }
  void add_accepted() noexcept { ++accepted_; }
  void add_skipped() noexcept { ++skipped_; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void set_incomplete_dropped(std::uint64_t b) noexcept { incomplete_ = b; }
  void set_oversize_drops(std::uint64_t n) noexcept { oversize_ = n; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  // A rejected frame (skipped or aborting): counts the section and keeps the message.
  void add_frame_error(std::string_view section, std::string diagnostic);

  std::uint64_t attempted() const noexcept { return attempted_; }
  std::uint64_t accepted() const noexcept { return accepted_; }
  std::uint64_t skipped() const noexcept { return skipped_; }

  CaptureStats snapshot(double wall_ms) const;

private:
  std::uint64_t attempted_{0};
  std::uint64_t accepted_{0};
  std::uint64_t skipped_{0};
  std::uint64_t bytes_{0};
  std::uint64_t incomplete_{0};
  std::uint64_t oversize_{0};
  std::string last_diag_;
  std::unordered_map<std::string, std::uint64_t> section_errs_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_us_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}

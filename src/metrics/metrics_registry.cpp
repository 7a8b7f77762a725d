#include "bms_capture/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace bc {

void MetricsRegistry::reset() {
  attempted_ = accepted_ = skipped_ = bytes_ = incomplete_ = oversize_ = 0;
  last_diag_.clear();
  section_errs_.clear();
  stage_accum_us_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_us_[key] += static_cast<std::uint64_t>(us);
  stage_starts_.erase(it);
}

void MetricsRegistry::add_frame_error(std::string_view section, std::string diagnostic) {
  ++section_errs_[std::string(section)];
  last_diag_ = std::move(diagnostic);
}

CaptureStats MetricsRegistry::snapshot(double wall_ms) const {
  CaptureStats r;
  r.frames_attempted = attempted_;
  r.frames_accepted = accepted_;
  r.frames_skipped = skipped_;
  r.bytes = bytes_;
  r.incomplete_bytes_dropped = incomplete_;
  r.oversize_drops = oversize_;
  r.wall_ms = wall_ms;
  r.frames_per_sec = (wall_ms > 0.0) ? accepted_ / (wall_ms / 1000.0) : 0.0;

  r.last_diagnostic = last_diag_;
  r.errors_by_section = section_errs_;
  r.stages.reserve(stage_accum_us_.size());
  for (auto& kv : stage_accum_us_) r.stages.push_back(StageTiming{kv.first, kv.second});
  std::sort(r.stages.begin(), r.stages.end(),
            [](const StageTiming& a, const StageTiming& b){ return a.name < b.name; });
  return r;
}

}

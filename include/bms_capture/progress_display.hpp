#pragma once
#include <cstdint>
#include <optional>
#include <ostream>

namespace bc {

// One-line "\r[INFO] Capturing..." status for live captures, throttled.
class ProgressDisplay {
public:
  ProgressDisplay(bool enabled,
                  std::optional<double> duration_s,
                  std::optional<std::uint64_t> max_frames,
                  std::ostream& out);

  void update(std::uint64_t frames, double elapsed_s, bool force = false);

  // Terminates the status line if anything was printed.
  void finish();

  static constexpr double kMinIntervalS = 0.5;

private:
  bool enabled_;
  std::optional<double> duration_s_;
  std::optional<std::uint64_t> max_frames_;
  std::ostream& out_;
  double last_s_{-1.0};
  bool printed_{false};
};

}

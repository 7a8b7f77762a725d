#include "bms_capture/progress_display.hpp"
#include <iomanip>
#include <sstream>

namespace bc {

ProgressDisplay::ProgressDisplay(bool enabled,
                                 std::optional<double> duration_s,
                                 std::optional<std::uint64_t> max_frames,
                                 std::ostream& out)
  : enabled_(enabled), duration_s_(duration_s), max_frames_(max_frames), out_(out) {}

void ProgressDisplay::update(std::uint64_t frames, double elapsed_s, bool force) {
  if (!enabled_) return;
  if (!force && last_s_ >= 0.0 && (elapsed_s - last_s_) < kMinIntervalS) return;
  last_s_ = elapsed_s;

  std::ostringstream o;
  o << std::fixed << std::setprecision(1);
  o << "\r[INFO] Capturing... frames=" << frames << ", elapsed=" << elapsed_s << "s";
  if (duration_s_) {
    const double remain = *duration_s_ - elapsed_s;
    o << ", remaining=" << (remain > 0.0 ? remain : 0.0) << "s";
  }
  if (max_frames_) o << ", target=" << frames << "/" << *max_frames_;
  out_ << o.str() << std::flush;
  printed_ = true;
}

void ProgressDisplay::finish() {
  if (printed_) out_ << "\n" << std::flush;
  printed_ = false;
}

}

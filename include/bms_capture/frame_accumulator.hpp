#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "bms_capture/frame_layout.hpp"

namespace bc {

struct AccumulatorConfig {
  std::string terminator      = std::string(kFrameTerminator);
  std::size_t max_frame_bytes = 1024 * 1024; // guard per buffered frame
  bool        strip_newlines  = true;        // drop '\r' and '\n' before scanning
};

// Splits a chunked text stream into raw frames at terminator boundaries.
class FrameAccumulator {
public:
  // Return false to stop; the frame view is only valid during the call.
  using FrameCallback = std::function<bool(std::string_view)>;

  FrameAccumulator();
  explicit FrameAccumulator(AccumulatorConfig cfg);

  // Appends `chunk` and emits every frame completed by it.
  // Returns false if `on_frame` asked to stop.
  bool feed(std::string_view chunk, const FrameCallback& on_frame);

  // End of input: discards the terminator-less remainder and returns its size.
  std::size_t finish();

  std::size_t   buffered() const noexcept { return buf_.size(); }
  std::uint64_t frames() const noexcept { return frames_; }
  std::uint64_t oversize_drops() const noexcept { return oversize_drops_; }

private:
  void append(std::string_view chunk);

  AccumulatorConfig cfg_;
  std::string buf_;
  std::size_t scan_from_{0};
  bool discarding_{false};
  std::uint64_t frames_{0};
  std::uint64_t oversize_drops_{0};
};

}

#include "bms_capture/frame_accumulator.hpp"
#include <utility>

namespace bc {

static std::string_view trim_blanks(std::string_view s) {
  constexpr std::string_view blanks = " \t\v\f\r\n";
  const std::size_t b = s.find_first_not_of(blanks);
  if (b == std::string_view::npos) return {};
  const std::size_t e = s.find_last_not_of(blanks);
  return s.substr(b, e - b + 1);
}

FrameAccumulator::FrameAccumulator() : FrameAccumulator(AccumulatorConfig{}) {}

FrameAccumulator::FrameAccumulator(AccumulatorConfig cfg) : cfg_(std::move(cfg)) {
  buf_.reserve(8 * 1024);
}

void FrameAccumulator::append(std::string_view chunk) {
  if (!cfg_.strip_newlines) { buf_.append(chunk.data(), chunk.size()); return; }
  std::size_t start = 0;
  while (start < chunk.size()) {
    const std::size_t nl = chunk.find_first_of("\r\n", start);
    if (nl == std::string_view::npos) {
      buf_.append(chunk.data() + start, chunk.size() - start);
      break;
    }
    buf_.append(chunk.data() + start, nl - start);
    start = nl + 1;
  }
}

bool FrameAccumulator::feed(std::string_view chunk, const FrameCallback& on_frame) {
  append(chunk);
  const std::string_view term = cfg_.terminator;
  if (term.empty()) return true;

  std::size_t head = 0;
  bool keep_going = true;
  while (keep_going) {
    const std::size_t pos = buf_.find(term.data(), scan_from_ > head ? scan_from_ : head, term.size());
    if (pos == std::string::npos) break;

    const std::string_view frame =
        trim_blanks(std::string_view(buf_).substr(head, pos - head));
    head = pos + term.size();
    scan_from_ = head;

    if (discarding_) { discarding_ = false; continue; } // tail of an oversize frame
    if (frame.empty()) continue;
    ++frames_;
    keep_going = on_frame(frame);
  }

  buf_.erase(0, head);
  // A terminator may straddle the next chunk; rescan only that overlap.
  scan_from_ = (keep_going && buf_.size() >= term.size()) ? buf_.size() - term.size() + 1 : 0;

  if (cfg_.max_frame_bytes > 0 && buf_.size() > cfg_.max_frame_bytes) {
    if (!discarding_) ++oversize_drops_;
    discarding_ = true;
    const std::size_t keep = term.size() - 1 < buf_.size() ? term.size() - 1 : buf_.size();
    buf_.erase(0, buf_.size() - keep);
    scan_from_ = 0;
  }
  return keep_going;
}

std::size_t FrameAccumulator::finish() {
  const std::size_t dropped = buf_.size();
  buf_.clear();
  scan_from_ = 0;
  discarding_ = false;
  return dropped;
}

}

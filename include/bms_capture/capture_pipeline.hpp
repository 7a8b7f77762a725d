#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "bms_capture/frame_accumulator.hpp"
#include "bms_capture/frame_tokenizer.hpp"
#include "bms_capture/metrics.hpp"
#include "bms_capture/parse_policy.hpp"

namespace bc {

class ChunkSource;
class CsvRowWriter;
class FaultNameResolver;

struct CaptureLimits {
  std::optional<double>        duration_s;  // wall clock bound
  std::optional<std::uint64_t> max_frames;  // counts attempted raw frames
};

// One rejected frame as seen by the error policy gate.
struct FrameDiagnostic {
  std::uint64_t frame_number = 0; // 1-based attempted frame
  FrameError error;
  bool fatal = false;             // strict mode abort
};

struct PipelineConfig {
  using Clock = std::function<std::chrono::steady_clock::time_point()>;
  using DiagnosticCallback = std::function<void(const FrameDiagnostic&)>;

  ParsePolicy policy;
  CaptureLimits limits;
  AccumulatorConfig accumulator;
  bool show_progress = false;

  const std::atomic<bool>* cancel = nullptr; // set from a signal handler
  Clock clock;                               // steady_clock::now when empty
  DiagnosticCallback on_diagnostic;          // logs to `log` when empty
  std::ostream* log = nullptr;               // std::cerr when null
};

enum class RunStatus { Completed, StrictAbort, SourceFailed, WriteFailed, InternalError };

const char* to_string(RunStatus s) noexcept;

enum class StopReason { EndOfInput, MaxFrames, Duration, Cancelled, Error };

const char* to_string(StopReason r) noexcept;

struct RunResult {
  RunStatus status = RunStatus::Completed;
  StopReason stop = StopReason::EndOfInput;
  std::string message;
  CaptureStats stats;
  std::size_t columns = 0;
};

// Source -> Accumulator -> Validator -> error policy gate -> Schema (once) -> Emitter.
class CapturePipeline {
public:
  CapturePipeline(PipelineConfig cfg, FaultNameResolver& faults);

  RunResult run(ChunkSource& source, CsvRowWriter& sink);

private:
  PipelineConfig cfg_;
  FaultNameResolver& faults_;
};

}

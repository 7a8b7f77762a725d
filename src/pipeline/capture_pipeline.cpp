#include "bms_capture/capture_pipeline.hpp"
#include "bms_capture/chunk_source.hpp"
#include "bms_capture/csv_writer.hpp"
#include "bms_capture/fault_names.hpp"
#include "bms_capture/progress_display.hpp"
#include "bms_capture/schema.hpp"

#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace bc {

const char* to_string(RunStatus s) noexcept {
  switch (s) {
    case RunStatus::Completed:     return "completed";
    case RunStatus::StrictAbort:   return "strict-abort";
    case RunStatus::SourceFailed:  return "source-failed";
    case RunStatus::WriteFailed:   return "write-failed";
    case RunStatus::InternalError: return "internal-error";
  }
  return "unknown";
}

const char* to_string(StopReason r) noexcept {
  switch (r) {
    case StopReason::EndOfInput: return "end-of-input";
    case StopReason::MaxFrames:  return "max-frames";
    case StopReason::Duration:   return "duration";
    case StopReason::Cancelled:  return "cancelled";
    case StopReason::Error:      return "error";
  }
  return "unknown";
}

CapturePipeline::CapturePipeline(PipelineConfig cfg, FaultNameResolver& faults)
  : cfg_(std::move(cfg)), faults_(faults) {
  if (!cfg_.clock) cfg_.clock = []{ return std::chrono::steady_clock::now(); };
  if (!cfg_.log) cfg_.log = &std::cerr;
}

RunResult CapturePipeline::run(ChunkSource& source, CsvRowWriter& sink) {
  std::ostream& log = *cfg_.log;
  const bool strict = cfg_.policy.on_error == ParsePolicy::OnError::Strict;
  const auto t0 = cfg_.clock();
  auto elapsed_s = [&]{ return std::chrono::duration<double>(cfg_.clock() - t0).count(); };

  RunResult res;
  MetricsRegistry metrics;
  FrameAccumulator acc(cfg_.accumulator);
  FrameValidator validator(cfg_.policy);
  FrameRecord record;
  std::optional<Schema> schema;
  ProgressDisplay progress(cfg_.show_progress, cfg_.limits.duration_s, cfg_.limits.max_frames, log);
  bool stopped = false;

  auto stop = [&](RunStatus st, StopReason why, std::string msg) {
    res.status = st;
    res.stop = why;
    res.message = std::move(msg);
    stopped = true;
    return false;
  };

  auto bound_reached = [&]() -> bool {
    if (stopped) return true;
    if (cfg_.cancel && cfg_.cancel->load()) {
      stop(RunStatus::Completed, StopReason::Cancelled, "capture interrupted");
      return true;
    }
    if (cfg_.limits.max_frames && metrics.attempted() >= *cfg_.limits.max_frames) {
      stop(RunStatus::Completed, StopReason::MaxFrames, "frame limit reached");
      return true;
    }
    if (cfg_.limits.duration_s && elapsed_s() >= *cfg_.limits.duration_s) {
      stop(RunStatus::Completed, StopReason::Duration, "duration limit reached");
      return true;
    }
    return false;
  };

  auto report = [&](const FrameDiagnostic& d) {
    if (cfg_.on_diagnostic) { cfg_.on_diagnostic(d); return; }
    log << (d.fatal ? "[ERROR] Aborting at frame #" : "[WARN] Skipped frame #")
        << d.frame_number << ": " << d.error.message() << "\n";
  };

  // Schema and header are produced once, on the first emission.
  auto ensure_header = [&]() -> bool {
    if (schema) return true;
    const FaultNameTable& names = faults_.resolve();
    log << "[INFO] " << names.note << "\n";
    schema.emplace(Schema::build(names));
    if (!sink.write_header(schema->columns()))
      return stop(RunStatus::WriteFailed, StopReason::Error, "destination write failed: " + sink.error());
    return true;
  };

  auto on_frame = [&](std::string_view raw) -> bool {
    if (bound_reached()) return false;
    metrics.add_attempted();
    const std::uint64_t n = metrics.attempted();

    metrics.start_stage("validate");
    const bool ok = validator.validate(raw, record);
    metrics.end_stage("validate");

    if (!ok) {
      FrameDiagnostic d;
      d.frame_number = n;
      d.error = validator.error();
      d.fatal = strict;
      std::string msg = "frame #" + std::to_string(n) + ": " + d.error.message();
      metrics.add_frame_error(d.error.section, msg);
      report(d);
      if (strict) return stop(RunStatus::StrictAbort, StopReason::Error, "strict mode: " + msg);
      metrics.add_skipped();
    } else {
      if (!ensure_header()) return false;
      if (!schema->conforms(record))
        return stop(RunStatus::InternalError, StopReason::Error,
                    "frame #" + std::to_string(n) + " has " + std::to_string(record.values.size() + 1) +
                    " columns, schema has " + std::to_string(schema->size()));
      metrics.start_stage("emit");
      const bool wrote = sink.write_row(metrics.accepted() + 1, record);
      metrics.end_stage("emit");
      if (!wrote)
        return stop(RunStatus::WriteFailed, StopReason::Error, "destination write failed: " + sink.error());
      metrics.add_accepted();
    }

    progress.update(n, elapsed_s(), true);
    return !bound_reached();
  };

  progress.update(0, 0.0, true);
  const bool source_ok = source.for_each_chunk([&](std::string_view chunk) -> bool {
    if (bound_reached()) return false;
    metrics.add_bytes(chunk.size());
    const bool more = acc.feed(chunk, on_frame);
    progress.update(metrics.attempted(), elapsed_s());
    return more && !stopped;
  });

  metrics.set_oversize_drops(acc.oversize_drops());
  metrics.set_incomplete_dropped(acc.finish());

  if (!source_ok && !stopped) {
    const int e = source.last_error();
    stop(RunStatus::SourceFailed, StopReason::Error,
         std::string("source read failed: ") + (e ? std::strerror(e) : "unknown error"));
  }

  // No accepted frame: still leave a header-only table behind.
  if (!schema && (res.status == RunStatus::Completed || res.status == RunStatus::StrictAbort))
    ensure_header();

  progress.update(metrics.attempted(), elapsed_s(), true);
  progress.finish();

  res.stats = metrics.snapshot(elapsed_s() * 1000.0);
  res.columns = schema ? schema->size() : 0;
  return res;
}

}

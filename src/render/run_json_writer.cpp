#include "bms_capture/run_json.hpp"
#include "bms_capture/path_utils.hpp"
#include <algorithm>
#include <cmath> // std::isfinite
#include <fstream>
#include <sstream>

namespace bc {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          static const char* hex = "0123456789abcdef";
          o << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

void fill_from_stats(RunJsonPayload& p, const CaptureStats& s) {
  p.frames_attempted = s.frames_attempted;
  p.frames_accepted = s.frames_accepted;
  p.frames_skipped = s.frames_skipped;
  p.bytes = s.bytes;
  p.incomplete_bytes_dropped = s.incomplete_bytes_dropped;
  p.oversize_drops = s.oversize_drops;
  p.wall_time_ms = s.wall_ms;
  p.frames_per_sec = s.frames_per_sec;
  p.errors_by_section = s.errors_by_section;
  p.last_diagnostic = s.last_diagnostic;
  p.stage_times.clear();
  for (const auto& st : s.stages) p.stage_times.emplace_back(st.name, st.duration_us);
}

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"mode\":";         esc(o, p.mode);         o << ",";
  o << "\"input\":";        esc(o, p.input);        o << ",";
  o << "\"output\":";       esc(o, p.output);       o << ",";
  o << "\"error_policy\":"; esc(o, p.error_policy); o << ",";
  o << "\"status\":";       esc(o, p.status);       o << ",";

  o << "\"frames_attempted\":" << p.frames_attempted << ",";
  o << "\"frames_accepted\":" << p.frames_accepted << ",";
  o << "\"frames_skipped\":" << p.frames_skipped << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"incomplete_bytes_dropped\":" << p.incomplete_bytes_dropped << ",";
  o << "\"oversize_drops\":" << p.oversize_drops << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"frames_per_sec\":" << safe_num(p.frames_per_sec) << ",";

  o << "\"columns\":" << p.columns << ",";
  o << "\"fault_names_from_source\":" << (p.fault_names_from_source ? "true" : "false") << ",";
  o << "\"fault_names_note\":"; esc(o, p.fault_names_note); o << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_us\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  // Sorted so repeated runs diff cleanly.
  std::vector<std::pair<std::string, std::uint64_t>> errs(p.errors_by_section.begin(),
                                                          p.errors_by_section.end());
  std::sort(errs.begin(), errs.end());
  o << "\"errors_by_section\":{";
  for (size_t i=0;i<errs.size();++i){
    if (i) o << ",";
    esc(o, errs[i].first); o << ":" << errs[i].second;
  }
  o << "},";

  o << "\"last_diagnostic\":"; esc(o, p.last_diagnostic);

  o << "}";
  return o.str();
}

bool RunJsonWriter::write_file(const std::string& path, const RunJsonPayload& p,
                               std::string* err_out) {
  if (!ensure_parent_dirs(path)) {
    if (err_out) *err_out = "cannot create parent directory of " + path;
    return false;
  }
  const std::string json = to_json(p);
  std::ofstream rj(path, std::ios::binary | std::ios::trunc);
  if (!rj) {
    if (err_out) *err_out = "failed to open " + path;
    return false;
  }
  rj.write(json.data(), static_cast<std::streamsize>(json.size()));
  rj.flush();
  if (!rj) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  return true;
}

}

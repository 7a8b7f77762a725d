#include "bms_capture/fault_names.hpp"
#include "bms_capture/frame_layout.hpp"
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace bc {

static bool is_ident(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

static std::size_t skip_blanks(std::string_view s, std::size_t p) {
  while (p < s.size() && std::isspace(static_cast<unsigned char>(s[p]))) ++p;
  return p;
}

// Body of `void <kFaultSourceFunc>(...) {` up to sendMessage("ENDData").
static std::string_view serial_step_body(std::string_view text) {
  constexpr std::string_view kEnd = "sendMessage(\"ENDData\")";
  std::size_t search = 0;
  while (true) {
    const std::size_t at = text.find(kFaultSourceFunc, search);
    if (at == std::string_view::npos) return {};
    search = at + kFaultSourceFunc.size();

    std::size_t b = at;
    while (b > 0 && std::isspace(static_cast<unsigned char>(text[b - 1]))) --b;
    if (b == at || b < 4 || text.substr(b - 4, 4) != "void") continue;
    if (b > 4 && is_ident(text[b - 5])) continue;

    std::size_t p = skip_blanks(text, search);
    if (p >= text.size() || text[p] != '(') continue;
    const std::size_t close = text.find(')', p);
    if (close == std::string_view::npos) continue;
    p = skip_blanks(text, close + 1);
    if (p >= text.size() || text[p] != '{') continue; // prototype

    const std::size_t end = text.find(kEnd, p + 1);
    if (end == std::string_view::npos) continue;
    return text.substr(p + 1, end - (p + 1));
  }
}

std::vector<std::string> extract_fault_names(std::string_view source_text) {
  std::string_view body = serial_step_body(source_text);
  if (body.empty()) body = source_text;

  std::vector<std::string> names;
  std::size_t line_start = 0;
  while (line_start < body.size()) {
    std::size_t line_end = body.find('\n', line_start);
    if (line_end == std::string_view::npos) line_end = body.size();
    const std::string_view line = body.substr(line_start, line_end - line_start);
    line_start = line_end + 1;

    const std::size_t first = skip_blanks(line, 0);
    if (line.substr(first, 2) == "//") continue;

    std::size_t p = 0;
    while ((p = line.find(kFaultSourceMember, p)) != std::string_view::npos) {
      p += kFaultSourceMember.size();
      const std::size_t rb = line.find(']', p);
      if (rb == std::string_view::npos || rb == p) continue;
      if (rb + 1 >= line.size() || line[rb + 1] != '.') continue;
      std::size_t e = rb + 2;
      while (e < line.size() && is_ident(line[e])) ++e;
      if (e == rb + 2) continue;
      names.emplace_back(line.substr(rb + 2, e - (rb + 2)));
      p = e;
    }
  }
  return names;
}

std::string fault_column_name(std::size_t index, std::string_view raw_name) {
  if (raw_name.substr(0, kFaultNamePrefix.size()) == kFaultNamePrefix)
    raw_name.remove_prefix(kFaultNamePrefix.size());
  char buf[16];
  std::snprintf(buf, sizeof(buf), "fault_%03zu", index);
  std::string out(buf);
  if (!raw_name.empty()) { out += '_'; out.append(raw_name.data(), raw_name.size()); }
  return out;
}

FaultNameTable fallback_fault_names(std::string note) {
  FaultNameTable t;
  t.names.reserve(kFaultCount);
  for (std::size_t i = 1; i <= kFaultCount; ++i) t.names.push_back(fault_column_name(i, {}));
  t.from_source = false;
  t.note = std::move(note);
  return t;
}

const FaultNameTable& FaultNameResolver::resolve() {
  if (table_) return *table_;

  if (source_.empty()) {
    table_ = fallback_fault_names("no fault-name source given; using fault_001..fault_187");
    return *table_;
  }

  std::ifstream in(source_, std::ios::binary);
  if (!in) {
    table_ = fallback_fault_names("fault-name source not readable: " + source_.string() +
                                  "; using fault_001..fault_187");
    return *table_;
  }
  std::ostringstream ss; ss << in.rdbuf();
  const std::string text = ss.str();

  std::vector<std::string> names = extract_fault_names(text);
  if (names.size() != kFaultCount) {
    table_ = fallback_fault_names(source_.string() + ": found " + std::to_string(names.size()) +
                                  " fault names, expected " + std::to_string(kFaultCount) +
                                  "; using fault_001..fault_187");
    return *table_;
  }

  FaultNameTable t;
  t.names.reserve(kFaultCount);
  for (std::size_t i = 0; i < names.size(); ++i) t.names.push_back(fault_column_name(i + 1, names[i]));
  t.from_source = true;
  t.note = std::to_string(names.size()) + " fault names from " + source_.string();
  table_ = std::move(t);
  return *table_;
}

}

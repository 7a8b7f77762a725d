#include "bms_capture/frame_tokenizer.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace bc {

static constexpr std::string_view kBom = "\xEF\xBB\xBF";

static std::string_view trim_blanks(std::string_view s) {
  constexpr std::string_view blanks = " \t\v\f\r\n";
  const std::size_t b = s.find_first_not_of(blanks);
  if (b == std::string_view::npos) return {};
  const std::size_t e = s.find_last_not_of(blanks);
  return s.substr(b, e - b + 1);
}

std::size_t tokenize_frame(std::string_view raw,
                           std::string& scratch,
                           std::vector<std::string_view>& out) {
  out.clear();
  scratch.clear();

  // Capture tools may splice a BOM anywhere a file was concatenated.
  std::size_t start = 0;
  while (true) {
    const std::size_t bom = raw.find(kBom, start);
    if (bom == std::string_view::npos) { scratch.append(raw.substr(start)); break; }
    scratch.append(raw.substr(start, bom - start));
    start = bom + kBom.size();
  }

  const std::string_view s(scratch);
  std::size_t field_start = 0;
  for (std::size_t i = 0; i <= s.size(); ++i) {
    if (i < s.size() && s[i] != kFieldDelimiter) continue;
    const std::string_view tok = trim_blanks(s.substr(field_start, i - field_start));
    if (!tok.empty()) out.push_back(tok);
    field_start = i + 1;
  }
  return out.size();
}

const char* to_string(FrameErrorKind k) noexcept {
  switch (k) {
    case FrameErrorKind::MissingLabel:    return "missing-label";
    case FrameErrorKind::CountMismatch:   return "count-mismatch";
    case FrameErrorKind::MalformedNumber: return "malformed-number";
  }
  return "unknown";
}

std::string FrameError::message() const {
  std::string m = "section " + section + ": ";
  switch (kind) {
    case FrameErrorKind::MissingLabel:
      m += "label not found (expected " + std::to_string(expected) + " values, got 0)";
      break;
    case FrameErrorKind::CountMismatch:
      m += "expected " + std::to_string(expected) + " values, got " + std::to_string(observed);
      break;
    case FrameErrorKind::MalformedNumber:
      m += "value " + std::to_string(position) + " of " + std::to_string(expected) +
           (value_kind == ValueKind::Integer ? " is not an integer: '" : " is not a number: '") +
           token + "'";
      break;
  }
  return m;
}

bool FrameValidator::fail(FrameErrorKind kind, const SectionSpec& sec, std::size_t observed,
                          std::size_t position, std::string_view token) {
  err_.kind = kind;
  err_.section.assign(sec.name.data(), sec.name.size());
  err_.expected = sec.count;
  err_.observed = observed;
  err_.position = position;
  err_.value_kind = sec.kind;
  err_.token.assign(token.data(), token.size());
  return false;
}

bool FrameValidator::validate(std::string_view raw_frame, FrameRecord& out) {
  tokenize_frame(raw_frame, scratch_, tokens_);
  const auto& secs = frame_sections();
  out.values.resize(frame_value_count());

  std::size_t pos = 0;
  for (std::size_t i = 0; i < secs.size(); ++i) {
    const SectionSpec& sec = secs[i];
    if (pos >= tokens_.size() || tokens_[pos] != sec.label)
      return fail(FrameErrorKind::MissingLabel, sec, 0);
    ++pos;

    // Values run up to the next section's label (or the end of the frame).
    std::size_t end = tokens_.size();
    if (i + 1 < secs.size()) {
      const std::string_view next = secs[i + 1].label;
      end = pos;
      while (end < tokens_.size() && tokens_[end] != next) ++end;
      if (end == tokens_.size()) return fail(FrameErrorKind::MissingLabel, secs[i + 1], 0);
    }

    const std::size_t observed = end - pos;
    if (observed != sec.count) return fail(FrameErrorKind::CountMismatch, sec, observed);

    FieldValue* dst = out.values.data() + section_value_offset(i);
    for (std::size_t k = 0; k < sec.count; ++k) {
      const std::string_view tok = tokens_[pos + k];
      if (sec.kind == ValueKind::Integer) {
        const auto v = policy_.parse_integer(tok);
        if (!v) return fail(FrameErrorKind::MalformedNumber, sec, observed, k + 1, tok);
        dst[k] = FieldValue::integer(*v);
      } else {
        const auto v = policy_.parse_number(tok);
        if (!v) return fail(FrameErrorKind::MalformedNumber, sec, observed, k + 1, tok);
        dst[k] = FieldValue::real(*v);
      }
    }
    pos = end;
  }
  return true;
}

}

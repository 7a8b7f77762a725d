#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "bms_capture/frame_record.hpp"
#include "bms_capture/parse_policy.hpp"

namespace bc {

// Splits a raw frame on ';', strips BOMs and blanks, drops empty tokens.
// Tokens view into `scratch`, which is reused between calls.
std::size_t tokenize_frame(std::string_view raw,
                           std::string& scratch,
                           std::vector<std::string_view>& out);

enum class FrameErrorKind { MissingLabel, CountMismatch, MalformedNumber };

struct FrameError {
  FrameErrorKind kind = FrameErrorKind::CountMismatch;
  std::string section;
  std::size_t expected = 0;
  std::size_t observed = 0;
  std::size_t position = 0; // 1-based value index for MalformedNumber
  ValueKind value_kind = ValueKind::Real;
  std::string token;

  std::string message() const;
};

const char* to_string(FrameErrorKind k) noexcept;

// Validates one raw frame against frame_sections(). A frame is checked
// exactly once and the first failing section is reported.
class FrameValidator {
public:
  FrameValidator() = default;
  explicit FrameValidator(ParsePolicy policy) : policy_(policy) {}

  bool validate(std::string_view raw_frame, FrameRecord& out);

  const FrameError& error() const noexcept { return err_; }
  const std::vector<std::string_view>& tokens() const noexcept { return tokens_; }

private:
  bool fail(FrameErrorKind kind, const SectionSpec& sec, std::size_t observed,
            std::size_t position = 0, std::string_view token = {});

  ParsePolicy policy_;
  std::string scratch_;
  std::vector<std::string_view> tokens_;
  FrameError err_;
};

}

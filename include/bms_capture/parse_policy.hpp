#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace bc {

struct ParsePolicy {
  // Behavior when a frame fails validation:
  // strict  -> abort the run; lenient -> report and skip the frame
  enum class OnError { Strict, Lenient };

  OnError on_error = OnError::Lenient;

  // Accept integer sections written with a zero fraction ("1.0").
  bool integral_reals = true;

  // Numeric parse (fast_float in .cpp). The whole token must be consumed.
  std::optional<double> parse_number(std::string_view s) const;

  // Integer parse; a real-valued token must have no fractional part.
  std::optional<std::int64_t> parse_integer(std::string_view s) const;
};

const char* to_string(ParsePolicy::OnError e) noexcept;

}

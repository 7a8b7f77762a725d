#include "bms_capture/duration_parse.hpp"
#include <cctype>
#include <string_view>
#include <fast_float/fast_float.h>

namespace bc {

static bool is_blank(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::optional<double> parse_duration_s(std::string_view s) {
  while (!s.empty() && is_blank(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_blank(s.back()))  s.remove_suffix(1);
  if (s.empty()) return std::nullopt;

  double scale = 1.0;
  const char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(s.back())));
  if (unit == 's' || unit == 'm' || unit == 'h') {
    scale = unit == 's' ? 1.0 : unit == 'm' ? 60.0 : 3600.0;
    s.remove_suffix(1);
    while (!s.empty() && is_blank(s.back())) s.remove_suffix(1);
  }

  // Digits with an optional fraction: no sign, no exponent.
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) return std::nullopt;
  bool dot = false;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (std::isdigit(static_cast<unsigned char>(c))) continue;
    if (c == '.' && !dot && i + 1 < s.size()) { dot = true; continue; }
    return std::nullopt;
  }

  double v;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v * scale;
}

}

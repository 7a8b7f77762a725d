#include "bms_capture/parse_policy.hpp"
#include <charconv>
#include <cmath>
#include <string_view>
#include <fast_float/fast_float.h>

namespace bc {

// Firmware printf output may carry an explicit '+' sign; a second sign is not allowed.
static bool strip_plus(std::string_view& s) {
  if (s.empty() || s.front() != '+') return true;
  s.remove_prefix(1);
  return !s.empty() && s.front() != '+' && s.front() != '-';
}

std::optional<double> ParsePolicy::parse_number(std::string_view s) const {
  if (!strip_plus(s)) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::int64_t> ParsePolicy::parse_integer(std::string_view s) const {
  if (!strip_plus(s)) return std::nullopt;
  std::int64_t iv;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), iv, 10);
  if (ec == std::errc() && ptr == s.data() + s.size()) return iv;
  if (!integral_reals) return std::nullopt;

  // Firmware formatting sometimes renders integers as "1.0" or "1e2".
  const auto d = parse_number(s);
  if (!d || !std::isfinite(*d) || std::trunc(*d) != *d) return std::nullopt;
  if (*d < -9.2e18 || *d > 9.2e18) return std::nullopt;
  return static_cast<std::int64_t>(*d);
}

const char* to_string(ParsePolicy::OnError e) noexcept {
  return e == ParsePolicy::OnError::Strict ? "strict" : "lenient";
}

}

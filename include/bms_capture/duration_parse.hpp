#pragma once
#include <optional>
#include <string_view>

namespace bc {

// "20s", "5m", "4h", "1.5m", "30" (seconds). Unit is case-insensitive,
// surrounding blanks are allowed. Returns seconds on success.
std::optional<double> parse_duration_s(std::string_view s);

}

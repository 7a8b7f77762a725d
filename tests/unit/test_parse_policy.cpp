#include "bms_capture/parse_policy.hpp"
#include "../support/test_support.hpp"

#include <cstdint>
#include <string>

using bctest::check;

int main(){
  const bc::ParsePolicy pol;

  // reals
  check(pol.parse_number("3.612") == 3.612, "plain real");
  check(pol.parse_number("-1.25") == -1.25, "negative real");
  check(pol.parse_number("+3.5") == 3.5, "leading plus real");
  check(pol.parse_number("1e2") == 100.0, "exponent");
  check(!pol.parse_number("3.6x"), "trailing garbage");
  check(!pol.parse_number(""), "empty");
  check(!pol.parse_number("+"), "bare plus");
  check(!pol.parse_number("++1"), "double plus");
  check(!pol.parse_number("+-1"), "plus minus");

  // integers
  check(pol.parse_integer("42") == std::int64_t{42}, "plain integer");
  check(pol.parse_integer("+7") == std::int64_t{7}, "leading plus integer");
  check(pol.parse_integer("-3") == std::int64_t{-3}, "negative integer");
  check(pol.parse_integer("1.0") == std::int64_t{1}, "integral real");
  check(pol.parse_integer("+1.0") == std::int64_t{1}, "plus integral real");
  check(!pol.parse_integer("1.5"), "fractional rejected");
  check(pol.parse_integer("9223372036854775807") == INT64_MAX, "int64 max");
  check(!pol.parse_integer("9223372036854775808"), "int64 overflow");
  check(!pol.parse_integer("+-3"), "plus minus integer");

  bc::ParsePolicy exact;
  exact.integral_reals = false;
  check(!exact.parse_integer("1.0"), "integral real off");
  check(exact.parse_integer("+12") == std::int64_t{12}, "plus with integral real off");

  check(std::string(bc::to_string(bc::ParsePolicy::OnError::Strict)) == "strict", "strict name");
  check(std::string(bc::to_string(bc::ParsePolicy::OnError::Lenient)) == "lenient", "lenient name");

  return bctest::finish("parse_policy");
}

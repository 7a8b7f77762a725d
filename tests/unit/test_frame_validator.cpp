#include "bms_capture/csv_writer.hpp"
#include "bms_capture/frame_tokenizer.hpp"
#include "../support/test_support.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

using bctest::check;

static bool validate(const std::string& body, bc::FrameRecord& rec, bc::FrameError* err = nullptr) {
  bc::FrameValidator v;
  const bool ok = v.validate(body, rec);
  if (err) *err = v.error();
  return ok;
}

int main(){
  const auto& secs = bc::frame_sections();

  // tokenizer: BOMs, blanks and empty fields
  {
    std::string scratch;
    std::vector<std::string_view> toks;
    const std::size_t n = bc::tokenize_frame("\xEF\xBB\xBFTOTDEV; 2 ;;\tCHAIN;\xEF\xBB\xBF" "0;", scratch, toks);
    check(n == 4, "token count");
    check(n == 4 && toks[0] == "TOTDEV" && toks[1] == "2" && toks[2] == "CHAIN" && toks[3] == "0",
          "tokens trimmed and BOM-free");
  }

  // valid frame: every value equals its literal token, in order
  {
    const auto s = bctest::valid_sections(3);
    bc::FrameRecord rec;
    bc::FrameError err;
    const bool ok = validate(bctest::frame_body(s), rec, &err);
    check(ok, "valid frame accepted: " + err.message());
    check(rec.values.size() == bc::frame_value_count(), "record size");
    if (ok) {
      for (std::size_t i = 0; i < secs.size(); ++i) {
        const bc::FieldValue* v = rec.section(i);
        check(v != nullptr, "section pointer");
        if (!v) continue;
        for (std::size_t k = 0; k < secs[i].count; ++k) {
          const bool same = secs[i].kind == bc::ValueKind::Integer
              ? v[k].ivalue == std::strtoll(s[i][k].c_str(), nullptr, 10)
              : v[k].value == std::strtod(s[i][k].c_str(), nullptr);
          check(same, std::string(secs[i].name) + " value " + std::to_string(k + 1));
          check(v[k].kind == secs[i].kind, std::string(secs[i].name) + " kind");
        }
      }
      check(rec.section(2)->ivalue == 2, "device id (seed 3 -> 2)");
      check(rec.section(7)->value == -1.25, "current");
    }
  }

  // each section one short and one long: exactly that section is named
  for (std::size_t i = 0; i < secs.size(); ++i) {
    for (int delta : {-1, +1}) {
      auto s = bctest::valid_sections();
      if (delta < 0) s[i].pop_back(); else s[i].push_back("0");
      bc::FrameRecord rec;
      bc::FrameError err;
      const bool ok = validate(bctest::frame_body(s), rec, &err);
      const std::string what = std::string(secs[i].name) + (delta < 0 ? " short" : " long");
      check(!ok, what + " rejected");
      check(err.kind == bc::FrameErrorKind::CountMismatch, what + " kind");
      check(err.section == secs[i].name, what + " names section, got " + err.section);
      check(err.expected == secs[i].count, what + " expected");
      check(err.observed == secs[i].count + delta, what + " observed");
    }
  }

  // malformed numeric token
  {
    auto s = bctest::valid_sections();
    s[4][6] = "3.6x";
    bc::FrameRecord rec;
    bc::FrameError err;
    check(!validate(bctest::frame_body(s), rec, &err), "malformed real rejected");
    check(err.kind == bc::FrameErrorKind::MalformedNumber && err.section == "Vcell", "malformed names Vcell");
    check(err.position == 7 && err.token == "3.6x", "malformed position/token");
    check(err.message().find("Vcell") != std::string::npos, "message names section");
  }

  // integers: "1.0" accepted, "1.5" rejected
  {
    auto s = bctest::valid_sections();
    s[3][0] = "55.0";
    bc::FrameRecord rec;
    check(validate(bctest::frame_body(s), rec), "integral real accepted for SOC");
    check(rec.section(3)->ivalue == 55 && rec.section(3)->kind == bc::ValueKind::Integer, "SOC 55");
    s[3][0] = "55.5";
    bc::FrameError err;
    check(!validate(bctest::frame_body(s), rec, &err), "fractional SOC rejected");
    check(err.kind == bc::FrameErrorKind::MalformedNumber && err.section == "SOC", "fractional SOC names SOC");
  }

  // integers wider than a double mantissa keep every digit
  {
    auto s = bctest::valid_sections();
    s[3][0] = "9007199254740993";
    s[3][1] = "9223372036854775807";
    s[3][2] = "-9223372036854775808";
    bc::FrameRecord rec;
    bc::FrameError err;
    check(validate(bctest::frame_body(s), rec, &err), "wide SOC accepted: " + err.message());
    const bc::FieldValue* soc = rec.section(3);
    check(soc && soc[0].ivalue == 9007199254740993LL, "SOC 2^53+1 exact");
    check(soc && soc[1].ivalue == INT64_MAX, "SOC int64 max exact");
    check(soc && soc[2].ivalue == INT64_MIN, "SOC int64 min exact");

    std::string row;
    for (std::size_t k = 0; soc && k < 3; ++k) { if (k) row += ','; bc::append_value(row, soc[k]); }
    check(row == "9007199254740993,9223372036854775807,-9223372036854775808", "wide SOC emitted: " + row);

    s[3][0] = "9223372036854775808";
    check(!validate(bctest::frame_body(s), rec, &err), "int64 overflow rejected");
    check(err.kind == bc::FrameErrorKind::MalformedNumber && err.section == "SOC", "overflow names SOC");
  }

  // missing / out-of-order label
  {
    auto body = bctest::frame_body(bctest::valid_sections());
    const auto at = body.find("TEMP:;");
    body.replace(at, 6, "");
    bc::FrameRecord rec;
    bc::FrameError err;
    check(!validate(body, rec, &err), "missing label rejected");
    check(err.kind == bc::FrameErrorKind::MissingLabel && err.section == "TEMP", "missing TEMP named");
  }
  {
    bc::FrameRecord rec;
    bc::FrameError err;
    check(!validate("garbage;1;2", rec, &err), "garbage rejected");
    check(err.kind == bc::FrameErrorKind::MissingLabel && err.section == "TOTDEV", "garbage names TOTDEV");
    check(!validate("", rec, &err), "empty rejected");
  }

  // validity is a pure function of the tokens
  {
    bc::FrameValidator v;
    bc::FrameRecord a, b;
    const std::string body = bctest::frame_body(bctest::valid_sections(1));
    check(v.validate(body, a) && v.validate(body, b), "revalidate");
    bool same = a.values.size() == b.values.size();
    for (std::size_t i = 0; same && i < a.values.size(); ++i)
      same = a.values[i].value == b.values[i].value && a.values[i].ivalue == b.values[i].ivalue;
    check(same, "same record twice");
  }

  return bctest::finish("frame_validator");
}

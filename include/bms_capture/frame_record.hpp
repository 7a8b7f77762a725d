#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "bms_capture/frame_layout.hpp"

namespace bc {

// Integer sections keep the exact parsed value in `ivalue`; `value` is
// its (possibly rounded) double for arithmetic only.
struct FieldValue {
  double       value  = 0.0;
  ValueKind    kind   = ValueKind::Real;
  std::int64_t ivalue = 0;

  static FieldValue integer(std::int64_t v) {
    return FieldValue{static_cast<double>(v), ValueKind::Integer, v};
  }
  static FieldValue real(double v) { return FieldValue{v, ValueKind::Real, 0}; }
};

// Values of one validated frame, flattened in frame_sections() order.
struct FrameRecord {
  std::vector<FieldValue> values;

  // First value of `section`; nullptr if the record is not fully populated.
  const FieldValue* section(std::size_t section) const {
    const std::size_t off = section_value_offset(section);
    if (section >= kSectionCount || off + frame_sections()[section].count > values.size())
      return nullptr;
    return values.data() + off;
  }
};

}

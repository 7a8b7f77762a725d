#include "bms_capture/schema.hpp"
#include "bms_capture/fault_names.hpp"
#include "bms_capture/frame_layout.hpp"
#include "bms_capture/frame_record.hpp"
#include <string>

namespace bc {

Schema Schema::build(const FaultNameTable& faults) {
  std::vector<std::string> cols;
  cols.reserve(1 + frame_value_count());
  cols.emplace_back("frame_index");

  for (const SectionSpec& sec : frame_sections()) {
    switch (sec.naming) {
      case ColumnNaming::Scalar:
        cols.emplace_back(sec.column);
        break;
      case ColumnNaming::PerCell:
        for (std::size_t c = 1; c <= sec.count; ++c) {
          std::string name(sec.column);
          name += std::to_string(c);
          name.append(sec.suffix.data(), sec.suffix.size());
          cols.push_back(std::move(name));
        }
        break;
      case ColumnNaming::Fault:
        for (std::size_t i = 0; i < sec.count; ++i)
          cols.push_back(i < faults.names.size() ? faults.names[i] : fault_column_name(i + 1, {}));
        break;
    }
  }
  return Schema(std::move(cols));
}

bool Schema::conforms(const FrameRecord& rec) const noexcept {
  return columns_.size() == 1 + frame_value_count() &&
         rec.values.size() + 1 == columns_.size();
}

}

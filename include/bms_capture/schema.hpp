#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace bc {

struct FaultNameTable;
struct FrameRecord;

// Ordered output columns; immutable once built.
class Schema {
public:
  static Schema build(const FaultNameTable& faults);

  const std::vector<std::string>& columns() const noexcept { return columns_; }
  std::size_t size() const noexcept { return columns_.size(); }

  // frame_index + one column per record value.
  bool conforms(const FrameRecord& rec) const noexcept;

private:
  explicit Schema(std::vector<std::string> cols) : columns_(std::move(cols)) {}
  std::vector<std::string> columns_;
};

}

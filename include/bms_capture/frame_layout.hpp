#pragma once
#include <array>
#include <cstddef>
#include <string_view>

namespace bc {

constexpr std::string_view kFrameTerminator = "ENDData";
constexpr char             kFieldDelimiter  = ';';
constexpr std::size_t      kCellCount       = 14;
constexpr std::size_t      kFaultCount      = 187;
constexpr std::size_t      kSectionCount    = 16;

enum class ValueKind { Integer, Real };

// How a section's values map to output columns.
//   Scalar  -> one column named `column`
//   PerCell -> `column` + <1..count> + `suffix`
//   Fault   -> names come from the FaultNameTable
enum class ColumnNaming { Scalar, PerCell, Fault };

struct SectionSpec {
  std::string_view name;    // used in diagnostics
  std::string_view label;   // token preceding the values on the wire
  std::size_t      count;
  ValueKind        kind;
  ColumnNaming     naming;
  std::string_view column;
  std::string_view suffix;
};

// Fixed section order of one device frame.
const std::array<SectionSpec, kSectionCount>& frame_sections() noexcept;

// Index of the first value of section `section` in a FrameRecord.
std::size_t section_value_offset(std::size_t section) noexcept;

// Sum of all section counts (values per accepted frame).
std::size_t frame_value_count() noexcept;

// Index into frame_sections() of the section whose label is `label`, or kSectionCount.
std::size_t find_section_by_label(std::string_view label) noexcept;

}

#include "bms_capture/frame_layout.hpp"

namespace bc {

namespace {

constexpr std::array<SectionSpec, kSectionCount> kSections{{
  {"TOTDEV", "TOTDEV",  1,           ValueKind::Integer, ColumnNaming::Scalar,  "total_devices",    ""},
  {"CHAIN",  "CHAIN",   1,           ValueKind::Integer, ColumnNaming::Scalar,  "chain_id",         ""},
  {"DEV",    "DEV",     1,           ValueKind::Integer, ColumnNaming::Scalar,  "device_id",        ""},
  {"SOC",    "SOC",     kCellCount,  ValueKind::Integer, ColumnNaming::PerCell, "soc_cell",         ""},
  {"Vcell",  "Vcell:",  kCellCount,  ValueKind::Real,    ColumnNaming::PerCell, "vcell",            "_v"},
  {"TEMP",   "TEMP:",   kCellCount,  ValueKind::Real,    ColumnNaming::PerCell, "temp_cell",        "_raw"},
  {"BAL",    "BAL:",    kCellCount,  ValueKind::Integer, ColumnNaming::PerCell, "bal_cell",         ""},
  {"Curr",   "Curr:",   1,           ValueKind::Real,    ColumnNaming::Scalar,  "current_a",        ""},
  {"totV",   "totV:",   1,           ValueKind::Real,    ColumnNaming::Scalar,  "pack_voltage_v",   ""},
  {"Vref",   "Vref:",   1,           ValueKind::Real,    ColumnNaming::Scalar,  "vref_v",           ""},
  {"VUV",    "VUV:",    1,           ValueKind::Real,    ColumnNaming::Scalar,  "vuv_threshold_v",  ""},
  {"VOV",    "VOV:",    1,           ValueKind::Real,    ColumnNaming::Scalar,  "vov_threshold_v",  ""},
  {"GPUT",   "GPUT:",   1,           ValueKind::Real,    ColumnNaming::Scalar,  "gput_threshold_v", ""},
  {"GPOT",   "GPOT:",   1,           ValueKind::Real,    ColumnNaming::Scalar,  "gpot_threshold_v", ""},
  {"FAULTS", "FAULTS:", kFaultCount, ValueKind::Integer, ColumnNaming::Fault,   "fault",            ""},
  {"VTREF",  "VTREF",   1,           ValueKind::Real,    ColumnNaming::Scalar,  "vtref_v",          ""},
}};

constexpr std::array<std::size_t, kSectionCount + 1> make_offsets() {
  std::array<std::size_t, kSectionCount + 1> off{};
  for (std::size_t i = 0; i < kSectionCount; ++i) off[i + 1] = off[i] + kSections[i].count;
  return off;
}

constexpr auto kOffsets = make_offsets();

}

const std::array<SectionSpec, kSectionCount>& frame_sections() noexcept { return kSections; }

std::size_t section_value_offset(std::size_t section) noexcept {
  return section <= kSectionCount ? kOffsets[section] : kOffsets[kSectionCount];
}

std::size_t frame_value_count() noexcept { return kOffsets[kSectionCount]; }

std::size_t find_section_by_label(std::string_view label) noexcept {
  for (std::size_t i = 0; i < kSectionCount; ++i)
    if (kSections[i].label == label) return i;
  return kSectionCount;
}

}

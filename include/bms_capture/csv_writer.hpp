#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace bc {

struct FieldValue;
struct FrameRecord;

struct CsvConfig {
  char delimiter      = ',';
  char quote          = '"';
  bool write_bom      = true;     // UTF-8 BOM for spreadsheet tools
  bool flush_each_row = true;     // keep live captures on disk
  std::string line_end = "\r\n";
};

// Formats `v` into `out` (integers as integers, reals shortest round-trip).
void append_value(std::string& out, const FieldValue& v);

// Appends `field`, quoting it when it holds the delimiter, a quote or a line break.
void append_field(std::string& out, std::string_view field, const CsvConfig& cfg);

// Streams rows to the destination file; never retains earlier rows.
class CsvRowWriter {
public:
  explicit CsvRowWriter(std::string path, CsvConfig cfg = {});
  ~CsvRowWriter();

  CsvRowWriter(const CsvRowWriter&) = delete;
  CsvRowWriter& operator=(const CsvRowWriter&) = delete;

  bool open();
  bool write_header(const std::vector<std::string>& columns);
  bool write_row(std::uint64_t frame_index, const FrameRecord& rec);
  bool close();

  bool header_written() const noexcept { return header_written_; }
  std::uint64_t rows() const noexcept { return rows_; }
  const std::string& path() const noexcept { return path_; }
  const std::string& error() const noexcept { return err_; }

private:
  bool commit(const char* what);

  std::string path_;
  CsvConfig cfg_;
  std::ofstream out_;
  std::string line_;
  bool header_written_{false};
  std::uint64_t rows_{0};
  std::string err_;
};

}

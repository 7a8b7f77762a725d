#include "bms_capture/csv_writer.hpp"
#include "bms_capture/frame_record.hpp"
#include "bms_capture/path_utils.hpp"
#include <cerrno>
#include <charconv>
#include <cstring>

namespace bc {

void append_value(std::string& out, const FieldValue& v) {
  char buf[64];
  std::to_chars_result r;
  if (v.kind == ValueKind::Integer) {
    r = std::to_chars(buf, buf + sizeof(buf), v.ivalue);
  } else {
    r = std::to_chars(buf, buf + sizeof(buf), v.value); // shortest round-trip
  }
  if (r.ec == std::errc()) out.append(buf, static_cast<std::size_t>(r.ptr - buf));
}

void append_field(std::string& out, std::string_view field, const CsvConfig& cfg) {
  const char specials[] = {cfg.delimiter, cfg.quote, '\r', '\n'};
  if (field.find_first_of(std::string_view(specials, sizeof(specials))) == std::string_view::npos) {
    out.append(field.data(), field.size());
    return;
  }
  out.push_back(cfg.quote);
  for (char c : field) {
    if (c == cfg.quote) out.push_back(cfg.quote);
    out.push_back(c);
  }
  out.push_back(cfg.quote);
}

CsvRowWriter::CsvRowWriter(std::string path, CsvConfig cfg)
  : path_(std::move(path)), cfg_(std::move(cfg)) {}

CsvRowWriter::~CsvRowWriter() {
  if (out_.is_open()) out_.close();
}

bool CsvRowWriter::open() {
  if (!ensure_parent_dirs(path_)) {
    err_ = "cannot create parent directory of " + path_;
    return false;
  }
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    err_ = "cannot open " + path_ + ": " + std::strerror(errno);
    return false;
  }
  if (cfg_.write_bom) {
    line_.assign("\xEF\xBB\xBF");
    return commit("BOM");
  }
  return true;
}

bool CsvRowWriter::commit(const char* what) {
  out_.write(line_.data(), static_cast<std::streamsize>(line_.size()));
  if (cfg_.flush_each_row) out_.flush();
  if (!out_) {
    err_ = std::string("write failed (") + what + ") on " + path_;
    return false;
  }
  return true;
}

bool CsvRowWriter::write_header(const std::vector<std::string>& columns) {
  if (!out_.is_open()) { err_ = "writer is not open"; return false; }
  if (header_written_) { err_ = "header already written"; return false; }
  line_.clear();
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (i) line_.push_back(cfg_.delimiter);
    append_field(line_, columns[i], cfg_);
  }
  line_ += cfg_.line_end;
  if (!commit("header")) return false;
  header_written_ = true;
  return true;
}

bool CsvRowWriter::write_row(std::uint64_t frame_index, const FrameRecord& rec) {
  if (!header_written_) { err_ = "row before header"; return false; }
  // Formatted in full, then written with a single call.
  line_.clear();
  line_ += std::to_string(frame_index);
  for (const FieldValue& v : rec.values) {
    line_.push_back(cfg_.delimiter);
    append_value(line_, v);
  }
  line_ += cfg_.line_end;
  if (!commit("row")) return false;
  ++rows_;
  return true;
}

bool CsvRowWriter::close() {
  if (!out_.is_open()) return err_.empty();
  out_.flush();
  const bool ok = static_cast<bool>(out_);
  out_.close();
  if (!ok || out_.fail()) {
    if (err_.empty()) err_ = "close failed on " + path_;
    return false;
  }
  return true;
}

}

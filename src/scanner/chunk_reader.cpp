#include "bms_capture/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <string_view>
#include <vector>

namespace bc {

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  int last_errno{0};
  std::uint64_t bytes{0};

  bool for_each_chunk(const ChunkCallback& cb) {
    const bool use_stdin = (path == "-");
    FILE* f = use_stdin ? stdin : std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return false; }

    std::vector<char> buf(cfg.chunk_bytes > 0 ? cfg.chunk_bytes : 1, 0);
    bool ok = true;
    while (true) {
      std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
      if (n == 0 && std::ferror(f)) { last_errno = errno; ok = false; break; }
      if (n == 0 && std::feof(f))   break;
      bytes += n;
      if (!cb(std::string_view(buf.data(), n))) break;
    }

    if (!use_stdin) std::fclose(f);
    return ok;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::for_each_chunk(const ChunkCallback& cb) { return p_->for_each_chunk(cb); }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }

}

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "bms_capture/chunk_source.hpp"

namespace bc {

// Reads a static capture file ("-" for stdin) in fixed-size chunks.
class ChunkReader : public ChunkSource {
public:
  struct Config {
    std::size_t chunk_bytes = 64 * 1024; // 64 KiB
  };

  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // explicit Config
  ~ChunkReader() override;

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  bool for_each_chunk(const ChunkCallback& cb) override;
  int  last_error() const noexcept override;
  std::uint64_t bytes_read() const noexcept override;

private:
  struct Impl; Impl* p_;
};

}

#pragma once
#include <cstdint>
#include <functional>
#include <string_view>

namespace bc {

// A producer of raw text chunks (static capture or live connection).
class ChunkSource {
public:
  // Return false to stop reading. An empty chunk means "no data yet"
  // and gives the consumer a chance to check its bounds.
  using ChunkCallback = std::function<bool(std::string_view)>;

  virtual ~ChunkSource() = default;

  // Delivers chunks in arrival order until end of input, an I/O error,
  // or the callback stops. Returns false only on I/O error.
  virtual bool for_each_chunk(const ChunkCallback& cb) = 0;

  virtual int last_error() const noexcept = 0;
  virtual std::uint64_t bytes_read() const noexcept = 0;
};

}

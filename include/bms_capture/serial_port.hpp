#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <sys/types.h>
#include <termios.h>

#include "bms_capture/chunk_source.hpp"

namespace bc {

// Raw 8N1 termios serial port.
class SerialPort {
public:
  explicit SerialPort(std::string port, int baud = 115200);
  ~SerialPort();

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  // `read_timeout_ds`: read() returns after this many 1/10 s with no data.
  bool open(int read_timeout_ds = 1);
  void close();
  bool is_open() const noexcept { return fd_ >= 0; }

  // Bytes read, 0 on timeout, -1 on error (see last_error()).
  ssize_t read_some(char* buf, std::size_t max);

  const std::string& port() const noexcept { return port_; }
  int baud() const noexcept { return baud_; }
  int last_error() const noexcept { return last_errno_; }

  // Maps an integer baud rate to a termios speed_t; B0 if unsupported.
  static speed_t map_baud(int baud);

private:
  bool configure(int read_timeout_ds);

  std::string port_;
  int baud_;
  int fd_{-1};
  int last_errno_{0};
};

// Live capture source over a SerialPort.
class SerialChunkSource : public ChunkSource {
public:
  struct Config {
    int baud = 115200;
    int read_timeout_ds = 1;
    std::size_t chunk_bytes = 4096;
  };

  SerialChunkSource(std::string port, Config cfg);

  bool open();
  bool for_each_chunk(const ChunkCallback& cb) override;
  int  last_error() const noexcept override { return port_.last_error(); }
  std::uint64_t bytes_read() const noexcept override { return bytes_; }

private:
  SerialPort port_;
  Config cfg_;
  std::vector<char> buf_;
  std::uint64_t bytes_{0};
};

}

#include "bms_capture/serial_port.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace bc {

SerialPort::SerialPort(std::string port, int baud)
  : port_(std::move(port)), baud_(baud) {}

SerialPort::~SerialPort() { close(); }

speed_t SerialPort::map_baud(int baud) {
  switch (baud) {
    case 9600:   return B9600;
    case 19200:  return B19200;
    case 38400:  return B38400;
    case 57600:  return B57600;
    case 115200: return B115200;
#ifdef B230400
    case 230400: return B230400;
#endif
#ifdef B460800
    case 460800: return B460800;
#endif
#ifdef B500000
    case 500000: return B500000;
#endif
#ifdef B576000
    case 576000: return B576000;
#endif
#ifdef B921600
    case 921600: return B921600;
#endif
#ifdef B1000000
    case 1000000: return B1000000;
#endif
#ifdef B1500000
    case 1500000: return B1500000;
#endif
#ifdef B2000000
    case 2000000: return B2000000;
#endif
    default: return B0;
  }
}

bool SerialPort::configure(int read_timeout_ds) {
  termios tio{};
  if (tcgetattr(fd_, &tio) != 0) { last_errno_ = errno; return false; }

  // Raw mode, no line discipline.
  cfmakeraw(&tio);

  const speed_t sp = map_baud(baud_);
  if (sp == B0) { last_errno_ = EINVAL; return false; }
  cfsetispeed(&tio, sp);
  cfsetospeed(&tio, sp);

  // 8N1, receiver on, ignore modem control, no flow control.
  tio.c_cflag |= (CLOCAL | CREAD | CS8);
  tio.c_cflag &= ~(PARENB | CSTOPB | CRTSCTS);
  tio.c_iflag &= ~(IXON | IXOFF | IXANY);

  // read() returns what is available, or 0 after read_timeout_ds tenths of a second.
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = static_cast<cc_t>(read_timeout_ds > 0 ? read_timeout_ds : 1);

  if (tcsetattr(fd_, TCSANOW, &tio) != 0) { last_errno_ = errno; return false; }

  // Stale bytes belong to a frame we never saw the start of.
  tcflush(fd_, TCIFLUSH);
  return true;
}

bool SerialPort::open(int read_timeout_ds) {
  close();

  // O_NONBLOCK only for the open itself; VTIME governs reads afterwards.
  fd_ = ::open(port_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) { last_errno_ = errno; return false; }

  const int flags = ::fcntl(fd_, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd_, F_SETFL, flags & ~O_NONBLOCK) < 0 || !configure(read_timeout_ds)) {
    if (last_errno_ == 0) last_errno_ = errno;
    ::close(fd_);
    fd_ = -1;
    return false;
  }
  return true;
}

void SerialPort::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

ssize_t SerialPort::read_some(char* buf, std::size_t max) {
  if (fd_ < 0) { last_errno_ = EBADF; return -1; }
  const ssize_t n = ::read(fd_, buf, max);
  if (n >= 0) return n;
  // EINTR: let the caller look at its stop flag.
  if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return 0;
  last_errno_ = errno;
  return -1;
}

SerialChunkSource::SerialChunkSource(std::string port, Config cfg)
  : port_(std::move(port), cfg.baud), cfg_(cfg), buf_(cfg.chunk_bytes > 0 ? cfg.chunk_bytes : 1) {}

bool SerialChunkSource::open() { return port_.open(cfg_.read_timeout_ds); }

bool SerialChunkSource::for_each_chunk(const ChunkCallback& cb) {
  if (!port_.is_open() && !open()) return false;
  while (true) {
    const ssize_t n = port_.read_some(buf_.data(), buf_.size());
    if (n < 0) { port_.close(); return false; }
    bytes_ += static_cast<std::uint64_t>(n);
    if (!cb(std::string_view(buf_.data(), static_cast<std::size_t>(n)))) break;
  }
  port_.close();
  return true;
}

}

#include "transport/stream/fd_stream.h"

#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>

#include "chunk/chunk_errors.h"
#include "common/logging/logger.h"

namespace rtmp::transport {

namespace {
std::error_code last_error() { return {errno, std::generic_category()}; }
}  // namespace

FdSource::~FdSource() {
  if (owns_fd_ && fd_ >= 0) {
    ::close(fd_);
  }
}

bool FdSource::read(std::span<std::uint8_t> out, std::error_code& ec) {
  std::size_t filled = 0;
  while (filled < out.size()) {
    const auto n = ::read(fd_, out.data() + filled, out.size() - filled);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ec = last_error();
      LOG_DEBUG("read on fd {} failed: {}", fd_, ec.message());
      return false;
    }
    if (n == 0) {
      ec = chunk::errc::end_of_stream;
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  return true;
}

FdSink::~FdSink() {
  if (owns_fd_ && fd_ >= 0) {
    ::close(fd_);
  }
}

bool FdSink::write(std::span<const std::uint8_t> data, std::error_code& ec) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const auto n = ::write(fd_, data.data() + sent, data.size() - sent);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ec = last_error();
      LOG_DEBUG("write on fd {} failed: {}", fd_, ec.message());
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

}  // namespace rtmp::transport

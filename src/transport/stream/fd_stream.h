#pragma once

#include <cstdint>
#include <span>
#include <system_error>

#include "transport/stream/byte_stream.h"

namespace rtmp::transport {

// Byte source over a POSIX file descriptor (socket, pipe or file).
// Does not own the descriptor unless constructed with owns_fd = true.
class FdSource : public ByteSource {
 public:
  explicit FdSource(int fd, bool owns_fd = false) : fd_(fd), owns_fd_(owns_fd) {}
  ~FdSource() override;

  FdSource(const FdSource&) = delete;
  FdSource& operator=(const FdSource&) = delete;
  FdSource(FdSource&&) = delete;
  FdSource& operator=(FdSource&&) = delete;

  bool read(std::span<std::uint8_t> out, std::error_code& ec) override;

  int fd() const { return fd_; }

 private:
  int fd_{-1};
  bool owns_fd_{false};
};

// Byte sink over a POSIX file descriptor.
class FdSink : public ByteSink {
 public:
  explicit FdSink(int fd, bool owns_fd = false) : fd_(fd), owns_fd_(owns_fd) {}
  ~FdSink() override;

  FdSink(const FdSink&) = delete;
  FdSink& operator=(const FdSink&) = delete;
  FdSink(FdSink&&) = delete;
  FdSink& operator=(FdSink&&) = delete;

  bool write(std::span<const std::uint8_t> data, std::error_code& ec) override;

  int fd() const { return fd_; }

 private:
  int fd_{-1};
  bool owns_fd_{false};
};

}  // namespace rtmp::transport

#pragma once

#include <cstdint>
#include <span>
#include <system_error>

namespace rtmp::transport {

// Blocking byte input. read() fills the entire span or fails; an exhausted
// source reports chunk::errc::end_of_stream.
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  virtual bool read(std::span<std::uint8_t> out, std::error_code& ec) = 0;
};

// Blocking byte output. write() delivers the entire span or fails.
class ByteSink {
 public:
  virtual ~ByteSink() = default;

  virtual bool write(std::span<const std::uint8_t> data, std::error_code& ec) = 0;
};

}  // namespace rtmp::transport

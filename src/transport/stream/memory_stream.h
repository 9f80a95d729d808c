#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

#include "transport/stream/byte_stream.h"

namespace rtmp::transport {

// Source over an owned byte vector. Used by tests and by the capture tool.
class MemorySource : public ByteSource {
 public:
  MemorySource() = default;
  explicit MemorySource(std::vector<std::uint8_t> data);

  bool read(std::span<std::uint8_t> out, std::error_code& ec) override;

  // Append more bytes at the end of the source.
  void append(std::span<const std::uint8_t> data);

  // Drop `count` unread bytes (e.g. a captured handshake prefix).
  bool skip(std::size_t count, std::error_code& ec);

  [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - offset_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return offset_; }

 private:
  std::vector<std::uint8_t> data_;
  std::size_t offset_{0};
};

// Sink collecting everything written into a byte vector.
class MemorySink : public ByteSink {
 public:
  bool write(std::span<const std::uint8_t> data, std::error_code& ec) override;

  [[nodiscard]] const std::vector<std::uint8_t>& data() const noexcept { return data_; }
  [[nodiscard]] std::size_t write_calls() const noexcept { return write_calls_; }

  // Make every write after `count` successful writes fail with `ec`.
  void fail_after(std::size_t count, std::error_code ec);

  std::vector<std::uint8_t> take();
  void clear();

 private:
  std::vector<std::uint8_t> data_;
  std::size_t write_calls_{0};
  std::size_t fail_after_{0};
  bool fail_enabled_{false};
  std::error_code fail_ec_;
};

}  // namespace rtmp::transport

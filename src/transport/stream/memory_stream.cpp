#include "transport/stream/memory_stream.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include "chunk/chunk_errors.h"

namespace rtmp::transport {

MemorySource::MemorySource(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

bool MemorySource::read(std::span<std::uint8_t> out, std::error_code& ec) {
  if (out.size() > remaining()) {
    // Consume what is left so the source stays exhausted.
    offset_ = data_.size();
    ec = chunk::errc::end_of_stream;
    return false;
  }
  std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), out.size(), out.begin());
  offset_ += out.size();
  return true;
}

void MemorySource::append(std::span<const std::uint8_t> data) {
  data_.insert(data_.end(), data.begin(), data.end());
}

bool MemorySource::skip(std::size_t count, std::error_code& ec) {
  if (count > remaining()) {
    offset_ = data_.size();
    ec = chunk::errc::end_of_stream;
    return false;
  }
  offset_ += count;
  return true;
}

bool MemorySink::write(std::span<const std::uint8_t> data, std::error_code& ec) {
  if (fail_enabled_ && write_calls_ >= fail_after_) {
    ec = fail_ec_;
    return false;
  }
  ++write_calls_;
  data_.insert(data_.end(), data.begin(), data.end());
  return true;
}

void MemorySink::fail_after(std::size_t count, std::error_code ec) {
  fail_enabled_ = true;
  fail_after_ = count;
  fail_ec_ = ec;
}

std::vector<std::uint8_t> MemorySink::take() {
  auto out = std::move(data_);
  data_.clear();
  return out;
}

void MemorySink::clear() {
  data_.clear();
  write_calls_ = 0;
}

}  // namespace rtmp::transport

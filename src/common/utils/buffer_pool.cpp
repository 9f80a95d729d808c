#include "common/utils/buffer_pool.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

namespace rtmp::utils {

BufferPool::BufferPool(std::size_t max_per_class) : max_per_class_(max_per_class) {}

BufferPool& BufferPool::shared() {
  static BufferPool pool;
  return pool;
}

std::size_t BufferPool::class_index(std::size_t size) noexcept {
  for (std::size_t i = 0; i < kSizeClasses.size(); ++i) {
    if (size <= kSizeClasses[i]) {
      return i;
    }
  }
  return kSizeClasses.size();
}

std::vector<std::uint8_t> BufferPool::acquire(std::size_t size) {
  if (size == 0) {
    return {};
  }

  const auto idx = class_index(size);
  if (idx == kSizeClasses.size()) {
    // Ungoverned allocation for large messages.
    {
      std::lock_guard<std::mutex> lock(misc_mutex_);
      ++oversized_;
    }
    return std::vector<std::uint8_t>(size);
  }

  auto& size_class = classes_[idx];
  {
    std::lock_guard<std::mutex> lock(size_class.mutex);
    if (!size_class.free_buffers.empty()) {
      auto buffer = std::move(size_class.free_buffers.back());
      size_class.free_buffers.pop_back();
      ++size_class.reuses;
      // Shrinking never reallocates, so capacity stays at the class size.
      buffer.resize(size);
      return buffer;
    }
    ++size_class.allocations;
  }

  std::vector<std::uint8_t> buffer;
  buffer.reserve(kSizeClasses[idx]);
  buffer.resize(size);
  return buffer;
}

void BufferPool::release(std::vector<std::uint8_t>&& buffer) {
  const auto capacity = buffer.capacity();
  const auto it = std::find(kSizeClasses.begin(), kSizeClasses.end(), capacity);
  if (it == kSizeClasses.end()) {
    std::lock_guard<std::mutex> lock(misc_mutex_);
    ++discarded_;
    return;  // Not ours - let the destructor free it
  }

  // Zero the whole class-sized region so no caller observes another's data.
  // assign() within capacity does not reallocate.
  buffer.assign(capacity, 0);

  auto& size_class = classes_[static_cast<std::size_t>(it - kSizeClasses.begin())];
  std::lock_guard<std::mutex> lock(size_class.mutex);
  ++size_class.releases;
  if (max_per_class_ > 0 && size_class.free_buffers.size() >= max_per_class_) {
    return;
  }
  size_class.free_buffers.push_back(std::move(buffer));
}

BufferPool::ClassStats BufferPool::stats(std::size_t class_idx) const {
  ClassStats out;
  if (class_idx >= kSizeClasses.size()) {
    return out;
  }
  const auto& size_class = classes_[class_idx];
  std::lock_guard<std::mutex> lock(size_class.mutex);
  out.class_size = kSizeClasses[class_idx];
  out.available = size_class.free_buffers.size();
  out.allocations = size_class.allocations;
  out.reuses = size_class.reuses;
  out.releases = size_class.releases;
  return out;
}

std::uint64_t BufferPool::discarded() const {
  std::lock_guard<std::mutex> lock(misc_mutex_);
  return discarded_;
}

std::uint64_t BufferPool::oversized_allocations() const {
  std::lock_guard<std::mutex> lock(misc_mutex_);
  return oversized_;
}

}  // namespace rtmp::utils

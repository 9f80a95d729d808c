#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace rtmp::utils {

/**
 * Size-classed pool of byte buffers used by the chunk reader and writer to
 * avoid allocating a fresh payload buffer for every message and chunk.
 *
 * Buffers are handed out as std::vector<std::uint8_t> whose size() equals the
 * requested size and whose capacity() equals the smallest size class able to
 * hold it (128, 4096 or 65536 bytes). Requests above the largest class are
 * allocated directly and never pooled.
 *
 * Thread Safety:
 * - All methods are thread-safe. Each size class has its own mutex, so
 *   acquires of different classes never contend.
 *
 * Usage Example:
 *   auto& pool = BufferPool::shared();
 *   auto buffer = pool.acquire(1500);   // size 1500, capacity 4096
 *   // ... fill buffer ...
 *   pool.release(std::move(buffer));    // zeroed and returned to the 4096 class
 */
class BufferPool {
 public:
  static constexpr std::array<std::size_t, 3> kSizeClasses{128, 4096, 65536};
  static constexpr std::size_t kLargestClass = kSizeClasses.back();

  struct ClassStats {
    std::size_t class_size{0};
    std::size_t available{0};
    std::uint64_t allocations{0};
    std::uint64_t reuses{0};
    std::uint64_t releases{0};
  };

  /**
   * @param max_per_class Maximum number of idle buffers kept per class
   *                      (0 = unlimited).
   */
  explicit BufferPool(std::size_t max_per_class = 0);

  // Non-copyable, non-movable (contains mutexes)
  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;
  BufferPool(BufferPool&&) = delete;
  BufferPool& operator=(BufferPool&&) = delete;

  ~BufferPool() = default;

  /**
   * Process-wide pool shared by every reader and writer that is not given
   * its own pool.
   */
  static BufferPool& shared();

  /**
   * Acquire a buffer of exactly `size` bytes. Pooled buffers are always
   * zero-filled. A size of 0 yields an empty buffer with no capacity.
   */
  [[nodiscard]] std::vector<std::uint8_t> acquire(std::size_t size);

  /**
   * Return a buffer. It is kept only when its capacity matches a size class
   * exactly and that class is below max_per_class; otherwise it is freed.
   */
  void release(std::vector<std::uint8_t>&& buffer);

  /**
   * Index of the class that would serve `size`, or kSizeClasses.size() when
   * the request is ungoverned.
   */
  [[nodiscard]] static std::size_t class_index(std::size_t size) noexcept;

  [[nodiscard]] ClassStats stats(std::size_t class_idx) const;

  // Releases whose capacity matched no class.
  [[nodiscard]] std::uint64_t discarded() const;

  // Acquires larger than kLargestClass.
  [[nodiscard]] std::uint64_t oversized_allocations() const;

 private:
  struct SizeClass {
    mutable std::mutex mutex;
    std::vector<std::vector<std::uint8_t>> free_buffers;
    std::uint64_t allocations{0};
    std::uint64_t reuses{0};
    std::uint64_t releases{0};
  };

  std::size_t max_per_class_;
  std::array<SizeClass, kSizeClasses.size()> classes_;

  mutable std::mutex misc_mutex_;
  std::uint64_t discarded_{0};
  std::uint64_t oversized_{0};
};

}  // namespace rtmp::utils

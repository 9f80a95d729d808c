#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <system_error>
#include <unordered_map>

#include "chunk/chunk_errors.h"
#include "chunk/chunk_header.h"
#include "common/utils/buffer_pool.h"
#include "transport/stream/byte_stream.h"

namespace rtmp::chunk {

struct WriterConfig {
  std::uint32_t chunk_size{kDefaultChunkSize};
  std::uint32_t max_chunk_size{kDefaultMaxChunkSize};
};

struct WriterStats {
  std::uint64_t chunks_written{0};
  std::uint64_t messages_written{0};
  std::uint64_t payload_bytes{0};
  std::uint64_t header_bytes{0};
  // First-chunk header formats chosen, indexed by HeaderFormat.
  std::array<std::uint64_t, 4> formats{};
};

// Splits messages into chunks. The first chunk of each message carries the
// most compact header relative to the last message on the same CSID; the
// rest are format 3 continuations.
//
// A failed write_message() may have already emitted part of the message; the
// connection must then be torn down.
//
// Thread Safety: not thread-safe. One thread drives a writer.
class ChunkWriter {
 public:
  // `pool` defaults to utils::BufferPool::shared(). The sink must outlive the writer.
  explicit ChunkWriter(transport::ByteSink& sink, WriterConfig config = {},
                       utils::BufferPool* pool = nullptr);

  ChunkWriter(const ChunkWriter&) = delete;
  ChunkWriter& operator=(const ChunkWriter&) = delete;
  ChunkWriter(ChunkWriter&&) = delete;
  ChunkWriter& operator=(ChunkWriter&&) = delete;

  // msg.message_length may be 0 (taken from the payload) or must equal the payload size.
  bool write_message(const Message& msg, std::error_code& ec);

  // Change the outbound chunk size for subsequent messages only. The peer
  // must be told separately (see write_set_chunk_size()).
  bool set_chunk_size(std::uint32_t size, std::error_code& ec);

  // Send Set Chunk Size on the control stream, then switch to `size`.
  bool write_set_chunk_size(std::uint32_t size, std::error_code& ec);

  [[nodiscard]] std::uint32_t chunk_size() const noexcept { return chunk_size_; }
  [[nodiscard]] std::uint32_t max_chunk_size() const noexcept { return max_chunk_size_; }

  [[nodiscard]] std::optional<ChunkHeader> last_header(std::uint32_t csid) const;

  [[nodiscard]] const ChunkErrorContext& last_error() const noexcept { return last_error_; }
  [[nodiscard]] const WriterStats& stats() const noexcept { return stats_; }

 private:
  bool fail(std::error_code& ec, std::error_code code, const char* operation, std::uint32_t csid,
            std::size_t expected, std::size_t actual);

  transport::ByteSink& sink_;
  utils::BufferPool& pool_;
  std::uint32_t chunk_size_;
  std::uint32_t max_chunk_size_;
  std::unordered_map<std::uint32_t, ChunkHeader> last_headers_;
  ChunkErrorContext last_error_;
  WriterStats stats_;
};

}  // namespace rtmp::chunk

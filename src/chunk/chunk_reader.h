#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include "chunk/chunk_errors.h"
#include "chunk/chunk_header.h"
#include "chunk/control_message.h"
#include "common/utils/buffer_pool.h"
#include "transport/stream/byte_stream.h"

namespace rtmp::chunk {

struct ReaderConfig {
  std::uint32_t chunk_size{kDefaultChunkSize};
  std::uint32_t max_chunk_size{kDefaultMaxChunkSize};
};

struct ReaderStats {
  std::uint64_t chunks_read{0};
  std::uint64_t messages_read{0};
  std::uint64_t payload_bytes{0};
  std::uint64_t control_messages{0};
  std::uint64_t aborted_messages{0};
};

// Reassembles messages from an interleaved stream of chunks.
//
// Keeps one state record per CSID: the last decoded header (base for header
// compression) and the partially received payload. Set Chunk Size and Abort
// Message are applied internally and never returned from read_message().
//
// Thread Safety: not thread-safe. One thread drives a reader.
class ChunkReader {
 public:
  using ControlObserver = std::function<void(const ControlEvent&)>;

  // `pool` defaults to utils::BufferPool::shared(). The source must outlive the reader.
  explicit ChunkReader(transport::ByteSource& source, ReaderConfig config = {},
                       utils::BufferPool* pool = nullptr);
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;
  ChunkReader(ChunkReader&&) = delete;
  ChunkReader& operator=(ChunkReader&&) = delete;

  // Block until a complete message is available. Protocol errors are fatal
  // for the connection; transport errors are returned unchanged.
  bool read_message(Message& out, std::error_code& ec);

  // Change the inbound chunk size. Applies from the next chunk header on.
  // Rejected sizes leave the current size untouched.
  bool set_chunk_size(std::uint32_t size, std::error_code& ec);

  [[nodiscard]] std::uint32_t chunk_size() const noexcept { return chunk_size_; }
  [[nodiscard]] std::uint32_t max_chunk_size() const noexcept { return max_chunk_size_; }

  // Called for every intercepted Set Chunk Size / Abort Message.
  void set_control_observer(ControlObserver observer) { control_observer_ = std::move(observer); }

  // Hand a delivered payload back to the buffer pool.
  void recycle(Message& msg);

  [[nodiscard]] const ChunkErrorContext& last_error() const noexcept { return last_error_; }
  [[nodiscard]] const ReaderStats& stats() const noexcept { return stats_; }

  // Number of CSIDs with a partially received message.
  [[nodiscard]] std::size_t pending_streams() const noexcept;

  // Last header decoded on `csid`, if any.
  [[nodiscard]] std::optional<ChunkHeader> last_header(std::uint32_t csid) const;

 private:
  struct StreamState {
    std::optional<ChunkHeader> last_header;
    std::vector<std::uint8_t> payload;
    std::uint32_t bytes_received{0};
    bool in_progress{false};
  };

  bool read_header(ChunkHeader& header, std::error_code& ec);
  bool accept_header(StreamState& state, ChunkHeader& header, std::error_code& ec);
  bool apply_control(const Message& msg, std::error_code& ec);
  void discard_payload(StreamState& state);
  bool fail(std::error_code& ec, std::error_code code, const char* operation, std::uint32_t csid,
            std::size_t expected, std::size_t actual);

  transport::ByteSource& source_;
  utils::BufferPool& pool_;
  std::uint32_t chunk_size_;
  std::uint32_t max_chunk_size_;
  std::unordered_map<std::uint32_t, StreamState> streams_;
  ControlObserver control_observer_;
  ChunkErrorContext last_error_;
  ReaderStats stats_;
};

}  // namespace rtmp::chunk

#include "chunk/chunk_writer.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include "chunk/control_message.h"
#include "chunk/header_codec.h"
#include "common/logging/logger.h"

namespace rtmp::chunk {

ChunkWriter::ChunkWriter(transport::ByteSink& sink, WriterConfig config, utils::BufferPool* pool)
    : sink_(sink),
      pool_(pool != nullptr ? *pool : utils::BufferPool::shared()),
      chunk_size_(kDefaultChunkSize),
      max_chunk_size_(config.max_chunk_size) {
  std::error_code ec;
  if (!validate_max_chunk_size(max_chunk_size_, ec)) {
    LOG_WARN("Invalid outbound max chunk size {}, using {}", max_chunk_size_,
             kDefaultMaxChunkSize);
    max_chunk_size_ = kDefaultMaxChunkSize;
  }
  if (!validate_chunk_size(config.chunk_size, max_chunk_size_, ec)) {
    LOG_WARN("Invalid initial outbound chunk size {}, using {}", config.chunk_size,
             kDefaultChunkSize);
  } else {
    chunk_size_ = config.chunk_size;
  }
}

bool ChunkWriter::set_chunk_size(std::uint32_t size, std::error_code& ec) {
  if (!validate_chunk_size(size, max_chunk_size_, ec)) {
    return fail(ec, ec, "writer.set_chunk_size", 0, max_chunk_size_, size);
  }
  if (size != chunk_size_) {
    LOG_INFO("Outbound chunk size changed {} -> {}", chunk_size_, size);
  }
  chunk_size_ = size;
  return true;
}

bool ChunkWriter::write_set_chunk_size(std::uint32_t size, std::error_code& ec) {
  if (!validate_chunk_size(size, max_chunk_size_, ec)) {
    return fail(ec, ec, "writer.write_set_chunk_size", kControlCsid, max_chunk_size_, size);
  }
  if (!write_message(make_set_chunk_size_message(size), ec)) {
    return false;
  }
  return set_chunk_size(size, ec);
}

std::optional<ChunkHeader> ChunkWriter::last_header(std::uint32_t csid) const {
  const auto it = last_headers_.find(csid);
  if (it == last_headers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ChunkWriter::write_message(const Message& msg, std::error_code& ec) {
  const std::size_t length = msg.payload.size();
  if (length > kMaxMessageLength) {
    return fail(ec, errc::message_too_large, "writer.write_message", msg.csid, kMaxMessageLength,
                length);
  }
  if (msg.message_length != 0 && msg.message_length != length) {
    return fail(ec, std::make_error_code(std::errc::invalid_argument), "writer.write_message",
                msg.csid, msg.message_length, length);
  }
  if (HeaderCodec::basic_header_size_for(msg.csid) == 0) {
    return fail(ec, errc::invalid_csid, "writer.write_message", msg.csid, kMinCsid, msg.csid);
  }

  ChunkHeader header{};
  header.csid = msg.csid;
  header.timestamp = msg.timestamp;
  header.message_length = static_cast<std::uint32_t>(length);
  header.type_id = msg.type_id;
  header.message_stream_id = msg.message_stream_id;

  const auto it = last_headers_.find(msg.csid);
  const ChunkHeader* prior = it != last_headers_.end() ? &it->second : nullptr;
  const auto resolved = HeaderCodec::select_format(header, prior);

  const std::size_t first_len = std::min<std::size_t>(chunk_size_, length);
  // The first chunk is the largest; every chunk is staged in the same buffer.
  auto staging = pool_.acquire(kMaxHeaderSize + first_len);
  std::span<std::uint8_t> out(staging);
  std::span<const std::uint8_t> payload(msg.payload);

  const auto header_len = HeaderCodec::encode_to(resolved, out, ec);
  if (header_len == 0) {
    pool_.release(std::move(staging));
    return fail(ec, ec, "writer.encode_header", msg.csid, kMaxHeaderSize, 0);
  }
  std::copy_n(payload.begin(), first_len, out.begin() + static_cast<std::ptrdiff_t>(header_len));
  if (!sink_.write(out.first(header_len + first_len), ec)) {
    pool_.release(std::move(staging));
    return fail(ec, ec, "writer.write_chunk", msg.csid, header_len + first_len, 0);
  }
  last_headers_[msg.csid] = resolved;
  ++stats_.formats[static_cast<std::size_t>(resolved.format)];
  ++stats_.chunks_written;
  stats_.header_bytes += header_len;
  stats_.payload_bytes += first_len;

  LOG_TRACE("message csid={} fmt={} ts={} len={} type={} stream={}", msg.csid,
            static_cast<int>(resolved.format), msg.timestamp, length, msg.type_id,
            msg.message_stream_id);

  std::size_t offset = first_len;
  if (offset < length) {
    const auto cont_len = HeaderCodec::encode_continuation_to(resolved, out, ec);
    if (cont_len == 0) {
      pool_.release(std::move(staging));
      return fail(ec, ec, "writer.encode_continuation", msg.csid, kMaxHeaderSize, 0);
    }
    while (offset < length) {
      const std::size_t n = std::min<std::size_t>(chunk_size_, length - offset);
      std::copy_n(payload.begin() + static_cast<std::ptrdiff_t>(offset), n,
                  out.begin() + static_cast<std::ptrdiff_t>(cont_len));
      if (!sink_.write(out.first(cont_len + n), ec)) {
        pool_.release(std::move(staging));
        return fail(ec, ec, "writer.write_chunk", msg.csid, length, offset);
      }
      offset += n;
      ++stats_.chunks_written;
      stats_.header_bytes += cont_len;
      stats_.payload_bytes += n;
    }
  }

  pool_.release(std::move(staging));
  ++stats_.messages_written;
  return true;
}

bool ChunkWriter::fail(std::error_code& ec, std::error_code code, const char* operation,
                       std::uint32_t csid, std::size_t expected, std::size_t actual) {
  last_error_.code = code;
  last_error_.operation = operation;
  last_error_.csid = csid;
  last_error_.expected = expected;
  last_error_.actual = actual;
  LOG_ERROR("Chunk writer failure: {}", last_error_.describe());
  ec = code;
  return false;
}

}  // namespace rtmp::chunk

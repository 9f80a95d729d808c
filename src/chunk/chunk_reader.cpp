#include "chunk/chunk_reader.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include "chunk/header_codec.h"
#include "common/logging/logger.h"

namespace rtmp::chunk {

ChunkReader::ChunkReader(transport::ByteSource& source, ReaderConfig config,
                         utils::BufferPool* pool)
    : source_(source),
      pool_(pool != nullptr ? *pool : utils::BufferPool::shared()),
      chunk_size_(kDefaultChunkSize),
      max_chunk_size_(config.max_chunk_size) {
  std::error_code ec;
  if (!validate_max_chunk_size(max_chunk_size_, ec)) {
    LOG_WARN("Invalid inbound max chunk size {}, using {}", max_chunk_size_,
             kDefaultMaxChunkSize);
    max_chunk_size_ = kDefaultMaxChunkSize;
  }
  if (!validate_chunk_size(config.chunk_size, max_chunk_size_, ec)) {
    LOG_WARN("Invalid initial inbound chunk size {}, using {}", config.chunk_size,
             kDefaultChunkSize);
  } else {
    chunk_size_ = config.chunk_size;
  }
}

ChunkReader::~ChunkReader() {
  for (auto& [csid, state] : streams_) {
    discard_payload(state);
  }
}

bool ChunkReader::set_chunk_size(std::uint32_t size, std::error_code& ec) {
  if (!validate_chunk_size(size, max_chunk_size_, ec)) {
    return fail(ec, ec, "reader.set_chunk_size", 0, max_chunk_size_, size);
  }
  if (size != chunk_size_) {
    LOG_INFO("Inbound chunk size changed {} -> {}", chunk_size_, size);
  }
  chunk_size_ = size;
  return true;
}

void ChunkReader::recycle(Message& msg) {
  pool_.release(std::move(msg.payload));
  msg.payload.clear();
}

std::size_t ChunkReader::pending_streams() const noexcept {
  return static_cast<std::size_t>(std::count_if(
      streams_.begin(), streams_.end(), [](const auto& entry) { return entry.second.in_progress; }));
}

std::optional<ChunkHeader> ChunkReader::last_header(std::uint32_t csid) const {
  const auto it = streams_.find(csid);
  if (it == streams_.end()) {
    return std::nullopt;
  }
  return it->second.last_header;
}

bool ChunkReader::read_message(Message& out, std::error_code& ec) {
  while (true) {
    ChunkHeader header{};
    if (!read_header(header, ec)) {
      return false;
    }

    auto& state = streams_[header.csid];
    if (!accept_header(state, header, ec)) {
      return false;
    }
    state.last_header = header;

    const std::uint32_t remaining = header.message_length - state.bytes_received;
    const std::uint32_t to_read = std::min(chunk_size_, remaining);
    if (to_read > 0) {
      std::span<std::uint8_t> dest(state.payload.data() + state.bytes_received, to_read);
      if (!source_.read(dest, ec)) {
        return fail(ec, ec, "reader.read_chunk_payload", header.csid, to_read, 0);
      }
    }
    state.bytes_received += to_read;
    stats_.payload_bytes += to_read;
    ++stats_.chunks_read;

    LOG_TRACE("chunk csid={} fmt={} len={} got={}/{}", header.csid,
              static_cast<int>(header.format), to_read, state.bytes_received,
              header.message_length);

    if (state.bytes_received < header.message_length) {
      continue;
    }

    Message msg;
    msg.csid = header.csid;
    msg.timestamp = header.timestamp;
    msg.message_length = header.message_length;
    msg.type_id = header.type_id;
    msg.message_stream_id = header.message_stream_id;
    msg.payload = std::move(state.payload);
    state.payload.clear();
    state.bytes_received = 0;
    state.in_progress = false;

    if (is_chunk_control(msg.type_id)) {
      ++stats_.control_messages;
      const bool applied = apply_control(msg, ec);
      recycle(msg);
      if (!applied) {
        return false;
      }
      continue;
    }

    ++stats_.messages_read;
    out = std::move(msg);
    return true;
  }
}

bool ChunkReader::read_header(ChunkHeader& header, std::error_code& ec) {
  std::array<std::uint8_t, kMaxHeaderSize> buf{};
  std::size_t have = 1;
  if (!source_.read(std::span<std::uint8_t>(buf.data(), 1), ec)) {
    return fail(ec, ec, "reader.read_basic_header", 0, 1, 0);
  }

  const auto basic = HeaderCodec::basic_header_size(buf[0]);
  if (basic > have) {
    if (!source_.read(std::span<std::uint8_t>(buf.data() + have, basic - have), ec)) {
      return fail(ec, ec, "reader.read_basic_header", 0, basic, have);
    }
    have = basic;
  }

  HeaderFormat format{};
  std::uint32_t csid = 0;
  std::size_t consumed = 0;
  HeaderCodec::decode_basic_header(std::span<const std::uint8_t>(buf.data(), have), format, csid,
                                   consumed);

  const ChunkHeader* prior = nullptr;
  const auto it = streams_.find(csid);
  if (it != streams_.end() && it->second.last_header) {
    prior = &*it->second.last_header;
  }

  for (auto need = HeaderCodec::required_size(std::span<const std::uint8_t>(buf.data(), have), prior);
       need > have;
       need = HeaderCodec::required_size(std::span<const std::uint8_t>(buf.data(), have), prior)) {
    if (!source_.read(std::span<std::uint8_t>(buf.data() + have, need - have), ec)) {
      return fail(ec, ec, "reader.read_message_header", csid, need, have);
    }
    have = need;
  }

  std::error_code decode_ec;
  if (!HeaderCodec::decode(std::span<const std::uint8_t>(buf.data(), have), prior, header,
                           consumed, decode_ec)) {
    return fail(ec, decode_ec, "reader.decode_header", csid, have, consumed);
  }
  return true;
}

bool ChunkReader::accept_header(StreamState& state, ChunkHeader& header, std::error_code& ec) {
  if (!state.in_progress) {
    // A format 3 header that opens a message repeats the previous delta.
    if (header.format == HeaderFormat::kInherit) {
      header.timestamp += header.timestamp_field;
    }
    state.payload = pool_.acquire(header.message_length);
    state.bytes_received = 0;
    state.in_progress = true;
    return true;
  }

  const auto& current = *state.last_header;
  if (header.format == HeaderFormat::kInherit) {
    return true;
  }
  // Some peers resend a full header on continuation chunks; accept it when it
  // describes the same message.
  if (header.message_length != current.message_length || header.type_id != current.type_id ||
      header.message_stream_id != current.message_stream_id ||
      header.timestamp != current.timestamp) {
    return fail(ec, errc::unexpected_continuation, "reader.continuation", header.csid,
                current.message_length, header.message_length);
  }
  return true;
}

bool ChunkReader::apply_control(const Message& msg, std::error_code& ec) {
  ControlEvent event;
  event.type = static_cast<ControlType>(msg.type_id);
  event.csid = msg.csid;

  if (event.type == ControlType::kSetChunkSize) {
    std::error_code parse_ec;
    if (!parse_set_chunk_size(msg.payload, max_chunk_size_, event.value, parse_ec)) {
      return fail(ec, parse_ec, "reader.set_chunk_size_message", msg.csid, 4, msg.payload.size());
    }
    LOG_INFO("Peer set chunk size {} -> {}", chunk_size_, event.value);
    chunk_size_ = event.value;
  } else {
    std::error_code parse_ec;
    if (!parse_abort_message(msg.payload, event.value, parse_ec)) {
      return fail(ec, parse_ec, "reader.abort_message", msg.csid, 4, msg.payload.size());
    }
    const auto it = streams_.find(event.value);
    if (it != streams_.end() && it->second.in_progress) {
      LOG_DEBUG("Aborting partial message on csid {} ({} bytes received)", event.value,
                it->second.bytes_received);
      discard_payload(it->second);
      ++stats_.aborted_messages;
    }
  }

  if (control_observer_) {
    control_observer_(event);
  }
  return true;
}

void ChunkReader::discard_payload(StreamState& state) {
  if (!state.payload.empty()) {
    pool_.release(std::move(state.payload));
  }
  state.payload.clear();
  state.bytes_received = 0;
  state.in_progress = false;
}

bool ChunkReader::fail(std::error_code& ec, std::error_code code, const char* operation,
                       std::uint32_t csid, std::size_t expected, std::size_t actual) {
  last_error_.code = code;
  last_error_.operation = operation;
  last_error_.csid = csid;
  last_error_.expected = expected;
  last_error_.actual = actual;
  if (is_protocol_error(code)) {
    LOG_ERROR("Chunk reader failure: {}", last_error_.describe());
  } else {
    LOG_DEBUG("Chunk reader stopped: {}", last_error_.describe());
  }
  ec = code;
  return false;
}

}  // namespace rtmp::chunk

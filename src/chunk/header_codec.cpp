#include "chunk/header_codec.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

#include "chunk/chunk_errors.h"
#include "common/logging/logger.h"

namespace {

using rtmp::chunk::HeaderFormat;

std::uint32_t read_u24(std::span<const std::uint8_t> data, std::size_t offset) {
  return (static_cast<std::uint32_t>(data[offset]) << 16) |
         (static_cast<std::uint32_t>(data[offset + 1]) << 8) |
         static_cast<std::uint32_t>(data[offset + 2]);
}

std::uint32_t read_u32(std::span<const std::uint8_t> data, std::size_t offset) {
  return (static_cast<std::uint32_t>(data[offset]) << 24) |
         (static_cast<std::uint32_t>(data[offset + 1]) << 16) |
         (static_cast<std::uint32_t>(data[offset + 2]) << 8) |
         static_cast<std::uint32_t>(data[offset + 3]);
}

std::uint32_t read_u32_le(std::span<const std::uint8_t> data, std::size_t offset) {
  return static_cast<std::uint32_t>(data[offset]) |
         (static_cast<std::uint32_t>(data[offset + 1]) << 8) |
         (static_cast<std::uint32_t>(data[offset + 2]) << 16) |
         (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

void write_u24_at(std::span<std::uint8_t> out, std::size_t offset, std::uint32_t value) {
  out[offset] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
  out[offset + 1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
  out[offset + 2] = static_cast<std::uint8_t>(value & 0xFF);
}

void write_u32_at(std::span<std::uint8_t> out, std::size_t offset, std::uint32_t value) {
  out[offset] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
  out[offset + 1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
  out[offset + 2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
  out[offset + 3] = static_cast<std::uint8_t>(value & 0xFF);
}

void write_u32_le_at(std::span<std::uint8_t> out, std::size_t offset, std::uint32_t value) {
  out[offset] = static_cast<std::uint8_t>(value & 0xFF);
  out[offset + 1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
  out[offset + 2] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
  out[offset + 3] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
}

std::size_t write_basic_header(std::span<std::uint8_t> out, HeaderFormat format,
                               std::uint32_t csid) {
  const auto fmt_bits = static_cast<std::uint8_t>(static_cast<std::uint8_t>(format) << 6);
  if (csid <= rtmp::chunk::kMaxOneByteCsid) {
    out[0] = static_cast<std::uint8_t>(fmt_bits | csid);
    return 1;
  }
  const auto value = csid - 64;
  if (csid <= rtmp::chunk::kMaxTwoByteCsid) {
    out[0] = fmt_bits;
    out[1] = static_cast<std::uint8_t>(value);
    return 2;
  }
  out[0] = static_cast<std::uint8_t>(fmt_bits | 0x01);
  out[1] = static_cast<std::uint8_t>(value & 0xFF);
  out[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
  return 3;
}

}  // namespace

namespace rtmp::chunk {

std::size_t HeaderCodec::basic_header_size(std::uint8_t first_byte) noexcept {
  switch (first_byte & 0x3F) {
    case 0:
      return 2;
    case 1:
      return 3;
    default:
      return 1;
  }
}

std::size_t HeaderCodec::basic_header_size_for(std::uint32_t csid) noexcept {
  if (csid < kMinCsid || csid > kMaxCsid) {
    return 0;
  }
  if (csid <= kMaxOneByteCsid) {
    return 1;
  }
  return csid <= kMaxTwoByteCsid ? 2 : 3;
}

std::size_t HeaderCodec::message_header_size(HeaderFormat format) noexcept {
  switch (format) {
    case HeaderFormat::kFull:
      return 11;
    case HeaderFormat::kSameStream:
      return 7;
    case HeaderFormat::kDeltaOnly:
      return 3;
    case HeaderFormat::kInherit:
      return 0;
  }
  return 0;
}

bool HeaderCodec::decode_basic_header(std::span<const std::uint8_t> data, HeaderFormat& format,
                                      std::uint32_t& csid, std::size_t& consumed) noexcept {
  if (data.empty()) {
    return false;
  }
  const auto size = basic_header_size(data[0]);
  if (data.size() < size) {
    return false;
  }
  format = static_cast<HeaderFormat>(data[0] >> 6);
  switch (size) {
    case 2:
      csid = static_cast<std::uint32_t>(data[1]) + 64;
      break;
    case 3:
      csid = static_cast<std::uint32_t>(data[1]) + (static_cast<std::uint32_t>(data[2]) << 8) + 64;
      break;
    default:
      csid = data[0] & 0x3F;
      break;
  }
  consumed = size;
  return true;
}

std::size_t HeaderCodec::required_size(std::span<const std::uint8_t> data,
                                       const ChunkHeader* prior) noexcept {
  if (data.empty()) {
    return 1;
  }
  const auto basic = basic_header_size(data[0]);
  if (data.size() < basic) {
    return basic;
  }
  const auto format = static_cast<HeaderFormat>(data[0] >> 6);
  const auto base = basic + message_header_size(format);
  if (format == HeaderFormat::kInherit) {
    return base + ((prior != nullptr && prior->extended_timestamp) ? kExtendedTimestampSize : 0);
  }
  if (data.size() < base) {
    return base;
  }
  return base + (read_u24(data, basic) == kExtendedTimestampMarker ? kExtendedTimestampSize : 0);
}

bool HeaderCodec::decode(std::span<const std::uint8_t> data, const ChunkHeader* prior,
                         ChunkHeader& out, std::size_t& consumed, std::error_code& ec) {
  HeaderFormat format{};
  std::uint32_t csid = 0;
  std::size_t pos = 0;
  if (!decode_basic_header(data, format, csid, pos)) {
    LOG_ERROR("Chunk header truncated in basic header: have {} bytes", data.size());
    ec = errc::malformed_header;
    return false;
  }

  if (format != HeaderFormat::kFull && (prior == nullptr || prior->csid != csid)) {
    LOG_ERROR("Chunk header fmt {} on csid {} without prior header",
              static_cast<int>(format), csid);
    ec = errc::missing_prior_state;
    return false;
  }

  const auto needed = pos + message_header_size(format);
  if (data.size() < needed) {
    LOG_ERROR("Chunk header truncated: csid={}, fmt={}, need {} bytes, have {}", csid,
              static_cast<int>(format), needed, data.size());
    ec = errc::malformed_header;
    return false;
  }

  ChunkHeader header{};
  bool has_extended = false;
  switch (format) {
    case HeaderFormat::kFull: {
      header.timestamp_field = read_u24(data, pos);
      header.message_length = read_u24(data, pos + 3);
      header.type_id = data[pos + 6];
      header.message_stream_id = read_u32_le(data, pos + 7);
      has_extended = header.timestamp_field == kExtendedTimestampMarker;
      break;
    }
    case HeaderFormat::kSameStream: {
      header.timestamp_field = read_u24(data, pos);
      header.message_length = read_u24(data, pos + 3);
      header.type_id = data[pos + 6];
      header.message_stream_id = prior->message_stream_id;
      has_extended = header.timestamp_field == kExtendedTimestampMarker;
      break;
    }
    case HeaderFormat::kDeltaOnly: {
      header.timestamp_field = read_u24(data, pos);
      header.message_length = prior->message_length;
      header.type_id = prior->type_id;
      header.message_stream_id = prior->message_stream_id;
      has_extended = header.timestamp_field == kExtendedTimestampMarker;
      break;
    }
    case HeaderFormat::kInherit: {
      header = *prior;
      has_extended = prior->extended_timestamp;
      break;
    }
  }
  pos = needed;

  if (has_extended) {
    if (data.size() < pos + kExtendedTimestampSize) {
      LOG_ERROR("Extended timestamp truncated: csid={}, need {} bytes, have {}", csid,
                pos + kExtendedTimestampSize, data.size());
      ec = errc::malformed_header;
      return false;
    }
    header.timestamp_field = read_u32(data, pos);
    pos += kExtendedTimestampSize;
  }

  header.format = format;
  header.csid = csid;
  header.extended_timestamp = has_extended;
  switch (format) {
    case HeaderFormat::kFull:
      header.timestamp = header.timestamp_field;
      break;
    case HeaderFormat::kSameStream:
    case HeaderFormat::kDeltaOnly:
      header.timestamp = prior->timestamp + header.timestamp_field;
      break;
    case HeaderFormat::kInherit:
      break;
  }

  out = header;
  consumed = pos;
  return true;
}

ChunkHeader HeaderCodec::select_format(const ChunkHeader& header,
                                       const ChunkHeader* prior) noexcept {
  ChunkHeader resolved = header;
  if (prior == nullptr || prior->csid != header.csid ||
      prior->message_stream_id != header.message_stream_id ||
      header.timestamp < prior->timestamp) {
    resolved.format = HeaderFormat::kFull;
    resolved.timestamp_field = header.timestamp;
  } else {
    const std::uint32_t delta = header.timestamp - prior->timestamp;
    resolved.timestamp_field = delta;
    if (header.message_length != prior->message_length || header.type_id != prior->type_id) {
      resolved.format = HeaderFormat::kSameStream;
    } else if (delta != prior->timestamp_field) {
      resolved.format = HeaderFormat::kDeltaOnly;
    } else {
      resolved.format = HeaderFormat::kInherit;
    }
  }
  resolved.extended_timestamp = resolved.timestamp_field >= kExtendedTimestampMarker;
  return resolved;
}

std::vector<std::uint8_t> HeaderCodec::encode(const ChunkHeader& header, const ChunkHeader* prior,
                                              std::error_code& ec) {
  const auto resolved = select_format(header, prior);
  std::vector<std::uint8_t> out(kMaxHeaderSize);
  const auto written = encode_to(resolved, out, ec);
  if (written == 0) {
    return {};
  }
  out.resize(written);
  return out;
}

std::size_t HeaderCodec::encoded_size(const ChunkHeader& resolved) noexcept {
  const auto basic = basic_header_size_for(resolved.csid);
  if (basic == 0) {
    return 0;
  }
  return basic + message_header_size(resolved.format) +
         (resolved.extended_timestamp ? kExtendedTimestampSize : 0);
}

std::size_t HeaderCodec::encode_to(const ChunkHeader& resolved, std::span<std::uint8_t> output,
                                   std::error_code& ec) {
  if (basic_header_size_for(resolved.csid) == 0) {
    LOG_ERROR("Cannot encode chunk header: csid {} out of range", resolved.csid);
    ec = errc::invalid_csid;
    return 0;
  }
  if (resolved.message_length > kMaxMessageLength) {
    LOG_ERROR("Cannot encode chunk header: csid={}, length {} exceeds {}", resolved.csid,
              resolved.message_length, kMaxMessageLength);
    ec = errc::message_too_large;
    return 0;
  }
  const auto required = encoded_size(resolved);
  if (output.size() < required) {
    ec = std::make_error_code(std::errc::no_buffer_space);
    return 0;  // Buffer too small
  }

  std::size_t pos = write_basic_header(output, resolved.format, resolved.csid);
  const std::uint32_t ts24 =
      resolved.extended_timestamp ? kExtendedTimestampMarker : resolved.timestamp_field;

  switch (resolved.format) {
    case HeaderFormat::kFull:
      write_u24_at(output, pos, ts24);
      write_u24_at(output, pos + 3, resolved.message_length);
      output[pos + 6] = resolved.type_id;
      write_u32_le_at(output, pos + 7, resolved.message_stream_id);
      pos += 11;
      break;
    case HeaderFormat::kSameStream:
      write_u24_at(output, pos, ts24);
      write_u24_at(output, pos + 3, resolved.message_length);
      output[pos + 6] = resolved.type_id;
      pos += 7;
      break;
    case HeaderFormat::kDeltaOnly:
      write_u24_at(output, pos, ts24);
      pos += 3;
      break;
    case HeaderFormat::kInherit:
      break;
  }

  if (resolved.extended_timestamp) {
    write_u32_at(output, pos, resolved.timestamp_field);
    pos += kExtendedTimestampSize;
  }
  return pos;
}

std::size_t HeaderCodec::encode_continuation_to(const ChunkHeader& resolved,
                                                std::span<std::uint8_t> output,
                                                std::error_code& ec) {
  ChunkHeader continuation = resolved;
  continuation.format = HeaderFormat::kInherit;
  return encode_to(continuation, output, ec);
}

}  // namespace rtmp::chunk

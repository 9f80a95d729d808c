#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

#include "chunk/chunk_header.h"

namespace rtmp::chunk {

// Serializes and parses RTMP chunk headers.
// Wire format:
//   Basic header (1-3 bytes):
//     [fmt: 2 bits][csid: 6 bits]                 csid 2..63
//     [fmt: 2 bits][0: 6 bits][csid - 64: 1 byte] csid 64..319
//     [fmt: 2 bits][1: 6 bits][csid - 64: 2 bytes little-endian] csid 320..65599
//   Message header:
//     fmt 0: [timestamp: 3 BE][length: 3 BE][type: 1][stream id: 4 LE]  (11 bytes)
//     fmt 1: [delta: 3 BE][length: 3 BE][type: 1]                       (7 bytes)
//     fmt 2: [delta: 3 BE]                                              (3 bytes)
//     fmt 3: nothing
//   Extended timestamp: [value: 4 BE], present when the 3-byte field is
//   0xFFFFFF, and on fmt 3 chunks whose prior header carried one.
class HeaderCodec {
 public:
  // Size of the basic header announced by its first byte (1, 2 or 3).
  static std::size_t basic_header_size(std::uint8_t first_byte) noexcept;

  // Size of the basic header needed for `csid`, or 0 if the CSID is out of range.
  static std::size_t basic_header_size_for(std::uint32_t csid) noexcept;

  static std::size_t message_header_size(HeaderFormat format) noexcept;

  // Parse only the basic header. Returns false when `data` is too short.
  static bool decode_basic_header(std::span<const std::uint8_t> data, HeaderFormat& format,
                                  std::uint32_t& csid, std::size_t& consumed) noexcept;

  // Total size of the header starting at data[0], as far as the available
  // bytes allow it to be determined. When the result exceeds data.size(), the
  // caller must supply at least that many bytes and ask again.
  static std::size_t required_size(std::span<const std::uint8_t> data,
                                   const ChunkHeader* prior) noexcept;

  // Decode a complete chunk header. `prior` is the last header seen on the
  // same CSID (nullptr if none). Fields omitted by formats 1-3 are inherited
  // from it; for formats 1 and 2 `timestamp` is prior timestamp plus delta.
  // For format 3 the header is a copy of `prior` (the caller decides whether
  // it starts a new message).
  static bool decode(std::span<const std::uint8_t> data, const ChunkHeader* prior,
                     ChunkHeader& out, std::size_t& consumed, std::error_code& ec);

  // Choose the most compact format for `header` (absolute timestamp, csid,
  // length, type, stream id) given `prior`, filling format, timestamp_field
  // and extended_timestamp.
  static ChunkHeader select_format(const ChunkHeader& header, const ChunkHeader* prior) noexcept;

  // Resolve and serialize in one step.
  static std::vector<std::uint8_t> encode(const ChunkHeader& header, const ChunkHeader* prior,
                                          std::error_code& ec);

  // Serialize an already resolved header. Returns bytes written, 0 on error.
  static std::size_t encode_to(const ChunkHeader& resolved, std::span<std::uint8_t> output,
                               std::error_code& ec);

  // Serialize the format 3 header that continues `resolved`'s message.
  static std::size_t encode_continuation_to(const ChunkHeader& resolved,
                                            std::span<std::uint8_t> output, std::error_code& ec);

  // Bytes encode_to() will produce for `resolved` (0 for an invalid CSID).
  static std::size_t encoded_size(const ChunkHeader& resolved) noexcept;

  static constexpr std::size_t kExtendedTimestampSize = 4;
};

}  // namespace rtmp::chunk

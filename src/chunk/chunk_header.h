#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rtmp::chunk {

// Message header compression level carried in the top two bits of the basic header.
enum class HeaderFormat : std::uint8_t {
  kFull = 0,        // 11-byte message header: timestamp, length, type, stream id
  kSameStream = 1,  // 7 bytes: timestamp delta, length, type
  kDeltaOnly = 2,   // 3 bytes: timestamp delta
  kInherit = 3,     // no message header
};

// Protocol control message type ids. Only kSetChunkSize and kAbortMessage
// are consumed by the chunk layer; the rest are delivered to the caller.
enum class ControlType : std::uint8_t {
  kSetChunkSize = 1,
  kAbortMessage = 2,
  kAcknowledgement = 3,
  kWindowAckSize = 5,
  kSetPeerBandwidth = 6,
};

// Limit type carried by Set Peer Bandwidth.
enum class BandwidthLimit : std::uint8_t {
  kHard = 0,
  kSoft = 1,
  kDynamic = 2,
};

inline constexpr std::uint32_t kMinCsid = 2;
inline constexpr std::uint32_t kMaxOneByteCsid = 63;
inline constexpr std::uint32_t kMaxTwoByteCsid = 319;
inline constexpr std::uint32_t kMaxCsid = 65599;
inline constexpr std::uint32_t kControlCsid = 2;

inline constexpr std::uint32_t kExtendedTimestampMarker = 0xFFFFFF;
inline constexpr std::uint32_t kMaxMessageLength = 0xFFFFFF;

inline constexpr std::uint32_t kDefaultChunkSize = 128;
inline constexpr std::uint32_t kDefaultMaxChunkSize = 16U * 1024U * 1024U;

// Largest possible header: 3-byte basic + 11-byte message + 4-byte extended timestamp.
inline constexpr std::size_t kMaxHeaderSize = 3 + 11 + 4;

struct ChunkHeader {
  HeaderFormat format{HeaderFormat::kFull};
  std::uint32_t csid{0};
  std::uint32_t timestamp{0};        // Absolute timestamp of the message.
  std::uint32_t timestamp_field{0};  // Wire value: absolute for kFull, delta otherwise.
  std::uint32_t message_length{0};
  std::uint8_t type_id{0};
  std::uint32_t message_stream_id{0};
  bool extended_timestamp{false};    // Wire value carried in the 4-byte extension.
};

struct Message {
  std::uint32_t csid{0};
  std::uint32_t timestamp{0};
  std::uint32_t message_length{0};
  std::uint8_t type_id{0};
  std::uint32_t message_stream_id{0};
  std::vector<std::uint8_t> payload;
};

}  // namespace rtmp::chunk

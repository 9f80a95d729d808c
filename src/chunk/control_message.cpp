#include "chunk/control_message.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include "chunk/chunk_errors.h"
#include "common/logging/logger.h"

namespace rtmp::chunk {

namespace {

constexpr std::size_t kControlPayloadSize = 4;
constexpr std::size_t kPeerBandwidthPayloadSize = 5;

std::vector<std::uint8_t> u32_payload(std::uint32_t value) {
  return {static_cast<std::uint8_t>((value >> 24) & 0xFF),
          static_cast<std::uint8_t>((value >> 16) & 0xFF),
          static_cast<std::uint8_t>((value >> 8) & 0xFF), static_cast<std::uint8_t>(value & 0xFF)};
}

std::uint32_t read_u32(std::span<const std::uint8_t> data) {
  return (static_cast<std::uint32_t>(data[0]) << 24) | (static_cast<std::uint32_t>(data[1]) << 16) |
         (static_cast<std::uint32_t>(data[2]) << 8) | static_cast<std::uint32_t>(data[3]);
}

Message make_control_message(ControlType type, std::vector<std::uint8_t> payload) {
  Message msg;
  msg.csid = kControlCsid;
  msg.timestamp = 0;
  msg.type_id = static_cast<std::uint8_t>(type);
  msg.message_stream_id = 0;
  msg.payload = std::move(payload);
  msg.message_length = static_cast<std::uint32_t>(msg.payload.size());
  return msg;
}

bool check_payload_size(std::span<const std::uint8_t> payload, std::size_t expected,
                        const char* name, std::error_code& ec) {
  if (payload.size() != expected) {
    LOG_ERROR("{} payload must be {} bytes, got {}", name, expected, payload.size());
    ec = errc::malformed_control;
    return false;
  }
  return true;
}

}  // namespace

bool validate_chunk_size(std::uint32_t size, std::uint32_t max_chunk_size, std::error_code& ec) {
  if (size == 0 || (size & 0x80000000U) != 0 || size > max_chunk_size) {
    ec = errc::chunk_size_invalid;
    return false;
  }
  return true;
}

bool validate_max_chunk_size(std::uint32_t max_chunk_size, std::error_code& ec) {
  if ((max_chunk_size & 0x80000000U) != 0 || max_chunk_size < kDefaultChunkSize) {
    ec = errc::chunk_size_invalid;
    return false;
  }
  return true;
}

Message make_set_chunk_size_message(std::uint32_t size) {
  return make_control_message(ControlType::kSetChunkSize, u32_payload(size));
}

Message make_abort_message(std::uint32_t csid) {
  return make_control_message(ControlType::kAbortMessage, u32_payload(csid));
}

Message make_acknowledgement_message(std::uint32_t sequence_number) {
  return make_control_message(ControlType::kAcknowledgement, u32_payload(sequence_number));
}

Message make_window_ack_size_message(std::uint32_t window_size) {
  return make_control_message(ControlType::kWindowAckSize, u32_payload(window_size));
}

Message make_set_peer_bandwidth_message(std::uint32_t bandwidth, BandwidthLimit limit) {
  auto payload = u32_payload(bandwidth);
  payload.push_back(static_cast<std::uint8_t>(limit));
  return make_control_message(ControlType::kSetPeerBandwidth, std::move(payload));
}

bool parse_set_chunk_size(std::span<const std::uint8_t> payload, std::uint32_t max_chunk_size,
                          std::uint32_t& size, std::error_code& ec) {
  if (!check_payload_size(payload, kControlPayloadSize, "Set Chunk Size", ec)) {
    return false;
  }
  const auto value = read_u32(payload);
  if (!validate_chunk_size(value, max_chunk_size, ec)) {
    LOG_ERROR("Peer requested invalid chunk size {} (max {})", value, max_chunk_size);
    return false;
  }
  size = value;
  return true;
}

bool parse_abort_message(std::span<const std::uint8_t> payload, std::uint32_t& csid,
                         std::error_code& ec) {
  if (!check_payload_size(payload, kControlPayloadSize, "Abort Message", ec)) {
    return false;
  }
  csid = read_u32(payload);
  return true;
}

bool parse_acknowledgement(std::span<const std::uint8_t> payload, std::uint32_t& sequence_number,
                           std::error_code& ec) {
  if (!check_payload_size(payload, kControlPayloadSize, "Acknowledgement", ec)) {
    return false;
  }
  sequence_number = read_u32(payload);
  return true;
}

bool parse_window_ack_size(std::span<const std::uint8_t> payload, std::uint32_t& window_size,
                           std::error_code& ec) {
  if (!check_payload_size(payload, kControlPayloadSize, "Window Acknowledgement Size", ec)) {
    return false;
  }
  const auto value = read_u32(payload);
  if (value == 0) {
    LOG_ERROR("Window Acknowledgement Size must be non-zero");
    ec = errc::malformed_control;
    return false;
  }
  window_size = value;
  return true;
}

bool parse_set_peer_bandwidth(std::span<const std::uint8_t> payload, std::uint32_t& bandwidth,
                              BandwidthLimit& limit, std::error_code& ec) {
  if (!check_payload_size(payload, kPeerBandwidthPayloadSize, "Set Peer Bandwidth", ec)) {
    return false;
  }
  if (payload[4] > static_cast<std::uint8_t>(BandwidthLimit::kDynamic)) {
    LOG_ERROR("Set Peer Bandwidth has invalid limit type {}", payload[4]);
    ec = errc::malformed_control;
    return false;
  }
  bandwidth = read_u32(payload);
  limit = static_cast<BandwidthLimit>(payload[4]);
  return true;
}

}  // namespace rtmp::chunk

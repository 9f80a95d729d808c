#pragma once

#include <cstdint>
#include <span>
#include <system_error>

#include "chunk/chunk_header.h"

namespace rtmp::chunk {

// A protocol control message consumed by the chunk layer instead of being
// delivered to the application.
struct ControlEvent {
  ControlType type{ControlType::kSetChunkSize};
  std::uint32_t value{0};  // New chunk size, or aborted CSID.
  std::uint32_t csid{0};   // Chunk stream the control message arrived on.
};

// Check a chunk size against the protocol rules (1..max, high bit clear).
bool validate_chunk_size(std::uint32_t size, std::uint32_t max_chunk_size, std::error_code& ec);

// A usable ceiling must be non-zero, keep the high bit clear and admit the
// default chunk size.
bool validate_max_chunk_size(std::uint32_t max_chunk_size, std::error_code& ec);

// Set Chunk Size (type 1) on CSID 2, message stream 0, timestamp 0.
Message make_set_chunk_size_message(std::uint32_t size);

// Abort Message (type 2) naming the chunk stream whose partial message to drop.
Message make_abort_message(std::uint32_t csid);

// Acknowledgement (type 3): bytes received so far.
Message make_acknowledgement_message(std::uint32_t sequence_number);

// Window Acknowledgement Size (type 5).
Message make_window_ack_size_message(std::uint32_t window_size);

// Set Peer Bandwidth (type 6): 4-byte window followed by the limit type.
Message make_set_peer_bandwidth_message(std::uint32_t bandwidth, BandwidthLimit limit);

bool parse_set_chunk_size(std::span<const std::uint8_t> payload, std::uint32_t max_chunk_size,
                          std::uint32_t& size, std::error_code& ec);

bool parse_abort_message(std::span<const std::uint8_t> payload, std::uint32_t& csid,
                         std::error_code& ec);

bool parse_acknowledgement(std::span<const std::uint8_t> payload, std::uint32_t& sequence_number,
                           std::error_code& ec);

// Rejects a window size of 0.
bool parse_window_ack_size(std::span<const std::uint8_t> payload, std::uint32_t& window_size,
                           std::error_code& ec);

// Rejects a limit type above kDynamic.
bool parse_set_peer_bandwidth(std::span<const std::uint8_t> payload, std::uint32_t& bandwidth,
                              BandwidthLimit& limit, std::error_code& ec);

// True for the control types the reader consumes itself.
inline bool is_chunk_control(std::uint8_t type_id) {
  return type_id == static_cast<std::uint8_t>(ControlType::kSetChunkSize) ||
         type_id == static_cast<std::uint8_t>(ControlType::kAbortMessage);
}

}  // namespace rtmp::chunk

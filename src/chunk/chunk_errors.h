#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace rtmp::chunk {

// Failure kinds reported by the chunk layer through std::error_code.
enum class errc {
  malformed_header = 1,     // Truncated or undecodable basic/message header
  missing_prior_state,      // Compressed header on a CSID with no history
  chunk_size_invalid,       // Chunk size of 0, high bit set, or above maximum
  invalid_csid,             // CSID outside 2..65599
  message_too_large,        // Payload does not fit the 24-bit length field
  unexpected_continuation,  // Continuation data that does not fit the in-flight message
  malformed_control,        // Control message payload of the wrong size
  end_of_stream,            // Byte source exhausted
};

const std::error_category& chunk_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

// True for errors that must tear the connection down (everything except
// transport failures and end of stream).
bool is_protocol_error(const std::error_code& ec) noexcept;

// Diagnostic details for the most recent failure of a reader or writer.
struct ChunkErrorContext {
  std::error_code code;
  std::string operation;
  std::uint32_t csid{0};
  std::size_t expected{0};
  std::size_t actual{0};

  [[nodiscard]] std::string describe() const;
};

}  // namespace rtmp::chunk

namespace std {
template <>
struct is_error_code_enum<rtmp::chunk::errc> : true_type {};
}  // namespace std

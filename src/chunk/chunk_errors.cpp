#include "chunk/chunk_errors.h"

#include <string>
#include <system_error>

#include <fmt/format.h>

namespace rtmp::chunk {

namespace {

class ChunkCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "rtmp.chunk"; }

  std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
      case errc::malformed_header:
        return "malformed chunk header";
      case errc::missing_prior_state:
        return "compressed chunk header without prior state for chunk stream";
      case errc::chunk_size_invalid:
        return "invalid chunk size";
      case errc::invalid_csid:
        return "chunk stream id out of range";
      case errc::message_too_large:
        return "message length exceeds 24-bit limit";
      case errc::unexpected_continuation:
        return "chunk does not continue the in-progress message";
      case errc::malformed_control:
        return "malformed protocol control message";
      case errc::end_of_stream:
        return "end of stream";
    }
    return "unknown chunk error";
  }
};

}  // namespace

const std::error_category& chunk_category() noexcept {
  static const ChunkCategory category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), chunk_category()};
}

bool is_protocol_error(const std::error_code& ec) noexcept {
  return ec && ec.category() == chunk_category() && ec != errc::end_of_stream;
}

std::string ChunkErrorContext::describe() const {
  if (!code) {
    return "ok";
  }
  return fmt::format("{}: {} (csid={}, expected={}, actual={})", operation, code.message(), csid,
                     expected, actual);
}

}  // namespace rtmp::chunk

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

#include "chunk/chunk_header.h"

namespace rtmp::tools {

enum class ToolCommand { kNone, kDechunk, kChunk };

// Settings for rtmp-chunk-tool.
struct ToolConfig {
  // General settings.
  std::string config_file;
  bool verbose{false};
  std::string log_file;
  ToolCommand command{ToolCommand::kNone};

  // Input / output. "-" selects stdin / stdout.
  std::string input_path{"-"};
  std::string output_path{"-"};

  // Chunking.
  std::uint32_t chunk_size{chunk::kDefaultChunkSize};
  std::uint32_t max_chunk_size{chunk::kDefaultMaxChunkSize};

  // Bytes to drop before the first chunk (3073 for a capture that includes
  // the C0+C1+C2 handshake).
  std::size_t skip_bytes{0};

  // Header fields of the message written by the chunk command.
  std::uint32_t csid{6};
  std::uint32_t type_id{9};
  std::uint32_t message_stream_id{1};
  std::uint32_t timestamp{0};

  // Dump message payloads as hex in the dechunk command.
  bool hexdump{false};
};

// Parse command-line arguments into configuration.
bool parse_args(int argc, char* argv[], ToolConfig& config, std::error_code& ec);

// Load configuration from INI file.
bool load_config_file(const std::string& path, ToolConfig& config, std::error_code& ec);

// Validate configuration.
bool validate_config(const ToolConfig& config, std::string& error);

}  // namespace rtmp::tools

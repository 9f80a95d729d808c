#include "tools/chunk_tool/tool_config.h"

#include <cerrno>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <CLI/CLI.hpp>

#include "chunk/chunk_header.h"
#include "chunk/header_codec.h"
#include "common/logging/logger.h"

namespace rtmp::tools {

namespace {
// Parse an unsigned config field, rejecting negatives and values wider than T.
template <typename T>
bool parse_unsigned(const std::string& value, T& out, const std::string& field_name,
                    std::error_code& ec) {
  static_assert(std::is_unsigned_v<T>, "config fields are unsigned");
  if (!value.empty() && value[0] == '-') {
    LOG_ERROR("Configuration error: {} value '{}' cannot be negative", field_name, value);
    ec = std::make_error_code(std::errc::result_out_of_range);
    return false;
  }
  try {
    const unsigned long long parsed = std::stoull(value);
    if (parsed > std::numeric_limits<T>::max()) {
      LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
      ec = std::make_error_code(std::errc::result_out_of_range);
      return false;
    }
    out = static_cast<T>(parsed);
    return true;
  } catch (const std::invalid_argument&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  } catch (const std::out_of_range&) {
    LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
    ec = std::make_error_code(std::errc::result_out_of_range);
    return false;
  }
}

bool parse_bool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

bool parse_ini_value(const std::string& line, std::string& key, std::string& value) {
  if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
    return false;
  }

  auto pos = line.find('=');
  if (pos == std::string::npos) {
    return false;
  }

  key = line.substr(0, pos);
  value = line.substr(pos + 1);

  const auto trim = [](std::string& s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
      s.pop_back();
    }
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
      s.erase(0, 1);
    }
  };
  trim(key);
  trim(value);

  return !key.empty();
}

std::string get_current_section(std::string line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
    line.pop_back();
  }
  if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
    return line.substr(1, line.size() - 2);
  }
  return "";
}

void add_chunk_options(CLI::App& cmd, ToolConfig& config) {
  cmd.add_option("-i,--input", config.input_path, "Input file ('-' for stdin)");
  cmd.add_option("-s,--chunk-size", config.chunk_size, "Chunk size in bytes")
      ->default_val(chunk::kDefaultChunkSize);
  cmd.add_option("--max-chunk-size", config.max_chunk_size, "Largest accepted chunk size")
      ->default_val(chunk::kDefaultMaxChunkSize);
}
}  // namespace

bool parse_args(int argc, char* argv[], ToolConfig& config, std::error_code& ec) {
  CLI::App app{"RTMP chunk stream tool"};
  app.require_subcommand(1);

  // General options.
  app.add_option("-c,--config", config.config_file, "Configuration file path");
  app.add_flag("-v,--verbose", config.verbose, "Enable verbose logging");
  app.add_option("--log-file", config.log_file, "Log file path");

  auto* dechunk = app.add_subcommand("dechunk", "Reassemble messages from a chunk stream");
  add_chunk_options(*dechunk, config);
  dechunk->add_option("--skip-bytes", config.skip_bytes, "Bytes to skip before the first chunk")
      ->default_val(0);
  dechunk->add_flag("-x,--hexdump", config.hexdump, "Print message payloads as hex");

  auto* chunk_cmd = app.add_subcommand("chunk", "Write a payload file as one chunked message");
  add_chunk_options(*chunk_cmd, config);
  chunk_cmd->add_option("-o,--output", config.output_path, "Output file ('-' for stdout)");
  chunk_cmd->add_option("--csid", config.csid, "Chunk stream id")->default_val(6);
  chunk_cmd->add_option("--type", config.type_id, "Message type id")->default_val(9);
  chunk_cmd->add_option("--stream", config.message_stream_id, "Message stream id")
      ->default_val(1);
  chunk_cmd->add_option("--timestamp", config.timestamp, "Message timestamp")->default_val(0);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    app.exit(e);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  if (dechunk->parsed()) {
    config.command = ToolCommand::kDechunk;
  } else if (chunk_cmd->parsed()) {
    config.command = ToolCommand::kChunk;
  }

  // Load config file if specified.
  if (!config.config_file.empty()) {
    if (!load_config_file(config.config_file, config, ec)) {
      return false;
    }
  }

  return true;
}

bool load_config_file(const std::string& path, ToolConfig& config, std::error_code& ec) {
  std::ifstream file(path);
  if (!file) {
    ec = errno != 0 ? std::error_code(errno, std::generic_category())
                    : std::make_error_code(std::errc::no_such_file_or_directory);
    LOG_ERROR("Failed to open config file: {}", path);
    return false;
  }

  std::string line;
  std::string section;

  while (std::getline(file, line)) {
    std::string new_section = get_current_section(line);
    if (!new_section.empty()) {
      section = new_section;
      continue;
    }

    std::string key;
    std::string value;
    if (!parse_ini_value(line, key, value)) {
      continue;
    }

    if (section == "chunk" || section.empty()) {
      if (key == "chunk_size") {
        if (!parse_unsigned(value, config.chunk_size, "chunk_size", ec)) {
          return false;
        }
      } else if (key == "max_chunk_size") {
        if (!parse_unsigned(value, config.max_chunk_size, "max_chunk_size", ec)) {
          return false;
        }
      } else if (key == "skip_bytes") {
        if (!parse_unsigned(value, config.skip_bytes, "skip_bytes", ec)) {
          return false;
        }
      }
    } else if (section == "message") {
      if (key == "csid") {
        if (!parse_unsigned(value, config.csid, "csid", ec)) {
          return false;
        }
      } else if (key == "type") {
        if (!parse_unsigned(value, config.type_id, "type", ec)) {
          return false;
        }
      } else if (key == "stream_id") {
        if (!parse_unsigned(value, config.message_stream_id, "stream_id", ec)) {
          return false;
        }
      } else if (key == "timestamp") {
        if (!parse_unsigned(value, config.timestamp, "timestamp", ec)) {
          return false;
        }
      }
    } else if (section == "logging") {
      if (key == "verbose") {
        config.verbose = parse_bool(value);
      } else if (key == "log_file") {
        config.log_file = value;
      }
    }
  }

  LOG_DEBUG("Loaded configuration from {}", path);
  return true;
}

bool validate_config(const ToolConfig& config, std::string& error) {
  if (config.command == ToolCommand::kNone) {
    error = "A command (dechunk or chunk) is required";
    return false;
  }

  if (config.max_chunk_size == 0 || config.max_chunk_size > 0x7FFFFFFF) {
    error = "Max chunk size must be between 1 and 2147483647";
    return false;
  }

  if (config.chunk_size == 0 || config.chunk_size > config.max_chunk_size) {
    error = "Chunk size must be between 1 and " + std::to_string(config.max_chunk_size);
    return false;
  }

  if (config.input_path.empty()) {
    error = "Input path is required";
    return false;
  }

  if (config.command == ToolCommand::kChunk) {
    if (config.output_path.empty()) {
      error = "Output path is required";
      return false;
    }
    if (chunk::HeaderCodec::basic_header_size_for(config.csid) == 0) {
      error = "Chunk stream id must be between " + std::to_string(chunk::kMinCsid) + " and " +
              std::to_string(chunk::kMaxCsid);
      return false;
    }
    if (config.type_id > 0xFF) {
      error = "Message type id must fit in one byte";
      return false;
    }
  }

  return true;
}

}  // namespace rtmp::tools

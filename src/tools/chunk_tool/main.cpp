#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include "chunk/chunk_errors.h"
#include "chunk/chunk_reader.h"
#include "chunk/chunk_writer.h"
#include "common/logging/logger.h"
#include "tools/chunk_tool/tool_config.h"
#include "transport/stream/fd_stream.h"
#include "transport/stream/memory_stream.h"

using namespace rtmp;

namespace {

bool load_file(const std::string& path, std::vector<std::uint8_t>& out, std::error_code& ec) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    ec = std::make_error_code(std::errc::io_error);
    return false;
  }
  return true;
}

std::string hex_line(const std::vector<std::uint8_t>& payload, std::size_t offset) {
  std::string line = fmt::format("    {:08x} ", offset);
  const auto end = std::min(offset + 16, payload.size());
  for (std::size_t i = offset; i < end; ++i) {
    line += fmt::format(" {:02x}", payload[i]);
  }
  return line;
}

std::unique_ptr<transport::ByteSource> open_input(const tools::ToolConfig& config,
                                                  std::error_code& ec) {
  if (config.input_path == "-") {
    auto source = std::make_unique<transport::FdSource>(STDIN_FILENO);
    std::vector<std::uint8_t> skipped(config.skip_bytes);
    if (!skipped.empty() && !source->read(skipped, ec)) {
      return nullptr;
    }
    return source;
  }

  std::vector<std::uint8_t> data;
  if (!load_file(config.input_path, data, ec)) {
    return nullptr;
  }
  auto source = std::make_unique<transport::MemorySource>(std::move(data));
  if (!source->skip(config.skip_bytes, ec)) {
    return nullptr;
  }
  return source;
}

int run_dechunk(const tools::ToolConfig& config) {
  std::error_code ec;
  auto source = open_input(config, ec);
  if (!source) {
    fmt::print(stderr, "Failed to open input '{}': {}\n", config.input_path, ec.message());
    return EXIT_FAILURE;
  }

  chunk::ReaderConfig reader_config;
  reader_config.chunk_size = config.chunk_size;
  reader_config.max_chunk_size = config.max_chunk_size;
  chunk::ChunkReader reader(*source, reader_config);
  reader.set_control_observer([](const chunk::ControlEvent& event) {
    if (event.type == chunk::ControlType::kSetChunkSize) {
      fmt::print("control csid={} set_chunk_size={}\n", event.csid, event.value);
    } else {
      fmt::print("control csid={} abort csid={}\n", event.csid, event.value);
    }
  });

  chunk::Message msg;
  while (reader.read_message(msg, ec)) {
    fmt::print("message csid={} ts={} type={} stream={} length={}\n", msg.csid, msg.timestamp,
               msg.type_id, msg.message_stream_id, msg.message_length);
    if (config.hexdump) {
      for (std::size_t offset = 0; offset < msg.payload.size(); offset += 16) {
        fmt::print("{}\n", hex_line(msg.payload, offset));
      }
    }
    reader.recycle(msg);
  }

  const auto& stats = reader.stats();
  fmt::print("chunks={} messages={} control={} payload_bytes={}\n", stats.chunks_read,
             stats.messages_read, stats.control_messages, stats.payload_bytes);

  if (ec == chunk::errc::end_of_stream && reader.pending_streams() == 0 &&
      reader.last_error().operation == "reader.read_basic_header") {
    return EXIT_SUCCESS;
  }
  fmt::print(stderr, "Dechunk failed: {}\n", reader.last_error().describe());
  return EXIT_FAILURE;
}

int run_chunk(const tools::ToolConfig& config) {
  std::error_code ec;
  std::vector<std::uint8_t> payload;
  if (config.input_path == "-") {
    payload.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else if (!load_file(config.input_path, payload, ec)) {
    fmt::print(stderr, "Failed to read payload '{}': {}\n", config.input_path, ec.message());
    return EXIT_FAILURE;
  }

  int fd = STDOUT_FILENO;
  bool owns_fd = false;
  if (config.output_path != "-") {
    fd = ::open(config.output_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
      ec = std::error_code(errno, std::generic_category());
      fmt::print(stderr, "Failed to open output '{}': {}\n", config.output_path, ec.message());
      return EXIT_FAILURE;
    }
    owns_fd = true;
  }
  transport::FdSink sink(fd, owns_fd);

  chunk::WriterConfig writer_config;
  writer_config.max_chunk_size = config.max_chunk_size;
  chunk::ChunkWriter writer(sink, writer_config);
  if (config.chunk_size != writer.chunk_size() &&
      !writer.write_set_chunk_size(config.chunk_size, ec)) {
    fmt::print(stderr, "Failed to announce chunk size: {}\n", writer.last_error().describe());
    return EXIT_FAILURE;
  }

  chunk::Message msg;
  msg.csid = config.csid;
  msg.timestamp = config.timestamp;
  msg.type_id = static_cast<std::uint8_t>(config.type_id);
  msg.message_stream_id = config.message_stream_id;
  msg.payload = std::move(payload);
  if (!writer.write_message(msg, ec)) {
    fmt::print(stderr, "Chunk failed: {}\n", writer.last_error().describe());
    return EXIT_FAILURE;
  }

  const auto& stats = writer.stats();
  LOG_INFO("Wrote {} chunks ({} header bytes, {} payload bytes)", stats.chunks_written,
           stats.header_bytes, stats.payload_bytes);
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
  tools::ToolConfig config;
  std::error_code ec;

  if (!tools::parse_args(argc, argv, config, ec)) {
    return EXIT_FAILURE;
  }

  std::string validation_error;
  if (!tools::validate_config(config, validation_error)) {
    fmt::print(stderr, "Configuration error: {}\n", validation_error);
    return EXIT_FAILURE;
  }

  logging::configure_logging(config.verbose ? logging::LogLevel::debug : logging::LogLevel::warn,
                             true, config.log_file);

  switch (config.command) {
    case tools::ToolCommand::kDechunk:
      return run_dechunk(config);
    case tools::ToolCommand::kChunk:
      return run_chunk(config);
    case tools::ToolCommand::kNone:
      break;
  }
  return EXIT_FAILURE;
}

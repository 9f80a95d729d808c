#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include "chunk/chunk_errors.h"
#include "chunk/control_message.h"

namespace rtmp::tests {

TEST(ControlMessageTests, SetChunkSizeMessageLayout) {
  const auto msg = chunk::make_set_chunk_size_message(4096);
  EXPECT_EQ(msg.csid, chunk::kControlCsid);
  EXPECT_EQ(msg.timestamp, 0U);
  EXPECT_EQ(msg.type_id, 1);
  EXPECT_EQ(msg.message_stream_id, 0U);
  EXPECT_EQ(msg.message_length, 4U);
  EXPECT_EQ(msg.payload, (std::vector<std::uint8_t>{0x00, 0x00, 0x10, 0x00}));
}

TEST(ControlMessageTests, AbortMessageLayout) {
  const auto msg = chunk::make_abort_message(0x0102);
  EXPECT_EQ(msg.csid, chunk::kControlCsid);
  EXPECT_EQ(msg.type_id, 2);
  EXPECT_EQ(msg.payload, (std::vector<std::uint8_t>{0x00, 0x00, 0x01, 0x02}));
}

TEST(ControlMessageTests, ParsesSetChunkSize) {
  const std::vector<std::uint8_t> payload{0x00, 0x01, 0x00, 0x00};
  std::uint32_t size = 0;
  std::error_code ec;
  ASSERT_TRUE(chunk::parse_set_chunk_size(payload, chunk::kDefaultMaxChunkSize, size, ec));
  EXPECT_EQ(size, 65536U);
}

TEST(ControlMessageTests, RejectsSetChunkSizeOutOfRange) {
  std::uint32_t size = 77;
  std::error_code ec;

  const std::vector<std::uint8_t> zero{0x00, 0x00, 0x00, 0x00};
  EXPECT_FALSE(chunk::parse_set_chunk_size(zero, chunk::kDefaultMaxChunkSize, size, ec));
  EXPECT_EQ(ec, chunk::errc::chunk_size_invalid);

  const std::vector<std::uint8_t> high_bit{0x80, 0x00, 0x00, 0x80};
  ec.clear();
  EXPECT_FALSE(chunk::parse_set_chunk_size(high_bit, 0xFFFFFFFFU, size, ec));
  EXPECT_EQ(ec, chunk::errc::chunk_size_invalid);

  const std::vector<std::uint8_t> above_max{0x00, 0x00, 0x10, 0x01};
  ec.clear();
  EXPECT_FALSE(chunk::parse_set_chunk_size(above_max, 4096, size, ec));
  EXPECT_EQ(ec, chunk::errc::chunk_size_invalid);
  EXPECT_EQ(size, 77U);
}

TEST(ControlMessageTests, RejectsWrongPayloadSize) {
  std::uint32_t value = 0;
  std::error_code ec;
  const std::vector<std::uint8_t> short_payload{0x00, 0x01};
  EXPECT_FALSE(chunk::parse_set_chunk_size(short_payload, chunk::kDefaultMaxChunkSize, value, ec));
  EXPECT_EQ(ec, chunk::errc::malformed_control);

  const std::vector<std::uint8_t> long_payload{0x00, 0x00, 0x00, 0x03, 0x00};
  ec.clear();
  EXPECT_FALSE(chunk::parse_abort_message(long_payload, value, ec));
  EXPECT_EQ(ec, chunk::errc::malformed_control);
}

TEST(ControlMessageTests, ParsesAbortMessage) {
  const std::vector<std::uint8_t> payload{0x00, 0x00, 0x00, 0x06};
  std::uint32_t csid = 0;
  std::error_code ec;
  ASSERT_TRUE(chunk::parse_abort_message(payload, csid, ec));
  EXPECT_EQ(csid, 6U);
}

TEST(ControlMessageTests, ValidateChunkSizeBounds) {
  std::error_code ec;
  EXPECT_TRUE(chunk::validate_chunk_size(1, 128, ec));
  EXPECT_TRUE(chunk::validate_chunk_size(128, 128, ec));
  EXPECT_FALSE(chunk::validate_chunk_size(129, 128, ec));
  EXPECT_FALSE(chunk::validate_chunk_size(0, 128, ec));
}

TEST(ControlMessageTests, ClassifiesControlTypes) {
  EXPECT_TRUE(chunk::is_chunk_control(1));
  EXPECT_TRUE(chunk::is_chunk_control(2));
  EXPECT_FALSE(chunk::is_chunk_control(3));
  EXPECT_FALSE(chunk::is_chunk_control(5));
  EXPECT_FALSE(chunk::is_chunk_control(6));
  EXPECT_FALSE(chunk::is_chunk_control(8));
}

TEST(ControlMessageTests, AcknowledgementRoundTrip) {
  const auto msg = chunk::make_acknowledgement_message(0x00ABCDEF);
  EXPECT_EQ(msg.csid, chunk::kControlCsid);
  EXPECT_EQ(msg.type_id, 3);
  EXPECT_EQ(msg.message_stream_id, 0U);
  EXPECT_EQ(msg.payload, (std::vector<std::uint8_t>{0x00, 0xAB, 0xCD, 0xEF}));

  std::uint32_t sequence = 0;
  std::error_code ec;
  ASSERT_TRUE(chunk::parse_acknowledgement(msg.payload, sequence, ec));
  EXPECT_EQ(sequence, 0x00ABCDEFU);

  const std::vector<std::uint8_t> short_payload{0x00, 0x01, 0x02};
  EXPECT_FALSE(chunk::parse_acknowledgement(short_payload, sequence, ec));
  EXPECT_EQ(ec, chunk::errc::malformed_control);
}

TEST(ControlMessageTests, WindowAckSizeRejectsZero) {
  const auto msg = chunk::make_window_ack_size_message(2500000);
  EXPECT_EQ(msg.csid, chunk::kControlCsid);
  EXPECT_EQ(msg.type_id, 5);
  EXPECT_EQ(msg.message_length, 4U);
  EXPECT_EQ(msg.payload, (std::vector<std::uint8_t>{0x00, 0x26, 0x25, 0xA0}));

  std::uint32_t window = 0;
  std::error_code ec;
  ASSERT_TRUE(chunk::parse_window_ack_size(msg.payload, window, ec));
  EXPECT_EQ(window, 2500000U);

  const std::vector<std::uint8_t> zero{0x00, 0x00, 0x00, 0x00};
  window = 7;
  EXPECT_FALSE(chunk::parse_window_ack_size(zero, window, ec));
  EXPECT_EQ(ec, chunk::errc::malformed_control);
  EXPECT_EQ(window, 7U);

  const std::vector<std::uint8_t> long_payload{0x00, 0x00, 0x10, 0x00, 0x00};
  ec.clear();
  EXPECT_FALSE(chunk::parse_window_ack_size(long_payload, window, ec));
  EXPECT_EQ(ec, chunk::errc::malformed_control);
}

TEST(ControlMessageTests, SetPeerBandwidthLayoutAndLimits) {
  const auto msg = chunk::make_set_peer_bandwidth_message(2500000, chunk::BandwidthLimit::kDynamic);
  EXPECT_EQ(msg.csid, chunk::kControlCsid);
  EXPECT_EQ(msg.timestamp, 0U);
  EXPECT_EQ(msg.type_id, 6);
  EXPECT_EQ(msg.message_length, 5U);
  EXPECT_EQ(msg.payload, (std::vector<std::uint8_t>{0x00, 0x26, 0x25, 0xA0, 0x02}));

  std::uint32_t bandwidth = 0;
  auto limit = chunk::BandwidthLimit::kHard;
  std::error_code ec;
  ASSERT_TRUE(chunk::parse_set_peer_bandwidth(msg.payload, bandwidth, limit, ec));
  EXPECT_EQ(bandwidth, 2500000U);
  EXPECT_EQ(limit, chunk::BandwidthLimit::kDynamic);

  const std::vector<std::uint8_t> bad_limit{0x00, 0x26, 0x25, 0xA0, 0x03};
  EXPECT_FALSE(chunk::parse_set_peer_bandwidth(bad_limit, bandwidth, limit, ec));
  EXPECT_EQ(ec, chunk::errc::malformed_control);

  const std::vector<std::uint8_t> four_bytes{0x00, 0x26, 0x25, 0xA0};
  ec.clear();
  EXPECT_FALSE(chunk::parse_set_peer_bandwidth(four_bytes, bandwidth, limit, ec));
  EXPECT_EQ(ec, chunk::errc::malformed_control);
}

TEST(ChunkErrorTests, CategoryAndClassification) {
  const std::error_code ec = chunk::errc::unexpected_continuation;
  EXPECT_STREQ(ec.category().name(), "rtmp.chunk");
  EXPECT_FALSE(ec.message().empty());
  EXPECT_TRUE(chunk::is_protocol_error(ec));
  EXPECT_FALSE(chunk::is_protocol_error(chunk::errc::end_of_stream));
  EXPECT_FALSE(chunk::is_protocol_error(std::make_error_code(std::errc::broken_pipe)));
  EXPECT_FALSE(chunk::is_protocol_error(std::error_code{}));
}

TEST(ChunkErrorTests, DescribeIncludesContext) {
  chunk::ChunkErrorContext context;
  EXPECT_EQ(context.describe(), "ok");

  context.code = chunk::errc::malformed_header;
  context.operation = "reader.decode_header";
  context.csid = 9;
  context.expected = 12;
  context.actual = 5;
  const auto text = context.describe();
  EXPECT_NE(text.find("reader.decode_header"), std::string::npos);
  EXPECT_NE(text.find("csid=9"), std::string::npos);
  EXPECT_NE(text.find("expected=12"), std::string::npos);
}

}  // namespace rtmp::tests

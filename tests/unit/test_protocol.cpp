/**
 * @file test_protocol.cpp
 * @brief Unit tests for the ClipSync wire protocol
 */

#include <algorithm>
#include <clipsync/config.h>
#include <clipsync/protocol.h>
#include <gtest/gtest.h>

using namespace clipsync;

namespace {

DeviceInfo make_device(const std::string &name) {
  DeviceInfo info;
  info.id = Uuid::generate();
  info.name = name;
  info.address = "192.168.1.20";
  info.port = 8766;
  info.last_seen = from_millis(1700000000000ull);
  return info;
}

ClipboardMessage make_text_message(const std::string &text) {
  ClipboardMessage msg;
  msg.content = TextContent{text};
  msg.timestamp = from_millis(1700000000500ull);
  msg.sender_id = Uuid::generate();
  msg.sender_name = "laptop";
  msg.message_id = Uuid::generate();
  return msg;
}

void expect_same_device(const DeviceInfo &a, const DeviceInfo &b) {
  EXPECT_EQ(a.id, b.id);
  EXPECT_EQ(a.name, b.name);
  EXPECT_EQ(a.address, b.address);
  EXPECT_EQ(a.port, b.port);
  EXPECT_EQ(to_millis(a.last_seen), to_millis(b.last_seen));
}

} // namespace

// ============================================================================
// Discovery Datagrams
// ============================================================================

TEST(DiscoveryCodecTest, HeaderLayout) {
  Bytes data = serialize_discovery(Announcement{make_device("desk")});

  ASSERT_GE(data.size(), 6u);
  // "CLPS" little-endian
  EXPECT_EQ(data[0], 0x43);
  EXPECT_EQ(data[1], 0x4C);
  EXPECT_EQ(data[2], 0x50);
  EXPECT_EQ(data[3], 0x53);
  EXPECT_EQ(data[4], PROTOCOL_VERSION);
  EXPECT_EQ(data[5], static_cast<Byte>(DiscoveryKind::Announcement));
}

TEST(DiscoveryCodecTest, RoundTripEachKind) {
  DeviceInfo device = make_device("desk");
  std::vector<DiscoveryMessage> messages = {
      Announcement{device}, Response{device}, Goodbye{device}};

  for (const auto &original : messages) {
    auto parsed = parse_discovery(serialize_discovery(original));
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().to_string();
    EXPECT_EQ(parsed.value().index(), original.index());
    expect_same_device(discovery_device(parsed.value()), device);
  }
}

TEST(DiscoveryCodecTest, RejectsBadMagic) {
  Bytes data = serialize_discovery(Announcement{make_device("desk")});
  data[0] ^= 0xFF;

  auto parsed = parse_discovery(data);
  ASSERT_TRUE(parsed.is_error());
  EXPECT_EQ(parsed.error().code, ErrorCode::DiscoveryParseError);
}

TEST(DiscoveryCodecTest, RejectsUnknownVersionAndKind) {
  Bytes data = serialize_discovery(Announcement{make_device("desk")});

  Bytes bad_version = data;
  bad_version[4] = 2;
  EXPECT_EQ(parse_discovery(bad_version).error().code,
            ErrorCode::DiscoveryParseError);

  Bytes bad_kind = data;
  bad_kind[5] = 9;
  EXPECT_EQ(parse_discovery(bad_kind).error().code,
            ErrorCode::DiscoveryParseError);
}

TEST(DiscoveryCodecTest, RejectsTruncatedAndTrailing) {
  Bytes data = serialize_discovery(Response{make_device("desk")});

  Bytes truncated(data.begin(), data.end() - 3);
  EXPECT_TRUE(parse_discovery(truncated).is_error());

  Bytes trailing = data;
  trailing.push_back(0);
  EXPECT_TRUE(parse_discovery(trailing).is_error());

  EXPECT_TRUE(parse_discovery(Bytes{}).is_error());
}

TEST(DiscoveryCodecTest, RejectsOversizedDatagram) {
  Bytes data(MAX_DATAGRAM_SIZE + 1, 0);
  auto parsed = parse_discovery(data);
  ASSERT_TRUE(parsed.is_error());
  EXPECT_EQ(parsed.error().code, ErrorCode::DiscoveryParseError);
}

// ============================================================================
// Clipboard Messages
// ============================================================================

TEST(ClipboardCodecTest, TextRoundTrip) {
  auto original = make_text_message("hello, world");

  auto parsed = parse_clipboard_message(serialize_clipboard_message(original));
  ASSERT_TRUE(parsed.is_ok()) << parsed.error().to_string();

  const auto &msg = parsed.value();
  EXPECT_EQ(msg.message_id, original.message_id);
  EXPECT_EQ(msg.sender_id, original.sender_id);
  EXPECT_EQ(msg.sender_name, "laptop");
  EXPECT_EQ(to_millis(msg.timestamp), 1700000000500ull);
  EXPECT_EQ(std::get<TextContent>(msg.content).text, "hello, world");
}

TEST(ClipboardCodecTest, ImageRoundTrip) {
  auto original = make_text_message("");
  ImageContent image;
  image.width = 3;
  image.height = 2;
  image.bytes = {0x89, 'P', 'N', 'G', 0x00, 0xFF};
  original.content = image;

  auto parsed = parse_clipboard_message(serialize_clipboard_message(original));
  ASSERT_TRUE(parsed.is_ok());
  EXPECT_EQ(std::get<ImageContent>(parsed.value().content), image);
}

TEST(ClipboardCodecTest, RejectsCorruptPayload) {
  Bytes data = serialize_clipboard_message(make_text_message("hello"));

  Bytes bad_tag = data;
  bad_tag[5] = 7;
  auto parsed = parse_clipboard_message(bad_tag);
  ASSERT_TRUE(parsed.is_error());
  EXPECT_EQ(parsed.error().code, ErrorCode::FrameError);

  Bytes truncated(data.begin(), data.end() - 1);
  EXPECT_EQ(parse_clipboard_message(truncated).error().code,
            ErrorCode::FrameError);

  Bytes trailing = data;
  trailing.push_back('!');
  EXPECT_EQ(parse_clipboard_message(trailing).error().code,
            ErrorCode::FrameError);
}

// ============================================================================
// Framing
// ============================================================================

TEST(FramingTest, PrefixIsBigEndianPayloadLength) {
  Bytes payload(300, 0xAB);
  Bytes frame = encode_frame(payload);

  ASSERT_EQ(frame.size(), FRAME_HEADER_SIZE + 300);
  EXPECT_EQ(frame[0], 0x00);
  EXPECT_EQ(frame[1], 0x00);
  EXPECT_EQ(frame[2], 0x01);
  EXPECT_EQ(frame[3], 0x2C);
  EXPECT_EQ(read_frame_length(frame.data()), 300u);
}

TEST(FramingTest, FrameTooLargeOnSend) {
  auto msg = make_text_message(std::string(2048, 'x'));
  auto framed = frame_clipboard_message(msg, 1024);
  ASSERT_TRUE(framed.is_error());
  EXPECT_EQ(framed.error().code, ErrorCode::FrameTooLarge);
}

TEST(FrameDecoderTest, SplitDelivery) {
  auto first = make_text_message("first");
  auto second = make_text_message("second");

  Bytes stream = frame_clipboard_message(first).value();
  Bytes more = frame_clipboard_message(second).value();
  stream.insert(stream.end(), more.begin(), more.end());

  FrameDecoder decoder;
  std::vector<Bytes> payloads;

  // Feed in awkward chunk sizes, including a split inside the prefix
  size_t pos = 0;
  const size_t chunks[] = {2, 5, 1, 17, 3};
  size_t i = 0;
  while (pos < stream.size()) {
    size_t n = std::min(chunks[i++ % 5], stream.size() - pos);
    auto result = decoder.feed(stream.data() + pos, n);
    ASSERT_TRUE(result.is_ok());
    for (auto &payload : result.value()) {
      payloads.push_back(std::move(payload));
    }
    pos += n;
  }

  ASSERT_EQ(payloads.size(), 2u);
  EXPECT_EQ(decoder.buffered(), 0u);

  auto a = parse_clipboard_message(payloads[0]);
  auto b = parse_clipboard_message(payloads[1]);
  ASSERT_TRUE(a.is_ok());
  ASSERT_TRUE(b.is_ok());
  EXPECT_EQ(a.value().message_id, first.message_id);
  EXPECT_EQ(std::get<TextContent>(b.value().content).text, "second");
}

TEST(FrameDecoderTest, WaitsForFullPayload) {
  Bytes frame = encode_frame(Bytes(10, 0x01));

  FrameDecoder decoder;
  auto partial = decoder.feed(frame.data(), 8);
  ASSERT_TRUE(partial.is_ok());
  EXPECT_TRUE(partial.value().empty());
  EXPECT_EQ(decoder.buffered(), 8u);

  auto rest = decoder.feed(frame.data() + 8, frame.size() - 8);
  ASSERT_TRUE(rest.is_ok());
  ASSERT_EQ(rest.value().size(), 1u);
  EXPECT_EQ(rest.value()[0].size(), 10u);
}

TEST(FrameDecoderTest, OversizedPrefixFailsImmediately) {
  // 10 000 000 bytes declared, nothing of the payload sent
  const Byte prefix[] = {0x00, 0x98, 0x96, 0x80};

  FrameDecoder decoder;
  auto result = decoder.feed(prefix, sizeof(prefix));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::FrameError);
  EXPECT_TRUE(decoder.failed());

  // Stays failed until reset
  EXPECT_TRUE(decoder.feed(prefix, 1).is_error());
  decoder.reset();
  EXPECT_FALSE(decoder.failed());
}

TEST(FrameDecoderTest, ConfiguredDefaultCeilingRejectsTenMillion) {
  const Byte prefix[] = {0x00, 0x98, 0x96, 0x80};
  ASSERT_EQ(read_frame_length(prefix), 10000000u);

  ClipSyncConfig config;
  EXPECT_LT(config.max_frame_size, 10000000u);

  FrameDecoder decoder(config.transport_config().max_frame_size);
  auto result = decoder.feed(prefix, sizeof(prefix));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::FrameError);
}

TEST(FrameDecoderTest, EmptyFrame) {
  Bytes frame = encode_frame(Bytes{});
  FrameDecoder decoder;
  auto result = decoder.feed(frame.data(), frame.size());
  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().size(), 1u);
  EXPECT_TRUE(result.value()[0].empty());
}

#include "seglink/config.hpp"
#include "seglink/logging.hpp"
#include "seglink/transport.hpp"
#include "seglink/util.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>

using namespace seglink;
using namespace seglink_test;

TEST(UtilTest, EnsureThrowsMatchingErrorKind) {
  EXPECT_NO_THROW(ensure(true, "fine"));
  EXPECT_THROW(ensure(false, "usage"), Error);
  EXPECT_THROW(ensure_io(false, "io"), TransportError);
  EXPECT_THROW(ensure_wire(false, "wire"), MalformedSegmentError);
  try {
    ensure_io(false, "recv failed/EOF");
    FAIL() << "expected throw";
  } catch (const Error& e) {
    EXPECT_STREQ(e.what(), "recv failed/EOF");
  }
}

TEST(UtilTest, Sha256AndHex) {
  Bytes d = sha256(to_bytes("abc"));
  EXPECT_EQ(to_hex(d.data(), d.size()),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(UtilTest, RandBytesHasRequestedSize) {
  EXPECT_EQ(rand_bytes(0).size(), 0u);
  Bytes a = rand_bytes(64);
  Bytes b = rand_bytes(64);
  EXPECT_EQ(a.size(), 64u);
  EXPECT_NE(a, b);
}

TEST(UtilTest, ParseHostPort) {
  std::string host;
  std::uint16_t port = 0;
  EXPECT_TRUE(parse_host_port("127.0.0.1:4444", host, port));
  EXPECT_EQ(host, "127.0.0.1");
  EXPECT_EQ(port, 4444);

  EXPECT_TRUE(parse_host_port("[::1]:80", host, port));
  EXPECT_EQ(host, "::1");
  EXPECT_EQ(port, 80);

  EXPECT_TRUE(parse_host_port("example.org:65535", host, port));
  EXPECT_EQ(port, 65535);

  EXPECT_FALSE(parse_host_port("no-port", host, port));
  EXPECT_FALSE(parse_host_port(":80", host, port));
  EXPECT_FALSE(parse_host_port("host:", host, port));
  EXPECT_FALSE(parse_host_port("host:65536", host, port));
  EXPECT_FALSE(parse_host_port("host:12ab", host, port));
}

TEST(UtilTest, FileRoundTrip) {
  char path[] = "/tmp/seglink_util_XXXXXX";
  int fd = ::mkstemp(path);
  ASSERT_GE(fd, 0);
  ::close(fd);

  Bytes data = make_payload(3000);
  EXPECT_TRUE(write_file(path, data));
  Bytes back;
  EXPECT_TRUE(read_file(path, back));
  EXPECT_EQ(back, data);
  std::remove(path);

  EXPECT_FALSE(read_file("/nonexistent/seglink/file", back));
}

TEST(UtilTest, ParseLogLevel) {
  LogLevel lvl = LogLevel::INFO;
  EXPECT_TRUE(parse_log_level("trace", lvl));
  EXPECT_EQ(lvl, LogLevel::TRACE);
  EXPECT_TRUE(parse_log_level("off", lvl));
  EXPECT_EQ(lvl, LogLevel::OFF);
  EXPECT_FALSE(parse_log_level("loud", lvl));
  EXPECT_EQ(lvl, LogLevel::OFF);
}

TEST(UtilTest, LoggerWritesToFile) {
  char path[] = "/tmp/seglink_log_XXXXXX";
  int fd = ::mkstemp(path);
  ASSERT_GE(fd, 0);
  ::close(fd);

  Logger& log = Logger::instance();
  const LogLevel saved = log.level();
  ASSERT_TRUE(log.set_file(path));
  log.set_level(LogLevel::WARN);
  log.log(LogLevel::INFO, "hidden %d", 1);
  log.log(LogLevel::WARN, "visible %d", 2);
  log.set_stderr();
  log.set_level(saved);

  Bytes contents;
  ASSERT_TRUE(read_file(path, contents));
  const std::string text(contents.begin(), contents.end());
  EXPECT_EQ(text.find("hidden"), std::string::npos);
  EXPECT_NE(text.find("[WARN] visible 2"), std::string::npos);
  std::remove(path);
}

TEST(ConfigTest, DefaultsAreValid) {
  LinkConfig cfg;
  EXPECT_EQ(cfg.segment_size, 1024u);
  EXPECT_EQ(cfg.width, OffsetWidth::U64);
  EXPECT_NO_THROW(validate(cfg));

  cfg.width = OffsetWidth::U32;
  cfg.max_message_size = 0xFFFFFFFFull;
  EXPECT_NO_THROW(validate(cfg));
}

TEST(ConfigTest, RejectsInconsistentBounds) {
  LinkConfig cfg;
  cfg.segment_size = 0;
  EXPECT_THROW(validate(cfg), Error);

  cfg = LinkConfig{};
  cfg.max_segment_size = 512;
  EXPECT_THROW(validate(cfg), Error);

  cfg = LinkConfig{};
  cfg.width = OffsetWidth::U32;
  cfg.max_message_size = 0x100000000ull;
  EXPECT_THROW(validate(cfg), Error);
}

TEST(MemoryTransportTest, DeliversInOrderAcrossCalls) {
  auto ends = make_memory_pair();
  Bytes a = to_bytes("abc");
  Bytes b = to_bytes("defgh");
  ends.first->send_all(a.data(), a.size());
  ends.first->send_all(b.data(), b.size());

  std::uint8_t out[8];
  ends.second->recv_all(out, 2);
  ends.second->recv_all(out + 2, 6);
  EXPECT_EQ(std::string((const char*)out, 8), "abcdefgh");
}

TEST(MemoryTransportTest, BlockedReadWakesWhenDataArrives) {
  auto ends = make_memory_pair();
  std::uint8_t out[4] = {};
  Peer writer([&] {
    Bytes d = to_bytes("ping");
    ends.first->send_all(d.data(), 2);
    ends.first->send_all(d.data() + 2, 2);
  });
  ends.second->recv_all(out, 4);
  writer.join();
  EXPECT_EQ(std::string((const char*)out, 4), "ping");
}

TEST(MemoryTransportTest, CloseDrainsThenFails) {
  auto ends = make_memory_pair();
  Bytes d = to_bytes("xy");
  ends.first->send_all(d.data(), d.size());
  ends.first->close();

  std::uint8_t out[2];
  ends.second->recv_all(out, 2);
  EXPECT_EQ(out[0], 'x');
  EXPECT_THROW(ends.second->recv_all(out, 1), TransportError);
  EXPECT_THROW(ends.second->send_all(d.data(), 1), TransportError);
  EXPECT_THROW(ends.first->send_all(d.data(), 1), TransportError);
}

TEST(MemoryTransportTest, CloseUnblocksPendingReader) {
  auto ends = make_memory_pair();
  Peer reader([&] {
    std::uint8_t out[1];
    ends.second->recv_all(out, 1);
  });
  ends.first->close();
  EXPECT_THROW(reader.join(), TransportError);
}

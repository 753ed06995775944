#include "seglink/checksum.hpp"
#include "seglink/session.hpp"
#include "seglink/transport.hpp"
#include "seglink/util.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace seglink;
using namespace seglink_test;

TEST(TcpTransportTest, SessionsOverLoopback) {
  TcpListener listener;
  listener.listen("127.0.0.1", 0);
  const std::uint16_t port = listener.port();
  ASSERT_NE(port, 0);

  auto crc = std::make_shared<Crc32Checksum>();
  const std::string big = repeat("hello world", 1024);

  Peer server([&] {
    Session s(listener.accept(), LinkConfig{}, crc);
    s.send(to_bytes(big));
    s.send(to_bytes("another"));
    const Bytes& reply = s.receive();
    EXPECT_EQ(std::string(reply.begin(), reply.end()), "hello from client");
  });

  Session client(LinkConfig{}, crc);
  client.connect("127.0.0.1:" + std::to_string(port));
  EXPECT_TRUE(client.attached());
  EXPECT_TRUE(client.reliable());

  Bytes buf;
  client.receive_into(buf);
  EXPECT_EQ(std::string(buf.begin(), buf.end()), big);
  client.receive_into(buf);
  EXPECT_EQ(std::string(buf.begin(), buf.end()), "another");
  client.send(to_bytes("hello from client"));
  server.join();

  EXPECT_EQ(client.stats().messages_received, 2u);
  EXPECT_EQ(client.stats().segments_accepted, 12u);
}

TEST(TcpTransportTest, ListenAndAcceptSingleClient) {
  // Reserve a free port, then hand it to listen_and_accept.
  TcpListener probe;
  probe.listen("127.0.0.1", 0);
  const std::uint16_t port = probe.port();
  probe.close();

  auto server_tp = std::make_unique<TcpTransport>();
  TcpTransport* server_raw = server_tp.get();
  Peer server([&] { server_raw->listen_and_accept("127.0.0.1", port); });

  // The server may not be listening yet.
  TcpTransport client;
  for (int attempt = 0;; ++attempt) {
    try {
      client.connect("127.0.0.1", port);
      break;
    } catch (const TransportError&) {
      if (attempt >= 200) throw;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  server.join();
  EXPECT_TRUE(client.is_open());
  EXPECT_TRUE(server_tp->is_open());

  Bytes msg = to_bytes("ping");
  client.send_all(msg.data(), msg.size());
  std::uint8_t out[4];
  server_tp->recv_all(out, 4);
  EXPECT_EQ(std::string((const char*)out, 4), "ping");
}

TEST(TcpTransportTest, ConnectToClosedPortFails) {
  TcpListener probe;
  probe.listen("127.0.0.1", 0);
  const std::uint16_t port = probe.port();
  probe.close();

  Session s;
  EXPECT_THROW(s.connect("127.0.0.1", port), TransportError);
  EXPECT_FALSE(s.attached());
  EXPECT_THROW(s.connect("missing-port"), Error);
}

TEST(TcpTransportTest, ReadTimeoutIsTransportError) {
  TcpListener listener;
  listener.listen("127.0.0.1", 0);

  TcpTransport client;
  client.connect("127.0.0.1", listener.port());
  std::unique_ptr<TcpTransport> server = listener.accept();
  server->set_timeout(std::chrono::milliseconds(50));

  std::uint8_t out[1];
  EXPECT_THROW(server->recv_all(out, 1), TransportError);
}

TEST(TcpTransportTest, PeerCloseMidMessage) {
  TcpListener listener;
  listener.listen("127.0.0.1", 0);

  auto client = std::make_unique<TcpTransport>();
  client->connect("127.0.0.1", listener.port());
  Session rx(listener.accept(), LinkConfig{}, std::make_shared<Crc32Checksum>());

  SegmentHeader h;
  h.length = 100;
  h.whole_length = 100;
  Bytes wire = h.encode(OffsetWidth::U64);
  client->send_all(wire.data(), wire.size());
  Bytes partial(10, 0x55);
  client->send_all(partial.data(), partial.size());
  client->close();

  EXPECT_THROW(rx.receive(), TransportError);
  EXPECT_FALSE(rx.attached());
}

TEST(TcpTransportTest, WriteToClosedPeerIsTransportError) {
  TcpListener listener;
  listener.listen("127.0.0.1", 0);

  TcpTransport client;
  client.connect("127.0.0.1", listener.port());
  listener.accept()->close();

  // Early writes may still be buffered; once the reset arrives the write fails
  // with EPIPE instead of raising SIGPIPE.
  Bytes chunk(64 * 1024, 0xA5);
  EXPECT_THROW({
    for (int i = 0; i < 1024; ++i) client.send_all(chunk.data(), chunk.size());
  }, TransportError);
}

TEST(TcpTransportTest, OperationsOnClosedSocketFail) {
  TcpTransport t;
  std::uint8_t b = 0;
  EXPECT_FALSE(t.is_open());
  EXPECT_THROW(t.send_all(&b, 1), TransportError);
  EXPECT_THROW(t.recv_all(&b, 1), TransportError);
  EXPECT_THROW(t.set_timeout(std::chrono::milliseconds(10)), Error);
}

#pragma once
#include "seglink.hpp"
#include "checksum.hpp"
#include "config.hpp"
#include "pipeline.hpp"
#include "transport.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace seglink {

// One connection's worth of protocol state. Blocking and half-duplex; not
// safe for concurrent use from several threads.
//
// Any fatal error inside send/receive closes and detaches the transport,
// since the stream position is no longer known.
class Session {
public:
  // Without a checksum the placeholder NullChecksum is used and reliable() is false.
  explicit Session(LinkConfig cfg = LinkConfig{},
                   std::shared_ptr<const IChecksum> checksum = nullptr);
  Session(std::unique_ptr<ITransport> transport, LinkConfig cfg = LinkConfig{},
          std::shared_ptr<const IChecksum> checksum = nullptr);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;
  Session(Session&&) noexcept;
  Session& operator=(Session&&) noexcept;

  // Opens a TCP connection and attaches it. Throws TransportError on failure.
  void connect(const std::string& host, std::uint16_t port);
  // "host:port" form.
  void connect(const std::string& address);

  // Adopts an already open transport, closing any previous one.
  void wrap(std::unique_ptr<ITransport> transport);
  // Hands the transport back to the caller; the session becomes detached.
  std::unique_ptr<ITransport> detach();
  void close() noexcept;

  bool attached() const { return transport_ != nullptr; }
  bool reliable() const { return !checksum_->is_placeholder(); }

  void send(const std::uint8_t* data, std::size_t n);
  void send(const Bytes& msg) { send(msg.data(), msg.size()); }

  // Typed messages: anything whose as_bytes() yields a contiguous byte
  // container (Bytes, std::string, std::vector<char>, ...).
  template <typename Msg, typename = decltype(std::declval<const Msg&>().as_bytes())>
  void send(const Msg& msg) {
    const auto& bytes = msg.as_bytes();
    static_assert(sizeof(*bytes.data()) == 1, "as_bytes() must yield single-byte elements");
    send((const std::uint8_t*)bytes.data(), bytes.size());
  }

  // Result stays valid until the next receive() on this session.
  const Bytes& receive();
  Bytes& receive_into(Bytes& buf);

  const LinkConfig& config() const { return cfg_; }
  const IChecksum& checksum() const { return *checksum_; }
  const LinkStats& stats() const { return stats_; }

private:
  LinkConfig cfg_;
  std::shared_ptr<const IChecksum> checksum_;
  std::unique_ptr<ITransport> transport_;

  SegmentScratch send_scratch_;
  SegmentScratch recv_scratch_;
  Bytes recv_buf_;
  LinkStats stats_;

  ITransport& require_transport();
  void drop_transport(const char* op, const char* why) noexcept;
};

} // namespace seglink

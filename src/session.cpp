#include "seglink/session.hpp"
#include "seglink/logging.hpp"
#include "seglink/util.hpp"

#include <exception>
#include <utility>

namespace seglink {

Session::Session(LinkConfig cfg, std::shared_ptr<const IChecksum> checksum)
  : cfg_(cfg), checksum_(std::move(checksum)) {
  validate(cfg_);
  if (!checksum_) checksum_ = std::make_shared<NullChecksum>();
  if (checksum_->is_placeholder())
    Logger::instance().log(LogLevel::WARN,
                           "session uses placeholder checksum '%s': corruption will go undetected",
                           checksum_->name());
}

Session::Session(std::unique_ptr<ITransport> transport, LinkConfig cfg,
                 std::shared_ptr<const IChecksum> checksum)
  : Session(cfg, std::move(checksum)) {
  wrap(std::move(transport));
}

Session::~Session() { close(); }

Session::Session(Session&&) noexcept = default;
Session& Session::operator=(Session&&) noexcept = default;

void Session::connect(const std::string& host, std::uint16_t port) {
  auto tcp = std::make_unique<TcpTransport>();
  tcp->connect(host, port);
  wrap(std::move(tcp));
  Logger::instance().log(LogLevel::INFO, "session connected to %s:%u", host.c_str(), (unsigned)port);
}

void Session::connect(const std::string& address) {
  std::string host;
  std::uint16_t port = 0;
  ensure(parse_host_port(address, host, port), "bad address, expected host:port");
  connect(host, port);
}

void Session::wrap(std::unique_ptr<ITransport> transport) {
  ensure(transport != nullptr, "cannot wrap a null transport");
  close();
  transport_ = std::move(transport);
  Logger::instance().log(LogLevel::INFO, "session attached (checksum=%s, segment=%zu, width=%u)",
                         checksum_->name(), cfg_.segment_size, (unsigned)cfg_.width);
}

std::unique_ptr<ITransport> Session::detach() {
  return std::move(transport_);
}

void Session::close() noexcept {
  if (!transport_) return;
  transport_->close();
  transport_.reset();
  Logger::instance().log(LogLevel::INFO, "session closed");
}

ITransport& Session::require_transport() {
  if (!transport_) throw NotConnectedError("session not connected");
  return *transport_;
}

void Session::drop_transport(const char* op, const char* why) noexcept {
  Logger::instance().log(LogLevel::ERROR, "%s failed, closing transport: %s", op, why);
  close();
}

void Session::send(const std::uint8_t* data, std::size_t n) {
  ITransport& t = require_transport();
  // Rejected before anything reaches the wire, so the link stays usable.
  ensure((std::uint64_t)n <= max_offset(cfg_.width), "message too large for offset width");
  try {
    send_message(t, data, n, cfg_, *checksum_, send_scratch_, stats_);
  } catch (const std::exception& e) {
    drop_transport("send", e.what());
    throw;
  }
}

const Bytes& Session::receive() {
  return receive_into(recv_buf_);
}

Bytes& Session::receive_into(Bytes& buf) {
  ITransport& t = require_transport();
  try {
    receive_message(t, buf, cfg_, *checksum_, recv_scratch_, stats_);
  } catch (const std::exception& e) {
    drop_transport("receive", e.what());
    throw;
  }
  return buf;
}

} // namespace seglink

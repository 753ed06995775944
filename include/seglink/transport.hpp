#pragma once
#include "seglink.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace seglink {

// Reliable, ordered byte stream. Both calls block until the full count is
// transferred and throw TransportError otherwise (including premature close).
class ITransport {
public:
  virtual ~ITransport() = default;

  virtual void send_all(const std::uint8_t* data, std::size_t n) = 0;
  virtual void recv_all(std::uint8_t* out, std::size_t n) = 0;

  virtual void close() noexcept = 0;
};

// POSIX TCP transport (Linux/macOS)
class TcpTransport final : public ITransport {
public:
  TcpTransport();
  // Adopts an already connected socket.
  explicit TcpTransport(int fd);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  // Client-side connect
  void connect(const std::string& host, std::uint16_t port);

  // Server-side: bind/listen/accept one client
  void listen_and_accept(const std::string& bind_host, std::uint16_t port);

  // Per-call send/recv deadline; zero disables it.
  void set_timeout(std::chrono::milliseconds timeout);

  bool is_open() const { return fd_ >= 0; }

  void send_all(const std::uint8_t* data, std::size_t n) override;
  void recv_all(std::uint8_t* out, std::size_t n) override;

  void close() noexcept override;

private:
  int fd_{-1};
  int listen_fd_{-1};
};

// Listening socket handing out one TcpTransport per accepted client.
class TcpListener {
public:
  TcpListener() = default;
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  // Port 0 binds an ephemeral port; port() reports the one chosen.
  void listen(const std::string& bind_host, std::uint16_t port, int backlog = 16);
  std::uint16_t port() const;

  std::unique_ptr<TcpTransport> accept();

  void close() noexcept;

private:
  int fd_{-1};
};

// In-process blocking byte pipe. Ends are created in pairs.
class MemoryTransport final : public ITransport {
public:
  struct Pipe;

  MemoryTransport(std::shared_ptr<Pipe> in, std::shared_ptr<Pipe> out);
  ~MemoryTransport() override;

  MemoryTransport(const MemoryTransport&) = delete;
  MemoryTransport& operator=(const MemoryTransport&) = delete;

  void send_all(const std::uint8_t* data, std::size_t n) override;
  void recv_all(std::uint8_t* out, std::size_t n) override;

  void close() noexcept override;

private:
  std::shared_ptr<Pipe> in_;
  std::shared_ptr<Pipe> out_;
  bool closed_{false};
};

std::pair<std::unique_ptr<MemoryTransport>, std::unique_ptr<MemoryTransport>> make_memory_pair();

} // namespace seglink

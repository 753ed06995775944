#include "seglink/transport.hpp"
#include "seglink/logging.hpp"
#include "seglink/util.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace seglink {

// Linux suppresses SIGPIPE per call, BSD/macOS per socket.
#ifdef MSG_NOSIGNAL
static constexpr int kSendFlags = MSG_NOSIGNAL;
#else
static constexpr int kSendFlags = 0;
#endif

static bool suppress_sigpipe(int fd) {
#ifdef SO_NOSIGPIPE
  int yes = 1;
  return ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &yes, sizeof(yes)) == 0;
#else
  (void)fd;
  return true;
#endif
}

TcpTransport::TcpTransport() = default;
TcpTransport::TcpTransport(int fd) : fd_(fd) {}
TcpTransport::~TcpTransport() { close(); }

static int connect_tcp(const std::string& host, std::uint16_t port) {
  struct addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;

  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
  ensure_io(rc == 0 && res, "getaddrinfo failed");

  int fd = -1;
  for (auto* p = res; p; p = p->ai_next) {
    fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (fd < 0) continue;
    if (::connect(fd, p->ai_addr, p->ai_addrlen) == 0) break;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);
  ensure_io(fd >= 0, "TCP connect failed");
  if (!suppress_sigpipe(fd)) {
    ::close(fd);
    ensure_io(false, "SO_NOSIGPIPE failed");
  }
  return fd;
}

static int listen_tcp(const std::string& bind_host, std::uint16_t port, int backlog) {
  struct addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;
  hints.ai_flags = AI_PASSIVE;

  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = ::getaddrinfo(bind_host.empty() ? nullptr : bind_host.c_str(),
                         port_str.c_str(), &hints, &res);
  ensure_io(rc == 0 && res, "getaddrinfo(bind) failed");

  int lfd = -1;
  for (auto* p = res; p; p = p->ai_next) {
    lfd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (lfd < 0) continue;

    int yes = 1;
    ::setsockopt(lfd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    if (::bind(lfd, p->ai_addr, p->ai_addrlen) != 0) { ::close(lfd); lfd = -1; continue; }
    if (::listen(lfd, backlog) != 0) { ::close(lfd); lfd = -1; continue; }
    break;
  }
  ::freeaddrinfo(res);
  ensure_io(lfd >= 0, "TCP listen failed");
  return lfd;
}

static int accept_tcp(int lfd) {
  for (;;) {
    int cfd = ::accept(lfd, nullptr, nullptr);
    if (cfd >= 0) {
      if (suppress_sigpipe(cfd)) return cfd;
      ::close(cfd);
      ensure_io(false, "SO_NOSIGPIPE failed");
    }
    if (errno == EINTR) continue;
    ensure_io(false, "accept failed");
  }
}

void TcpTransport::connect(const std::string& host, std::uint16_t port) {
  close();
  fd_ = connect_tcp(host, port);
  Logger::instance().log(LogLevel::DEBUG, "tcp connected to %s:%u", host.c_str(), (unsigned)port);
}

void TcpTransport::listen_and_accept(const std::string& bind_host, std::uint16_t port) {
  close();
  listen_fd_ = listen_tcp(bind_host, port, 16);
  int cfd = accept_tcp(listen_fd_);
  fd_ = cfd;
  ::close(listen_fd_);
  listen_fd_ = -1;
  Logger::instance().log(LogLevel::DEBUG, "tcp accepted on port %u", (unsigned)port);
}

void TcpTransport::set_timeout(std::chrono::milliseconds timeout) {
  ensure(fd_ >= 0, "set_timeout on closed socket");
  struct timeval tv{};
  tv.tv_sec = (time_t)(timeout.count() / 1000);
  tv.tv_usec = (suseconds_t)((timeout.count() % 1000) * 1000);
  ensure_io(::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0, "SO_RCVTIMEO failed");
  ensure_io(::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0, "SO_SNDTIMEO failed");
}

void TcpTransport::send_all(const std::uint8_t* data, std::size_t n) {
  ensure_io(fd_ >= 0, "send on closed socket");
  std::size_t off = 0;
  while (off < n) {
    ssize_t w = ::send(fd_, data + off, n - off, kSendFlags);
    if (w < 0 && errno == EINTR) continue;
    ensure_io(!(w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)), "send timed out");
    ensure_io(w > 0, "send failed");
    off += (std::size_t)w;
  }
}

void TcpTransport::recv_all(std::uint8_t* out, std::size_t n) {
  ensure_io(fd_ >= 0, "recv on closed socket");
  std::size_t off = 0;
  while (off < n) {
    ssize_t r = ::recv(fd_, out + off, n - off, MSG_WAITALL);
    if (r < 0 && errno == EINTR) continue;
    ensure_io(!(r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)), "recv timed out");
    ensure_io(r > 0, "recv failed/EOF");
    off += (std::size_t)r;
  }
}

void TcpTransport::close() noexcept {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

// ------------------------------ TcpListener ------------------------------

TcpListener::~TcpListener() { close(); }

void TcpListener::listen(const std::string& bind_host, std::uint16_t port, int backlog) {
  close();
  fd_ = listen_tcp(bind_host, port, backlog);
}

std::uint16_t TcpListener::port() const {
  ensure(fd_ >= 0, "listener not open");
  struct sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  ensure_io(::getsockname(fd_, (struct sockaddr*)&ss, &len) == 0, "getsockname failed");
  if (ss.ss_family == AF_INET6) return ntohs(((struct sockaddr_in6*)&ss)->sin6_port);
  return ntohs(((struct sockaddr_in*)&ss)->sin_port);
}

std::unique_ptr<TcpTransport> TcpListener::accept() {
  ensure(fd_ >= 0, "accept on closed listener");
  return std::make_unique<TcpTransport>(accept_tcp(fd_));
}

void TcpListener::close() noexcept {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

} // namespace seglink

#include "seglink/transport.hpp"
#include "seglink/util.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <initializer_list>
#include <mutex>

namespace seglink {

struct MemoryTransport::Pipe {
  std::mutex mtx;
  std::condition_variable cv;
  std::deque<std::uint8_t> buf;
  bool closed{false};
};

MemoryTransport::MemoryTransport(std::shared_ptr<Pipe> in, std::shared_ptr<Pipe> out)
  : in_(std::move(in)), out_(std::move(out)) {}

MemoryTransport::~MemoryTransport() { close(); }

void MemoryTransport::send_all(const std::uint8_t* data, std::size_t n) {
  ensure_io(!closed_, "send on closed pipe");
  {
    std::lock_guard<std::mutex> lk(out_->mtx);
    ensure_io(!out_->closed, "send failed: peer closed");
    out_->buf.insert(out_->buf.end(), data, data + n);
  }
  out_->cv.notify_all();
}

void MemoryTransport::recv_all(std::uint8_t* out, std::size_t n) {
  ensure_io(!closed_, "recv on closed pipe");
  std::size_t off = 0;
  std::unique_lock<std::mutex> lk(in_->mtx);
  while (off < n) {
    in_->cv.wait(lk, [&] { return !in_->buf.empty() || in_->closed; });
    // Buffered bytes drain before a close is reported.
    ensure_io(!in_->buf.empty(), "recv failed/EOF");
    std::size_t take = std::min(n - off, in_->buf.size());
    std::copy(in_->buf.begin(), in_->buf.begin() + (std::ptrdiff_t)take, out + off);
    in_->buf.erase(in_->buf.begin(), in_->buf.begin() + (std::ptrdiff_t)take);
    off += take;
  }
}

void MemoryTransport::close() noexcept {
  if (closed_) return;
  closed_ = true;
  for (auto* p : {in_.get(), out_.get()}) {
    {
      std::lock_guard<std::mutex> lk(p->mtx);
      p->closed = true;
    }
    p->cv.notify_all();
  }
}

std::pair<std::unique_ptr<MemoryTransport>, std::unique_ptr<MemoryTransport>> make_memory_pair() {
  auto a_to_b = std::make_shared<MemoryTransport::Pipe>();
  auto b_to_a = std::make_shared<MemoryTransport::Pipe>();
  auto a = std::make_unique<MemoryTransport>(b_to_a, a_to_b);
  auto b = std::make_unique<MemoryTransport>(a_to_b, b_to_a);
  return {std::move(a), std::move(b)};
}

} // namespace seglink

#include "seglink/util.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <fstream>
#include <limits>

namespace seglink {

void ensure(bool ok, const char* msg) {
  if (!ok) throw Error(msg);
}

void ensure_io(bool ok, const char* msg) {
  if (!ok) throw TransportError(msg);
}

void ensure_wire(bool ok, const char* msg) {
  if (!ok) throw MalformedSegmentError(msg);
}

void rand_bytes(std::uint8_t* out, std::size_t n) {
  ensure(n <= (std::size_t)(std::numeric_limits<int>::max)(), "rand_bytes request too large");
  if (n == 0) return;
  ensure(RAND_bytes(out, (int)n) == 1, "RAND_bytes failed");
}

Bytes rand_bytes(std::size_t n) {
  Bytes out(n);
  rand_bytes(out.data(), out.size());
  return out;
}

Bytes sha256(const std::uint8_t* data, std::size_t n) {
  Bytes out(32);
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  ensure(ctx != nullptr, "EVP_MD_CTX_new failed");
  unsigned int len = 0;
  bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
            EVP_DigestUpdate(ctx, data, n) == 1 &&
            EVP_DigestFinal_ex(ctx, out.data(), &len) == 1;
  EVP_MD_CTX_free(ctx);
  ensure(ok, "sha256 digest failed");
  ensure(len == 32, "sha256 length mismatch");
  return out;
}

Bytes sha256(const Bytes& data) {
  return sha256(data.data(), data.size());
}

std::string to_hex(const std::uint8_t* data, std::size_t n) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(n * 2);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

bool parse_host_port(const std::string& s, std::string& host, std::uint16_t& port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos == 0) return false;
  std::string h = s.substr(0, pos);
  // [::1]:port
  if (h.size() >= 2 && h.front() == '[' && h.back() == ']') h = h.substr(1, h.size() - 2);
  const std::string p = s.substr(pos + 1);
  if (p.empty() || p.size() > 5) return false;
  unsigned long v = 0;
  for (char c : p) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + (unsigned long)(c - '0');
  }
  if (v > 65535) return false;
  host = h;
  port = (std::uint16_t)v;
  return true;
}

bool read_file(const std::string& path, Bytes& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  f.seekg(0, std::ios::end);
  std::streamsize n = f.tellg();
  if (n < 0) return false;
  f.seekg(0, std::ios::beg);
  out.resize((std::size_t)n);
  if (n > 0) f.read((char*)out.data(), n);
  return (bool)f;
}

bool write_file(const std::string& path, const Bytes& data) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) return false;
  if (!data.empty()) f.write((const char*)data.data(), (std::streamsize)data.size());
  return (bool)f;
}

} // namespace seglink

#pragma once
#include "seglink.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace seglink {

// Integrity function applied to every segment payload.
class IChecksum {
public:
  virtual ~IChecksum() = default;

  virtual std::uint32_t compute(const std::uint8_t* data, std::size_t n) const = 0;
  virtual const char* name() const = 0;

  // True for implementations that do not actually detect corruption.
  virtual bool is_placeholder() const { return false; }

  std::uint32_t compute(const Bytes& data) const { return compute(data.data(), data.size()); }
};

// Always 0. Every segment passes verification, so resends never happen.
class NullChecksum final : public IChecksum {
public:
  using IChecksum::compute;
  std::uint32_t compute(const std::uint8_t*, std::size_t) const override { return 0; }
  const char* name() const override { return "none"; }
  bool is_placeholder() const override { return true; }
};

// IEEE 802.3 CRC-32 (reflected, polynomial 0xEDB88320).
class Crc32Checksum final : public IChecksum {
public:
  using IChecksum::compute;
  std::uint32_t compute(const std::uint8_t* data, std::size_t n) const override;
  const char* name() const override { return "crc32"; }
};

// Leading four bytes of SHA-256, big-endian.
class Sha256Checksum final : public IChecksum {
public:
  using IChecksum::compute;
  std::uint32_t compute(const std::uint8_t* data, std::size_t n) const override;
  const char* name() const override { return "sha256"; }
};

std::uint32_t crc32(const std::uint8_t* data, std::size_t n);

// "none", "crc32" or "sha256". Throws seglink::Error for anything else.
std::shared_ptr<const IChecksum> make_checksum(const std::string& name);

} // namespace seglink

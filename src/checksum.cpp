#include "seglink/checksum.hpp"
#include "seglink/util.hpp"
#include <array>

namespace seglink {

static std::array<std::uint32_t, 256> make_crc32_table() {
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t i = 0; i < 256; i++) {
    std::uint32_t c = i;
    for (int j = 0; j < 8; j++)
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    table[i] = c;
  }
  return table;
}

std::uint32_t crc32(const std::uint8_t* data, std::size_t n) {
  static const std::array<std::uint32_t, 256> table = make_crc32_table();
  std::uint32_t c = ~0u;
  for (std::size_t i = 0; i < n; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

std::uint32_t Crc32Checksum::compute(const std::uint8_t* data, std::size_t n) const {
  return crc32(data, n);
}

std::uint32_t Sha256Checksum::compute(const std::uint8_t* data, std::size_t n) const {
  Bytes d = sha256(data, n);
  return (std::uint32_t(d[0]) << 24) |
         (std::uint32_t(d[1]) << 16) |
         (std::uint32_t(d[2]) << 8) |
         (std::uint32_t(d[3]));
}

std::shared_ptr<const IChecksum> make_checksum(const std::string& name) {
  if (name == "none") return std::make_shared<NullChecksum>();
  if (name == "crc32") return std::make_shared<Crc32Checksum>();
  if (name == "sha256") return std::make_shared<Sha256Checksum>();
  throw Error("unknown checksum: " + name);
}

} // namespace seglink

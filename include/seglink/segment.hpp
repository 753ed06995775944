#pragma once
#include "seglink.hpp"
#include <cstddef>
#include <cstdint>

namespace seglink {

// Width of the begin/length/whole_length fields on the wire. Both ends must agree.
enum class OffsetWidth : std::uint8_t { U32 = 4, U64 = 8 };

enum SegmentFlags : std::uint8_t {
  SF_RESPONSE  = 0x01,
  SF_SLICED    = 0x02,
  SF_CONFIRMED = 0x10
};

// Wire layout, big-endian:
//   u8  version
//   u8  flags
//   u16 reserved
//   uW  begin
//   uW  length
//   uW  whole_length
//   u32 check
struct SegmentHeader {
  std::uint8_t  version{kVersion};
  std::uint8_t  flags{0};
  std::uint16_t reserved{0};
  std::uint64_t begin{0};
  std::uint64_t length{0};
  std::uint64_t whole_length{0};
  std::uint32_t check{0};

  bool is_response() const { return (flags & SF_RESPONSE) != 0; }
  bool is_sliced() const { return (flags & SF_SLICED) != 0; }
  bool is_confirmed() const { return (flags & SF_CONFIRMED) != 0; }

  void set_response() { flags |= SF_RESPONSE; }
  void set_sliced() { flags |= SF_SLICED; }
  void set_confirmed() { flags |= SF_CONFIRMED; }

  void reset() { *this = SegmentHeader{}; }

  // Writes exactly header_size(w) bytes to out. Throws if a field does not fit in w.
  void encode(std::uint8_t* out, OffsetWidth w) const;
  Bytes encode(OffsetWidth w) const;

  static SegmentHeader decode(const std::uint8_t* in, OffsetWidth w);
  static SegmentHeader decode(const Bytes& in, OffsetWidth w);
};

constexpr std::size_t header_size(OffsetWidth w) {
  return 4 + 3 * (std::size_t)w + 4;
}

// Largest value a begin/length/whole_length field can carry at width w.
constexpr std::uint64_t max_offset(OffsetWidth w) {
  return w == OffsetWidth::U32 ? 0xFFFFFFFFull : 0xFFFFFFFFFFFFFFFFull;
}

} // namespace seglink

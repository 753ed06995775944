#include "seglink/segment.hpp"
#include "seglink/util.hpp"

namespace seglink {

static std::uint8_t* put_u16(std::uint8_t* p, std::uint16_t v) {
  p[0] = (std::uint8_t)((v >> 8) & 0xFF);
  p[1] = (std::uint8_t)(v & 0xFF);
  return p + 2;
}
static std::uint8_t* put_u32(std::uint8_t* p, std::uint32_t v) {
  p[0] = (std::uint8_t)((v >> 24) & 0xFF);
  p[1] = (std::uint8_t)((v >> 16) & 0xFF);
  p[2] = (std::uint8_t)((v >> 8) & 0xFF);
  p[3] = (std::uint8_t)(v & 0xFF);
  return p + 4;
}
static std::uint8_t* put_u64(std::uint8_t* p, std::uint64_t v) {
  for (int i = 7; i >= 0; --i) *p++ = (std::uint8_t)((v >> (8 * i)) & 0xFF);
  return p;
}

static std::uint16_t get_u16(const std::uint8_t*& p) {
  std::uint16_t v = (std::uint16_t)((std::uint16_t(p[0]) << 8) | std::uint16_t(p[1]));
  p += 2;
  return v;
}
static std::uint32_t get_u32(const std::uint8_t*& p) {
  std::uint32_t v = (std::uint32_t(p[0]) << 24) |
                    (std::uint32_t(p[1]) << 16) |
                    (std::uint32_t(p[2]) << 8) |
                    (std::uint32_t(p[3]));
  p += 4;
  return v;
}
static std::uint64_t get_u64(const std::uint8_t*& p) {
  std::uint64_t v = 0;
  for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
  p += 8;
  return v;
}

static std::uint8_t* put_offset(std::uint8_t* p, std::uint64_t v, OffsetWidth w) {
  if (w == OffsetWidth::U64) return put_u64(p, v);
  ensure(v <= max_offset(w), "segment field exceeds 32-bit offset width");
  return put_u32(p, (std::uint32_t)v);
}
static std::uint64_t get_offset(const std::uint8_t*& p, OffsetWidth w) {
  return w == OffsetWidth::U64 ? get_u64(p) : (std::uint64_t)get_u32(p);
}

void SegmentHeader::encode(std::uint8_t* out, OffsetWidth w) const {
  std::uint8_t* p = out;
  *p++ = version;
  *p++ = flags;
  p = put_u16(p, reserved);
  p = put_offset(p, begin, w);
  p = put_offset(p, length, w);
  p = put_offset(p, whole_length, w);
  put_u32(p, check);
}

Bytes SegmentHeader::encode(OffsetWidth w) const {
  Bytes out(header_size(w));
  encode(out.data(), w);
  return out;
}

SegmentHeader SegmentHeader::decode(const std::uint8_t* in, OffsetWidth w) {
  const std::uint8_t* p = in;
  SegmentHeader h;
  h.version = *p++;
  h.flags = *p++;
  h.reserved = get_u16(p);
  h.begin = get_offset(p, w);
  h.length = get_offset(p, w);
  h.whole_length = get_offset(p, w);
  h.check = get_u32(p);
  return h;
}

SegmentHeader SegmentHeader::decode(const Bytes& in, OffsetWidth w) {
  ensure_wire(in.size() == header_size(w), "segment header size mismatch");
  return decode(in.data(), w);
}

} // namespace seglink

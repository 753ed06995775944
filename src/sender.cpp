#include "seglink/pipeline.hpp"
#include "seglink/logging.hpp"
#include "seglink/transport.hpp"
#include "seglink/util.hpp"

#include <algorithm>
#include <string>

namespace seglink {

static SegmentHeader await_ack(ITransport& t, const LinkConfig& cfg, Bytes& wire,
                               const SegmentHeader& sent) {
  t.recv_all(wire.data(), wire.size());
  SegmentHeader ack = SegmentHeader::decode(wire.data(), cfg.width);
  ensure_wire(ack.version == kVersion, "ack version mismatch");
  ensure_wire(ack.is_response(), "expected a response segment");
  ensure_wire(ack.begin == sent.begin && ack.length == sent.length,
              "ack does not match the segment sent");
  return ack;
}

void send_message(ITransport& t, const std::uint8_t* msg, std::size_t n,
                  const LinkConfig& cfg, const IChecksum& checksum,
                  SegmentScratch& scratch, LinkStats& stats) {
  validate(cfg);
  ensure((std::uint64_t)n <= max_offset(cfg.width), "message too large for offset width");

  scratch.reset(cfg.width);
  SegmentHeader& h = scratch.header;
  Bytes& wire = scratch.wire;

  const std::uint64_t whole = (std::uint64_t)n;
  h.whole_length = whole;
  if (whole > cfg.segment_size) h.set_sliced();

  std::uint64_t cursor = 0;
  std::uint32_t retries = 0;
  do {
    h.begin = cursor;
    h.length = std::min<std::uint64_t>(cfg.segment_size, whole - cursor);
    const std::uint8_t* data = msg + cursor;
    h.check = checksum.compute(data, (std::size_t)h.length);

    h.encode(wire.data(), cfg.width);
    t.send_all(wire.data(), wire.size());
    if (h.length) t.send_all(data, (std::size_t)h.length);
    stats.segments_sent++;
    Logger::instance().log(LogLevel::TRACE, "sent segment begin=%llu len=%llu whole=%llu check=%08x",
                           (unsigned long long)h.begin, (unsigned long long)h.length,
                           (unsigned long long)whole, (unsigned)h.check);

    SegmentHeader ack = await_ack(t, cfg, wire, h);
    if (ack.is_confirmed()) {
      cursor += h.length;
      retries = 0;
      continue;
    }

    stats.retransmissions++;
    ++retries;
    Logger::instance().log(LogLevel::WARN, "peer rejected segment begin=%llu len=%llu (attempt %u of %u)",
                           (unsigned long long)h.begin, (unsigned long long)h.length,
                           (unsigned)retries, (unsigned)cfg.max_retries + 1);
    if (retries > cfg.max_retries)
      throw LinkUnreliableError("segment at offset " + std::to_string(h.begin) +
                                " rejected " + std::to_string(retries) + " times");
  } while (cursor < whole);

  stats.messages_sent++;
  Logger::instance().log(LogLevel::DEBUG, "message sent: %llu bytes", (unsigned long long)whole);
}

} // namespace seglink

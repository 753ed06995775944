#include "seglink/pipeline.hpp"
#include "seglink/logging.hpp"
#include "seglink/transport.hpp"
#include "seglink/util.hpp"

#include <string>

namespace seglink {

// Checks h against the bytes accepted so far. `whole` is only meaningful once
// the first header of the message has been seen.
static void check_segment(const SegmentHeader& h, bool first, std::uint64_t whole,
                          std::uint64_t accepted, const LinkConfig& cfg) {
  ensure_wire(h.version == kVersion, "segment version mismatch");
  ensure_wire(!h.is_response(), "unexpected response segment");
  if (first)
    ensure_wire(h.whole_length <= cfg.max_message_size, "message exceeds max_message_size");
  else
    ensure_wire(h.whole_length == whole, "whole_length changed mid-message");
  ensure_wire(h.begin == accepted, "segment out of sequence");
  ensure_wire(h.length <= cfg.max_segment_size, "segment exceeds max_segment_size");
  ensure_wire(h.begin <= h.whole_length && h.length <= h.whole_length - h.begin,
              "segment overruns message");
  ensure_wire(h.length > 0 || h.whole_length == 0, "empty segment in non-empty message");
}

void receive_message(ITransport& t, Bytes& out,
                     const LinkConfig& cfg, const IChecksum& checksum,
                     SegmentScratch& scratch, LinkStats& stats) {
  validate(cfg);
  out.clear();
  scratch.reset(cfg.width);
  SegmentHeader& h = scratch.header;
  Bytes& wire = scratch.wire;

  bool first = true;
  std::uint64_t whole = 0;
  std::uint32_t failures = 0;
  SegmentHeader reply;

  for (;;) {
    t.recv_all(wire.data(), wire.size());
    h = SegmentHeader::decode(wire.data(), cfg.width);
    check_segment(h, first, whole, (std::uint64_t)out.size(), cfg);
    if (first) {
      whole = h.whole_length;
      first = false;
    }

    // Payload lands directly at the tail of the accumulator and is dropped again on mismatch.
    const std::size_t at = out.size();
    out.resize(at + (std::size_t)h.length);
    if (h.length) t.recv_all(out.data() + at, (std::size_t)h.length);
    const bool intact = checksum.compute(out.data() + at, (std::size_t)h.length) == h.check;

    reply.reset();
    reply.set_response();
    reply.begin = h.begin;
    reply.length = h.length;
    reply.whole_length = h.whole_length;
    if (intact) reply.set_confirmed();
    else out.resize(at);
    reply.encode(wire.data(), cfg.width);
    t.send_all(wire.data(), wire.size());

    if (!intact) {
      stats.integrity_failures++;
      ++failures;
      Logger::instance().log(LogLevel::WARN, "checksum mismatch at begin=%llu len=%llu, requested resend (%u of %u)",
                             (unsigned long long)h.begin, (unsigned long long)h.length,
                             (unsigned)failures, (unsigned)cfg.max_retries + 1);
      if (failures > cfg.max_retries)
        throw LinkUnreliableError("segment at offset " + std::to_string(h.begin) +
                                  " failed verification " + std::to_string(failures) + " times");
      continue;
    }

    failures = 0;
    stats.segments_accepted++;
    Logger::instance().log(LogLevel::TRACE, "accepted segment begin=%llu len=%llu whole=%llu",
                           (unsigned long long)h.begin, (unsigned long long)h.length,
                           (unsigned long long)whole);
    if (h.begin + h.length == whole) break;
  }

  stats.messages_received++;
  Logger::instance().log(LogLevel::DEBUG, "message received: %llu bytes", (unsigned long long)whole);
}

} // namespace seglink

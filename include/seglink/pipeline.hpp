#pragma once
#include "seglink.hpp"
#include "checksum.hpp"
#include "config.hpp"
#include "segment.hpp"
#include <cstddef>
#include <cstdint>

namespace seglink {

class ITransport;

// Header scratch and wire buffer reused across the segments of one message.
struct SegmentScratch {
  SegmentHeader header;
  Bytes wire;

  void reset(OffsetWidth w) {
    header.reset();
    wire.assign(header_size(w), 0);
  }
};

// Stop-and-wait send of one logical message: for every segment write header
// then payload, block for the acknowledgment, resend until confirmed.
// An empty message is one header with no payload.
void send_message(ITransport& t, const std::uint8_t* msg, std::size_t n,
                  const LinkConfig& cfg, const IChecksum& checksum,
                  SegmentScratch& scratch, LinkStats& stats);

// Reassembles one logical message into `out` (cleared first), acknowledging
// each verified segment and requesting a resend on checksum mismatch.
void receive_message(ITransport& t, Bytes& out,
                     const LinkConfig& cfg, const IChecksum& checksum,
                     SegmentScratch& scratch, LinkStats& stats);

} // namespace seglink

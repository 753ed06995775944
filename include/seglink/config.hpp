#pragma once
#include "seglink.hpp"
#include "segment.hpp"
#include <cstddef>
#include <cstdint>

namespace seglink {

struct LinkConfig {
  std::size_t segment_size{kDefaultSegmentSize};
  OffsetWidth width{OffsetWidth::U64};
  // Resends allowed per segment before the link is declared unreliable.
  std::uint32_t max_retries{kDefaultMaxRetries};
  // Upper bounds on what a peer may announce.
  std::uint64_t max_segment_size{kMaxSegmentSize};
  std::uint64_t max_message_size{kMaxMessageSize};
};

// Throws seglink::Error on an unusable configuration.
void validate(const LinkConfig& cfg);

struct LinkStats {
  std::uint64_t messages_sent{0};
  std::uint64_t messages_received{0};
  std::uint64_t segments_sent{0};
  std::uint64_t segments_accepted{0};
  // Resend requests received from the peer.
  std::uint64_t retransmissions{0};
  // Checksum mismatches detected on incoming segments.
  std::uint64_t integrity_failures{0};
};

} // namespace seglink

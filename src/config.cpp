#include "seglink/config.hpp"
#include "seglink/util.hpp"

namespace seglink {

void validate(const LinkConfig& cfg) {
  ensure(cfg.width == OffsetWidth::U32 || cfg.width == OffsetWidth::U64, "offset width must be 4 or 8");
  ensure(cfg.segment_size > 0, "segment_size must be positive");
  ensure(cfg.max_segment_size > 0, "max_segment_size must be positive");
  ensure((std::uint64_t)cfg.segment_size <= cfg.max_segment_size, "segment_size exceeds max_segment_size");
  ensure(cfg.max_segment_size <= max_offset(cfg.width), "max_segment_size exceeds offset width");
  ensure(cfg.max_message_size <= max_offset(cfg.width), "max_message_size exceeds offset width");
}

} // namespace seglink

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace seglink {
using Bytes = std::vector<std::uint8_t>;
static constexpr std::uint8_t kVersion = 1;

static constexpr std::size_t kDefaultSegmentSize = 1024;
static constexpr std::uint32_t kDefaultMaxRetries = 8;
static constexpr std::uint64_t kMaxSegmentSize = 16 * 1024 * 1024;
static constexpr std::uint64_t kMaxMessageSize = 1024ull * 1024 * 1024;
} // namespace seglink

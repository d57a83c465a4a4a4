// include/imgstream/core/types.hpp
#pragma once

#include <cstdint>
#include <string>

namespace imgstream {

// -----------------------------
// Basic identifiers
// -----------------------------

using RunId = std::string;  // e.g. "run_001"

// -----------------------------
// Time
// -----------------------------
// Timestamps are integer nanoseconds for determinism and portability.
// Interpretation (epoch vs run-relative) is defined by whoever stamps them.

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
  constexpr bool operator>(const TimestampNs& other) const noexcept { return ns > other.ns; }
  constexpr bool operator>=(const TimestampNs& other) const noexcept { return ns >= other.ns; }
};

// -----------------------------
// Stream addressing
// -----------------------------

// Reference point for ImageStream::seek. Same meaning as for byte streams,
// except the unit is one item.
enum class SeekOrigin {
  kBegin,
  kCurrent,
  kEnd,
};

}  // namespace imgstream

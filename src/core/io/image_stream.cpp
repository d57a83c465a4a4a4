// File: src/core/io/image_stream.cpp
#include "imgstream/core/io/image_stream.hpp"

#include <algorithm>
#include <limits>

namespace imgstream {
namespace {

// Saturating add: seek offsets come straight from callers.
std::int64_t add_sat(std::int64_t a, std::int64_t b) noexcept {
  if (b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) {
    return std::numeric_limits<std::int64_t>::max();
  }
  if (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b) {
    return std::numeric_limits<std::int64_t>::min();
  }
  return a + b;
}

}  // namespace

std::int64_t clamp_seek(std::int64_t position, std::int64_t offset, SeekOrigin origin,
                        std::int64_t length) noexcept {
  length = std::max<std::int64_t>(0, length);

  std::int64_t base = 0;
  switch (origin) {
    case SeekOrigin::kBegin:
      base = 0;
      break;
    case SeekOrigin::kCurrent:
      base = position;
      break;
    case SeekOrigin::kEnd:
      base = length;
      break;
  }

  return std::clamp<std::int64_t>(add_sat(base, offset), 0, length);
}

}  // namespace imgstream

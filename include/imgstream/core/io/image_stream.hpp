// File: include/imgstream/core/io/image_stream.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "imgstream/core/io/image.hpp"
#include "imgstream/core/status.hpp"
#include "imgstream/core/types.hpp"

namespace imgstream {

// Shared seek arithmetic for item streams.
// Candidate = base(origin) + offset, clamped into [0, length].
//   kBegin   -> base 0
//   kCurrent -> base position
//   kEnd     -> base length
[[nodiscard]] std::int64_t clamp_seek(std::int64_t position, std::int64_t offset, SeekOrigin origin,
                                      std::int64_t length) noexcept;

// A source of decoded images addressed by item index.
//
// read() contract:
//  - ok + image    : one item consumed, position advanced by one
//  - ok + nullopt  : end of stream (not an error)
//  - error status  : the item could not be produced
class ImageStream {
 public:
  virtual ~ImageStream() = default;

  virtual Status open() = 0;
  virtual void close() = 0;

  virtual Result<std::optional<Image>> read() = 0;

  [[nodiscard]] virtual std::int64_t length() const = 0;
  [[nodiscard]] virtual std::int64_t position() const = 0;

  // Returns the new position. Streams that cannot seek return position().
  virtual std::int64_t seek(std::int64_t offset, SeekOrigin origin = SeekOrigin::kCurrent) = 0;

  [[nodiscard]] virtual bool is_live_stream() const = 0;
  [[nodiscard]] virtual bool can_seek() const = 0;

  // Name of the item at position(), if the stream has one.
  [[nodiscard]] virtual std::optional<std::string> current_path() const { return std::nullopt; }
};

}  // namespace imgstream

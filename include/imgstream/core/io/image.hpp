// File: include/imgstream/core/io/image.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "imgstream/core/status.hpp"

namespace imgstream {

struct ImageInfo {
  int width{0};
  int height{0};
  int channels{0};
  int depth{1};          // bytes per channel (1 = 8-bit, 2 = 16-bit, 4 = float)
  std::size_t stride{0};  // bytes per row, >= width * channels * depth

  [[nodiscard]] std::size_t size_bytes() const noexcept {
    return stride * static_cast<std::size_t>(height);
  }
};

// Owning handle to a decoded raster.
// Release contract:
//  - `release` runs exactly once, when the image is destroyed or overwritten
//  - a moved-from image is empty and releases nothing
// Loaders bind whatever frees their native buffer into `release`.
class Image {
 public:
  using Releaser = std::function<void()>;

  Image() = default;
  Image(ImageInfo info, std::uint8_t* data, Releaser release);
  ~Image();

  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;

  Image(Image&& other) noexcept;
  Image& operator=(Image&& other) noexcept;

  // Heap-backed image with a tightly packed stride, zero-filled.
  // invalid_argument on negative sizes or when the byte count overflows.
  static Result<Image> allocate(int width, int height, int channels, int depth = 1);

  [[nodiscard]] const ImageInfo& info() const noexcept { return info_; }
  [[nodiscard]] int width() const noexcept { return info_.width; }
  [[nodiscard]] int height() const noexcept { return info_.height; }
  [[nodiscard]] int channels() const noexcept { return info_.channels; }

  [[nodiscard]] std::uint8_t* data() noexcept { return data_; }
  [[nodiscard]] const std::uint8_t* data() const noexcept { return data_; }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return data_ ? info_.size_bytes() : 0; }
  [[nodiscard]] bool empty() const noexcept { return data_ == nullptr; }

  // Pointer to the first byte of row `y`. No bounds check.
  [[nodiscard]] std::uint8_t* row(int y) noexcept {
    return data_ + static_cast<std::size_t>(y) * info_.stride;
  }
  [[nodiscard]] const std::uint8_t* row(int y) const noexcept {
    return data_ + static_cast<std::size_t>(y) * info_.stride;
  }

 private:
  void reset() noexcept;

  ImageInfo info_{};
  std::uint8_t* data_{nullptr};
  Releaser release_;
};

}  // namespace imgstream

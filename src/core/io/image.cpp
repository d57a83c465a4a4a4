// File: src/core/io/image.cpp
#include "imgstream/core/io/image.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

namespace imgstream {
namespace {

bool mul_checked(std::size_t a, std::size_t b, std::size_t& out) {
  if (a != 0 && b > std::numeric_limits<std::size_t>::max() / a) return false;
  out = a * b;
  return true;
}

}  // namespace

Image::Image(ImageInfo info, std::uint8_t* data, Releaser release)
    : info_(info), data_(data), release_(std::move(release)) {}

Image::~Image() { reset(); }

Image::Image(Image&& other) noexcept
    : info_(other.info_), data_(other.data_), release_(std::move(other.release_)) {
  other.info_ = ImageInfo{};
  other.data_ = nullptr;
  other.release_ = nullptr;
}

Image& Image::operator=(Image&& other) noexcept {
  if (this == &other) return *this;
  reset();
  info_ = other.info_;
  data_ = other.data_;
  release_ = std::move(other.release_);
  other.info_ = ImageInfo{};
  other.data_ = nullptr;
  other.release_ = nullptr;
  return *this;
}

Result<Image> Image::allocate(int width, int height, int channels, int depth) {
  if (width < 0 || height < 0 || channels < 0 || depth < 1) {
    return Result<Image>::err(Status::invalid_argument("Image::allocate: negative size"));
  }

  std::size_t stride = 0;
  std::size_t bytes = 0;
  if (!mul_checked(static_cast<std::size_t>(width), static_cast<std::size_t>(channels), stride) ||
      !mul_checked(stride, static_cast<std::size_t>(depth), stride) ||
      !mul_checked(stride, static_cast<std::size_t>(height), bytes)) {
    return Result<Image>::err(Status::invalid_argument("Image::allocate: size overflows"));
  }

  ImageInfo info;
  info.width = width;
  info.height = height;
  info.channels = channels;
  info.depth = depth;
  info.stride = stride;

  auto buf = std::make_shared<std::vector<std::uint8_t>>(std::max<std::size_t>(1, bytes));
  std::uint8_t* data = buf->data();
  return Result<Image>::ok(Image(info, data, [buf]() mutable { buf.reset(); }));
}

void Image::reset() noexcept {
  // Clear state before calling out: the releaser runs at most once.
  Releaser r = std::move(release_);
  release_ = nullptr;
  data_ = nullptr;
  info_ = ImageInfo{};
  if (r) r();
}

}  // namespace imgstream

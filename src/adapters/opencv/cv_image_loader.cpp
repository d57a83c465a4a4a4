// File: src/adapters/opencv/cv_image_loader.cpp
#include "imgstream/adapters/opencv/cv_image_loader.hpp"

#include <filesystem>
#include <memory>
#include <system_error>
#include <utility>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace imgstream {
namespace {

int bytes_per_channel(int cv_depth) {
  switch (cv_depth) {
    case CV_8U:
    case CV_8S:
      return 1;
    case CV_16U:
    case CV_16S:
      return 2;
    case CV_32F:
      return 4;
    default:
      return 0;
  }
}

}  // namespace

Result<Image> load_image_cv(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return Result<Image>::err(Status::not_found("image not found: " + path));
  }

  cv::Mat mat;
  try {
    mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    return Result<Image>::err(Status::corrupt_data("failed decoding " + path + ": " + e.what()));
  }
  if (mat.empty()) {
    return Result<Image>::err(Status::corrupt_data("failed decoding " + path));
  }

  const int depth = bytes_per_channel(mat.depth());
  if (depth == 0) {
    return Result<Image>::err(Status::unsupported("unsupported pixel type in " + path));
  }

  ImageInfo info;
  info.width = mat.cols;
  info.height = mat.rows;
  info.channels = mat.channels();
  info.depth = depth;
  info.stride = mat.step[0];

  // The heap copy of the header holds one reference to the pixel buffer.
  auto holder = std::make_shared<cv::Mat>(std::move(mat));
  std::uint8_t* data = holder->data;
  return Result<Image>::ok(Image(info, data, [holder]() mutable { holder.reset(); }));
}

}  // namespace imgstream

// File: include/imgstream/adapters/opencv/cv_image_loader.hpp
#pragma once

#include <string>

#include "imgstream/core/io/image.hpp"
#include "imgstream/core/status.hpp"

namespace imgstream {

// Default ImageDirectoryReader loader.
// Decodes `path` with cv::imread(IMREAD_UNCHANGED): channel count and bit depth
// are kept as stored in the file. The returned Image shares the decoded
// cv::Mat buffer and drops its reference when the Image is destroyed.
//
// Errors:
//  - not_found if the file does not exist
//  - corrupt_data if OpenCV cannot decode it
//  - unsupported for element types other than 8/16-bit integer or 32-bit float
Result<Image> load_image_cv(const std::string& path);

}  // namespace imgstream

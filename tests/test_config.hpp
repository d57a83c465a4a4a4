// File: tests/test_config.hpp
#pragma once

#include <atomic>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

#include "imgstream/adapters/image_dir/image_dir_reader.hpp"
#include "imgstream/core/io/image.hpp"
#include "imgstream/core/status.hpp"

namespace imgstream::test {

namespace fs = std::filesystem;

// Scratch directory removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::random_device rd;
    const auto tag = std::to_string(rd()) + "_" + std::to_string(rd());
    path_ = fs::temp_directory_path() / ("imgstream_test_" + tag);
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const fs::path& path() const { return path_; }
  [[nodiscard]] std::string str() const { return path_.string(); }

  // Creates `rel` (and parent directories) holding `contents`.
  fs::path touch(const std::string& rel, const std::string& contents = "x") const {
    const fs::path p = path_ / rel;
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << contents;
    return p;
  }

  fs::path mkdir(const std::string& rel) const {
    const fs::path p = path_ / rel;
    fs::create_directories(p);
    return p;
  }

 private:
  fs::path path_;
};

// Loader that "decodes" a file into a 1-row image holding the path bytes.
// Lets tests map an item back to the file it came from without real images.
inline Result<Image> path_echo_loader(const std::string& path) {
  auto img = Image::allocate(static_cast<int>(path.size()), 1, 1);
  if (!img.ok()) return img;
  std::memcpy(img->data(), path.data(), path.size());
  return img;
}

inline std::string path_of(const Image& img) {
  return std::string(reinterpret_cast<const char*>(img.data()), img.size_bytes());
}

inline std::string file_name_of(const Image& img) {
  return fs::path(path_of(img)).filename().string();
}

inline std::vector<std::string> read_lines(const std::string& path) {
  std::ifstream f(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(f, line)) lines.push_back(line);
  return lines;
}

inline bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// Wraps a loader and counts how often it ran.
struct CountingLoader {
  std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);

  ImageLoader wrap(ImageLoader inner) const {
    auto c = calls;
    return [c, inner = std::move(inner)](const std::string& path) {
      c->fetch_add(1);
      return inner(path);
    };
  }
};

}  // namespace imgstream::test

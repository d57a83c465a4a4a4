// File: include/imgstream/adapters/image_dir/image_dir_reader.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "imgstream/core/io/image_stream.hpp"

namespace imgstream {

// Turns a file path into a decoded image. Must be safe to call from the
// thread that calls read(); the reader never calls it concurrently.
using ImageLoader = std::function<Result<Image>(const std::string& path)>;

struct ImageDirectoryReaderConfig {
  std::string dir;                       // e.g. data/run_001/frames
  std::vector<std::string> patterns{"*"};  // e.g. {"*.png", "*.jpg"}
  bool natural_sort{true};               // false keeps raw walk order
  bool recursive{false};                 // false lists the top directory only
};

// Directory of still images exposed as a seekable ImageStream.
//
// The file list is scanned once in create() and frozen; open() never re-scans.
// Each read() decodes one file through the loader. Nothing is cached.
//
// Thread safety:
//  - concurrent read() calls consume distinct indices (instance mutex)
//  - seek/position/close/current_path are atomic on the cursor but do not wait
//    for an in-flight read()
//
// Loader failure leaves the cursor where it was; the next read() retries the
// same file.
class ImageDirectoryReader final : public ImageStream {
 public:
  // Errors: directory_not_found if `cfg.dir` is missing, io_error if the
  // directory cannot be listed. An empty `loader` selects the OpenCV decoder.
  static Result<std::unique_ptr<ImageDirectoryReader>> create(
      const ImageDirectoryReaderConfig& cfg, ImageLoader loader = {});

  static Result<std::unique_ptr<ImageDirectoryReader>> create(
      const std::string& dir, std::vector<std::string> patterns, bool natural_sort = true,
      bool recursive = false, ImageLoader loader = {});

  // Brace lists such as {"*.png", "*.jpg"} resolve here.
  static Result<std::unique_ptr<ImageDirectoryReader>> create(
      const std::string& dir, std::initializer_list<std::string> patterns,
      bool natural_sort = true, bool recursive = false, ImageLoader loader = {});

  static Result<std::unique_ptr<ImageDirectoryReader>> create(
      const std::string& dir, const std::string& pattern, bool natural_sort = true,
      bool recursive = false, ImageLoader loader = {});

 private:
  struct Passkey {
    explicit Passkey() = default;
  };

 public:
  // Only create() can mint a Passkey.
  ImageDirectoryReader(Passkey, std::vector<std::string> paths, ImageLoader loader);

  ImageDirectoryReader(const ImageDirectoryReader&) = delete;
  ImageDirectoryReader& operator=(const ImageDirectoryReader&) = delete;

  // No-op: the directory was scanned at construction.
  Status open() override { return Status::ok_status(); }

  // Rewinds to the first file. The reader stays usable.
  void close() override;

  Result<std::optional<Image>> read() override;

  [[nodiscard]] std::int64_t length() const override {
    return static_cast<std::int64_t>(paths_.size());
  }
  [[nodiscard]] std::int64_t position() const override { return cursor_.load(); }

  std::int64_t seek(std::int64_t offset, SeekOrigin origin = SeekOrigin::kCurrent) override;

  [[nodiscard]] bool is_live_stream() const override { return false; }
  [[nodiscard]] bool can_seek() const override { return true; }

  // Path at the cursor, or nullopt once position() == length().
  [[nodiscard]] std::optional<std::string> current_path() const override;

  [[nodiscard]] const std::vector<std::string>& paths() const noexcept { return paths_; }

 private:
  const std::vector<std::string> paths_;
  const ImageLoader loader_;

  std::mutex read_mu_;
  std::atomic<std::int64_t> cursor_{0};
};

}  // namespace imgstream

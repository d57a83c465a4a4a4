// File: src/adapters/image_dir/image_dir_reader.cpp
#include "imgstream/adapters/image_dir/image_dir_reader.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <utility>

#include "imgstream/adapters/opencv/cv_image_loader.hpp"
#include "imgstream/core/util/file_enumerator.hpp"
#include "imgstream/core/util/natural_sort.hpp"

namespace imgstream {
namespace {

// A throwing loader is reported like one that returned an error.
Result<Image> invoke_loader(const ImageLoader& loader, const std::string& path) {
  try {
    return loader(path);
  } catch (const std::exception& e) {
    return Result<Image>::err(Status::internal("loader failed on " + path + ": " + e.what()));
  }
}

}  // namespace

using ReaderResult = Result<std::unique_ptr<ImageDirectoryReader>>;

ImageDirectoryReader::ImageDirectoryReader(Passkey, std::vector<std::string> paths,
                                           ImageLoader loader)
    : paths_(std::move(paths)), loader_(std::move(loader)) {}

ReaderResult ImageDirectoryReader::create(const ImageDirectoryReaderConfig& cfg,
                                          ImageLoader loader) {
  if (cfg.dir.empty()) {
    return ReaderResult::err(Status::invalid_argument("ImageDirectoryReader: dir is empty"));
  }

  EnumerateOptions opts;
  opts.patterns = cfg.patterns;
  opts.recursive = cfg.recursive;

  auto files_r = enumerate_files(cfg.dir, opts);
  if (!files_r.ok()) return ReaderResult::err(files_r.status());
  std::vector<std::string> files = files_r.take_value();

  if (cfg.natural_sort) natural_sort(files);

  if (!loader) loader = load_image_cv;

  return ReaderResult::ok(
      std::make_unique<ImageDirectoryReader>(Passkey{}, std::move(files), std::move(loader)));
}

ReaderResult ImageDirectoryReader::create(const std::string& dir,
                                          std::vector<std::string> patterns, bool natural_sort,
                                          bool recursive, ImageLoader loader) {
  ImageDirectoryReaderConfig cfg;
  cfg.dir = dir;
  cfg.patterns = std::move(patterns);
  cfg.natural_sort = natural_sort;
  cfg.recursive = recursive;
  return create(cfg, std::move(loader));
}

ReaderResult ImageDirectoryReader::create(const std::string& dir,
                                          std::initializer_list<std::string> patterns,
                                          bool natural_sort, bool recursive, ImageLoader loader) {
  return create(dir, std::vector<std::string>(patterns), natural_sort, recursive,
                std::move(loader));
}

ReaderResult ImageDirectoryReader::create(const std::string& dir, const std::string& pattern,
                                          bool natural_sort, bool recursive, ImageLoader loader) {
  return create(dir, std::vector<std::string>{pattern}, natural_sort, recursive,
                std::move(loader));
}

void ImageDirectoryReader::close() { cursor_.store(0); }

Result<std::optional<Image>> ImageDirectoryReader::read() {
  using ReadResult = Result<std::optional<Image>>;

  std::lock_guard<std::mutex> lock(read_mu_);

  const std::int64_t idx = cursor_.load();
  if (idx >= length()) {
    return ReadResult::ok(std::nullopt);
  }

  const std::string& path = paths_[static_cast<std::size_t>(idx)];

  Result<Image> img_r = invoke_loader(loader_, path);
  if (!img_r.ok()) return ReadResult::err(img_r.status());

  // Advance only after a successful load; a failed item is retried next time.
  cursor_.store(idx + 1);
  return ReadResult::ok(std::optional<Image>(img_r.take_value()));
}

std::int64_t ImageDirectoryReader::seek(std::int64_t offset, SeekOrigin origin) {
  const std::int64_t next = clamp_seek(cursor_.load(), offset, origin, length());
  cursor_.store(next);
  return next;
}

std::optional<std::string> ImageDirectoryReader::current_path() const {
  const std::int64_t idx = cursor_.load();
  if (idx < 0 || idx >= length()) return std::nullopt;
  return paths_[static_cast<std::size_t>(idx)];
}

}  // namespace imgstream

// src/core/util/file_enumerator.cpp
#include "imgstream/core/util/file_enumerator.hpp"

#include <fnmatch.h>

#include <filesystem>
#include <system_error>
#include <utility>

namespace imgstream {
namespace fs = std::filesystem;

namespace {

template <typename Iterator>
Status walk(Iterator it, const fs::path& root, const EnumerateOptions& opts,
            std::vector<std::string>& out) {
  std::error_code ec;
  const Iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      return Status::io_error("failed listing directory " + root.string() + ": " + ec.message());
    }
    if (!it->is_regular_file(ec)) {
      ec.clear();
      continue;
    }
    if (!matches_any(it->path().filename().string(), opts.patterns)) continue;
    out.push_back(it->path().string());
  }
  if (ec) {
    return Status::io_error("failed listing directory " + root.string() + ": " + ec.message());
  }
  return Status::ok_status();
}

}  // namespace

bool matches_any(const std::string& file_name, const std::vector<std::string>& patterns) {
  for (const auto& p : patterns) {
    if (p.empty()) continue;
    if (::fnmatch(p.c_str(), file_name.c_str(), 0) == 0) return true;
  }
  return false;
}

Result<std::vector<std::string>> enumerate_files(const std::string& root,
                                                 const EnumerateOptions& opts) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return Result<std::vector<std::string>>::err(
        Status::directory_not_found("Dir: " + root + " cannot be found!"));
  }

  const fs::path abs_root = fs::absolute(fs::path(root), ec).lexically_normal();
  if (ec) {
    return Result<std::vector<std::string>>::err(
        Status::io_error("failed resolving " + root + ": " + ec.message()));
  }

  std::vector<std::string> files;
  Status st;
  if (opts.recursive) {
    fs::recursive_directory_iterator it(abs_root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      return Result<std::vector<std::string>>::err(
          Status::io_error("failed opening directory " + root + ": " + ec.message()));
    }
    st = walk(std::move(it), abs_root, opts, files);
  } else {
    fs::directory_iterator it(abs_root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      return Result<std::vector<std::string>>::err(
          Status::io_error("failed opening directory " + root + ": " + ec.message()));
    }
    st = walk(std::move(it), abs_root, opts, files);
  }
  if (!st.ok()) return Result<std::vector<std::string>>::err(st);

  return Result<std::vector<std::string>>::ok(std::move(files));
}

}  // namespace imgstream

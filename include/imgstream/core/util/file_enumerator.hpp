// include/imgstream/core/util/file_enumerator.hpp
#pragma once

#include <string>
#include <vector>

#include "imgstream/core/status.hpp"

namespace imgstream {

struct EnumerateOptions {
  // Shell-style wildcards matched against the file name: '*', '?', '[...]'.
  std::vector<std::string> patterns{"*"};
  bool recursive{false};
};

// True if `file_name` matches at least one of `patterns`.
bool matches_any(const std::string& file_name, const std::vector<std::string>& patterns);

// Lists regular files under `root` whose name matches any pattern.
// Paths are absolute, in directory walk order, each listed once.
// Errors:
//  - directory_not_found if `root` is missing or not a directory
//  - io_error if the walk fails part way
Result<std::vector<std::string>> enumerate_files(const std::string& root,
                                                 const EnumerateOptions& opts);

}  // namespace imgstream

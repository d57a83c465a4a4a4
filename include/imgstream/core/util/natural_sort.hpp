// include/imgstream/core/util/natural_sort.hpp
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace imgstream {

// Three-way "natural" comparison:
//  - runs of ASCII digits compare by numeric value ("file2" < "file10")
//  - everything else compares byte-wise
//  - equal numeric values with different zero padding ("01" vs "1") fall back
//    to fewer leading zeros first, then plain byte order
// Returns <0, 0, >0. Returns 0 only for identical strings.
int natural_compare(std::string_view a, std::string_view b) noexcept;

struct NaturalLess {
  bool operator()(std::string_view a, std::string_view b) const noexcept {
    return natural_compare(a, b) < 0;
  }
};

// Stable in-place natural sort.
void natural_sort(std::vector<std::string>& values);

}  // namespace imgstream

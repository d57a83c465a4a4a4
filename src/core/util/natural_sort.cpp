// src/core/util/natural_sort.cpp
#include "imgstream/core/util/natural_sort.hpp"

#include <algorithm>
#include <cstddef>

namespace imgstream {
namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

struct DigitRun {
  std::size_t end = 0;           // one past the last digit
  std::size_t leading_zeros = 0;
  std::string_view significant;  // digits after the leading zeros
};

DigitRun scan_digits(std::string_view s, std::size_t begin) {
  std::size_t i = begin;
  while (i < s.size() && s[i] == '0') ++i;
  const std::size_t sig_begin = i;
  while (i < s.size() && is_digit(s[i])) ++i;

  DigitRun run;
  run.end = i;
  run.leading_zeros = sig_begin - begin;
  run.significant = s.substr(sig_begin, i - sig_begin);

  // A run of only zeros: keep one so "0" and "000" both read as value zero.
  if (run.significant.empty() && run.leading_zeros > 0) {
    --run.leading_zeros;
    run.significant = s.substr(i - 1, 1);
  }
  return run;
}

}  // namespace

int natural_compare(std::string_view a, std::string_view b) noexcept {
  std::size_t i = 0;
  std::size_t j = 0;
  int zero_tiebreak = 0;

  while (i < a.size() && j < b.size()) {
    if (is_digit(a[i]) && is_digit(b[j])) {
      const DigitRun ra = scan_digits(a, i);
      const DigitRun rb = scan_digits(b, j);

      // Without leading zeros, a longer digit string is a larger number.
      if (ra.significant.size() != rb.significant.size()) {
        return ra.significant.size() < rb.significant.size() ? -1 : 1;
      }
      const int c = ra.significant.compare(rb.significant);
      if (c != 0) return c < 0 ? -1 : 1;

      if (zero_tiebreak == 0 && ra.leading_zeros != rb.leading_zeros) {
        zero_tiebreak = ra.leading_zeros < rb.leading_zeros ? -1 : 1;
      }
      i = ra.end;
      j = rb.end;
      continue;
    }

    const auto ca = static_cast<unsigned char>(a[i]);
    const auto cb = static_cast<unsigned char>(b[j]);
    if (ca != cb) return ca < cb ? -1 : 1;
    ++i;
    ++j;
  }

  const bool a_done = (i >= a.size());
  const bool b_done = (j >= b.size());
  if (a_done != b_done) return a_done ? -1 : 1;

  if (zero_tiebreak != 0) return zero_tiebreak;

  const int c = a.compare(b);
  return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

void natural_sort(std::vector<std::string>& values) {
  std::stable_sort(values.begin(), values.end(), NaturalLess{});
}

}  // namespace imgstream

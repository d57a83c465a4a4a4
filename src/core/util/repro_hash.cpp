// File: src/core/util/repro_hash.cpp
#include "imgstream/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>

namespace imgstream {
namespace {

// FNV-1a 64-bit. Not cryptographic; fast, stable fingerprints.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) {
    const std::uint64_t bits = std::bit_cast<std::uint64_t>(v);
    add_u64(bits);
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  h.add_string(cfg.run_id);

  // Input. Pattern order matters only for matching, but a reordered list is
  // still a different config file.
  h.add_string(cfg.input.dir);
  h.add_u64(static_cast<std::uint64_t>(cfg.input.patterns.size()));
  for (const auto& p : cfg.input.patterns) h.add_string(p);
  h.add_bool(cfg.input.natural_sort);
  h.add_bool(cfg.input.recursive);
  h.add_i64(cfg.input.start_index);
  h.add_i64(cfg.input.max_items);
  h.add_double(cfg.input.tick_hz);
  h.add_i32(cfg.input.heartbeat_every_s);

  // Output.
  h.add_string(cfg.output.out_dir);
  h.add_i32(cfg.output.keep_runs);

  return to_hex(h.h);
}

}  // namespace imgstream

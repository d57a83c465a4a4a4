// src/core/util/config_loader.cpp
#include "imgstream/core/util/config_loader.hpp"

#include <filesystem>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace imgstream {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

// `patterns` accepts a single string or a sequence of strings.
static Result<std::vector<std::string>> parse_patterns(const YAML::Node& n) {
  using R = Result<std::vector<std::string>>;
  if (n.IsScalar()) return R::ok({n.as<std::string>()});
  if (!n.IsSequence()) return R::err(Status::invalid_argument("input.patterns must be a string or a sequence"));

  std::vector<std::string> out;
  out.reserve(n.size());
  for (std::size_t i = 0; i < n.size(); ++i) {
    if (!n[i].IsScalar()) {
      return R::err(Status::invalid_argument("input.patterns entries must be strings"));
    }
    out.push_back(n[i].as<std::string>());
  }
  return R::ok(std::move(out));
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 16) {
    return Result<YAML::Node>::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  // An empty file is an empty mapping; anything else at the top must be a mapping.
  if (root.IsNull()) root = YAML::Node(YAML::NodeType::Map);
  if (!root.IsMap()) {
    return Result<YAML::Node>::err(Status::parse_error("top level of " + path.string() + " must be a mapping"));
  }

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      if (!inc[i].IsScalar()) {
        return Result<YAML::Node>::err(
            Status::parse_error("includes entries must be file names in " + path.string()));
      }
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  // Finally override with this file's contents (excluding includes itself).
  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

// Merging reads keys as strings; a non-scalar key surfaces as a YAML exception.
static Result<YAML::Node> load_with_includes_checked(const fs::path& path) {
  try {
    return load_with_includes(path, 0);
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("invalid YAML in " + path.string() + ": " + e.what()));
  }
}

static Result<Config> parse_config(const YAML::Node& y) {
  Config cfg;  // defaults

  // --- high-level
  maybe_set(y, "run_id", cfg.run_id);

  // --- input
  if (is_map(y["input"])) {
    const auto in = y["input"];
    maybe_set(in, "dir", cfg.input.dir);
    if (in["patterns"]) {
      auto p = parse_patterns(in["patterns"]);
      if (!p.ok()) return Result<Config>::err(p.status());
      cfg.input.patterns = p.take_value();
    }
    maybe_set(in, "natural_sort", cfg.input.natural_sort);
    maybe_set(in, "recursive", cfg.input.recursive);
    maybe_set(in, "start_index", cfg.input.start_index);
    maybe_set(in, "max_items", cfg.input.max_items);
    maybe_set(in, "tick_hz", cfg.input.tick_hz);
    maybe_set(in, "heartbeat_every_s", cfg.input.heartbeat_every_s);
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    maybe_set(o, "out_dir", cfg.output.out_dir);
    maybe_set(o, "keep_runs", cfg.output.keep_runs);
  }

  return Result<Config>::ok(cfg);
}

// Type mismatches (e.g. "abc" for an integer) surface as YAML exceptions.
static Result<Config> parse_config_checked(const YAML::Node& y, const std::string& path_str) {
  try {
    return parse_config(y);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error("invalid value in " + path_str + ": " + e.what()));
  }
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  auto yaml_r = load_with_includes_checked(path);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  const YAML::Node y = yaml_r.take_value();

  auto cfg_r = parse_config_checked(y, path_str);
  if (!cfg_r.ok()) return cfg_r;
  Config cfg = cfg_r.take_value();

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

}  // namespace imgstream

// include/imgstream/core/util/config_loader.hpp
#pragma once

#include <string>

#include "imgstream/core/config.hpp"
#include "imgstream/core/status.hpp"

namespace imgstream {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

}  // namespace imgstream

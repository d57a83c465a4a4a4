// File: include/imgstream/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "imgstream/core/config.hpp"

namespace imgstream {

// Hash the full runtime config (input selection, ordering, pacing, output).
// Goal: if the run changes, this hash should change.
std::string compute_config_hash(const Config& cfg);

}  // namespace imgstream

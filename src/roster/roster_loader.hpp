// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "engine/match_state.hpp"

#include <yaml-cpp/yaml.h>

#include <string>

namespace dball::roster {

// Builds a roster snapshot from YAML. Unknown role/race tags, stat names and bonus names are
// logged at warn and carry no modifier; missing stats keep their defaults.
engine::RosterSnapshot parse_roster(const YAML::Node &root, const std::string &source);

// YAML::Exception propagates for unreadable or malformed files.
engine::RosterSnapshot load_roster(const std::string &path);

} // namespace dball::roster

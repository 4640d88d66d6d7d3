// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "engine/match_state.hpp"
#include "engine/race_modifiers.hpp"

#include <string>
#include <vector>

namespace dball::engine {

// Base stats + active bonuses + race deltas, then fatigue: speed and agility scale by (1 - f),
// power by (1 - f) * 0.5 + 0.5. Pure.
StatBlock effective_stats(const PlayerState &p, const RaceTable &races);

// Mean of one effective stat over the listed players of a team (0 for an empty list).
double average_effective(const TeamState &team, const std::vector<std::string> &ids, Stat stat,
                         const RaceTable &races);

} // namespace dball::engine

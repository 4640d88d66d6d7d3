// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "engine/balance_config.hpp"
#include "engine/match_state.hpp"

namespace dball::engine {

// 0 at or above the threshold, rising linearly to max_fatigue_penalty at zero stamina.
double fatigue_for(double stamina, const BalanceConfig &cfg) noexcept;

// Per-tick drain for every on-field player, home slots first then away. Races with a regen rule
// consume one draw per player before the drain.
void apply_stamina_tick(MatchState &state, const BalanceConfig &cfg);

// Recomputes fatigue_penalty from current_stamina for every rostered player.
void refresh_fatigue(MatchState &state, const BalanceConfig &cfg);

// Explicit recovery for every rostered player (halftime), clamped to capacity.
void apply_recovery(MatchState &state, double amount, const BalanceConfig &cfg);

} // namespace dball::engine

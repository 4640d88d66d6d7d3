// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "engine/balance_config.hpp"
#include "engine/match_event.hpp"
#include "engine/match_state.hpp"
#include "engine/rng.hpp"

#include <string>

namespace dball::engine {

// Chooses and resolves one play per tick for the side in possession.
// Resolution reads the state (never writes it) and draws from the supplied RNG only; the returned
// event carries type, priority, involved players, stat deltas and play detail. Identity, timing
// and description are filled in by the engine.
class ActionResolver
{
public:
    explicit ActionResolver(const BalanceConfig &cfg) : cfg_(cfg) {}

    // Weighted draw over the four play kinds (one draw).
    ActionKind select_action(DeterministicRng &rng) const;

    MatchEvent resolve(ActionKind kind, const MatchState &state, DeterministicRng &rng) const;

    MatchEvent resolve_run(const MatchState &state, DeterministicRng &rng) const;
    MatchEvent resolve_pass(const MatchState &state, DeterministicRng &rng) const;
    MatchEvent resolve_kick(const MatchState &state, DeterministicRng &rng) const;
    MatchEvent resolve_defense(const MatchState &state, DeterministicRng &rng) const;

    // Contest for a loose ball dropped or fumbled by lost_by (a player of losing_side).
    LooseBall scramble(MatchEvent &ev, const MatchState &state, DeterministicRng &rng, const std::string &lost_by,
                       Side losing_side) const;

private:
    const BalanceConfig &cfg_;
};

} // namespace dball::engine

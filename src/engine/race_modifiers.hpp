// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "engine/types.hpp"

#include <array>
#include <limits>
#include <optional>
#include <string>

namespace dball::engine {

// Chance-gated passive stamina regeneration applied before the per-tick drain.
struct RegenRule
{
    double chance{0.0};
    double amount{0.0};
};

// Commentary flavor window: the named pool is eligible when yards fall in [min_yards, max_yards],
// or in (min_yards, max_yards] for an exclusive lower bound.
struct FlavorWindow
{
    std::string pool;
    double min_yards{0.0};
    double max_yards{std::numeric_limits<double>::infinity()};
    bool exclusive_min{false};

    bool contains(double yards) const noexcept
    {
        const bool above = exclusive_min ? yards > min_yards : yards >= min_yards;
        return above && yards <= max_yards;
    }
};

// Everything race-specific lives in this record so the resolver, the stat pipeline and the
// commentary generator stay free of per-race branches.
struct RaceProfile
{
    StatBlock deltas;
    double drain_multiplier{1.0};
    std::optional<RegenRule> regen;
    std::optional<FlavorWindow> run_flavor;
    std::optional<std::string> pass_flavor; // pool mixed into completed-pass commentary
};

using RaceTable = std::array<RaceProfile, kRaceCount>;

RaceTable default_race_table();

inline const RaceProfile &profile_for(const RaceTable &table, Race r) noexcept
{
    return table[static_cast<size_t>(r)];
}

} // namespace dball::engine

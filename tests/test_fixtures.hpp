// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "engine/balance_config.hpp"
#include "engine/match_state.hpp"

#include <yaml-cpp/yaml.h>

#include <initializer_list>
#include <string>
#include <utility>

namespace dball::test {

using StatOverrides = std::initializer_list<std::pair<dball::engine::Stat, double>>;

// Uniform roster: n players sharing role, race and stat overrides on top of the defaults.
inline dball::engine::RosterSnapshot make_roster(const std::string &prefix, dball::engine::Role role,
                                                 StatOverrides stats = {}, size_t n = 6,
                                                 dball::engine::Race race = dball::engine::Race::Human)
{
    dball::engine::RosterSnapshot r;
    r.team_id = prefix + "s";
    r.name = prefix + " team";
    for (size_t i = 1; i <= n; ++i) {
        dball::engine::RosterPlayer p;
        p.id = prefix + "-" + std::to_string(i);
        p.name = p.id;
        p.role = role;
        p.race = race;
        for (const auto &[stat, value] : stats)
            p.base_stats[stat] = value;
        r.players.push_back(std::move(p));
    }
    return r;
}

// The reference scenario: six fast, light Runners against six slow, heavy Blockers.
inline dball::engine::RosterSnapshot runners_roster()
{
    using dball::engine::Stat;
    return make_roster("runner", dball::engine::Role::Runner, {{Stat::Speed, 40.0}, {Stat::Power, 10.0}});
}

inline dball::engine::RosterSnapshot blockers_roster()
{
    using dball::engine::Stat;
    return make_roster("blocker", dball::engine::Role::Blocker, {{Stat::Power, 40.0}, {Stat::Speed, 10.0}});
}

// Apply YAML overrides from an optional file (argv[1] in most tests) onto cfg.
inline void apply_overrides_from(dball::engine::BalanceConfig &cfg, int argc, char **argv)
{
    if (argc > 1)
        dball::engine::apply_balance_overrides(cfg, YAML::LoadFile(argv[1]));
}

} // namespace dball::test

// SPDX-License-Identifier: Apache-2.0
#include "engine/race_modifiers.hpp"

namespace dball::engine {

RaceTable default_race_table()
{
    RaceTable t{};

    // Human: adaptable, no fixed modifiers.

    auto &sylvan = t[static_cast<size_t>(Race::Sylvan)];
    sylvan.deltas[Stat::Speed] = 2;
    sylvan.deltas[Stat::Agility] = 3;
    sylvan.regen = RegenRule{0.1, 2.0}; // photosynthesis

    auto &gryll = t[static_cast<size_t>(Race::Gryll)];
    gryll.deltas[Stat::Power] = 4;
    gryll.deltas[Stat::Stamina] = 2;
    gryll.deltas[Stat::Speed] = -1;
    gryll.drain_multiplier = 0.9;
    gryll.run_flavor = FlavorWindow{"run_gryll", 1.0, 3.0};

    auto &lumina = t[static_cast<size_t>(Race::Lumina)];
    lumina.deltas[Stat::Throwing] = 3;
    lumina.deltas[Stat::Leadership] = 2;
    lumina.pass_flavor = "pass_lumina";

    auto &umbra = t[static_cast<size_t>(Race::Umbra)];
    umbra.run_flavor = FlavorWindow{"run_umbra", 8.0, std::numeric_limits<double>::infinity(), true}; // above 8 only

    // Unknown: no modifiers.
    return t;
}

} // namespace dball::engine

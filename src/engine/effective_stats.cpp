// SPDX-License-Identifier: Apache-2.0
#include "engine/effective_stats.hpp"

namespace dball::engine {

StatBlock effective_stats(const PlayerState &p, const RaceTable &races)
{
    StatBlock s = p.base_stats;
    const auto &race = profile_for(races, p.race);
    for (size_t i = 0; i < kStatCount; ++i)
        s.v[i] += p.active_bonuses.v[i] + race.deltas.v[i];

    const double m = 1.0 - p.fatigue_penalty;
    s[Stat::Speed] *= m;
    s[Stat::Agility] *= m;
    s[Stat::Power] *= m * 0.5 + 0.5;
    return s;
}

double average_effective(const TeamState &team, const std::vector<std::string> &ids, Stat stat,
                         const RaceTable &races)
{
    if (ids.empty())
        return 0.0;
    double sum = 0.0;
    for (const auto &id : ids)
        sum += effective_stats(team.player(id), races)[stat];
    return sum / static_cast<double>(ids.size());
}

} // namespace dball::engine

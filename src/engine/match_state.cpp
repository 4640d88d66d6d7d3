// SPDX-License-Identifier: Apache-2.0
#include "engine/match_state.hpp"

#include <algorithm>
#include <set>

namespace dball::engine {

PlayerMatchStats &PlayerMatchStats::operator+=(const PlayerMatchStats &o)
{
    plays += o.plays;
    rushing_attempts += o.rushing_attempts;
    rushing_yards += o.rushing_yards;
    breakaway_runs += o.breakaway_runs;
    scores += o.scores;
    pass_attempts += o.pass_attempts;
    pass_completions += o.pass_completions;
    passing_yards += o.passing_yards;
    catches += o.catches;
    receiving_yards += o.receiving_yards;
    drops += o.drops;
    interceptions_thrown += o.interceptions_thrown;
    interceptions += o.interceptions;
    tackles += o.tackles;
    power_tackles += o.power_tackles;
    fumbles_lost += o.fumbles_lost;
    fumbles_recovered += o.fumbles_recovered;
    kick_attempts += o.kick_attempts;
    kick_scores += o.kick_scores;
    stamina_used += o.stamina_used;
    ticks_on_field += o.ticks_on_field;
    return *this;
}

StatBlock RosterPlayer::default_base_stats()
{
    StatBlock s;
    s.v.fill(20.0);
    s[Stat::Stamina] = 30.0;
    return s;
}

std::vector<std::string> TeamState::on_field_with_role(Role r) const
{
    std::vector<std::string> out;
    for (const auto &id : on_field) {
        if (player(id).role == r)
            out.push_back(id);
    }
    return out;
}

uint32_t TeamState::score() const
{
    uint32_t total = 0;
    for (const auto &[id, p] : players)
        total += p.stats.scores;
    return total;
}

namespace {

void build_team(TeamState &team, const RosterSnapshot &roster, Side side)
{
    const std::string label = std::string(to_string(side)) + " roster '" + roster.team_id + "'";
    if (roster.players.size() < kOnFieldCount) {
        throw ConfigError(label + " has " + std::to_string(roster.players.size()) + " players, need at least "
                          + std::to_string(kOnFieldCount));
    }
    team.team_id = roster.team_id;
    team.name = roster.name;
    team.side = side;
    for (const auto &rp : roster.players) {
        if (rp.id.empty())
            throw ConfigError(label + " contains a player without an id");
        PlayerState ps;
        ps.id = rp.id;
        ps.name = rp.name.empty() ? rp.id : rp.name;
        ps.role = rp.role;
        ps.race = rp.race;
        ps.base_stats = rp.base_stats;
        ps.skills = rp.skills;
        ps.active_bonuses = rp.bonuses;
        ps.current_stamina = std::max(0.0, ps.stamina_capacity());
        auto [it, inserted] = team.players.emplace(rp.id, std::move(ps));
        if (!inserted)
            throw ConfigError(label + " has duplicate player id '" + rp.id + "'");
    }

    if (roster.starters) {
        const auto &starters = *roster.starters;
        if (starters.size() != kOnFieldCount) {
            throw ConfigError(label + " starter list has " + std::to_string(starters.size()) + " entries, need "
                              + std::to_string(kOnFieldCount));
        }
        std::set<std::string> seen;
        for (const auto &id : starters) {
            if (!team.players.count(id))
                throw ConfigError(label + " starter '" + id + "' is not on the roster");
            if (!seen.insert(id).second)
                throw ConfigError(label + " starter '" + id + "' listed twice");
        }
        team.on_field = starters;
    } else {
        for (size_t i = 0; i < kOnFieldCount; ++i)
            team.on_field.push_back(roster.players[i].id);
    }
    for (size_t slot = 0; slot < team.on_field.size(); ++slot) {
        auto &p = team.player(team.on_field[slot]);
        p.on_field = true;
        p.position = static_cast<int>(slot);
    }
}

} // namespace

MatchState build_match_state(const RosterSnapshot &home, const RosterSnapshot &away, const std::string &match_id,
                             double max_time)
{
    if (match_id.empty())
        throw ConfigError("match id must not be empty");
    MatchState st(match_id, max_time);
    build_team(st.team(Side::Home), home, Side::Home);
    build_team(st.team(Side::Away), away, Side::Away);
    return st;
}

TeamMatchStats team_stats(const MatchState &state, Side side)
{
    const auto &team = state.team(side);
    TeamMatchStats ts;
    for (const auto &[id, p] : team.players) {
        ts.score += p.stats.scores;
        ts.rushing_yards += p.stats.rushing_yards;
        ts.passing_yards += p.stats.passing_yards;
        ts.turnovers += p.stats.fumbles_lost + p.stats.interceptions_thrown;
        ts.tackles += p.stats.tackles;
        ts.plays += p.stats.plays;
    }
    ts.possession_ticks = team.possession_ticks;
    return ts;
}

} // namespace dball::engine

// SPDX-License-Identifier: Apache-2.0
#include "engine/action_resolver.hpp"

#include "engine/effective_stats.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace dball::engine {

namespace {

// Role-preferred pick: choice over preferred when non-empty, else over fallback.
std::string pick_player(const std::vector<std::string> &preferred, const std::vector<std::string> &fallback,
                        DeterministicRng &rng)
{
    return preferred.empty() ? rng.choice(fallback) : rng.choice(preferred);
}

int32_t to_yards(double v)
{
    return static_cast<int32_t>(std::max(0.0, v));
}

} // namespace

ActionKind ActionResolver::select_action(DeterministicRng &rng) const
{
    double r = rng.next() * cfg_.total_action_weight();
    if (r < cfg_.run_weight)
        return ActionKind::Run;
    r -= cfg_.run_weight;
    if (r < cfg_.pass_weight)
        return ActionKind::Pass;
    r -= cfg_.pass_weight;
    if (r < cfg_.kick_weight)
        return ActionKind::Kick;
    return ActionKind::Defense;
}

MatchEvent ActionResolver::resolve(ActionKind kind, const MatchState &state, DeterministicRng &rng) const
{
    switch (kind) {
        case ActionKind::Run:
            return resolve_run(state, rng);
        case ActionKind::Pass:
            return resolve_pass(state, rng);
        case ActionKind::Kick:
            return resolve_kick(state, rng);
        case ActionKind::Defense:
            return resolve_defense(state, rng);
    }
    return resolve_run(state, rng);
}

MatchEvent ActionResolver::resolve_run(const MatchState &state, DeterministicRng &rng) const
{
    const auto &off = state.offense();
    const auto &def = state.defense();
    const Side side = state.possession;

    const std::string carrier = pick_player(off.on_field_with_role(Role::Runner), off.on_field, rng);
    const StatBlock cs = effective_stats(off.player(carrier), cfg_.races);
    const double def_power = average_effective(def, def.on_field, Stat::Power, cfg_.races);

    const double power_contest = cs.power() - def_power;
    const double speed_contest = cs.speed() - def_power / 2.0;

    double yards = 0.0;
    if (rng.next() * 100.0 < cfg_.run_base_success_pct + power_contest) {
        yards = std::floor(cfg_.run_success_base_yards + speed_contest / cfg_.run_speed_divisor
                           + rng.next() * cfg_.run_success_random_yards);
    } else {
        yards = std::floor(rng.next() * cfg_.run_stuffed_random_yards); // stuffed at the line
    }

    RunPlay run;
    run.carrier_id = carrier;
    run.yards = to_yards(yards);
    run.breakaway = run.yards >= cfg_.breakaway_min_yards && cs.speed() > cfg_.breakaway_speed_threshold;
    run.scored = rng.next() < (run.breakaway ? cfg_.breakaway_score_chance : cfg_.run_score_chance);

    MatchEvent ev;
    ev.offense = side;
    auto &d = ev.delta_for(carrier, side);
    d.plays = 1;
    d.rushing_attempts = 1;
    d.rushing_yards = run.yards;
    d.breakaway_runs = run.breakaway ? 1 : 0;
    d.scores = run.scored ? 1 : 0;

    if (run.scored) {
        ev.type = EventType::Score;
        ev.priority = Priority::Critical;
        ev.stats.possession_change = true;
    } else {
        ev.priority = run.breakaway ? Priority::Important : Priority::Standard;
    }
    ev.play = run;
    return ev;
}

MatchEvent ActionResolver::resolve_pass(const MatchState &state, DeterministicRng &rng) const
{
    const auto &off = state.offense();
    const auto &def = state.defense();
    const Side side = state.possession;

    PassPlay pass;
    pass.passer_id = pick_player(off.on_field_with_role(Role::Passer), off.on_field, rng);

    std::vector<std::string> runners;
    std::vector<std::string> others;
    for (const auto &id : off.on_field) {
        if (id == pass.passer_id)
            continue;
        others.push_back(id);
        if (off.player(id).role == Role::Runner)
            runners.push_back(id);
    }
    pass.receiver_id = pick_player(runners, others, rng);

    const StatBlock ps = effective_stats(off.player(pass.passer_id), cfg_.races);
    const StatBlock rs = effective_stats(off.player(pass.receiver_id), cfg_.races);
    const double def_agility = average_effective(def, def.on_field, Stat::Agility, cfg_.races);

    MatchEvent ev;
    ev.offense = side;
    auto &pd = ev.delta_for(pass.passer_id, side);
    pd.plays = 1;
    pd.pass_attempts = 1;
    ev.involved.push_back(pass.receiver_id);

    const double completion = std::clamp(cfg_.pass_base_completion + (ps.throwing() - def_agility) / 100.0
                                             + (rs.catching() - def_agility) / 200.0,
                                         0.05, 0.95);
    if (rng.next() < completion) {
        pass.completed = true;
        pass.yards = to_yards(std::floor(cfg_.pass_base_yards + ps.throwing() / cfg_.pass_throwing_divisor
                                         + rng.next() * cfg_.pass_random_yards));
        pass.deep = pass.yards >= cfg_.deep_pass_min_yards;
        pass.scored = rng.next() < (pass.deep ? cfg_.deep_pass_score_chance : cfg_.pass_score_chance);

        ev.delta_for(pass.passer_id, side).pass_completions = 1;
        ev.delta_for(pass.passer_id, side).passing_yards = pass.yards;
        auto &rd = ev.delta_for(pass.receiver_id, side);
        rd.catches = 1;
        rd.receiving_yards = pass.yards;
        rd.scores = pass.scored ? 1 : 0;

        if (pass.scored) {
            ev.type = EventType::Score;
            ev.priority = Priority::Critical;
            ev.stats.possession_change = true;
        } else {
            ev.priority = pass.deep ? Priority::Important : Priority::Standard;
        }
        ev.play = pass;
        return ev;
    }

    const double drop_chance =
        std::clamp(cfg_.drop_base_chance - (rs.catching() - cfg_.drop_catching_pivot) / 100.0, 0.02, 0.6);
    if (rng.next() < drop_chance) {
        pass.dropped = true;
        ev.delta_for(pass.receiver_id, side).drops = 1;
        pass.loose_ball = scramble(ev, state, rng, pass.receiver_id, side);
        ev.priority = Priority::Important;
        ev.play = pass;
        return ev;
    }

    const std::string defender = rng.choice(def.on_field);
    const StatBlock ds = effective_stats(def.player(defender), cfg_.races);
    const double pick_chance =
        std::clamp(cfg_.interception_base_chance + (ds.agility() - ps.throwing()) / 100.0, 0.05, 0.6);
    if (rng.next() < pick_chance) {
        pass.intercepted = true;
        pass.defender_id = defender;
        ev.delta_for(pass.passer_id, side).interceptions_thrown = 1;
        ev.delta_for(defender, opposite(side)).interceptions = 1;
        ev.type = EventType::Turnover;
        ev.priority = Priority::Important;
        ev.stats.turnover = true;
        ev.stats.possession_change = true;
    } else {
        ev.priority = Priority::Downtime;
    }
    ev.play = pass;
    return ev;
}

MatchEvent ActionResolver::resolve_kick(const MatchState &state, DeterministicRng &rng) const
{
    const auto &off = state.offense();
    const Side side = state.possession;

    KickPlay kick;
    double best = -std::numeric_limits<double>::infinity();
    for (const auto &id : off.on_field) {
        double k = effective_stats(off.player(id), cfg_.races).kicking();
        if (k > best) {
            best = k;
            kick.kicker_id = id;
        }
    }

    kick.distance =
        to_yards(std::floor(cfg_.kick_base_distance + best / 2.0 + rng.next() * cfg_.kick_random_distance));
    const double score_chance =
        std::clamp(cfg_.kick_base_score_chance + (best - cfg_.kick_kicking_pivot) / 100.0, 0.02, 0.8);
    kick.scored = rng.next() < score_chance;

    MatchEvent ev;
    ev.offense = side;
    auto &d = ev.delta_for(kick.kicker_id, side);
    d.plays = 1;
    d.kick_attempts = 1;
    d.kick_scores = kick.scored ? 1 : 0;
    d.scores = kick.scored ? 1 : 0;

    // Made or missed, the opponent takes over.
    ev.stats.possession_change = true;
    if (kick.scored) {
        ev.type = EventType::Score;
        ev.priority = Priority::Critical;
    } else {
        ev.priority = Priority::Standard;
    }
    ev.play = kick;
    return ev;
}

MatchEvent ActionResolver::resolve_defense(const MatchState &state, DeterministicRng &rng) const
{
    const auto &off = state.offense();
    const auto &def = state.defense();
    const Side side = state.possession;

    DefensivePlay play;
    play.defender_id = pick_player(def.on_field_with_role(Role::Blocker), def.on_field, rng);
    play.carrier_id = pick_player(off.on_field_with_role(Role::Runner), off.on_field, rng);

    const StatBlock ds = effective_stats(def.player(play.defender_id), cfg_.races);
    const StatBlock cs = effective_stats(off.player(play.carrier_id), cfg_.races);

    MatchEvent ev;
    ev.offense = side;
    auto &dd = ev.delta_for(play.defender_id, opposite(side));
    dd.plays = 1;
    ev.delta_for(play.carrier_id, side);

    const double tackle_chance = std::clamp(cfg_.tackle_base_chance + (ds.power() - cs.agility()) / 100.0, 0.1, 0.9);
    if (rng.next() < tackle_chance) {
        play.tackled = true;
        play.power_tackle = ds.power() >= cfg_.power_tackle_threshold;
        auto &td = ev.delta_for(play.defender_id, opposite(side));
        td.tackles = 1;
        td.power_tackles = play.power_tackle ? 1 : 0;

        const double fumble_chance =
            std::clamp(cfg_.fumble_base_chance + (ds.power() - cs.power()) / 200.0, 0.0, 0.5);
        if (rng.next() < fumble_chance) {
            play.fumble = true;
            play.loose_ball = scramble(ev, state, rng, play.carrier_id, side);
            ev.priority = Priority::Important;
        } else {
            ev.priority = play.power_tackle ? Priority::Important : Priority::Standard;
        }
    } else {
        play.yards = to_yards(std::floor(rng.next() * cfg_.evasion_random_yards));
        ev.delta_for(play.carrier_id, side).rushing_yards = play.yards;
        ev.priority = play.yards > 0 ? Priority::Standard : Priority::Downtime;
    }
    ev.play = play;
    return ev;
}

LooseBall ActionResolver::scramble(MatchEvent &ev, const MatchState &state, DeterministicRng &rng,
                                   const std::string &lost_by, Side losing_side) const
{
    const auto &losers = state.team(losing_side);
    const auto &others = state.team(opposite(losing_side));
    const double own = average_effective(losers, losers.on_field, Stat::Agility, cfg_.races);
    const double opp = average_effective(others, others.on_field, Stat::Agility, cfg_.races);

    LooseBall lb;
    lb.lost_by = lost_by;
    lb.offense_recovered = rng.next() < std::clamp(cfg_.scramble_offense_base + (own - opp) / 100.0, 0.2, 0.8);
    lb.recovered_side = lb.offense_recovered ? losing_side : opposite(losing_side);
    lb.recovered_by = rng.choice(state.team(lb.recovered_side).on_field);

    ev.delta_for(lb.recovered_by, lb.recovered_side).fumbles_recovered += 1;
    if (!lb.offense_recovered) {
        ev.delta_for(lost_by, losing_side).fumbles_lost += 1;
        ev.type = EventType::Turnover;
        ev.stats.turnover = true;
        ev.stats.possession_change = true;
    }
    return lb;
}

} // namespace dball::engine

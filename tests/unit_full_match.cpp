// SPDX-License-Identifier: Apache-2.0
// unit_full_match.cpp
// Runs complete matches and checks the per-tick and end-of-match invariants.
// Usage: unit_full_match [BALANCE_YAML]
#include "engine/match_engine.hpp"
#include "test_fixtures.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace dball::engine;

static double advance_for_check(const BalanceConfig &cfg, Priority p)
{
    switch (p) {
        case Priority::Critical:
            return cfg.critical_advance_sec;
        case Priority::Important:
            return cfg.important_advance_sec;
        case Priority::Standard:
            return cfg.standard_advance_sec;
        case Priority::Downtime:
            return cfg.downtime_advance_sec;
    }
    return 0;
}

static void check_match(const RosterSnapshot &home, const RosterSnapshot &away, const std::string &id,
                        const BalanceConfig &cfg)
{
    MatchEngine eng(home, away, id, cfg);
    const auto &st = eng.state();
    uint64_t expected_tick = 0;
    uint32_t last_home = 0, last_away = 0;
    double last_time = 0;
    while (!eng.finished()) {
        const Side offense = st.possession;
        auto ev = eng.advance_tick();
        ++expected_tick;
        assert(ev.tick == expected_tick && st.tick == expected_tick);
        assert(ev.id == id + ":" + std::to_string(expected_tick));
        assert(ev.offense == offense);
        assert(ev.timestamp == last_time);
        assert(st.game_time == last_time + advance_for_check(cfg, ev.priority));
        last_time = st.game_time;

        // Scores never decrease and only score events move them.
        assert(ev.home_score >= last_home && ev.away_score >= last_away);
        if (ev.type != EventType::Score)
            assert(ev.home_score == last_home && ev.away_score == last_away);
        else
            assert(ev.home_score + ev.away_score == last_home + last_away + 1);
        last_home = ev.home_score;
        last_away = ev.away_score;

        assert(ev.stats.possession_change == (st.possession != offense));
        assert(!ev.stats.turnover || ev.stats.possession_change);
        assert(!ev.involved.empty() && !ev.description.empty());
        assert(ev.description.find("{") == std::string::npos);

        for (const auto &team : st.teams) {
            assert(team.on_field.size() == kOnFieldCount);
            for (const auto &[pid, p] : team.players) {
                assert(p.current_stamina >= 0 && p.current_stamina <= p.stamina_capacity());
                assert(p.fatigue_penalty >= 0 && p.fatigue_penalty <= cfg.max_fatigue_penalty);
            }
        }
    }
    assert(st.game_time >= st.max_time);

    bool threw = false;
    try {
        (void)eng.advance_tick();
    } catch (const std::logic_error &) {
        threw = true;
    }
    assert(threw);

    auto s = eng.summary();
    assert(s.finished && s.ticks == st.tick && s.match_id == id);
    const auto &h = s.teams[0];
    const auto &a = s.teams[1];
    assert(h.plays + a.plays == s.ticks);
    assert(h.possession_ticks + a.possession_ticks == s.ticks);
    assert(h.score == last_home && a.score == last_away);
    assert(s.players.size() == home.players.size() + away.players.size());
    uint64_t on_field_ticks = 0;
    for (const auto &p : s.players)
        on_field_ticks += p.stats.ticks_on_field;
    assert(on_field_ticks == s.ticks * 2 * kOnFieldCount);
}

int main(int argc, char **argv)
{
    BalanceConfig cfg;
    dball::test::apply_overrides_from(cfg, argc, argv);

    check_match(dball::test::runners_roster(), dball::test::blockers_roster(), "full-1", cfg);

    // Mixed roles and races, with a bench.
    auto home = dball::test::make_roster("home", Role::Runner, {{Stat::Throwing, 30}}, 8, Race::Lumina);
    home.players[0].role = Role::Passer;
    home.players[1].race = Race::Umbra;
    home.players[2].race = Race::Sylvan;
    auto away = dball::test::make_roster("away", Role::Blocker, {{Stat::Kicking, 35}}, 6, Race::Gryll);
    away.players[4].role = Role::Unknown;
    check_match(home, away, "full-2", cfg);

    // Short match with halftime recovery and only kicks.
    BalanceConfig kicks = cfg;
    kicks.match_duration_sec = 300;
    kicks.run_weight = kicks.pass_weight = kicks.defense_weight = 0;
    kicks.halftime_stamina_recovery = 10;
    check_match(home, away, "full-3", kicks);

    // Stopping early leaves a consistent, inspectable state.
    MatchEngine partial(home, away, "full-4", cfg);
    for (int i = 0; i < 10; ++i)
        (void)partial.advance_tick();
    auto s = partial.summary();
    assert(!s.finished && s.ticks == 10);
    assert(s.teams[0].plays + s.teams[1].plays == 10);

    std::cout << "unit_full_match OK" << std::endl;
    return 0;
}

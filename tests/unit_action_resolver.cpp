// SPDX-License-Identifier: Apache-2.0
// unit_action_resolver.cpp
// Play selection and resolution rules, exercised over many seeded draws.
#include "engine/action_resolver.hpp"
#include "test_fixtures.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

using namespace dball::engine;

static bool contains(const std::vector<std::string> &v, const std::string &s)
{
    return std::find(v.begin(), v.end(), s) != v.end();
}

static const PlayerStatDelta *find_delta(const MatchEvent &ev, const std::string &id)
{
    for (const auto &d : ev.stats.players)
        if (d.player_id == id)
            return &d;
    return nullptr;
}

static void test_select_action()
{
    BalanceConfig cfg;
    cfg.run_weight = 0;
    cfg.pass_weight = 0;
    cfg.defense_weight = 0;
    ActionResolver only_kicks(cfg);
    DeterministicRng rng("weights");
    for (int i = 0; i < 200; ++i)
        assert(only_kicks.select_action(rng) == ActionKind::Kick);
    assert(rng.draws() == 200);

    BalanceConfig even;
    ActionResolver r(even);
    int counts[4] = {0, 0, 0, 0};
    for (int i = 0; i < 4000; ++i)
        ++counts[static_cast<int>(r.select_action(rng))];
    for (int c : counts)
        assert(c > 800 && c < 1200);
}

static void test_run()
{
    BalanceConfig cfg;
    ActionResolver r(cfg);
    auto home = dball::test::make_roster("mix", Role::Blocker);
    home.players[2].role = Role::Runner;
    auto st = build_match_state(home, dball::test::blockers_roster(), "run", 2400);
    DeterministicRng rng("run");
    for (int i = 0; i < 500; ++i) {
        auto ev = r.resolve_run(st, rng);
        const auto &run = std::get<RunPlay>(ev.play);
        assert(ev.kind() == ActionKind::Run);
        assert(run.carrier_id == "mix-3");
        assert(run.yards >= 0);
        assert(ev.involved == std::vector<std::string>{"mix-3"});
        const auto *d = find_delta(ev, "mix-3");
        assert(d && d->delta.plays == 1 && d->delta.rushing_attempts == 1 && d->delta.rushing_yards == run.yards);
        if (run.scored) {
            assert(ev.type == EventType::Score && ev.priority == Priority::Critical);
            assert(ev.stats.possession_change && !ev.stats.turnover);
        } else {
            assert(ev.type == EventType::RoutinePlay && !ev.stats.possession_change);
            assert(ev.priority == (run.breakaway ? Priority::Important : Priority::Standard));
        }
    }

    // No Runner on the field: any on-field player may carry.
    auto plain = build_match_state(dball::test::blockers_roster(), dball::test::runners_roster(), "run-2", 2400);
    for (int i = 0; i < 100; ++i) {
        auto ev = r.resolve_run(plain, rng);
        assert(contains(plain.team(Side::Home).on_field, std::get<RunPlay>(ev.play).carrier_id));
    }
}

static void test_pass()
{
    BalanceConfig cfg;
    ActionResolver r(cfg);
    auto home = dball::test::make_roster("off", Role::Blocker);
    home.players[0].role = Role::Passer;
    home.players[4].role = Role::Runner;
    auto st = build_match_state(home, dball::test::blockers_roster(), "pass", 2400);
    DeterministicRng rng("pass");
    int completed = 0, intercepted = 0, dropped = 0;
    for (int i = 0; i < 1000; ++i) {
        auto ev = r.resolve_pass(st, rng);
        const auto &pass = std::get<PassPlay>(ev.play);
        assert(pass.passer_id == "off-1");
        assert(pass.receiver_id == "off-5");
        assert(ev.involved.size() >= 2 && ev.involved[0] == "off-1" && ev.involved[1] == "off-5");
        assert(pass.yards >= 0);
        if (pass.completed) {
            ++completed;
            assert(!pass.dropped && !pass.intercepted);
            assert(find_delta(ev, "off-5")->delta.receiving_yards == pass.yards);
        } else if (pass.dropped) {
            ++dropped;
            assert(pass.loose_ball && pass.loose_ball->lost_by == "off-5");
            assert(ev.priority == Priority::Important);
            assert(ev.stats.turnover == !pass.loose_ball->offense_recovered);
        } else if (pass.intercepted) {
            ++intercepted;
            assert(ev.type == EventType::Turnover && ev.stats.turnover && ev.stats.possession_change);
            assert(contains(st.team(Side::Away).on_field, pass.defender_id));
            assert(contains(ev.involved, pass.defender_id));
            assert(find_delta(ev, pass.defender_id)->side == Side::Away);
        } else {
            assert(ev.priority == Priority::Downtime && !ev.stats.possession_change);
        }
    }
    assert(completed > 0 && intercepted > 0 && dropped > 0);
}

static void test_kick()
{
    BalanceConfig cfg;
    ActionResolver r(cfg);
    auto home = dball::test::make_roster("k", Role::Blocker);
    home.players[3].base_stats[Stat::Kicking] = 45;
    auto st = build_match_state(home, dball::test::blockers_roster(), "kick", 2400);
    DeterministicRng rng("kick");
    for (int i = 0; i < 200; ++i) {
        auto ev = r.resolve_kick(st, rng);
        const auto &kick = std::get<KickPlay>(ev.play);
        assert(kick.kicker_id == "k-4");
        assert(kick.distance >= 15 + 22); // base + kicking / 2
        assert(ev.stats.possession_change);
        assert(ev.type == (kick.scored ? EventType::Score : EventType::RoutinePlay));
    }
    assert(rng.draws() == 400);
}

static void test_defense()
{
    BalanceConfig cfg;
    ActionResolver r(cfg);
    auto st = build_match_state(dball::test::runners_roster(), dball::test::blockers_roster(), "defense", 2400);
    DeterministicRng rng("defense");
    int tackles = 0, fumbles = 0;
    for (int i = 0; i < 1000; ++i) {
        auto ev = r.resolve_defense(st, rng);
        const auto &play = std::get<DefensivePlay>(ev.play);
        assert(contains(st.team(Side::Away).on_field, play.defender_id));
        assert(contains(st.team(Side::Home).on_field, play.carrier_id));
        const auto *dd = find_delta(ev, play.defender_id);
        assert(dd && dd->side == Side::Away && dd->delta.plays == 1);
        if (play.tackled) {
            ++tackles;
            assert(play.power_tackle); // blockers carry power 40
            assert(dd->delta.tackles == 1 && dd->delta.power_tackles == 1);
            assert(ev.priority == Priority::Important);
            if (play.fumble) {
                ++fumbles;
                assert(play.loose_ball && play.loose_ball->lost_by == play.carrier_id);
            }
        } else {
            assert(!play.fumble && play.yards >= 0);
            assert(find_delta(ev, play.carrier_id)->delta.rushing_yards == play.yards);
        }
    }
    assert(tackles > 0 && fumbles > 0);
}

static void test_scramble_and_purity()
{
    BalanceConfig cfg;
    ActionResolver r(cfg);
    auto st = build_match_state(dball::test::runners_roster(), dball::test::blockers_roster(), "scramble", 2400);
    const auto before = team_stats(st, Side::Home);
    DeterministicRng rng("scramble");
    int offense = 0, defense = 0;
    for (int i = 0; i < 300; ++i) {
        MatchEvent ev;
        auto lb = r.scramble(ev, st, rng, "runner-1", Side::Home);
        const auto *rec = find_delta(ev, lb.recovered_by);
        assert(rec && rec->side == lb.recovered_side && rec->delta.fumbles_recovered == 1);
        if (lb.offense_recovered) {
            ++offense;
            assert(lb.recovered_side == Side::Home && !ev.stats.turnover && ev.type == EventType::RoutinePlay);
        } else {
            ++defense;
            assert(lb.recovered_side == Side::Away && ev.stats.turnover && ev.stats.possession_change);
            assert(find_delta(ev, "runner-1")->delta.fumbles_lost == 1);
        }
    }
    assert(offense > 0 && defense > 0);

    // Resolution never writes the state.
    for (int i = 0; i < 50; ++i)
        (void)r.resolve(static_cast<ActionKind>(i % 4), st, rng);
    const auto after = team_stats(st, Side::Home);
    assert(after.plays == before.plays && after.score == before.score && st.tick == 0);
    assert(st.rng.draws() == 0 && st.possession == Side::Home);
}

int main()
{
    test_select_action();
    test_run();
    test_pass();
    test_kick();
    test_defense();
    test_scramble_and_purity();
    std::cout << "unit_action_resolver OK" << std::endl;
    return 0;
}

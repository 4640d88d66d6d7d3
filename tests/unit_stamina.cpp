// SPDX-License-Identifier: Apache-2.0
// unit_stamina.cpp
// Drain, regeneration, clamping and fatigue curve.
#include "engine/match_engine.hpp"
#include "engine/stamina.hpp"
#include "test_fixtures.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace dball::engine;

static bool near(double a, double b)
{
    return std::fabs(a - b) < 1e-9;
}

int main()
{
    BalanceConfig cfg;

    // Fatigue curve.
    assert(near(fatigue_for(30, cfg), 0.0));
    assert(near(fatigue_for(20, cfg), 0.0));
    assert(near(fatigue_for(10, cfg), 0.25));
    assert(near(fatigue_for(0, cfg), 0.5));
    assert(near(fatigue_for(-3, cfg), 0.5));

    // Role drain: Runners pay 1.5x, Blockers 1x; bench players untouched.
    {
        auto home = dball::test::make_roster("runner", Role::Runner, {}, 7);
        auto away = dball::test::blockers_roster();
        auto st = build_match_state(home, away, "stamina-1", 2400);
        apply_stamina_tick(st, cfg);
        assert(st.rng.draws() == 0);
        for (const auto &id : st.team(Side::Home).on_field) {
            const auto &p = st.team(Side::Home).player(id);
            assert(near(p.current_stamina, 28.5));
            assert(near(p.stats.stamina_used, 1.5));
            assert(p.stats.ticks_on_field == 1);
            assert(near(p.fatigue_penalty, 0.0));
        }
        const auto &bench = st.team(Side::Home).player("runner-7");
        assert(!bench.on_field && near(bench.current_stamina, 30) && bench.stats.ticks_on_field == 0);
        for (const auto &id : st.team(Side::Away).on_field)
            assert(near(st.team(Side::Away).player(id).current_stamina, 29));
    }

    // Gryll drain multiplier and the zero floor.
    {
        auto home = dball::test::make_roster("gryll", Role::Runner, {}, 6, Race::Gryll);
        auto away = dball::test::blockers_roster();
        auto st = build_match_state(home, away, "stamina-2", 2400);
        // Race stat deltas do not raise the stamina capacity.
        apply_stamina_tick(st, cfg);
        const auto &p = st.team(Side::Home).player("gryll-1");
        assert(near(p.current_stamina, 30 - 1.5 * 0.9));

        auto &low = st.team(Side::Away).player("blocker-1");
        low.current_stamina = 0.4;
        apply_stamina_tick(st, cfg);
        assert(near(low.current_stamina, 0.0));
        assert(near(low.fatigue_penalty, 0.5));
        assert(near(low.stats.stamina_used, 1.0 + 0.4));
    }

    // Stamina forced to zero before a tick: the penalty is exactly the configured maximum.
    {
        MatchEngine eng(dball::test::runners_roster(), dball::test::blockers_roster(), "stamina-5", cfg);
        auto &runner = eng.state_mut().team(Side::Home).player("runner-1");
        runner.current_stamina = 0;
        eng.advance_tick();
        const auto &p = eng.state().team(Side::Home).player("runner-1");
        assert(p.current_stamina == 0);
        assert(p.fatigue_penalty == 0.5);
        assert(p.fatigue_penalty == eng.config().max_fatigue_penalty);
    }

    // Sylvan regeneration: one draw per on-field Sylvan, never above capacity.
    {
        auto home = dball::test::make_roster("sylvan", Role::Blocker, {}, 6, Race::Sylvan);
        auto away = dball::test::blockers_roster();
        auto st = build_match_state(home, away, "stamina-3", 2400);
        for (int i = 0; i < 50; ++i)
            apply_stamina_tick(st, cfg);
        assert(st.rng.draws() == 300);
        for (const auto &[id, p] : st.team(Side::Home).players) {
            assert(p.current_stamina <= p.stamina_capacity());
            assert(p.current_stamina >= 0.0);
        }
        // Blockers without regen drained exactly 30 over 50 ticks, floored at 0.
        assert(near(st.team(Side::Away).player("blocker-1").current_stamina, 0.0));
    }

    // Recovery restores every rostered player up to capacity and refreshes fatigue.
    {
        auto st = build_match_state(dball::test::runners_roster(), dball::test::blockers_roster(), "stamina-4", 2400);
        for (int i = 0; i < 16; ++i)
            apply_stamina_tick(st, cfg); // runners at 6, blockers at 14
        const auto &r = st.team(Side::Home).player("runner-1");
        assert(near(r.current_stamina, 6));
        assert(near(r.fatigue_penalty, 0.35));
        apply_recovery(st, 10, cfg);
        assert(near(r.current_stamina, 16));
        assert(near(r.fatigue_penalty, 0.1));
        apply_recovery(st, 100, cfg);
        assert(near(r.current_stamina, 30));
        assert(near(r.fatigue_penalty, 0.0));
        assert(near(st.team(Side::Away).player("blocker-1").current_stamina, 30));
    }

    std::cout << "unit_stamina OK" << std::endl;
    return 0;
}

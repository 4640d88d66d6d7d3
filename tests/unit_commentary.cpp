// SPDX-License-Identifier: Apache-2.0
// unit_commentary.cpp
// Template substitution, pool selection and phrase bank overlays.
// Usage: unit_commentary [PHRASE_OVERLAY_YAML]
#include "engine/commentary.hpp"
#include "test_fixtures.hpp"

#include <yaml-cpp/yaml.h>

#include <cassert>
#include <iostream>
#include <string>

using namespace dball::engine;

static MatchEvent run_event(const std::string &carrier, int32_t yards, bool breakaway, bool scored)
{
    MatchEvent ev;
    ev.offense = Side::Home;
    RunPlay run;
    run.carrier_id = carrier;
    run.yards = yards;
    run.breakaway = breakaway;
    run.scored = scored;
    ev.play = run;
    ev.delta_for(carrier, Side::Home).plays = 1;
    return ev;
}

static void test_substitute()
{
    std::map<std::string, std::string> v{{"runnerName", "Ada"}, {"yards", "7"}};
    assert(substitute("{runnerName} for {yards}", v) == "Ada for 7");
    assert(substitute("{missing} stays", v) == "{missing} stays");
    assert(substitute("open { brace", v) == "open { brace");
    assert(substitute("", v).empty());
    assert(substitute("{yards}{yards}", v) == "77");
}

static void test_pool_selection()
{
    auto home = dball::test::make_roster("h", Role::Runner);
    home.players[1].race = Race::Umbra;
    home.players[2].race = Race::Gryll;
    home.players[3].race = Race::Lumina;
    auto st = build_match_state(home, dball::test::blockers_roster(), "pools", 2400);
    CommentaryGenerator gen(PhraseBank::built_in(), default_race_table());
    using Pools = std::vector<std::string>;

    assert(gen.pools_for(run_event("h-1", 5, false, false), st) == Pools{"run_standard"});
    assert(gen.pools_for(run_event("h-1", 0, false, false), st) == Pools{"run_stuffed"});
    assert(gen.pools_for(run_event("h-1", 14, true, false), st) == Pools{"run_breakaway"});
    assert(gen.pools_for(run_event("h-1", 14, true, true), st) == Pools{"run_score"});
    assert(gen.pools_for(run_event("h-2", 9, true, false), st) == Pools{"run_umbra"});
    assert(gen.pools_for(run_event("h-2", 8, false, false), st) == Pools{"run_standard"});
    assert(gen.pools_for(run_event("h-2", 4, false, false), st) == Pools{"run_standard"});
    assert(gen.pools_for(run_event("h-3", 2, false, false), st) == Pools{"run_gryll"});
    assert(gen.pools_for(run_event("h-3", 0, false, false), st) == Pools{"run_stuffed"});

    MatchEvent pass;
    pass.offense = Side::Home;
    PassPlay pp;
    pp.passer_id = "h-4";
    pp.receiver_id = "h-1";
    pp.completed = true;
    pp.yards = 25;
    pp.deep = true;
    pass.play = pp;
    assert(gen.pools_for(pass, st) == Pools{"pass_lumina"});
    pp.passer_id = "h-1";
    pp.receiver_id = "h-4";
    pass.play = pp;
    assert(gen.pools_for(pass, st) == Pools{"pass_deep"});

    pp.completed = false;
    pp.deep = false;
    pp.dropped = true;
    pp.loose_ball = LooseBall{"h-4", "blocker-2", Side::Away, false};
    pass.play = pp;
    assert(gen.pools_for(pass, st) == Pools{"pass_drop_defense"});
    auto text = gen.render(pass, st, st.rng);
    assert(text.find("blocker-2") != std::string::npos || text.find("blocker team") != std::string::npos);

    MatchEvent tackle;
    tackle.offense = Side::Home;
    tackle.phase = GamePhase::Clutch;
    DefensivePlay dp;
    dp.defender_id = "blocker-1";
    dp.carrier_id = "h-1";
    dp.tackled = true;
    dp.power_tackle = true;
    tackle.play = dp;
    assert(gen.pools_for(tackle, st) == (Pools{"tackle_power", "clutch"}));
    auto v = gen.placeholders(tackle, st);
    assert(v.at("tacklerName") == "blocker-1");
    assert(v.at("carrierName") == "h-1");
    assert(v.at("teamName") == "h team");
}

static void test_one_draw_and_overlay(const char *overlay)
{
    auto st = build_match_state(dball::test::runners_roster(), dball::test::blockers_roster(), "draws", 2400);
    CommentaryGenerator gen(PhraseBank::built_in(), default_race_table());
    auto ev = run_event("runner-1", 6, false, false);
    for (int i = 0; i < 20; ++i) {
        auto before = st.rng.draws();
        auto line = gen.render(ev, st, st.rng);
        assert(st.rng.draws() == before + 1);
        assert(line.find("runner-1") != std::string::npos);
        assert(line.find('{') == std::string::npos);
    }

    // Missing pools fall back to a generic line and still draw once.
    PhraseBank empty;
    CommentaryGenerator bare(empty, default_race_table());
    auto before = st.rng.draws();
    assert(bare.render(ev, st, st.rng) == "runner-1 makes a play for runner team.");
    assert(st.rng.draws() == before + 1);

    if (!overlay)
        return;
    auto bank = PhraseBank::load(overlay);
    assert(bank.pool_count() == PhraseBank::built_in().pool_count() + 1);
    assert(bank.pool("run_standard")->size() == 1);
    assert(bank.pool("run_breakaway")->size() == 2);
    CommentaryGenerator custom(bank, default_race_table());
    assert(custom.render(ev, st, st.rng) == "RUN runner-1 +6 {unknownTag}");

    bool threw = false;
    try {
        (void)PhraseBank::load(std::string(overlay) + ".missing");
    } catch (const YAML::Exception &) {
        threw = true;
    }
    assert(threw);
}

int main(int argc, char **argv)
{
    test_substitute();
    test_pool_selection();
    test_one_draw_and_overlay(argc > 1 ? argv[1] : nullptr);
    std::cout << "unit_commentary OK" << std::endl;
    return 0;
}

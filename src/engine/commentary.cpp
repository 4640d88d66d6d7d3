// SPDX-License-Identifier: Apache-2.0
#include "engine/commentary.hpp"

#include "common/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <type_traits>

namespace dball::engine {

PhraseBank PhraseBank::built_in()
{
    PhraseBank b;
    b.pools_ = {
        {"run_standard",
         {"{runnerName} grinds it out for {yards} tough yards up the middle.",
          "{runnerName} finds a small crease and picks up {yards} yards.",
          "A quick dash by {runnerName} for a {yards}-yard gain."}},
        {"run_stuffed",
         {"{runnerName} is stuffed at the line. No gain.", "Nowhere to go for {runnerName}, the wall holds."}},
        {"run_breakaway",
         {"{runnerName} turns on the jets and is in open space for {yards} yards!",
          "Explosive speed! {runnerName} leaves the defense behind with a {yards}-yard burst!"}},
        {"run_umbra",
         {"Where did he go?! {runnerName} slips through the shadows for {yards} yards!",
          "Shadow step! {runnerName} phases past the tackle attempt for {yards} yards."}},
        {"run_gryll",
         {"Like tackling a boulder. {runnerName} shrugs off the hit and churns out {yards} yards.",
          "Raw Gryll power! {runnerName} pounds out {yards} hard yards."}},
        {"run_score",
         {"He's in! {runnerName} crosses the line! A score for {teamName}!",
          "SCORE! A brilliant individual effort by {runnerName}!"}},
        {"pass_complete",
         {"{passerName} connects with {receiverName} for a gain of {yards}.",
          "A quick pass from {passerName} to {receiverName} moves the chains."}},
        {"pass_deep",
         {"He's going deep! {passerName} launches one to {receiverName} for {yards} yards!",
          "What a strike! {passerName} finds {receiverName} on a {yards}-yard completion!"}},
        {"pass_lumina",
         {"Lumina precision! A beautiful, accurate throw from {passerName} to {receiverName}.",
          "The ball seems to glow as {passerName} delivers it to {receiverName}."}},
        {"pass_score",
         {"{passerName} connects with {receiverName} in the end zone for the score!",
          "Touchdown {teamName}! {receiverName} hauls in the pass from {passerName}!"}},
        {"pass_incomplete",
         {"{passerName} throws for {receiverName} but the pass falls incomplete.",
          "The pass sails past {receiverName}. Incomplete."}},
        {"pass_interception",
         {"The pass is picked off! {defenderName} read {passerName} perfectly!",
          "He threw it right to the defense! An easy interception for {defenderName}."}},
        {"pass_drop_offense",
         {"Dropped by {receiverName}! A scramble, and {recovererName} secures it for {teamName}.",
          "Right through his hands! {recovererName} dives on the loose ball to keep possession."}},
        {"pass_drop_defense",
         {"Dropped by {receiverName}! {recovererName} scoops up the loose ball for {recoveringTeam}!",
          "A brutal drop by {receiverName} and {recovererName} pounces! Turnover!"}},
        {"kick_score",
         {"{kickerName} drives it home from {distance} yards! Good!", "The kick is up... and it's good!"}},
        {"kick_miss",
         {"{kickerName} pushes the {distance}-yard attempt wide.",
          "No good from {distance} yards. The ball changes hands."}},
        {"tackle_standard",
         {"{tacklerName} wraps up {carrierName} for the tackle.",
          "Solid defense by {tacklerName}, bringing down {carrierName}."}},
        {"tackle_power",
         {"A thunderous tackle by {tacklerName}! {carrierName} is flattened.",
          "Vicious hit! {tacklerName} stops {carrierName} cold."}},
        {"tackle_missed",
         {"{carrierName} slips the tackle from {tacklerName} and picks up {yards}.",
          "{tacklerName} grasps at air as {carrierName} escapes."}},
        {"fumble_offense",
         {"Stripped by {tacklerName}! The ball is loose, but {recovererName} falls on it for {teamName}.",
          "{carrierName} coughs it up! {recovererName} recovers for the offense."}},
        {"fumble_defense",
         {"HUGE HIT by {tacklerName}! {carrierName} fumbles and {recovererName} comes up with it!",
          "Stripped! The ball pops free and {recoveringTeam} takes over through {recovererName}!"}},
        {"clutch",
         {"Every second counts now! {playerName} makes a play for {teamName}.",
          "Crunch time, and {playerName} is right in the middle of it."}},
    };
    return b;
}

PhraseBank PhraseBank::load(const std::string &path)
{
    PhraseBank b = built_in();
    YAML::Node root = YAML::LoadFile(path);
    if (!root.IsMap())
        throw YAML::ParserException(YAML::Mark::null_mark(), "phrase bank root must be a mapping: " + path);
    for (auto it = root.begin(); it != root.end(); ++it) {
        auto name = it->first.as<std::string>();
        b.set_pool(name, it->second.as<std::vector<std::string>>());
    }
    dball::log::debug("[commentary] phrase bank loaded path={} pools={}", path, b.pool_count());
    return b;
}

const std::vector<std::string> *PhraseBank::pool(const std::string &name) const
{
    auto it = pools_.find(name);
    return it == pools_.end() ? nullptr : &it->second;
}

void PhraseBank::set_pool(const std::string &name, std::vector<std::string> templates)
{
    pools_[name] = std::move(templates);
}

std::string substitute(std::string_view tmpl, const std::map<std::string, std::string> &values)
{
    std::string out;
    out.reserve(tmpl.size() + 32);
    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            size_t close = tmpl.find('}', i + 1);
            if (close != std::string_view::npos) {
                auto it = values.find(std::string(tmpl.substr(i + 1, close - i - 1)));
                if (it != values.end()) {
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }
        out.push_back(tmpl[i]);
        ++i;
    }
    return out;
}

std::vector<std::string> CommentaryGenerator::pools_for(const MatchEvent &ev, const MatchState &state) const
{
    std::vector<std::string> pools;
    const auto &off = state.team(ev.offense);
    std::visit(
        [&](const auto &play) {
            using T = std::decay_t<decltype(play)>;
            if constexpr (std::is_same_v<T, RunPlay>) {
                const auto &flavor = profile_for(races_, off.player(play.carrier_id).race).run_flavor;
                if (play.scored)
                    pools.push_back("run_score");
                else if (flavor && flavor->contains(play.yards))
                    pools.push_back(flavor->pool);
                else if (play.breakaway)
                    pools.push_back("run_breakaway");
                else
                    pools.push_back(play.yards > 0 ? "run_standard" : "run_stuffed");
            } else if constexpr (std::is_same_v<T, PassPlay>) {
                const auto &flavor = profile_for(races_, off.player(play.passer_id).race).pass_flavor;
                if (play.scored)
                    pools.push_back("pass_score");
                else if (play.completed && flavor)
                    pools.push_back(*flavor);
                else if (play.completed)
                    pools.push_back(play.deep ? "pass_deep" : "pass_complete");
                else if (play.dropped)
                    pools.push_back(play.loose_ball && !play.loose_ball->offense_recovered ? "pass_drop_defense"
                                                                                          : "pass_drop_offense");
                else if (play.intercepted)
                    pools.push_back("pass_interception");
                else
                    pools.push_back("pass_incomplete");
            } else if constexpr (std::is_same_v<T, KickPlay>) {
                pools.push_back(play.scored ? "kick_score" : "kick_miss");
            } else {
                if (play.fumble)
                    pools.push_back(play.loose_ball && !play.loose_ball->offense_recovered ? "fumble_defense"
                                                                                          : "fumble_offense");
                else if (play.tackled)
                    pools.push_back(play.power_tackle ? "tackle_power" : "tackle_standard");
                else
                    pools.push_back("tackle_missed");
            }
        },
        ev.play);
    if (ev.phase == GamePhase::Clutch)
        pools.push_back("clutch");
    return pools;
}

std::map<std::string, std::string> CommentaryGenerator::placeholders(const MatchEvent &ev,
                                                                     const MatchState &state) const
{
    const Side off_side = ev.offense;
    const Side def_side = opposite(off_side);
    auto name_of = [&](Side side, const std::string &id) { return state.team(side).player(id).name; };

    std::map<std::string, std::string> v;
    v["teamName"] = state.team(off_side).name;
    std::visit(
        [&](const auto &play) {
            using T = std::decay_t<decltype(play)>;
            if constexpr (std::is_same_v<T, RunPlay>) {
                v["runnerName"] = name_of(off_side, play.carrier_id);
                v["playerName"] = v["runnerName"];
                v["yards"] = std::to_string(play.yards);
            } else if constexpr (std::is_same_v<T, PassPlay>) {
                v["passerName"] = name_of(off_side, play.passer_id);
                v["receiverName"] = name_of(off_side, play.receiver_id);
                v["playerName"] = v["passerName"];
                v["yards"] = std::to_string(play.yards);
                if (!play.defender_id.empty())
                    v["defenderName"] = name_of(def_side, play.defender_id);
            } else if constexpr (std::is_same_v<T, KickPlay>) {
                v["kickerName"] = name_of(off_side, play.kicker_id);
                v["playerName"] = v["kickerName"];
                v["distance"] = std::to_string(play.distance);
            } else {
                v["tacklerName"] = name_of(def_side, play.defender_id);
                v["defenderName"] = v["tacklerName"];
                v["carrierName"] = name_of(off_side, play.carrier_id);
                v["playerName"] = v["tacklerName"];
                v["yards"] = std::to_string(play.yards);
            }
            if constexpr (std::is_same_v<T, PassPlay> || std::is_same_v<T, DefensivePlay>) {
                if (play.loose_ball) {
                    v["recovererName"] = name_of(play.loose_ball->recovered_side, play.loose_ball->recovered_by);
                    v["recoveringTeam"] = state.team(play.loose_ball->recovered_side).name;
                }
            }
        },
        ev.play);
    return v;
}

std::string CommentaryGenerator::render(const MatchEvent &ev, const MatchState &state, DeterministicRng &rng) const
{
    std::vector<std::string> candidates;
    for (const auto &name : pools_for(ev, state)) {
        if (const auto *templates = bank_.pool(name))
            candidates.insert(candidates.end(), templates->begin(), templates->end());
    }
    if (candidates.empty()) {
        dball::log::warn("[commentary] no templates for event {}, using generic line", ev.id);
        candidates.push_back("{playerName} makes a play for {teamName}.");
    }
    return substitute(rng.choice(candidates), placeholders(ev, state));
}

} // namespace dball::engine

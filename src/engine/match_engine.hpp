// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "engine/action_resolver.hpp"
#include "engine/balance_config.hpp"
#include "engine/commentary.hpp"
#include "engine/match_event.hpp"
#include "engine/match_state.hpp"

#include <array>
#include <string>
#include <vector>

namespace dball::engine {

struct PlayerSummary
{
    std::string player_id;
    std::string name;
    Side side{Side::Home};
    PlayerMatchStats stats;
};

struct MatchSummary
{
    std::string match_id;
    uint64_t ticks{0};
    double game_time{0.0};
    bool finished{false};
    std::array<std::string, 2> team_ids;
    std::array<std::string, 2> team_names;
    std::array<TeamMatchStats, 2> teams;
    std::vector<PlayerSummary> players; // home roster then away roster, id order
};

// Pull-based driver for one match. The caller invokes advance_tick() until finished(); stopping
// early leaves a valid, inspectable state. Not thread-safe; independent engines share nothing
// except the process-wide metrics counters.
class MatchEngine
{
public:
    // Throws ConfigError for invalid rosters or balance configuration.
    MatchEngine(const RosterSnapshot &home, const RosterSnapshot &away, const std::string &match_id,
                BalanceConfig cfg = {}, PhraseBank phrases = PhraseBank::built_in());
    MatchEngine(const MatchEngine &) = delete;
    MatchEngine &operator=(const MatchEngine &) = delete;

    // Runs one tick and returns its event. Throws std::logic_error once the match is finished.
    MatchEvent advance_tick();

    // Advances until finished; returns every event produced by this call.
    std::vector<MatchEvent> run_to_completion();

    bool finished() const noexcept { return state_.finished(); }
    const MatchState &state() const noexcept { return state_; }
    // Direct state access for staging scenarios such as forced stamina before a tick.
    MatchState &state_mut() noexcept { return state_; }
    const BalanceConfig &config() const noexcept { return cfg_; }

    MatchSummary summary() const;

private:
    void update_phase();
    void apply_event(MatchEvent &ev);
    void advance_clock(Priority p);

    BalanceConfig cfg_;
    MatchState state_;
    ActionResolver resolver_;
    CommentaryGenerator commentary_;
};

} // namespace dball::engine

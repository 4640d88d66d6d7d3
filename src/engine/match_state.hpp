// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "engine/rng.hpp"
#include "engine/types.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dball::engine {

// Per-player accumulation over one match. Also used as the delta record carried by events.
struct PlayerMatchStats
{
    uint32_t plays{0};
    uint32_t rushing_attempts{0};
    int32_t rushing_yards{0};
    uint32_t breakaway_runs{0};
    uint32_t scores{0};
    uint32_t pass_attempts{0};
    uint32_t pass_completions{0};
    int32_t passing_yards{0};
    uint32_t catches{0};
    int32_t receiving_yards{0};
    uint32_t drops{0};
    uint32_t interceptions_thrown{0};
    uint32_t interceptions{0};
    uint32_t tackles{0};
    uint32_t power_tackles{0};
    uint32_t fumbles_lost{0};
    uint32_t fumbles_recovered{0};
    uint32_t kick_attempts{0};
    uint32_t kick_scores{0};
    double stamina_used{0.0};
    uint32_t ticks_on_field{0};

    PlayerMatchStats &operator+=(const PlayerMatchStats &o);
};

// Derived per side from the PlayerMatchStats of its roster.
struct TeamMatchStats
{
    uint32_t score{0};
    int32_t rushing_yards{0};
    int32_t passing_yards{0};
    uint32_t turnovers{0}; // ball lost to the opponent
    uint32_t tackles{0};
    uint64_t possession_ticks{0};
    uint32_t plays{0};
};

// Read-only input describing one rostered player.
struct RosterPlayer
{
    std::string id;
    std::string name;
    Role role{Role::Unknown};
    Race race{Race::Human};
    StatBlock base_stats{default_base_stats()}; // Stat::Stamina holds stamina capacity
    std::vector<std::string> skills; // opaque to the engine
    StatBlock bonuses; // additive modifiers by stat

    static StatBlock default_base_stats();
};

struct RosterSnapshot
{
    std::string team_id;
    std::string name;
    std::vector<RosterPlayer> players; // ordered; first six start unless starters is set
    std::optional<std::vector<std::string>> starters;
};

struct PlayerState
{
    std::string id;
    std::string name;
    Role role{Role::Unknown};
    Race race{Race::Human};
    StatBlock base_stats;
    std::vector<std::string> skills;
    bool on_field{false};
    int position{-1}; // on-field slot, -1 on the bench
    double current_stamina{0.0};
    double fatigue_penalty{0.0};
    StatBlock active_bonuses;
    PlayerMatchStats stats;

    double stamina_capacity() const noexcept { return base_stats[Stat::Stamina]; }
};

struct TeamState
{
    std::string team_id;
    std::string name;
    Side side{Side::Home};
    std::map<std::string, PlayerState> players;
    std::vector<std::string> on_field; // exactly kOnFieldCount ids, slot order
    uint64_t possession_ticks{0};

    // Throws std::out_of_range for ids outside the roster.
    PlayerState &player(const std::string &id) { return players.at(id); }
    const PlayerState &player(const std::string &id) const { return players.at(id); }

    // On-field ids filtered by role, in slot order.
    std::vector<std::string> on_field_with_role(Role r) const;
    uint32_t score() const;
};

// Whole-match mutable state; owned by one engine and touched from one thread.
struct MatchState
{
    MatchState(std::string id, double duration) : match_id(std::move(id)), max_time(duration), rng(match_id) {}

    std::string match_id;
    std::array<TeamState, 2> teams;
    double game_time{0.0};
    double max_time{2400.0};
    Side possession{Side::Home};
    GamePhase phase{GamePhase::Early};
    uint64_t tick{0};
    bool halftime_applied{false};
    DeterministicRng rng;

    TeamState &team(Side s) noexcept { return teams[static_cast<size_t>(s)]; }
    const TeamState &team(Side s) const noexcept { return teams[static_cast<size_t>(s)]; }
    TeamState &offense() noexcept { return team(possession); }
    const TeamState &offense() const noexcept { return team(possession); }
    const TeamState &defense() const noexcept { return team(opposite(possession)); }
    bool finished() const noexcept { return game_time >= max_time; }
};

// Validates both rosters and builds the initial state: full stamina, home in possession.
// fatigue_penalty is left at 0; refresh_fatigue() derives it once balance rules are known.
// Throws ConfigError for an empty match id, fewer than kOnFieldCount players, duplicate ids or an
// invalid starter list.
MatchState build_match_state(const RosterSnapshot &home, const RosterSnapshot &away, const std::string &match_id,
                             double max_time);

TeamMatchStats team_stats(const MatchState &state, Side side);

} // namespace dball::engine

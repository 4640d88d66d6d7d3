// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "engine/match_state.hpp"
#include "engine/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dball::engine {

struct PlayerStatDelta
{
    std::string player_id;
    Side side{Side::Home};
    PlayerMatchStats delta;
};

struct EventStats
{
    std::vector<PlayerStatDelta> players;
    bool turnover{false};
    bool possession_change{false};
};

// Outcome of a scramble for a dropped or fumbled ball.
struct LooseBall
{
    std::string lost_by;
    std::string recovered_by;
    Side recovered_side{Side::Home};
    bool offense_recovered{false};
};

struct RunPlay
{
    std::string carrier_id;
    int32_t yards{0};
    bool breakaway{false};
    bool scored{false};
};

struct PassPlay
{
    std::string passer_id;
    std::string receiver_id;
    std::string defender_id; // interceptor, empty otherwise
    int32_t yards{0};
    bool completed{false};
    bool deep{false};
    bool scored{false};
    bool dropped{false};
    bool intercepted{false};
    std::optional<LooseBall> loose_ball;
};

struct KickPlay
{
    std::string kicker_id;
    int32_t distance{0};
    bool scored{false};
};

struct DefensivePlay
{
    std::string defender_id;
    std::string carrier_id;
    bool tackled{false};
    bool power_tackle{false};
    bool fumble{false};
    int32_t yards{0}; // gained by the carrier on a missed tackle
    std::optional<LooseBall> loose_ball;
};

// Alternative order matches ActionKind.
using PlayDetail = std::variant<RunPlay, PassPlay, KickPlay, DefensivePlay>;

struct MatchEvent
{
    std::string id; // "<match id>:<tick>"
    uint64_t tick{0};
    double timestamp{0.0}; // game time when the play started
    EventType type{EventType::RoutinePlay};
    Priority priority{Priority::Standard};
    GamePhase phase{GamePhase::Early};
    Side offense{Side::Home};
    std::vector<std::string> involved;
    std::string description;
    EventStats stats;
    PlayDetail play;
    uint32_t home_score{0};
    uint32_t away_score{0};

    ActionKind kind() const noexcept { return static_cast<ActionKind>(play.index()); }

    // Delta record for a player, created on first use.
    PlayerMatchStats &delta_for(const std::string &player_id, Side side);
};

} // namespace dball::engine

// SPDX-License-Identifier: Apache-2.0
#include "engine/match_event.hpp"

#include <algorithm>

namespace dball::engine {

PlayerMatchStats &MatchEvent::delta_for(const std::string &player_id, Side side)
{
    for (auto &d : stats.players) {
        if (d.player_id == player_id && d.side == side)
            return d.delta;
    }
    if (std::find(involved.begin(), involved.end(), player_id) == involved.end())
        involved.push_back(player_id);
    stats.players.push_back(PlayerStatDelta{player_id, side, {}});
    return stats.players.back().delta;
}

} // namespace dball::engine

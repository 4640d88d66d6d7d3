// SPDX-License-Identifier: Apache-2.0
#include "engine/stamina.hpp"

#include <algorithm>

namespace dball::engine {

double fatigue_for(double stamina, const BalanceConfig &cfg) noexcept
{
    if (stamina >= cfg.fatigue_threshold)
        return 0.0;
    if (stamina <= 0.0)
        return cfg.max_fatigue_penalty;
    return (cfg.fatigue_threshold - stamina) / cfg.fatigue_threshold * cfg.max_fatigue_penalty;
}

void apply_stamina_tick(MatchState &state, const BalanceConfig &cfg)
{
    for (auto side : {Side::Home, Side::Away}) {
        auto &team = state.team(side);
        for (const auto &id : team.on_field) {
            auto &p = team.player(id);
            const auto &race = profile_for(cfg.races, p.race);
            const double cap = std::max(0.0, p.stamina_capacity());
            ++p.stats.ticks_on_field;

            if (race.regen && race.regen->chance > 0.0) {
                if (state.rng.next() < race.regen->chance)
                    p.current_stamina = std::min(cap, p.current_stamina + race.regen->amount);
            }

            double drain = cfg.base_stamina_drain;
            if (p.role == Role::Runner || p.role == Role::Passer)
                drain *= cfg.demanding_role_drain_multiplier;
            drain *= race.drain_multiplier;

            const double before = p.current_stamina;
            p.current_stamina = std::clamp(p.current_stamina - drain, 0.0, cap);
            if (before > p.current_stamina)
                p.stats.stamina_used += before - p.current_stamina;
            p.fatigue_penalty = fatigue_for(p.current_stamina, cfg);
        }
    }
}

void refresh_fatigue(MatchState &state, const BalanceConfig &cfg)
{
    for (auto &team : state.teams) {
        for (auto &[id, p] : team.players)
            p.fatigue_penalty = fatigue_for(p.current_stamina, cfg);
    }
}

void apply_recovery(MatchState &state, double amount, const BalanceConfig &cfg)
{
    if (amount <= 0.0)
        return;
    for (auto &team : state.teams) {
        for (auto &[id, p] : team.players)
            p.current_stamina = std::min(std::max(0.0, p.stamina_capacity()), p.current_stamina + amount);
    }
    refresh_fatigue(state, cfg);
}

} // namespace dball::engine

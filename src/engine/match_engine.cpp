// SPDX-License-Identifier: Apache-2.0
#include "engine/match_engine.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "engine/stamina.hpp"

#include <chrono>
#include <stdexcept>

namespace dball::engine {

namespace {

BalanceConfig validated(BalanceConfig cfg)
{
    try {
        validate(cfg);
    } catch (const ConfigError &e) {
        dball::metrics::sim().config_errors.fetch_add(1, std::memory_order_relaxed);
        dball::log::error("[match] invalid balance config: {}", e.what());
        throw;
    }
    return cfg;
}

MatchState checked_state(const RosterSnapshot &home, const RosterSnapshot &away, const std::string &match_id,
                         double duration)
{
    try {
        return build_match_state(home, away, match_id, duration);
    } catch (const ConfigError &e) {
        dball::metrics::sim().config_errors.fetch_add(1, std::memory_order_relaxed);
        dball::log::error("[match] rejected rosters for {}: {}", match_id, e.what());
        throw;
    }
}

} // namespace

MatchEngine::MatchEngine(const RosterSnapshot &home, const RosterSnapshot &away, const std::string &match_id,
                         BalanceConfig cfg, PhraseBank phrases)
    : cfg_(validated(std::move(cfg)))
    , state_(checked_state(home, away, match_id, cfg_.match_duration_sec))
    , resolver_(cfg_)
    , commentary_(std::move(phrases), cfg_.races)
{
    // Low-capacity players start the match already tired.
    refresh_fatigue(state_, cfg_);
    dball::metrics::sim().matches_started.fetch_add(1, std::memory_order_relaxed);
    dball::log::info("[match] start id={} home={} away={} duration={}s", match_id, home.team_id, away.team_id,
                     cfg_.match_duration_sec);
}

MatchEvent MatchEngine::advance_tick()
{
    if (finished())
        throw std::logic_error("advance_tick called after match '" + state_.match_id + "' finished");
    auto t0 = std::chrono::steady_clock::now();

    update_phase();
    const ActionKind kind = resolver_.select_action(state_.rng);
    MatchEvent ev = resolver_.resolve(kind, state_, state_.rng);
    ev.tick = ++state_.tick;
    ev.id = state_.match_id + ":" + std::to_string(ev.tick);
    ev.timestamp = state_.game_time;
    ev.phase = state_.phase;

    apply_event(ev);
    apply_stamina_tick(state_, cfg_);
    advance_clock(ev.priority);
    ev.description = commentary_.render(ev, state_, state_.rng);

    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count();
    dball::metrics::add_tick_duration(static_cast<uint64_t>(ns));
    dball::metrics::add_event(static_cast<int>(ev.priority), ev.type == EventType::Score, ev.stats.turnover);
    DBALL_LOG_EVERY_N(trace, 50, "[tick] match={} n={} t={} kind={} priority={} score={}-{}", state_.match_id,
                      ev.tick, state_.game_time, to_string(kind), to_string(ev.priority), ev.home_score,
                      ev.away_score);

    if (finished()) {
        dball::metrics::sim().matches_completed.fetch_add(1, std::memory_order_relaxed);
        dball::log::info("[match] end id={} ticks={} score={}-{}", state_.match_id, state_.tick, ev.home_score,
                         ev.away_score);
    }
    return ev;
}

std::vector<MatchEvent> MatchEngine::run_to_completion()
{
    std::vector<MatchEvent> events;
    while (!finished())
        events.push_back(advance_tick());
    return events;
}

void MatchEngine::update_phase()
{
    const double pct = state_.game_time / state_.max_time;
    if (pct < cfg_.middle_phase_at)
        state_.phase = GamePhase::Early;
    else if (pct < cfg_.late_phase_at)
        state_.phase = GamePhase::Middle;
    else if (pct < cfg_.clutch_phase_at)
        state_.phase = GamePhase::Late;
    else
        state_.phase = GamePhase::Clutch;
}

void MatchEngine::apply_event(MatchEvent &ev)
{
    for (const auto &d : ev.stats.players)
        state_.team(d.side).player(d.player_id).stats += d.delta;
    ++state_.team(ev.offense).possession_ticks;
    if (ev.stats.possession_change)
        state_.possession = opposite(state_.possession);
    ev.home_score = state_.team(Side::Home).score();
    ev.away_score = state_.team(Side::Away).score();
}

void MatchEngine::advance_clock(Priority p)
{
    const double before = state_.game_time;
    state_.game_time += cfg_.advance_for(p);
    const double half = state_.max_time / 2.0;
    if (!state_.halftime_applied && before < half && state_.game_time >= half) {
        state_.halftime_applied = true;
        if (cfg_.halftime_stamina_recovery > 0.0) {
            apply_recovery(state_, cfg_.halftime_stamina_recovery, cfg_);
            dball::log::debug("[match] halftime id={} recovery={}", state_.match_id, cfg_.halftime_stamina_recovery);
        }
    }
}

MatchSummary MatchEngine::summary() const
{
    MatchSummary s;
    s.match_id = state_.match_id;
    s.ticks = state_.tick;
    s.game_time = state_.game_time;
    s.finished = finished();
    for (auto side : {Side::Home, Side::Away}) {
        const auto &team = state_.team(side);
        const auto i = static_cast<size_t>(side);
        s.team_ids[i] = team.team_id;
        s.team_names[i] = team.name;
        s.teams[i] = team_stats(state_, side);
        for (const auto &[id, p] : team.players)
            s.players.push_back(PlayerSummary{id, p.name, side, p.stats});
    }
    return s;
}

} // namespace dball::engine

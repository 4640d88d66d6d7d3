// SPDX-License-Identifier: Apache-2.0
#include "wire/event_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <type_traits>
#include <variant>

namespace dball::wire {

namespace {

pb::Side side_pb(engine::Side s)
{
    return s == engine::Side::Home ? pb::SIDE_HOME : pb::SIDE_AWAY;
}

pb::EventType type_pb(engine::EventType t)
{
    switch (t) {
        case engine::EventType::RoutinePlay:
            return pb::EVENT_TYPE_ROUTINE_PLAY;
        case engine::EventType::Score:
            return pb::EVENT_TYPE_SCORE;
        case engine::EventType::Turnover:
            return pb::EVENT_TYPE_TURNOVER;
    }
    return pb::EVENT_TYPE_ROUTINE_PLAY;
}

void loose_ball_pb(const std::optional<engine::LooseBall> &in, pb::LooseBall *out)
{
    out->set_lost_by(in->lost_by);
    out->set_recovered_by(in->recovered_by);
    out->set_recovered_side(side_pb(in->recovered_side));
    out->set_offense_recovered(in->offense_recovered);
}

void team_pb(const engine::MatchSummary &in, engine::Side side, pb::TeamStats *out)
{
    const auto i = static_cast<size_t>(side);
    const auto &t = in.teams[i];
    out->set_team_id(in.team_ids[i]);
    out->set_name(in.team_names[i]);
    out->set_score(t.score);
    out->set_rushing_yards(t.rushing_yards);
    out->set_passing_yards(t.passing_yards);
    out->set_turnovers(t.turnovers);
    out->set_tackles(t.tackles);
    out->set_possession_ticks(t.possession_ticks);
    out->set_plays(t.plays);
}

} // namespace

void to_proto(const engine::PlayerMatchStats &in, pb::PlayerStats *out)
{
    out->set_plays(in.plays);
    out->set_rushing_attempts(in.rushing_attempts);
    out->set_rushing_yards(in.rushing_yards);
    out->set_breakaway_runs(in.breakaway_runs);
    out->set_scores(in.scores);
    out->set_pass_attempts(in.pass_attempts);
    out->set_pass_completions(in.pass_completions);
    out->set_passing_yards(in.passing_yards);
    out->set_catches(in.catches);
    out->set_receiving_yards(in.receiving_yards);
    out->set_drops(in.drops);
    out->set_interceptions_thrown(in.interceptions_thrown);
    out->set_interceptions(in.interceptions);
    out->set_tackles(in.tackles);
    out->set_power_tackles(in.power_tackles);
    out->set_fumbles_lost(in.fumbles_lost);
    out->set_fumbles_recovered(in.fumbles_recovered);
    out->set_kick_attempts(in.kick_attempts);
    out->set_kick_scores(in.kick_scores);
    out->set_stamina_used(in.stamina_used);
    out->set_ticks_on_field(in.ticks_on_field);
}

void to_proto(const engine::MatchEvent &in, pb::MatchEvent *out)
{
    out->set_id(in.id);
    out->set_tick(in.tick);
    out->set_timestamp(in.timestamp);
    out->set_type(type_pb(in.type));
    out->set_priority(static_cast<pb::Priority>(static_cast<int>(in.priority)));
    out->set_phase(static_cast<pb::GamePhase>(static_cast<int>(in.phase)));
    out->set_offense(side_pb(in.offense));
    for (const auto &id : in.involved)
        out->add_involved(id);
    out->set_description(in.description);
    for (const auto &d : in.stats.players) {
        auto *pd = out->add_player_stats();
        pd->set_player_id(d.player_id);
        pd->set_side(side_pb(d.side));
        to_proto(d.delta, pd->mutable_delta());
    }
    out->set_turnover(in.stats.turnover);
    out->set_possession_change(in.stats.possession_change);
    out->set_home_score(in.home_score);
    out->set_away_score(in.away_score);

    std::visit(
        [&](const auto &play) {
            using T = std::decay_t<decltype(play)>;
            if constexpr (std::is_same_v<T, engine::RunPlay>) {
                auto *r = out->mutable_run();
                r->set_carrier_id(play.carrier_id);
                r->set_yards(play.yards);
                r->set_breakaway(play.breakaway);
                r->set_scored(play.scored);
            } else if constexpr (std::is_same_v<T, engine::PassPlay>) {
                auto *p = out->mutable_pass();
                p->set_passer_id(play.passer_id);
                p->set_receiver_id(play.receiver_id);
                p->set_defender_id(play.defender_id);
                p->set_yards(play.yards);
                p->set_completed(play.completed);
                p->set_deep(play.deep);
                p->set_scored(play.scored);
                p->set_dropped(play.dropped);
                p->set_intercepted(play.intercepted);
                if (play.loose_ball)
                    loose_ball_pb(play.loose_ball, p->mutable_loose_ball());
            } else if constexpr (std::is_same_v<T, engine::KickPlay>) {
                auto *k = out->mutable_kick();
                k->set_kicker_id(play.kicker_id);
                k->set_distance(play.distance);
                k->set_scored(play.scored);
            } else {
                auto *d = out->mutable_defense();
                d->set_defender_id(play.defender_id);
                d->set_carrier_id(play.carrier_id);
                d->set_tackled(play.tackled);
                d->set_power_tackle(play.power_tackle);
                d->set_fumble(play.fumble);
                d->set_yards(play.yards);
                if (play.loose_ball)
                    loose_ball_pb(play.loose_ball, d->mutable_loose_ball());
            }
        },
        in.play);
}

void to_proto(const engine::MatchSummary &in, pb::MatchSummary *out)
{
    out->set_match_id(in.match_id);
    out->set_ticks(in.ticks);
    out->set_game_time(in.game_time);
    out->set_finished(in.finished);
    team_pb(in, engine::Side::Home, out->mutable_home());
    team_pb(in, engine::Side::Away, out->mutable_away());
    for (const auto &p : in.players) {
        auto *ps = out->add_players();
        ps->set_player_id(p.player_id);
        ps->set_name(p.name);
        ps->set_side(side_pb(p.side));
        to_proto(p.stats, ps->mutable_stats());
    }
}

pb::MatchHeader make_header(const engine::MatchState &state)
{
    pb::MatchHeader h;
    h.set_match_id(state.match_id);
    h.set_seed_hash(state.rng.seed());
    h.set_max_time(state.max_time);
    h.set_home_team_id(state.team(engine::Side::Home).team_id);
    h.set_home_team_name(state.team(engine::Side::Home).name);
    h.set_away_team_id(state.team(engine::Side::Away).team_id);
    h.set_away_team_name(state.team(engine::Side::Away).name);
    return h;
}

std::string serialize_event(const engine::MatchEvent &ev)
{
    pb::MatchEvent msg;
    to_proto(ev, &msg);
    std::string out;
    if (!msg.SerializeToString(&out))
        throw std::runtime_error("failed to serialize event " + ev.id);
    return out;
}

std::string to_json(const google::protobuf::Message &msg)
{
    google::protobuf::util::JsonPrintOptions opts;
    opts.preserve_proto_field_names = true;
    std::string out;
    auto st = google::protobuf::util::MessageToJsonString(msg, &out, opts);
    if (!st.ok())
        throw std::runtime_error("json conversion failed: " + st.ToString());
    return out;
}

} // namespace dball::wire

// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "dball_events.pb.h"
#include "engine/match_engine.hpp"
#include "engine/match_event.hpp"
#include "engine/match_state.hpp"

#include <google/protobuf/message.h>

#include <string>

namespace dball::wire {

void to_proto(const engine::PlayerMatchStats &in, pb::PlayerStats *out);
void to_proto(const engine::MatchEvent &in, pb::MatchEvent *out);
void to_proto(const engine::MatchSummary &in, pb::MatchSummary *out);
pb::MatchHeader make_header(const engine::MatchState &state);

// Deterministic binary encoding of one event (no map fields, so byte-stable across runs).
std::string serialize_event(const engine::MatchEvent &ev);

// Single-line JSON with proto field names. Throws std::runtime_error if conversion fails.
std::string to_json(const google::protobuf::Message &msg);

} // namespace dball::wire

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "engine/balance_config.hpp"
#include "engine/commentary.hpp"
#include "engine/match_engine.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dball::batch {

struct BatchResult
{
    std::string match_id;
    engine::MatchSummary summary;
    std::vector<engine::MatchEvent> events; // empty unless events were requested
};

// "<base>-<i>" for i in [0, count).
std::vector<std::string> batch_match_ids(const std::string &base, uint32_t count);

// One independent match as a coroutine: hops onto the scheduler's worker pool, then runs the
// engine to completion.
coro::task<BatchResult> simulate_match(std::shared_ptr<coro::io_scheduler> sched, engine::RosterSnapshot home,
                                       engine::RosterSnapshot away, std::string match_id, engine::BalanceConfig cfg,
                                       engine::PhraseBank phrases, bool keep_events);

// Runs every match concurrently and returns results in match_ids order. Each match owns its state
// and RNG, so results equal sequential simulation. ConfigError propagates from the first failing match.
std::vector<BatchResult> run_batch(std::shared_ptr<coro::io_scheduler> sched, const engine::RosterSnapshot &home,
                                   const engine::RosterSnapshot &away, const std::vector<std::string> &match_ids,
                                   const engine::BalanceConfig &cfg, const engine::PhraseBank &phrases,
                                   bool keep_events = false);

} // namespace dball::batch

// SPDX-License-Identifier: Apache-2.0
#include "batch/batch_runner.hpp"

#include "common/logger.hpp"

#include <chrono>

namespace dball::batch {

std::vector<std::string> batch_match_ids(const std::string &base, uint32_t count)
{
    std::vector<std::string> ids;
    ids.reserve(count);
    for (uint32_t i = 0; i < count; ++i)
        ids.push_back(base + "-" + std::to_string(i));
    return ids;
}

coro::task<BatchResult> simulate_match(std::shared_ptr<coro::io_scheduler> sched, engine::RosterSnapshot home,
                                       engine::RosterSnapshot away, std::string match_id, engine::BalanceConfig cfg,
                                       engine::PhraseBank phrases, bool keep_events)
{
    co_await sched->schedule();
    dball::log::match_scope tag(match_id);
    engine::MatchEngine eng(home, away, match_id, std::move(cfg), std::move(phrases));
    BatchResult result;
    result.match_id = match_id;
    while (!eng.finished()) {
        auto ev = eng.advance_tick();
        if (keep_events)
            result.events.push_back(std::move(ev));
    }
    result.summary = eng.summary();
    co_return result;
}

std::vector<BatchResult> run_batch(std::shared_ptr<coro::io_scheduler> sched, const engine::RosterSnapshot &home,
                                   const engine::RosterSnapshot &away, const std::vector<std::string> &match_ids,
                                   const engine::BalanceConfig &cfg, const engine::PhraseBank &phrases,
                                   bool keep_events)
{
    auto start = std::chrono::steady_clock::now();
    std::vector<coro::task<BatchResult>> tasks;
    tasks.reserve(match_ids.size());
    for (const auto &id : match_ids)
        tasks.emplace_back(simulate_match(sched, home, away, id, cfg, phrases, keep_events));

    auto completed = coro::sync_wait(coro::when_all(std::move(tasks)));
    std::vector<BatchResult> results;
    results.reserve(completed.size());
    for (auto &t : completed)
        results.push_back(std::move(t.return_value()));

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    dball::log::info("[batch] {} matches completed in {}ms", results.size(), ms);
    return results;
}

} // namespace dball::batch

// SPDX-License-Identifier: Apache-2.0
// Command-line match simulator: loads two rosters, runs one match (or a batch of independent
// matches on the coroutine scheduler) and prints the event stream and final statistics.
#include "batch/batch_runner.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "engine/balance_config.hpp"
#include "engine/commentary.hpp"
#include "engine/match_engine.hpp"
#include "roster/roster_loader.hpp"
#include "wire/event_codec.hpp"
#include "wire/event_log.hpp"

#include <coro/default_executor.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace {

struct SimOptions
{
    std::string home_path{"config/rosters/home.yaml"};
    std::string away_path{"config/rosters/away.yaml"};
    std::string balance_path{"config/balance.yaml"};
    std::string phrases_path{"config/commentary.yaml"};
    std::string match_id{"match-42"};
    std::string events_out;
    uint32_t batch{0};
    bool json{false};
    bool metrics{false};
    bool quiet{false};
};

void usage()
{
    std::cerr << "usage: dball_sim [--home FILE] [--away FILE] [--balance FILE] [--phrases FILE]\n"
                 "                 [--match-id ID] [--batch N] [--json] [--events-out FILE] [--metrics] [--quiet]\n";
}

void print_event_text(const dball::engine::MatchEvent &ev)
{
    std::cout << "[" << std::setw(4) << ev.tick << " " << std::setw(6) << std::fixed << std::setprecision(0)
              << ev.timestamp << "s] " << std::setw(9) << std::left << dball::engine::to_string(ev.priority)
              << std::right << " " << ev.home_score << "-" << ev.away_score << "  " << ev.description << "\n";
}

void print_summary_text(const dball::engine::MatchSummary &s)
{
    using dball::engine::Side;
    const auto &h = s.teams[static_cast<size_t>(Side::Home)];
    const auto &a = s.teams[static_cast<size_t>(Side::Away)];
    std::cout << "\nFinal: " << s.team_names[0] << " " << h.score << " - " << a.score << " " << s.team_names[1]
              << " (" << s.ticks << " ticks, " << s.game_time << "s)\n";
    for (auto side : {Side::Home, Side::Away}) {
        const auto &t = s.teams[static_cast<size_t>(side)];
        std::cout << "  " << s.team_names[static_cast<size_t>(side)] << ": rush=" << t.rushing_yards
                  << " pass=" << t.passing_yards << " turnovers=" << t.turnovers << " tackles=" << t.tackles
                  << " possession_ticks=" << t.possession_ticks << " plays=" << t.plays << "\n";
    }
    for (const auto &p : s.players) {
        if (p.stats.plays == 0 && p.stats.ticks_on_field == 0)
            continue;
        std::cout << "    " << std::setw(5) << dball::engine::to_string(p.side) << " " << std::setw(20) << std::left
                  << p.name << std::right << " plays=" << p.stats.plays << " rush=" << p.stats.rushing_yards
                  << " pass=" << p.stats.passing_yards << " rec=" << p.stats.receiving_yards
                  << " tkl=" << p.stats.tackles << " scores=" << p.stats.scores
                  << " stamina_used=" << std::setprecision(1) << p.stats.stamina_used << "\n";
    }
}

int run_single(const SimOptions &opt, const dball::engine::RosterSnapshot &home,
               const dball::engine::RosterSnapshot &away, const dball::engine::BalanceConfig &cfg,
               const dball::engine::PhraseBank &phrases)
{
    dball::log::match_scope tag(opt.match_id);
    dball::engine::MatchEngine eng(home, away, opt.match_id, cfg, phrases);
    std::unique_ptr<dball::wire::EventLogWriter> writer;
    if (!opt.events_out.empty()) {
        writer = std::make_unique<dball::wire::EventLogWriter>(opt.events_out);
        writer->write_header(eng.state());
    }
    while (!eng.finished()) {
        auto ev = eng.advance_tick();
        if (writer)
            writer->write_event(ev);
        if (opt.quiet)
            continue;
        if (opt.json) {
            dball::pb::MatchEvent msg;
            dball::wire::to_proto(ev, &msg);
            std::cout << dball::wire::to_json(msg) << "\n";
        } else {
            print_event_text(ev);
        }
    }
    auto summary = eng.summary();
    if (writer) {
        writer->write_summary(summary);
        writer->close();
        dball::log::info("Event log written: {} ({} bytes)", opt.events_out, writer->bytes_written());
    }
    if (opt.json) {
        dball::pb::MatchSummary msg;
        dball::wire::to_proto(summary, &msg);
        std::cout << dball::wire::to_json(msg) << "\n";
    } else {
        print_summary_text(summary);
    }
    return 0;
}

int run_many(const SimOptions &opt, const dball::engine::RosterSnapshot &home,
             const dball::engine::RosterSnapshot &away, const dball::engine::BalanceConfig &cfg,
             const dball::engine::PhraseBank &phrases)
{
    if (!opt.events_out.empty())
        dball::log::warn("--events-out is ignored in batch mode");
    auto scheduler = coro::default_executor::io_executor();
    auto ids = dball::batch::batch_match_ids(opt.match_id, opt.batch);
    auto results = dball::batch::run_batch(scheduler, home, away, ids, cfg, phrases);
    for (const auto &r : results) {
        if (opt.json) {
            dball::pb::MatchSummary msg;
            dball::wire::to_proto(r.summary, &msg);
            std::cout << dball::wire::to_json(msg) << "\n";
        } else {
            std::cout << r.match_id << ": " << r.summary.team_names[0] << " " << r.summary.teams[0].score << " - "
                      << r.summary.teams[1].score << " " << r.summary.team_names[1] << " (" << r.summary.ticks
                      << " ticks)\n";
        }
    }
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    SimOptions opt;
    bool balance_explicit = false;
    bool phrases_explicit = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--home" && i + 1 < argc) {
            opt.home_path = argv[++i];
        } else if (a == "--away" && i + 1 < argc) {
            opt.away_path = argv[++i];
        } else if (a == "--balance" && i + 1 < argc) {
            opt.balance_path = argv[++i];
            balance_explicit = true;
        } else if (a == "--phrases" && i + 1 < argc) {
            opt.phrases_path = argv[++i];
            phrases_explicit = true;
        } else if (a == "--match-id" && i + 1 < argc) {
            opt.match_id = argv[++i];
        } else if (a == "--batch" && i + 1 < argc) {
            try {
                opt.batch = static_cast<uint32_t>(std::stoul(argv[++i]));
            } catch (const std::exception &) {
                dball::log::warn("Invalid --batch value '{}', ignoring", argv[i]);
            }
        } else if (a == "--events-out" && i + 1 < argc) {
            opt.events_out = argv[++i];
        } else if (a == "--json") {
            opt.json = true;
        } else if (a == "--metrics") {
            opt.metrics = true;
        } else if (a == "--quiet") {
            opt.quiet = true;
        } else if (a == "--help" || a == "-h") {
            usage();
            return 0;
        } else {
            dball::log::warn("Unknown argument '{}'", a);
            usage();
            return 2;
        }
    }

    dball::log::init();
    int rc = 1;
    try {
        auto home = dball::roster::load_roster(opt.home_path);
        auto away = dball::roster::load_roster(opt.away_path);
        dball::engine::BalanceConfig cfg;
        if (balance_explicit || std::filesystem::exists(opt.balance_path))
            cfg = dball::engine::load_balance_config(opt.balance_path);
        auto phrases = (phrases_explicit || std::filesystem::exists(opt.phrases_path))
                           ? dball::engine::PhraseBank::load(opt.phrases_path)
                           : dball::engine::PhraseBank::built_in();
        rc = opt.batch > 0 ? run_many(opt, home, away, cfg, phrases) : run_single(opt, home, away, cfg, phrases);
    } catch (const YAML::Exception &ex) {
        dball::log::error("Failed to load configuration: {}", ex.what());
    } catch (const dball::engine::ConfigError &ex) {
        dball::log::error("Invalid configuration: {}", ex.what());
    } catch (const std::exception &ex) {
        dball::log::error("Simulation failed: {}", ex.what());
    }
    if (opt.metrics)
        std::cout << dball::metrics::render_text();
    std::cout.flush();
    dball::log::flush();
    return rc;
}

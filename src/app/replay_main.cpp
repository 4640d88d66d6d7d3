// SPDX-License-Identifier: Apache-2.0
// Prints a recorded event log: header, every event and the final summary.
#include "common/logger.hpp"
#include "wire/event_codec.hpp"
#include "wire/event_log.hpp"

#include <iostream>
#include <string>

namespace {

const char *priority_name(dball::pb::Priority p)
{
    switch (p) {
        case dball::pb::PRIORITY_CRITICAL:
            return "critical";
        case dball::pb::PRIORITY_IMPORTANT:
            return "important";
        case dball::pb::PRIORITY_STANDARD:
            return "standard";
        case dball::pb::PRIORITY_DOWNTIME:
            return "downtime";
        default:
            break;
    }
    return "?";
}

} // namespace

int main(int argc, char **argv)
{
    std::string path;
    bool json = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--json") {
            json = true;
        } else if (!a.empty() && a[0] != '-') {
            path = a;
        } else {
            dball::log::warn("Unknown argument '{}'", a);
        }
    }
    if (path.empty()) {
        std::cerr << "usage: dball_replay [--json] EVENT_LOG\n";
        return 2;
    }

    dball::log::init();
    int rc = 0;
    try {
        auto log = dball::wire::read_event_log(path);
        if (log.header) {
            const auto &h = *log.header;
            if (json)
                std::cout << dball::wire::to_json(h) << "\n";
            else
                std::cout << "Match " << h.match_id() << ": " << h.home_team_name() << " vs " << h.away_team_name()
                          << " (" << h.max_time() << "s)\n";
        }
        for (const auto &ev : log.events) {
            if (json)
                std::cout << dball::wire::to_json(ev) << "\n";
            else
                std::cout << "[" << ev.tick() << " " << ev.timestamp() << "s " << priority_name(ev.priority()) << "] "
                          << ev.home_score() << "-" << ev.away_score() << " " << ev.description() << "\n";
        }
        if (log.summary) {
            const auto &s = *log.summary;
            if (json)
                std::cout << dball::wire::to_json(s) << "\n";
            else
                std::cout << "Final: " << s.home().name() << " " << s.home().score() << " - " << s.away().score() << " "
                          << s.away().name() << " (" << s.ticks() << " ticks)\n";
        } else {
            dball::log::warn("Event log {} has no summary record (match incomplete?)", path);
        }
        if (log.truncated)
            rc = 1;
    } catch (const std::exception &ex) {
        dball::log::error("Failed to read event log: {}", ex.what());
        rc = 1;
    }
    std::cout.flush();
    dball::log::flush();
    return rc;
}

// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "dball_events.pb.h"
#include "engine/match_engine.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace dball::wire {

// Appends length-prefixed EventLogRecord frames to a file.
class EventLogWriter
{
public:
    // Throws std::runtime_error if the file cannot be opened.
    explicit EventLogWriter(const std::string &path);

    void write(const pb::EventLogRecord &rec);
    void write_header(const engine::MatchState &state);
    void write_event(const engine::MatchEvent &ev);
    void write_summary(const engine::MatchSummary &summary);
    void close();

    uint64_t bytes_written() const noexcept { return bytes_; }
    uint64_t records_written() const noexcept { return records_; }

private:
    std::string path_;
    std::ofstream out_;
    uint64_t bytes_{0};
    uint64_t records_{0};
};

struct EventLog
{
    std::optional<pb::MatchHeader> header;
    std::vector<pb::MatchEvent> events;
    std::optional<pb::MatchSummary> summary;
    bool truncated{false}; // trailing partial frame was ignored
};

// Throws std::runtime_error for unreadable files, oversized frames or unparseable records.
EventLog read_event_log(const std::string &path);

} // namespace dball::wire

// SPDX-License-Identifier: Apache-2.0
#include "wire/event_log.hpp"

#include "common/framing.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "wire/event_codec.hpp"

#include <iterator>
#include <stdexcept>

namespace dball::wire {

EventLogWriter::EventLogWriter(const std::string &path) : path_(path), out_(path, std::ios::binary | std::ios::trunc)
{
    if (!out_)
        throw std::runtime_error("cannot open event log for writing: " + path);
}

void EventLogWriter::write(const pb::EventLogRecord &rec)
{
    std::string payload;
    if (!rec.SerializeToString(&payload))
        throw std::runtime_error("failed to serialize event log record");
    auto frame = build_frame(payload);
    out_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    if (!out_)
        throw std::runtime_error("write failed: " + path_);
    bytes_ += frame.size();
    ++records_;
    dball::metrics::sim().event_log_bytes.fetch_add(frame.size(), std::memory_order_relaxed);
}

void EventLogWriter::write_header(const engine::MatchState &state)
{
    pb::EventLogRecord rec;
    *rec.mutable_header() = make_header(state);
    write(rec);
}

void EventLogWriter::write_event(const engine::MatchEvent &ev)
{
    pb::EventLogRecord rec;
    to_proto(ev, rec.mutable_event());
    write(rec);
}

void EventLogWriter::write_summary(const engine::MatchSummary &summary)
{
    pb::EventLogRecord rec;
    to_proto(summary, rec.mutable_summary());
    write(rec);
}

void EventLogWriter::close()
{
    if (!out_.is_open())
        return;
    out_.flush();
    out_.close();
    dball::log::debug("[eventlog] closed path={} records={} bytes={}", path_, records_, bytes_);
}

EventLog read_event_log(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot open event log: " + path);

    FrameParseState st;
    st.buffer.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());

    EventLog log;
    std::string payload;
    FrameStatus status;
    while ((status = next_frame(st, payload)) == FrameStatus::Ok) {
        pb::EventLogRecord rec;
        if (!rec.ParseFromString(payload))
            throw std::runtime_error("malformed record in event log: " + path);
        switch (rec.record_case()) {
            case pb::EventLogRecord::kHeader:
                log.header = rec.header();
                break;
            case pb::EventLogRecord::kEvent:
                log.events.push_back(rec.event());
                break;
            case pb::EventLogRecord::kSummary:
                log.summary = rec.summary();
                break;
            case pb::EventLogRecord::RECORD_NOT_SET:
                dball::log::warn("[eventlog] empty record skipped in {}", path);
                break;
        }
    }
    if (status == FrameStatus::Corrupt)
        throw std::runtime_error("oversized frame in event log: " + path);
    if (st.pending() > 0) {
        log.truncated = true;
        dball::log::warn("[eventlog] {} trailing bytes ignored in {}", st.pending(), path);
    }
    return log;
}

} // namespace dball::wire

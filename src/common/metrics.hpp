// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide simulation counters (atomics, no dynamic allocation). Batch runs update them from
// several worker threads, so every access is a relaxed atomic op.
#pragma once
#include "common/logger.hpp"

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace dball::metrics {

struct SimCounters
{
    std::atomic<uint64_t> matches_started{0};
    std::atomic<uint64_t> matches_completed{0};
    std::atomic<uint64_t> ticks_total{0};
    // Indexed by priority tier: 0 critical, 1 important, 2 standard, 3 downtime.
    static constexpr int PRIORITY_TIERS = 4;
    std::atomic<uint64_t> events_by_priority[PRIORITY_TIERS]{};
    std::atomic<uint64_t> scores_total{0};
    std::atomic<uint64_t> turnovers_total{0};
    std::atomic<uint64_t> config_errors{0};
    std::atomic<uint64_t> event_log_bytes{0};
    // Power-of-two buckets for tick compute time (base 1us) -> up to ~512us.
    static constexpr int TICK_BUCKETS = 10;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{};
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
};

inline SimCounters &sim()
{
    static SimCounters inst;
    return inst;
}

inline void add_tick_duration(uint64_t ns)
{
    auto &c = sim();
    c.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    c.tick_samples.fetch_add(1, std::memory_order_relaxed);
    constexpr uint64_t base = 1000; // 1us
    for (int i = 0; i < SimCounters::TICK_BUCKETS; ++i) {
        if (ns < (base << i)) {
            c.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    c.tick_hist[SimCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t approx_tick_p99()
{
    auto &c = sim();
    uint64_t total = c.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    constexpr uint64_t base = 1000;
    uint64_t cumulative = 0;
    for (int i = 0; i < SimCounters::TICK_BUCKETS; ++i) {
        cumulative += c.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return base << i;
    }
    return base << (SimCounters::TICK_BUCKETS - 1);
}

inline void add_event(int priority_tier, bool score, bool turnover)
{
    auto &c = sim();
    c.ticks_total.fetch_add(1, std::memory_order_relaxed);
    if (priority_tier >= 0 && priority_tier < SimCounters::PRIORITY_TIERS)
        c.events_by_priority[priority_tier].fetch_add(1, std::memory_order_relaxed);
    if (score)
        c.scores_total.fetch_add(1, std::memory_order_relaxed);
    if (turnover)
        c.turnovers_total.fetch_add(1, std::memory_order_relaxed);
}

// Prometheus text exposition of every counter.
inline std::string render_text()
{
    auto &c = sim();
    std::ostringstream oss;
    uint64_t samples = c.tick_samples.load(std::memory_order_relaxed);
    uint64_t avg_ns = samples ? c.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
    oss << "# TYPE dball_matches_started counter\n";
    oss << "dball_matches_started " << c.matches_started.load() << "\n";
    oss << "# TYPE dball_matches_completed counter\n";
    oss << "dball_matches_completed " << c.matches_completed.load() << "\n";
    oss << "# TYPE dball_ticks_total counter\n";
    oss << "dball_ticks_total " << c.ticks_total.load() << "\n";
    static const char *tier_names[SimCounters::PRIORITY_TIERS] = {"critical", "important", "standard", "downtime"};
    oss << "# TYPE dball_events_total counter\n";
    for (int i = 0; i < SimCounters::PRIORITY_TIERS; ++i)
        oss << "dball_events_total{priority=\"" << tier_names[i] << "\"} " << c.events_by_priority[i].load() << "\n";
    oss << "# TYPE dball_scores_total counter\n";
    oss << "dball_scores_total " << c.scores_total.load() << "\n";
    oss << "# TYPE dball_turnovers_total counter\n";
    oss << "dball_turnovers_total " << c.turnovers_total.load() << "\n";
    oss << "# TYPE dball_config_errors counter\n";
    oss << "dball_config_errors " << c.config_errors.load() << "\n";
    oss << "# TYPE dball_event_log_bytes counter\n";
    oss << "dball_event_log_bytes " << c.event_log_bytes.load() << "\n";
    oss << "# TYPE dball_log_lines_total counter\n";
    oss << "dball_log_lines_total{level=\"warn\"} " << dball::log::count(dball::log::level::warn) << "\n";
    oss << "dball_log_lines_total{level=\"error\"} " << dball::log::count(dball::log::level::error) << "\n";
    oss << "# TYPE dball_avg_tick_ns gauge\n";
    oss << "dball_avg_tick_ns " << avg_ns << "\n";
    oss << "# TYPE dball_p99_tick_ns gauge\n";
    oss << "dball_p99_tick_ns " << approx_tick_p99() << "\n";
    return oss.str();
}

} // namespace dball::metrics

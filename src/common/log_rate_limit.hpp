// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite rate-limited logging: emits every Nth invocation at the given level.
// Usage: DBALL_LOG_EVERY_N(trace, 50, "[tick] n={} t={}", tick, game_time);
// The counter is atomic because batch runs advance several engines on worker threads.
#define DBALL_LOG_EVERY_N(lvl, N, ...) \
    do { \
        static std::atomic<uint64_t> _dball_log_counter_##__LINE__{0}; \
        if (dball::log::enabled(dball::log::level::lvl) \
            && ((_dball_log_counter_##__LINE__.fetch_add(1, std::memory_order_relaxed) + 1) % (N)) == 0) { \
            dball::log::lvl(__VA_ARGS__); \
        } \
    } while (0)

// SPDX-License-Identifier: Apache-2.0
// unit_logger.cpp
// Placeholder formatting, level parsing, match tags, line counters and metrics text.
#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> g_lines;

void capture(int, const char *msg, void *)
{
    g_lines.emplace_back(msg);
}

} // namespace

int main()
{
    using dball::log::detail_format::tiny_format;
    assert(tiny_format("plain") == "plain");
    assert(tiny_format("a={} b={}", 1, std::string("x")) == "a=1 b=x");
    assert(tiny_format("t={}", 2.5) == "t=2.500");
    assert(tiny_format("{} {}", true, 'c') == "true c");
    assert(tiny_format("only {}", 1, 2, "three") == "only 1 2 three");
    assert(tiny_format("{} and {}", 7) == "7 and {}");

    using dball::log::level;
    using dball::log::detail::parse_level;
    assert(parse_level("TRACE") == level::trace);
    assert(parse_level("warning") == level::warn);
    assert(parse_level("err") == level::error);
    assert(parse_level("bogus") == level::info);

    // Synchronous mode from here on: every line reaches the sink before write() returns.
    dball::log::init();
    dball::log::flush();
    dball::log::set_callback(&capture, nullptr);
    dball::log::set_level(level::info);

    const auto warn_before = dball::log::count(level::warn);
    dball::log::debug("hidden {}", 1);
    dball::log::info("visible {}", 2);
    dball::log::warn("careful {}", "now");
    assert((g_lines == std::vector<std::string>{"visible 2", "careful now"}));
    assert(dball::log::count(level::warn) == warn_before + 1);
    assert(dball::log::count(level::debug) == 0);

    {
        dball::log::match_scope outer("m-1");
        assert(dball::log::detail::t_match_tag == "m-1");
        {
            dball::log::match_scope inner("m-2");
            assert(dball::log::detail::t_match_tag == "m-2");
        }
        assert(dball::log::detail::t_match_tag == "m-1");
    }
    assert(dball::log::detail::t_match_tag.empty());

    g_lines.clear();
    for (int i = 0; i < 10; ++i)
        DBALL_LOG_EVERY_N(info, 4, "every fourth {}", i);
    assert((g_lines == std::vector<std::string>{"every fourth 3", "every fourth 7"}));

    dball::metrics::add_event(0, true, false);
    dball::metrics::add_event(3, false, true);
    dball::metrics::add_tick_duration(1500);
    auto text = dball::metrics::render_text();
    assert(text.find("dball_ticks_total 2") != std::string::npos);
    assert(text.find("dball_events_total{priority=\"critical\"} 1") != std::string::npos);
    assert(text.find("dball_turnovers_total 1") != std::string::npos);
    assert(text.find("dball_log_lines_total{level=\"warn\"} 1") != std::string::npos);
    assert(dball::metrics::approx_tick_p99() == 2000);

    dball::log::set_callback(nullptr, nullptr);
    std::cout << "unit_logger OK" << std::endl;
    return 0;
}

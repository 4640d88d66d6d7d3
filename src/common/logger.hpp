// SPDX-License-Identifier: Apache-2.0
// Asynchronous line logger (header-only).
// Lines are formatted on the calling thread and handed to a background writer, so a match tick
// never waits on stderr. Features:
//  - Level filtering via DBALL_LOG_LEVEL (trace|debug|info|warn|error)
//  - JSON line mode via DBALL_LOG_JSON presence
//  - {} placeholder formatting
//  - Per-thread match tag (match_scope) so interleaved batch output stays attributable
//  - Per-level line counters and an optional sink callback (tests capture output through it)

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

namespace dball::log {

enum class level
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

inline constexpr size_t kLevelCount = 5;

namespace detail {

struct level_info
{
    const char *name;
    char tag;
};

inline constexpr std::array<level_info, kLevelCount> kLevels{{
    {"trace", 'T'},
    {"debug", 'D'},
    {"info", 'I'},
    {"warn", 'W'},
    {"error", 'E'},
}};

inline const level_info &info_of(level lv)
{
    auto i = static_cast<size_t>(lv);
    return kLevels[i < kLevelCount ? i : static_cast<size_t>(level::info)];
}

inline level parse_level(std::string_view s)
{
    std::string v;
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "warning")
        return level::warn;
    if (v == "err")
        return level::error;
    for (size_t i = 0; i < kLevelCount; ++i) {
        if (v == kLevels[i].name)
            return static_cast<level>(i);
    }
    return level::info;
}

struct line
{
    level lv;
    std::string tag; // match id active on the producing thread, may be empty
    std::string msg;
    std::chrono::system_clock::time_point ts;
};

using sink_fn = void (*)(int, const char *, void *);

struct state
{
    std::atomic<int> min_level{static_cast<int>(level::info)};
    std::atomic<bool> json{false};
    std::atomic<bool> started{false};
    std::atomic<bool> running{false};
    std::array<std::atomic<uint64_t>, kLevelCount> lines{};
    std::atomic<sink_fn> sink{nullptr};
    std::atomic<void *> sink_ud{nullptr};

    std::mutex q_mtx;
    std::condition_variable q_cv;
    std::deque<line> queue;
    std::mutex io_mtx;
    std::thread writer;
};

inline state &st()
{
    static state s;
    return s;
}

inline thread_local std::string t_match_tag;

} // namespace detail

namespace detail_format {

template <typename T>
inline void append_value(std::string &out, const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, bool>) {
        out += v ? "true" : "false";
    } else if constexpr (std::is_same_v<D, char>) {
        out.push_back(v);
    } else if constexpr (std::is_same_v<D, const char *> || std::is_same_v<D, char *>) {
        if (v)
            out += v;
    } else if constexpr (std::is_convertible_v<const T &, std::string_view>) {
        out += std::string_view(v);
    } else if constexpr (std::is_floating_point_v<D>) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << v;
        out += oss.str();
    } else if constexpr (std::is_arithmetic_v<D>) {
        out += std::to_string(v);
    } else {
        std::ostringstream oss;
        oss << v;
        out += oss.str();
    }
}

// Substitutes each {} with the next argument; surplus arguments are appended space-separated.
template <typename... Args>
inline std::string tiny_format(std::string_view fmt, const Args &...args)
{
    std::string out;
    out.reserve(fmt.size() + sizeof...(Args) * 8);
    size_t pos = 0;
    auto one = [&](const auto &value) {
        size_t p = fmt.find("{}", pos);
        if (p == std::string_view::npos) {
            out.push_back(' ');
        } else {
            out.append(fmt.substr(pos, p - pos));
            pos = p + 2;
        }
        append_value(out, value);
    };
    (one(args), ...);
    if (pos < fmt.size())
        out.append(fmt.substr(pos));
    return out;
}

} // namespace detail_format

namespace detail {

inline void write_json_string(std::ostream &os, std::string_view m)
{
    for (char c : m) {
        switch (c) {
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            case '\n':
                os << "\\n";
                break;
            case '\t':
                os << "\\t";
                break;
            default:
                os << c;
        }
    }
}

inline void emit(const line &l)
{
    auto &s = st();
    std::time_t tt = std::chrono::system_clock::to_time_t(l.ts);
    std::tm tm{};
    localtime_r(&tt, &tm);
    const auto &li = info_of(l.lv);
    {
        std::lock_guard lk(s.io_mtx);
        if (s.json.load(std::memory_order_relaxed)) {
            std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\"" << li.name
                      << "\"";
            if (!l.tag.empty()) {
                std::cerr << ",\"match\":\"";
                write_json_string(std::cerr, l.tag);
                std::cerr << "\"";
            }
            std::cerr << ",\"msg\":\"";
            write_json_string(std::cerr, l.msg);
            std::cerr << "\"}" << std::endl;
        } else {
            std::cerr << '[' << li.tag << ' ' << std::put_time(&tm, "%H:%M:%S") << "] ";
            if (!l.tag.empty())
                std::cerr << '{' << l.tag << "} ";
            std::cerr << l.msg << std::endl;
        }
    }
    if (auto cb = s.sink.load(std::memory_order_acquire))
        cb(static_cast<int>(l.lv), l.msg.c_str(), s.sink_ud.load(std::memory_order_relaxed));
}

inline void writer_loop()
{
    auto &s = st();
    std::unique_lock lk(s.q_mtx);
    for (;;) {
        s.q_cv.wait(lk, [&] { return !s.running.load(std::memory_order_acquire) || !s.queue.empty(); });
        if (s.queue.empty())
            return; // stopped and drained
        std::deque<line> batch;
        batch.swap(s.queue);
        lk.unlock();
        for (const auto &l : batch)
            emit(l);
        lk.lock();
    }
}

inline void stop()
{
    auto &s = st();
    if (!s.running.exchange(false, std::memory_order_acq_rel))
        return;
    s.q_cv.notify_all();
    if (s.writer.joinable())
        s.writer.join();
}

inline void start()
{
    auto &s = st();
    if (s.started.exchange(true, std::memory_order_acq_rel))
        return;
    if (const char *lv = std::getenv("DBALL_LOG_LEVEL"))
        s.min_level.store(static_cast<int>(parse_level(lv)), std::memory_order_relaxed);
    if (std::getenv("DBALL_LOG_JSON"))
        s.json.store(true, std::memory_order_relaxed);
    s.running.store(true, std::memory_order_release);
    s.writer = std::thread(writer_loop);
    std::atexit([] { stop(); });
}

} // namespace detail

inline void init()
{
    detail::start();
}

// Drains the queue and stops the writer thread. Later lines are written synchronously on the
// calling thread, which is what tests inspecting the sink callback rely on.
inline void flush()
{
    detail::stop();
}

inline void set_level(level lv) noexcept
{
    detail::st().min_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_level(std::string_view name) noexcept
{
    set_level(detail::parse_level(name));
}

inline void set_json(bool on) noexcept
{
    detail::st().json.store(on, std::memory_order_relaxed);
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::st().min_level.load(std::memory_order_relaxed);
}

inline void set_callback(void (*cb)(int, const char *, void *), void *ud) noexcept
{
    auto &s = detail::st();
    s.sink_ud.store(ud, std::memory_order_release);
    s.sink.store(cb, std::memory_order_release);
}

// Lines emitted at a level since process start (filtered-out lines are not counted).
inline uint64_t count(level lv) noexcept
{
    return detail::st().lines[static_cast<size_t>(lv)].load(std::memory_order_relaxed);
}

// Tags every line produced on this thread with a match id for the scope's lifetime.
class match_scope
{
public:
    explicit match_scope(std::string match_id) : prev_(std::exchange(detail::t_match_tag, std::move(match_id))) {}
    ~match_scope() { detail::t_match_tag = std::move(prev_); }
    match_scope(const match_scope &) = delete;
    match_scope &operator=(const match_scope &) = delete;

private:
    std::string prev_;
};

inline void write(level lv, std::string msg)
{
    if (!enabled(lv))
        return;
    auto &s = detail::st();
    detail::start();
    s.lines[static_cast<size_t>(lv)].fetch_add(1, std::memory_order_relaxed);
    detail::line l{lv, detail::t_match_tag, std::move(msg), std::chrono::system_clock::now()};
    if (s.running.load(std::memory_order_acquire)) {
        {
            std::lock_guard lk(s.q_mtx);
            s.queue.push_back(std::move(l));
        }
        s.q_cv.notify_one();
    } else {
        // writer stopped (flush() or exit): write inline
        detail::emit(l);
    }
}

template <typename... Args>
inline void trace(const char *fmt, const Args &...args)
{
    if (enabled(level::trace))
        write(level::trace, detail_format::tiny_format(fmt, args...));
}

template <typename... Args>
inline void debug(const char *fmt, const Args &...args)
{
    if (enabled(level::debug))
        write(level::debug, detail_format::tiny_format(fmt, args...));
}

template <typename... Args>
inline void info(const char *fmt, const Args &...args)
{
    if (enabled(level::info))
        write(level::info, detail_format::tiny_format(fmt, args...));
}

template <typename... Args>
inline void warn(const char *fmt, const Args &...args)
{
    if (enabled(level::warn))
        write(level::warn, detail_format::tiny_format(fmt, args...));
}

template <typename... Args>
inline void error(const char *fmt, const Args &...args)
{
    if (enabled(level::error))
        write(level::error, detail_format::tiny_format(fmt, args...));
}

} // namespace dball::log

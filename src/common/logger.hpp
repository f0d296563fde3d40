// SPDX-License-Identifier: Apache-2.0
// Asynchronous structured logger (header-only).
// A background thread drains a queue so the tick loop never blocks on the output stream.
//  - Level filtering via S2D_LOG_LEVEL (trace|debug|info|warn|error) or set_level()
//  - JSON lines via S2D_LOG_JSON presence or set_json()
//  - Output goes to stderr unless redirected with set_output()

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace s2d::log {

enum class level
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

namespace detail {

struct record
{
    level lv;
    std::string msg;
    std::chrono::system_clock::time_point ts;
};

struct state
{
    std::atomic<int> min_level{static_cast<int>(level::info)};
    std::atomic<bool> level_pinned{false}; // set_level() wins over the environment
    std::atomic<bool> json{false};
    std::atomic<bool> started{false};
    std::atomic<bool> running{false};
    std::mutex queue_mtx;
    std::condition_variable queue_cv;
    std::deque<record> queue;
    std::mutex out_mtx;
    std::ostream *out{&std::cerr}; // guarded by out_mtx
    std::thread consumer;
};

inline state &instance()
{
    static state s;
    return s;
}

constexpr std::array<std::string_view, 5> kLevelNames{"trace", "debug", "info", "warn", "error"};
constexpr std::array<char, 5> kLevelTags{'T', 'D', 'I', 'W', 'E'};

inline int parse_level(std::string_view s)
{
    std::string v;
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "warning")
        return static_cast<int>(level::warn);
    if (v == "err")
        return static_cast<int>(level::error);
    for (size_t i = 0; i < kLevelNames.size(); ++i)
        if (v == kLevelNames[i])
            return static_cast<int>(i);
    return static_cast<int>(level::info);
}

inline void append_escaped(std::ostream &os, std::string_view m)
{
    for (char c : m) {
        switch (c) {
            case '"':
            case '\\':
                os << '\\' << c;
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

inline void emit(const record &r)
{
    auto &st = instance();
    std::time_t tt = std::chrono::system_clock::to_time_t(r.ts);
    std::tm tm{};
    localtime_r(&tt, &tm);
    const auto idx = static_cast<size_t>(r.lv);
    std::lock_guard lk(st.out_mtx);
    std::ostream &os = *st.out;
    if (st.json.load(std::memory_order_relaxed)) {
        os << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\"" << kLevelNames[idx]
           << "\",\"msg\":\"";
        append_escaped(os, r.msg);
        os << "\"}" << std::endl;
    } else {
        os << '[' << kLevelTags[idx] << ' ' << std::put_time(&tm, "%H:%M:%S") << "] " << r.msg << std::endl;
    }
}

inline void drain_loop()
{
    auto &st = instance();
    std::unique_lock lk(st.queue_mtx);
    for (;;) {
        st.queue_cv.wait(lk, [&] { return !st.running.load(std::memory_order_acquire) || !st.queue.empty(); });
        std::deque<record> batch;
        batch.swap(st.queue);
        const bool stopping = !st.running.load(std::memory_order_acquire);
        lk.unlock();
        for (auto &r : batch)
            emit(r);
        if (stopping)
            return;
        lk.lock();
    }
}

// Flushes everything queued and joins the consumer. Later writes are emitted synchronously.
inline void shutdown()
{
    auto &st = instance();
    {
        std::lock_guard lk(st.queue_mtx);
        if (!st.running.exchange(false, std::memory_order_acq_rel))
            return;
    }
    st.queue_cv.notify_all();
    if (st.consumer.joinable())
        st.consumer.join();
}

inline void start()
{
    auto &st = instance();
    if (st.started.exchange(true, std::memory_order_acq_rel))
        return;
    if (const char *lvl = std::getenv("S2D_LOG_LEVEL")) {
        if (!st.level_pinned.load(std::memory_order_relaxed))
            st.min_level.store(parse_level(lvl), std::memory_order_relaxed);
    }
    if (std::getenv("S2D_LOG_JSON"))
        st.json.store(true, std::memory_order_relaxed);
    st.running.store(true, std::memory_order_release);
    st.consumer = std::thread(drain_loop);
    std::atexit([] { shutdown(); });
}

} // namespace detail

// {} placeholder formatting. Floats print with three decimals; surplus arguments are appended space-separated.
namespace detail_format {
template <typename T>
inline std::string to_string_any(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_same_v<T, const char *> || std::is_same_v<T, char *>)
        return v ? std::string(v) : std::string();
    else if constexpr (std::is_convertible_v<const T &, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_floating_point_v<D>) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << v;
        return oss.str();
    } else if constexpr (std::is_arithmetic_v<D>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

template <typename... Args>
inline std::string tiny_format(std::string_view fmt, const Args &...args)
{
    std::array<std::string, sizeof...(Args)> values{to_string_any(args)...};
    std::string out;
    size_t pos = 0;
    size_t idx = 0;
    for (; idx < values.size(); ++idx) {
        size_t p = fmt.find("{}", pos);
        if (p == std::string_view::npos)
            break;
        out.append(fmt.substr(pos, p - pos));
        out += values[idx];
        pos = p + 2;
    }
    out.append(fmt.substr(pos));
    for (; idx < values.size(); ++idx) {
        out.push_back(' ');
        out += values[idx];
    }
    return out;
}
} // namespace detail_format

inline void init()
{
    detail::start();
}

// Explicit level from configuration. Environment S2D_LOG_LEVEL still applies when this is never called.
inline void set_level(std::string_view name)
{
    auto &st = detail::instance();
    st.min_level.store(detail::parse_level(name), std::memory_order_relaxed);
    st.level_pinned.store(true, std::memory_order_relaxed);
}

inline void set_json(bool on) noexcept
{
    detail::instance().json.store(on, std::memory_order_relaxed);
}

// The stream must outlive every write that can reach it; pass std::cerr to restore the default.
inline void set_output(std::ostream &os)
{
    auto &st = detail::instance();
    std::lock_guard lk(st.out_mtx);
    st.out = &os;
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::instance().min_level.load(std::memory_order_relaxed);
}

inline void write(level lv, std::string msg)
{
    if (!enabled(lv))
        return;
    detail::start();
    auto &st = detail::instance();
    detail::record r{lv, std::move(msg), std::chrono::system_clock::now()};
    {
        std::lock_guard lk(st.queue_mtx);
        if (st.running.load(std::memory_order_acquire)) {
            st.queue.push_back(std::move(r));
            st.queue_cv.notify_one();
            return;
        }
    }
    detail::emit(r);
}

template <typename... Args>
inline void trace(std::string_view fmt, const Args &...args)
{
    if (enabled(level::trace))
        write(level::trace, detail_format::tiny_format(fmt, args...));
}

template <typename... Args>
inline void debug(std::string_view fmt, const Args &...args)
{
    if (enabled(level::debug))
        write(level::debug, detail_format::tiny_format(fmt, args...));
}

template <typename... Args>
inline void info(std::string_view fmt, const Args &...args)
{
    if (enabled(level::info))
        write(level::info, detail_format::tiny_format(fmt, args...));
}

template <typename... Args>
inline void warn(std::string_view fmt, const Args &...args)
{
    if (enabled(level::warn))
        write(level::warn, detail_format::tiny_format(fmt, args...));
}

template <typename... Args>
inline void error(std::string_view fmt, const Args &...args)
{
    if (enabled(level::error))
        write(level::error, detail_format::tiny_format(fmt, args...));
}

} // namespace s2d::log

// SPDX-License-Identifier: Apache-2.0
// Asynchronous structured logger (header-only).
// A dedicated background thread drains a shared queue so the command consumer
// and connection coroutines never block on stderr. Provides:
//  - Level filtering via BLOB_LOG_LEVEL (trace|debug|info|warn|error)
//  - JSON lines via BLOB_LOG_JSON presence
//  - "{}" placeholder formatting

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
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace blob::log {

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

inline std::atomic<int> g_level{static_cast<int>(level::info)};
inline std::atomic<bool> g_json{false};
inline std::atomic<bool> g_started{false};
inline std::atomic<bool> g_running{false};
inline std::mutex g_q_mtx;
inline std::condition_variable g_q_cv;
inline std::deque<record> g_queue;
inline std::mutex g_io_mtx;
inline std::thread g_thread;

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::trace:
            return "trace";
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

inline char level_tag(level lv)
{
    switch (lv) {
        case level::trace:
            return 'T';
        case level::debug:
            return 'D';
        case level::info:
            return 'I';
        case level::warn:
            return 'W';
        case level::error:
            return 'E';
    }
    return 'I';
}

inline level parse_level(std::string_view s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return level::trace;
    if (v == "debug")
        return level::debug;
    if (v == "warn" || v == "warning")
        return level::warn;
    if (v == "error" || v == "err")
        return level::error;
    return level::info;
}

template <typename T>
inline std::string to_text(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, std::string>)
        return v;
    else if constexpr (std::is_same_v<D, const char *> || std::is_same_v<D, char *>)
        return v ? std::string(v) : std::string();
    else if constexpr (std::is_convertible_v<T, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_floating_point_v<D>) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed, std::ios::floatfield);
        oss.precision(3);
        oss << v;
        return oss.str();
    } else if constexpr (std::is_arithmetic_v<D>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

// Substitutes each "{}" in order; surplus arguments are appended space-separated.
template <typename... Args>
inline std::string format(std::string_view fmt, Args &&...args)
{
    if constexpr (sizeof...(Args) == 0) {
        return std::string(fmt);
    } else {
        std::array<std::string, sizeof...(Args)> values{to_text(std::forward<Args>(args))...};
        std::string out;
        out.reserve(fmt.size() + values.size() * 8);
        size_t pos = 0;
        size_t idx = 0;
        while (idx < values.size()) {
            size_t p = fmt.find("{}", pos);
            if (p == std::string_view::npos)
                break;
            out.append(fmt.substr(pos, p - pos));
            out += values[idx++];
            pos = p + 2;
        }
        out.append(fmt.substr(pos));
        for (; idx < values.size(); ++idx) {
            out.push_back(' ');
            out += values[idx];
        }
        return out;
    }
}

inline void emit(const record &r)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(r.ts);
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::lock_guard lk(g_io_mtx);
    if (g_json.load(std::memory_order_relaxed)) {
        std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\""
                  << level_name(r.lv) << "\",\"msg\":\"";
        for (char c : r.msg) {
            if (c == '"' || c == '\\')
                std::cerr << '\\';
            std::cerr << c;
        }
        std::cerr << "\"}\n";
    } else {
        char buf[16];
        std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
        std::cerr << '[' << level_tag(r.lv) << ' ' << buf << "] " << r.msg << '\n';
    }
    std::cerr.flush();
}

inline void writer_loop()
{
    while (true) {
        std::deque<record> batch;
        {
            std::unique_lock lk(g_q_mtx);
            g_q_cv.wait(lk, [] { return !g_running.load(std::memory_order_acquire) || !g_queue.empty(); });
            if (!g_running.load(std::memory_order_acquire) && g_queue.empty())
                return;
            batch.swap(g_queue);
        }
        for (auto &r : batch)
            emit(r);
    }
}

inline void stop()
{
    {
        // Flipped under the queue lock so no producer can push after the writer's last drain.
        std::lock_guard lk(g_q_mtx);
        if (!g_running.exchange(false, std::memory_order_acq_rel))
            return;
    }
    g_q_cv.notify_all();
    if (g_thread.joinable())
        g_thread.join();
}

inline void start()
{
    if (g_started.exchange(true, std::memory_order_acq_rel))
        return;
    if (const char *lvl = std::getenv("BLOB_LOG_LEVEL"))
        g_level.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
    if (std::getenv("BLOB_LOG_JSON"))
        g_json.store(true, std::memory_order_relaxed);
    g_running.store(true, std::memory_order_release);
    g_thread = std::thread([] { writer_loop(); });
    std::atexit([] { stop(); });
}
} // namespace detail

inline void init()
{
    detail::start();
}

// Flushes pending records and joins the writer thread.
inline void shutdown()
{
    detail::stop();
}

inline void set_level(level lv) noexcept
{
    detail::g_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::g_level.load(std::memory_order_relaxed);
}

inline void write(level lv, std::string msg)
{
    if (!enabled(lv))
        return;
    detail::start();
    detail::record r{lv, std::move(msg), std::chrono::system_clock::now()};
    bool queued = false;
    {
        std::lock_guard lk(detail::g_q_mtx);
        if (detail::g_running.load(std::memory_order_acquire)) {
            detail::g_queue.push_back(std::move(r));
            queued = true;
        }
    }
    if (queued)
        detail::g_q_cv.notify_one();
    else
        detail::emit(r); // writer already stopped: write synchronously
}

template <typename... Args>
inline void trace(std::string_view fmt, Args &&...args)
{
    if (enabled(level::trace))
        write(level::trace, detail::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void debug(std::string_view fmt, Args &&...args)
{
    if (enabled(level::debug))
        write(level::debug, detail::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void info(std::string_view fmt, Args &&...args)
{
    if (enabled(level::info))
        write(level::info, detail::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void warn(std::string_view fmt, Args &&...args)
{
    if (enabled(level::warn))
        write(level::warn, detail::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void error(std::string_view fmt, Args &&...args)
{
    if (enabled(level::error))
        write(level::error, detail::format(fmt, std::forward<Args>(args)...));
}

} // namespace blob::log

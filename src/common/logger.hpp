// SPDX-License-Identifier: Apache-2.0
// Asynchronous structured logger (header-only).
// Callers format and enqueue; one background thread writes records to stderr.
//  - Level filtering via FLYIN_LOG_LEVEL (debug|info|warn|error)
//  - JSON lines via FLYIN_LOG_JSON presence
//  - Optional app id prefix via FLYIN_LOG_APP_ID (several tasks may share one pod log)
//  - Optional sink callback, invoked on the writer thread for every emitted record
//  - flush() blocks until everything enqueued so far has been written

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace flyin::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

using sink_fn = std::function<void(level, const std::string &)>;

namespace detail {

struct level_entry
{
    level lv;
    const char *name;
    char tag;
};

inline constexpr level_entry k_levels[] = {
    {level::debug, "debug", 'D'},
    {level::info, "info", 'I'},
    {level::warn, "warn", 'W'},
    {level::error, "error", 'E'},
};

inline const level_entry &entry(level lv)
{
    return k_levels[static_cast<int>(lv)];
}

// Unknown names fall back to info.
inline level level_from_name(std::string_view name)
{
    std::string lower;
    for (char c : name)
        lower.push_back(static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c));
    if (lower == "warning")
        return level::warn;
    if (lower == "err")
        return level::error;
    for (const auto &e : k_levels) {
        if (lower == e.name)
            return e.lv;
    }
    return level::info;
}

inline void append_json_string(std::string &out, std::string_view s)
{
    for (char c : s) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\t') {
            out += "\\t";
        } else if (static_cast<unsigned char>(c) < 0x20) {
            char esc[8];
            std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
            out += esc;
        } else {
            out.push_back(c);
        }
    }
}

template <typename T>
inline void append_value(std::string &out, const T &v)
{
    using U = std::decay_t<T>;
    if constexpr (std::is_same_v<U, bool>) {
        out += v ? "true" : "false";
    } else if constexpr (std::is_same_v<U, const char *> || std::is_same_v<U, char *>) {
        if (v)
            out += v;
    } else if constexpr (std::is_convertible_v<const T &, std::string_view>) {
        out += std::string_view(v);
    } else if constexpr (std::is_integral_v<U>) {
        out += std::to_string(v);
    } else if constexpr (std::is_floating_point_v<U>) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.3f", static_cast<double>(v));
        out += buf;
    } else {
        std::ostringstream os;
        os << v;
        out += os.str();
    }
}

// "{}" placeholders take the arguments in order; arguments without a placeholder are appended
// after the text, separated by spaces.
template <typename... Args>
inline std::string format(std::string_view fmt, const Args &...args)
{
    std::string out;
    out.reserve(fmt.size() + 16 * sizeof...(Args));
    size_t pos = 0;
    auto substitute = [&](const auto &value) {
        size_t hole = fmt.find("{}", pos);
        if (hole == std::string_view::npos) {
            out.append(fmt.substr(pos));
            pos = fmt.size();
            out.push_back(' ');
        } else {
            out.append(fmt.substr(pos, hole - pos));
            pos = hole + 2;
        }
        append_value(out, value);
    };
    (substitute(args), ...);
    out.append(fmt.substr(pos));
    return out;
}

struct record
{
    level lv;
    std::chrono::system_clock::time_point when;
    std::string text;
};

// Process-wide backend. Never destroyed so that late log calls from other threads stay valid;
// the writer thread is stopped from an atexit handler instead.
class backend
{
public:
    static backend &instance()
    {
        static backend *b = new backend();
        return *b;
    }

    std::atomic<int> threshold{static_cast<int>(level::info)};
    std::atomic<bool> json{false};

    void ensure_started()
    {
        if (m_started.load(std::memory_order_acquire))
            return;
        std::lock_guard lk(m_queue_mtx);
        if (m_started.load(std::memory_order_relaxed))
            return;
        if (const char *lvl = std::getenv("FLYIN_LOG_LEVEL"))
            threshold.store(static_cast<int>(level_from_name(lvl)), std::memory_order_relaxed);
        if (std::getenv("FLYIN_LOG_JSON"))
            json.store(true, std::memory_order_relaxed);
        if (const char *app = std::getenv("FLYIN_LOG_APP_ID")) {
            std::lock_guard out_lk(m_out_mtx);
            m_app_id = app;
        }
        m_accepting = true;
        m_worker = std::thread([this] { run(); });
        m_started.store(true, std::memory_order_release);
        std::atexit([] { backend::instance().stop(); });
    }

    void push(level lv, std::string text)
    {
        record r{lv, std::chrono::system_clock::now(), std::move(text)};
        {
            std::lock_guard lk(m_queue_mtx);
            if (m_accepting) {
                m_pending.push_back(std::move(r));
                ++m_pushed;
                m_queue_cv.notify_one();
                return;
            }
        }
        // writer already stopped (process exit): write synchronously
        emit(r);
    }

    void drain()
    {
        if (!m_started.load(std::memory_order_acquire))
            return;
        std::unique_lock lk(m_queue_mtx);
        const uint64_t target = m_pushed;
        m_drained_cv.wait(lk, [&] { return m_emitted >= target || !m_accepting; });
    }

    void stop()
    {
        {
            std::lock_guard lk(m_queue_mtx);
            if (!m_accepting)
                return;
            m_accepting = false;
        }
        m_queue_cv.notify_all();
        if (m_worker.joinable())
            m_worker.join();
    }

    void set_sink(sink_fn fn)
    {
        std::lock_guard lk(m_out_mtx);
        m_sink = std::move(fn);
    }

private:
    backend() = default;

    void run()
    {
        std::vector<record> batch;
        for (;;) {
            {
                std::unique_lock lk(m_queue_mtx);
                m_queue_cv.wait(lk, [this] { return !m_accepting || !m_pending.empty(); });
                if (m_pending.empty())
                    break; // stopping and nothing left
                batch.swap(m_pending);
            }
            for (const auto &r : batch)
                emit(r);
            {
                std::lock_guard lk(m_queue_mtx);
                m_emitted += batch.size();
            }
            batch.clear();
            m_drained_cv.notify_all();
        }
        m_drained_cv.notify_all();
    }

    void emit(const record &r)
    {
        std::time_t secs = std::chrono::system_clock::to_time_t(r.when);
        std::tm local{};
        localtime_r(&secs, &local);
        int millis =
            static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(r.when.time_since_epoch()).count() % 1000);
        const auto &e = entry(r.lv);

        std::lock_guard lk(m_out_mtx);
        std::string line;
        line.reserve(r.text.size() + 64);
        if (json.load(std::memory_order_relaxed)) {
            char ts[40];
            std::snprintf(
                ts,
                sizeof(ts),
                "%04d-%02d-%02dT%02d:%02d:%02d.%03d",
                local.tm_year + 1900,
                local.tm_mon + 1,
                local.tm_mday,
                local.tm_hour,
                local.tm_min,
                local.tm_sec,
                millis);
            line += "{\"ts\":\"";
            line += ts;
            line += "\",\"level\":\"";
            line += e.name;
            line += '"';
            if (!m_app_id.empty()) {
                line += ",\"app\":\"";
                append_json_string(line, m_app_id);
                line += '"';
            }
            line += ",\"msg\":\"";
            append_json_string(line, r.text);
            line += "\"}";
        } else {
            char ts[24];
            std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min, local.tm_sec, millis);
            if (!m_app_id.empty()) {
                line += m_app_id;
                line += ' ';
            }
            line += '[';
            line += e.tag;
            line += ' ';
            line += ts;
            line += "] ";
            line += r.text;
        }
        std::cerr << line << std::endl;
        if (m_sink)
            m_sink(r.lv, r.text);
    }

    std::atomic<bool> m_started{false};
    std::mutex m_queue_mtx;
    std::condition_variable m_queue_cv;
    std::condition_variable m_drained_cv;
    std::vector<record> m_pending; // guarded by m_queue_mtx
    uint64_t m_pushed{0}; // guarded by m_queue_mtx
    uint64_t m_emitted{0}; // guarded by m_queue_mtx
    bool m_accepting{false}; // guarded by m_queue_mtx
    std::thread m_worker;

    std::mutex m_out_mtx;
    std::string m_app_id; // guarded by m_out_mtx
    sink_fn m_sink; // guarded by m_out_mtx
};

} // namespace detail

// Reads the FLYIN_LOG_* environment and starts the writer. Called implicitly by the first record.
inline void init()
{
    detail::backend::instance().ensure_started();
}

inline void set_level(level lv) noexcept
{
    detail::backend::instance().threshold.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_level(const std::string &name)
{
    set_level(detail::level_from_name(name));
}

inline void set_json(bool on) noexcept
{
    detail::backend::instance().json.store(on, std::memory_order_relaxed);
}

inline void set_sink(sink_fn fn)
{
    detail::backend::instance().set_sink(std::move(fn));
}

// Starts the backend first so that FLYIN_LOG_LEVEL applies to the very first record.
inline bool enabled(level lv)
{
    auto &b = detail::backend::instance();
    b.ensure_started();
    return static_cast<int>(lv) >= b.threshold.load(std::memory_order_relaxed);
}

inline void write(level lv, std::string_view msg)
{
    if (!enabled(lv))
        return;
    detail::backend::instance().push(lv, std::string(msg));
}

inline void flush()
{
    detail::backend::instance().drain();
}

inline void debug(std::string_view m)
{
    write(level::debug, m);
}

inline void info(std::string_view m)
{
    write(level::info, m);
}

inline void warn(std::string_view m)
{
    write(level::warn, m);
}

inline void error(std::string_view m)
{
    write(level::error, m);
}

// Formatting is skipped entirely when the level is filtered out.
template <typename... Args>
inline void debug(const char *fmt, const Args &...args)
{
    if (enabled(level::debug))
        write(level::debug, detail::format(fmt, args...));
}

template <typename... Args>
inline void info(const char *fmt, const Args &...args)
{
    if (enabled(level::info))
        write(level::info, detail::format(fmt, args...));
}

template <typename... Args>
inline void warn(const char *fmt, const Args &...args)
{
    if (enabled(level::warn))
        write(level::warn, detail::format(fmt, args...));
}

template <typename... Args>
inline void error(const char *fmt, const Args &...args)
{
    if (enabled(level::error))
        write(level::error, detail::format(fmt, args...));
}

} // namespace flyin::log

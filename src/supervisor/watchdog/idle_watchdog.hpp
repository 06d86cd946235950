// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "supervisor/heartbeat/heartbeat_monitor.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

namespace flyin::wd {

// Polls a HeartbeatMonitor from a coroutine on the io_scheduler and calls on_idle exactly once
// when the idle time reaches the threshold. A zero threshold disables the watchdog.
class IdleWatchdog
{
public:
    using idle_callback = std::function<void(std::chrono::milliseconds idle_for)>;

    static constexpr std::chrono::milliseconds never{0};
    // Upper bound on how long stop() can go unnoticed by the polling coroutine.
    static constexpr std::chrono::milliseconds stop_check_slice{50};

    IdleWatchdog(std::shared_ptr<coro::io_scheduler> scheduler, const hb::HeartbeatMonitor &monitor);
    ~IdleWatchdog();

    IdleWatchdog(const IdleWatchdog &) = delete;
    IdleWatchdog &operator=(const IdleWatchdog &) = delete;

    // Returns false when disabled (threshold == never), already started, or the scheduler refused the task.
    bool start(std::chrono::milliseconds threshold, std::chrono::milliseconds poll_interval, idle_callback on_idle);

    // Sets threshold/interval/callback without spawning the polling coroutine; poll_once() then drives
    // the watchdog (simulated time). Same rejection rules as start().
    bool arm(std::chrono::milliseconds threshold, std::chrono::milliseconds poll_interval, idle_callback on_idle);

    // Idempotent. Does not wait for the polling coroutine (safe from inside on_idle); the destructor joins.
    void stop() noexcept;

    // One synchronous check; returns true if this call fired on_idle.
    bool poll_once();

    bool active() const noexcept { return m_started.load() && !m_stop.load() && !m_fired.load(); }
    bool fired() const noexcept { return m_fired.load(); }
    std::chrono::milliseconds threshold() const noexcept { return m_threshold; }

private:
    // Owned jointly by the watchdog and its coroutine so the join handshake never touches a dead object.
    struct loop_state
    {
        std::mutex mtx;
        std::condition_variable cv;
        bool running{false};
    };

    coro::task<void> poll_loop(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<loop_state> st);
    void join();

    std::shared_ptr<coro::io_scheduler> m_scheduler;
    const hb::HeartbeatMonitor &m_monitor;
    std::chrono::milliseconds m_threshold{never};
    std::chrono::milliseconds m_poll_interval{std::chrono::seconds(60)};
    idle_callback m_on_idle;
    std::atomic<bool> m_started{false};
    std::atomic<bool> m_stop{false};
    std::atomic<bool> m_fired{false};
    std::shared_ptr<loop_state> m_loop;
};

} // namespace flyin::wd

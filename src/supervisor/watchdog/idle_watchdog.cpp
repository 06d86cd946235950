// SPDX-License-Identifier: Apache-2.0
#include "supervisor/watchdog/idle_watchdog.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>

namespace flyin::wd {

IdleWatchdog::IdleWatchdog(std::shared_ptr<coro::io_scheduler> scheduler, const hb::HeartbeatMonitor &monitor)
    : m_scheduler(std::move(scheduler)), m_monitor(monitor), m_loop(std::make_shared<loop_state>())
{}

IdleWatchdog::~IdleWatchdog()
{
    stop();
    join();
}

bool IdleWatchdog::arm(
    std::chrono::milliseconds threshold, std::chrono::milliseconds poll_interval, idle_callback on_idle)
{
    if (threshold <= never) {
        flyin::log::info("[wd] idle watchdog disabled (max idle = never)");
        return false;
    }
    if (poll_interval <= std::chrono::milliseconds(0)) {
        flyin::log::error("[wd] invalid poll interval {}ms", poll_interval.count());
        return false;
    }
    if (m_started.exchange(true)) {
        flyin::log::warn("[wd] start ignored: watchdog already started");
        return false;
    }
    m_threshold = threshold;
    m_poll_interval = poll_interval;
    m_on_idle = std::move(on_idle);
    return true;
}

bool IdleWatchdog::start(
    std::chrono::milliseconds threshold, std::chrono::milliseconds poll_interval, idle_callback on_idle)
{
    if (!arm(threshold, poll_interval, std::move(on_idle)))
        return false;
    {
        std::lock_guard lk(m_loop->mtx);
        m_loop->running = true;
    }
    if (!m_scheduler->spawn(poll_loop(m_scheduler, m_loop))) {
        std::lock_guard lk(m_loop->mtx);
        m_loop->running = false;
        flyin::log::error("[wd] scheduler refused the polling task");
        return false;
    }
    flyin::log::info("[wd] started threshold={}ms poll={}ms", m_threshold.count(), m_poll_interval.count());
    return true;
}

void IdleWatchdog::stop() noexcept
{
    m_stop.store(true);
}

void IdleWatchdog::join()
{
    std::unique_lock lk(m_loop->mtx);
    m_loop->cv.wait(lk, [this] { return !m_loop->running; });
}

bool IdleWatchdog::poll_once()
{
    if (m_stop.load() || m_fired.load() || m_threshold <= never)
        return false;
    metrics::session().watchdog_polls.fetch_add(1, std::memory_order_relaxed);
    auto idle = m_monitor.time_since_last_activity();
    FLYIN_LOG_EVERY_N(debug, 10, "[wd] idle={}ms threshold={}ms", idle.count(), m_threshold.count());
    if (idle < m_threshold)
        return false;
    // exactly once, even if a synchronous poll races the coroutine
    if (m_fired.exchange(true))
        return false;
    metrics::session().idle_fires.fetch_add(1, std::memory_order_relaxed);
    flyin::log::warn("[wd] idle for {}ms (threshold {}ms)", idle.count(), m_threshold.count());
    if (m_on_idle)
        m_on_idle(idle);
    return true;
}

coro::task<void> IdleWatchdog::poll_loop(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<loop_state> st)
{
    co_await scheduler->schedule();
    using clock = std::chrono::steady_clock;
    auto next_poll = clock::now() + m_poll_interval;
    while (!m_stop.load() && !m_fired.load()) {
        auto now = clock::now();
        if (now < next_poll) {
            // sleep in short slices so stop() is honoured promptly
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(next_poll - now);
            co_await scheduler->yield_for(std::clamp(left, std::chrono::milliseconds(1), stop_check_slice));
            continue;
        }
        next_poll += m_poll_interval;
        if (poll_once())
            break;
    }
    {
        std::lock_guard lk(st->mtx);
        st->running = false;
        st->cv.notify_all();
    }
    co_return;
}

} // namespace flyin::wd

// SPDX-License-Identifier: Apache-2.0
#include "supervisor/heartbeat/heartbeat_monitor.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace flyin::hb {

HeartbeatMonitor::HeartbeatMonitor(std::string path, clock_fn clock)
    : m_path(std::move(path)), m_clock(clock ? std::move(clock) : clock_fn([] { return wall_clock::now(); }))
{
    m_started_at = m_clock();
}

void HeartbeatMonitor::restart_idle_clock()
{
    m_started_at = m_clock();
}

bool HeartbeatMonitor::record_activity() const
{
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(m_clock().time_since_epoch()).count();
    std::string tmp = m_path + ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            flyin::log::warn("[hb] cannot open {} for writing: {}", tmp, std::strerror(errno));
            return false;
        }
        out << now_ms << '\n';
        out.flush();
        if (!out) {
            flyin::log::warn("[hb] write to {} failed", tmp);
            std::remove(tmp.c_str());
            return false;
        }
    }
    if (std::rename(tmp.c_str(), m_path.c_str()) != 0) {
        flyin::log::warn("[hb] rename {} -> {} failed: {}", tmp, m_path, std::strerror(errno));
        std::remove(tmp.c_str());
        return false;
    }
    metrics::session().heartbeat_writes.fetch_add(1, std::memory_order_relaxed);
    return true;
}

HeartbeatMonitor::read_status HeartbeatMonitor::read_record(wall_clock::time_point &out, std::string &detail) const
{
    int fd = ::open(m_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT)
            return read_status::missing;
        detail = std::strerror(errno);
        return read_status::invalid;
    }
    char buf[64];
    std::string text;
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0) {
            detail = std::strerror(errno);
            ::close(fd);
            return read_status::invalid;
        }
        if (n == 0 || text.size() > 256)
            break;
        text.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
        text.pop_back();
    if (text.empty()) {
        detail = "empty record";
        return read_status::invalid;
    }
    int64_t ms = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), ms);
    if (ec != std::errc() || ptr != text.data() + text.size() || ms < 0) {
        detail = "malformed timestamp '" + text.substr(0, 32) + "'";
        return read_status::invalid;
    }
    out = wall_clock::time_point(std::chrono::milliseconds(ms));
    return read_status::ok;
}

std::optional<wall_clock::time_point> HeartbeatMonitor::last_activity() const
{
    wall_clock::time_point tp;
    std::string detail;
    if (read_record(tp, detail) == read_status::ok)
        return tp;
    return std::nullopt;
}

std::chrono::milliseconds HeartbeatMonitor::time_since_last_activity() const
{
    auto now = m_clock();
    wall_clock::time_point last;
    std::string detail;
    switch (read_record(last, detail)) {
        case read_status::ok:
            last = std::max(last, m_started_at);
            break;
        case read_status::missing:
            // never connected yet: idle since the session started
            last = m_started_at;
            break;
        case read_status::invalid:
            metrics::session().heartbeat_read_errors.fetch_add(1, std::memory_order_relaxed);
            flyin::log::warn("[hb] heartbeat {} unreadable ({}); assuming active", m_path, detail);
            return std::chrono::milliseconds(0);
    }
    if (now <= last)
        return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - last);
}

bool record_activity_at(const std::string &path)
{
    return HeartbeatMonitor(path).record_activity();
}

} // namespace flyin::hb

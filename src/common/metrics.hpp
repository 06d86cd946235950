// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Session counters (atomics, no dynamic allocation). Dumped as one JSON log line at shutdown.
#pragma once
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace flyin::metrics {

struct SessionCounters
{
    // Watchdog
    std::atomic<uint64_t> watchdog_polls{0};
    std::atomic<uint64_t> idle_fires{0};
    std::atomic<uint64_t> heartbeat_read_errors{0};
    std::atomic<uint64_t> heartbeat_writes{0};
    // Hooks
    std::atomic<uint64_t> hooks_run{0};
    std::atomic<uint64_t> hook_failures{0};
    // Extensions
    std::atomic<uint64_t> extensions_installed{0};
    std::atomic<uint64_t> extensions_failed{0};
    // Processes
    std::atomic<uint64_t> processes_launched{0};
    std::atomic<uint64_t> launch_failures{0};
    std::atomic<uint64_t> forced_kills{0};
    // Session lifecycle
    std::atomic<uint64_t> sessions_started{0};
    std::atomic<uint64_t> task_failures_captured{0};
};

inline SessionCounters &session()
{
    static SessionCounters inst;
    return inst;
}

inline void reset()
{
    auto &c = session();
    c.watchdog_polls.store(0, std::memory_order_relaxed);
    c.idle_fires.store(0, std::memory_order_relaxed);
    c.heartbeat_read_errors.store(0, std::memory_order_relaxed);
    c.heartbeat_writes.store(0, std::memory_order_relaxed);
    c.hooks_run.store(0, std::memory_order_relaxed);
    c.hook_failures.store(0, std::memory_order_relaxed);
    c.extensions_installed.store(0, std::memory_order_relaxed);
    c.extensions_failed.store(0, std::memory_order_relaxed);
    c.processes_launched.store(0, std::memory_order_relaxed);
    c.launch_failures.store(0, std::memory_order_relaxed);
    c.forced_kills.store(0, std::memory_order_relaxed);
    c.sessions_started.store(0, std::memory_order_relaxed);
    c.task_failures_captured.store(0, std::memory_order_relaxed);
}

// Single-line JSON object, e.g. {"metric":"session","watchdog_polls":12,...}
inline std::string to_json(const char *metric_name)
{
    auto &c = session();
    std::ostringstream j;
    j << "{\"metric\":\"" << metric_name << '"';
    j << ",\"watchdog_polls\":" << c.watchdog_polls.load(std::memory_order_relaxed);
    j << ",\"idle_fires\":" << c.idle_fires.load(std::memory_order_relaxed);
    j << ",\"heartbeat_read_errors\":" << c.heartbeat_read_errors.load(std::memory_order_relaxed);
    j << ",\"heartbeat_writes\":" << c.heartbeat_writes.load(std::memory_order_relaxed);
    j << ",\"hooks_run\":" << c.hooks_run.load(std::memory_order_relaxed);
    j << ",\"hook_failures\":" << c.hook_failures.load(std::memory_order_relaxed);
    j << ",\"extensions_installed\":" << c.extensions_installed.load(std::memory_order_relaxed);
    j << ",\"extensions_failed\":" << c.extensions_failed.load(std::memory_order_relaxed);
    j << ",\"processes_launched\":" << c.processes_launched.load(std::memory_order_relaxed);
    j << ",\"launch_failures\":" << c.launch_failures.load(std::memory_order_relaxed);
    j << ",\"forced_kills\":" << c.forced_kills.load(std::memory_order_relaxed);
    j << ",\"sessions_started\":" << c.sessions_started.load(std::memory_order_relaxed);
    j << ",\"task_failures_captured\":" << c.task_failures_captured.load(std::memory_order_relaxed);
    j << '}';
    return j.str();
}

} // namespace flyin::metrics

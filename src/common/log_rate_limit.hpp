// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite rate-limited logging macro.
// Emits a log line on the first and then every Nth invocation at the given level.
// Usage: FLYIN_LOG_EVERY_N(debug, 10, "[wd] idle={}ms", idle_ms);
// The watchdog poll runs for the whole session lifetime; logging every poll floods pod logs.
#define FLYIN_LOG_EVERY_N(level, N, ...) \
    do { \
        static std::atomic<uint64_t> _flyin_log_counter{0}; \
        if ((_flyin_log_counter.fetch_add(1, std::memory_order_relaxed) % (N)) == 0) { \
            flyin::log::level(__VA_ARGS__); \
        } \
    } while (0)

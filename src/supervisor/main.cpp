// SPDX-License-Identifier: Apache-2.0
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "supervisor/config/session_config.hpp"
#include "supervisor/heartbeat/heartbeat_monitor.hpp"
#include "supervisor/process/process_launcher.hpp"
#include "supervisor/session/command_task.hpp"
#include "supervisor/session/session_supervisor.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace flyin {
std::atomic_bool g_shutdown{false};
}

static void handle_signal(int)
{
    // async-signal context: only the flag; the supervisor logs when it observes it
    flyin::g_shutdown.store(true);
}

static void usage()
{
    std::cerr << "usage: flyin_session [config.yaml] [--max-idle <s>] [--run-task-first] [--task <cmd>]\n"
                 "                     [--duration <s>]\n"
                 "       flyin_session --record-activity <heartbeat-path>\n";
}

int main(int argc, char **argv)
{
    std::string config_path = "config/session.yaml";
    bool config_given = false;
    bool cli_run_task_first = false;
    int cli_max_idle = -1;
    int cli_duration = -1;
    std::string cli_task;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--record-activity" && i + 1 < argc) {
            // used by the connection tracker: one heartbeat, then exit
            return flyin::hb::record_activity_at(argv[++i]) ? 0 : 1;
        } else if (a == "--run-task-first") {
            cli_run_task_first = true;
        } else if (a == "--max-idle" && i + 1 < argc) {
            try {
                cli_max_idle = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                flyin::log::warn("Invalid --max-idle value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                cli_duration = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                flyin::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (a == "--task" && i + 1 < argc) {
            cli_task = argv[++i];
        } else if (a == "-h" || a == "--help") {
            usage();
            return 0;
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
            config_given = true;
        } else {
            usage();
            return 2;
        }
    }

    flyin::cfg::SessionConfig cfg;
    try {
        if (config_given || std::getenv("FLYIN_CONFIG") == nullptr)
            cfg = flyin::cfg::load_config(config_path);
        else
            cfg = flyin::cfg::load_config(std::getenv("FLYIN_CONFIG"));
        if (cli_max_idle < -1 || cli_duration < -1)
            throw flyin::ConfigError("negative durations are not allowed");
        if (cli_max_idle >= 0)
            cfg.max_idle_seconds = static_cast<uint32_t>(cli_max_idle);
        if (cli_duration >= 0)
            cfg.deadline_seconds = static_cast<uint32_t>(cli_duration);
        if (!cli_task.empty())
            cfg.task_command = cli_task;
        if (cli_run_task_first || std::getenv("FLYIN_RUN_TASK_FIRST"))
            cfg.run_task_first = true;
        flyin::cfg::validate(cfg);
    } catch (const flyin::ConfigError &ex) {
        flyin::log::error("Failed to load config: {}", ex.what());
        flyin::log::flush();
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Do not override an explicit FLYIN_LOG_LEVEL from the environment.
    if (!cfg.log_level.empty() && std::getenv("FLYIN_LOG_LEVEL") == nullptr)
        flyin::log::set_level(cfg.log_level);
    if (cfg.log_json)
        flyin::log::set_json(true);
    flyin::log::init();
    flyin::log::info("flyin session supervisor starting (version: {} sha:{})", FLYIN_VERSION, FLYIN_GIT_SHA);
    if (!cfg.container_image.empty())
        flyin::log::info("Container image: {}", cfg.container_image);
    if (cfg.max_idle_seconds > 0)
        flyin::log::info("Idle timeout: {}s (heartbeat {})", cfg.max_idle_seconds, cfg.heartbeat_path);
    else
        flyin::log::info("Idle timeout disabled");
    if (cfg.deadline_seconds > 0)
        flyin::log::info("Session deadline: {}s", cfg.deadline_seconds);

    auto launcher = flyin::proc::make_posix_launcher();
    auto scheduler = coro::default_executor::io_executor();
    int rc = 0;
    try {
        flyin::session::SessionSupervisor sup(cfg, *launcher, scheduler);
        sup.set_external_cancel(&flyin::g_shutdown);
        auto result = sup.run(flyin::session::make_command_task(*launcher, cfg));
        if (result.task.ran && !result.task.ok)
            flyin::log::warn("Task failed and was inspected interactively: {}", result.task.error);
        flyin::log::info("Session ended: {}", flyin::session::to_string(result.reason));
    } catch (const flyin::HookError &ex) {
        flyin::log::error("Session aborted: {}", ex.what());
        rc = 3;
    } catch (const flyin::ProcessLaunchError &ex) {
        flyin::log::error("Session aborted: {}", ex.what());
        rc = 4;
    } catch (const flyin::TaskExecutionError &ex) {
        flyin::log::error("Task failed: {}", ex.what());
        rc = ex.exit_code() > 0 ? ex.exit_code() : 1;
    } catch (const flyin::SessionError &ex) {
        flyin::log::error("Session failed: {}", ex.what());
        rc = 1;
    } catch (const std::exception &ex) {
        flyin::log::error("Task failed: {}", ex.what());
        rc = 1;
    }
    flyin::log::info("{}", flyin::metrics::to_json("session_final"));
    flyin::log::info("Shutdown complete.");
    flyin::log::flush();
    return rc;
}

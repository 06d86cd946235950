// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "supervisor/config/session_config.hpp"
#include "supervisor/process/process_launcher.hpp"
#include "supervisor/session/session_supervisor.hpp"

#include <chrono>

namespace flyin::session {

// Wraps cfg.task_command as a task body: runs it through the launcher, raises TaskExecutionError on a
// non-zero exit and stops the command (SIGTERM, then SIGKILL after the grace period) once should_stop
// reports a stop request. Empty when no command is configured.
TaskBody make_command_task(
    proc::IProcessLauncher &launcher,
    const cfg::SessionConfig &cfg,
    std::chrono::milliseconds check_interval = std::chrono::milliseconds(100));

} // namespace flyin::session

// SPDX-License-Identifier: Apache-2.0
#include "supervisor/session/command_task.hpp"

#include "common/errors.hpp"
#include "common/logger.hpp"

#include <optional>
#include <string>

namespace flyin::session {

TaskBody make_command_task(
    proc::IProcessLauncher &launcher, const cfg::SessionConfig &cfg, std::chrono::milliseconds check_interval)
{
    if (cfg.task_command.empty())
        return {};
    return [&launcher,
            command = cfg.task_command,
            dir = cfg.working_dir,
            grace = cfg.grace_period(),
            check_interval](const StopCheck &should_stop) {
        flyin::log::info("[task] running: {}", command);
        auto handle = launcher.launch(proc::shell_command(command, dir));
        std::optional<int> code;
        while (!(code = handle->wait(check_interval))) {
            if (should_stop && should_stop()) {
                flyin::log::warn("[task] stop requested, terminating pid={}", handle->pid());
                handle->send_signal(proc::StopSignal::Graceful);
                if (!handle->wait(grace)) {
                    handle->send_signal(proc::StopSignal::Kill);
                    handle->wait(std::chrono::seconds(5));
                }
                throw TaskExecutionError("task interrupted by stop request");
            }
        }
        if (*code != 0)
            throw TaskExecutionError("task command exited with code " + std::to_string(*code), *code);
        flyin::log::info("[task] completed");
    };
}

} // namespace flyin::session

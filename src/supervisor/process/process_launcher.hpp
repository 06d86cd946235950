// SPDX-License-Identifier: Apache-2.0
// process_launcher.hpp
// Narrow process launch abstraction. The POSIX implementation forks/execs the child into its own
// process group so that signals reach the code server and everything it spawned.
#pragma once

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace flyin::proc {

enum class StopSignal
{
    Graceful, // SIGTERM
    Kill // SIGKILL
};

struct LaunchSpec
{
    std::vector<std::string> argv; // argv[0] resolved through PATH
    std::string working_dir; // empty = inherit
    std::vector<std::pair<std::string, std::string>> env; // added/overridden on top of the parent environment
};

class IProcessHandle
{
public:
    virtual ~IProcessHandle() = default;
    virtual pid_t pid() const = 0;
    virtual bool is_alive() = 0;
    // Returns false when the process is already gone.
    virtual bool send_signal(StopSignal kind) = 0;
    // Waits up to timeout; returns the exit code (128+signo when killed by a signal) or nullopt if still running.
    virtual std::optional<int> wait(std::chrono::milliseconds timeout) = 0;
    virtual std::optional<int> exit_code() const = 0;
};

class IProcessLauncher
{
public:
    virtual ~IProcessLauncher() = default;
    // Throws flyin::ProcessLaunchError when the process cannot be started.
    virtual std::unique_ptr<IProcessHandle> launch(const LaunchSpec &spec) = 0;
};

std::unique_ptr<IProcessLauncher> make_posix_launcher();

// Helpers shared by hooks, extension installs and command tasks.
LaunchSpec shell_command(const std::string &command, const std::string &working_dir = {});
std::string describe(const LaunchSpec &spec);

// Launches, waits up to timeout and kills on expiry. Returns exit code, or nullopt on timeout.
std::optional<int> run_to_completion(IProcessLauncher &launcher, const LaunchSpec &spec, std::chrono::milliseconds timeout);

} // namespace flyin::proc

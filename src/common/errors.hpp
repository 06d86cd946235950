// SPDX-License-Identifier: Apache-2.0
// Fatal session errors. Non-fatal problems (post hook, extension install, heartbeat read)
// are reported through outcome structs and the log instead.
#pragma once

#include <stdexcept>
#include <string>

namespace flyin {

class SessionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Invalid configuration; raised before the session leaves Initializing.
class ConfigError : public SessionError
{
public:
    using SessionError::SessionError;
};

// Pre-execute hook failed; the server is never launched.
class HookError : public SessionError
{
public:
    HookError(std::string hook, const std::string &detail)
        : SessionError("hook '" + hook + "' failed: " + detail), m_hook(std::move(hook))
    {}

    const std::string &hook() const noexcept { return m_hook; }

private:
    std::string m_hook;
};

// fork/exec of the server or a helper command failed.
class ProcessLaunchError : public SessionError
{
public:
    using SessionError::SessionError;
};

// Task body failed (command-based tasks raise this on non-zero exit).
class TaskExecutionError : public SessionError
{
public:
    TaskExecutionError(const std::string &what, int exit_code = -1) : SessionError(what), m_exit_code(exit_code) {}

    int exit_code() const noexcept { return m_exit_code; }

private:
    int m_exit_code;
};

} // namespace flyin

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "supervisor/config/session_config.hpp"
#include "supervisor/extensions/extension_installer.hpp"
#include "supervisor/heartbeat/heartbeat_monitor.hpp"
#include "supervisor/hooks/hook_runner.hpp"
#include "supervisor/process/process_launcher.hpp"
#include "supervisor/watchdog/idle_watchdog.hpp"

#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flyin::session {

enum class SessionState
{
    Initializing,
    Running,
    AwaitingIdleCheck, // running, waiting for idle / cancellation / process exit
    Terminating,
    Terminated
};

enum class TerminationReason
{
    None,
    IdleTimeout,
    Cancelled,
    DeadlineExceeded,
    ProcessExited,
    TaskCompleted,
    TaskFailed,
    StartupFailed
};

const char *to_string(SessionState s) noexcept;
const char *to_string(TerminationReason r) noexcept;

// Running and AwaitingIdleCheck both mean the interactive server is up.
inline bool is_running(SessionState s) noexcept
{
    return s == SessionState::Running || s == SessionState::AwaitingIdleCheck;
}

// Result of the wrapped task body. In triage mode a failure is captured with continue_session=true
// instead of being rethrown.
struct TaskOutcome
{
    bool ran{false};
    bool ok{true};
    std::string error;
    bool continue_session{false};
};

struct SessionResult
{
    SessionState final_state{SessionState::Initializing};
    TerminationReason reason{TerminationReason::None};
    hooks::HookOutcome pre;
    hooks::HookOutcome post;
    std::vector<ext::ExtensionResult> extensions;
    TaskOutcome task;
    std::optional<int> server_exit_code;
    std::string startup_error;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

// One-shot termination request shared by the watchdog, cancel() and the supervision loop.
// The first reason wins; later requests are ignored.
class TerminationSignal
{
public:
    bool request(TerminationReason r);
    bool requested() const;
    TerminationReason reason() const;
    // true if a request is (or becomes) pending within timeout
    bool wait_for(std::chrono::milliseconds timeout);

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    TerminationReason m_reason{TerminationReason::None};
};

// True once the session has been asked to stop (cancel, external flag, deadline). Long-running task
// bodies poll it and abandon their work.
using StopCheck = std::function<bool()>;
using TaskBody = std::function<void(const StopCheck &should_stop)>;
using StateListener = std::function<void(SessionState from, SessionState to)>;

// Runs one interactive session: pre hook, extensions, code server launch, optional task body
// (failure triage), idle watchdog once the session is interactive, then a single shutdown path.
class SessionSupervisor
{
public:
    // Upper bound between two checks of the external cancel flag, the deadline and server liveness.
    static constexpr std::chrono::milliseconds max_supervision_slice{250};

    SessionSupervisor(
        cfg::SessionConfig cfg, proc::IProcessLauncher &launcher, std::shared_ptr<coro::io_scheduler> scheduler);
    ~SessionSupervisor();

    SessionSupervisor(const SessionSupervisor &) = delete;
    SessionSupervisor &operator=(const SessionSupervisor &) = delete;

    // Hooks default to the configured pre_execute / post_execute commands.
    void set_pre_hook(std::unique_ptr<hooks::IHook> hook);
    void set_post_hook(std::unique_ptr<hooks::IHook> hook);
    void set_state_listener(StateListener fn);
    // Flag set asynchronously (signal handler); observed within one supervision slice.
    void set_external_cancel(const std::atomic_bool *flag) noexcept { m_external_cancel = flag; }

    // Blocking entry point, call once. Throws HookError / ProcessLaunchError when the session cannot start,
    // and rethrows the task body's exception when it fails outside triage mode (after teardown).
    // A body that fails after a stop request counts as interrupted and is never rethrown.
    SessionResult run(TaskBody body = {});

    // Thread-safe; idempotent. Returns false if a termination reason was already set.
    bool cancel();
    bool request_termination(TerminationReason r);

    // Polls the external cancel flag and the deadline, then reports whether a termination reason is set.
    bool stop_requested();

    SessionState state() const noexcept { return m_state.load(); }
    TaskOutcome task_outcome() const;
    const hb::HeartbeatMonitor &heartbeat() const noexcept { return m_heartbeat; }
    const cfg::SessionConfig &config() const noexcept { return m_cfg; }
    std::vector<hooks::HookRecord> hook_history() const { return m_hooks.history(); }

    proc::LaunchSpec server_launch_spec() const;

private:
    void transition(SessionState to);
    void set_task_outcome(TaskOutcome o);
    std::exception_ptr run_task(const TaskBody &body);
    bool poll_stop_sources();
    void start_watchdog();
    void wait_for_termination();
    void stop_server();
    void shutdown();
    void fail_startup(const std::string &why);
    void finish();

    cfg::SessionConfig m_cfg;
    proc::IProcessLauncher &m_launcher;
    std::shared_ptr<coro::io_scheduler> m_scheduler;
    hb::HeartbeatMonitor m_heartbeat;
    hooks::HookRunner m_hooks;
    std::unique_ptr<hooks::IHook> m_pre;
    std::unique_ptr<hooks::IHook> m_post;
    StateListener m_listener;
    const std::atomic_bool *m_external_cancel{nullptr};

    std::atomic<SessionState> m_state{SessionState::Initializing};
    std::atomic<bool> m_ran{false};
    TerminationSignal m_signal;
    std::unique_ptr<proc::IProcessHandle> m_server;
    std::unique_ptr<wd::IdleWatchdog> m_watchdog;
    std::chrono::steady_clock::time_point m_started_steady{};

    mutable std::mutex m_result_mutex;
    SessionResult m_result;
};

} // namespace flyin::session

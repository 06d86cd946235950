// SPDX-License-Identifier: Apache-2.0
#include "supervisor/session/session_supervisor.hpp"

#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "supervisor/report/session_report.hpp"
#include "supervisor/workspace/launch_config.hpp"

#include <algorithm>
#include <exception>

namespace flyin::session {

const char *to_string(SessionState s) noexcept
{
    switch (s) {
        case SessionState::Initializing:
            return "initializing";
        case SessionState::Running:
            return "running";
        case SessionState::AwaitingIdleCheck:
            return "awaiting_idle_check";
        case SessionState::Terminating:
            return "terminating";
        case SessionState::Terminated:
            return "terminated";
    }
    return "unknown";
}

const char *to_string(TerminationReason r) noexcept
{
    switch (r) {
        case TerminationReason::None:
            return "none";
        case TerminationReason::IdleTimeout:
            return "idle_timeout";
        case TerminationReason::Cancelled:
            return "cancelled";
        case TerminationReason::DeadlineExceeded:
            return "deadline_exceeded";
        case TerminationReason::ProcessExited:
            return "process_exited";
        case TerminationReason::TaskCompleted:
            return "task_completed";
        case TerminationReason::TaskFailed:
            return "task_failed";
        case TerminationReason::StartupFailed:
            return "startup_failed";
    }
    return "unknown";
}

// --- TerminationSignal ---

bool TerminationSignal::request(TerminationReason r)
{
    if (r == TerminationReason::None)
        return false;
    {
        std::scoped_lock lk{m_mutex};
        if (m_reason != TerminationReason::None)
            return false;
        m_reason = r;
    }
    m_cv.notify_all();
    return true;
}

bool TerminationSignal::requested() const
{
    std::scoped_lock lk{m_mutex};
    return m_reason != TerminationReason::None;
}

TerminationReason TerminationSignal::reason() const
{
    std::scoped_lock lk{m_mutex};
    return m_reason;
}

bool TerminationSignal::wait_for(std::chrono::milliseconds timeout)
{
    std::unique_lock lk(m_mutex);
    return m_cv.wait_for(lk, timeout, [this] { return m_reason != TerminationReason::None; });
}

// --- SessionSupervisor ---

SessionSupervisor::SessionSupervisor(
    cfg::SessionConfig cfg, proc::IProcessLauncher &launcher, std::shared_ptr<coro::io_scheduler> scheduler)
    : m_cfg(std::move(cfg)), m_launcher(launcher), m_scheduler(std::move(scheduler)), m_heartbeat(m_cfg.heartbeat_path)
{
    cfg::validate(m_cfg);
    auto hook_timeout = std::chrono::seconds(m_cfg.hook_timeout_seconds);
    m_pre = hooks::make_command_hook(m_launcher, m_cfg.pre_execute, m_cfg.working_dir, hook_timeout);
    m_post = hooks::make_command_hook(m_launcher, m_cfg.post_execute, m_cfg.working_dir, hook_timeout);
}

SessionSupervisor::~SessionSupervisor()
{
    // run() always tears down; this only matters if run() was never called or unwound abnormally.
    if (m_watchdog)
        m_watchdog->stop();
    m_watchdog.reset();
    m_server.reset();
}

void SessionSupervisor::set_pre_hook(std::unique_ptr<hooks::IHook> hook)
{
    m_pre = hook ? std::move(hook) : hooks::make_noop_hook();
}

void SessionSupervisor::set_post_hook(std::unique_ptr<hooks::IHook> hook)
{
    m_post = hook ? std::move(hook) : hooks::make_noop_hook();
}

void SessionSupervisor::set_state_listener(StateListener fn)
{
    m_listener = std::move(fn);
}

bool SessionSupervisor::cancel()
{
    return request_termination(TerminationReason::Cancelled);
}

bool SessionSupervisor::request_termination(TerminationReason r)
{
    if (m_state.load() == SessionState::Terminated)
        return false;
    bool first = m_signal.request(r);
    if (first)
        flyin::log::info("[session] termination requested: {}", to_string(r));
    return first;
}

TaskOutcome SessionSupervisor::task_outcome() const
{
    std::scoped_lock lk{m_result_mutex};
    return m_result.task;
}

void SessionSupervisor::set_task_outcome(TaskOutcome o)
{
    std::scoped_lock lk{m_result_mutex};
    m_result.task = std::move(o);
}

void SessionSupervisor::transition(SessionState to)
{
    auto from = m_state.load();
    if (from == to || from == SessionState::Terminated)
        return;
    m_state.store(to);
    flyin::log::debug("[session] {} -> {}", to_string(from), to_string(to));
    if (m_listener)
        m_listener(from, to);
}

proc::LaunchSpec SessionSupervisor::server_launch_spec() const
{
    proc::LaunchSpec spec;
    spec.argv.push_back(m_cfg.server_binary);
    spec.argv.push_back("--bind-addr");
    spec.argv.push_back(m_cfg.server_host + ":" + std::to_string(m_cfg.server_port));
    spec.argv.push_back("--auth");
    spec.argv.push_back("none");
    for (auto &a : m_cfg.server_args)
        spec.argv.push_back(a);
    spec.argv.push_back(m_cfg.working_dir);
    spec.working_dir = m_cfg.working_dir;
    // the connection tracker inside the server environment writes activity here
    spec.env.emplace_back("FLYIN_HEARTBEAT_PATH", m_cfg.heartbeat_path);
    return spec;
}

// Runs the body and files its outcome. Returns the exception to rethrow after teardown, if any.
std::exception_ptr SessionSupervisor::run_task(const TaskBody &body)
{
    TaskOutcome o;
    o.ran = true;
    std::exception_ptr error;
    try {
        body([this] { return stop_requested(); });
    } catch (const std::exception &ex) {
        o.ok = false;
        o.error = ex.what();
        error = std::current_exception();
    } catch (...) {
        o.ok = false;
        o.error = "non-standard exception";
        error = std::current_exception();
    }

    if (o.ok) {
        set_task_outcome(std::move(o));
        if (m_cfg.run_task_first)
            request_termination(TerminationReason::TaskCompleted);
        return {};
    }
    if (m_signal.requested()) {
        // stopped from outside while running: nothing left to triage or report as a task failure
        flyin::log::warn("[session] task interrupted ({}): {}", to_string(m_signal.reason()), o.error);
        set_task_outcome(std::move(o));
        return {};
    }
    flyin::log::error("[session] task failed: {}", o.error);
    if (m_cfg.run_task_first) {
        o.continue_session = true;
        metrics::session().task_failures_captured.fetch_add(1, std::memory_order_relaxed);
        flyin::log::warn("[session] keeping the session open for interactive triage");
        set_task_outcome(std::move(o));
        return {};
    }
    set_task_outcome(std::move(o));
    request_termination(TerminationReason::TaskFailed);
    return error;
}

void SessionSupervisor::fail_startup(const std::string &why)
{
    m_signal.request(TerminationReason::StartupFailed);
    std::scoped_lock lk{m_result_mutex};
    m_result.startup_error = why;
}

SessionResult SessionSupervisor::run(TaskBody body)
{
    if (m_ran.exchange(true))
        throw SessionError("session supervisor can only run once");
    m_started_steady = std::chrono::steady_clock::now();
    {
        std::scoped_lock lk{m_result_mutex};
        m_result.started_at = std::chrono::system_clock::now();
    }
    metrics::session().sessions_started.fetch_add(1, std::memory_order_relaxed);
    flyin::log::info(
        "[session] starting server={} port={} max_idle={}s run_task_first={}",
        m_cfg.server_binary,
        m_cfg.server_port,
        m_cfg.max_idle_seconds,
        m_cfg.run_task_first);

    // Initializing: pre hook failure aborts before anything is launched.
    auto pre = m_hooks.run_pre(m_pre.get());
    {
        std::scoped_lock lk{m_result_mutex};
        m_result.pre = pre;
    }
    if (!pre.ok) {
        fail_startup("pre_execute hook failed: " + pre.error);
        transition(SessionState::Terminated);
        finish();
        throw HookError(pre.hook, pre.error);
    }

    auto installs = ext::ExtensionInstaller(
                        m_launcher,
                        ext::InstallerOptions{
                            m_cfg.server_binary,
                            m_cfg.extensions_dir,
                            std::chrono::seconds(m_cfg.install_timeout_seconds)})
                        .install_all(m_cfg.effective_extensions());
    {
        std::scoped_lock lk{m_result_mutex};
        m_result.extensions = std::move(installs);
    }

    if (!m_cfg.debug_program.empty())
        workspace::write_launch_config(m_cfg.working_dir, m_cfg.debug_program, {});

    try {
        m_server = m_launcher.launch(server_launch_spec());
    } catch (const ProcessLaunchError &ex) {
        flyin::log::error("[session] code server failed to start: {}", ex.what());
        fail_startup(ex.what());
        transition(SessionState::Terminating);
        auto post = m_hooks.run_post(m_post.get());
        {
            std::scoped_lock lk{m_result_mutex};
            m_result.post = post;
        }
        transition(SessionState::Terminated);
        finish();
        throw;
    }
    flyin::log::info("[session] code server running pid={}", m_server->pid());
    transition(SessionState::Running);

    m_watchdog = std::make_unique<wd::IdleWatchdog>(m_scheduler, m_heartbeat);

    // the body counts as activity: idle time starts once the session is interactive
    std::exception_ptr task_error;
    if (body)
        task_error = run_task(body);

    if (!m_signal.requested()) {
        start_watchdog();
        transition(SessionState::AwaitingIdleCheck);
    }
    wait_for_termination();
    shutdown();
    if (task_error)
        std::rethrow_exception(task_error);
    std::scoped_lock lk{m_result_mutex};
    return m_result;
}

void SessionSupervisor::start_watchdog()
{
    m_heartbeat.restart_idle_clock();
    m_watchdog->start(m_cfg.max_idle(), m_cfg.poll_interval(), [this](std::chrono::milliseconds idle) {
        flyin::log::info("[session] no activity for {}s, shutting down", idle.count() / 1000);
        request_termination(TerminationReason::IdleTimeout);
    });
}

bool SessionSupervisor::poll_stop_sources()
{
    if (m_external_cancel && m_external_cancel->load()) {
        request_termination(TerminationReason::Cancelled);
        return true;
    }
    if (m_cfg.deadline_seconds > 0 && std::chrono::steady_clock::now() >= m_started_steady + m_cfg.deadline()) {
        if (request_termination(TerminationReason::DeadlineExceeded))
            flyin::log::warn("[session] deadline of {}s reached", m_cfg.deadline_seconds);
        return true;
    }
    return false;
}

bool SessionSupervisor::stop_requested()
{
    if (m_signal.requested())
        return true;
    poll_stop_sources();
    return m_signal.requested();
}

void SessionSupervisor::wait_for_termination()
{
    const auto slice = std::min(m_cfg.poll_interval(), max_supervision_slice);
    while (!m_signal.wait_for(slice)) {
        if (poll_stop_sources())
            break;
        if (m_server && !m_server->is_alive()) {
            auto code = m_server->exit_code();
            flyin::log::warn("[session] code server exited on its own (code {})", code ? *code : -1);
            request_termination(TerminationReason::ProcessExited);
            break;
        }
    }
}

void SessionSupervisor::stop_server()
{
    if (!m_server)
        return;
    if (m_server->is_alive()) {
        flyin::log::info("[session] stopping code server pid={}", m_server->pid());
        m_server->send_signal(proc::StopSignal::Graceful);
        if (!m_server->wait(m_cfg.grace_period())) {
            flyin::log::warn(
                "[session] code server ignored SIGTERM for {}ms, killing", m_cfg.grace_period_ms);
            m_server->send_signal(proc::StopSignal::Kill);
            metrics::session().forced_kills.fetch_add(1, std::memory_order_relaxed);
            m_server->wait(std::chrono::seconds(5));
        }
    }
    std::scoped_lock lk{m_result_mutex};
    m_result.server_exit_code = m_server->exit_code();
}

void SessionSupervisor::shutdown()
{
    transition(SessionState::Terminating);
    if (m_watchdog)
        m_watchdog->stop();
    // post hook runs after the decision to stop, before the server is torn down
    auto post = m_hooks.run_post(m_post.get());
    {
        std::scoped_lock lk{m_result_mutex};
        m_result.post = post;
    }
    stop_server();
    m_watchdog.reset();
    transition(SessionState::Terminated);
    finish();
}

void SessionSupervisor::finish()
{
    SessionResult snapshot;
    {
        std::scoped_lock lk{m_result_mutex};
        m_result.final_state = m_state.load();
        m_result.reason = m_signal.reason();
        m_result.finished_at = std::chrono::system_clock::now();
        snapshot = m_result;
    }
    flyin::log::info(
        "[session] finished state={} reason={} task_ok={}",
        to_string(snapshot.final_state),
        to_string(snapshot.reason),
        snapshot.task.ok);
    if (!m_cfg.report_path.empty())
        report::write_report(m_cfg.report_path, snapshot, m_cfg.container_image);
}

} // namespace flyin::session

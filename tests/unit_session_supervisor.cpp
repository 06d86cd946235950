#include "common/errors.hpp"
#include "common/metrics.hpp"
#include "supervisor/report/session_report.hpp"
#include "supervisor/session/command_task.hpp"
#include "supervisor/session/session_supervisor.hpp"
#include "test_fake_process.hpp"
#include <coro/io_scheduler.hpp>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace flyin;
using namespace std::chrono_literals;
using session::SessionState;
using session::TerminationReason;

namespace {

cfg::SessionConfig base_config(const std::string &tag)
{
    cfg::SessionConfig c;
    c.server_binary = test::fake_server;
    c.default_extensions = false;
    c.heartbeat_path = "/tmp/flyin-unit-sup-" + tag + "-" + std::to_string(::getpid());
    std::remove(c.heartbeat_path.c_str());
    c.heartbeat_check_ms = 20;
    c.grace_period_ms = 100;
    c.working_dir = "/tmp";
    return c;
}

// Server launches keep running; everything else exits 0.
void server_runs(test::FakeLauncher &l)
{
    l.rule = [](const proc::LaunchSpec &spec) {
        test::FakeBehavior b;
        if (test::is_server_launch(spec))
            b.exit_immediately = std::nullopt;
        return b;
    };
}

// Records every transition seen by the listener.
struct StateLog
{
    std::mutex mtx;
    std::vector<SessionState> seen;

    session::StateListener listener()
    {
        return [this](SessionState, SessionState to) {
            std::lock_guard lk(mtx);
            seen.push_back(to);
        };
    }
    bool contains(SessionState s)
    {
        std::lock_guard lk(mtx);
        return std::find(seen.begin(), seen.end(), s) != seen.end();
    }
};

template<typename Pred>
bool wait_until(Pred p, std::chrono::milliseconds limit = 5s)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!p()) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

int main()
{
    auto sched = coro::io_scheduler::make_shared();
    metrics::reset();

    // Launch command line for the code server.
    {
        test::FakeLauncher l;
        auto c = base_config("cmdline");
        c.server_port = 9123;
        c.server_args = {"--disable-telemetry"};
        session::SessionSupervisor sup(c, l, sched);
        auto spec = sup.server_launch_spec();
        std::vector<std::string> want{
            test::fake_server, "--bind-addr", "0.0.0.0:9123", "--auth", "none", "--disable-telemetry", "/tmp"};
        assert(spec.argv == want);
        assert(spec.env.size() == 1 && spec.env[0].first == "FLYIN_HEARTBEAT_PATH");
        assert(sup.state() == SessionState::Initializing);
        assert(sup.config().server_port == 9123);
        assert(sup.heartbeat().path() == c.heartbeat_path);
    }

    // Triage mode: a failing task keeps the session running and is not rethrown.
    {
        test::FakeLauncher l;
        server_runs(l);
        auto c = base_config("triage");
        c.run_task_first = true;
        session::SessionSupervisor sup(c, l, sched);
        std::atomic<int> post_calls{0};
        sup.set_post_hook(hooks::make_callable_hook("post", [&] { post_calls.fetch_add(1); }));
        session::SessionResult result;
        bool threw = false;
        std::thread runner([&] {
            try {
                result = sup.run([](const session::StopCheck &) { throw std::runtime_error("boom"); });
            } catch (...) {
                threw = true;
            }
        });
        assert(wait_until([&] { return sup.state() == SessionState::AwaitingIdleCheck; }));
        auto outcome = sup.task_outcome();
        assert(outcome.ran && !outcome.ok);
        assert(outcome.continue_session);
        assert(outcome.error == "boom");
        // still up well after the failure
        std::this_thread::sleep_for(100ms);
        assert(session::is_running(sup.state()));
        assert(l.server()->alive());
        assert(post_calls.load() == 0);

        auto cancelled_at = std::chrono::steady_clock::now();
        assert(sup.cancel());
        assert(!sup.cancel());
        runner.join();
        assert(std::chrono::steady_clock::now() - cancelled_at < 2s);
        assert(!threw);
        assert(result.final_state == SessionState::Terminated);
        assert(result.reason == TerminationReason::Cancelled);
        assert(!result.task.ok && result.task.continue_session);
        assert(post_calls.load() == 1);
        assert(!l.server()->alive());
        assert(result.server_exit_code && *result.server_exit_code == 128 + 15);
    }

    // Triage mode: a successful task ends the session.
    {
        test::FakeLauncher l;
        server_runs(l);
        auto c = base_config("triage-ok");
        c.run_task_first = true;
        session::SessionSupervisor sup(c, l, sched);
        int ran = 0;
        auto result = sup.run([&](const session::StopCheck &) { ++ran; });
        assert(ran == 1);
        assert(result.reason == TerminationReason::TaskCompleted);
        assert(result.task.ran && result.task.ok && !result.task.continue_session);
    }

    // Outside triage mode a task failure tears the session down and propagates.
    {
        test::FakeLauncher l;
        server_runs(l);
        auto c = base_config("strict");
        session::SessionSupervisor sup(c, l, sched);
        StateLog log;
        sup.set_state_listener(log.listener());
        int code = 0;
        try {
            sup.run([](const session::StopCheck &) { throw TaskExecutionError("task command exited with code 2", 2); });
        } catch (const TaskExecutionError &ex) {
            code = ex.exit_code();
        }
        assert(code == 2);
        assert(log.contains(SessionState::Running));
        assert(log.contains(SessionState::Terminating));
        assert(sup.state() == SessionState::Terminated);
        assert(!sup.task_outcome().ok && !sup.task_outcome().continue_session);
        assert(!l.server()->alive());
    }

    // Pre hook failure: the server is never launched and Running is never entered.
    {
        test::FakeLauncher l;
        server_runs(l);
        auto c = base_config("pre");
        session::SessionSupervisor sup(c, l, sched);
        StateLog log;
        sup.set_state_listener(log.listener());
        sup.set_pre_hook(hooks::make_callable_hook("fetch-inputs", [] { throw std::runtime_error("no inputs"); }));
        bool body_ran = false;
        std::string hook_name;
        try {
            sup.run([&](const session::StopCheck &) { body_ran = true; });
        } catch (const HookError &ex) {
            hook_name = ex.hook();
        }
        assert(hook_name == "fetch-inputs");
        assert(!body_ran);
        assert(!log.contains(SessionState::Running));
        assert(sup.state() == SessionState::Terminated);
        assert(!l.server());
        assert(l.launched().empty());
    }

    // Post hook failure is recorded but the session still reaches Terminated.
    {
        test::FakeLauncher l;
        server_runs(l);
        auto c = base_config("post");
        c.run_task_first = true;
        session::SessionSupervisor sup(c, l, sched);
        sup.set_post_hook(hooks::make_callable_hook("upload", [] { throw std::runtime_error("bucket missing"); }));
        auto result = sup.run([](const session::StopCheck &) {});
        assert(result.final_state == SessionState::Terminated);
        assert(!result.post.ok && result.post.error == "bucket missing");
        auto hist = sup.hook_history();
        assert(hist.size() == 2);
        assert(hist[1].phase == hooks::Phase::post);
    }

    // Server launch failure: ProcessLaunchError, post hook still runs.
    {
        test::FakeLauncher l;
        l.rule = [](const proc::LaunchSpec &spec) {
            test::FakeBehavior b;
            b.fail_launch = test::is_server_launch(spec);
            return b;
        };
        auto c = base_config("launch");
        session::SessionSupervisor sup(c, l, sched);
        StateLog log;
        sup.set_state_listener(log.listener());
        int post_calls = 0;
        sup.set_post_hook(hooks::make_callable_hook("post", [&] { ++post_calls; }));
        bool threw = false;
        try {
            sup.run();
        } catch (const ProcessLaunchError &) {
            threw = true;
        }
        assert(threw);
        assert(post_calls == 1);
        assert(!log.contains(SessionState::Running));
        assert(sup.state() == SessionState::Terminated);
    }

    // Server exits on its own.
    {
        test::FakeLauncher l;
        server_runs(l);
        auto c = base_config("exit");
        session::SessionSupervisor sup(c, l, sched);
        session::SessionResult result;
        std::thread runner([&] { result = sup.run(); });
        assert(wait_until([&] { return sup.state() == SessionState::AwaitingIdleCheck; }));
        l.server()->exit_with(1);
        runner.join();
        assert(result.reason == TerminationReason::ProcessExited);
        assert(result.server_exit_code && *result.server_exit_code == 1);
    }

    // Idle timeout with no heartbeat at all fires from the session start.
    {
        test::FakeLauncher l;
        server_runs(l);
        auto c = base_config("idle");
        c.max_idle_seconds = 1;
        session::SessionSupervisor sup(c, l, sched);
        auto t0 = std::chrono::steady_clock::now();
        auto result = sup.run();
        auto took = std::chrono::steady_clock::now() - t0;
        assert(result.reason == TerminationReason::IdleTimeout);
        assert(took >= 900ms && took < 5s);
    }

    // Deadline, external cancel flag and a server that ignores SIGTERM.
    {
        test::FakeLauncher l;
        l.rule = [](const proc::LaunchSpec &spec) {
            test::FakeBehavior b;
            if (test::is_server_launch(spec)) {
                b.exit_immediately = std::nullopt;
                b.ignore_graceful = true;
            }
            return b;
        };
        auto c = base_config("deadline");
        c.deadline_seconds = 1;
        session::SessionSupervisor sup(c, l, sched);
        auto result = sup.run();
        assert(result.reason == TerminationReason::DeadlineExceeded);
        assert(result.server_exit_code && *result.server_exit_code == 128 + 9);
        auto srv = l.server();
        assert(srv->signals.size() == 2);
        assert(srv->signals[0] == proc::StopSignal::Graceful && srv->signals[1] == proc::StopSignal::Kill);
        assert(metrics::session().forced_kills.load() == 1);
    }
    {
        test::FakeLauncher l;
        server_runs(l);
        auto c = base_config("flag");
        session::SessionSupervisor sup(c, l, sched);
        std::atomic_bool flag{false};
        sup.set_external_cancel(&flag);
        session::SessionResult result;
        std::thread runner([&] { result = sup.run(); });
        assert(wait_until([&] { return sup.state() == SessionState::AwaitingIdleCheck; }));
        flag.store(true);
        runner.join();
        assert(result.reason == TerminationReason::Cancelled);
        // terminated sessions ignore further requests; a second run is refused
        assert(!sup.request_termination(TerminationReason::IdleTimeout));
        bool threw = false;
        try {
            sup.run();
        } catch (const SessionError &) {
            threw = true;
        }
        assert(threw);
    }

    // Extensions install before the server starts; launch.json and the report are written.
    {
        test::FakeLauncher l;
        server_runs(l);
        auto c = base_config("outputs");
        c.extensions = {"pub.one", "ftp://mirror.local/bad.vsix", "https://x.org/files/pub.two-1.0.vsix"};
        std::string ws = "/tmp/flyin-unit-sup-ws-" + std::to_string(::getpid());
        ::mkdir(ws.c_str(), 0755);
        c.working_dir = ws;
        c.debug_program = "workflows/train.py";
        c.report_path = ws + "/report.pb";
        c.container_image = "ghcr.io/acme/flyin:1.0";
        c.run_task_first = true;
        session::SessionSupervisor sup(c, l, sched);
        auto result = sup.run([](const session::StopCheck &) {});
        // one invalid reference among three: two installed, session still ran
        assert(result.extensions.size() == 3);
        assert(result.extensions[0].ok && !result.extensions[1].ok && result.extensions[2].ok);
        auto launched = l.launched();
        // install, mkdir, curl, install, server
        assert(launched.size() == 5);
        assert(launched[0].argv[1] == "--install-extension");
        assert(test::is_server_launch(launched[4]));

        std::ifstream lc(ws + "/.vscode/launch.json");
        assert(lc.good());

        flyin::SessionReport rep;
        assert(report::read_report(c.report_path, rep));
        assert(rep.final_state() == flyin::SESSION_STATE_TERMINATED);
        assert(rep.reason() == flyin::TERMINATION_TASK_COMPLETED);
        assert(rep.extensions_size() == 3);
        assert(rep.container_image() == "ghcr.io/acme/flyin:1.0");

        std::remove(c.report_path.c_str());
        std::remove((ws + "/.vscode/launch.json").c_str());
        ::rmdir((ws + "/.vscode").c_str());
        ::rmdir(ws.c_str());
    }

    // Hooks that throw a non-standard value are contained like any other hook failure.
    {
        test::FakeLauncher l;
        server_runs(l);
        auto c = base_config("post-int");
        c.run_task_first = true;
        session::SessionSupervisor sup(c, l, sched);
        sup.set_post_hook(hooks::make_callable_hook("archive", [] { throw 42; }));
        auto result = sup.run([](const session::StopCheck &) {});
        assert(result.final_state == SessionState::Terminated);
        assert(result.reason == TerminationReason::TaskCompleted);
        assert(!result.post.ok && result.post.error == "non-standard exception");
        assert(!l.server()->alive());
        assert(l.server()->signals.size() == 1 && l.server()->signals[0] == proc::StopSignal::Graceful);
    }
    {
        test::FakeLauncher l;
        server_runs(l);
        auto c = base_config("pre-int");
        session::SessionSupervisor sup(c, l, sched);
        sup.set_pre_hook(hooks::make_callable_hook("fetch-inputs", [] { throw 42; }));
        std::string error;
        try {
            sup.run();
        } catch (const HookError &ex) {
            error = ex.what();
        }
        assert(error.find("non-standard exception") != std::string::npos);
        assert(sup.state() == SessionState::Terminated);
        assert(l.launched().empty());
    }

    // A triage body that runs longer than the idle threshold: idle time only counts once the
    // session is interactive, so the failure can still be inspected.
    {
        test::FakeLauncher l;
        server_runs(l);
        auto c = base_config("slow-triage");
        c.run_task_first = true;
        c.max_idle_seconds = 1;
        c.heartbeat_check_ms = 100;
        session::SessionSupervisor sup(c, l, sched);
        session::SessionResult result;
        std::chrono::steady_clock::time_point body_done;
        std::thread runner([&] {
            result = sup.run([&](const session::StopCheck &) {
                std::this_thread::sleep_for(1500ms);
                body_done = std::chrono::steady_clock::now();
                throw std::runtime_error("slow failure");
            });
        });
        assert(wait_until([&] { return sup.state() == SessionState::AwaitingIdleCheck; }));
        std::this_thread::sleep_for(300ms);
        assert(session::is_running(sup.state()));
        assert(sup.task_outcome().continue_session);
        assert(l.server()->alive());
        runner.join();
        auto ended = std::chrono::steady_clock::now();
        assert(result.reason == TerminationReason::IdleTimeout);
        assert(ended - body_done >= 900ms);
        assert(result.task.error == "slow failure" && result.task.continue_session);
    }

    // A hung task command is stopped at the deadline instead of running on.
    {
        test::FakeLauncher l;
        l.rule = [](const proc::LaunchSpec &spec) {
            test::FakeBehavior b;
            if (test::is_server_launch(spec) || spec.argv.back() == "sleep 60")
                b.exit_immediately = std::nullopt;
            return b;
        };
        auto c = base_config("task-deadline");
        c.task_command = "sleep 60";
        c.deadline_seconds = 1;
        session::SessionSupervisor sup(c, l, sched);
        auto t0 = std::chrono::steady_clock::now();
        auto result = sup.run(session::make_command_task(l, c, 20ms));
        auto took = std::chrono::steady_clock::now() - t0;
        assert(result.reason == TerminationReason::DeadlineExceeded);
        assert(took >= 900ms && took < 3s);
        assert(result.task.ran && !result.task.ok && !result.task.continue_session);
        auto task = l.process(1);
        assert(task && !task->alive());
        assert(task->signals.size() == 1 && task->signals[0] == proc::StopSignal::Graceful);
        assert(l.launched()[1].argv.back() == "sleep 60");
    }

    // cancel() reaches a running task command within one check interval.
    {
        test::FakeLauncher l;
        l.rule = [](const proc::LaunchSpec &spec) {
            test::FakeBehavior b;
            if (test::is_server_launch(spec) || spec.argv.back() == "sleep 60")
                b.exit_immediately = std::nullopt;
            return b;
        };
        auto c = base_config("task-cancel");
        c.task_command = "sleep 60";
        c.run_task_first = true;
        session::SessionSupervisor sup(c, l, sched);
        session::SessionResult result;
        std::thread runner([&] { result = sup.run(session::make_command_task(l, c, 20ms)); });
        assert(wait_until([&] { return l.process(1) != nullptr; }));
        assert(sup.state() == SessionState::Running);
        auto cancelled_at = std::chrono::steady_clock::now();
        assert(sup.cancel());
        runner.join();
        assert(std::chrono::steady_clock::now() - cancelled_at < 1s);
        assert(result.reason == TerminationReason::Cancelled);
        assert(!result.task.ok && !result.task.continue_session);
        assert(!l.process(1)->alive());
    }

    // Command tasks report a non-zero exit as TaskExecutionError with the exit code.
    {
        test::FakeLauncher l;
        l.rule = [](const proc::LaunchSpec &spec) {
            test::FakeBehavior b;
            if (test::is_server_launch(spec))
                b.exit_immediately = std::nullopt;
            else if (spec.argv.back() == "exit 7")
                b.exit_immediately = 7;
            return b;
        };
        auto c = base_config("task-exit");
        c.task_command = "exit 7";
        assert(!session::make_command_task(l, base_config("no-task")));
        session::SessionSupervisor sup(c, l, sched);
        int code = 0;
        try {
            sup.run(session::make_command_task(l, c));
        } catch (const TaskExecutionError &ex) {
            code = ex.exit_code();
        }
        assert(code == 7);
        assert(sup.state() == SessionState::Terminated);
    }

    auto summary = metrics::to_json("session_final");
    assert(summary.find("\"metric\":\"session_final\"") != std::string::npos);
    assert(metrics::session().task_failures_captured.load() == 2);

    sched->shutdown();
    std::cout << "unit_session_supervisor OK" << std::endl;
    return 0;
}

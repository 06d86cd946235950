// SPDX-License-Identifier: Apache-2.0
#include "supervisor/report/session_report.hpp"

#include "common/logger.hpp"

#include <cstdio>
#include <fstream>

namespace flyin::report {

namespace {
flyin::SessionStateProto state_to_proto(session::SessionState s)
{
    switch (s) {
        case session::SessionState::Initializing:
            return flyin::SESSION_STATE_INITIALIZING;
        case session::SessionState::Running:
            return flyin::SESSION_STATE_RUNNING;
        case session::SessionState::AwaitingIdleCheck:
            return flyin::SESSION_STATE_AWAITING_IDLE_CHECK;
        case session::SessionState::Terminating:
            return flyin::SESSION_STATE_TERMINATING;
        case session::SessionState::Terminated:
            return flyin::SESSION_STATE_TERMINATED;
    }
    return flyin::SESSION_STATE_INITIALIZING;
}

flyin::TerminationReasonProto reason_to_proto(session::TerminationReason r)
{
    switch (r) {
        case session::TerminationReason::None:
            return flyin::TERMINATION_NONE;
        case session::TerminationReason::IdleTimeout:
            return flyin::TERMINATION_IDLE_TIMEOUT;
        case session::TerminationReason::Cancelled:
            return flyin::TERMINATION_CANCELLED;
        case session::TerminationReason::DeadlineExceeded:
            return flyin::TERMINATION_DEADLINE_EXCEEDED;
        case session::TerminationReason::ProcessExited:
            return flyin::TERMINATION_PROCESS_EXITED;
        case session::TerminationReason::TaskCompleted:
            return flyin::TERMINATION_TASK_COMPLETED;
        case session::TerminationReason::TaskFailed:
            return flyin::TERMINATION_TASK_FAILED;
        case session::TerminationReason::StartupFailed:
            return flyin::TERMINATION_STARTUP_FAILED;
    }
    return flyin::TERMINATION_NONE;
}

uint64_t epoch_ms(std::chrono::system_clock::time_point tp)
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    return ms > 0 ? static_cast<uint64_t>(ms) : 0;
}

void add_hook(flyin::SessionReport &rep, const char *phase, const hooks::HookOutcome &o)
{
    auto *h = rep.add_hooks();
    h->set_phase(phase);
    h->set_hook(o.hook);
    h->set_ok(o.ok);
    h->set_error(o.error);
    h->set_duration_ms(static_cast<uint64_t>(o.duration.count()));
}
} // namespace

flyin::SessionReport to_proto(const session::SessionResult &result, const std::string &container_image)
{
    flyin::SessionReport rep;
    rep.set_final_state(state_to_proto(result.final_state));
    rep.set_reason(reason_to_proto(result.reason));
    add_hook(rep, hooks::phase_name(hooks::Phase::pre), result.pre);
    add_hook(rep, hooks::phase_name(hooks::Phase::post), result.post);
    for (auto &e : result.extensions) {
        auto *x = rep.add_extensions();
        x->set_reference(e.reference);
        x->set_ok(e.ok);
        x->set_detail(e.detail);
    }
    auto *t = rep.mutable_task();
    t->set_ran(result.task.ran);
    t->set_ok(result.task.ok);
    t->set_error(result.task.error);
    t->set_continue_session(result.task.continue_session);
    if (result.server_exit_code) {
        rep.set_server_exit_known(true);
        rep.set_server_exit_code(*result.server_exit_code);
    }
    rep.set_started_at_ms(epoch_ms(result.started_at));
    rep.set_finished_at_ms(epoch_ms(result.finished_at));
    rep.set_container_image(container_image);
    rep.set_startup_error(result.startup_error);
    return rep;
}

bool write_report(const std::string &path, const session::SessionResult &result, const std::string &container_image)
{
    auto rep = to_proto(result, container_image);
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out || !rep.SerializeToOstream(&out)) {
            flyin::log::error("[report] failed to write {}", tmp);
            std::remove(tmp.c_str());
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        flyin::log::error("[report] failed to move report into {}", path);
        std::remove(tmp.c_str());
        return false;
    }
    flyin::log::info("[report] session report written to {}", path);
    return true;
}

bool read_report(const std::string &path, flyin::SessionReport &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    return out.ParseFromIstream(&in);
}

} // namespace flyin::report

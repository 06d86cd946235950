// SPDX-License-Identifier: Apache-2.0
#include "supervisor/hooks/hook_runner.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <chrono>
#include <exception>

namespace flyin::hooks {

const char *phase_name(Phase p) noexcept
{
    return p == Phase::pre ? "pre_execute" : "post_execute";
}

HookOutcome HookRunner::run_pre(IHook *hook)
{
    return run(Phase::pre, hook);
}

HookOutcome HookRunner::run_post(IHook *hook)
{
    return run(Phase::post, hook);
}

std::vector<HookRecord> HookRunner::history() const
{
    std::scoped_lock lk{m_mutex};
    return m_history;
}

HookOutcome HookRunner::run(Phase phase, IHook *hook)
{
    HookOutcome out;
    if (!hook) {
        out = HookOutcome::success("none");
    } else {
        std::string name(hook->name());
        auto t0 = std::chrono::steady_clock::now();
        flyin::log::info("[hook] {} '{}' starting", phase_name(phase), name);
        metrics::session().hooks_run.fetch_add(1, std::memory_order_relaxed);
        try {
            out = hook->execute();
        } catch (const std::exception &ex) {
            out = HookOutcome::failure(name, ex.what());
        } catch (...) {
            out = HookOutcome::failure(name, "non-standard exception");
        }
        if (out.hook.empty())
            out.hook = name;
        out.duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
        if (out.ok) {
            flyin::log::info("[hook] {} '{}' ok ({}ms)", phase_name(phase), out.hook, out.duration.count());
        } else {
            metrics::session().hook_failures.fetch_add(1, std::memory_order_relaxed);
            flyin::log::error("[hook] {} '{}' failed: {}", phase_name(phase), out.hook, out.error);
        }
    }
    std::scoped_lock lk{m_mutex};
    m_history.push_back(HookRecord{phase, out});
    return out;
}

} // namespace flyin::hooks

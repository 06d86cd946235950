// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "supervisor/hooks/hook.hpp"

#include <mutex>
#include <vector>

namespace flyin::hooks {

enum class Phase
{
    pre,
    post
};

const char *phase_name(Phase p) noexcept;

struct HookRecord
{
    Phase phase;
    HookOutcome outcome;
};

// Runs hooks and turns every failure (including exceptions escaping a hook) into a HookOutcome.
// Never throws; deciding what a failure means is left to the caller.
class HookRunner
{
public:
    HookOutcome run_pre(IHook *hook);
    HookOutcome run_post(IHook *hook);

    std::vector<HookRecord> history() const;

private:
    HookOutcome run(Phase phase, IHook *hook);

    mutable std::mutex m_mutex;
    std::vector<HookRecord> m_history;
};

} // namespace flyin::hooks

// SPDX-License-Identifier: Apache-2.0
// hook.hpp
// Pre/post execute hook capability. Variants: none (no-op), callable (in-process), command (shell).
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace flyin::proc {
class IProcessLauncher;
}

namespace flyin::hooks {

struct HookOutcome
{
    bool ok{true};
    std::string hook; // hook name ("none" for the no-op)
    std::string error; // failure detail when !ok
    std::chrono::milliseconds duration{0};

    static HookOutcome success(std::string name) { return HookOutcome{true, std::move(name), {}, {}}; }
    static HookOutcome failure(std::string name, std::string why)
    {
        return HookOutcome{false, std::move(name), std::move(why), {}};
    }
};

class IHook
{
public:
    virtual ~IHook() = default;
    virtual std::string_view name() const = 0;
    virtual HookOutcome execute() = 0;
};

std::unique_ptr<IHook> make_noop_hook();
// Empty fn yields the no-op hook.
std::unique_ptr<IHook> make_callable_hook(std::string name, std::function<void()> fn);
// Runs `/bin/sh -c command`; non-zero exit or timeout is a failure. Empty command yields the no-op hook.
// The launcher must outlive the hook.
std::unique_ptr<IHook> make_command_hook(
    proc::IProcessLauncher &launcher,
    std::string command,
    std::string working_dir,
    std::chrono::milliseconds timeout);

} // namespace flyin::hooks

// SPDX-License-Identifier: Apache-2.0
#include "supervisor/hooks/hook.hpp"

#include "common/errors.hpp"
#include "supervisor/process/process_launcher.hpp"

#include <exception>
#include <optional>

namespace flyin::hooks {

namespace {
class NoopHook : public IHook
{
public:
    std::string_view name() const override { return "none"; }
    HookOutcome execute() override { return HookOutcome::success("none"); }
};

class CallableHook : public IHook
{
public:
    CallableHook(std::string name, std::function<void()> fn) : m_name(std::move(name)), m_fn(std::move(fn)) {}

    std::string_view name() const override { return m_name; }

    HookOutcome execute() override
    {
        try {
            m_fn();
        } catch (const std::exception &ex) {
            return HookOutcome::failure(m_name, ex.what());
        } catch (...) {
            return HookOutcome::failure(m_name, "non-standard exception");
        }
        return HookOutcome::success(m_name);
    }

private:
    std::string m_name;
    std::function<void()> m_fn;
};

class CommandHook : public IHook
{
public:
    CommandHook(proc::IProcessLauncher &launcher, std::string command, std::string dir, std::chrono::milliseconds timeout)
        : m_launcher(launcher), m_command(std::move(command)), m_dir(std::move(dir)), m_timeout(timeout)
    {}

    std::string_view name() const override { return m_command; }

    HookOutcome execute() override
    {
        std::optional<int> code;
        try {
            code = proc::run_to_completion(m_launcher, proc::shell_command(m_command, m_dir), m_timeout);
        } catch (const ProcessLaunchError &ex) {
            return HookOutcome::failure(m_command, ex.what());
        }
        if (!code)
            return HookOutcome::failure(m_command, "timed out after " + std::to_string(m_timeout.count()) + "ms");
        if (*code != 0)
            return HookOutcome::failure(m_command, "exit code " + std::to_string(*code));
        return HookOutcome::success(m_command);
    }

private:
    proc::IProcessLauncher &m_launcher;
    std::string m_command;
    std::string m_dir;
    std::chrono::milliseconds m_timeout;
};
} // namespace

std::unique_ptr<IHook> make_noop_hook()
{
    return std::make_unique<NoopHook>();
}

std::unique_ptr<IHook> make_callable_hook(std::string name, std::function<void()> fn)
{
    if (!fn)
        return make_noop_hook();
    return std::make_unique<CallableHook>(std::move(name), std::move(fn));
}

std::unique_ptr<IHook> make_command_hook(
    proc::IProcessLauncher &launcher,
    std::string command,
    std::string working_dir,
    std::chrono::milliseconds timeout)
{
    if (command.empty())
        return make_noop_hook();
    return std::make_unique<CommandHook>(launcher, std::move(command), std::move(working_dir), timeout);
}

} // namespace flyin::hooks

// SPDX-License-Identifier: Apache-2.0
#include "supervisor/process/process_launcher.hpp"

#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <map>
#include <thread>

extern char **environ;

namespace flyin::proc {

namespace {

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

class PosixProcessHandle : public IProcessHandle
{
public:
    explicit PosixProcessHandle(pid_t pid) : m_pid(pid) {}

    ~PosixProcessHandle() override
    {
        // Never leave an orphan or a zombie behind.
        if (is_alive()) {
            ::kill(-m_pid, SIGKILL);
            int status = 0;
            if (::waitpid(m_pid, &status, 0) == m_pid)
                m_exit_code = decode_status(status);
        }
    }

    pid_t pid() const override { return m_pid; }

    bool is_alive() override
    {
        if (m_exit_code)
            return false;
        int status = 0;
        pid_t r = ::waitpid(m_pid, &status, WNOHANG);
        if (r == 0)
            return true;
        if (r == m_pid) {
            m_exit_code = decode_status(status);
            return false;
        }
        // ECHILD: reaped elsewhere; treat as gone with unknown status
        m_exit_code = -1;
        return false;
    }

    bool send_signal(StopSignal kind) override
    {
        if (!is_alive())
            return false;
        int sig = kind == StopSignal::Graceful ? SIGTERM : SIGKILL;
        // Whole process group first; fall back to the pid if the group is already gone.
        if (::kill(-m_pid, sig) == 0)
            return true;
        return ::kill(m_pid, sig) == 0;
    }

    std::optional<int> wait(std::chrono::milliseconds timeout) override
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (is_alive()) {
            if (std::chrono::steady_clock::now() >= deadline)
                return std::nullopt;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return m_exit_code;
    }

    std::optional<int> exit_code() const override { return m_exit_code; }

private:
    pid_t m_pid;
    std::optional<int> m_exit_code;
};

class PosixProcessLauncher : public IProcessLauncher
{
public:
    std::unique_ptr<IProcessHandle> launch(const LaunchSpec &spec) override
    {
        if (spec.argv.empty()) {
            metrics::session().launch_failures.fetch_add(1, std::memory_order_relaxed);
            throw ProcessLaunchError("empty command line");
        }
        // Everything the child touches is prepared before fork.
        std::vector<char *> argv;
        argv.reserve(spec.argv.size() + 1);
        for (auto &a : spec.argv)
            argv.push_back(const_cast<char *>(a.c_str()));
        argv.push_back(nullptr);

        std::map<std::string, std::string> merged;
        for (char **e = environ; e && *e; ++e) {
            std::string kv(*e);
            auto eq = kv.find('=');
            if (eq != std::string::npos)
                merged[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
        for (auto &[k, v] : spec.env)
            merged[k] = v;
        std::vector<std::string> env_storage;
        env_storage.reserve(merged.size());
        for (auto &[k, v] : merged)
            env_storage.push_back(k + "=" + v);
        std::vector<char *> envp;
        envp.reserve(env_storage.size() + 1);
        for (auto &s : env_storage)
            envp.push_back(s.data());
        envp.push_back(nullptr);

        int err_pipe[2];
        if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
            metrics::session().launch_failures.fetch_add(1, std::memory_order_relaxed);
            throw ProcessLaunchError(std::string("pipe2 failed: ") + std::strerror(errno));
        }

        pid_t pid = ::fork();
        if (pid < 0) {
            int e = errno;
            ::close(err_pipe[0]);
            ::close(err_pipe[1]);
            metrics::session().launch_failures.fetch_add(1, std::memory_order_relaxed);
            throw ProcessLaunchError(std::string("fork failed: ") + std::strerror(e));
        }
        if (pid == 0) {
            // child: only async-signal-safe calls from here on
            ::close(err_pipe[0]);
            ::setpgid(0, 0);
            if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
                int e = errno;
                (void)!::write(err_pipe[1], &e, sizeof(e));
                ::_exit(127);
            }
            ::execvpe(argv[0], argv.data(), envp.data());
            int e = errno;
            (void)!::write(err_pipe[1], &e, sizeof(e));
            ::_exit(127);
        }

        ::close(err_pipe[1]);
        int child_errno = 0;
        ssize_t n;
        do {
            n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        ::close(err_pipe[0]);
        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            int status = 0;
            ::waitpid(pid, &status, 0);
            metrics::session().launch_failures.fetch_add(1, std::memory_order_relaxed);
            throw ProcessLaunchError("cannot start '" + spec.argv[0] + "': " + std::strerror(child_errno));
        }
        // Parent-side setpgid closes the race with an early kill(-pid) before the child ran setpgid.
        ::setpgid(pid, pid);
        metrics::session().processes_launched.fetch_add(1, std::memory_order_relaxed);
        flyin::log::debug("[proc] launched pid={} cmd={}", pid, describe(spec));
        return std::make_unique<PosixProcessHandle>(pid);
    }
};

} // namespace

std::unique_ptr<IProcessLauncher> make_posix_launcher()
{
    return std::make_unique<PosixProcessLauncher>();
}

LaunchSpec shell_command(const std::string &command, const std::string &working_dir)
{
    LaunchSpec spec;
    spec.argv = {"/bin/sh", "-c", command};
    spec.working_dir = working_dir;
    return spec;
}

std::string describe(const LaunchSpec &spec)
{
    std::string out;
    for (size_t i = 0; i < spec.argv.size(); ++i) {
        if (i)
            out.push_back(' ');
        out += spec.argv[i];
    }
    return out;
}

std::optional<int> run_to_completion(IProcessLauncher &launcher, const LaunchSpec &spec, std::chrono::milliseconds timeout)
{
    auto handle = launcher.launch(spec);
    if (auto code = handle->wait(timeout))
        return code;
    flyin::log::warn("[proc] '{}' exceeded {}ms, killing", describe(spec), timeout.count());
    handle->send_signal(StopSignal::Kill);
    metrics::session().forced_kills.fetch_add(1, std::memory_order_relaxed);
    handle->wait(std::chrono::seconds(1));
    return std::nullopt;
}

} // namespace flyin::proc

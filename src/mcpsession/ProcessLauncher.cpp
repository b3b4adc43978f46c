//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessLauncher.cpp
// Purpose: POSIX fork/exec of an MCP server child with piped stdio, exec-failure reporting, and shutdown
//==========================================================================================================

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include "logging/Logger.h"
#include "mcpsession/ProcessLauncher.hpp"
#include "mcpsession/errors/Errors.h"

extern char** environ;

namespace mcpsession {

namespace {

using errors::ProcessSpawnError;
using errors::SessionClosedError;

constexpr std::chrono::milliseconds kTermWait{500};
constexpr std::chrono::milliseconds kReapPollInterval{10};
constexpr std::chrono::milliseconds kDestructorGrace{100};

// Stage reported by the child through the status pipe when it cannot become the server.
enum class ChildStage : int { Redirect = 1, Chdir = 2, Exec = 3 };

struct ExecFailure {
    int stage;
    int err;
};

void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() {
        struct sigaction sa {};
        sa.sa_handler = SIG_IGN;
        ::sigemptyset(&sa.sa_mask);
        if (::sigaction(SIGPIPE, &sa, nullptr) != 0) {
            const int err = errno;
            LOG_WARN("ProcessLauncher: failed to ignore SIGPIPE (errno={} msg={})", err, ::strerror(err));
        }
    });
}

void closeFd(int& fd) {
    if (fd < 0) {
        return;
    }
    if (::close(fd) != 0 && errno != EINTR) {
        const int err = errno;
        LOG_WARN("ProcessLauncher: close(fd={}) failed (errno={} msg={})", fd, err, ::strerror(err));
    }
    fd = -1;
}

int exitCodeFromStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Both ends of one pipe; whatever was not handed off is closed on scope exit.
struct PipeFds {
    int read{-1};
    int write{-1};

    PipeFds() = default;
    PipeFds(const PipeFds&) = delete;
    PipeFds& operator=(const PipeFds&) = delete;
    ~PipeFds() {
        closeFd(read);
        closeFd(write);
    }

    void Open(const char* what) {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            const int err = errno;
            throw ProcessSpawnError(std::format("failed to create {} pipe: {}", what, ::strerror(err)), err);
        }
        read = fds[0];
        write = fds[1];
    }

    int TakeRead() { int fd = read; read = -1; return fd; }
    int TakeWrite() { int fd = write; write = -1; return fd; }
};

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overlay) {
    std::vector<std::string> entries;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        const std::string key = entry.substr(0, entry.find('='));
        if (overlay.find(key) != overlay.end()) {
            continue;
        }
        entries.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overlay) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<char*> toCStrings(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void childFail(int statusFd, ChildStage stage) noexcept {
    ExecFailure failure{static_cast<int>(stage), errno};
    while (::write(statusFd, &failure, sizeof(failure)) < 0 && errno == EINTR) {
    }
    ::_exit(127);
}

void childRedirect(int fd, int target, int statusFd) noexcept {
    if (fd == target) {
        // dup2 onto itself keeps FD_CLOEXEC; clear it by hand
        int flags = ::fcntl(fd, F_GETFD);
        if (flags < 0 || ::fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) < 0) {
            childFail(statusFd, ChildStage::Redirect);
        }
        return;
    }
    if (::dup2(fd, target) < 0) {
        childFail(statusFd, ChildStage::Redirect);
    }
}

const char* stageName(int stage) {
    switch (static_cast<ChildStage>(stage)) {
        case ChildStage::Redirect: return "redirect stdio of";
        case ChildStage::Chdir: return "enter working directory for";
        case ChildStage::Exec: return "execute";
    }
    return "start";
}

} // namespace

////////////////////////////////////////// ChildProcess::Impl //////////////////////////////////////////
struct ChildProcess::Impl {
    std::string command;
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};

    std::mutex stdinMutex;
    std::atomic<bool> stdinClosing{false};

    std::mutex reapMutex;
    bool reaped{false};
    std::optional<int> exitCode;

    std::mutex terminateMutex;
    bool terminated{false};

    // Non-blocking reap. Returns true once the child is known to be gone.
    bool TryReap() {
        std::lock_guard<std::mutex> lock(reapMutex);
        if (reaped) {
            return true;
        }
        int status = 0;
        pid_t r = 0;
        do {
            r = ::waitpid(pid, &status, WNOHANG);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            MarkReaped(status);
            return true;
        }
        if (r < 0) {
            const int err = errno;
            if (err == ECHILD) {
                LOG_WARN("Server process pid={} was reaped elsewhere; exit code unknown", pid);
                reaped = true;
                return true;
            }
            LOG_WARN("waitpid(pid={}) failed (errno={} msg={})", pid, err, ::strerror(err));
        }
        return false;
    }

    void BlockingReap() {
        std::lock_guard<std::mutex> lock(reapMutex);
        if (reaped) {
            return;
        }
        int status = 0;
        pid_t r = 0;
        do {
            r = ::waitpid(pid, &status, 0);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            MarkReaped(status);
        } else {
            const int err = errno;
            LOG_WARN("waitpid(pid={}) failed (errno={} msg={})", pid, err, ::strerror(err));
            reaped = true;
        }
    }

    bool WaitForExit(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (TryReap()) {
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(kReapPollInterval);
        }
    }

    void Signal(int sig) {
        if (::kill(pid, sig) != 0 && errno != ESRCH) {
            const int err = errno;
            LOG_WARN("kill(pid={}, {}) failed (errno={} msg={})", pid, sig, err, ::strerror(err));
        }
    }

private:
    void MarkReaped(int status) {
        reaped = true;
        exitCode = exitCodeFromStatus(status);
        LOG_INFO("Server process '{}' pid={} exited with code {}", command, pid, *exitCode);
    }
};

////////////////////////////////////////// ChildProcess //////////////////////////////////////////
ChildProcess::ChildProcess(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) {}

ChildProcess::~ChildProcess() {
    Terminate(kDestructorGrace);
    closeFd(pImpl->stdoutFd);
    closeFd(pImpl->stderrFd);
}

pid_t ChildProcess::Pid() const { return pImpl->pid; }
int ChildProcess::StdoutFd() const { return pImpl->stdoutFd; }
int ChildProcess::StderrFd() const { return pImpl->stderrFd; }

void ChildProcess::WriteAll(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(pImpl->stdinMutex);
    std::size_t total = 0;
    while (total < bytes.size()) {
        if (pImpl->stdinFd < 0 || pImpl->stdinClosing.load()) {
            throw SessionClosedError("server stdin is closed");
        }
        ssize_t w = ::write(pImpl->stdinFd, bytes.data() + total, bytes.size() - total);
        if (w > 0) {
            total += static_cast<std::size_t>(w);
            continue;
        }
        if (w < 0 && errno == EINTR) {
            continue;
        }
        if (w == 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
            // Pipe full: wait in short slices so CloseStdin can interrupt
            pollfd pfd{pImpl->stdinFd, POLLOUT, 0};
            if (::poll(&pfd, 1, 50) < 0 && errno != EINTR) {
                const int err = errno;
                throw SessionClosedError(std::format("poll on server stdin failed: {}", ::strerror(err)));
            }
            continue;
        }
        const int err = errno;
        throw SessionClosedError(std::format("write to server stdin failed: {}", ::strerror(err)));
    }
}

void ChildProcess::CloseStdin() {
    pImpl->stdinClosing.store(true);
    std::lock_guard<std::mutex> lock(pImpl->stdinMutex);
    closeFd(pImpl->stdinFd);
}

void ChildProcess::Terminate(std::chrono::milliseconds grace) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->terminateMutex);
    if (pImpl->terminated) {
        return;
    }
    pImpl->terminated = true;

    CloseStdin();
    if (pImpl->WaitForExit(grace)) {
        return;
    }
    LOG_WARN("Server process pid={} still running after {} ms; sending SIGTERM", pImpl->pid,
             static_cast<long long>(grace.count()));
    pImpl->Signal(SIGTERM);
    if (pImpl->WaitForExit(kTermWait)) {
        return;
    }
    LOG_WARN("Server process pid={} ignored SIGTERM; sending SIGKILL", pImpl->pid);
    pImpl->Signal(SIGKILL);
    pImpl->BlockingReap();
}

bool ChildProcess::IsRunning() {
    return !pImpl->TryReap();
}

std::optional<int> ChildProcess::ExitCode() const {
    std::lock_guard<std::mutex> lock(pImpl->reapMutex);
    return pImpl->exitCode;
}

////////////////////////////////////////// ProcessLauncher //////////////////////////////////////////
std::unique_ptr<ChildProcess> ProcessLauncher::Start(const std::string& command,
                                                     const std::vector<std::string>& args,
                                                     const std::map<std::string, std::string>& env,
                                                     const std::optional<std::string>& cwd) {
    FUNC_SCOPE();
    if (command.empty()) {
        throw ProcessSpawnError("no command configured for the server process");
    }
    ignoreSigpipeOnce();

    // Everything the child needs is prepared before fork
    std::vector<std::string> argvStore;
    argvStore.reserve(args.size() + 1);
    argvStore.push_back(command);
    argvStore.insert(argvStore.end(), args.begin(), args.end());
    std::vector<char*> argv = toCStrings(argvStore);
    std::vector<std::string> envStore = buildEnvironment(env);
    std::vector<char*> envp = toCStrings(envStore);
    const char* workDir = (cwd && !cwd->empty()) ? cwd->c_str() : nullptr;

    PipeFds stdinPipe;
    PipeFds stdoutPipe;
    PipeFds stderrPipe;
    PipeFds statusPipe;
    stdinPipe.Open("stdin");
    stdoutPipe.Open("stdout");
    stderrPipe.Open("stderr");
    statusPipe.Open("exec status");

    pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        throw ProcessSpawnError(std::format("fork failed: {}", ::strerror(err)), err);
    }

    if (pid == 0) {
        ::signal(SIGPIPE, SIG_DFL);
        childRedirect(stdinPipe.read, STDIN_FILENO, statusPipe.write);
        childRedirect(stdoutPipe.write, STDOUT_FILENO, statusPipe.write);
        childRedirect(stderrPipe.write, STDERR_FILENO, statusPipe.write);
        if (workDir != nullptr && ::chdir(workDir) != 0) {
            childFail(statusPipe.write, ChildStage::Chdir);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        childFail(statusPipe.write, ChildStage::Exec);
    }

    // Parent: drop the child's ends so EOF propagates correctly
    closeFd(stdinPipe.read);
    closeFd(stdoutPipe.write);
    closeFd(stderrPipe.write);
    closeFd(statusPipe.write);

    auto impl = std::make_unique<ChildProcess::Impl>();
    impl->command = command;
    impl->pid = pid;

    // The status pipe is close-on-exec: EOF means exec succeeded
    ExecFailure failure{};
    ssize_t n = 0;
    do {
        n = ::read(statusPipe.read, &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
        const int err = errno;
        LOG_WARN("ProcessLauncher: reading exec status failed (errno={} msg={})", err, ::strerror(err));
    }
    if (n == static_cast<ssize_t>(sizeof(failure))) {
        impl->BlockingReap();
        const std::string where = (failure.stage == static_cast<int>(ChildStage::Chdir) && workDir != nullptr)
                                      ? std::format(" (cwd '{}')", workDir)
                                      : std::string();
        LOG_ERROR("Cannot {} '{}'{}: {}", stageName(failure.stage), command, where, ::strerror(failure.err));
        throw ProcessSpawnError(
            std::format("cannot {} '{}'{}: {}", stageName(failure.stage), command, where, ::strerror(failure.err)),
            failure.err);
    }

    impl->stdinFd = stdinPipe.TakeWrite();
    impl->stdoutFd = stdoutPipe.TakeRead();
    impl->stderrFd = stderrPipe.TakeRead();
    int flags = ::fcntl(impl->stdinFd, F_GETFL);
    if (flags < 0 || ::fcntl(impl->stdinFd, F_SETFL, flags | O_NONBLOCK) < 0) {
        const int err = errno;
        LOG_WARN("ProcessLauncher: cannot make stdin pipe non-blocking (errno={} msg={})", err, ::strerror(err));
    }

    std::unique_ptr<ChildProcess> child(new ChildProcess(std::move(impl)));
    if (child->pImpl->WaitForExit(ImmediateExitWindow)) {
        const std::optional<int> code = child->ExitCode();
        const std::string codeText = code ? std::to_string(*code) : std::string("unknown");
        throw ProcessSpawnError(std::format("server '{}' exited immediately with code {}", command, codeText));
    }

    LOG_INFO("Started server process '{}' pid={}", command, pid);
    return child;
}

} // namespace mcpsession

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessLauncher.hpp
// Purpose: Spawns an MCP server child process with piped stdio and manages its shutdown
//==========================================================================================================

#pragma once

#include <sys/types.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpsession {

//==========================================================================================================
// ChildProcess
// Purpose: Live handles to a spawned server: its pid, the write end of its stdin, and the read ends of its
//          stdout and stderr.
// Notes:
//   - The stdin handle is guarded internally; WriteAll and CloseStdin may be called from different threads.
//     CloseStdin interrupts a WriteAll blocked on a full pipe.
//   - StdoutFd/StderrFd stay open until destruction so a reader thread can keep polling them after
//     Terminate. Destroy only once that reader has stopped.
//   - Terminate is idempotent; the destructor calls it with a short grace period when nobody did.
//==========================================================================================================
class ChildProcess {
public:
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ~ChildProcess();

    pid_t Pid() const;
    int StdoutFd() const;
    int StderrFd() const;

    //==========================================================================================================
    // WriteAll
    // Purpose: Writes every byte to the child's stdin, retrying short writes and EINTR.
    // Throws:
    //   errors::SessionClosedError when stdin was closed or the pipe broke (child exited).
    //==========================================================================================================
    void WriteAll(const std::string& bytes);

    // Closes the child's stdin (end of input for a well-behaved server). No-op when already closed.
    void CloseStdin();

    //==========================================================================================================
    // Terminate
    // Purpose: Shutdown sequence: close stdin, wait up to grace for a voluntary exit, SIGTERM, wait 500 ms,
    //          SIGKILL, reap. A second call returns immediately.
    //==========================================================================================================
    void Terminate(std::chrono::milliseconds grace);

    // Non-blocking liveness check; reaps the child when it has exited.
    bool IsRunning();

    // Exit code once reaped: the status for a normal exit, 128 + signal number for a signal death.
    std::optional<int> ExitCode() const;

private:
    friend class ProcessLauncher;
    struct Impl;
    explicit ChildProcess(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ProcessLauncher
// Purpose: Starts a server process.
//==========================================================================================================
class ProcessLauncher {
public:
    //==========================================================================================================
    // Start
    // Purpose: Spawns command with args, inheriting the parent environment overlaid with env and, when
    //          given, running in cwd.
    // Args:
    //   command: Executable name (resolved through PATH) or path.
    //   args: Arguments after argv[0].
    //   env: Entries that override or extend the inherited environment.
    //   cwd: Optional working directory for the child.
    // Returns:
    //   The running child.
    // Throws:
    //   errors::ProcessSpawnError when pipes cannot be created, fork fails, the working directory or the
    //   executable cannot be used (carrying the child's errno), or the process exits right away.
    //==========================================================================================================
    static std::unique_ptr<ChildProcess> Start(const std::string& command,
                                               const std::vector<std::string>& args,
                                               const std::map<std::string, std::string>& env = {},
                                               const std::optional<std::string>& cwd = std::nullopt);

    // Window after a successful exec during which an exit counts as a failed start.
    static constexpr std::chrono::milliseconds ImmediateExitWindow{100};
};

} // namespace mcpsession

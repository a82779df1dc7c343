#pragma once

#include <chrono>
#include <string>
#include <core/types.hpp>
#include "connection_manager.hpp"

// Runs sanitized commands on the managed connection.
//
// With an elevated shell available the command is typed into it and output
// is collected up to the next root prompt; exit status is not observable
// there and is reported as 0. Otherwise each command gets its own exec
// channel. On an exec-channel timeout a `pkill -f` for the command is sent
// in the background and the caller gets a Timeout error right away.
class CommandExecutor {
public:
    explicit CommandExecutor(ConnectionManager& connection);

    Result<CommandOutput> exec_command(const std::string& command, std::chrono::milliseconds timeout);

private:
    Result<CommandOutput> exec_via_elevated_shell(const std::string& command,
                                                  std::chrono::milliseconds timeout);
    Result<CommandOutput> exec_via_channel(const std::string& command,
                                           std::chrono::milliseconds timeout);

    ConnectionManager& connection_;
};

// Best-effort kill of a command that outlived its timeout: runs
// `timeout 3s pkill -f '<command>' 2>/dev/null || true` on a fresh channel
// and waits up to ABORT_TIMEOUT_MS. Failures are logged only.
void abort_remote_command(ChannelSource& source, const std::string& command);

// The remote kill command for `command`.
std::string build_abort_command(const std::string& command);

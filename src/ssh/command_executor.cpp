#include "command_executor.hpp"
#include "expect.hpp"
#include "shell_escape.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

using Clock = std::chrono::steady_clock;

static std::chrono::milliseconds until(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

CommandExecutor::CommandExecutor(ConnectionManager& connection)
    : connection_(connection) {
}

Result<CommandOutput> CommandExecutor::exec_command(const std::string& command,
                                                    std::chrono::milliseconds timeout) {
    auto connected = connection_.ensure_connected();
    if (connected.is_err()) {
        return Result<CommandOutput>::from(connected);
    }

    auto& elevation = connection_.elevation();
    if (elevation.is_elevated() && elevation.has_channel()) {
        log_debug(fmt::format("Executing via elevated shell: {}", command));
        return exec_via_elevated_shell(command, timeout);
    }

    log_debug(fmt::format("Executing via exec channel: {}", command));
    return exec_via_channel(command, timeout);
}

Result<CommandOutput> CommandExecutor::exec_via_elevated_shell(const std::string& command,
                                                               std::chrono::milliseconds timeout) {
    using R = Result<CommandOutput>;
    auto& elevation = connection_.elevation();
    auto deadline = deadline_after(timeout);

    // Commands on the root shell run one at a time
    std::unique_ptr<SshChannel> channel = elevation.take_channel(timeout);
    if (!channel) {
        if (Clock::now() >= deadline) {
            return R::Timeout(static_cast<uint64_t>(timeout.count()));
        }
        return R::Err(ErrorKind::Connection, "No su channel available");
    }

    channel->drain();

    auto sent = channel->write(command + "\n");
    if (sent.is_err()) {
        elevation.return_channel(std::move(channel));
        return R::Err(ErrorKind::Connection, "Failed to send command: " + sent.error);
    }

    CommandCompletionScanner scanner;
    while (true) {
        auto left = until(deadline);
        if (left.count() == 0) {
            elevation.return_channel(std::move(channel));
            log_warn(fmt::format("Elevated command timed out after {}ms", timeout.count()));
            return R::Timeout(static_cast<uint64_t>(timeout.count()));
        }

        auto ev = channel->read(std::min(left, std::chrono::milliseconds(CHANNEL_READ_POLL_MS)));
        if (ev.is_err()) {
            channel->close();
            elevation.drop_channel(channel.get());
            return R::Err(ErrorKind::Connection, "Channel ended during command execution: " + ev.error);
        }

        switch (ev.value.kind) {
        case ChannelEvent::Kind::Data:
        case ChannelEvent::Kind::ExtendedData:
            if (scanner.feed(ev.value.data)) {
                elevation.return_channel(std::move(channel));
                CommandOutput out;
                out.stdout_data = scanner.output();
                out.exit_code = 0;
                return R::Ok(std::move(out));
            }
            break;
        case ChannelEvent::Kind::Eof:
        case ChannelEvent::Kind::ExitStatus:
        case ChannelEvent::Kind::Closed:
            channel->close();
            elevation.drop_channel(channel.get());
            return R::Err(ErrorKind::Connection, "Channel closed during command execution");
        case ChannelEvent::Kind::None:
            break;
        }
    }
}

Result<CommandOutput> CommandExecutor::exec_via_channel(const std::string& command,
                                                        std::chrono::milliseconds timeout) {
    using R = Result<CommandOutput>;
    auto deadline = deadline_after(timeout);

    auto opened = connection_.open_channel();
    if (opened.is_err()) return R::from(opened);
    std::unique_ptr<SshChannel> channel = std::move(opened.value);

    auto started = channel->exec(command);
    if (started.is_err()) {
        channel->close();
        return R::from(started);
    }

    CommandOutput out;
    bool done = false;
    while (!done) {
        auto left = until(deadline);
        if (left.count() == 0) {
            log_warn(fmt::format("Command timed out after {}ms, attempting abort", timeout.count()));
            // Closing waits on the remote end, so it happens off the caller's path
            std::shared_ptr<SshChannel> abandoned = std::move(channel);
            ConnectionManager* conn = &connection_;
            connection_.spawn_background([conn, command, abandoned] {
                abandoned->close();
                abort_remote_command(*conn, command);
            });
            return R::Timeout(static_cast<uint64_t>(timeout.count()));
        }

        auto ev = channel->read(std::min(left, std::chrono::milliseconds(CHANNEL_READ_POLL_MS)));
        if (ev.is_err()) {
            channel->close();
            return R::from(ev);
        }

        switch (ev.value.kind) {
        case ChannelEvent::Kind::Data:
            out.stdout_data += ev.value.data;
            break;
        case ChannelEvent::Kind::ExtendedData:
            if (ev.value.stream_id == 1) {
                out.stderr_data += ev.value.data;
            } else {
                out.stdout_data += ev.value.data;
            }
            break;
        case ChannelEvent::Kind::ExitStatus:
            out.exit_code = ev.value.exit_status;
            break;
        case ChannelEvent::Kind::Closed:
            done = true;
            break;
        case ChannelEvent::Kind::Eof:
        case ChannelEvent::Kind::None:
            break;
        }
    }

    channel->close();
    log_debug(fmt::format("Command completed: exit_code={}, stdout_len={}, stderr_len={}",
                          out.exit_code ? std::to_string(*out.exit_code) : "none",
                          out.stdout_data.size(), out.stderr_data.size()));
    return R::Ok(std::move(out));
}

std::string build_abort_command(const std::string& command) {
    return fmt::format(ABORT_COMMAND_FMT, escape_for_shell(command));
}

void abort_remote_command(ChannelSource& source, const std::string& command) {
    std::string abort_cmd = build_abort_command(command);
    log_debug(fmt::format("Sending abort: {}", abort_cmd));

    auto opened = source.open_channel();
    if (opened.is_err()) {
        log_warn(fmt::format("Abort skipped, no channel: {}", opened.describe()));
        return;
    }
    std::unique_ptr<SshChannel> channel = std::move(opened.value);

    auto started = channel->exec(abort_cmd);
    if (started.is_err()) {
        log_warn(fmt::format("Abort command failed to start: {}", started.describe()));
        channel->close();
        return;
    }

    auto deadline = deadline_after(std::chrono::milliseconds(ABORT_TIMEOUT_MS));
    while (true) {
        auto left = until(deadline);
        if (left.count() == 0) {
            log_warn("Abort command did not finish in time");
            break;
        }
        auto ev = channel->read(std::min(left, std::chrono::milliseconds(CHANNEL_READ_POLL_MS)));
        if (ev.is_err()) {
            log_warn(fmt::format("Abort command failed: {}", ev.describe()));
            break;
        }
        if (ev.value.kind == ChannelEvent::Kind::Closed) {
            log_debug("Abort command completed");
            break;
        }
    }
    channel->close();
}

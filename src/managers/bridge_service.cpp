#include "bridge_service.hpp"
#include <core/log.hpp>
#include <ssh/sanitize.hpp>
#include <ssh/shell_escape.hpp>
#include <fmt/format.h>

BridgeService::BridgeService(const Config& config, std::shared_ptr<Transport> transport)
    : config_(config),
      connection_(config.connection(), std::move(transport)),
      executor_(connection_) {
}

BridgeService::~BridgeService() {
    shutdown();
}

// ── Operations ────────────────────────────────────────────────

ToolReply BridgeService::exec(const std::string& command) {
    log_debug(fmt::format("exec: {}", command));

    auto sanitized = sanitize_command(command, config_.max_chars());
    if (sanitized.is_err()) {
        log_error(fmt::format("Command sanitization failed: {}", sanitized.describe()));
        return {true, "Error: " + sanitized.describe()};
    }

    auto connected = connection_.ensure_connected();
    if (connected.is_err()) {
        log_error(fmt::format("Failed to ensure SSH connection: {}", connected.describe()));
        return {true, "SSH connection error: " + connected.describe()};
    }

    if (config_.connection().su_password) {
        auto elevated = connection_.ensure_elevated();
        if (elevated.is_err()) {
            log_debug(fmt::format("Elevation failed, will run as normal user: {}", elevated.describe()));
        }
    }

    return run(sanitized.value);
}

ToolReply BridgeService::sudo_exec(const std::string& command) {
    if (config_.disable_sudo()) {
        return {true, "Error: sudo-exec is disabled"};
    }
    log_debug("sudo-exec requested");

    auto sanitized = sanitize_command(command, config_.max_chars());
    if (sanitized.is_err()) {
        log_error(fmt::format("Command sanitization failed: {}", sanitized.describe()));
        return {true, "Error: " + sanitized.describe()};
    }

    auto connected = connection_.ensure_connected();
    if (connected.is_err()) {
        log_error(fmt::format("Failed to ensure SSH connection: {}", connected.describe()));
        return {true, "SSH connection error: " + connected.describe()};
    }

    // The wrapped form may carry the sudo password; never log it
    std::string wrapped = wrap_sudo_command(sanitized.value, config_.connection().sudo_password);
    log_debug(fmt::format("Wrapped sudo command: {}", sanitized.value));

    return run(wrapped);
}

Result<void> BridgeService::elevate() {
    auto connected = connection_.ensure_connected();
    if (connected.is_err()) return connected;
    return connection_.ensure_elevated();
}

void BridgeService::shutdown() {
    connection_.close();
}

// ── Helpers ───────────────────────────────────────────────────

ToolReply BridgeService::run(const std::string& remote_command) {
    auto result = executor_.exec_command(remote_command,
                                         std::chrono::milliseconds(config_.timeout_ms()));
    if (result.is_err()) {
        log_error(fmt::format("Command execution failed: {}", result.describe()));
        return {true, "Error: " + result.describe()};
    }

    const CommandOutput& out = result.value;
    bool failed = out.exit_code && *out.exit_code != 0;
    return {failed, format_output(out)};
}

std::string BridgeService::format_output(const CommandOutput& output) {
    std::string text = output.stdout_data;
    if (!output.stderr_data.empty()) {
        if (!text.empty()) {
            text += "\n--- stderr ---\n";
        }
        text += output.stderr_data;
    }
    return text;
}

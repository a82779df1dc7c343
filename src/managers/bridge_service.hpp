#pragma once

#include <memory>
#include <string>
#include <core/config.hpp>
#include <ssh/command_executor.hpp>
#include <ssh/connection_manager.hpp>
#include <ssh/transport.hpp>

// Reply to one exec / sudo-exec request. `text` is what the user sees.
struct ToolReply {
    bool is_error = false;
    std::string text;
};

// The two remote operations the bridge offers, on top of one lazily
// opened connection. Never fails outward: every problem becomes an error
// reply.
class BridgeService {
public:
    BridgeService(const Config& config, std::shared_ptr<Transport> transport);
    ~BridgeService();

    // Run as the login user (or on the root shell when one is up).
    ToolReply exec(const std::string& command);

    // Run through sudo with the configured sudo password, if any.
    ToolReply sudo_exec(const std::string& command);

    Result<void> connect() { return connection_.ensure_connected(); }
    Result<void> elevate();
    bool is_connected() const { return connection_.is_connected(); }
    bool is_elevated() const { return connection_.is_elevated(); }
    bool sudo_enabled() const { return !config_.disable_sudo(); }
    const Config& config() const { return config_; }

    void shutdown();

    // Join stdout and stderr the way replies show them.
    static std::string format_output(const CommandOutput& output);

private:
    ToolReply run(const std::string& remote_command);

    Config config_;
    ConnectionManager connection_;
    CommandExecutor executor_;
};

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <core/types.hpp>

// One unit of channel traffic, as seen by the command and elevation loops.
struct ChannelEvent {
    enum class Kind {
        None,          // read wait elapsed with nothing to report
        Data,          // stdout / PTY bytes
        ExtendedData,  // extended stream; stream_id 1 is stderr
        ExitStatus,
        Eof,
        Closed,
    };

    Kind kind = Kind::None;
    std::string data;
    int stream_id = 0;
    int exit_status = 0;

    static ChannelEvent none() { return {}; }
    static ChannelEvent stdout_data(std::string d) { return {Kind::Data, std::move(d), 0, 0}; }
    static ChannelEvent stderr_data(std::string d) { return {Kind::ExtendedData, std::move(d), 1, 0}; }
    static ChannelEvent exit(int status) { return {Kind::ExitStatus, "", 0, status}; }
    static ChannelEvent eof() { return {Kind::Eof, "", 0, 0}; }
    static ChannelEvent closed() { return {Kind::Closed, "", 0, 0}; }
};

class SshChannel {
public:
    virtual ~SshChannel() = default;

    virtual Result<void> request_pty(const std::string& term, int cols, int rows) = 0;
    virtual Result<void> request_shell() = 0;
    virtual Result<void> exec(const std::string& command) = 0;
    virtual Result<void> write(const std::string& data) = 0;

    // Wait up to `wait` for the next event; Kind::None when nothing arrived.
    virtual Result<ChannelEvent> read(std::chrono::milliseconds wait) = 0;

    // Discard bytes already buffered on the channel.
    virtual void drain() = 0;

    virtual Result<void> send_eof() = 0;
    virtual void close() = 0;
};

// An authenticated (or authenticating) SSH session.
class SshSession {
public:
    virtual ~SshSession() = default;

    virtual Result<void> auth_password(const std::string& user, const std::string& password) = 0;
    virtual Result<void> auth_publickey(const std::string& user, const std::string& key_material) = 0;
    virtual Result<std::unique_ptr<SshChannel>> open_channel() = 0;
    virtual void disconnect() = 0;
};

// Produces connected, handshaken, not-yet-authenticated sessions.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<std::unique_ptr<SshSession>> open(const std::string& host, int port,
                                                     std::chrono::milliseconds timeout) = 0;
};

// Anything that can hand out channels on the live session.
class ChannelSource {
public:
    virtual ~ChannelSource() = default;
    virtual Result<std::unique_ptr<SshChannel>> open_channel() = 0;
};

#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <vector>
#include <core/types.hpp>
#include "elevation.hpp"
#include "transport.hpp"

// Owns the one SSH session to the target host.
//
// connect() is single-flight: the first caller does the work, later callers
// poll until it finishes and share the outcome. When an su password is
// configured a root shell is opened right after login; if that fails the
// connection still succeeds and commands run unprivileged.
//
// Lock order: session_mutex_ is never held while calling into the
// ElevationEngine.
class ConnectionManager : public ChannelSource {
public:
    ConnectionManager(ConnectionConfig config, std::shared_ptr<Transport> transport);
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    Result<void> connect();
    Result<void> ensure_connected();
    bool is_connected() const;

    // New channel on the live session.
    Result<std::unique_ptr<SshChannel>> open_channel() override;

    // Joins background tasks, tears down the elevated shell, then the
    // session. Safe to call repeatedly.
    void close();

    Result<void> ensure_elevated() { return elevation_.ensure_elevated(); }
    bool is_elevated() const { return elevation_.is_elevated(); }
    ElevationEngine& elevation() { return elevation_; }

    const ConnectionConfig& config() const { return config_; }

    // Fire-and-forget work (timeout aborts). Outcomes are only logged;
    // close() waits for all of them.
    void spawn_background(std::function<void()> task);
    void wait_background();

private:
    Result<void> establish();

    ConnectionConfig config_;
    std::shared_ptr<Transport> transport_;

    mutable std::mutex session_mutex_;
    std::unique_ptr<SshSession> session_;

    std::atomic<bool> connecting_{false};

    ElevationEngine elevation_;

    std::mutex background_mutex_;
    std::vector<std::future<void>> background_;
};

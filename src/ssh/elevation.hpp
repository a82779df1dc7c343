#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "transport.hpp"

// Owns the root shell obtained by running `su -` on a PTY channel.
//
// The elevated channel is borrowed for each command: take_channel() hands
// it out and blocks other borrowers until return_channel() or
// drop_channel(). While borrowed it still counts as present.
class ElevationEngine {
public:
    ElevationEngine(ChannelSource& source, std::optional<std::string> su_password,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(ELEVATION_TIMEOUT_MS));
    ~ElevationEngine();

    ElevationEngine(const ElevationEngine&) = delete;
    ElevationEngine& operator=(const ElevationEngine&) = delete;

    // No-op when already elevated. Concurrent callers are serialized and a
    // caller that waited re-checks before starting a second login.
    Result<void> ensure_elevated();

    bool is_elevated() const { return elevated_.load(); }
    bool has_channel() const;
    bool has_password() const { return password_.has_value(); }

    // Borrow the elevated channel, waiting up to `wait` while another
    // command holds it. Returns nullptr if none is available in time.
    std::unique_ptr<SshChannel> take_channel(std::chrono::milliseconds wait);
    void return_channel(std::unique_ptr<SshChannel> channel);

    // The borrowed channel died: forget it and clear the elevated flag.
    // Ignored when `channel` is not the one currently lent out, so a shell
    // from before a teardown cannot discard its replacement.
    void drop_channel(const SshChannel* channel);

    // Send EOF (errors ignored), close, clear the flag.
    void teardown();

private:
    Result<std::unique_ptr<SshChannel>> run_su_login();

    ChannelSource& source_;
    std::optional<std::string> password_;
    std::chrono::milliseconds timeout_;

    std::mutex elevate_mutex_;

    mutable std::mutex channel_mutex_;
    std::condition_variable channel_cv_;
    std::unique_ptr<SshChannel> channel_;
    bool borrowed_ = false;
    const SshChannel* lent_ = nullptr;

    std::atomic<bool> elevated_{false};
};

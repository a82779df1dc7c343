#include "elevation.hpp"
#include "expect.hpp"
#include "shell_escape.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

using Clock = std::chrono::steady_clock;

ElevationEngine::ElevationEngine(ChannelSource& source, std::optional<std::string> su_password,
                                 std::chrono::milliseconds timeout)
    : source_(source), password_(std::move(su_password)), timeout_(timeout) {
}

ElevationEngine::~ElevationEngine() {
    teardown();
}

bool ElevationEngine::has_channel() const {
    std::lock_guard<std::mutex> lock(channel_mutex_);
    return channel_ != nullptr || borrowed_;
}

Result<void> ElevationEngine::ensure_elevated() {
    if (is_elevated() && has_channel()) {
        return Result<void>::Ok();
    }
    if (!password_) {
        return Result<void>::Err(ErrorKind::ElevationFailed, "No su_password configured");
    }
    if (!is_valid_password(*password_)) {
        return Result<void>::Err(ErrorKind::ElevationFailed, "su_password is blank or contains NUL bytes");
    }

    std::lock_guard<std::mutex> elevate_lock(elevate_mutex_);

    // Another caller may have finished the login while we waited
    if (is_elevated() && has_channel()) {
        return Result<void>::Ok();
    }

    // A leftover channel that is not elevated is useless; replace it
    teardown();

    log_info("Starting su elevation");
    auto login = run_su_login();
    if (login.is_err()) {
        elevated_.store(false);
        log_warn(fmt::format("su elevation failed: {}", login.describe()));
        return Result<void>::from(login);
    }

    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        channel_ = std::move(login.value);
        borrowed_ = false;
        lent_ = nullptr;
    }
    elevated_.store(true);
    channel_cv_.notify_all();
    log_info("Elevated root shell ready");
    return Result<void>::Ok();
}

Result<std::unique_ptr<SshChannel>> ElevationEngine::run_su_login() {
    using R = Result<std::unique_ptr<SshChannel>>;

    auto opened = source_.open_channel();
    if (opened.is_err()) return opened;
    std::unique_ptr<SshChannel> channel = std::move(opened.value);

    auto fail = [&channel](const std::string& msg) {
        channel->close();
        return R::Err(ErrorKind::ElevationFailed, msg);
    };

    auto pty = channel->request_pty(PTY_TERM, PTY_COLS, PTY_ROWS);
    if (pty.is_err()) return fail("Failed to request PTY: " + pty.error);

    auto shell = channel->request_shell();
    if (shell.is_err()) return fail("Failed to request shell: " + shell.error);

    auto su = channel->write(SU_COMMAND);
    if (su.is_err()) return fail("Failed to send su command: " + su.error);

    ElevationScanner scanner;
    auto deadline = deadline_after(timeout_);

    while (true) {
        auto now = Clock::now();
        if (now >= deadline) {
            return fail("su elevation timed out");
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto ev = channel->read(std::min(left, std::chrono::milliseconds(CHANNEL_READ_POLL_MS)));
        if (ev.is_err()) {
            return fail("Channel ended before elevation completed: " + ev.error);
        }

        switch (ev.value.kind) {
        case ChannelEvent::Kind::Data:
        case ChannelEvent::Kind::ExtendedData: {
            auto verdict = scanner.feed(ev.value.data);
            log_debug(fmt::format("su buffer: {}", scanner.buffer()));

            if (verdict == ElevationScanner::Verdict::SendPassword) {
                log_debug("Password prompt detected, sending password");
                auto w = channel->write(*password_ + "\n");
                if (w.is_err()) return fail("Failed to send password: " + w.error);
                scanner.password_sent();
            } else if (verdict == ElevationScanner::Verdict::Elevated) {
                log_debug("Root prompt detected");
                return R::Ok(std::move(channel));
            } else if (verdict == ElevationScanner::Verdict::Failed) {
                return fail("su authentication failed: " + scanner.buffer());
            }
            break;
        }
        case ChannelEvent::Kind::Eof:
        case ChannelEvent::Kind::ExitStatus:
        case ChannelEvent::Kind::Closed:
            return fail("Channel closed before elevation completed");
        case ChannelEvent::Kind::None:
            break;
        }
    }
}

std::unique_ptr<SshChannel> ElevationEngine::take_channel(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(channel_mutex_);
    if (!channel_cv_.wait_until(lock, deadline_after(wait), [this] { return !borrowed_; })) {
        return nullptr;
    }
    if (!channel_) return nullptr;
    borrowed_ = true;
    lent_ = channel_.get();
    return std::move(channel_);
}

void ElevationEngine::return_channel(std::unique_ptr<SshChannel> channel) {
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        // A shell from before a teardown never goes back into the slot
        if (channel && channel.get() == lent_) {
            borrowed_ = false;
            lent_ = nullptr;
            if (elevated_.load() && !channel_) {
                channel_ = std::move(channel);
            }
        }
    }
    channel_cv_.notify_all();

    // Torn down while borrowed
    if (channel) channel->close();
}

void ElevationEngine::drop_channel(const SshChannel* channel) {
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        if (channel == nullptr || channel != lent_) {
            log_debug("Ignoring loss of a stale elevated shell");
            return;
        }
        borrowed_ = false;
        lent_ = nullptr;
        channel_.reset();
        elevated_.store(false);
    }
    channel_cv_.notify_all();
    log_warn("Elevated shell lost; falling back to exec channels");
}

void ElevationEngine::teardown() {
    std::unique_ptr<SshChannel> channel;
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        channel = std::move(channel_);
    }
    elevated_.store(false);
    if (!channel) return;

    auto eof = channel->send_eof();
    if (eof.is_err()) {
        log_debug(fmt::format("Ignoring EOF failure on elevated shell: {}", eof.error));
    }
    channel->close();
    log_debug("Elevated shell closed");
}

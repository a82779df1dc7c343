#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <mutex>

using Clock = std::chrono::steady_clock;

namespace {

std::once_flag g_libssh2_init;
int g_libssh2_init_rc = 0;

// Shared by a session and every channel opened on it, so the raw handle
// outlives whichever of them is released last.
struct SessionCore {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = SSHBRIDGE_INVALID_SOCKET;
    std::mutex io;
    bool disconnected = false;  // guarded by io

    ~SessionCore() {
        if (session) libssh2_session_free(session);
        platform::close_socket(sock);
    }
};

std::string last_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : "unknown error";
}

int remaining_ms(Clock::time_point deadline) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return ms > 0 ? static_cast<int>(ms) : 0;
}

// Run one libssh2 call, retrying on EAGAIN until it completes or the
// deadline passes. The io lock is held per attempt only.
template <typename Fn>
int call_nonblocking(SessionCore& core, Fn fn, Clock::time_point deadline) {
    while (true) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(core.io);
            if (core.disconnected) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        int left = remaining_ms(deadline);
        if (left == 0) return LIBSSH2_ERROR_TIMEOUT;
        platform::poll_socket(core.sock, POLLIN | POLLOUT, std::min(left, SOCKET_POLL_MS));
    }
}

// ── Channel ──────────────────────────────────────────────────────────

class Libssh2Channel : public SshChannel {
public:
    Libssh2Channel(std::shared_ptr<SessionCore> core, LIBSSH2_CHANNEL* channel)
        : core_(std::move(core)), channel_(channel) {}

    ~Libssh2Channel() override { close(); }

    Result<void> request_pty(const std::string& term, int cols, int rows) override {
        if (!channel_) return closed_error();
        int rc = call_nonblocking(*core_, [&] {
            return libssh2_channel_request_pty_ex(channel_, term.c_str(),
                                                  static_cast<unsigned int>(term.size()),
                                                  nullptr, 0, cols, rows, 0, 0);
        }, deadline());
        if (rc != 0) {
            return Result<void>::Err(ErrorKind::Connection, fmt::format("PTY request failed ({})", rc));
        }
        return Result<void>::Ok();
    }

    Result<void> request_shell() override {
        if (!channel_) return closed_error();
        int rc = call_nonblocking(*core_, [&] { return libssh2_channel_shell(channel_); }, deadline());
        if (rc != 0) {
            return Result<void>::Err(ErrorKind::Connection, fmt::format("Shell request failed ({})", rc));
        }
        return Result<void>::Ok();
    }

    Result<void> exec(const std::string& command) override {
        if (!channel_) return closed_error();
        int rc = call_nonblocking(*core_, [&] {
            return libssh2_channel_exec(channel_, command.c_str());
        }, deadline());
        if (rc != 0) {
            return Result<void>::Err(ErrorKind::Connection, fmt::format("Failed to exec command ({})", rc));
        }
        return Result<void>::Ok();
    }

    Result<void> write(const std::string& data) override {
        if (!channel_) return closed_error();
        auto until = deadline();
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t w;
            {
                std::lock_guard<std::mutex> lock(core_->io);
                if (core_->disconnected) return closed_error();
                w = libssh2_channel_write(channel_, data.data() + sent, data.size() - sent);
            }
            if (w == LIBSSH2_ERROR_EAGAIN) {
                int left = remaining_ms(until);
                if (left == 0) {
                    return Result<void>::Err(ErrorKind::Connection, "Write stalled (EAGAIN for too long)");
                }
                platform::poll_socket(core_->sock, POLLOUT, std::min(left, SOCKET_POLL_MS));
                continue;
            }
            if (w < 0) {
                return Result<void>::Err(ErrorKind::Connection,
                    fmt::format("Channel write error ({})", static_cast<int>(w)));
            }
            sent += static_cast<size_t>(w);
        }
        return Result<void>::Ok();
    }

    Result<ChannelEvent> read(std::chrono::milliseconds wait) override {
        if (!channel_ || closed_) return Result<ChannelEvent>::Ok(ChannelEvent::closed());

        auto until = Clock::now() + wait;
        char buf[SSH_READ_BUF_SIZE];

        while (true) {
            ssize_t n;
            int eof;
            {
                std::lock_guard<std::mutex> lock(core_->io);
                if (core_->disconnected) {
                    return Result<ChannelEvent>::Err(ErrorKind::Connection, "Session disconnected");
                }
                n = libssh2_channel_read(channel_, buf, sizeof(buf));
                if (n > 0) {
                    return Result<ChannelEvent>::Ok(ChannelEvent::stdout_data(std::string(buf, n)));
                }
                ssize_t e = libssh2_channel_read_stderr(channel_, buf, sizeof(buf));
                if (e > 0) {
                    return Result<ChannelEvent>::Ok(ChannelEvent::stderr_data(std::string(buf, e)));
                }
                eof = libssh2_channel_eof(channel_);
            }

            if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                return Result<ChannelEvent>::Err(ErrorKind::Connection,
                    fmt::format("SSH channel read error ({})", static_cast<int>(n)));
            }

            if (eof) {
                if (!eof_reported_) {
                    eof_reported_ = true;
                    return Result<ChannelEvent>::Ok(ChannelEvent::eof());
                }
                if (!exit_reported_) {
                    exit_reported_ = true;
                    int status = finish();
                    return Result<ChannelEvent>::Ok(ChannelEvent::exit(status));
                }
                closed_ = true;
                return Result<ChannelEvent>::Ok(ChannelEvent::closed());
            }

            int left = remaining_ms(until);
            if (left == 0) return Result<ChannelEvent>::Ok(ChannelEvent::none());
            platform::poll_socket(core_->sock, POLLIN, std::min(left, SOCKET_POLL_MS));
        }
    }

    void drain() override {
        if (!channel_) return;
        char buf[SSH_DRAIN_BUF_SIZE];
        std::lock_guard<std::mutex> lock(core_->io);
        if (core_->disconnected) return;
        while (libssh2_channel_read(channel_, buf, sizeof(buf)) > 0) {}
        while (libssh2_channel_read_stderr(channel_, buf, sizeof(buf)) > 0) {}
    }

    Result<void> send_eof() override {
        if (!channel_) return closed_error();
        int rc = call_nonblocking(*core_, [&] { return libssh2_channel_send_eof(channel_); },
                                  Clock::now() + std::chrono::seconds(5));
        if (rc != 0) {
            return Result<void>::Err(ErrorKind::Connection, fmt::format("Failed to send EOF ({})", rc));
        }
        return Result<void>::Ok();
    }

    void close() override {
        if (!channel_) return;
        if (!close_sent_) {
            close_sent_ = true;
            call_nonblocking(*core_, [&] { return libssh2_channel_close(channel_); },
                             Clock::now() + std::chrono::seconds(2));
        }
        std::lock_guard<std::mutex> lock(core_->io);
        libssh2_channel_free(channel_);
        channel_ = nullptr;
    }

private:
    std::shared_ptr<SessionCore> core_;
    LIBSSH2_CHANNEL* channel_;
    bool eof_reported_ = false;
    bool exit_reported_ = false;
    bool closed_ = false;
    bool close_sent_ = false;

    static Clock::time_point deadline() {
        return Clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    }

    static Result<void> closed_error() {
        return Result<void>::Err(ErrorKind::Connection, "Channel is closed");
    }

    // Close our side and collect the exit status.
    int finish() {
        close_sent_ = true;
        int rc = call_nonblocking(*core_, [&] { return libssh2_channel_close(channel_); },
                                  Clock::now() + std::chrono::seconds(5));
        if (rc != 0) return 0;
        std::lock_guard<std::mutex> lock(core_->io);
        return libssh2_channel_get_exit_status(channel_);
    }
};

// ── Session ──────────────────────────────────────────────────────────

class Libssh2Session : public SshSession {
public:
    explicit Libssh2Session(std::shared_ptr<SessionCore> core) : core_(std::move(core)) {}

    ~Libssh2Session() override { disconnect(); }

    Result<void> auth_password(const std::string& user, const std::string& password) override {
        int rc = call_nonblocking(*core_, [&] {
            return libssh2_userauth_password(core_->session, user.c_str(), password.c_str());
        }, auth_deadline());

        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_AUTHENTICATION_FAILED || rc == LIBSSH2_ERROR_PASSWORD_EXPIRED) {
            return Result<void>::Err(ErrorKind::Authentication, "Password authentication rejected");
        }
        return Result<void>::Err(ErrorKind::Authentication,
            fmt::format("Password authentication error: {}", session_error()));
    }

    Result<void> auth_publickey(const std::string& user, const std::string& key_material) override {
        int rc = call_nonblocking(*core_, [&] {
            return libssh2_userauth_publickey_frommemory(core_->session,
                                                         user.c_str(), user.size(),
                                                         nullptr, 0,
                                                         key_material.c_str(), key_material.size(),
                                                         nullptr);
        }, auth_deadline());

        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_FILE || rc == LIBSSH2_ERROR_METHOD_NOT_SUPPORTED) {
            return Result<void>::Err(ErrorKind::SshKey,
                fmt::format("Failed to parse private key: {}", session_error()));
        }
        if (rc == LIBSSH2_ERROR_AUTHENTICATION_FAILED || rc == LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED) {
            return Result<void>::Err(ErrorKind::Authentication, "Key authentication rejected");
        }
        return Result<void>::Err(ErrorKind::Authentication,
            fmt::format("Key authentication error: {}", session_error()));
    }

    Result<std::unique_ptr<SshChannel>> open_channel() override {
        using R = Result<std::unique_ptr<SshChannel>>;
        auto until = Clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);

        while (true) {
            LIBSSH2_CHANNEL* ch = nullptr;
            int err = 0;
            {
                std::lock_guard<std::mutex> lock(core_->io);
                if (core_->disconnected) {
                    return R::Err(ErrorKind::Connection, "SSH connection not established");
                }
                ch = libssh2_channel_open_session(core_->session);
                if (!ch) err = libssh2_session_last_errno(core_->session);
            }
            if (ch) {
                return R::Ok(std::make_unique<Libssh2Channel>(core_, ch));
            }
            if (err != LIBSSH2_ERROR_EAGAIN) {
                return R::Err(ErrorKind::Connection,
                    fmt::format("Failed to open channel: {}", session_error()));
            }
            int left = remaining_ms(until);
            if (left == 0) {
                return R::Err(ErrorKind::Connection, "Timed out opening channel");
            }
            platform::poll_socket(core_->sock, POLLIN, std::min(left, SOCKET_POLL_MS));
        }
    }

    void disconnect() override {
        call_nonblocking(*core_, [&] {
            return libssh2_session_disconnect(core_->session, "Normal shutdown");
        }, Clock::now() + std::chrono::seconds(2));

        std::lock_guard<std::mutex> lock(core_->io);
        core_->disconnected = true;
    }

private:
    std::shared_ptr<SessionCore> core_;

    static Clock::time_point auth_deadline() {
        return Clock::now() + std::chrono::seconds(CONNECT_TIMEOUT_SECS);
    }

    std::string session_error() {
        std::lock_guard<std::mutex> lock(core_->io);
        return last_error(core_->session);
    }
};

} // namespace

// ── Transport ────────────────────────────────────────────────────────

Libssh2Transport::Libssh2Transport() {
    std::call_once(g_libssh2_init, [] { g_libssh2_init_rc = libssh2_init(0); });
}

Result<std::unique_ptr<SshSession>> Libssh2Transport::open(const std::string& host, int port,
                                                           std::chrono::milliseconds timeout) {
    using R = Result<std::unique_ptr<SshSession>>;

    if (g_libssh2_init_rc != 0) {
        return R::Err(ErrorKind::Connection, "Failed to initialize libssh2");
    }

    auto until = Clock::now() + timeout;
    auto connected = platform::connect_tcp(host, port, static_cast<int>(timeout.count()));
    if (connected.is_err()) return R::from(connected);

    auto core = std::make_shared<SessionCore>();
    core->sock = connected.value;

    core->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!core->session) {
        return R::Err(ErrorKind::Connection, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(core->session, 0);

    log_debug(fmt::format("TCP connected to {}:{}, starting SSH handshake", host, port));

    int rc;
    while ((rc = libssh2_session_handshake(core->session, core->sock)) == LIBSSH2_ERROR_EAGAIN) {
        int left = remaining_ms(until);
        if (left == 0) {
            return R::Err(ErrorKind::Connection,
                fmt::format("Connection timeout after {}s", timeout.count() / 1000));
        }
        platform::poll_socket(core->sock, POLLIN, std::min(left, 100));
    }
    if (rc != 0) {
        return R::Err(ErrorKind::Connection,
            fmt::format("SSH handshake failed: {}", last_error(core->session)));
    }

    platform::set_tcp_keepalive(core->sock);
    libssh2_keepalive_config(core->session, 1, SSH_KEEPALIVE_SECS);

    return R::Ok(std::make_unique<Libssh2Session>(core));
}

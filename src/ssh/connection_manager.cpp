#include "connection_manager.hpp"
#include "auth.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

ConnectionManager::ConnectionManager(ConnectionConfig config, std::shared_ptr<Transport> transport)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      elevation_(*this, config_.su_password) {
}

ConnectionManager::~ConnectionManager() {
    close();
}

bool ConnectionManager::is_connected() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_ != nullptr;
}

Result<void> ConnectionManager::ensure_connected() {
    if (is_connected()) {
        return Result<void>::Ok();
    }
    return connect();
}

Result<void> ConnectionManager::connect() {
    if (is_connected()) {
        return Result<void>::Ok();
    }

    bool expected = false;
    if (!connecting_.compare_exchange_strong(expected, true)) {
        log_debug("Connection in progress elsewhere, waiting");
        while (connecting_.load()) {
            platform::sleep_ms(CONNECT_WAIT_POLL_MS);
        }
        if (is_connected()) {
            return Result<void>::Ok();
        }
        return Result<void>::Err(ErrorKind::Connection, "Connection failed by another task");
    }

    auto result = establish();
    connecting_.store(false);
    return result;
}

Result<void> ConnectionManager::establish() {
    // Someone may have connected between our check and winning the flag
    if (is_connected()) {
        return Result<void>::Ok();
    }

    log_info(fmt::format("Connecting to {}@{}:{}", config_.username, config_.host, config_.port));

    auto opened = transport_->open(config_.host, config_.port,
                                   std::chrono::seconds(CONNECT_TIMEOUT_SECS));
    if (opened.is_err()) {
        log_error(fmt::format("SSH connection failed: {}", opened.describe()));
        return Result<void>::from(opened);
    }
    std::unique_ptr<SshSession> session = std::move(opened.value);

    AuthenticationStrategy auth(config_);
    auto authed = auth.authenticate(*session);
    if (authed.is_err()) {
        log_error(authed.describe());
        session->disconnect();
        return authed;
    }

    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_ = std::move(session);
    }
    log_info(fmt::format("Connected to {}", config_.host));

    if (elevation_.has_password()) {
        auto elevated = elevation_.ensure_elevated();
        if (elevated.is_err()) {
            log_warn(fmt::format("Could not elevate, running unprivileged: {}", elevated.describe()));
        }
    }

    return Result<void>::Ok();
}

Result<std::unique_ptr<SshChannel>> ConnectionManager::open_channel() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!session_) {
        return Result<std::unique_ptr<SshChannel>>::Err(ErrorKind::Connection,
                                                        "SSH connection not established");
    }
    return session_->open_channel();
}

void ConnectionManager::close() {
    wait_background();

    // Root shell first: it lives on the session
    elevation_.teardown();

    std::unique_ptr<SshSession> session;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session = std::move(session_);
    }
    if (session) {
        session->disconnect();
        log_info("SSH session closed");
    }
}

void ConnectionManager::spawn_background(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(background_mutex_);

    // Reap finished tasks so the list stays short
    std::vector<std::future<void>> pending;
    for (auto& f : background_) {
        if (f.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            pending.push_back(std::move(f));
        }
    }
    background_ = std::move(pending);

    background_.push_back(std::async(std::launch::async, std::move(task)));
}

void ConnectionManager::wait_background() {
    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(background_mutex_);
        tasks = std::move(background_);
        background_.clear();
    }
    for (auto& f : tasks) {
        f.wait();
    }
}

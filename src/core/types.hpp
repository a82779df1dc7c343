#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <fmt/format.h>

// Error categories surfaced by every layer of the bridge
enum class ErrorKind {
    None,
    Connection,
    Authentication,
    Timeout,
    InvalidParams,
    ElevationFailed,
    Config,
    Io,
    SshKey,
};

// Human-readable form of an error, e.g. "Authentication failed: Key authentication rejected"
inline std::string describe_error(ErrorKind kind, const std::string& message,
                                  uint64_t timeout_ms = 0) {
    switch (kind) {
    case ErrorKind::Connection:      return fmt::format("SSH connection error: {}", message);
    case ErrorKind::Authentication:  return fmt::format("Authentication failed: {}", message);
    case ErrorKind::Timeout:         return fmt::format("Command timeout after {}ms", timeout_ms);
    case ErrorKind::InvalidParams:   return fmt::format("Invalid parameters: {}", message);
    case ErrorKind::ElevationFailed: return fmt::format("Elevation failed: {}", message);
    case ErrorKind::Config:          return fmt::format("Configuration error: {}", message);
    case ErrorKind::Io:              return fmt::format("IO error: {}", message);
    case ErrorKind::SshKey:          return fmt::format("SSH key error: {}", message);
    case ErrorKind::None:            break;
    }
    return message;
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    uint64_t timeout_ms = 0;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    static Result<T> Timeout(uint64_t ms) {
        return {false, T{}, fmt::format("timed out after {}ms", ms), ErrorKind::Timeout, ms};
    }

    // Re-type a failed result, keeping kind and message
    template <typename U>
    static Result<T> from(const Result<U>& other) {
        return {false, T{}, other.error, other.kind, other.timeout_ms};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    std::string describe() const { return describe_error(kind, error, timeout_ms); }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    uint64_t timeout_ms = 0;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    static Result<void> Timeout(uint64_t ms) {
        return {false, fmt::format("timed out after {}ms", ms), ErrorKind::Timeout, ms};
    }

    template <typename U>
    static Result<void> from(const Result<U>& other) {
        return {false, other.error, other.kind, other.timeout_ms};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    std::string describe() const { return describe_error(kind, error, timeout_ms); }
};

// Output of one remote command
struct CommandOutput {
    std::string stdout_data;
    std::string stderr_data;
    std::optional<int> exit_code;

    // No exit status (e.g. signal-terminated) counts as success
    bool success() const { return !exit_code || *exit_code == 0; }
};

// Everything needed to open and authenticate one SSH session.
// private_key holds key material (PEM/OpenSSH text), not a path.
struct ConnectionConfig {
    std::string host;
    int port = 22;
    std::string username;
    std::optional<std::string> password;
    std::optional<std::string> private_key;
    std::optional<std::string> su_password;
    std::optional<std::string> sudo_password;
};

#pragma once

#include <string>
#include <optional>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Log file defaults to <temp>/sshbridge.log; stdout is never written,
// it carries command output.
void log_configure(LogLevel threshold, const std::string& path, bool to_stderr);

std::string default_log_path();
std::optional<LogLevel> parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

// Append "[HH:MM:SS.mmm] LEVEL msg" if level passes the threshold.
void bridge_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { bridge_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { bridge_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { bridge_log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { bridge_log(LogLevel::Error, msg); }

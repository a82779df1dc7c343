#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

struct LogState {
    std::mutex mutex;
    LogLevel threshold = LogLevel::Info;
    std::string path;
    bool to_stderr = false;
};

LogState& state() {
    static LogState s;
    return s;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    return fmt::format("{:02}:{:02}:{:02}.{:03}", tm_buf.tm_hour, tm_buf.tm_min,
                       tm_buf.tm_sec, static_cast<int>(ms.count()));
}

} // namespace

std::string default_log_path() {
    static std::string path = (platform::temp_dir() / "sshbridge.log").string();
    return path;
}

void log_configure(LogLevel threshold, const std::string& path, bool to_stderr) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.threshold = threshold;
    s.path = path;
    s.to_stderr = to_stderr;
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string n = to_lower(trimmed(name));
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "?";
}

void bridge_log(LogLevel level, const std::string& msg) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (level < s.threshold) return;

    std::string line = fmt::format("[{}] {:<5} {}\n", timestamp(), log_level_name(level), msg);

    if (s.to_stderr) {
        std::cerr << line << std::flush;
    }

    std::ofstream out(s.path.empty() ? default_log_path() : s.path, std::ios::app);
    if (!out) return;
    out << line;
}

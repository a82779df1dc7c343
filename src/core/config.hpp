#pragma once

#include <string>
#include <map>
#include <optional>
#include <filesystem>
#include "log.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

// Unvalidated settings by key ("host", "port", "max_chars", ...).
// Later sources override earlier ones.
using SettingsMap = std::map<std::string, std::string>;

// Keys accepted in the YAML file; flags and env vars map onto the same names.
extern const char* const SETTING_KEYS[];

class Config {
public:
    // Merge file < environment < overrides, then validate.
    // config_path: explicit file; otherwise $SSHBRIDGE_CONFIG, then
    // ~/.sshbridge/config.yaml when it exists.
    static Result<Config> load(const SettingsMap& overrides,
                               const std::optional<fs::path>& config_path = std::nullopt);

    // Validate merged settings and read the key file.
    static Result<Config> build(const SettingsMap& settings);

    // Accessors
    const ConnectionConfig& connection() const { return connection_; }
    const std::optional<fs::path>& key_path() const { return key_path_; }
    uint64_t timeout_ms() const { return timeout_ms_; }
    std::optional<size_t> max_chars() const { return max_chars_; }
    bool disable_sudo() const { return disable_sudo_; }
    LogLevel log_level() const { return log_level_; }
    const std::string& log_file() const { return log_file_; }
    bool log_stderr() const { return log_stderr_; }

public:
    Config() = default;

private:
    ConnectionConfig connection_;
    std::optional<fs::path> key_path_;
    uint64_t timeout_ms_ = 60000;
    std::optional<size_t> max_chars_ = 1000;
    bool disable_sudo_ = false;
    LogLevel log_level_ = LogLevel::Info;
    std::string log_file_;
    bool log_stderr_ = false;
};

// Flat YAML mapping of setting keys to scalars.
Result<SettingsMap> load_settings_file(const fs::path& path);

// SSHBRIDGE_HOST, SSHBRIDGE_PORT, ... for every known key.
SettingsMap settings_from_env();

// absent -> 1000; "none" (any case), 0 or negative -> unlimited;
// positive -> that value; unparsable -> 1000.
std::optional<size_t> parse_max_chars(const std::optional<std::string>& value);

// "true"/"1"/"yes"/"on" (any case).
bool parse_bool(const std::string& value);

fs::path get_default_config_path();

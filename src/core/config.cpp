#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cctype>
#include <vector>

const char* const SETTING_KEYS[] = {
    "host", "port", "user", "password", "key", "su_password", "sudo_password",
    "timeout", "max_chars", "disable_sudo", "log_level", "log_file", "log_stderr",
    nullptr,
};

static std::optional<std::string> lookup(const SettingsMap& settings, const std::string& key) {
    auto it = settings.find(key);
    if (it == settings.end()) return std::nullopt;
    return it->second;
}

// Empty credentials are treated as not given
static std::optional<std::string> non_empty(const std::optional<std::string>& value) {
    if (!value || value->empty()) return std::nullopt;
    return value;
}

fs::path get_default_config_path() {
    return platform::home_dir() / ".sshbridge" / "config.yaml";
}

bool parse_bool(const std::string& value) {
    std::string v = to_lower(trimmed(value));
    return v == "true" || v == "1" || v == "yes" || v == "on";
}

std::optional<size_t> parse_max_chars(const std::optional<std::string>& value) {
    const std::optional<size_t> fallback = static_cast<size_t>(DEFAULT_MAX_CHARS);
    if (!value) return fallback;

    if (to_lower(trimmed(*value)) == "none") return std::nullopt;

    auto n = parse_int(*value);
    if (!n) return fallback;
    if (*n <= 0) return std::nullopt;
    return static_cast<size_t>(*n);
}

Result<SettingsMap> load_settings_file(const fs::path& path) {
    SettingsMap settings;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) {
            return Result<SettingsMap>::Ok(settings);
        }
        if (!root.IsMap()) {
            return Result<SettingsMap>::Err(ErrorKind::Config,
                fmt::format("{}: expected a mapping of settings", path.string()));
        }
        for (const auto& entry : root) {
            std::string key = entry.first.as<std::string>();
            if (!entry.second.IsScalar()) {
                return Result<SettingsMap>::Err(ErrorKind::Config,
                    fmt::format("{}: '{}' must be a scalar", path.string(), key));
            }
            settings[key] = entry.second.as<std::string>();
        }
    } catch (const YAML::BadFile&) {
        return Result<SettingsMap>::Err(ErrorKind::Io, "Cannot open config file " + path.string());
    } catch (const YAML::Exception& e) {
        return Result<SettingsMap>::Err(ErrorKind::Config,
            fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
    return Result<SettingsMap>::Ok(settings);
}

SettingsMap settings_from_env() {
    SettingsMap settings;
    for (const char* const* key = SETTING_KEYS; *key; ++key) {
        std::string name = "SSHBRIDGE_";
        for (const char* c = *key; *c; ++c) {
            name += static_cast<char>(std::toupper(static_cast<unsigned char>(*c)));
        }
        if (auto v = platform::get_env(name)) {
            settings[*key] = *v;
        }
    }
    return settings;
}

Result<Config> Config::load(const SettingsMap& overrides, const std::optional<fs::path>& config_path) {
    SettingsMap merged;

    std::optional<fs::path> path = config_path;
    if (!path) {
        if (auto env_path = non_empty(platform::get_env("SSHBRIDGE_CONFIG"))) {
            path = fs::path(*env_path);
        } else if (fs::exists(get_default_config_path())) {
            path = get_default_config_path();
        }
    }

    if (path) {
        auto file = load_settings_file(*path);
        if (file.is_err()) return Result<Config>::from(file);
        merged = file.value;
    }

    for (const auto& kv : settings_from_env()) merged[kv.first] = kv.second;
    for (const auto& kv : overrides) merged[kv.first] = kv.second;

    return build(merged);
}

Result<Config> Config::build(const SettingsMap& settings) {
    Config cfg;
    std::vector<std::string> errors;

    auto host = lookup(settings, "host");
    auto user = lookup(settings, "user");
    if (!host || trimmed(*host).empty()) {
        errors.push_back("Missing required --host");
    } else {
        cfg.connection_.host = trimmed(*host);
    }
    if (!user || trimmed(*user).empty()) {
        errors.push_back("Missing required --user");
    } else {
        cfg.connection_.username = trimmed(*user);
    }

    cfg.connection_.port = DEFAULT_SSH_PORT;
    if (auto port = lookup(settings, "port")) {
        auto n = parse_int(*port);
        if (!n || *n < 1 || *n > 65535) {
            errors.push_back(fmt::format("Invalid --port: {}", *port));
        } else {
            cfg.connection_.port = static_cast<int>(*n);
        }
    }

    cfg.connection_.password = non_empty(lookup(settings, "password"));
    cfg.connection_.su_password = non_empty(lookup(settings, "su_password"));
    cfg.connection_.sudo_password = non_empty(lookup(settings, "sudo_password"));

    auto key = non_empty(lookup(settings, "key"));
    if (key) {
        cfg.key_path_ = fs::path(*key);
        if (!fs::exists(*cfg.key_path_)) {
            errors.push_back(fmt::format("SSH key file not found: {}", *key));
        }
    }

    if (!cfg.connection_.password && !key) {
        errors.push_back("Must provide either --password or --key");
    }

    cfg.timeout_ms_ = DEFAULT_TIMEOUT_MS;
    if (auto timeout = lookup(settings, "timeout")) {
        auto n = parse_int(*timeout);
        if (!n || *n <= 0) {
            errors.push_back(fmt::format("Invalid --timeout: {}", *timeout));
        } else if (static_cast<uint64_t>(*n) > MAX_TIMEOUT_MS) {
            errors.push_back(fmt::format("Invalid --timeout: {} (max {}ms)", *timeout, MAX_TIMEOUT_MS));
        } else {
            cfg.timeout_ms_ = static_cast<uint64_t>(*n);
        }
    }

    cfg.max_chars_ = parse_max_chars(lookup(settings, "max_chars"));

    if (auto disable = lookup(settings, "disable_sudo")) {
        cfg.disable_sudo_ = parse_bool(*disable);
    }

    if (auto level = lookup(settings, "log_level")) {
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            errors.push_back(fmt::format("Invalid --log-level: {}", *level));
        } else {
            cfg.log_level_ = *parsed;
        }
    }
    cfg.log_file_ = lookup(settings, "log_file").value_or("");
    if (auto to_stderr = lookup(settings, "log_stderr")) {
        cfg.log_stderr_ = parse_bool(*to_stderr);
    }

    if (!errors.empty()) {
        std::string msg;
        for (size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) msg += "\n";
            msg += errors[i];
        }
        return Result<Config>::Err(ErrorKind::Config, msg);
    }

    // The key is handed to the transport as material, not as a path
    if (cfg.key_path_) {
        auto material = read_file(*cfg.key_path_);
        if (material.is_err()) return Result<Config>::from(material);
        cfg.connection_.private_key = material.value;
    }

    return Result<Config>::Ok(cfg);
}

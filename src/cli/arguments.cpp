#include "arguments.hpp"
#include <map>

// flag -> settings key
static const std::map<std::string, std::string> VALUE_FLAGS{
    {"--host",          "host"},
    {"--port",          "port"},
    {"--user",          "user"},
    {"--password",      "password"},
    {"--key",           "key"},
    {"--su-password",   "su_password"},
    {"--sudo-password", "sudo_password"},
    {"--timeout",       "timeout"},
    {"--maxChars",      "max_chars"},
    {"--max-chars",     "max_chars"},
    {"--log-level",     "log_level"},
    {"--log-file",      "log_file"},
};

Result<CliArguments> parse_arguments(const std::vector<std::string>& args) {
    CliArguments out;

    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--") { ++i; break; }
        if (arg.size() < 2 || arg[0] != '-') break;

        if (arg == "--help" || arg == "-h") { out.show_help = true; continue; }
        if (arg == "--version" || arg == "-V") { out.show_version = true; continue; }
        if (arg == "--verbose" || arg == "-v") { out.settings["log_stderr"] = "true"; continue; }

        // --flag=value or --flag value
        std::string name = arg;
        std::optional<std::string> value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }

        if (name == "--disable-sudo") {
            out.settings["disable_sudo"] = value.value_or("true");
            continue;
        }

        bool is_config = (name == "--config");
        auto it = VALUE_FLAGS.find(name);
        if (!is_config && it == VALUE_FLAGS.end()) {
            return Result<CliArguments>::Err(ErrorKind::InvalidParams, "Unknown option: " + name);
        }

        if (!value) {
            if (i + 1 >= args.size()) {
                return Result<CliArguments>::Err(ErrorKind::InvalidParams, "Missing value for " + name);
            }
            value = args[++i];
        }

        if (is_config) {
            out.config_path = fs::path(*value);
        } else {
            out.settings[it->second] = *value;
        }
    }

    for (; i < args.size(); ++i) {
        out.positional.push_back(args[i]);
    }
    return Result<CliArguments>::Ok(out);
}

std::string join_words(const std::vector<std::string>& words, size_t from) {
    std::string out;
    for (size_t i = from; i < words.size(); ++i) {
        if (i > from) out += " ";
        out += words[i];
    }
    return out;
}

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>

// Parsed command line. Flags come first; the first non-flag word starts
// the positional part, which is taken verbatim so remote commands may
// carry their own dashes (`sshbridge --host h exec ls -la`).
struct CliArguments {
    SettingsMap settings;
    std::optional<fs::path> config_path;
    bool show_help = false;
    bool show_version = false;
    std::vector<std::string> positional;
};

Result<CliArguments> parse_arguments(const std::vector<std::string>& args);

// Join words with single spaces.
std::string join_words(const std::vector<std::string>& words, size_t from = 0);

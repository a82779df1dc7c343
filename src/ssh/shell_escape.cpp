#include "shell_escape.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

std::string escape_for_shell(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out += c;
        }
    }
    return out;
}

std::string wrap_sudo_command(const std::string& command,
                              const std::optional<std::string>& password) {
    std::string escaped_command = escape_for_shell(command);

    if (!password) {
        // -n: fail instead of prompting when sudo wants a password
        return fmt::format("sudo -n sh -c '{}'", escaped_command);
    }

    return fmt::format("printf '%s\\n' '{}' | sudo -p \"\" -S sh -c '{}'",
                       escape_for_shell(*password), escaped_command);
}

bool is_valid_password(const std::string& password) {
    return !trimmed(password).empty() && password.find('\0') == std::string::npos;
}

#pragma once

#include <string>
#include <optional>

// Escape for use inside single quotes: each ' becomes '"'"'
std::string escape_for_shell(const std::string& s);

// Wrap a command for sudo.
//   no password:   sudo -n sh -c '<cmd>'
//   with password: printf '%s\n' '<pw>' | sudo -p "" -S sh -c '<cmd>'
std::string wrap_sudo_command(const std::string& command,
                              const std::optional<std::string>& password);

// Non-blank after trimming and free of NUL bytes.
bool is_valid_password(const std::string& password);

#include "sanitize.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

Result<std::string> sanitize_command(const std::string& command,
                                     std::optional<size_t> max_chars) {
    std::string cmd = trimmed(command);

    if (cmd.empty()) {
        return Result<std::string>::Err(ErrorKind::InvalidParams, "Command cannot be empty");
    }

    if (max_chars && cmd.size() > *max_chars) {
        return Result<std::string>::Err(ErrorKind::InvalidParams,
            fmt::format("Command is too long (max {} characters, got {})", *max_chars, cmd.size()));
    }

    return Result<std::string>::Ok(cmd);
}

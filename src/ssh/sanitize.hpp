#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

// Trim a raw command and enforce the length limit (none when max_chars is
// unset). Fails with InvalidParams for blank or oversize input.
Result<std::string> sanitize_command(const std::string& command,
                                     std::optional<size_t> max_chars);

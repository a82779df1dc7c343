#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), falling back to the temp directory.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Environment variable, or nullopt when unset.
std::optional<std::string> get_env(const std::string& name);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform

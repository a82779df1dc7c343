#pragma once

#include <chrono>
#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

// Strict integer parse: the whole string must be a number.
std::optional<long long> parse_int(const std::string& s);

// ASCII lower-case copy.
std::string to_lower(const std::string& s);

// Case-insensitive substring test.
bool contains_nocase(const std::string& haystack, const std::string& needle);

// Read an entire file into memory.
Result<std::string> read_file(const std::filesystem::path& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\v\f");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n\v\f") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

// now + timeout, saturated at the clock's maximum instead of overflowing.
inline std::chrono::steady_clock::time_point deadline_after(std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    auto now = Clock::now();
    if (timeout.count() <= 0) return now;
    auto room = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (timeout >= room) return Clock::time_point::max();
    return now + timeout;
}

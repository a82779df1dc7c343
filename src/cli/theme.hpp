#pragma once

#include <string>
#include <unistd.h>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences; empty when stdout is not a terminal
namespace color {
    inline bool enabled() {
        static bool tty = isatty(STDOUT_FILENO) != 0;
        return tty;
    }
    inline std::string code(const char* seq) { return enabled() ? seq : ""; }

    inline std::string BLUE()   { return code("\033[38;2;62;120;178m"); }
    inline std::string AMBER()  { return code("\033[38;2;196;140;40m"); }
    inline std::string RED()    { return code("\033[91m"); }
    inline std::string GREEN()  { return code("\033[92m"); }
    inline std::string BOLD()   { return code("\033[1m"); }
    inline std::string DIM()    { return code("\033[2m"); }
    inline std::string RESET()  { return code("\033[0m"); }
}

// Shorthand wrappers
inline std::string blue(const std::string& s)  { return color::BLUE() + s + color::RESET(); }
inline std::string amber(const std::string& s) { return color::AMBER() + s + color::RESET(); }
inline std::string bold(const std::string& s)  { return color::BOLD() + s + color::RESET(); }
inline std::string dim(const std::string& s)   { return color::DIM() + s + color::RESET(); }

// ── Layout ──────────────────────────────────────────────

inline std::string banner(const std::string& target) {
    return "\n" + color::BLUE() + color::BOLD() + "  sshbridge" + color::RESET()
         + color::DIM() + "  " + target + color::RESET() + "\n\n";
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER() + color::BOLD() + "  " + title + color::RESET() + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN() + "    + " + color::RESET() + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED() + "    x " + color::RESET() + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER() + "    > " + color::RESET() + msg + "\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM() + fmt::format("    {:<16}", key) + color::RESET() + value + "\n";
}

} // namespace theme

#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string blue(const std::string& s)   { return color::BLUE + s + color::RESET; }
inline std::string brown(const std::string& s)  { return color::BROWN + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string banner() {
    return "\n" + color::BLUE + color::BOLD + "  rexec\n"
        + color::RESET + color::DIM + "  v" + REXEC_VERSION + "  remote execution kernel"
        + color::RESET + "\n";
}

// Section header with a blank line either side
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Usage row: command, optional argument hint, description
inline std::string usage(const std::string& cmd, const std::string& arg, const std::string& what) {
    std::string left = "    " + cmd + (arg.empty() ? "" : " " + arg);
    return color::BLUE + "    " + cmd + color::RESET
        + (arg.empty() ? "" : " " + color::BROWN + arg + color::RESET)
        + std::string(left.size() < 36 ? 36 - left.size() : 1, ' ')
        + color::DIM + what + color::RESET + "\n";
}

// Key-value row for listings
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<36}", key) + color::RESET + value + "\n";
}

} // namespace theme

#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// Section header, padded by blank lines
inline std::string section(const std::string& title) {
    return "\n" + color::BLUE + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

// Progress line for a STATE snapshot: "    [ 40%] running  Doing something"
inline std::string progress(int percent, const std::string& status, const std::string& step) {
    return color::YELLOW + fmt::format("    [{:>3}%] ", percent) + color::RESET
         + color::DIM + fmt::format("{:<9}", status) + color::RESET + step + "\n";
}

// Key-value row for usage panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::BLUE + fmt::format("    {:<32}", key) + color::RESET
         + color::DIM + value + color::RESET + "\n";
}

} // namespace theme

#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string TEAL      = "\033[38;2;42;157;143m";
    const std::string WHITE     = "\033[97m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string blue(const std::string& s)    { return color::BLUE + s + color::RESET; }
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; ++i) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Banner: title + version + rule
inline std::string banner() {
    return "\n" + color::TEAL + color::BOLD + "  sshdesk\n"
         + color::RESET + color::DIM + "  v" + SSHDESK_VERSION
         + color::RESET + "\n\n" + rule();
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::TEAL + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::TEAL + "    > " + color::RESET + msg + "\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

} // namespace theme

#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// Cargo orange (#CE422B) and slate (#5C6773) as ANSI truecolor escapes.
// Every value is cleared by set_color_enabled(false).
namespace color {
    inline std::string ORANGE    = "\033[38;2;206;66;43m";
    inline std::string SLATE     = "\033[38;2;92;103;115m";
    inline std::string WHITE     = "\033[97m";
    inline std::string GRAY      = "\033[90m";
    inline std::string LOG       = "\033[38;2;80;80;80m";
    inline std::string RED       = "\033[91m";
    inline std::string GREEN     = "\033[92m";
    inline std::string YELLOW    = "\033[93m";
    inline std::string BLUE      = "\033[94m";
    inline std::string BOLD      = "\033[1m";
    inline std::string DIM       = "\033[2m";
    inline std::string RESET     = "\033[0m";
}

// Turn escapes off for pipes, NO_COLOR and `color: false`.
inline void set_color_enabled(bool enabled) {
    if (enabled) {
        color::ORANGE = "\033[38;2;206;66;43m";
        color::SLATE  = "\033[38;2;92;103;115m";
        color::WHITE  = "\033[97m";
        color::GRAY   = "\033[90m";
        color::LOG    = "\033[38;2;80;80;80m";
        color::RED    = "\033[91m";
        color::GREEN  = "\033[92m";
        color::YELLOW = "\033[93m";
        color::BLUE   = "\033[94m";
        color::BOLD   = "\033[1m";
        color::DIM    = "\033[2m";
        color::RESET  = "\033[0m";
        return;
    }
    for (std::string* c : {&color::ORANGE, &color::SLATE, &color::WHITE, &color::GRAY,
                           &color::LOG, &color::RED, &color::GREEN, &color::YELLOW,
                           &color::BLUE, &color::BOLD, &color::DIM, &color::RESET}) {
        c->clear();
    }
}

// Shorthand wrappers
inline std::string orange(const std::string& s)  { return color::ORANGE + s + color::RESET; }
inline std::string slate(const std::string& s)   { return color::SLATE + s + color::RESET; }
inline std::string blue(const std::string& s)    { return color::BLUE + s + color::RESET; }
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }
inline std::string white(const std::string& s)   { return color::WHITE + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Just the horizontal line (callers control gaps)
inline std::string rule() {
    std::string line;
    for (int i = 0; i < 48; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Title + version, used at the top of --help
inline std::string banner(const std::string& version) {
    return "\n"
        + color::ORANGE + color::BOLD
        + "  cratecache\n"
        + color::RESET + color::DIM + "  v" + version + "\n"
        + "  Inspect and prune the cargo cache"
        + color::RESET + "\n\n"
        + rule();
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::ORANGE + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// Divider: blank line, rule, blank line
inline std::string divider() {
    return "\n" + rule() + "\n";
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
    return color::SLATE + "    > " + color::RESET + msg + "\n";
}

// Subtle line for per-item progress (dimmer than program output)
inline std::string log(const std::string& msg) {
    return color::LOG + "    \xc2\xb7 " + msg + color::RESET + "\n";
}

// Key-value row
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<24}", key) + color::RESET + value + "\n";
}

} // namespace theme

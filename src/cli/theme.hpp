#pragma once

#include <cstdlib>
#include <string>
#include <fmt/format.h>
#include <unistd.h>

#ifndef FLEETRUN_VERSION
#define FLEETRUN_VERSION "0.1.0"
#endif

namespace theme {

// Escape sequences are dropped when stdout is not a terminal or NO_COLOR is set.
inline bool colors_enabled() {
    static const bool enabled = std::getenv("NO_COLOR") == nullptr && isatty(STDOUT_FILENO) == 1;
    return enabled;
}

inline std::string esc(const char* seq) {
    return colors_enabled() ? std::string(seq) : std::string();
}

// Teal #2A9D8F, amber #E9A23B
namespace color {
    inline const std::string TEAL   = esc("\033[38;2;42;157;143m");
    inline const std::string AMBER  = esc("\033[38;2;233;162;59m");
    inline const std::string RED    = esc("\033[91m");
    inline const std::string GREEN  = esc("\033[92m");
    inline const std::string YELLOW = esc("\033[93m");
    inline const std::string FAINT  = esc("\033[38;2;80;80;80m");
    inline const std::string BOLD   = esc("\033[1m");
    inline const std::string DIM    = esc("\033[2m");
    inline const std::string RESET  = esc("\033[0m");
}

inline std::string paint(const std::string& c, const std::string& s) { return c + s + color::RESET; }

inline std::string teal(const std::string& s)   { return paint(color::TEAL, s); }
inline std::string dim(const std::string& s)    { return paint(color::DIM, s); }
inline std::string green(const std::string& s)  { return paint(color::GREEN, s); }
inline std::string red(const std::string& s)    { return paint(color::RED, s); }
inline std::string yellow(const std::string& s) { return paint(color::YELLOW, s); }

// ── Layout ──────────────────────────────────────────────

inline std::string rule(int width = 44) {
    std::string line;
    for (int i = 0; i < width; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Title block for the console. Clears the screen only on a terminal.
inline std::string banner() {
    std::string clear = colors_enabled() ? "\033[2J\033[H" : "";
    return clear + "\n"
        + color::TEAL + color::BOLD + "  fleetrun" + color::RESET + color::DIM
        + "  v" FLEETRUN_VERSION "\n"
        + "  Parallel SSH for the whole fleet" + color::RESET + "\n\n"
        + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status lines ────────────────────────────────────────

inline std::string marker_line(const std::string& c, const char* mark, const std::string& msg) {
    return c + "    " + mark + " " + color::RESET + msg + "\n";
}

inline std::string ok(const std::string& msg)   { return marker_line(color::GREEN, "+", msg); }
inline std::string fail(const std::string& msg) { return marker_line(color::RED, "x", msg); }
inline std::string warn(const std::string& msg) { return marker_line(color::YELLOW, "!", msg); }
inline std::string step(const std::string& msg) { return marker_line(color::AMBER, ">", msg); }

// Internal status, fainter than remote output.
inline std::string log(const std::string& msg) {
    return color::FAINT + "    \xc2\xb7 " + msg + color::RESET + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<14}", key) + color::RESET + value + "\n";
}

} // namespace theme

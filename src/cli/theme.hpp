#pragma once

#include <string>
#include <fmt/format.h>
#include <managers/tunnel_types.hpp>

namespace theme {

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string TEAL      = "\033[38;2;42;157;143m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string blue(const std::string& s)   { return color::BLUE + s + color::RESET; }
inline std::string teal(const std::string& s)   { return color::TEAL + s + color::RESET; }
inline std::string bold(const std::string& s)   { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)  { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)    { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s) { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner() {
    return "\n" + color::TEAL + color::BOLD + "  tunneld\n"
         + color::RESET + color::DIM + "  SSH tunnel supervisor  v0.1.0"
         + color::RESET + "\n\n" + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + color::TEAL + color::BOLD + "  " + title + color::RESET + "\n\n";
}

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

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::TEAL + "    > " + color::RESET + msg + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

// Tunnel state, colored by health
inline std::string state(TunnelState s) {
    std::string name = tunnel_state_name(s);
    switch (s) {
        case TunnelState::Connected:     return green(name);
        case TunnelState::Failed:        return red(name);
        case TunnelState::Retrying:
        case TunnelState::Waiting:       return yellow(name);
        case TunnelState::Disconnected:  return dim(name);
        default:                         return blue(name);
    }
}

} // namespace theme

#pragma once

#include <string>

namespace theme {

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// One usage row: command in blue, optional argument in brown, description dimmed.
inline std::string usage(const std::string& command, const std::string& arg,
                         const std::string& description, size_t width = 32) {
    std::string shown = command + (arg.empty() ? "" : " " + arg);
    std::string pad(shown.size() < width ? width - shown.size() : 1, ' ');
    std::string out = color::BLUE + "    " + command + color::RESET;
    if (!arg.empty()) out += " " + color::BROWN + arg + color::RESET;
    return out + pad + color::DIM + description + color::RESET + "\n";
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
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Marker row for `backset status`: present markers are highlighted.
inline std::string marker(const std::string& label, const std::string& path, bool present) {
    std::string name = label + std::string(label.size() < 8 ? 8 - label.size() : 1, ' ');
    if (present) return step(name + " " + dim(path) + "  " + yellow("present"));
    return info(name + " " + dim(path) + "  " + dim("absent"));
}

} // namespace theme

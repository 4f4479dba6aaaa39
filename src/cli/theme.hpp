#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
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

// Colour for stdout text, switched off when stdout is not a terminal
inline bool& color_enabled() {
    static bool enabled = true;
    return enabled;
}

// Same switch for text bound for stderr (diagnostics, picker frames)
inline bool& stderr_color_enabled() {
    static bool enabled = true;
    return enabled;
}

// Builds strings with the stderr colour setting while in scope
class StderrColor {
public:
    StderrColor() : saved_(color_enabled()) { color_enabled() = stderr_color_enabled(); }
    ~StderrColor() { color_enabled() = saved_; }

    StderrColor(const StderrColor&) = delete;
    StderrColor& operator=(const StderrColor&) = delete;

private:
    bool saved_;
};

inline std::string paint(const std::string& code, const std::string& s) {
    return color_enabled() ? code + s + color::RESET : s;
}

// Shorthand wrappers
inline std::string blue(const std::string& s)    { return paint(color::BLUE, s); }
inline std::string brown(const std::string& s)   { return paint(color::BROWN, s); }
inline std::string bold(const std::string& s)    { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)     { return paint(color::DIM, s); }
inline std::string green(const std::string& s)   { return paint(color::GREEN, s); }
inline std::string yellow(const std::string& s)  { return paint(color::YELLOW, s); }

// ── Layout ──────────────────────────────────────────────

// Section header with a blank line on either side
inline std::string section(const std::string& title) {
    return "\n" + paint(color::BROWN + color::BOLD, title) + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return paint(color::GREEN, "+ ") + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return paint(color::RED, "x ") + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return paint(color::BLUE, "~ ") + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return paint(color::BROWN, "  - ") + msg + "\n";
}

// Key-value row
inline std::string kv(const std::string& key, const std::string& value) {
    return dim(fmt::format("    {:<10}", key)) + value + "\n";
}

} // namespace theme

#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// Azure blue #0078D4, slate #5C6B7A
namespace color {
    const std::string BLUE      = "\033[38;2;0;120;212m";
    const std::string SLATE     = "\033[38;2;92;107;122m";
    const std::string WHITE     = "\033[97m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string blue(const std::string& s)    { return color::BLUE + s + color::RESET; }
inline std::string slate(const std::string& s)   { return color::SLATE + s + color::RESET; }
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 48; ++i) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner(const std::string& version) {
    return "\n" + color::BLUE + color::BOLD
        + "  azprov\n"
        + color::RESET + color::DIM + "  v" + version + "\n"
        + "  Azure AI deployment orchestration"
        + color::RESET + "\n\n"
        + rule();
}

// Section header, blank line before and after
inline std::string section(const std::string& title) {
    return "\n" + color::SLATE + color::BOLD + "  " + title + color::RESET + "\n\n";
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
    return color::SLATE + "    > " + color::RESET + msg + "\n";
}

// Job log line as streamed from the orchestrator
inline std::string log(const std::string& msg) {
    if (msg.rfind("ERROR", 0) == 0) return red("    " + msg) + "\n";
    if (msg.rfind("[WARN]", 0) == 0 || msg.rfind("[RETRY]", 0) == 0) {
        return yellow("    " + msg) + "\n";
    }
    if (msg.rfind("[CMD]", 0) == 0 || msg.rfind("[EXIT", 0) == 0) {
        return dim("    " + msg) + "\n";
    }
    return "    " + msg + "\n";
}

// Key-value row for detail panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<32}", key) + color::RESET + value + "\n";
}

} // namespace theme

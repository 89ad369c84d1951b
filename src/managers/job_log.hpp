#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <filesystem>
#include <system_error>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string azprov_log_path() {
    static std::string path = (platform::temp_dir() / "azprov_debug.log").string();
    return path;
}

// Process-wide debug log. Job-visible lines go to the job's own log instead.
inline void azprov_log(const std::string& msg) {
    static std::mutex log_mutex;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    static bool restricted = false;
    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream out(azprov_log_path(), std::ios::app);
    if (!out) return;
    out << line;

    if (!restricted) {
        std::error_code ec;
        std::filesystem::permissions(azprov_log_path(),
                                     std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
        restricted = true;
    }
}

inline void azprov_log_command(const std::string& label, const CommandSpec& cmd,
                               const CommandResult& r) {
    azprov_log(fmt::format("{} CMD: {}", label, cmd.display()));
    if (cmd.sensitive) {
        azprov_log(fmt::format("{} exit={} output({}) redacted", label, r.exit_code,
                               r.output.size()));
        return;
    }
    azprov_log(fmt::format("{} exit={} output({})={}", label, r.exit_code,
                           r.output.size(), r.output.substr(0, 500)));
}

#include "platform.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_sibling(const fs::path& path) {
    static std::atomic<unsigned> counter{0};
    return fs::path(path.string() + ".tmp." + std::to_string(getpid()) + "." +
                    std::to_string(counter.fetch_add(1)));
}

void write_file_atomic(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    fs::path tmp = temp_sibling(path);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open " + tmp.string() + " for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("Failed writing " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("Cannot replace " + path.string() + ": " + ec.message());
    }
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace platform

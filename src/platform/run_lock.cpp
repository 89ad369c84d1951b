#include "run_lock.hpp"
#include <filesystem>
#include <system_error>
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

namespace platform {

RunLock::RunLock(const std::string& lock_path) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(lock_path).parent_path(), ec);

    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd_ < 0) return;
    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        close(fd_);
        fd_ = -1;
    }
}

RunLock::~RunLock() {
    if (fd_ < 0) return;
    close(fd_);
    // flock is released when the descriptor closes
}

bool RunLock::is_locked(const std::string& lock_path) {
    if (!std::filesystem::exists(lock_path)) return false;
    RunLock attempt(lock_path);
    return !attempt.held();
}

} // namespace platform

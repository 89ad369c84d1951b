#pragma once

#include <string>

namespace platform {

// RAII advisory lock on a file (flock, exclusive, non-blocking). Held for the
// life of the object and released by the kernel if the process dies, so a
// free lock means no live process owns whatever it guards.
class RunLock {
public:
    // Attempts to acquire the lock. Check held() after construction.
    explicit RunLock(const std::string& lock_path);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    bool held() const { return fd_ >= 0; }

    // True if another open description (this or any process) holds the lock.
    static bool is_locked(const std::string& lock_path);

private:
    int fd_ = -1;
};

} // namespace platform

#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

extern char** environ;

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_output();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), out_fd_(other.out_fd_),
      buffer_(std::move(other.buffer_)), eof_(other.eof_) {
    other.pid_ = -1;
    other.out_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_output();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        buffer_ = std::move(other.buffer_);
        eof_ = other.eof_;
        other.pid_ = -1;
        other.out_fd_ = -1;
    }
    return *this;
}

void ProcessHandle::close_output() {
    if (out_fd_ >= 0) {
        close(out_fd_);
        out_fd_ = -1;
    }
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::read_line(std::string& line) {
    for (;;) {
        auto nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        if (eof_ || out_fd_ < 0) {
            if (buffer_.empty()) return false;
            line = std::move(buffer_);
            buffer_.clear();
            return true;
        }

        char chunk[4096];
        ssize_t n = read(out_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
            close_output();
        } else if (errno != EINTR) {
            eof_ = true;
            close_output();
        }
    }
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    pid_ = -1;
    if (ret < 0) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options) {
    ProcessHandle handle;

    // Everything the child needs is built before fork(): only
    // async-signal-safe calls happen between fork and exec.
    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = (eq == std::string::npos) ? entry : entry.substr(0, eq);
        if (options.env.count(key)) continue;
        env_storage.push_back(std::move(entry));
    }
    for (const auto& [key, val] : options.env) {
        env_storage.push_back(key + "=" + val);
    }
    std::vector<char*> envp;
    for (auto& s : env_storage) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::vector<char*> argv;
    std::string prog = program;
    argv.push_back(prog.data());
    std::vector<std::string> arg_storage(args);
    for (auto& a : arg_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    const char* exec_failed = "failed to execute program\n";

    int fds[2] = {-1, -1};
    if (options.capture_output) {
        // O_CLOEXEC keeps concurrently spawned siblings from inheriting the
        // write end (which would hold the pipe open past our child's exit).
        if (pipe2(fds, O_CLOEXEC) != 0) return handle;
    }

    pid_t pid = fork();
    if (pid < 0) {
        if (fds[0] >= 0) { close(fds[0]); close(fds[1]); }
        return handle;  // fork failed
    }

    if (pid == 0) {
        // Child process
        if (options.capture_output) {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }
            dup2(fds[1], STDOUT_FILENO);
            if (options.merge_stderr) {
                dup2(fds[1], STDERR_FILENO);
            } else {
                int errnull = open("/dev/null", O_WRONLY);
                if (errnull >= 0) {
                    dup2(errnull, STDERR_FILENO);
                    close(errnull);
                }
            }
            close(fds[0]);
            close(fds[1]);
        }

        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            _exit(127);
        }

        execvpe(argv[0], argv.data(), envp.data());
        ssize_t ignored = write(STDERR_FILENO, exec_failed, strlen(exec_failed));
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    if (options.capture_output) {
        close(fds[1]);
        handle.out_fd_ = fds[0];
    } else {
        handle.eof_ = true;
    }
    handle.pid_ = pid;
    return handle;
}

} // namespace platform

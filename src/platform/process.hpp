#pragma once

#include <string>
#include <vector>
#include <map>

namespace platform {

struct SpawnOptions {
    std::string working_dir;                       // "" = inherit
    std::map<std::string, std::string> env;        // merged over the parent environment
    bool capture_output = true;                    // stdout+stderr into one pipe, stdin from /dev/null;
                                                   // false inherits the terminal (interactive login)
    bool merge_stderr = true;                      // false sends stderr to /dev/null
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Read the next line of merged output (without the trailing newline).
    // Blocks until a full line or EOF is available. Returns false at EOF
    // once the buffered remainder has been handed out.
    bool read_line(std::string& line);

    // Wait for the process to exit. Returns exit code, or -1 if it was
    // killed by a signal.
    int wait();

private:
    int pid_ = -1;
    int out_fd_ = -1;
    std::string buffer_;
    bool eof_ = false;

    void close_output();

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const SpawnOptions& options);
};

// Spawn a child process. program is looked up on PATH.
// If exec fails, the child exits with 127 (and prints a diagnostic to the pipe).
// Returns an invalid handle if fork/pipe fails.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options = {});

} // namespace platform

#pragma once

#include <string>
#include <stdexcept>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Raised when a command exits non-zero and is not (or no longer) retryable.
// Always fatal to the enclosing job step.
class CommandFailed : public std::runtime_error {
public:
    CommandFailed(const std::string& command, int exit_code, int attempts);

    const std::string& command() const { return command_; }
    int exit_code() const { return exit_code_; }
    int attempts() const { return attempts_; }

private:
    std::string command_;
    int exit_code_;
    int attempts_;
};

// Runs external programs with merged stdout/stderr, streaming each line to a
// sink as it arrives. Every invocation, output line, retry and exit code is
// written to the sink in chronological order.
class CommandRunner {
public:
    // base_env is merged over the process environment for every invocation;
    // per-call env is merged over that.
    explicit CommandRunner(EnvMap base_env = {});

    // Run with the retry policy. Throws CommandFailed on a fatal failure.
    void run(const CommandSpec& cmd, const fs::path& working_dir, const EnvMap& env,
             const RetryPolicy& policy, const LineSink& sink) const;

    // Run once to completion and hand back stdout (structured queries; stderr
    // is discarded so warnings never corrupt JSON). Never throws for a
    // non-zero exit; a spawn failure is exit 127.
    CommandResult capture(const CommandSpec& cmd, const fs::path& working_dir = {},
                          const EnvMap& env = {}) const;

    // Run attached to the terminal (interactive login flows). Returns exit code.
    int run_interactive(const CommandSpec& cmd) const;

    // Output markers of a transient provider conflict (resource mid-transition).
    static bool is_transient_conflict(const std::string& output);

    static bool is_retryable_kind(CommandKind kind);

private:
    EnvMap base_env_;

    EnvMap merged_env(const EnvMap& env) const;
};

#include "command_runner.hpp"
#include "job_log.hpp"
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <chrono>

static const char* const TRANSIENT_MARKERS[] = {
    "409",
    "Conflict",
    "provisioning state is not terminal",
};

static std::string format_delay(std::chrono::milliseconds delay) {
    if (delay.count() % 1000 == 0) {
        return fmt::format("{}s", delay.count() / 1000);
    }
    return fmt::format("{}ms", delay.count());
}

CommandFailed::CommandFailed(const std::string& command, int exit_code, int attempts)
    : std::runtime_error(attempts > 1
          ? fmt::format("Command failed after {} attempts (exit {}): {}", attempts, exit_code, command)
          : fmt::format("Command failed (exit {}): {}", exit_code, command)),
      command_(command), exit_code_(exit_code), attempts_(attempts) {}

CommandRunner::CommandRunner(EnvMap base_env)
    : base_env_(std::move(base_env)) {}

EnvMap CommandRunner::merged_env(const EnvMap& env) const {
    EnvMap merged = base_env_;
    for (const auto& [k, v] : env) merged[k] = v;
    return merged;
}

bool CommandRunner::is_transient_conflict(const std::string& output) {
    for (const char* marker : TRANSIENT_MARKERS) {
        if (output.find(marker) != std::string::npos) return true;
    }
    return false;
}

bool CommandRunner::is_retryable_kind(CommandKind kind) {
    return kind == CommandKind::Apply || kind == CommandKind::Destroy;
}

void CommandRunner::run(const CommandSpec& cmd, const fs::path& working_dir,
                        const EnvMap& env, const RetryPolicy& policy,
                        const LineSink& sink) const {
    const std::string display = cmd.display();
    auto emit = [&](const std::string& line) {
        if (sink) sink(line);
    };

    platform::SpawnOptions opts;
    opts.working_dir = working_dir.string();
    opts.env = merged_env(env);

    emit(fmt::format("[CMD] {}", display));
    azprov_log(fmt::format("run: {} (cwd={})", display, opts.working_dir));

    const int total = policy.max_retries + 1;
    for (int attempt = 0; attempt < total; ++attempt) {
        if (attempt > 0) {
            emit(fmt::format("[RETRY] Attempt {}/{} after {} delay",
                             attempt + 1, total, format_delay(policy.delay)));
            platform::sleep_ms(static_cast<int>(policy.delay.count()));
        }

        std::string captured;
        int rc = 127;
        auto proc = platform::spawn(cmd.program, cmd.args, opts);
        if (proc.valid()) {
            std::string line;
            while (proc.read_line(line)) {
                emit(line);
                captured += line;
                captured += '\n';
            }
            rc = proc.wait();
        } else {
            emit(fmt::format("Failed to start {}", cmd.program));
        }

        emit(fmt::format("[EXIT {}] {}", rc, display));
        if (rc == 0) return;

        bool retryable = attempt < policy.max_retries &&
                         is_retryable_kind(cmd.kind) &&
                         is_transient_conflict(captured);
        if (!retryable) {
            azprov_log(fmt::format("run: {} failed rc={} attempt={}", display, rc, attempt + 1));
            throw CommandFailed(display, rc, attempt + 1);
        }

        emit(fmt::format("[RETRY] Detected retryable error (409 Conflict). Will retry in {}...",
                         format_delay(policy.delay)));
    }

    // Unreachable: every iteration returns or throws.
    throw CommandFailed(display, -1, total);
}

CommandResult CommandRunner::capture(const CommandSpec& cmd, const fs::path& working_dir,
                                     const EnvMap& env) const {
    platform::SpawnOptions opts;
    opts.working_dir = working_dir.string();
    opts.env = merged_env(env);
    opts.merge_stderr = false;

    CommandResult result;
    auto proc = platform::spawn(cmd.program, cmd.args, opts);
    if (!proc.valid()) {
        result.exit_code = 127;
        result.output = "failed to start " + cmd.program;
        azprov_log_command("capture", cmd, result);
        return result;
    }

    std::string line;
    while (proc.read_line(line)) {
        result.output += line;
        result.output += '\n';
    }
    result.exit_code = proc.wait();
    azprov_log_command("capture", cmd, result);
    return result;
}

int CommandRunner::run_interactive(const CommandSpec& cmd) const {
    platform::SpawnOptions opts;
    opts.env = merged_env({});
    opts.capture_output = false;

    auto proc = platform::spawn(cmd.program, cmd.args, opts);
    if (!proc.valid()) return 127;
    int rc = proc.wait();
    azprov_log(fmt::format("interactive: {} exit={}", cmd.display(), rc));
    return rc;
}

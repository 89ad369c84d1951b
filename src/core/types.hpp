#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <chrono>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of a best-effort fetch. Only Ok values are merged anywhere;
// an Unavailable carries the reason so the caller can log it.
template <typename T>
struct Fetched {
    std::optional<T> value;
    std::string reason;

    static Fetched<T> Ok(T val) {
        return {std::move(val), ""};
    }

    static Fetched<T> Unavailable(const std::string& why) {
        return {std::nullopt, why};
    }

    bool ok() const { return value.has_value(); }
};

// Local command execution result
struct CommandResult {
    int exit_code = -1;
    std::string output;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Which retry classification applies to a command.
// Only Apply and Destroy are eligible for transient-conflict retries.
enum class CommandKind {
    Plain,
    Apply,
    Destroy,
};

struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
    CommandKind kind = CommandKind::Plain;
    bool sensitive = false;   // output carries credentials; never written to the debug log

    std::string display() const;
};

struct RetryPolicy {
    int max_retries = 0;
    std::chrono::milliseconds delay{0};
};

using EnvMap = std::map<std::string, std::string>;

// Line sink for streamed output and job log lines
using LineSink = std::function<void(const std::string&)>;

// Configuration structures
struct PathsConfig {
    std::string terraform_dir;       // static *.tf definitions (shared template)
    std::string deployments_root;    // one workspace per job id + index file
};

struct ToolsConfig {
    std::string terraform = "terraform";
    std::string az = "az";
};

struct RetryConfig {
    RetryPolicy apply;
    RetryPolicy destroy;
};

struct ExportDefaults {
    std::string openai_api_version;
    std::string embedding_deployment;
    std::string search_index_name;
    std::string log_level;
};

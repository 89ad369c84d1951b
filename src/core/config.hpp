#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from a YAML file. A missing file yields the built-in defaults.
    static Result<Config> load(const fs::path& path);

    // Load from AZPROV_CONFIG, falling back to ~/.azprov/config.yaml
    static Result<Config> load_default();

    // Built-in defaults, relative to the current directory
    static Config defaults();

    // Accessors
    const PathsConfig& paths() const { return paths_; }
    const ToolsConfig& tools() const { return tools_; }
    const RetryConfig& retry() const { return retry_; }
    const EnvMap& environment() const { return environment_; }
    const ExportDefaults& export_defaults() const { return export_; }
    const fs::path& source() const { return source_; }

    // Overrides (used by tests and the CLI)
    void set_paths(PathsConfig paths) { paths_ = std::move(paths); }
    void set_tools(ToolsConfig tools) { tools_ = std::move(tools); }
    void set_retry(RetryConfig retry) { retry_ = retry; }

public:
    Config() = default;

private:
    PathsConfig paths_;
    ToolsConfig tools_;
    RetryConfig retry_;
    EnvMap environment_;
    ExportDefaults export_;
    fs::path source_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Write the default config template (does not overwrite)
Result<void> create_default_config(const fs::path& path = get_global_config_path());

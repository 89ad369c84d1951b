#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".azprov";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_config(const fs::path& config_path) {
    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# azprov configuration

paths:
  terraform_dir: "./terraform"              # static *.tf definitions
  deployments_root: "./deployment_states"   # one workspace per deployment

tools:
  terraform: "terraform"
  az: "az"

# Transient 409 / Conflict failures are retried with these limits
retry:
  apply:
    max_retries: 2
    delay_seconds: 60
  destroy:
    max_retries: 2
    delay_seconds: 30

# Extra environment variables for terraform and az invocations
environment: {}

# Values written into exported .env files when terraform does not supply them
export:
  openai_api_version: "2024-12-01-preview"
  embedding_deployment: "text-embedding-3-small"
  search_index_name: "ai-search-index"
  log_level: "INFO"
)";

    try {
        if (config_path.has_parent_path()) {
            fs::create_directories(config_path.parent_path());
        }
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static RetryPolicy parse_retry_policy(const YAML::Node& node, int max_retries, int delay_secs) {
    RetryPolicy p;
    p.max_retries = node["max_retries"].as<int>(max_retries);
    if (node["delay_ms"]) {
        p.delay = std::chrono::milliseconds(node["delay_ms"].as<int>());
    } else {
        p.delay = std::chrono::seconds(node["delay_seconds"].as<int>(delay_secs));
    }
    if (p.max_retries < 0) p.max_retries = 0;
    return p;
}

Config Config::defaults() {
    Config config;
    config.paths_.terraform_dir = "terraform";
    config.paths_.deployments_root = "deployment_states";
    config.retry_.apply.max_retries = APPLY_MAX_RETRIES;
    config.retry_.apply.delay = std::chrono::seconds(APPLY_RETRY_DELAY_SECS);
    config.retry_.destroy.max_retries = DESTROY_MAX_RETRIES;
    config.retry_.destroy.delay = std::chrono::seconds(DESTROY_RETRY_DELAY_SECS);
    config.export_.openai_api_version = DEFAULT_OPENAI_API_VERSION;
    config.export_.embedding_deployment = DEFAULT_EMBEDDING_DEPLOYMENT;
    config.export_.search_index_name = DEFAULT_SEARCH_INDEX_NAME;
    config.export_.log_level = DEFAULT_LOG_LEVEL;
    return config;
}

Result<Config> Config::load(const fs::path& path) {
    Config config = defaults();
    config.source_ = path;

    if (!fs::exists(path)) {
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        // Relative paths resolve against the config file's directory
        fs::path base = path.has_parent_path() ? path.parent_path() : fs::current_path();
        auto resolve = [&](const std::string& p) {
            fs::path fp(p);
            return fp.is_absolute() ? fp.string() : (base / fp).lexically_normal().string();
        };

        const auto& paths = root["paths"];
        if (paths && paths.IsMap()) {
            if (paths["terraform_dir"]) {
                config.paths_.terraform_dir = resolve(paths["terraform_dir"].as<std::string>());
            }
            if (paths["deployments_root"]) {
                config.paths_.deployments_root = resolve(paths["deployments_root"].as<std::string>());
            }
        }

        const auto& tools = root["tools"];
        if (tools && tools.IsMap()) {
            config.tools_.terraform = tools["terraform"].as<std::string>(config.tools_.terraform);
            config.tools_.az = tools["az"].as<std::string>(config.tools_.az);
        }

        const auto& retry = root["retry"];
        if (retry && retry.IsMap()) {
            config.retry_.apply = parse_retry_policy(
                retry["apply"] ? retry["apply"] : YAML::Node(),
                APPLY_MAX_RETRIES, APPLY_RETRY_DELAY_SECS);
            config.retry_.destroy = parse_retry_policy(
                retry["destroy"] ? retry["destroy"] : YAML::Node(),
                DESTROY_MAX_RETRIES, DESTROY_RETRY_DELAY_SECS);
        }

        if (root["environment"] && root["environment"].IsMap()) {
            for (const auto& kv : root["environment"]) {
                config.environment_[kv.first.as<std::string>()] = kv.second.as<std::string>("");
            }
        }

        const auto& exp = root["export"];
        if (exp && exp.IsMap()) {
            config.export_.openai_api_version =
                exp["openai_api_version"].as<std::string>(config.export_.openai_api_version);
            config.export_.embedding_deployment =
                exp["embedding_deployment"].as<std::string>(config.export_.embedding_deployment);
            config.export_.search_index_name =
                exp["search_index_name"].as<std::string>(config.export_.search_index_name);
            config.export_.log_level = exp["log_level"].as<std::string>(config.export_.log_level);
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_default() {
    std::string override_path = env_or_empty(ENV_CONFIG_PATH);
    if (!override_path.empty()) {
        return load(override_path);
    }
    return load(get_global_config_path());
}

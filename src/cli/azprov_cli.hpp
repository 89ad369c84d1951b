#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <core/config.hpp>
#include <managers/state_store.hpp>
#include <managers/job_registry.hpp>
#include <managers/job_orchestrator.hpp>

constexpr const char* AZPROV_VERSION = "0.4.0";

// Parsed command line: positionals plus "--key value" / "--flag" options.
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;   // flags map to "true"

    bool has(const std::string& key) const { return options.count(key) > 0; }
    std::string get(const std::string& key, const std::string& fallback = "") const;
};

// Options listed in `flags` take no value.
CommandArgs parse_command_args(const std::vector<std::string>& args,
                               const std::vector<std::string>& flags = {});

class AzprovCLI {
public:
    explicit AzprovCLI(Config config);

    using CommandHandler = std::function<int(AzprovCLI&, const CommandArgs&)>;

    // Returns the process exit code.
    int execute(const std::string& command, const std::vector<std::string>& args);

    void print_usage() const;

private:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
        std::vector<std::string> flags;
    };

    Config config_;
    std::unique_ptr<StateStore> store_;
    std::unique_ptr<JobRegistry> registry_;
    std::unique_ptr<JobOrchestrator> jobs_;
    std::vector<std::pair<std::string, Command>> commands_;

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& usage, const std::string& help,
                     std::vector<std::string> flags = {});
    void register_all_commands();

    JobOrchestrator& jobs();

    // Resolve a full id from an unambiguous prefix
    Result<std::string> resolve_id(const std::string& prefix);

    // Stream the job log from `cursor` until its run finishes. Returns 0 if
    // it ended in a non-failure state.
    int follow(const std::string& id, std::size_t cursor);

    // Tail the persisted record (a run owned by another process).
    int follow_persisted(const std::string& id, std::size_t cursor);

    int cmd_deploy(const CommandArgs& args);
    int cmd_retry(const CommandArgs& args);
    int cmd_destroy(const CommandArgs& args);
    int cmd_list(const CommandArgs& args);
    int cmd_show(const CommandArgs& args);
    int cmd_logs(const CommandArgs& args);
    int cmd_env(const CommandArgs& args);
    int cmd_init_config(const CommandArgs& args);
};

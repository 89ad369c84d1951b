#include "azprov_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/request.hpp>
#include <core/utils.hpp>
#include <managers/env_export.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

// ── Argument parsing ─────────────────────────────────────────

std::string CommandArgs::get(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
}

CommandArgs parse_command_args(const std::vector<std::string>& args,
                               const std::vector<std::string>& flags) {
    CommandArgs out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
            std::string key = a.substr(2);
            auto eq = key.find('=');
            if (eq != std::string::npos) {
                out.options[key.substr(0, eq)] = key.substr(eq + 1);
            } else if (std::find(flags.begin(), flags.end(), key) != flags.end()) {
                out.options[key] = "true";
            } else if (i + 1 < args.size()) {
                out.options[key] = args[++i];
            } else {
                out.options[key] = "";
            }
        } else {
            out.positional.push_back(a);
        }
    }
    return out;
}

// ── Setup ────────────────────────────────────────────────────

AzprovCLI::AzprovCLI(Config config) : config_(std::move(config)) {
    register_all_commands();
}

void AzprovCLI::add_command(const std::string& name, CommandHandler handler,
                            const std::string& usage, const std::string& help,
                            std::vector<std::string> flags) {
    commands_.push_back({name, Command{std::move(handler), usage, help, std::move(flags)}});
}

void AzprovCLI::register_all_commands() {
    add_command("deploy", &AzprovCLI::cmd_deploy,
                "--base <name> --location <region> --sp-name <name> --secret-expiry <date>"
                " [--model <m>] [--search] [--subscription <id>]",
                "Provision a new deployment and follow its log", {"search"});
    add_command("retry", &AzprovCLI::cmd_retry, "<id>",
                "Start a fresh provisioning attempt for a failed deployment");
    add_command("destroy", &AzprovCLI::cmd_destroy, "<id>",
                "Tear down a deployment's resources and follow the log");
    add_command("list", &AzprovCLI::cmd_list, "", "List known deployments");
    add_command("show", &AzprovCLI::cmd_show, "<id> [--reveal]",
                "Show parameters, resource names and outputs", {"reveal"});
    add_command("logs", &AzprovCLI::cmd_logs, "<id> [--follow]",
                "Print a deployment's log", {"follow"});
    add_command("env", &AzprovCLI::cmd_env, "<id> [file]",
                "Write a .env file from a deployment's outputs");
    add_command("init-config", &AzprovCLI::cmd_init_config, "[path]",
                "Write the default configuration file");
}

JobOrchestrator& AzprovCLI::jobs() {
    if (!jobs_) {
        store_ = std::make_unique<StateStore>(config_.paths().deployments_root);
        registry_ = std::make_unique<JobRegistry>();
        jobs_ = std::make_unique<JobOrchestrator>(config_, *registry_, *store_);
    }
    return *jobs_;
}

int AzprovCLI::execute(const std::string& command, const std::vector<std::string>& args) {
    auto it = std::find_if(commands_.begin(), commands_.end(),
                           [&](const auto& c) { return c.first == command; });
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'azprov --help' for available commands.");
        return 1;
    }
    return it->second.handler(*this, parse_command_args(args, it->second.flags));
}

void AzprovCLI::print_usage() const {
    std::cout << theme::banner(AZPROV_VERSION);
    std::cout << theme::section("Usage");
    for (const auto& [name, cmd] : commands_) {
        std::cout << theme::color::BLUE << "    azprov " << name << theme::color::RESET;
        if (!cmd.usage.empty()) {
            std::cout << " " << theme::color::SLATE << cmd.usage << theme::color::RESET;
        }
        std::cout << "\n" << theme::color::DIM << "        " << cmd.help
                  << theme::color::RESET << "\n";
    }
    std::cout << "\n" << theme::color::DIM
              << "    azprov --config <path> <command>   Use another config file\n"
              << "    azprov --version                   Show version\n"
              << "    azprov --help                      Show this help"
              << theme::color::RESET << "\n\n";
}

// ── Helpers ──────────────────────────────────────────────────

Result<std::string> AzprovCLI::resolve_id(const std::string& prefix) {
    if (prefix.empty()) {
        return Result<std::string>::Err("Missing deployment id.");
    }
    if (jobs().find(prefix)) {
        return Result<std::string>::Ok(prefix);
    }

    std::vector<std::string> matches;
    for (const auto& s : jobs().summaries()) {
        if (s.id.compare(0, prefix.size(), prefix) == 0) matches.push_back(s.id);
    }
    if (matches.empty()) {
        return Result<std::string>::Err("Deployment not found: " + prefix);
    }
    if (matches.size() > 1) {
        return Result<std::string>::Err(
            fmt::format("Id prefix '{}' matches {} deployments", prefix, matches.size()));
    }
    return Result<std::string>::Ok(matches.front());
}

static int report_status(const std::string& id, JobStatus status) {
    std::string label = fmt::format("{} {}", id.substr(0, 8), to_string(status));
    if (is_retriable_failure(status)) {
        std::cout << "\n" << theme::fail(label);
        return 1;
    }
    std::cout << "\n" << theme::ok(label);
    return 0;
}

int AzprovCLI::follow(const std::string& id, std::size_t cursor) {
    while (true) {
        bool active = jobs().running(id);
        auto chunk = jobs().observe(id, cursor);
        if (chunk.is_err()) {
            std::cout << theme::fail(chunk.error);
            return 1;
        }
        for (const auto& line : chunk.value.lines) {
            std::cout << theme::log(line);
        }
        std::cout << std::flush;
        cursor = chunk.value.next_cursor;
        if (!active) {
            return report_status(id, chunk.value.status);
        }
        platform::sleep_ms(LOG_FOLLOW_POLL_MS / 4);
    }
}

int AzprovCLI::follow_persisted(const std::string& id, std::size_t cursor) {
    std::cout << theme::info("Waiting for the owning process (Ctrl-C to stop)...");
    while (true) {
        platform::sleep_ms(LOG_FOLLOW_POLL_MS);
        // Sampled before the read: the owner writes its final record before
        // releasing the lock.
        bool owner_alive = jobs().running(id);
        auto job = store_->load(id);
        if (!job) {
            std::cout << theme::fail("Deployment record is no longer readable: " + id);
            return 1;
        }
        for (std::size_t i = cursor; i < job->log.size(); ++i) {
            std::cout << theme::log(job->log[i]);
        }
        std::cout << std::flush;
        cursor = std::max(cursor, job->log.size());
        if (is_terminal(job->status)) {
            return report_status(id, job->status);
        }
        if (!owner_alive) {
            std::cout << "\n" << theme::fail(fmt::format(
                "No process is running deployment {}; it was interrupted ({})",
                id.substr(0, 8), to_string(job->status)));
            return 1;
        }
    }
}

static bool is_secret_key(const std::string& key) {
    return key.find("key") != std::string::npos ||
           key.find("secret") != std::string::npos ||
           key.find("connection_string") != std::string::npos;
}

static std::string mask(const std::string& value) {
    if (value.size() <= 4) return "****";
    return value.substr(0, 4) + std::string(8, '*');
}

// ── Commands ─────────────────────────────────────────────────

int AzprovCLI::cmd_deploy(const CommandArgs& args) {
    DeploymentRequest req;
    req.resource_group_base = args.get("base");
    req.location = args.get("location");
    req.include_search = args.has("search") ? "on" : "";
    req.openai_model_name = args.get("model");
    req.subscription_id = args.get("subscription");
    req.service_principal_name = args.get("sp-name");
    req.secret_expiration_date = args.get("secret-expiry");

    auto submitted = jobs().submit(req);
    if (submitted.is_err()) {
        std::cout << theme::fail(submitted.error);
        return 1;
    }

    const std::string& id = submitted.value;
    auto job = jobs().find(id);
    std::cout << theme::section("Deploying");
    std::cout << theme::kv("id", id);
    if (job) {
        std::cout << theme::kv("resource group", job->parameters.resource_group_name());
        std::cout << theme::kv("region", job->parameters.location);
        std::cout << theme::kv("model", job->parameters.openai_model_name);
    }
    std::cout << "\n";
    return follow(id, 0);
}

int AzprovCLI::cmd_retry(const CommandArgs& args) {
    auto id = resolve_id(args.positional.empty() ? "" : args.positional[0]);
    if (id.is_err()) {
        std::cout << theme::fail(id.error);
        return 1;
    }
    auto before = jobs().observe(id.value, 0);
    std::size_t cursor = before.is_ok() ? before.value.next_cursor : 0;
    auto started = jobs().retry(id.value);
    if (started.is_err()) {
        std::cout << theme::fail(started.error);
        return 1;
    }
    std::cout << theme::section("Retrying " + id.value.substr(0, 8));
    return follow(id.value, cursor);
}

int AzprovCLI::cmd_destroy(const CommandArgs& args) {
    auto id = resolve_id(args.positional.empty() ? "" : args.positional[0]);
    if (id.is_err()) {
        std::cout << theme::fail(id.error);
        return 1;
    }
    auto before = jobs().observe(id.value, 0);
    std::size_t cursor = before.is_ok() ? before.value.next_cursor : 0;
    auto started = jobs().destroy(id.value);
    if (started.is_err()) {
        std::cout << theme::fail(started.error);
        return 1;
    }
    std::cout << theme::section("Destroying " + id.value.substr(0, 8));
    return follow(id.value, cursor);
}

int AzprovCLI::cmd_list(const CommandArgs&) {
    auto rows = jobs().summaries();
    std::cout << theme::section("Deployments");
    if (rows.empty()) {
        std::cout << theme::info("No deployments yet.");
        return 0;
    }

    std::cout << theme::color::DIM
              << fmt::format("    {:<10}{:<17}{:<18}{:<14}{:<7}{}\n",
                             "ID", "NAME", "STATUS", "REGION", "STATE", "CREATED")
              << theme::color::RESET;
    for (const auto& s : rows) {
        std::string status = to_string(s.status);
        std::string colored = is_retriable_failure(s.status) ? theme::red(status)
                            : s.status == JobStatus::Completed ? theme::green(status)
                            : status;
        std::cout << fmt::format("    {:<10}{:<17}", s.id.substr(0, 8), s.name)
                  << colored << std::string(status.size() < 18 ? 18 - status.size() : 1, ' ')
                  << fmt::format("{:<14}{:<7}{}\n", s.region, s.has_state ? "yes" : "no",
                                 s.created_at);
    }
    std::cout << "\n";
    return 0;
}

int AzprovCLI::cmd_show(const CommandArgs& args) {
    auto id = resolve_id(args.positional.empty() ? "" : args.positional[0]);
    if (id.is_err()) {
        std::cout << theme::fail(id.error);
        return 1;
    }
    auto job = jobs().find(id.value);
    if (!job) {
        std::cout << theme::fail("Deployment not found: " + id.value);
        return 1;
    }

    const JobParameters& p = job->parameters;
    std::cout << theme::section("Deployment " + job->id.substr(0, 8));
    std::cout << theme::kv("id", job->id);
    std::cout << theme::kv("status", to_string(job->status));
    std::cout << theme::kv("resource group", p.resource_group_name());
    std::cout << theme::kv("region", p.location);
    std::cout << theme::kv("search", p.include_search ? "enabled" : "disabled");
    std::cout << theme::kv("model", fmt::format("{} ({})", p.openai_model_name,
                                                p.openai_deployment_sku));
    std::cout << theme::kv("subscription", p.subscription_id.empty() ? "-" : p.subscription_id);
    std::cout << theme::kv("terraform state", jobs().durable_state_present(job->id) ? "present" : "absent");
    std::cout << theme::kv("created", job->created_at);
    std::cout << theme::kv("updated", job->updated_at);

    std::cout << theme::section("Resource names");
    for (const auto& [role, name] : job->names.entries()) {
        std::cout << theme::kv(role, name);
    }

    std::cout << theme::section("Outputs");
    if (job->outputs.empty()) {
        std::cout << theme::info("No outputs available.");
    }
    bool reveal = args.has("reveal");
    for (const auto& [key, value] : job->outputs) {
        std::cout << theme::kv(key, (!reveal && is_secret_key(key)) ? mask(value) : value);
    }
    std::cout << "\n";
    return 0;
}

int AzprovCLI::cmd_logs(const CommandArgs& args) {
    auto id = resolve_id(args.positional.empty() ? "" : args.positional[0]);
    if (id.is_err()) {
        std::cout << theme::fail(id.error);
        return 1;
    }
    auto chunk = jobs().observe(id.value, 0);
    if (chunk.is_err()) {
        std::cout << theme::fail(chunk.error);
        return 1;
    }
    for (const auto& line : chunk.value.lines) {
        std::cout << theme::log(line);
    }
    std::cout << std::flush;

    if (args.has("follow") && !is_terminal(chunk.value.status)) {
        return follow_persisted(id.value, chunk.value.next_cursor);
    }
    return 0;
}

int AzprovCLI::cmd_env(const CommandArgs& args) {
    auto id = resolve_id(args.positional.empty() ? "" : args.positional[0]);
    if (id.is_err()) {
        std::cout << theme::fail(id.error);
        return 1;
    }
    auto job = jobs().find(id.value);
    if (!job) {
        std::cout << theme::fail("Deployment not found: " + id.value);
        return 1;
    }

    auto content = render_env(*job, config_.export_defaults(), now_utc_iso());
    if (content.is_err()) {
        std::cout << theme::fail(content.error);
        return 1;
    }

    std::string file = args.positional.size() > 1 ? args.positional[1] : env_filename(job->id);
    platform::write_file_atomic(file, content.value);
    std::cout << theme::ok("Wrote " + file);
    std::cout << theme::step("Never commit this file; it contains live credentials.");
    return 0;
}

int AzprovCLI::cmd_init_config(const CommandArgs& args) {
    fs::path path = args.positional.empty() ? get_global_config_path()
                                            : fs::path(args.positional[0]);
    if (fs::exists(path)) {
        std::cout << theme::info("Config already exists: " + path.string());
        return 0;
    }
    auto created = create_default_config(path);
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return 1;
    }
    std::cout << theme::ok("Created " + path.string());
    return 0;
}

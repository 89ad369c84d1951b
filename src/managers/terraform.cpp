#include "terraform.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

TerraformCli::TerraformCli(const CommandRunner& runner, std::string binary, EnvMap env)
    : runner_(runner), binary_(std::move(binary)), env_(std::move(env)) {}

// ── Commands ───────────────────────────────────────────────

CommandSpec TerraformCli::init_command() const {
    return {binary_, {"init", "-input=false", "-no-color"}, CommandKind::Plain};
}

CommandSpec TerraformCli::apply_command() const {
    return {binary_,
            {"apply", "-auto-approve", "-input=false", "-no-color",
             std::string("-var-file=") + TF_VARS_FILE},
            CommandKind::Apply};
}

CommandSpec TerraformCli::destroy_command() const {
    return {binary_,
            {"destroy", "-auto-approve", "-input=false", "-no-color",
             std::string("-var-file=") + TF_VARS_FILE},
            CommandKind::Destroy};
}

CommandSpec TerraformCli::output_command() const {
    // Outputs include the service principal secret
    return {binary_, {"output", "-json"}, CommandKind::Plain, true};
}

void TerraformCli::init(const fs::path& workspace, const LineSink& sink) const {
    runner_.run(init_command(), workspace, env_, RetryPolicy{}, sink);
}

void TerraformCli::apply(const fs::path& workspace, const RetryPolicy& policy,
                         const LineSink& sink) const {
    runner_.run(apply_command(), workspace, env_, policy, sink);
}

void TerraformCli::destroy(const fs::path& workspace, const RetryPolicy& policy,
                           const LineSink& sink) const {
    runner_.run(destroy_command(), workspace, env_, policy, sink);
}

Result<OutputMap> TerraformCli::outputs(const fs::path& workspace) const {
    auto cmd = output_command();
    auto r = runner_.capture(cmd, workspace, env_);
    if (r.failed()) {
        return Result<OutputMap>::Err(
            fmt::format("{} exited with {}", cmd.display(), r.exit_code));
    }
    auto parsed = parse_terraform_outputs(r.output);
    if (parsed.is_ok()) {
        derive_endpoint_aliases(parsed.value);
    }
    return parsed;
}

// ── tfvars ─────────────────────────────────────────────────

static std::string hcl_quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
    out += "\"";
    return out;
}

std::string render_tfvars(const JobParameters& p, const ResourceNames& n) {
    std::string out;
    auto str = [&](const char* key, const std::string& value) {
        out += fmt::format("{} = {}\n", key, hcl_quote(value));
    };
    auto flag = [&](const char* key, bool value) {
        out += fmt::format("{} = {}\n", key, value ? "true" : "false");
    };

    str("rg_name", p.resource_group_name());
    str("location", p.location);
    flag("include_search", p.include_search);
    str("storage_account_name", n.storage_account);
    str("search_service_name", n.search_service);
    str("foundry_project_name", n.foundry_project);
    str("ai_services_name", n.ai_services);
    str("ai_foundry_hub_name", n.ai_foundry_hub);
    str("app_insights_name", n.app_insights);
    str("log_analytics_workspace_name", n.log_analytics_workspace);
    flag("enable_model_deployment", p.enable_model_deployment);
    str("model_deployment_name", p.model_deployment_name);
    str("openai_model_name", p.openai_model_name);
    str("openai_model_version", p.openai_model_version);
    str("openai_deployment_sku", p.openai_deployment_sku);
    str("service_principal_name", p.service_principal_name);
    str("secret_expiration_date", p.secret_expiration_date);
    if (!p.subscription_id.empty()) {
        str("subscription_id", p.subscription_id);
    }
    return out;
}

// ── Outputs ────────────────────────────────────────────────

static std::string node_to_text(const YAML::Node& node) {
    if (node.IsScalar()) return node.as<std::string>();

    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out << node;
    return out.c_str();
}

Result<OutputMap> parse_terraform_outputs(const std::string& json) {
    OutputMap outputs;
    if (trimmed(json).empty()) {
        return Result<OutputMap>::Ok(outputs);
    }

    try {
        // JSON is a subset of YAML flow syntax
        YAML::Node root = YAML::Load(json);
        if (!root.IsMap()) {
            return Result<OutputMap>::Err("terraform output is not an object");
        }
        for (const auto& kv : root) {
            std::string key = kv.first.as<std::string>();
            YAML::Node value = kv.second.IsMap() ? kv.second["value"] : YAML::Node();
            if (!value || value.IsNull()) continue;
            outputs[key] = node_to_text(value);
        }
    } catch (const std::exception& e) {
        return Result<OutputMap>::Err(std::string("Cannot parse terraform output: ") + e.what());
    }
    return Result<OutputMap>::Ok(outputs);
}

static std::string get_or_empty(const OutputMap& m, const std::string& key) {
    auto it = m.find(key);
    return it == m.end() ? std::string() : it->second;
}

void derive_endpoint_aliases(OutputMap& outputs) {
    std::string ai_services = get_or_empty(outputs, "ai_services_endpoint");
    std::string openai = get_or_empty(outputs, "openai_endpoint");
    std::string inference = get_or_empty(outputs, "ai_inference_endpoint");

    bool cognitive = ai_services.find(COGNITIVE_DOMAIN) != std::string::npos;
    if (openai.empty() && cognitive) {
        openai = replace_all(ai_services, COGNITIVE_DOMAIN, OPENAI_DOMAIN);
    }
    if (inference.empty() && cognitive) {
        inference = replace_all(ai_services, COGNITIVE_DOMAIN, INFERENCE_DOMAIN);
    }

    auto set_default = [&](const std::string& key, const std::string& value) {
        if (!value.empty()) outputs.emplace(key, value);
    };
    set_default("azure_ai_services_endpoint", ai_services);
    set_default("azure_openai_endpoint", openai);
    set_default("azure_ai_inference_endpoint", inference);
    set_default("azure_ai_foundry_project_endpoint",
                get_or_empty(outputs, "foundry_project_endpoint"));
    set_default("openai_model_deployment_name",
                get_or_empty(outputs, "openai_deployment_name"));
}

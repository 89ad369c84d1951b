#include "request.hpp"
#include "constants.hpp"
#include "naming.hpp"
#include "utils.hpp"
#include <fmt/format.h>

const std::set<std::string>& allowed_model_names() {
    static const std::set<std::string> names = {
        "gpt-4.1", "gpt-4.1-mini", "gpt-4o", "gpt-4o-mini",
    };
    return names;
}

bool parse_flag(const std::string& value) {
    std::string v = to_lower(trimmed(value));
    return v == "on" || v == "1" || v == "true" || v == "yes";
}

Result<JobParameters> validate_request(const DeploymentRequest& request) {
    std::string base = sanitize_base(request.resource_group_base);
    if (base.size() < MIN_RESOURCE_GROUP_BASE) {
        return Result<JobParameters>::Err("Resource group base too short.");
    }
    if (base.size() > MAX_RESOURCE_GROUP_BASE) {
        return Result<JobParameters>::Err(
            fmt::format("Resource group base too long (max {}).", MAX_RESOURCE_GROUP_BASE));
    }

    std::string location = trimmed(request.location);
    if (location.empty()) {
        return Result<JobParameters>::Err("Location is required.");
    }

    std::string model = trimmed(request.openai_model_name);
    if (model.empty()) model = DEFAULT_MODEL_NAME;
    if (allowed_model_names().count(model) == 0) {
        return Result<JobParameters>::Err("Invalid model selection.");
    }

    std::string sp_name = trimmed(request.service_principal_name);
    if (sp_name.empty()) {
        return Result<JobParameters>::Err("Service principal name is required.");
    }
    std::string expiry = trimmed(request.secret_expiration_date);
    if (expiry.empty()) {
        return Result<JobParameters>::Err("Secret expiration date is required.");
    }

    JobParameters p;
    p.resource_group_base = base;
    p.location = location;
    p.include_search = parse_flag(request.include_search);
    p.enable_model_deployment = true;
    p.openai_model_name = model;
    p.openai_model_version = "";
    p.openai_deployment_sku = DEFAULT_DEPLOYMENT_SKU;
    p.model_deployment_name = model;
    p.service_principal_name = sp_name;
    p.secret_expiration_date = expiry;

    // Fall back to the environment when the form left it empty
    p.subscription_id = trimmed(request.subscription_id);
    if (p.subscription_id.empty()) {
        p.subscription_id = trimmed(env_or_empty(ENV_SUBSCRIPTION_ID));
    }

    return Result<JobParameters>::Ok(p);
}

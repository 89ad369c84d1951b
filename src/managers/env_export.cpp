#include "env_export.hpp"
#include <fmt/format.h>
#include <initializer_list>

static const char* RULE =
    "# =============================================================================\n";

// First non-empty output among `keys`
static std::string first_of(const OutputMap& outputs, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = outputs.find(key);
        if (it != outputs.end() && !it->second.empty()) return it->second;
    }
    return "";
}

static void section(std::string& out, const char* title) {
    out += "\n";
    out += RULE;
    out += fmt::format("# {}\n", title);
    out += RULE;
}

static void put(std::string& out, const char* key, const std::string& value) {
    if (value.empty()) return;
    out += fmt::format("{}=\"{}\"\n", key, value);
}

Result<std::string> render_env(const Job& job, const ExportDefaults& defaults,
                               const std::string& generated_at) {
    const OutputMap& o = job.outputs;
    if (o.empty()) {
        return Result<std::string>::Err(
            fmt::format("Deployment {} has no outputs to export", job.id.substr(0, 8)));
    }

    std::string out;
    out += RULE;
    out += "# Azure AI Environment Configuration\n";
    out += RULE;
    out += fmt::format("# Generated from Azure AI deployment: {}\n", job.id.substr(0, 8));
    out += fmt::format("# Created at: {}\n", generated_at);
    out += "# Never commit .env files with real credentials to version control!\n";

    section(out, "Azure Subscription & Service Principal");
    std::string subscription = first_of(o, {"subscription_id"});
    if (subscription.empty()) subscription = job.parameters.subscription_id;
    put(out, "AZURE_SUBSCRIPTION_ID", subscription);
    put(out, "AZURE_TENANT_ID", first_of(o, {"tenant_id"}));
    put(out, "AZURE_CLIENT_ID", first_of(o, {"service_principal_app_id"}));
    put(out, "AZURE_CLIENT_SECRET", first_of(o, {"service_principal_secret"}));

    const std::string api_key = first_of(o, {"azure_openai_key", "azure_openai_api_key_primary"});
    const std::string deployment = first_of(o, {"openai_deployment_name",
                                                "openai_model_deployment_name"});

    section(out, "Azure OpenAI Configuration");
    put(out, "AZURE_OPENAI_ENDPOINT", first_of(o, {"azure_openai_endpoint", "openai_endpoint"}));
    put(out, "AZURE_OPENAI_API_KEY", api_key);
    put(out, "AZURE_OPENAI_DEPLOYMENT_NAME", deployment);
    put(out, "AZURE_OPENAI_API_VERSION", defaults.openai_api_version);
    put(out, "AZURE_OPENAI_EMBEDDING_DEPLOYMENT", defaults.embedding_deployment);

    // Foundry shares the AI services key and the model deployment
    section(out, "Azure AI Foundry / AI Studio");
    put(out, "AI_FOUNDRY_ENDPOINT", first_of(o, {"azure_ai_inference_endpoint",
                                                 "ai_inference_endpoint",
                                                 "azure_foundry_project_url"}));
    put(out, "AI_FOUNDRY_PROJECT_ENDPOINT", first_of(o, {"azure_ai_foundry_project_endpoint"}));
    put(out, "AI_FOUNDRY_API_KEY", api_key);
    put(out, "AI_FOUNDRY_DEPLOYMENT_NAME", deployment);

    section(out, "Azure AI Search Configuration");
    put(out, "AZURE_SEARCH_ENDPOINT", first_of(o, {"search_service_endpoint",
                                                   "azure_ai_search_url"}));
    put(out, "AZURE_SEARCH_API_KEY", first_of(o, {"azure_search_admin_key",
                                                  "azure_ai_search_key"}));
    put(out, "AZURE_SEARCH_INDEX_NAME", defaults.search_index_name);

    section(out, "Azure Storage");
    put(out, "AZURE_STORAGE_CONNECTION_STRING", first_of(o, {"storage_connection_string"}));
    put(out, "AZURE_STORAGE_ACCOUNT_KEY", first_of(o, {"storage_account_key"}));

    section(out, "Logging and Monitoring (Optional)");
    put(out, "LOG_LEVEL", defaults.log_level);
    put(out, "APPLICATION_INSIGHTS_CONNECTION_STRING",
        first_of(o, {"app_insights_connection_string"}));

    return Result<std::string>::Ok(out);
}

std::string env_filename(const std::string& job_id) {
    return fmt::format("azure-ai-{}.env", job_id.substr(0, 8));
}

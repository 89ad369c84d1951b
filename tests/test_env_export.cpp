#include <gtest/gtest.h>
#include <managers/env_export.hpp>

static ExportDefaults defaults() {
    ExportDefaults d;
    d.openai_api_version = "2024-12-01-preview";
    d.embedding_deployment = "text-embedding-3-small";
    d.search_index_name = "ai-search-index";
    d.log_level = "INFO";
    return d;
}

static bool has_line(const std::string& text, const std::string& line) {
    return text.find(line + "\n") != std::string::npos;
}

TEST(EnvExport, RefusesJobWithoutOutputs) {
    Job job;
    job.id = "0123456789abcdef";
    auto r = render_env(job, defaults(), "2026-01-01T00:00:00Z");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Deployment 01234567 has no outputs to export");
}

TEST(EnvExport, RendersSectionsAndDefaults) {
    Job job;
    job.id = "0123456789abcdef";
    job.parameters.subscription_id = "sub-1";
    job.outputs = {
        {"tenant_id", "tenant-1"},
        {"service_principal_app_id", "app-1"},
        {"service_principal_secret", "secret-1"},
        {"azure_openai_endpoint", "https://x.openai.azure.com/"},
        {"azure_openai_api_key_primary", "key-primary"},
        {"openai_model_deployment_name", "gpt-4.1"},
        {"azure_ai_inference_endpoint", "https://x.services.ai.azure.com/"},
        {"storage_connection_string", "DefaultEndpointsProtocol=https"},
    };

    auto r = render_env(job, defaults(), "2026-01-01T00:00:00Z");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const std::string& env = r.value;

    EXPECT_TRUE(has_line(env, "# Generated from Azure AI deployment: 01234567"));
    EXPECT_TRUE(has_line(env, "# Created at: 2026-01-01T00:00:00Z"));
    EXPECT_TRUE(has_line(env, "AZURE_SUBSCRIPTION_ID=\"sub-1\""));
    EXPECT_TRUE(has_line(env, "AZURE_TENANT_ID=\"tenant-1\""));
    EXPECT_TRUE(has_line(env, "AZURE_CLIENT_SECRET=\"secret-1\""));
    EXPECT_TRUE(has_line(env, "AZURE_OPENAI_API_KEY=\"key-primary\""));
    EXPECT_TRUE(has_line(env, "AZURE_OPENAI_DEPLOYMENT_NAME=\"gpt-4.1\""));
    EXPECT_TRUE(has_line(env, "AZURE_OPENAI_API_VERSION=\"2024-12-01-preview\""));
    EXPECT_TRUE(has_line(env, "AI_FOUNDRY_API_KEY=\"key-primary\""));
    EXPECT_TRUE(has_line(env, "AI_FOUNDRY_ENDPOINT=\"https://x.services.ai.azure.com/\""));
    EXPECT_TRUE(has_line(env, "AZURE_SEARCH_INDEX_NAME=\"ai-search-index\""));
    EXPECT_TRUE(has_line(env, "AZURE_STORAGE_CONNECTION_STRING=\"DefaultEndpointsProtocol=https\""));
    EXPECT_TRUE(has_line(env, "LOG_LEVEL=\"INFO\""));

    // Absent values are omitted rather than written empty
    EXPECT_EQ(env.find("AZURE_SEARCH_ENDPOINT="), std::string::npos);
    EXPECT_EQ(env.find("=\"\""), std::string::npos);

    EXPECT_LT(env.find("# Azure OpenAI Configuration"), env.find("# Azure AI Search Configuration"));
}

TEST(EnvExport, OutputSubscriptionBeatsParameter) {
    Job job;
    job.id = "abcdef0123";
    job.parameters.subscription_id = "param-sub";
    job.outputs = {{"subscription_id", "output-sub"}};
    auto r = render_env(job, defaults(), "now");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(has_line(r.value, "AZURE_SUBSCRIPTION_ID=\"output-sub\""));
}

TEST(EnvExport, FileNameUsesShortId) {
    EXPECT_EQ(env_filename("0123456789abcdef"), "azure-ai-01234567.env");
    EXPECT_EQ(env_filename("abc"), "azure-ai-abc.env");
}

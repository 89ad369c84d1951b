#include "test_support.hpp"
#include <managers/terraform.hpp>
#include <core/naming.hpp>

TEST(TerraformOutputs, FlattensValues) {
    auto r = parse_terraform_outputs(R"({
        "resource_group_name": {"sensitive": false, "type": "string", "value": "RG-demo"},
        "search_enabled": {"sensitive": false, "type": "bool", "value": true},
        "unset_output": {"sensitive": false, "type": "string", "value": null}
    })");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.at("resource_group_name"), "RG-demo");
    EXPECT_EQ(r.value.at("search_enabled"), "true");
    EXPECT_EQ(r.value.count("unset_output"), 0u);
}

TEST(TerraformOutputs, NestedValuesStayStructured) {
    auto r = parse_terraform_outputs(
        R"({"ids": {"type": ["list", "string"], "value": ["a", "b"]}})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const std::string& ids = r.value.at("ids");
    EXPECT_EQ(ids.front(), '[');
    EXPECT_NE(ids.find("\"a\""), std::string::npos);
    EXPECT_NE(ids.find("\"b\""), std::string::npos);
}

TEST(TerraformOutputs, EmptyInputIsEmptyMap) {
    auto r = parse_terraform_outputs("   \n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());

    r = parse_terraform_outputs("{}");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
}

TEST(TerraformOutputs, RejectsNonObject) {
    EXPECT_TRUE(parse_terraform_outputs("[1, 2]").is_err());
    EXPECT_TRUE(parse_terraform_outputs("{\"a\": [").is_err());
}

TEST(TerraformOutputs, DerivesEndpointAliases) {
    OutputMap o = {
        {"ai_services_endpoint", "https://demoaisabcde.cognitiveservices.azure.com/"},
        {"foundry_project_endpoint", "https://hub.services.ai.azure.com/api/projects/p"},
        {"openai_deployment_name", "gpt-4.1"},
    };
    derive_endpoint_aliases(o);

    EXPECT_EQ(o.at("azure_ai_services_endpoint"),
              "https://demoaisabcde.cognitiveservices.azure.com/");
    EXPECT_EQ(o.at("azure_openai_endpoint"), "https://demoaisabcde.openai.azure.com/");
    EXPECT_EQ(o.at("azure_ai_inference_endpoint"), "https://demoaisabcde.services.ai.azure.com/");
    EXPECT_EQ(o.at("azure_ai_foundry_project_endpoint"),
              "https://hub.services.ai.azure.com/api/projects/p");
    EXPECT_EQ(o.at("openai_model_deployment_name"), "gpt-4.1");
}

TEST(TerraformOutputs, AliasesNeverOverwrite) {
    OutputMap o = {
        {"ai_services_endpoint", "https://x.cognitiveservices.azure.com/"},
        {"openai_endpoint", "https://custom.example/"},
        {"azure_openai_endpoint", "https://pinned.example/"},
    };
    derive_endpoint_aliases(o);
    EXPECT_EQ(o.at("azure_openai_endpoint"), "https://pinned.example/");
}

TEST(TerraformOutputs, NoCognitiveDomainNoDerivation) {
    OutputMap o = {{"ai_services_endpoint", "https://example.com/"}};
    derive_endpoint_aliases(o);
    EXPECT_EQ(o.count("azure_openai_endpoint"), 0u);
    EXPECT_EQ(o.count("azure_ai_inference_endpoint"), 0u);
}

TEST(TerraformVars, RendersEveryInput) {
    JobParameters p;
    p.resource_group_base = "demo";
    p.location = "eastus2";
    p.include_search = true;
    p.openai_model_name = "gpt-4o";
    p.openai_deployment_sku = "GlobalStandard";
    p.model_deployment_name = "gpt-4o";
    p.service_principal_name = "sp \"quoted\"";
    p.secret_expiration_date = "2027-01-01";
    auto names = build_names("demo", "abcde");

    std::string tfvars = render_tfvars(p, names);
    EXPECT_NE(tfvars.find("rg_name = \"RG-demo\"\n"), std::string::npos);
    EXPECT_NE(tfvars.find("include_search = true\n"), std::string::npos);
    EXPECT_NE(tfvars.find("storage_account_name = \"demostgabcde\"\n"), std::string::npos);
    EXPECT_NE(tfvars.find("foundry_project_name = \"demoprjabcde\"\n"), std::string::npos);
    EXPECT_NE(tfvars.find("enable_model_deployment = true\n"), std::string::npos);
    EXPECT_NE(tfvars.find("openai_model_version = \"\"\n"), std::string::npos);
    EXPECT_NE(tfvars.find("service_principal_name = \"sp \\\"quoted\\\"\"\n"), std::string::npos);
    EXPECT_EQ(tfvars.find("subscription_id"), std::string::npos);

    p.subscription_id = "sub-1";
    EXPECT_NE(render_tfvars(p, names).find("subscription_id = \"sub-1\"\n"), std::string::npos);
}

class TerraformCliTest : public ScratchDirTest {};

TEST_F(TerraformCliTest, BuildsExpectedCommands) {
    CommandRunner runner;
    TerraformCli tf(runner, "terraform");

    EXPECT_EQ(tf.apply_command().display(),
              "terraform apply -auto-approve -input=false -no-color -var-file=terraform.tfvars");
    EXPECT_EQ(tf.apply_command().kind, CommandKind::Apply);
    EXPECT_EQ(tf.destroy_command().kind, CommandKind::Destroy);
    EXPECT_EQ(tf.init_command().kind, CommandKind::Plain);
    EXPECT_EQ(tf.output_command().display(), "terraform output -json");
    EXPECT_TRUE(tf.output_command().sensitive);
    EXPECT_FALSE(tf.apply_command().sensitive);
}

TEST_F(TerraformCliTest, OutputsRunInsideWorkspace) {
    auto fake = write_script("bin/terraform",
        "if [ \"$1\" = output ] && [ -f main.tf ]; then\n"
        "  echo '{\"ai_services_endpoint\": {\"value\": \"https://a.cognitiveservices.azure.com/\"}}'\n"
        "  exit 0\n"
        "fi\n"
        "exit 1\n");
    write_file("ws/main.tf", "# definitions\n");

    CommandRunner runner;
    TerraformCli tf(runner, fake.string());
    auto r = tf.outputs(test_dir / "ws");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.at("azure_openai_endpoint"), "https://a.openai.azure.com/");
}

TEST_F(TerraformCliTest, OutputsFailureIsAnError) {
    auto fake = write_script("bin/terraform", "exit 1\n");
    CommandRunner runner;
    TerraformCli tf(runner, fake.string());
    EXPECT_TRUE(tf.outputs(test_dir).is_err());
}

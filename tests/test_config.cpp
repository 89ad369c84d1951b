#include "test_support.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>

class ConfigTest : public ScratchDirTest {};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    auto c = Config::load(test_dir / "absent.yaml");
    ASSERT_TRUE(c.is_ok()) << c.error;
    EXPECT_EQ(c.value.tools().terraform, "terraform");
    EXPECT_EQ(c.value.tools().az, "az");
    EXPECT_EQ(c.value.retry().apply.max_retries, 2);
    EXPECT_EQ(c.value.retry().apply.delay, std::chrono::seconds(60));
    EXPECT_EQ(c.value.retry().destroy.max_retries, 2);
    EXPECT_EQ(c.value.retry().destroy.delay, std::chrono::seconds(30));
    EXPECT_EQ(c.value.export_defaults().openai_api_version, "2024-12-01-preview");
    EXPECT_EQ(c.value.export_defaults().log_level, "INFO");
}

TEST_F(ConfigTest, LoadsAllSections) {
    write_file("config.yaml",
        "paths:\n"
        "  terraform_dir: tf\n"
        "  deployments_root: /var/lib/azprov\n"
        "tools:\n"
        "  terraform: /opt/tf/terraform\n"
        "retry:\n"
        "  apply: { max_retries: 5, delay_ms: 250 }\n"
        "  destroy: { delay_seconds: 7 }\n"
        "environment:\n"
        "  ARM_SKIP_PROVIDER_REGISTRATION: \"true\"\n"
        "export:\n"
        "  log_level: DEBUG\n");

    auto c = Config::load(test_dir / "config.yaml");
    ASSERT_TRUE(c.is_ok()) << c.error;
    EXPECT_EQ(c.value.paths().terraform_dir, (test_dir / "tf").string());
    EXPECT_EQ(c.value.paths().deployments_root, "/var/lib/azprov");
    EXPECT_EQ(c.value.tools().terraform, "/opt/tf/terraform");
    EXPECT_EQ(c.value.tools().az, "az");
    EXPECT_EQ(c.value.retry().apply.max_retries, 5);
    EXPECT_EQ(c.value.retry().apply.delay, std::chrono::milliseconds(250));
    EXPECT_EQ(c.value.retry().destroy.max_retries, 2);
    EXPECT_EQ(c.value.retry().destroy.delay, std::chrono::seconds(7));
    EXPECT_EQ(c.value.environment().at("ARM_SKIP_PROVIDER_REGISTRATION"), "true");
    EXPECT_EQ(c.value.export_defaults().log_level, "DEBUG");
    EXPECT_EQ(c.value.export_defaults().search_index_name, "ai-search-index");
}

TEST_F(ConfigTest, MalformedFileIsAnError) {
    write_file("bad.yaml", "paths: [unclosed\n");
    auto c = Config::load(test_dir / "bad.yaml");
    ASSERT_TRUE(c.is_err());
    EXPECT_NE(c.error.find("Failed to parse config"), std::string::npos);
}

TEST_F(ConfigTest, DefaultTemplateRoundTrips) {
    auto path = test_dir / "nested" / "config.yaml";
    ASSERT_TRUE(create_default_config(path).is_ok());
    ASSERT_TRUE(fs::exists(path));

    auto c = Config::load(path);
    ASSERT_TRUE(c.is_ok()) << c.error;
    EXPECT_EQ(c.value.retry().apply.delay, std::chrono::seconds(60));
    EXPECT_TRUE(c.value.environment().empty());
}

TEST_F(ConfigTest, DefaultTemplateDoesNotOverwrite) {
    auto path = write_file("config.yaml", "tools: { az: /custom/az }\n");
    ASSERT_TRUE(create_default_config(path).is_ok());
    EXPECT_EQ(read_file(path), "tools: { az: /custom/az }\n");
}

TEST_F(ConfigTest, EnvironmentVariableSelectsFile) {
    auto path = write_file("alt.yaml", "tools: { az: /alt/az }\n");
    ScopedEnv env(ENV_CONFIG_PATH, path.c_str());
    auto c = Config::load_default();
    ASSERT_TRUE(c.is_ok());
    EXPECT_EQ(c.value.tools().az, "/alt/az");
}

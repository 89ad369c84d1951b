#include "test_support.hpp"
#include <managers/cloud_session.hpp>
#include <managers/job_log.hpp>
#include <core/constants.hpp>

// Fake `az` driven by files in its own directory:
//   logged_in      present -> `account show` succeeds
//   login_ok       present -> `login` succeeds (and creates logged_in)
//   accounts.json  output of `account list`
//   calls.log      every invocation, one per line
class CloudSessionTest : public ScratchDirTest {
protected:
    fs::path az;
    CommandRunner runner;

    void SetUp() override {
        ScratchDirTest::SetUp();
        az = write_script("az/az",
            "D=$(dirname \"$0\")\n"
            "echo \"$*\" >> \"$D/calls.log\"\n"
            "case \"$1 $2\" in\n"
            "  'account show')\n"
            "    [ -f \"$D/logged_in\" ] || exit 1\n"
            "    echo '{\"id\": \"active-sub\", \"name\": \"Active\"}' ;;\n"
            "  'account list') cat \"$D/accounts.json\" ;;\n"
            "  'account set') [ \"$4\" = bad-sub ] && exit 1 ; exit 0 ;;\n"
            "  'login '*|'login --use-device-code')\n"
            "    [ -f \"$D/login_ok\" ] || exit 1\n"
            "    touch \"$D/logged_in\" ;;\n"
            "  'cognitiveservices account')\n"
            "    echo '{\"key1\": \"k-one\", \"key2\": \"k-two\"}' ;;\n"
            "  'storage account')\n"
            "    if [ \"$3\" = show-connection-string ]; then\n"
            "      echo '{\"connectionString\": \"DefaultEndpointsProtocol=https;AccountName=x\"}'\n"
            "    else\n"
            "      echo '[{\"keyName\": \"key1\", \"value\": \"storage-key\"}]'\n"
            "    fi ;;\n"
            "  'search query-key') exit 2 ;;\n"
            "  *) exit 1 ;;\n"
            "esac\n");
        write_file("az/accounts.json", "[]");
    }

    void set_accounts(const std::string& json) { write_file("az/accounts.json", json); }
    void mark_logged_in() { write_file("az/logged_in"); }
    std::string calls() const { return read_file(test_dir / "az" / "calls.log"); }
};

TEST_F(CloudSessionTest, ExplicitHintWins) {
    ScopedEnv env(ENV_SUBSCRIPTION_ID, "env-sub");
    CloudSession s(runner, az.string());
    auto sel = s.select_account("given-sub");
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(sel->id, "given-sub");
    EXPECT_EQ(sel->strategy, "explicit(given-sub)");
}

TEST_F(CloudSessionTest, EnvironmentBeatsEnumeration) {
    ScopedEnv env(ENV_SUBSCRIPTION_ID, "env-sub");
    set_accounts(R"([{"id": "a"}, {"id": "b", "isDefault": true}])");
    CloudSession s(runner, az.string());
    auto sel = s.select_account("");
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(sel->strategy, "env(env-sub)");
}

TEST_F(CloudSessionTest, SingleAccount) {
    ScopedEnv env(ENV_SUBSCRIPTION_ID, nullptr);
    set_accounts(R"([{"id": "only", "isDefault": false}])");
    CloudSession s(runner, az.string());
    auto sel = s.select_account("");
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(sel->id, "only");
    EXPECT_EQ(sel->strategy, "single");
}

TEST_F(CloudSessionTest, DefaultFlagThenFirst) {
    ScopedEnv env(ENV_SUBSCRIPTION_ID, nullptr);
    set_accounts(R"([{"id": "a", "isDefault": false}, {"id": "b", "isDefault": true}])");
    CloudSession s(runner, az.string());
    auto sel = s.select_account("");
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(sel->id, "b");
    EXPECT_EQ(sel->strategy, "default-flag");

    set_accounts(R"([{"id": "a"}, {"id": "c"}])");
    sel = s.select_account("");
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(sel->id, "a");
    EXPECT_EQ(sel->strategy, "first");
}

TEST_F(CloudSessionTest, NoAccountsMeansNoSelection) {
    ScopedEnv env(ENV_SUBSCRIPTION_ID, nullptr);
    CloudSession s(runner, az.string());
    EXPECT_FALSE(s.select_account("").has_value());
}

TEST_F(CloudSessionTest, AuthenticatedSessionSetsAccount) {
    ScopedEnv skip(ENV_SKIP_LOGIN_CHECK, nullptr);
    ScopedEnv env(ENV_SUBSCRIPTION_ID, nullptr);
    mark_logged_in();
    set_accounts(R"([{"id": "only"}])");

    CloudSession s(runner, az.string());
    auto out = s.ensure_authenticated("");
    EXPECT_TRUE(out.ok);
    EXPECT_EQ(out.chosen, "only");
    EXPECT_EQ(out.message, "Subscription set (single): only");
    EXPECT_EQ(calls().find("login"), std::string::npos);
    EXPECT_NE(calls().find("account set --subscription only"), std::string::npos);
}

TEST_F(CloudSessionTest, FallsBackToDeviceCodeThenFails) {
    ScopedEnv skip(ENV_SKIP_LOGIN_CHECK, nullptr);
    CloudSession s(runner, az.string());
    auto out = s.ensure_authenticated("");
    EXPECT_FALSE(out.ok);
    EXPECT_EQ(out.message, "Azure CLI login failed (both standard and device code)");
    EXPECT_NE(calls().find("login\n"), std::string::npos);
    EXPECT_NE(calls().find("login --use-device-code\n"), std::string::npos);
}

TEST_F(CloudSessionTest, LoginRecoversSession) {
    ScopedEnv skip(ENV_SKIP_LOGIN_CHECK, nullptr);
    write_file("az/login_ok");
    CloudSession s(runner, az.string());
    auto out = s.ensure_authenticated("given");
    EXPECT_TRUE(out.ok);
    EXPECT_EQ(out.chosen, "given");
}

TEST_F(CloudSessionTest, FailedAccountSetIsNotFatal) {
    ScopedEnv skip(ENV_SKIP_LOGIN_CHECK, nullptr);
    mark_logged_in();
    CloudSession s(runner, az.string());
    auto out = s.ensure_authenticated("bad-sub");
    EXPECT_TRUE(out.ok);
    EXPECT_TRUE(out.chosen.empty());
}

TEST_F(CloudSessionTest, SkipToggleMakesItANoop) {
    for (const char* value : {"1", "true", "YES"}) {
        ScopedEnv skip(ENV_SKIP_LOGIN_CHECK, value);
        CloudSession s(runner, az.string());
        auto out = s.ensure_authenticated("");
        EXPECT_TRUE(out.ok) << value;
    }
    EXPECT_FALSE(fs::exists(test_dir / "az" / "calls.log"));
}

TEST_F(CloudSessionTest, FetchesAuxiliaryCredentials) {
    CloudSession s(runner, az.string());

    auto keys = s.ai_services_keys("demoais", "RG-demo");
    ASSERT_TRUE(keys.ok()) << keys.reason;
    EXPECT_EQ(keys.value->key1, "k-one");
    EXPECT_EQ(keys.value->key2, "k-two");
    EXPECT_NE(calls().find("cognitiveservices account keys list -n demoais -g RG-demo -o json"),
              std::string::npos);

    auto storage = s.storage_credentials("demostg", "RG-demo");
    ASSERT_TRUE(storage.ok()) << storage.reason;
    EXPECT_EQ(storage.value->connection_string, "DefaultEndpointsProtocol=https;AccountName=x");
    EXPECT_EQ(storage.value->account_key, "storage-key");

    std::string debug_log = read_file(azprov_log_path());
    EXPECT_EQ(debug_log.find("DefaultEndpointsProtocol=https;AccountName=x"), std::string::npos);
}

TEST_F(CloudSessionTest, UnavailableSearchKeyCarriesReason) {
    CloudSession s(runner, az.string());
    auto search = s.search_query_key("demosrc", "RG-demo");
    EXPECT_FALSE(search.ok());
    EXPECT_NE(search.reason.find("exited with 2"), std::string::npos);
}

#include "cloud_session.hpp"
#include "job_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

CloudSession::CloudSession(const CommandRunner& runner, std::string az_binary, EnvMap env)
    : runner_(runner), az_(std::move(az_binary)), env_(std::move(env)) {}

CommandSpec CloudSession::az(std::vector<std::string> args) const {
    return {az_, std::move(args), CommandKind::Plain};
}

CommandSpec CloudSession::secret_az(std::vector<std::string> args) const {
    CommandSpec cmd = az(std::move(args));
    cmd.sensitive = true;
    return cmd;
}

// Run an az query and parse its JSON stdout. Errors become the reason text.
static Fetched<YAML::Node> query_json(const CommandRunner& runner, const CommandSpec& cmd,
                                      const EnvMap& env) {
    auto r = runner.capture(cmd, {}, env);
    if (r.failed()) {
        return Fetched<YAML::Node>::Unavailable(
            fmt::format("'{}' exited with {}", cmd.display(), r.exit_code));
    }
    try {
        return Fetched<YAML::Node>::Ok(YAML::Load(r.output));
    } catch (const std::exception& e) {
        return Fetched<YAML::Node>::Unavailable(
            fmt::format("unparseable output from '{}': {}", cmd.display(), e.what()));
    }
}

static std::string scalar_or_empty(const YAML::Node& node, const char* key) {
    if (!node.IsMap()) return "";
    const YAML::Node v = node[key];
    if (!v || !v.IsScalar()) return "";
    return v.as<std::string>("");
}

// ── Session ────────────────────────────────────────────────

bool CloudSession::logged_in() const {
    return runner_.capture(az({"account", "show", "-o", "none"}), {}, env_).success();
}

bool CloudSession::login(bool device_code) const {
    std::vector<std::string> args = {"login"};
    if (device_code) args.push_back("--use-device-code");
    return runner_.run_interactive(az(args)) == 0;
}

std::vector<AccountInfo> CloudSession::list_accounts() const {
    std::vector<AccountInfo> accounts;
    auto doc = query_json(runner_, az({"account", "list", "--all", "-o", "json"}), env_);
    if (!doc.ok() || !doc.value->IsSequence()) return accounts;

    for (const auto& n : *doc.value) {
        AccountInfo a;
        a.id = scalar_or_empty(n, "id");
        a.name = scalar_or_empty(n, "name");
        a.is_default = n.IsMap() && n["isDefault"] && n["isDefault"].as<bool>(false);
        if (!a.id.empty()) accounts.push_back(a);
    }
    return accounts;
}

bool CloudSession::set_account(const std::string& id) const {
    return runner_.capture(az({"account", "set", "--subscription", id}), {}, env_).success();
}

Fetched<AccountInfo> CloudSession::active_account() const {
    auto doc = query_json(runner_, az({"account", "show", "-o", "json"}), env_);
    if (!doc.ok()) return Fetched<AccountInfo>::Unavailable(doc.reason);

    AccountInfo a;
    a.id = scalar_or_empty(*doc.value, "id");
    a.name = scalar_or_empty(*doc.value, "name");
    a.is_default = true;
    if (a.id.empty()) return Fetched<AccountInfo>::Unavailable("no active subscription id");
    return Fetched<AccountInfo>::Ok(a);
}

std::optional<AccountSelection> CloudSession::select_account(const std::string& explicit_hint) const {
    if (!explicit_hint.empty()) {
        return AccountSelection{explicit_hint, fmt::format("explicit({})", explicit_hint)};
    }

    std::string env_sub = env_or_empty(ENV_SUBSCRIPTION_ID);
    if (!env_sub.empty()) {
        return AccountSelection{env_sub, fmt::format("env({})", env_sub)};
    }

    auto accounts = list_accounts();
    if (accounts.empty()) return std::nullopt;
    if (accounts.size() == 1) {
        return AccountSelection{accounts[0].id, "single"};
    }
    for (const auto& a : accounts) {
        if (a.is_default) return AccountSelection{a.id, "default-flag"};
    }
    return AccountSelection{accounts[0].id, "first"};
}

AuthOutcome CloudSession::ensure_authenticated(const std::string& explicit_hint) const {
    AuthOutcome out;

    if (env_flag_enabled(ENV_SKIP_LOGIN_CHECK)) {
        out.ok = true;
        out.message = fmt::format("Skipping Azure login check ({} set)", ENV_SKIP_LOGIN_CHECK);
        return out;
    }

    if (!logged_in()) {
        azprov_log("az session absent, attempting login");
        if (!login(false) && !login(true)) {
            out.message = "Azure CLI login failed (both standard and device code)";
            return out;
        }
    }

    auto selection = select_account(explicit_hint);
    out.ok = true;
    if (!selection) {
        out.message = "No subscription enumerable; continuing with the CLI default";
        return out;
    }

    if (set_account(selection->id)) {
        out.chosen = selection->id;
        out.message = fmt::format("Subscription set ({}): {}", selection->strategy, selection->id);
    } else {
        out.message = fmt::format("Failed to set subscription ({}); continuing", selection->id);
    }
    return out;
}

// ── Auxiliary credentials ──────────────────────────────────

Fetched<AiServicesKeys> CloudSession::ai_services_keys(const std::string& service_name,
                                                       const std::string& resource_group) const {
    auto doc = query_json(runner_, secret_az({"cognitiveservices", "account", "keys", "list",
                                       "-n", service_name, "-g", resource_group, "-o", "json"}),
                          env_);
    if (!doc.ok()) return Fetched<AiServicesKeys>::Unavailable(doc.reason);
    if (!doc.value->IsMap()) return Fetched<AiServicesKeys>::Unavailable("unexpected key list shape");

    AiServicesKeys keys;
    keys.key1 = scalar_or_empty(*doc.value, "key1");
    keys.key2 = scalar_or_empty(*doc.value, "key2");
    if (keys.key1.empty() && keys.key2.empty()) {
        return Fetched<AiServicesKeys>::Unavailable("no keys returned");
    }
    return Fetched<AiServicesKeys>::Ok(keys);
}

Fetched<StorageCredentials> CloudSession::storage_credentials(const std::string& account_name,
                                                              const std::string& resource_group) const {
    auto conn = query_json(runner_, secret_az({"storage", "account", "show-connection-string",
                                        "-n", account_name, "-g", resource_group, "-o", "json"}),
                           env_);
    if (!conn.ok()) return Fetched<StorageCredentials>::Unavailable(conn.reason);

    auto keys = query_json(runner_, secret_az({"storage", "account", "keys", "list",
                                        "-n", account_name, "-g", resource_group, "-o", "json"}),
                           env_);
    if (!keys.ok()) return Fetched<StorageCredentials>::Unavailable(keys.reason);

    StorageCredentials creds;
    creds.connection_string = scalar_or_empty(*conn.value, "connectionString");
    if (keys.value->IsSequence() && keys.value->size() > 0) {
        creds.account_key = scalar_or_empty((*keys.value)[0], "value");
    }
    if (creds.connection_string.empty() && creds.account_key.empty()) {
        return Fetched<StorageCredentials>::Unavailable("no connection string or key returned");
    }
    return Fetched<StorageCredentials>::Ok(creds);
}

Fetched<SearchCredentials> CloudSession::search_query_key(const std::string& service_name,
                                                          const std::string& resource_group) const {
    auto doc = query_json(runner_, secret_az({"search", "query-key", "list",
                                       "--service-name", service_name,
                                       "-g", resource_group, "-o", "json"}),
                          env_);
    if (!doc.ok()) return Fetched<SearchCredentials>::Unavailable(doc.reason);

    SearchCredentials creds;
    if (doc.value->IsSequence() && doc.value->size() > 0) {
        creds.query_key = scalar_or_empty((*doc.value)[0], "key");
    }
    if (creds.query_key.empty()) {
        return Fetched<SearchCredentials>::Unavailable("no query key returned");
    }
    creds.url = fmt::format("https://{}.search.windows.net", service_name);
    return Fetched<SearchCredentials>::Ok(creds);
}

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <core/types.hpp>
#include "command_runner.hpp"

// Neither interactive login flow produced a session. Fatal to the job step.
class AuthenticationFailed : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct AccountInfo {
    std::string id;
    std::string name;
    bool is_default = false;
};

struct AccountSelection {
    std::string id;
    std::string strategy;   // explicit(..) | env(..) | single | default-flag | first
};

struct AuthOutcome {
    bool ok = false;
    std::string message;
    std::string chosen;     // subscription applied, "" if none
};

struct AiServicesKeys {
    std::string key1;
    std::string key2;
};

struct StorageCredentials {
    std::string connection_string;
    std::string account_key;
};

struct SearchCredentials {
    std::string url;
    std::string query_key;
};

// Wraps the `az` CLI: session check, login, subscription selection and
// per-resource credential retrieval. Setting AZ_SKIP_LOGIN_CHECK makes
// ensure_authenticated() a no-op.
class CloudSession {
public:
    CloudSession(const CommandRunner& runner, std::string az_binary, EnvMap env = {});

    // Check the session, log in (standard then device code) and select a subscription.
    // Only a failed login is fatal (ok == false).
    AuthOutcome ensure_authenticated(const std::string& explicit_hint) const;

    // Precedence: explicit hint, AZ_SUBSCRIPTION_ID, single account,
    // isDefault account, first account. nullopt when none are enumerable.
    std::optional<AccountSelection> select_account(const std::string& explicit_hint) const;

    bool logged_in() const;
    bool login(bool device_code) const;
    std::vector<AccountInfo> list_accounts() const;
    bool set_account(const std::string& id) const;
    Fetched<AccountInfo> active_account() const;

    // Auxiliary credentials (best-effort; callers merge only Ok values)
    Fetched<AiServicesKeys> ai_services_keys(const std::string& service_name,
                                             const std::string& resource_group) const;
    Fetched<StorageCredentials> storage_credentials(const std::string& account_name,
                                                    const std::string& resource_group) const;
    Fetched<SearchCredentials> search_query_key(const std::string& service_name,
                                                const std::string& resource_group) const;

private:
    const CommandRunner& runner_;
    std::string az_;
    EnvMap env_;

    CommandSpec az(std::vector<std::string> args) const;
    // Credential queries: output is kept out of the debug log
    CommandSpec secret_az(std::vector<std::string> args) const;
};

#pragma once

#include <string>
#include <set>
#include "job.hpp"
#include "types.hpp"

// Raw submission as received from a front-end. Everything is text;
// validate_request() turns it into typed JobParameters exactly once.
struct DeploymentRequest {
    std::string resource_group_base;
    std::string location;
    std::string include_search;          // "on", "1", "true", "yes" enable it
    std::string openai_model_name;       // "" -> DEFAULT_MODEL_NAME
    std::string subscription_id;
    std::string service_principal_name;
    std::string secret_expiration_date;
};

const std::set<std::string>& allowed_model_names();

bool parse_flag(const std::string& value);

Result<JobParameters> validate_request(const DeploymentRequest& request);

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstddef>

enum class JobStatus {
    Pending,
    Provisioning,
    PostProvisioning,
    Completed,
    Destroying,
    Destroyed,
    Failed,
    DestroyFailed,
};

std::string to_string(JobStatus status);
std::optional<JobStatus> parse_job_status(const std::string& text);

// Terminal for the current attempt (no run in flight).
bool is_terminal(JobStatus status);

// Failure states that accept a fresh attempt on the same job id.
bool is_retriable_failure(JobStatus status);

// Immutable input set, validated once by validate_request().
struct JobParameters {
    std::string resource_group_base;   // sanitized naming seed
    std::string location;
    bool include_search = false;
    bool enable_model_deployment = true;
    std::string openai_model_name;
    std::string openai_model_version;  // "" lets the platform choose
    std::string openai_deployment_sku;
    std::string model_deployment_name;
    std::string service_principal_name;
    std::string secret_expiration_date;
    std::string subscription_id;       // optional account hint

    std::string resource_group_name() const { return "RG-" + resource_group_base; }
};

// Generated resource names, computed once at job creation.
struct ResourceNames {
    std::string storage_account;
    std::string search_service;
    std::string ai_services;
    std::string ai_foundry_hub;
    std::string app_insights;
    std::string log_analytics_workspace;
    std::string foundry_project;
    std::string suffix;

    // role -> name, in a fixed order (persisted and shown in summaries)
    std::vector<std::pair<std::string, std::string>> entries() const;
};

using OutputMap = std::map<std::string, std::string>;

struct Job {
    std::string id;
    JobStatus status = JobStatus::Pending;
    JobParameters parameters;
    ResourceNames names;
    std::vector<std::string> log;
    OutputMap outputs;
    std::string created_at;
    std::string updated_at;
};

// Index row for list views. created_at is first-write-wins.
struct JobSummary {
    std::string id;
    std::string name;
    JobStatus status = JobStatus::Pending;
    std::string created_at;
    std::string updated_at;
    bool has_state = false;
    bool outputs_available = false;
    std::string region;
    bool include_search = false;
    std::vector<std::pair<std::string, std::string>> resource_names;
};

// Lines appended since an observer's cursor, plus current status.
struct LogChunk {
    std::vector<std::string> lines;
    std::size_t next_cursor = 0;
    JobStatus status = JobStatus::Pending;
};

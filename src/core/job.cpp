#include "job.hpp"

std::string to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:          return "pending";
        case JobStatus::Provisioning:     return "provisioning";
        case JobStatus::PostProvisioning: return "post_provisioning";
        case JobStatus::Completed:        return "completed";
        case JobStatus::Destroying:       return "destroying";
        case JobStatus::Destroyed:        return "destroyed";
        case JobStatus::Failed:           return "failed";
        case JobStatus::DestroyFailed:    return "destroy_failed";
    }
    return "unknown";
}

std::optional<JobStatus> parse_job_status(const std::string& text) {
    static const std::pair<const char*, JobStatus> table[] = {
        {"pending", JobStatus::Pending},
        {"provisioning", JobStatus::Provisioning},
        {"post_provisioning", JobStatus::PostProvisioning},
        {"completed", JobStatus::Completed},
        {"destroying", JobStatus::Destroying},
        {"destroyed", JobStatus::Destroyed},
        {"failed", JobStatus::Failed},
        {"destroy_failed", JobStatus::DestroyFailed},
    };
    for (const auto& [name, status] : table) {
        if (text == name) return status;
    }
    return std::nullopt;
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Destroyed ||
           status == JobStatus::Failed || status == JobStatus::DestroyFailed;
}

bool is_retriable_failure(JobStatus status) {
    return status == JobStatus::Failed || status == JobStatus::DestroyFailed;
}

std::vector<std::pair<std::string, std::string>> ResourceNames::entries() const {
    return {
        {"storage_account_name", storage_account},
        {"search_service_name", search_service},
        {"ai_services_name", ai_services},
        {"ai_foundry_hub_name", ai_foundry_hub},
        {"app_insights_name", app_insights},
        {"log_analytics_workspace_name", log_analytics_workspace},
        {"project_name", foundry_project},
        {"suffix", suffix},
    };
}

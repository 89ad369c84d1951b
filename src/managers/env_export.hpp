#pragma once

#include <string>
#include <core/job.hpp>
#include <core/types.hpp>

// Render a .env file from a job's outputs. Keys the deployment does not
// supply come from `defaults`. Refused when the job has no outputs.
Result<std::string> render_env(const Job& job, const ExportDefaults& defaults,
                               const std::string& generated_at);

// "azure-ai-<first 8 chars of id>.env"
std::string env_filename(const std::string& job_id);

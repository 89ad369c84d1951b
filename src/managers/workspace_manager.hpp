#pragma once

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// One isolated terraform working directory per job:
//   <deployments_root>/<job_id>/
//     *.tf                 copied from the template dir (disposable)
//     terraform.tfvars     job inputs
//     terraform.tfstate    durable tool state
//     metadata.yaml        state store record
//     .azprov.lock         held by the process running a job step
class WorkspaceManager {
public:
    WorkspaceManager(fs::path template_dir, fs::path deployments_root);

    fs::path path(const std::string& job_id) const;
    fs::path lock_path(const std::string& job_id) const;

    // Create the workspace if absent and copy every static definition into it.
    // Throws std::runtime_error / fs::filesystem_error on failure.
    fs::path prepare(const std::string& job_id) const;

    // Replace terraform.tfvars (temp file + rename).
    void write_inputs(const std::string& job_id, const std::string& content) const;

    // Remove the copied definitions only. Returns the number of files removed.
    int cleanup_transient(const std::string& job_id) const;

    bool has_durable_state(const std::string& job_id) const;

    // Remove terraform.tfstate and its backup once the resources are gone.
    void remove_durable_state(const std::string& job_id) const;

    const fs::path& template_dir() const { return template_dir_; }
    const fs::path& root() const { return root_; }

private:
    fs::path template_dir_;
    fs::path root_;

    static bool is_definition(const fs::path& p);
};

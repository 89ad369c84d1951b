#include "workspace_manager.hpp"
#include "job_log.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <stdexcept>
#include <vector>

WorkspaceManager::WorkspaceManager(fs::path template_dir, fs::path deployments_root)
    : template_dir_(std::move(template_dir)), root_(std::move(deployments_root)) {}

bool WorkspaceManager::is_definition(const fs::path& p) {
    return p.extension() == TF_DEFINITION_EXT;
}

fs::path WorkspaceManager::path(const std::string& job_id) const {
    return root_ / job_id;
}

fs::path WorkspaceManager::lock_path(const std::string& job_id) const {
    return path(job_id) / RUN_LOCK_FILE;
}

fs::path WorkspaceManager::prepare(const std::string& job_id) const {
    if (!fs::is_directory(template_dir_)) {
        throw std::runtime_error(
            fmt::format("Terraform template directory not found: {}", template_dir_.string()));
    }

    fs::path dir = path(job_id);
    fs::create_directories(dir);

    int copied = 0;
    for (const auto& entry : fs::directory_iterator(template_dir_)) {
        if (!entry.is_regular_file() || !is_definition(entry.path())) continue;
        fs::copy_file(entry.path(), dir / entry.path().filename(),
                      fs::copy_options::overwrite_existing);
        ++copied;
    }

    azprov_log(fmt::format("workspace {}: copied {} definition files", job_id, copied));
    return dir;
}

void WorkspaceManager::write_inputs(const std::string& job_id, const std::string& content) const {
    platform::write_file_atomic(path(job_id) / TF_VARS_FILE, content);
}

int WorkspaceManager::cleanup_transient(const std::string& job_id) const {
    fs::path dir = path(job_id);
    if (!fs::is_directory(dir)) return 0;

    std::vector<fs::path> definitions;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && is_definition(entry.path())) {
            definitions.push_back(entry.path());
        }
    }

    int removed = 0;
    for (const auto& p : definitions) {
        std::error_code ec;
        if (fs::remove(p, ec)) {
            ++removed;
        } else if (ec) {
            azprov_log(fmt::format("workspace {}: cannot remove {}: {}",
                                   job_id, p.string(), ec.message()));
        }
    }
    return removed;
}

bool WorkspaceManager::has_durable_state(const std::string& job_id) const {
    return fs::exists(path(job_id) / TF_STATE_FILE);
}

void WorkspaceManager::remove_durable_state(const std::string& job_id) const {
    fs::path dir = path(job_id);
    fs::remove(dir / TF_STATE_FILE);
    fs::remove(dir / TF_STATE_BACKUP);
}

#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <thread>
#include <map>
#include <memory>
#include <chrono>
#include <optional>
#include <core/config.hpp>
#include <core/job.hpp>
#include <core/request.hpp>
#include <platform/run_lock.hpp>
#include "command_runner.hpp"
#include "terraform.hpp"
#include "cloud_session.hpp"
#include "workspace_manager.hpp"
#include "state_store.hpp"
#include "job_registry.hpp"

// Sequences provisioning and teardown of one deployment per job.
//
// Every run happens on its own background thread; the steps inside a run are
// strictly sequential and every line they produce lands in the job log in
// order. A job accepts one run at a time, across processes: the run holds
// the workspace lock file until its thread exits. Transitions:
//
//   pending -> provisioning -> post_provisioning -> completed
//   (any step fails)          -> failed
//   any idle job with terraform state -> destroying -> destroyed | destroy_failed
//   failed -> provisioning                                  (retry)
//
// A job loaded in an in-flight status whose lock nobody holds was cut off by
// a process exit; it is marked failed (destroy_failed if it was destroying).
class JobOrchestrator {
public:
    // Jobs already in the store are loaded into the registry.
    JobOrchestrator(const Config& config, JobRegistry& registry, StateStore& store);
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    // Validate, create a pending job and start provisioning. Returns the job id.
    Result<std::string> submit(const DeploymentRequest& request);

    // Start a fresh provisioning attempt for a failed job (same id and workspace).
    Result<void> retry(const std::string& id);

    // Start teardown. Rejected before any work if a run is active or the job
    // has no durable state.
    Result<void> destroy(const std::string& id);

    // Log lines since `cursor`, with the next cursor and the current status.
    Result<LogChunk> observe(const std::string& id, std::size_t cursor) const;

    std::optional<Job> find(const std::string& id) const;
    std::vector<JobSummary> summaries() const;

    // True while a provisioning or destroy run is in flight for `id`, in this
    // process or another one.
    bool running(const std::string& id) const;

    // Named precondition for teardown: terraform.tfstate exists in the workspace.
    bool durable_state_present(const std::string& id) const;

    // Block until the runs started for `id` (or for every job) have finished.
    void wait(const std::string& id);
    void wait_all();

private:
    enum class RunKind { Provision, Destroy };

    const Config& config_;
    JobRegistry& registry_;
    StateStore& store_;
    CommandRunner runner_;
    TerraformCli terraform_;
    CloudSession cloud_;
    WorkspaceManager workspaces_;

    std::vector<std::pair<std::string, std::thread>> runs_;
    std::mutex runs_mutex_;

    // Last time each job's log was flushed to the store mid-run
    std::map<std::string, std::chrono::steady_clock::time_point> checkpoints_;
    std::mutex checkpoint_mutex_;

    void restore();
    Result<void> start_run(const std::string& id, RunKind kind);
    void reap_finished();
    void finish_run(const std::string& id, std::unique_ptr<platform::RunLock> lock);
    void provision_thread(std::string id, std::unique_ptr<platform::RunLock> lock);
    void destroy_thread(std::string id, std::unique_ptr<platform::RunLock> lock);

    void emit(const std::string& id, const std::string& line);
    void transition(const std::string& id, JobStatus status);
    void persist(const std::string& id);
    void authenticate(const std::string& id, bool record_subscription);
    void collect_outputs(const std::string& id);
    void cleanup(const std::string& id, const std::string& reason);
};

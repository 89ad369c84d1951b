#include "job_orchestrator.hpp"
#include "job_log.hpp"
#include <core/constants.hpp>
#include <core/naming.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <system_error>

// ── Constructor ────────────────────────────────────────────

JobOrchestrator::JobOrchestrator(const Config& config, JobRegistry& registry, StateStore& store)
    : config_(config), registry_(registry), store_(store),
      runner_(config.environment()),
      terraform_(runner_, config.tools().terraform),
      cloud_(runner_, config.tools().az),
      workspaces_(config.paths().terraform_dir, config.paths().deployments_root) {
    restore();
}

JobOrchestrator::~JobOrchestrator() {
    wait_all();
}

// Load persisted jobs. A run that was in flight when its process stopped is
// not resumed; the job is closed out so it can be retried or destroyed.
void JobOrchestrator::restore() {
    int restored = 0;
    std::vector<std::string> interrupted;

    for (auto job : store_.load_all()) {
        if (!is_terminal(job.status) &&
            !platform::RunLock::is_locked(workspaces_.lock_path(job.id).string())) {
            JobStatus was = job.status;
            job.status = was == JobStatus::Destroying ? JobStatus::DestroyFailed
                                                      : JobStatus::Failed;
            job.log.push_back(fmt::format("ERROR: run interrupted by process restart (was {})",
                                          to_string(was)));
            job.updated_at = now_utc_iso();
            interrupted.push_back(job.id);
        }
        if (registry_.insert(job)) ++restored;
    }

    for (const auto& id : interrupted) {
        persist(id);
    }
    azprov_log(fmt::format("orchestrator: restored {} jobs ({} interrupted) from {}",
                           restored, interrupted.size(), store_.root().string()));
}

// ── Public API ─────────────────────────────────────────────

Result<std::string> JobOrchestrator::submit(const DeploymentRequest& request) {
    auto params = validate_request(request);
    if (params.is_err()) {
        return Result<std::string>::Err(params.error);
    }

    Job job;
    job.id = generate_uuid();
    job.status = JobStatus::Pending;
    job.parameters = params.value;
    job.names = build_names(job.parameters.resource_group_base,
                            random_suffix(NAME_SUFFIX_LENGTH));
    job.created_at = now_utc_iso();
    job.updated_at = job.created_at;

    if (!registry_.insert(job)) {
        return Result<std::string>::Err(fmt::format("Job id collision: {}", job.id));
    }

    auto started = start_run(job.id, RunKind::Provision);
    if (started.is_err()) {
        persist(job.id);
        return Result<std::string>::Err(started.error);
    }
    return Result<std::string>::Ok(job.id);
}

Result<void> JobOrchestrator::retry(const std::string& id) {
    auto job = registry_.snapshot(id);
    if (!job) {
        return Result<void>::Err(fmt::format("Deployment not found: {}", id));
    }
    if (job->status != JobStatus::Failed) {
        return Result<void>::Err(fmt::format(
            "Only failed deployments can be retried (status: {})", to_string(job->status)));
    }
    if (running(id)) {
        return Result<void>::Err(fmt::format("Deployment {} is already running", id));
    }
    return start_run(id, RunKind::Provision);
}

Result<void> JobOrchestrator::destroy(const std::string& id) {
    auto job = registry_.snapshot(id);
    if (!job) {
        return Result<void>::Err(fmt::format("Deployment not found: {}", id));
    }
    if (running(id)) {
        return Result<void>::Err(fmt::format("Deployment {} is already running", id));
    }
    if (!durable_state_present(id)) {
        return Result<void>::Err(fmt::format(
            "Cannot destroy deployment {}: no terraform state found", id.substr(0, 8)));
    }
    return start_run(id, RunKind::Destroy);
}

Result<LogChunk> JobOrchestrator::observe(const std::string& id, std::size_t cursor) const {
    auto chunk = registry_.read_since(id, cursor);
    if (!chunk) {
        return Result<LogChunk>::Err(fmt::format("Deployment not found: {}", id));
    }
    return Result<LogChunk>::Ok(std::move(*chunk));
}

std::optional<Job> JobOrchestrator::find(const std::string& id) const {
    return registry_.snapshot(id);
}

std::vector<JobSummary> JobOrchestrator::summaries() const {
    return store_.list_all();
}

bool JobOrchestrator::running(const std::string& id) const {
    return registry_.run_active(id) ||
           platform::RunLock::is_locked(workspaces_.lock_path(id).string());
}

bool JobOrchestrator::durable_state_present(const std::string& id) const {
    return workspaces_.has_durable_state(id);
}

void JobOrchestrator::wait(const std::string& id) {
    std::vector<std::thread> mine;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        for (auto it = runs_.begin(); it != runs_.end();) {
            if (it->first == id) {
                mine.push_back(std::move(it->second));
                it = runs_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& t : mine) {
        if (t.joinable()) t.join();
    }
}

void JobOrchestrator::wait_all() {
    std::vector<std::pair<std::string, std::thread>> all;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        all.swap(runs_);
    }
    for (auto& [id, t] : all) {
        if (t.joinable()) t.join();
    }
}

// ── Run management ─────────────────────────────────────────

Result<void> JobOrchestrator::start_run(const std::string& id, RunKind kind) {
    reap_finished();

    if (!registry_.try_begin_run(id)) {
        return Result<void>::Err(fmt::format("Deployment {} is already running", id));
    }

    auto run_lock = std::make_unique<platform::RunLock>(workspaces_.lock_path(id).string());
    if (!run_lock->held()) {
        registry_.end_run(id);
        return Result<void>::Err(
            fmt::format("Deployment {} is already running in another process", id));
    }

    // The record is written while the lock is held, so a concurrent restore
    // never mistakes this job for an interrupted one.
    persist(id);

    std::lock_guard<std::mutex> lock(runs_mutex_);
    try {
        if (kind == RunKind::Provision) {
            runs_.emplace_back(id, std::thread(&JobOrchestrator::provision_thread, this, id,
                                               std::move(run_lock)));
        } else {
            runs_.emplace_back(id, std::thread(&JobOrchestrator::destroy_thread, this, id,
                                               std::move(run_lock)));
        }
    } catch (const std::system_error& e) {
        registry_.end_run(id);
        return Result<void>::Err(fmt::format("Cannot start worker thread: {}", e.what()));
    }
    return Result<void>::Ok();
}

// Join threads whose run has already ended so runs_ does not grow without bound.
void JobOrchestrator::reap_finished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        for (auto it = runs_.begin(); it != runs_.end();) {
            if (!registry_.run_active(it->first)) {
                done.push_back(std::move(it->second));
                it = runs_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

// The final record is written before the lock drops; the in-process guard
// is released last.
void JobOrchestrator::finish_run(const std::string& id, std::unique_ptr<platform::RunLock> lock) {
    persist(id);
    lock.reset();
    {
        std::lock_guard<std::mutex> lock(checkpoint_mutex_);
        checkpoints_.erase(id);
    }
    registry_.end_run(id);
}

void JobOrchestrator::emit(const std::string& id, const std::string& line) {
    registry_.append_log(id, line);

    // Checkpoint so observers in another process can tail a long apply
    auto now = std::chrono::steady_clock::now();
    bool due = false;
    {
        std::lock_guard<std::mutex> lock(checkpoint_mutex_);
        auto& last = checkpoints_[id];
        if (now - last >= std::chrono::milliseconds(LOG_FOLLOW_POLL_MS)) {
            last = now;
            due = true;
        }
    }
    if (due) persist(id);
}

void JobOrchestrator::transition(const std::string& id, JobStatus status) {
    registry_.set_status(id, status);
    azprov_log(fmt::format("job {} -> {}", id, to_string(status)));
    persist(id);
}

void JobOrchestrator::persist(const std::string& id) {
    auto job = registry_.snapshot(id);
    if (!job) return;
    auto saved = store_.save(*job);
    if (saved.is_err()) {
        azprov_log(fmt::format("persist {}: {}", id, saved.error));
    }
}

void JobOrchestrator::authenticate(const std::string& id, bool record_subscription) {
    auto job = registry_.snapshot(id);
    const std::string hint = job ? job->parameters.subscription_id : "";

    AuthOutcome auth = cloud_.ensure_authenticated(hint);
    if (!auth.ok) {
        emit(id, fmt::format("[AUTH] {}", auth.message));
        throw AuthenticationFailed(auth.message);
    }
    emit(id, fmt::format("[AUTH] {}", auth.message));

    if (record_subscription && hint.empty() && !auth.chosen.empty()) {
        registry_.set_subscription(id, auth.chosen);
    }
}

void JobOrchestrator::cleanup(const std::string& id, const std::string& reason) {
    try {
        int removed = workspaces_.cleanup_transient(id);
        emit(id, fmt::format("[CLEANUP] Removed {} terraform files {}", removed, reason));
    } catch (const std::exception& e) {
        emit(id, fmt::format("[WARN] Could not clean up workspace: {}", e.what()));
    }
}

// ── Provisioning ───────────────────────────────────────────

void JobOrchestrator::provision_thread(std::string id, std::unique_ptr<platform::RunLock> lock) {
    azprov_log(fmt::format("PROVISION THREAD START: job_id={}", id));
    LineSink sink = [this, &id](const std::string& line) { emit(id, line); };

    try {
        transition(id, JobStatus::Provisioning);

        emit(id, "[SETUP] Creating isolated terraform workspace");
        fs::path dir = workspaces_.prepare(id);
        emit(id, fmt::format("[SETUP] Copied terraform files to {}", dir.string()));

        authenticate(id, true);

        auto job = registry_.snapshot(id);
        if (!job) throw std::runtime_error("job vanished from registry");
        workspaces_.write_inputs(id, render_tfvars(job->parameters, job->names));
        emit(id, fmt::format("[SETUP] Wrote {} (include_search={})",
                             TF_VARS_FILE, job->parameters.include_search));

        if (!env_flag_enabled(ENV_SKIP_LOGIN_CHECK)) {
            auto active = cloud_.active_account();
            if (active.ok()) {
                emit(id, fmt::format("[PRECHECK] Active subscription: {} - {}",
                                     active.value->id, active.value->name));
            } else {
                emit(id, fmt::format("[PRECHECK][WARN] Could not read active subscription: {}",
                                     active.reason));
            }
        }

        emit(id, fmt::format("[TERRAFORM] Executing in isolated workspace: {}", dir.string()));
        terraform_.init(dir, sink);
        terraform_.apply(dir, config_.retry().apply, sink);

        transition(id, JobStatus::PostProvisioning);
        collect_outputs(id);

        cleanup(id, "(kept state and variables)");
        transition(id, JobStatus::Completed);
        emit(id, "[INFO] Deployment completed successfully");
    } catch (const std::exception& e) {
        azprov_log(fmt::format("PROVISION FAILED: job_id={} error={}", id, e.what()));
        emit(id, fmt::format("ERROR: {}", e.what()));
        cleanup(id, "due to error");
        transition(id, JobStatus::Failed);
    }

    finish_run(id, std::move(lock));
}

void JobOrchestrator::collect_outputs(const std::string& id) {
    auto job = registry_.snapshot(id);
    if (!job) return;
    const JobParameters& p = job->parameters;
    const ResourceNames& n = job->names;
    const std::string rg = p.resource_group_name();

    OutputMap outputs;
    auto parsed = terraform_.outputs(workspaces_.path(id));
    if (parsed.is_ok()) {
        outputs = parsed.value;
    } else {
        emit(id, fmt::format("[WARN] Could not read terraform outputs: {}", parsed.error));
    }

    auto value_of = [&](const std::string& key) {
        auto it = outputs.find(key);
        return it == outputs.end() ? std::string() : it->second;
    };

    if (!value_of("foundry_project_endpoint").empty()) {
        emit(id, fmt::format("[INFO] Foundry project endpoint: {}",
                             value_of("foundry_project_endpoint")));
    } else {
        emit(id, "[INFO] Foundry project endpoint not exposed by provider yet or null.");
    }

    emit(id, "[INFO] Retrieving Azure OpenAI (AI Services) keys...");
    auto keys = cloud_.ai_services_keys(n.ai_services, rg);
    if (keys.ok()) {
        std::string endpoint = value_of("openai_endpoint");
        if (endpoint.empty()) endpoint = value_of("ai_services_endpoint");
        if (!endpoint.empty()) outputs["azure_openai_endpoint"] = endpoint;
        outputs["azure_openai_api_key_primary"] = keys.value->key1;
        outputs["azure_openai_api_key_secondary"] = keys.value->key2;
    } else {
        emit(id, fmt::format("[WARN] Could not fetch Azure OpenAI keys: {}", keys.reason));
    }

    emit(id, "[INFO] Retrieving Storage connection string...");
    auto storage = cloud_.storage_credentials(n.storage_account, rg);
    if (storage.ok()) {
        outputs["storage_connection_string"] = storage.value->connection_string;
        outputs["storage_account_key"] = storage.value->account_key;
    } else {
        emit(id, fmt::format("[WARN] Could not fetch Storage credentials: {}", storage.reason));
    }

    if (p.include_search) {
        emit(id, "[INFO] Retrieving Search service query key...");
        auto search = cloud_.search_query_key(n.search_service, rg);
        if (search.ok()) {
            outputs["azure_ai_search_url"] = search.value->url;
            outputs["azure_ai_search_key"] = search.value->query_key;
        } else {
            emit(id, fmt::format("[WARN] Could not fetch Search credentials: {}", search.reason));
        }
    }

    registry_.set_outputs(id, std::move(outputs));
}

// ── Teardown ───────────────────────────────────────────────

void JobOrchestrator::destroy_thread(std::string id, std::unique_ptr<platform::RunLock> lock) {
    azprov_log(fmt::format("DESTROY THREAD START: job_id={}", id));
    LineSink sink = [this, &id](const std::string& line) { emit(id, line); };

    try {
        transition(id, JobStatus::Destroying);
        authenticate(id, false);

        emit(id, "[SETUP] Creating isolated terraform workspace for destroy");
        fs::path dir = workspaces_.prepare(id);
        if (!workspaces_.has_durable_state(id)) {
            throw std::runtime_error(fmt::format(
                "Cannot destroy deployment {}: no terraform state found", id.substr(0, 8)));
        }
        emit(id, fmt::format("[SETUP] Using terraform files with existing state in {}",
                             dir.string()));

        emit(id, fmt::format("[TERRAFORM] Destroying from isolated workspace: {}", dir.string()));
        terraform_.destroy(dir, config_.retry().destroy, sink);

        registry_.set_outputs(id, {});
        cleanup(id, "after successful destroy");
        workspaces_.remove_durable_state(id);
        emit(id, "[CLEANUP] Removed terraform state");
        transition(id, JobStatus::Destroyed);
        emit(id, "[INFO] Resources destroyed successfully");
    } catch (const std::exception& e) {
        azprov_log(fmt::format("DESTROY FAILED: job_id={} error={}", id, e.what()));
        emit(id, fmt::format("ERROR during destroy: {}", e.what()));
        cleanup(id, "due to error");
        transition(id, JobStatus::DestroyFailed);
    }

    finish_run(id, std::move(lock));
}

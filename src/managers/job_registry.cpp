#include "job_registry.hpp"
#include <core/utils.hpp>
#include <algorithm>
#include <cstddef>

Job* JobRegistry::find_locked(const std::string& id) {
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : &it->second;
}

bool JobRegistry::insert(const Job& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!jobs_.emplace(job.id, job).second) return false;
    order_.push_back(job.id);
    return true;
}

bool JobRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.count(id) > 0;
}

std::optional<Job> JobRegistry::snapshot(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

std::vector<Job> JobRegistry::snapshot_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(jobs_.at(id));
    }
    return out;
}

void JobRegistry::append_log(const std::string& id, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* job = find_locked(id)) {
        job->log.push_back(line);
    }
}

void JobRegistry::set_status(const std::string& id, JobStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* job = find_locked(id)) {
        job->status = status;
        job->updated_at = now_utc_iso();
    }
}

void JobRegistry::set_outputs(const std::string& id, OutputMap outputs) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* job = find_locked(id)) {
        job->outputs = std::move(outputs);
        job->updated_at = now_utc_iso();
    }
}

void JobRegistry::set_subscription(const std::string& id, const std::string& subscription_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* job = find_locked(id)) {
        job->parameters.subscription_id = subscription_id;
    }
}

std::optional<LogChunk> JobRegistry::read_since(const std::string& id, std::size_t cursor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return std::nullopt;

    const auto& log = it->second.log;
    LogChunk chunk;
    chunk.status = it->second.status;
    if (cursor < log.size()) {
        chunk.lines.assign(log.begin() + static_cast<std::ptrdiff_t>(cursor), log.end());
    }
    chunk.next_cursor = std::max(cursor, log.size());
    return chunk;
}

bool JobRegistry::try_begin_run(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.insert(id).second;
}

void JobRegistry::end_run(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.erase(id);
}

bool JobRegistry::run_active(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.count(id) > 0;
}

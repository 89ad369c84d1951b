#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>
#include <optional>
#include <core/job.hpp>

// In-memory set of known jobs. Mutated only by orchestrator transitions;
// readers always receive copies.
class JobRegistry {
public:
    // Returns false if a job with this id already exists.
    bool insert(const Job& job);

    bool contains(const std::string& id) const;
    std::optional<Job> snapshot(const std::string& id) const;
    std::vector<Job> snapshot_all() const;   // insertion order

    void append_log(const std::string& id, const std::string& line);
    void set_status(const std::string& id, JobStatus status);
    void set_outputs(const std::string& id, OutputMap outputs);
    void set_subscription(const std::string& id, const std::string& subscription_id);

    // Lines from `cursor` onward. A cursor past the end yields no lines.
    std::optional<LogChunk> read_since(const std::string& id, std::size_t cursor) const;

    // Run guard: at most one provisioning/destroy run per job at a time.
    bool try_begin_run(const std::string& id);
    void end_run(const std::string& id);
    bool run_active(const std::string& id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Job> jobs_;
    std::vector<std::string> order_;
    std::set<std::string> running_;

    Job* find_locked(const std::string& id);
};

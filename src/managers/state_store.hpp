#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <core/job.hpp>

namespace fs = std::filesystem;

// Durable job records:
//   <root>/<id>/metadata.yaml    full Job (parameters, names, outputs, log)
//   <root>/deployments.yaml      summary index, creation order
// All writes go through a temp file + rename; the index is rewritten under a mutex.
class StateStore {
public:
    explicit StateStore(fs::path root);
    virtual ~StateStore() = default;

    virtual Result<void> save(const Job& job);

    std::optional<Job> load(const std::string& id) const;
    std::vector<JobSummary> list_all() const;

    // Every job listed in the index whose record is readable.
    std::vector<Job> load_all() const;

    const fs::path& root() const { return root_; }
    fs::path index_path() const;
    fs::path record_path(const std::string& id) const;

private:
    fs::path root_;
    mutable std::mutex index_mutex_;

    JobSummary summarize(const Job& job) const;
    std::vector<JobSummary> read_index() const;
    void write_index(const std::vector<JobSummary>& rows) const;
};

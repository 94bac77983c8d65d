#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include <chrono>
#include <filesystem>
#include "job.hpp"

// Owns every job for the lifetime of the server. Injected into JobManager;
// finished jobs are dropped by prune() once past the retention window.
class JobRegistry {
public:
    explicit JobRegistry(std::filesystem::path logs_dir,
                         std::size_t history_capacity = HISTORY_CAPACITY);

    // Insert a fresh queued job and return its id.
    std::string create(const std::string& script_ref);

    // nullptr when the id is unknown (or was pruned).
    std::shared_ptr<Job> get(const std::string& job_id) const;

    // Snapshots of all jobs, oldest first.
    std::vector<JobSnapshot> list() const;

    // Remove done jobs that finished more than `retention` before `now`.
    // Transcript files are left on disk. Returns number removed.
    std::size_t prune(std::chrono::steady_clock::duration retention,
                      std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    std::size_t size() const;
    const std::filesystem::path& logs_dir() const { return logs_dir_; }

private:
    std::filesystem::path logs_dir_;
    std::size_t history_capacity_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Job>> jobs_;
    std::vector<std::string> order_;       // creation order, for list()
};

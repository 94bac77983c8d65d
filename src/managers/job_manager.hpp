#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <core/types.hpp>
#include "job_registry.hpp"
#include "script_launcher.hpp"

// Accepts run requests and drives each job on its own thread:
// resolve interpreter -> spawn -> feed stdin -> consume output -> settle.
// No cancellation: a hung script keeps its thread until it exits.
class JobManager {
public:
    JobManager(JobRegistry& registry, ScriptLauncher launcher,
               std::chrono::minutes retention = std::chrono::minutes(0));
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    // Register a job for the request and start it in the background.
    // Returns the new job id. Script failures never surface here; they
    // land in the job state.
    Result<std::string> start(const RunRequest& request);

    // Full transcript of a known job, read from disk.
    Result<std::string> read_log(const std::string& job_id) const;

    // Transcript path of a known job.
    Result<std::string> log_path(const std::string& job_id) const;

    // Drop finished jobs older than the retention window (0 = never).
    std::size_t prune_expired();

    // Block until every started job has settled and its thread is joined.
    void wait_all();

    JobRegistry& registry() { return registry_; }
    const JobRegistry& registry() const { return registry_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void run_job(std::shared_ptr<Job> job, RunRequest request);
    void reap_finished_workers();

    JobRegistry& registry_;
    ScriptLauncher launcher_;
    std::chrono::minutes retention_;

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
    std::atomic<bool> shutdown_{false};
};

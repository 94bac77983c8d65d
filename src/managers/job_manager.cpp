#include "job_manager.hpp"
#include "output_pipeline.hpp"
#include "job_log.hpp"
#include <core/constants.hpp>
#include <fstream>
#include <sstream>
#include <filesystem>

namespace fs = std::filesystem;

// ── Constructor ────────────────────────────────────────────

JobManager::JobManager(JobRegistry& registry, ScriptLauncher launcher,
                       std::chrono::minutes retention)
    : registry_(registry), launcher_(std::move(launcher)), retention_(retention) {}

JobManager::~JobManager() {
    shutdown_.store(true);
    // Jobs cannot be canceled; shutdown waits for running scripts to exit.
    wait_all();
}

// ── Run requests ───────────────────────────────────────────

Result<std::string> JobManager::start(const RunRequest& request) {
    if (shutdown_.load()) {
        return Result<std::string>::Err("server is shutting down");
    }
    if (request.executable.empty()) {
        return Result<std::string>::Err("no executable given");
    }

    prune_expired();
    reap_finished_workers();

    std::string job_id = registry_.create(request.script_ref);
    auto job = registry_.get(job_id);
    jobcast_log(fmt::format("manager: job {} created for {}", job_id, request.script_ref));

    Worker w;
    w.finished = std::make_shared<std::atomic<bool>>(false);
    auto finished = w.finished;
    w.thread = std::thread([this, job, request, finished]() {
        run_job(job, request);
        finished->store(true);
    });

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(std::move(w));
    return Result<std::string>::Ok(job_id);
}

void JobManager::run_job(std::shared_ptr<Job> job, RunRequest request) {
    // Unknown script type: straight from queued to error, nothing spawned
    auto interp = resolve_interpreter(request.executable, launcher_.interpreters());
    if (interp.is_err()) {
        jobcast_log(fmt::format("manager: job {}: {}", job->id(), interp.error));
        job->fail_launch(LAUNCH_FAILED_RC);
        return;
    }

    job->mark_running();

    OutputPipeline pipeline(*job);
    pipeline.open_transcript();

    auto proc = launcher_.launch(request.executable, request.args,
                                 request.working_dir, request.input_vars);
    if (proc.is_err()) {
        jobcast_log(fmt::format("manager: job {}: spawn failed: {}", job->id(), proc.error));
        job->finish(LAUNCH_FAILED_RC);
        return;
    }

    pipeline.run(proc.value);
}

void JobManager::reap_finished_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->finished->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void JobManager::wait_all() {
    std::vector<Worker> local;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        local.swap(workers_);
    }
    for (auto& w : local) {
        if (w.thread.joinable()) w.thread.join();
    }
}

std::size_t JobManager::prune_expired() {
    if (retention_.count() <= 0) return 0;
    return registry_.prune(retention_);
}

// ── Logs ───────────────────────────────────────────────────

Result<std::string> JobManager::log_path(const std::string& job_id) const {
    auto job = registry_.get(job_id);
    if (!job) {
        return Result<std::string>::Err("not found");
    }
    return Result<std::string>::Ok(job->log_path());
}

Result<std::string> JobManager::read_log(const std::string& job_id) const {
    auto path = log_path(job_id);
    if (path.is_err()) return path;

    if (!fs::exists(path.value)) {
        return Result<std::string>::Err("log missing");
    }
    std::ifstream in(path.value);
    if (!in) {
        return Result<std::string>::Err("log unreadable");
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::Ok(ss.str());
}

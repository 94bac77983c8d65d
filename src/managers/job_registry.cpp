#include "job_registry.hpp"
#include "job_log.hpp"
#include <core/utils.hpp>
#include <algorithm>

JobRegistry::JobRegistry(std::filesystem::path logs_dir, std::size_t history_capacity)
    : logs_dir_(std::move(logs_dir)), history_capacity_(history_capacity) {}

std::string JobRegistry::create(const std::string& script_ref) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string job_id;
    do {
        job_id = generate_uuid();
    } while (jobs_.count(job_id));

    jobs_[job_id] = std::make_shared<Job>(job_id, script_ref,
                                          job_log_path(logs_dir_, job_id),
                                          history_capacity_);
    order_.push_back(job_id);
    return job_id;
}

std::shared_ptr<Job> JobRegistry::get(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return nullptr;
    return it->second;
}

std::vector<JobSnapshot> JobRegistry::list() const {
    std::vector<std::shared_ptr<Job>> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : order_) {
            jobs.push_back(jobs_.at(id));
        }
    }
    std::vector<JobSnapshot> out;
    out.reserve(jobs.size());
    for (const auto& j : jobs) out.push_back(j->snapshot());
    return out;
}

std::size_t JobRegistry::prune(std::chrono::steady_clock::duration retention,
                               std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::size_t removed = 0;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        auto finished = it->second->finished_time();
        if (finished && now - *finished > retention) {
            jobcast_log(fmt::format("registry: pruned job {}", it->first));
            it = jobs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        order_.erase(std::remove_if(order_.begin(), order_.end(),
                                    [this](const std::string& id) { return !jobs_.count(id); }),
                     order_.end());
    }
    return removed;
}

std::size_t JobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

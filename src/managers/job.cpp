#include "job.hpp"
#include <core/utils.hpp>
#include <algorithm>

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Queued:   return "queued";
        case JobStatus::Running:  return "running";
        case JobStatus::Finished: return "finished";
        case JobStatus::Error:    return "error";
    }
    return "error";
}

Job::Job(std::string job_id, std::string script_ref, std::string log_path,
         std::size_t history_capacity)
    : job_id_(std::move(job_id)), script_ref_(std::move(script_ref)),
      log_path_(std::move(log_path)),
      capacity_(history_capacity > 0 ? history_capacity : HISTORY_CAPACITY),
      created_at_(now_iso()) {}

// ── Writer side ────────────────────────────────────────────

void Job::mark_running() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_) return;
    status_ = JobStatus::Running;
    step_ = "starting";
    changed_.notify_all();
}

void Job::append_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(line);
    ++total_lines_;
    while (history_.size() > capacity_) {
        history_.pop_front();
    }
    changed_.notify_all();
}

void Job::set_progress(int percent, const std::string& step) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_) return;
    percent_ = std::max(0, std::min(100, percent));
    if (!step.empty()) step_ = step;
    changed_.notify_all();
}

void Job::mark_completed_marker() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_) return;
    percent_ = 100;
    step_ = "done";
    changed_.notify_all();
}

void Job::finish(int return_code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_) return;

    return_code_ = return_code;
    if (return_code == 0) {
        status_ = JobStatus::Finished;
        percent_ = 100;
        if (step_.empty() || step_ == "starting") step_ = "done";
    } else {
        status_ = JobStatus::Error;
    }
    done_ = true;
    finished_at_ = now_iso();
    finished_time_ = std::chrono::steady_clock::now();
    changed_.notify_all();
}

void Job::fail_launch(int return_code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_) return;

    return_code_ = return_code;
    status_ = JobStatus::Error;
    done_ = true;
    finished_at_ = now_iso();
    finished_time_ = std::chrono::steady_clock::now();
    changed_.notify_all();
}

// ── Reader side ────────────────────────────────────────────

JobSnapshot Job::snapshot_locked() const {
    JobSnapshot s;
    s.job_id = job_id_;
    s.script_ref = script_ref_;
    s.percent = percent_;
    s.status = status_;
    s.step = step_;
    s.done = done_;
    s.return_code = return_code_;
    s.log_path = log_path_;
    s.created_at = created_at_;
    s.finished_at = finished_at_;
    s.total_lines = total_lines_;
    return s;
}

JobSnapshot Job::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

std::vector<std::string> Job::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {history_.begin(), history_.end()};
}

bool Job::done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
}

JobUpdate Job::read_since(uint64_t cursor) const {
    std::lock_guard<std::mutex> lock(mutex_);

    JobUpdate update;
    uint64_t first = total_lines_ - history_.size();
    if (cursor < first) cursor = first;
    if (cursor < total_lines_) {
        auto begin = history_.begin() + static_cast<std::ptrdiff_t>(cursor - first);
        update.lines.assign(begin, history_.end());
    }
    update.next_cursor = total_lines_;
    update.state = snapshot_locked();
    return update;
}

void Job::wait_for_update(uint64_t cursor, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait_for(lock, timeout, [&] {
        return done_ || total_lines_ > cursor;
    });
}

std::optional<std::chrono::steady_clock::time_point> Job::finished_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_time_;
}

#pragma once

#include <string>
#include <deque>
#include <vector>
#include <optional>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <core/constants.hpp>

enum class JobStatus { Queued, Running, Finished, Error };

const char* to_string(JobStatus status);

// Point-in-time copy of a job's scalar fields.
struct JobSnapshot {
    std::string job_id;
    std::string script_ref;
    int percent = 0;
    JobStatus status = JobStatus::Queued;
    std::string step;
    bool done = false;
    std::optional<int> return_code;
    std::string log_path;
    std::string created_at;           // ISO timestamp
    std::string finished_at;          // ISO timestamp, empty until done
    uint64_t total_lines = 0;         // lines ever appended
};

// Lines a viewer has not seen yet plus the state right after them,
// read under one lock so the two agree.
struct JobUpdate {
    std::vector<std::string> lines;
    uint64_t next_cursor = 0;
    JobSnapshot state;
};

// State of one run. Written only by its output pipeline, read by any number
// of stream sessions. Every compound operation holds the job's mutex.
//
// Lines are numbered from 0 in arrival order. The history keeps the newest
// `capacity` of them; older ones survive only in the transcript file.
class Job {
public:
    Job(std::string job_id, std::string script_ref, std::string log_path,
        std::size_t history_capacity = HISTORY_CAPACITY);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    const std::string& id() const { return job_id_; }
    const std::string& script_ref() const { return script_ref_; }
    const std::string& log_path() const { return log_path_; }
    std::size_t history_capacity() const { return capacity_; }

    // ── Writer side (output pipeline) ──

    // queued -> running, step "starting"
    void mark_running();

    // Append to history, evicting the oldest lines past capacity.
    void append_line(const std::string& line);

    // Clamp percent to [0,100]; a blank step leaves the current one.
    void set_progress(int percent, const std::string& step);

    // Producer-declared completion: 100% / "done", independent of exit.
    void mark_completed_marker();

    // Process exited with rc. finished on 0 (forcing 100% / "done"),
    // error otherwise (progress left as last observed).
    void finish(int return_code);

    // Could not start: straight to error/done with the given rc.
    void fail_launch(int return_code);

    // ── Reader side ──

    JobSnapshot snapshot() const;
    std::vector<std::string> history() const;
    bool done() const;

    // Lines numbered >= cursor still in history. A cursor older than the
    // oldest retained line resumes at that line.
    JobUpdate read_since(uint64_t cursor) const;

    // Block until a line numbered >= cursor exists, the job is done, or
    // timeout elapses.
    void wait_for_update(uint64_t cursor, std::chrono::milliseconds timeout) const;

    // Steady-clock completion time, for retention. Empty until done.
    std::optional<std::chrono::steady_clock::time_point> finished_time() const;

private:
    JobSnapshot snapshot_locked() const;

    const std::string job_id_;
    const std::string script_ref_;
    const std::string log_path_;
    const std::size_t capacity_;
    const std::string created_at_;

    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;

    int percent_ = 0;
    JobStatus status_ = JobStatus::Queued;
    std::string step_;
    bool done_ = false;
    std::optional<int> return_code_;
    std::string finished_at_;
    std::optional<std::chrono::steady_clock::time_point> finished_time_;

    std::deque<std::string> history_;
    uint64_t total_lines_ = 0;
};

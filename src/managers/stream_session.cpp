#include "stream_session.hpp"
#include <fmt/format.h>

std::string format_log_message(const std::string& line) {
    return "LOG " + line;
}

std::string format_state_message(const JobSnapshot& state) {
    return fmt::format("STATE {}|{}|{}", state.percent, to_string(state.status), state.step);
}

std::string format_done_message(const std::optional<int>& return_code) {
    return return_code ? fmt::format("DONE rc={}", *return_code) : std::string("DONE rc=None");
}

std::string format_error_message(const std::string& text) {
    return "ERROR " + text;
}

StreamSession::StreamSession(const JobRegistry& registry, std::string job_id,
                             std::chrono::milliseconds poll_interval)
    : registry_(registry), job_id_(std::move(job_id)), poll_interval_(poll_interval) {}

bool StreamSession::poll_once(const MessageSink& sink, Outcome& outcome) {
    auto job = registry_.get(job_id_);
    if (!job) {
        sink(format_error_message("Job not found"));
        outcome = Outcome::NotFound;
        return true;
    }

    JobUpdate update = job->read_since(cursor_);
    cursor_ = update.next_cursor;

    for (const auto& line : update.lines) {
        if (!sink(format_log_message(line))) {
            outcome = Outcome::Disconnected;
            return true;
        }
    }
    if (!sink(format_state_message(update.state))) {
        outcome = Outcome::Disconnected;
        return true;
    }
    if (update.state.done) {
        sink(format_done_message(update.state.return_code));
        outcome = Outcome::Completed;
        return true;
    }
    return false;
}

StreamSession::Outcome StreamSession::run(const MessageSink& sink) {
    Outcome outcome = Outcome::Completed;
    while (true) {
        if (poll_once(sink, outcome)) return outcome;

        auto job = registry_.get(job_id_);
        if (job) {
            job->wait_for_update(cursor_, poll_interval_);
        }
        // A pruned job is reported as unknown on the next pass
    }
}

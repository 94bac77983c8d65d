#pragma once

#include <string>
#include <functional>
#include <chrono>
#include <cstdint>
#include <core/constants.hpp>
#include "job_registry.hpp"

// Live-channel wire messages, one per line:
//   LOG <line>
//   STATE <percent>|<status>|<step>     (step is not escaped)
//   DONE rc=<rc|None>
//   ERROR <text>
std::string format_log_message(const std::string& line);
std::string format_state_message(const JobSnapshot& state);
std::string format_done_message(const std::optional<int>& return_code);
std::string format_error_message(const std::string& text);

// Delivers one message to the viewer. False once the viewer is gone.
using MessageSink = std::function<bool(const std::string& message)>;

// One viewer of one job. Holds a private cursor (line sequence number) into
// the job's history and never mutates the job.
class StreamSession {
public:
    enum class Outcome { Completed, NotFound, Disconnected };

    StreamSession(const JobRegistry& registry, std::string job_id,
                  std::chrono::milliseconds poll_interval =
                      std::chrono::milliseconds(STREAM_POLL_MS));

    // Stream until the job is done (DONE sent), unknown (ERROR sent) or
    // the sink fails.
    Outcome run(const MessageSink& sink);

    // One pass: new lines, a state snapshot, and DONE if finished.
    // Returns true when the session is over.
    bool poll_once(const MessageSink& sink, Outcome& outcome);

    uint64_t cursor() const { return cursor_; }

private:
    const JobRegistry& registry_;
    std::string job_id_;
    std::chrono::milliseconds poll_interval_;
    uint64_t cursor_ = 0;
};

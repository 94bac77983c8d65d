#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

namespace platform {

struct SpawnOptions {
    std::string program;                     // resolved via PATH when not absolute
    std::vector<std::string> args;
    std::optional<std::string> working_dir;
};

// Opaque handle to a spawned child process with a writable stdin pipe and a
// single readable pipe carrying both its stdout and stderr.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Write all of data to the child's stdin.
    Result<void> write_input(const std::string& data);

    // Close the child's stdin so it observes end-of-input.
    Result<void> close_input();

    // Read the next chunk of merged output. Blocks until data or EOF.
    // Returns false at EOF (or on a read error).
    bool read_output(std::string& chunk);

    // Wait for the process to exit. Returns exit code, 128 + signal for a
    // signal death, -1 if the handle is invalid.
    int wait();

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    int stdin_fd_ = -1;
    int output_fd_ = -1;
    std::optional<int> exit_code_;

    void close_fds();

    friend Result<ProcessHandle> spawn(const SpawnOptions& opts);
};

// Spawn a child process with piped stdin and merged stdout+stderr.
// Errors only for local failures (pipe/fork). An exec or chdir failure in the
// child is reported on the output pipe and as exit code 127.
Result<ProcessHandle> spawn(const SpawnOptions& opts);

} // namespace platform

#include "process.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <pthread.h>
#include <ctime>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_fds();
    // Reap so the child does not linger as a zombie
    if (pid_ > 0 && !exit_code_) {
        waitpid(pid_, nullptr, 0);
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), stdin_fd_(other.stdin_fd_), output_fd_(other.output_fd_),
      exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.stdin_fd_ = -1;
    other.output_fd_ = -1;
    other.exit_code_.reset();
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_fds();
        if (pid_ > 0 && !exit_code_) waitpid(pid_, nullptr, 0);
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        output_fd_ = other.output_fd_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.stdin_fd_ = -1;
        other.output_fd_ = -1;
        other.exit_code_.reset();
    }
    return *this;
}

void ProcessHandle::close_fds() {
    if (stdin_fd_ >= 0) { close(stdin_fd_); stdin_fd_ = -1; }
    if (output_fd_ >= 0) { close(output_fd_); output_fd_ = -1; }
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

Result<void> ProcessHandle::write_input(const std::string& data) {
    if (stdin_fd_ < 0) return Result<void>::Err("stdin already closed");

    // A child that exits without reading raises SIGPIPE on this thread.
    // Block it for the write and discard any instance we caused.
    sigset_t pipe_set, old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    std::string error;
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = std::string("write to stdin failed: ") + std::strerror(errno);
            break;
        }
        off += static_cast<size_t>(n);
    }

    if (!error.empty()) {
        struct timespec zero = {0, 0};
        while (sigtimedwait(&pipe_set, nullptr, &zero) > 0) {}
    }
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);

    if (!error.empty()) return Result<void>::Err(error);
    return Result<void>::Ok();
}

Result<void> ProcessHandle::close_input() {
    if (stdin_fd_ < 0) return Result<void>::Ok();
    int fd = stdin_fd_;
    stdin_fd_ = -1;
    if (close(fd) != 0 && errno != EINTR) {
        return Result<void>::Err(std::string("close stdin failed: ") + std::strerror(errno));
    }
    return Result<void>::Ok();
}

bool ProcessHandle::read_output(std::string& chunk) {
    chunk.clear();
    if (output_fd_ < 0) return false;

    char buf[PIPE_READ_BUF_SIZE];
    while (true) {
        ssize_t n = ::read(output_fd_, buf, sizeof(buf));
        if (n > 0) {
            chunk.assign(buf, static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && errno == EINTR) continue;
        // EOF or unrecoverable error: stop reading
        close(output_fd_);
        output_fd_ = -1;
        return false;
    }
}

int ProcessHandle::wait() {
    if (exit_code_) return *exit_code_;
    if (pid_ <= 0) return -1;

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);

    if (ret != pid_) {
        exit_code_ = -1;
    } else if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = SIGNAL_RC_BASE + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
    return *exit_code_;
}

// ── spawn ────────────────────────────────────────────────────

// Child-side failure report; only async-signal-safe calls after fork.
static void child_fail(const char* what, const char* detail) {
    auto put = [](const char* s) {
        ssize_t r = ::write(STDERR_FILENO, s, std::strlen(s));
        (void)r;
    };
    put(what);
    put(detail);
    put("\n");
    _exit(LAUNCH_FAILED_RC);
}

Result<ProcessHandle> spawn(const SpawnOptions& opts) {
    int in_pipe[2];
    int out_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) != 0) {
        return Result<ProcessHandle>::Err(std::string("pipe failed: ") + std::strerror(errno));
    }
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(in_pipe[0]);
        close(in_pipe[1]);
        return Result<ProcessHandle>::Err(std::string("pipe failed: ") + std::strerror(err));
    }

    // Build argv before fork
    std::vector<const char*> argv;
    argv.push_back(opts.program.c_str());
    for (const auto& a : opts.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    const char* cwd = opts.working_dir ? opts.working_dir->c_str() : nullptr;

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        return Result<ProcessHandle>::Err(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process. dup2 clears CLOEXEC on the targets.
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);

        // Restore default SIGPIPE and an empty mask (the server blocks
        // SIGINT/SIGTERM in its threads) for the script
        signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        if (cwd && chdir(cwd) != 0) {
            child_fail("cannot enter working directory: ", cwd);
        }

        execvp(opts.program.c_str(), const_cast<char* const*>(argv.data()));
        child_fail("cannot execute: ", opts.program.c_str());
    }

    // Parent
    close(in_pipe[0]);
    close(out_pipe[1]);

    ProcessHandle handle;
    handle.pid_ = pid;
    handle.stdin_fd_ = in_pipe[1];
    handle.output_fd_ = out_pipe[0];
    return Result<ProcessHandle>::Ok(std::move(handle));
}

} // namespace platform

#pragma once

#include <string>
#include <mutex>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <cstdio>
#include <filesystem>
#include <platform/platform.hpp>
#include <platform/append_file.hpp>
#include <fmt/format.h>

// Daemon debug log: $JOBCAST_DEBUG_LOG, else <tmp>/jobcast_debug.log
inline std::string jobcast_log_path() {
    static std::string path = [] {
        const char* env = std::getenv("JOBCAST_DEBUG_LOG");
        if (env && *env) return std::string(env);
        return (platform::temp_dir() / "jobcast_debug.log").string();
    }();
    return path;
}

// Per-job transcript path: {logs_dir}/{job_id}.log
inline std::string job_log_path(const std::filesystem::path& logs_dir, const std::string& job_id) {
    return (logs_dir / (job_id + ".log")).string();
}

inline void jobcast_log(const std::string& msg) {
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);

    // Close-on-exec: a script spawned meanwhile must not inherit the log
    platform::AppendFile out;
    if (out.open(jobcast_log_path()).is_err()) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out.write(fmt::format("[{}] {}\n", ts, msg));
}

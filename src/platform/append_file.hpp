#pragma once

#include <string>
#include <core/types.hpp>

namespace platform {

// Append-only file opened close-on-exec, so spawned scripts never inherit
// it. Owns the descriptor; closed on destruction.
class AppendFile {
public:
    AppendFile() = default;
    ~AppendFile();

    AppendFile(AppendFile&& other) noexcept;
    AppendFile& operator=(AppendFile&& other) noexcept;
    AppendFile(const AppendFile&) = delete;
    AppendFile& operator=(const AppendFile&) = delete;

    // Create (0644) or open for append. Replaces any file already held.
    Result<void> open(const std::string& path);

    // Write all of data. False on error or if not open.
    bool write(const std::string& data);

    void close();
    bool is_open() const { return fd_ >= 0; }
    int native_handle() const { return fd_; }

private:
    int fd_ = -1;
};

} // namespace platform

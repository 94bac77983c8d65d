#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Keep a peer hanging up on a pipe or socket from killing the process.
// Writes then fail with EPIPE instead.
void ignore_sigpipe();

} // namespace platform

#pragma once

#include <string>
#include <optional>

// Control markers scripts print on their own line:
//   PROGRESS 40 Doing something   -> 40%, step "Doing something"
//   DONE                          -> logical completion

struct ProgressMarker {
    int percent;          // already clamped to [0,100]
    std::string step;     // trimmed; empty means "keep current step"
};

// Parse a PROGRESS line (`PROGRESS [+-]<1-3 digits> [text]`). nullopt otherwise.
std::optional<ProgressMarker> parse_progress_marker(const std::string& line);

// True for a line starting with the word DONE.
bool is_done_marker(const std::string& line);

inline constexpr const char* PROGRESS_MARKER = "PROGRESS";
inline constexpr const char* DONE_MARKER     = "DONE";

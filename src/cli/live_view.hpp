#pragma once

#include <string>

// Renders live-channel messages for a terminal. LOG lines print as-is,
// STATE lines only when the snapshot changed, DONE/ERROR as status rows.
class LiveView {
public:
    // Text to print for a message (possibly empty).
    std::string render(const std::string& message);

    // rc from the DONE message, -1 if absent or not seen.
    int return_code() const { return return_code_; }
    bool finished() const { return finished_; }

private:
    std::string last_state_;
    int return_code_ = -1;
    bool finished_ = false;
};

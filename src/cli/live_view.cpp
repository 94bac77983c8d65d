#include "live_view.hpp"
#include "theme.hpp"
#include <core/utils.hpp>

static bool starts_with(const std::string& s, const char* prefix, std::string& rest) {
    std::string p(prefix);
    if (s.compare(0, p.size(), p) != 0) return false;
    rest = s.substr(p.size());
    return true;
}

std::string LiveView::render(const std::string& message) {
    std::string rest;

    if (starts_with(message, "LOG ", rest)) {
        return rest + "\n";
    }

    if (starts_with(message, "STATE ", rest)) {
        if (rest == last_state_) return "";
        last_state_ = rest;

        // <percent>|<status>|<step>; step may itself contain '|'
        auto a = rest.find('|');
        auto b = (a == std::string::npos) ? a : rest.find('|', a + 1);
        if (b == std::string::npos) return theme::dim(rest) + "\n";
        return theme::progress(safe_stoi(rest.substr(0, a)),
                               rest.substr(a + 1, b - a - 1),
                               rest.substr(b + 1));
    }

    if (starts_with(message, "DONE rc=", rest)) {
        finished_ = true;
        return_code_ = safe_stoi(rest, -1);
        if (return_code_ == 0) return theme::ok("finished (rc=0)");
        return theme::fail("failed (rc=" + rest + ")");
    }

    if (starts_with(message, "ERROR ", rest)) {
        finished_ = true;
        return theme::fail(rest);
    }

    return message + "\n";
}

#include "progress_markers.hpp"
#include <core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Non-ASCII bytes count as word characters (letters outside ASCII)
static bool is_word_char(char c) {
    auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) != 0 || c == '_';
}

std::optional<ProgressMarker> parse_progress_marker(const std::string& line) {
    const size_t tag_len = std::strlen(PROGRESS_MARKER);
    if (line.compare(0, tag_len, PROGRESS_MARKER) != 0) return std::nullopt;

    // At least one whitespace between the tag and the number
    size_t pos = tag_len;
    if (pos >= line.size() || !is_space(line[pos])) return std::nullopt;
    while (pos < line.size() && is_space(line[pos])) ++pos;

    // Optional sign, then 1-3 digits
    bool negative = false;
    if (pos < line.size() && (line[pos] == '-' || line[pos] == '+')) {
        negative = (line[pos] == '-');
        ++pos;
    }
    size_t digits_start = pos;
    while (pos < line.size() && pos - digits_start < 3 &&
           std::isdigit(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
    if (pos == digits_start) return std::nullopt;
    // "PROGRESS 1000" reads as 100 with step "0"
    int value = std::stoi(line.substr(digits_start, pos - digits_start));
    if (negative) value = -value;

    std::string step = line.substr(pos);
    trim(step);

    return ProgressMarker{std::max(0, std::min(100, value)), step};
}

bool is_done_marker(const std::string& line) {
    const size_t tag_len = std::strlen(DONE_MARKER);
    if (line.compare(0, tag_len, DONE_MARKER) != 0) return false;
    return line.size() == tag_len || !is_word_char(line[tag_len]);
}
